#include "idheap.hpp"
#include "test_check.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <type_traits>
#include <vector>

using idheap::Allocator;
using idheap::Id;
using idheap::IndexedMaxQueue;
using idheap::IndexedMinQueue;
using idheap::Reverse;

namespace {

struct Nodes {};
struct Edges {};

using NodeId = Id<Nodes>;
using MinQueue = IndexedMinQueue<Nodes, int32_t>;
using MaxQueue = IndexedMaxQueue<Nodes, int32_t>;

static_assert(std::is_same<MinQueue::sorted_range::arena_type, Nodes>::value, "range carries its arena");
static_assert(std::is_same<decltype(std::declval<const MinQueue&>().slots())::arena_type, Nodes>::value,
              "slots carry their arena");
static_assert(!std::is_convertible<Id<Edges>, NodeId>::value, "arenas do not mix");
static_assert(!std::is_invocable<decltype(&MinQueue::insert), MinQueue&, Id<Edges>, int32_t>::value,
              "queue rejects foreign ids");

std::vector<NodeId> order_of(const MinQueue& queue) {
    std::vector<NodeId> out;
    for (const auto& entry : queue.iter_sorted()) {
        out.push_back(entry.first);
    }
    return out;
}

template <class Queue>
bool is_max_ordered(const Queue& queue) {
    const size_t n = queue.len();
    for (size_t p = 0; p < n; ++p) {
        const idheap::ChildRange children = idheap::heap_children(p, n, idheap::UntypedIndexedMinQueue<int32_t>::kArity);
        for (size_t c = children.first; c < children.last; ++c) {
            if (*queue.get_position(p) < *queue.get_position(c)) return false;
        }
    }
    return true;
}

}  // namespace

void test_allocator() {
    std::cout << "Test: allocator lifecycle... ";

    Allocator<Nodes> alloc;
    CHECK(alloc.empty());

    const NodeId a = alloc.create();
    const NodeId b = alloc.create();
    const NodeId c = alloc.create();
    CHECK(alloc.size() == 3);
    CHECK(a.index() == 0 && b.index() == 1 && c.index() == 2);

    CHECK(alloc.kill(b));
    CHECK(!alloc.kill(b));
    CHECK(!alloc.is_alive(b));
    CHECK((alloc.ids() == std::vector<NodeId>{a, c}));

    const NodeId b2 = alloc.create();
    CHECK(b2.index() == b.index());
    CHECK(b2.generation() == b.generation() + 1);
    CHECK(b2 != b);
    CHECK(alloc.is_alive(b2));
    CHECK(!alloc.is_alive(b));
    CHECK(alloc.size() == 3);

    std::cout << "PASSED\n";
}

void test_min_scenarios() {
    std::cout << "Test: typed min-queue scenarios... ";

    Allocator<Nodes> alloc;
    const NodeId id0 = alloc.create();
    const NodeId id1 = alloc.create();

    MinQueue queue;
    queue.insert(id0, 3);
    queue.insert(id1, 2);
    CHECK((order_of(queue) == std::vector<NodeId>{id1, id0}));
    CHECK(queue.peek() == std::optional<int32_t>(2));

    queue.decrease(id0, 1);
    CHECK((order_of(queue) == std::vector<NodeId>{id0, id1}));
    CHECK(queue.peek() == std::optional<int32_t>(1));

    const auto top = queue.peek_id();
    CHECK(top.has_value());
    CHECK(top->first == id0);

    const auto popped = queue.pop();
    CHECK(popped.has_value());
    CHECK(popped->first == id0);
    CHECK(popped->second == 1);
    CHECK((order_of(queue) == std::vector<NodeId>{id1}));
    CHECK(!queue[id0]);
    CHECK(queue[id1] == std::optional<int32_t>(2));

    std::cout << "PASSED\n";
}

void test_min_remove() {
    std::cout << "Test: typed min-queue remove... ";

    Allocator<Nodes> alloc;
    const NodeId id0 = alloc.create();
    const NodeId id1 = alloc.create();
    const NodeId id2 = alloc.create();
    const NodeId never = alloc.create();

    MinQueue queue;
    CHECK(!queue.remove(id0));

    queue.insert(id0, 1);
    queue.insert(id1, 2);
    queue.insert(id2, 3);

    CHECK(!queue.remove(never));
    CHECK(queue.len() == 3);

    const auto removed = queue.remove(id1);
    CHECK(removed.has_value());
    CHECK(removed->first == id1);
    CHECK(removed->second == 2);
    CHECK((order_of(queue) == std::vector<NodeId>{id0, id2}));
    CHECK(queue.untyped().is_consistent());

    const auto at1 = queue.get_position_with_id(1);
    CHECK(at1.has_value());
    CHECK(at1->first == id2);
    CHECK(queue.get_position(1) == std::optional<int32_t>(3));
    CHECK(!queue.remove_position(5));

    queue.clear();
    CHECK(queue.is_empty());
    CHECK(!queue.pop());

    std::cout << "PASSED\n";
}

void test_slots() {
    std::cout << "Test: arena slots... ";

    Allocator<Nodes> alloc;
    MinQueue queue;
    std::vector<NodeId> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(alloc.create());
        queue.insert(ids.back(), 10 * i);
    }
    queue.remove(ids[2]);
    queue.remove(ids[4]);

    size_t present = 0;
    size_t index = 0;
    for (const std::optional<int32_t>& slot : queue.slots()) {
        if (slot) {
            CHECK(*slot == static_cast<int32_t>(10 * index));
            ++present;
        }
        ++index;
    }
    CHECK(present == queue.len());
    CHECK(queue.slots().size() == 6);

    std::cout << "PASSED\n";
}

void test_max_scenario() {
    std::cout << "Test: max-queue scenario... ";

    Allocator<Nodes> alloc;
    const NodeId id0 = alloc.create();
    const NodeId id1 = alloc.create();

    MaxQueue queue;
    queue.insert(id0, 3);
    queue.insert(id1, 5);
    CHECK(queue.peek() == std::optional<int32_t>(5));

    queue.increase(id0, 10);
    CHECK(queue.peek() == std::optional<int32_t>(10));
    CHECK(queue[id0] == std::optional<int32_t>(10));

    // Not an increase: ignored.
    queue.increase(id1, 4);
    CHECK(queue[id1] == std::optional<int32_t>(5));

    queue.decrease(id0, 1);
    CHECK(queue.peek() == std::optional<int32_t>(5));
    const auto top = queue.peek_id();
    CHECK(top.has_value());
    CHECK(top->first == id1);
    CHECK(top->second == 5);

    // Not a decrease: ignored.
    queue.decrease(id0, 2);
    CHECK(queue[id0] == std::optional<int32_t>(1));

    const auto removed = queue.remove(id0);
    CHECK(removed.has_value());
    CHECK(removed->first == id0);
    CHECK(removed->second == 1);
    CHECK(queue.len() == 1);
    CHECK(!queue[id0]);

    std::cout << "PASSED\n";
}

void test_max_ordering() {
    std::cout << "Test: max-queue pops in descending order... ";

    std::mt19937 rng(20260206);
    std::uniform_int_distribution<int32_t> dist(-100000, 100000);

    Allocator<Nodes> alloc;
    MaxQueue queue;
    std::vector<int32_t> expected;
    for (int i = 0; i < 5000; ++i) {
        const int32_t v = dist(rng);
        queue.insert(alloc.create(), v);
        expected.push_back(v);
    }
    CHECK(is_max_ordered(queue));

    const auto first = *queue.iter_sorted().begin();
    CHECK(first.second == *std::max_element(expected.begin(), expected.end()));

    std::sort(expected.begin(), expected.end(), std::greater<int32_t>());
    for (int32_t v : expected) {
        const auto popped = queue.pop();
        CHECK(popped.has_value());
        CHECK(popped->second == v);
        CHECK(queue[popped->first] == std::nullopt);
    }
    CHECK(queue.is_empty());
    CHECK(!queue.peek());

    std::cout << "PASSED\n";
}

void test_reverse() {
    std::cout << "Test: reversed ordering wrapper... ";

    CHECK(Reverse<int>(5) < Reverse<int>(3));
    CHECK(!(Reverse<int>(3) < Reverse<int>(5)));
    CHECK(!(Reverse<int>(4) < Reverse<int>(4)));
    CHECK(Reverse<int>(4) == Reverse<int>(4));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== IndexedMinQueue / IndexedMaxQueue Unit Tests ===\n\n";

    try {
        test_allocator();
        test_min_scenarios();
        test_min_remove();
        test_slots();
        test_max_scenario();
        test_max_ordering();
        test_reverse();
    } catch (const std::exception& e) {
        std::cerr << "\n=== Test failed ===\n" << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
