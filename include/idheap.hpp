#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include "idheap_component.hpp"
#include "idheap_ids.hpp"
#include "idheap_untyped.hpp"

namespace idheap {

// Orders values in reverse. Wrapping the stored value turns the min-heap into
// a max-heap without a second sink/swim.
template <class T>
struct Reverse {
    T value{};

    Reverse() = default;
    explicit Reverse(T v) : value(std::move(v)) {}
};

template <class T>
bool operator<(const Reverse<T>& a, const Reverse<T>& b) {
    return b.value < a.value;
}

template <class T>
bool operator==(const Reverse<T>& a, const Reverse<T>& b) {
    return a.value == b.value;
}

template <class T>
bool operator!=(const Reverse<T>& a, const Reverse<T>& b) {
    return !(a == b);
}

namespace detail {

struct IdentityValue {
    template <class T>
    static const T& get(const T& v) noexcept { return v; }
};

struct ReversedValue {
    template <class T>
    static const T& get(const Reverse<T>& v) noexcept { return v.value; }
};

}  // namespace detail

// Heap-array order over a typed queue, yielding (Id<Arena>, const value&).
template <class Arena, class Stored, class Projection>
class TypedSortedRange {
public:
    using arena_type = Arena;
    using inner_range = typename UntypedIndexedMinQueue<Stored>::SortedRange;
    using inner_iterator = typename UntypedIndexedMinQueue<Stored>::const_iterator;
    using projected_type = std::remove_cv_t<std::remove_reference_t<
        decltype(Projection::get(std::declval<const Stored&>()))>>;

    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<Id<Arena>, const projected_type&>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        iterator() = default;
        explicit iterator(inner_iterator inner) noexcept : inner_(inner) {}

        reference operator*() const {
            const auto entry = *inner_;
            return reference(Id<Arena>(entry.first), Projection::get(entry.second));
        }

        iterator& operator++() noexcept {
            ++inner_;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator prev = *this;
            ++inner_;
            return prev;
        }

        friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.inner_ == b.inner_; }
        friend bool operator!=(const iterator& a, const iterator& b) noexcept { return a.inner_ != b.inner_; }

    private:
        inner_iterator inner_;
    };

    explicit TypedSortedRange(inner_range inner) noexcept : inner_(inner) {}

    iterator begin() const noexcept { return iterator(inner_.begin()); }
    iterator end() const noexcept { return iterator(inner_.end()); }

private:
    inner_range inner_;
};

// Every value slot of a queue, by identifier index, tagged with its arena.
template <class Arena, class T>
class ArenaSlots {
public:
    using arena_type = Arena;
    using const_iterator = typename DenseComponent<std::optional<T>>::const_iterator;

    explicit ArenaSlots(const DenseComponent<std::optional<T>>& slots) noexcept : slots_(&slots) {}

    const_iterator begin() const noexcept { return slots_->begin(); }
    const_iterator end() const noexcept { return slots_->end(); }
    size_t size() const noexcept { return slots_->size(); }

private:
    const DenseComponent<std::optional<T>>* slots_;
};

/**
 * Id-indexed min priority queue over a D-ary heap.
 *
 * Only identifiers of Arena are accepted. All operations are forwarded to
 * UntypedIndexedMinQueue; absent identifiers and out-of-range positions
 * produce empty results.
 */
template <class Arena, class T>
class IndexedMinQueue {
public:
    using arena_type = Arena;
    using id_type = Id<Arena>;
    using value_type = T;
    using entry_type = std::pair<id_type, T>;
    using sorted_range = TypedSortedRange<Arena, T, detail::IdentityValue>;

    IndexedMinQueue() = default;

    size_t len() const noexcept { return inner_.len(); }
    bool is_empty() const noexcept { return inner_.is_empty(); }

    void clear() { inner_.clear(); }

    void insert(id_type id, T value) { inner_.insert(id.untyped(), std::move(value)); }

    std::optional<entry_type> remove(id_type id) { return typed(inner_.remove(id.untyped())); }
    std::optional<entry_type> remove_position(size_t position) {
        return typed(inner_.remove_position(position));
    }
    std::optional<entry_type> pop() { return remove_position(0); }

    std::optional<T> peek() const { return inner_.peek(); }
    std::optional<entry_type> peek_id() const { return get_position_with_id(0); }

    std::optional<T> get_position(size_t position) const { return inner_.get_position(position); }
    std::optional<entry_type> get_position_with_id(size_t position) const {
        return typed(inner_.get_position_with_id(position));
    }

    void decrease(id_type id, const T& value) { inner_.decrease(id.untyped(), value); }
    void increase(id_type id, const T& value) { inner_.increase(id.untyped(), value); }

    sorted_range iter_sorted() const noexcept { return sorted_range(inner_.iter_sorted()); }

    const std::optional<T>& operator[](id_type id) const noexcept { return inner_[id.untyped()]; }

    ArenaSlots<Arena, T> slots() const noexcept { return ArenaSlots<Arena, T>(inner_.slots()); }

    const UntypedIndexedMinQueue<T>& untyped() const noexcept { return inner_; }

private:
    UntypedIndexedMinQueue<T> inner_;

    static std::optional<entry_type> typed(std::optional<std::pair<UntypedId, T>> entry) {
        if (!entry) return std::nullopt;
        return entry_type(id_type(entry->first), std::move(entry->second));
    }
};

// Id-indexed max priority queue. increase/decrease map onto the reversed
// min-queue's decrease/increase.
template <class Arena, class T>
class IndexedMaxQueue {
public:
    using arena_type = Arena;
    using id_type = Id<Arena>;
    using value_type = T;
    using entry_type = std::pair<id_type, T>;
    using sorted_range = TypedSortedRange<Arena, Reverse<T>, detail::ReversedValue>;

    IndexedMaxQueue() = default;

    size_t len() const noexcept { return inner_.len(); }
    bool is_empty() const noexcept { return inner_.is_empty(); }

    void clear() { inner_.clear(); }

    void insert(id_type id, T value) { inner_.insert(id, Reverse<T>(std::move(value))); }

    std::optional<entry_type> remove(id_type id) { return unwrap(inner_.remove(id)); }
    std::optional<entry_type> remove_position(size_t position) {
        return unwrap(inner_.remove_position(position));
    }
    std::optional<entry_type> pop() { return unwrap(inner_.pop()); }

    std::optional<T> peek() const { return unwrap_value(inner_.peek()); }
    std::optional<entry_type> peek_id() const { return unwrap(inner_.peek_id()); }

    std::optional<T> get_position(size_t position) const {
        return unwrap_value(inner_.get_position(position));
    }
    std::optional<entry_type> get_position_with_id(size_t position) const {
        return unwrap(inner_.get_position_with_id(position));
    }

    void increase(id_type id, const T& value) { inner_.decrease(id, Reverse<T>(value)); }
    void decrease(id_type id, const T& value) { inner_.increase(id, Reverse<T>(value)); }

    sorted_range iter_sorted() const noexcept { return sorted_range(inner_.untyped().iter_sorted()); }

    std::optional<T> operator[](id_type id) const { return unwrap_value(inner_[id]); }

private:
    IndexedMinQueue<Arena, Reverse<T>> inner_;

    static std::optional<T> unwrap_value(const std::optional<Reverse<T>>& value) {
        if (!value) return std::nullopt;
        return value->value;
    }

    static std::optional<entry_type> unwrap(std::optional<std::pair<id_type, Reverse<T>>> entry) {
        if (!entry) return std::nullopt;
        return entry_type(entry->first, std::move(entry->second.value));
    }
};

}  // namespace idheap
