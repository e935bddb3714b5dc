#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace idheap {

struct UntypedId {
    uint32_t index = 0;
    uint32_t generation = 0;

    static UntypedId first(uint32_t index) noexcept { return UntypedId{index, 0}; }
};

inline bool operator==(const UntypedId& a, const UntypedId& b) noexcept {
    return a.index == b.index && a.generation == b.generation;
}

inline bool operator!=(const UntypedId& a, const UntypedId& b) noexcept {
    return !(a == b);
}

// Identifier bound to one arena. Ids of different arenas are distinct types.
template <class Arena>
class Id {
public:
    using arena_type = Arena;

    Id() = default;
    explicit Id(UntypedId untyped) noexcept : untyped_(untyped) {}

    UntypedId untyped() const noexcept { return untyped_; }
    uint32_t index() const noexcept { return untyped_.index; }
    uint32_t generation() const noexcept { return untyped_.generation; }

    friend bool operator==(const Id& a, const Id& b) noexcept { return a.untyped_ == b.untyped_; }
    friend bool operator!=(const Id& a, const Id& b) noexcept { return a.untyped_ != b.untyped_; }

private:
    UntypedId untyped_;
};

/**
 * Mints identifiers. A killed identifier's index is handed out again by a
 * later create() with its generation bumped, so stale handles never compare
 * equal to the new one.
 */
class UntypedAllocator {
public:
    UntypedAllocator() = default;

    UntypedId create();
    bool kill(UntypedId id);
    bool is_alive(UntypedId id) const noexcept;

    // Live identifiers in index order.
    std::vector<UntypedId> ids() const;

    size_t size() const noexcept { return live_count_; }
    bool empty() const noexcept { return live_count_ == 0; }

private:
    std::vector<uint32_t> generations_;
    std::vector<bool> alive_;
    std::vector<uint32_t> free_indices_;
    size_t live_count_ = 0;
};

template <class Arena>
class Allocator {
public:
    Id<Arena> create() { return Id<Arena>(inner_.create()); }
    bool kill(Id<Arena> id) { return inner_.kill(id.untyped()); }
    bool is_alive(Id<Arena> id) const noexcept { return inner_.is_alive(id.untyped()); }

    std::vector<Id<Arena>> ids() const {
        std::vector<Id<Arena>> out;
        for (const UntypedId& id : inner_.ids()) {
            out.push_back(Id<Arena>(id));
        }
        return out;
    }

    size_t size() const noexcept { return inner_.size(); }
    bool empty() const noexcept { return inner_.empty(); }

private:
    UntypedAllocator inner_;
};

}  // namespace idheap
