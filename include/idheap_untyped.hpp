#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "idheap_component.hpp"
#include "idheap_ids.hpp"

#ifndef IDHEAP_ARITY
#define IDHEAP_ARITY 8
#endif

#ifndef IDHEAP_DEBUG_CHECKS
#define IDHEAP_DEBUG_CHECKS 0
#endif

namespace idheap {

// Half-open range of child positions [first, last).
struct ChildRange {
    size_t first;
    size_t last;

    bool empty() const noexcept { return first >= last; }
    size_t size() const noexcept { return empty() ? 0 : last - first; }
};

std::optional<size_t> heap_parent(size_t index, size_t arity) noexcept;
ChildRange heap_children(size_t index, size_t len, size_t arity) noexcept;

/**
 * Indexed min priority queue over a D-ary heap, keyed by raw identifiers.
 *
 *    values_      identifier -> priority
 *    positions_   identifier -> heap position
 *    inverse_map_ heap position -> identifier
 *
 * positions_ and inverse_map_ are kept as exact inverses of each other. The
 * queue is generation-agnostic: slots are addressed by identifier index and
 * the identifier stored in the heap is the one it was inserted with.
 */
template <class T>
class UntypedIndexedMinQueue {
public:
    using value_type = T;
    using position_type = uint32_t;
    using entry_type = std::pair<UntypedId, T>;

    static constexpr size_t kArity = IDHEAP_ARITY;
    static constexpr size_t kMaxLen = std::numeric_limits<position_type>::max();

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<UntypedId, const T&>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        const_iterator() = default;
        const_iterator(const UntypedIndexedMinQueue* queue, size_t pos) noexcept
            : queue_(queue), pos_(pos) {}

        reference operator*() const {
            const UntypedId id = queue_->inverse_map_[pos_];
            return reference(id, queue_->value_at(pos_));
        }

        const_iterator& operator++() noexcept {
            ++pos_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            const_iterator prev = *this;
            ++pos_;
            return prev;
        }

        size_t position() const noexcept { return pos_; }

        friend bool operator==(const const_iterator& a, const const_iterator& b) noexcept {
            return a.queue_ == b.queue_ && a.pos_ == b.pos_;
        }
        friend bool operator!=(const const_iterator& a, const const_iterator& b) noexcept {
            return !(a == b);
        }

    private:
        const UntypedIndexedMinQueue* queue_ = nullptr;
        size_t pos_ = 0;
    };

    // Heap-array order. Only the first element is guaranteed minimal.
    class SortedRange {
    public:
        explicit SortedRange(const UntypedIndexedMinQueue* queue) noexcept : queue_(queue) {}

        const_iterator begin() const noexcept { return const_iterator(queue_, 0); }
        const_iterator end() const noexcept { return const_iterator(queue_, queue_->len()); }

    private:
        const UntypedIndexedMinQueue* queue_;
    };

    UntypedIndexedMinQueue() = default;

    size_t len() const noexcept { return inverse_map_.size(); }
    bool is_empty() const noexcept { return inverse_map_.empty(); }

    void clear() {
        values_.fill_with([] { return std::optional<T>(); });
        positions_.fill_with([] { return std::optional<position_type>(); });
        inverse_map_.clear();
    }

    void insert(UntypedId id, T value);
    std::optional<entry_type> remove(UntypedId id);
    std::optional<entry_type> remove_position(size_t position);
    std::optional<entry_type> pop() { return remove_position(0); }

    void decrease(UntypedId id, const T& value);
    void increase(UntypedId id, const T& value);

    std::optional<T> peek() const { return get_position(0); }
    std::optional<entry_type> peek_id() const { return get_position_with_id(0); }

    std::optional<T> get_position(size_t position) const {
        if (position >= inverse_map_.size()) return std::nullopt;
        return values_[inverse_map_[position]];
    }

    std::optional<entry_type> get_position_with_id(size_t position) const {
        if (position >= inverse_map_.size()) return std::nullopt;
        const UntypedId id = inverse_map_[position];
        const std::optional<T>& value = values_[id];
        if (!value) return std::nullopt;
        return entry_type(id, *value);
    }

    SortedRange iter_sorted() const noexcept { return SortedRange(this); }

    const std::optional<T>& operator[](UntypedId id) const noexcept { return values_[id]; }

    const DenseComponent<std::optional<T>>& slots() const noexcept { return values_; }
    const std::vector<UntypedId>& heap_order() const noexcept { return inverse_map_; }

    bool is_consistent() const;

private:
    DenseComponent<std::optional<T>> values_;
    DenseComponent<std::optional<position_type>> positions_;
    std::vector<UntypedId> inverse_map_;

    static_assert(kArity >= 2, "IDHEAP_ARITY must be >= 2");

    const T& value_at(size_t position) const {
        const std::optional<T>& value = values_[inverse_map_[position]];
        assert(value.has_value());
        return *value;
    }

    void sink(size_t index);
    void swim(size_t index);
    void swap(size_t a, size_t b);

    void debug_check() const {
#if IDHEAP_DEBUG_CHECKS
        assert(is_consistent());
#endif
    }
};

template <class T>
void UntypedIndexedMinQueue<T>::insert(UntypedId id, T value) {
    const std::optional<position_type>* slot = positions_.get(id);
    if (slot != nullptr && slot->has_value()) {
        const size_t index = **slot;
        values_.insert(id, std::optional<T>(std::move(value)));
        sink(index);
        swim(index);
    } else {
        if (inverse_map_.size() >= kMaxLen) {
            throw std::length_error("heap position range exhausted");
        }
        const size_t index = inverse_map_.size();
        values_.insert(id, std::optional<T>(std::move(value)));
        positions_.insert(id, std::optional<position_type>(static_cast<position_type>(index)));
        inverse_map_.push_back(id);
        swim(index);
    }
    debug_check();
}

template <class T>
std::optional<typename UntypedIndexedMinQueue<T>::entry_type>
UntypedIndexedMinQueue<T>::remove(UntypedId id) {
    const std::optional<position_type>* slot = positions_.get(id);
    if (slot == nullptr || !slot->has_value()) return std::nullopt;
    return remove_position(**slot);
}

template <class T>
std::optional<typename UntypedIndexedMinQueue<T>::entry_type>
UntypedIndexedMinQueue<T>::remove_position(size_t position) {
    if (position >= inverse_map_.size()) return std::nullopt;

    swap(position, inverse_map_.size() - 1);

    const UntypedId id = inverse_map_.back();
    inverse_map_.pop_back();

    std::optional<T>* value = values_.get_mut(id);
    std::optional<position_type>* pos = positions_.get_mut(id);
    assert(value != nullptr && value->has_value() && pos != nullptr);

    entry_type removed(id, std::move(**value));
    value->reset();
    pos->reset();

    sink(position);
    swim(position);
    debug_check();
    return removed;
}

template <class T>
void UntypedIndexedMinQueue<T>::decrease(UntypedId id, const T& value) {
    std::optional<T>* current = values_.get_mut(id);
    const std::optional<position_type>* pos = positions_.get(id);
    if (current == nullptr || !current->has_value() || pos == nullptr || !pos->has_value()) {
        return;
    }
    if (!(value < **current)) return;

    **current = value;
    swim(**pos);
    debug_check();
}

template <class T>
void UntypedIndexedMinQueue<T>::increase(UntypedId id, const T& value) {
    std::optional<T>* current = values_.get_mut(id);
    const std::optional<position_type>* pos = positions_.get(id);
    if (current == nullptr || !current->has_value() || pos == nullptr || !pos->has_value()) {
        return;
    }
    if (!(**current < value)) return;

    **current = value;
    sink(**pos);
    debug_check();
}

template <class T>
void UntypedIndexedMinQueue<T>::sink(size_t index) {
    const size_t n = inverse_map_.size();
    while (index < n) {
        const ChildRange children = heap_children(index, n, kArity);
        if (children.empty()) break;

        size_t min_idx = children.first;
        const T* min_val = &value_at(min_idx);
        for (size_t c = children.first + 1; c < children.last; ++c) {
            const T& v = value_at(c);
            if (v < *min_val) {
                min_val = &v;
                min_idx = c;
            }
        }

        if (!(*min_val < value_at(index))) break;

        swap(index, min_idx);
        index = min_idx;
    }
}

template <class T>
void UntypedIndexedMinQueue<T>::swim(size_t index) {
    if (index >= inverse_map_.size()) return;

    std::optional<size_t> parent = heap_parent(index, kArity);
    while (parent) {
        if (!(value_at(index) < value_at(*parent))) break;
        swap(index, *parent);
        index = *parent;
        parent = heap_parent(index, kArity);
    }
}

template <class T>
void UntypedIndexedMinQueue<T>::swap(size_t a, size_t b) {
    if (a >= inverse_map_.size() || b >= inverse_map_.size()) return;
    positions_.swap(inverse_map_[a], inverse_map_[b]);
    std::swap(inverse_map_[a], inverse_map_[b]);
}

template <class T>
bool UntypedIndexedMinQueue<T>::is_consistent() const {
    const size_t n = inverse_map_.size();

    size_t with_value = 0;
    for (const std::optional<T>& v : values_) {
        if (v) ++with_value;
    }
    size_t with_position = 0;
    for (const std::optional<position_type>& p : positions_) {
        if (p) ++with_position;
    }
    if (with_value != n || with_position != n) return false;

    for (size_t p = 0; p < n; ++p) {
        const UntypedId id = inverse_map_[p];
        const std::optional<position_type>& pos = positions_[id];
        if (!pos || *pos != p || !values_[id]) return false;
    }

    for (size_t p = 0; p < n; ++p) {
        const ChildRange children = heap_children(p, n, kArity);
        for (size_t c = children.first; c < children.last; ++c) {
            if (value_at(c) < value_at(p)) return false;
        }
    }
    return true;
}

}  // namespace idheap
