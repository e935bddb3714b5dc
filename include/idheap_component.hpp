#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "idheap_ids.hpp"

namespace idheap {

// Per-identifier storage, dense by identifier index. Slots beyond the highest
// index ever inserted read as T{}.
template <class T>
class DenseComponent {
public:
    using value_type = T;
    using const_iterator = typename std::vector<T>::const_iterator;

    DenseComponent() = default;

    size_t size() const noexcept { return slots_.size(); }

    void insert(UntypedId id, T value) {
        if (id.index >= slots_.size()) {
            slots_.resize(static_cast<size_t>(id.index) + 1);
        }
        slots_[id.index] = std::move(value);
    }

    const T* get(UntypedId id) const noexcept {
        return id.index < slots_.size() ? &slots_[id.index] : nullptr;
    }

    T* get_mut(UntypedId id) noexcept {
        return id.index < slots_.size() ? &slots_[id.index] : nullptr;
    }

    const T& operator[](UntypedId id) const noexcept {
        static const T kEmpty{};
        const T* slot = get(id);
        return slot != nullptr ? *slot : kEmpty;
    }

    template <class Factory>
    void fill_with(Factory factory) {
        for (T& slot : slots_) {
            slot = factory();
        }
    }

    void swap(UntypedId a, UntypedId b) {
        const size_t hi = static_cast<size_t>(a.index > b.index ? a.index : b.index);
        if (hi >= slots_.size()) {
            slots_.resize(hi + 1);
        }
        std::swap(slots_[a.index], slots_[b.index]);
    }

    const_iterator begin() const noexcept { return slots_.begin(); }
    const_iterator end() const noexcept { return slots_.end(); }

private:
    std::vector<T> slots_;
};

}  // namespace idheap
