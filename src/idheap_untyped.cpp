#include "idheap_untyped.hpp"

#include <algorithm>

namespace idheap {

std::optional<size_t> heap_parent(size_t index, size_t arity) noexcept {
    if (index == 0) return std::nullopt;
    return (index - 1) / arity;
}

ChildRange heap_children(size_t index, size_t len, size_t arity) noexcept {
    const size_t i = index * arity;
    return ChildRange{i + 1, std::min(i + arity + 1, len)};
}

}  // namespace idheap
