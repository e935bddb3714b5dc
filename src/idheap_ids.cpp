#include "idheap_ids.hpp"

#include <limits>
#include <stdexcept>

namespace idheap {

UntypedId UntypedAllocator::create() {
    if (!free_indices_.empty()) {
        const uint32_t index = free_indices_.back();
        free_indices_.pop_back();
        alive_[index] = true;
        ++live_count_;
        return UntypedId{index, generations_[index]};
    }

    if (generations_.size() >= static_cast<size_t>(std::numeric_limits<uint32_t>::max())) {
        throw std::length_error("identifier space exhausted");
    }

    const uint32_t index = static_cast<uint32_t>(generations_.size());
    generations_.push_back(0);
    alive_.push_back(true);
    ++live_count_;
    return UntypedId{index, 0};
}

bool UntypedAllocator::kill(UntypedId id) {
    if (!is_alive(id)) return false;

    alive_[id.index] = false;
    ++generations_[id.index];
    free_indices_.push_back(id.index);
    --live_count_;
    return true;
}

bool UntypedAllocator::is_alive(UntypedId id) const noexcept {
    return id.index < alive_.size() && alive_[id.index] &&
           generations_[id.index] == id.generation;
}

std::vector<UntypedId> UntypedAllocator::ids() const {
    std::vector<UntypedId> out;
    out.reserve(live_count_);
    for (size_t i = 0; i < alive_.size(); ++i) {
        if (alive_[i]) {
            out.push_back(UntypedId{static_cast<uint32_t>(i), generations_[i]});
        }
    }
    return out;
}

}  // namespace idheap
