#include <loom/dom/ElementId.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cassert>
#include <string>

namespace LM::Dom {

auto ElementIdAllocator::allocate() -> ElementId {
    ElementId id{};
    if (!free_list_.empty()) {
        if (reuse_order_ == IdReuseOrder::Fifo) {
            id = free_list_.front();
            free_list_.pop_front();
        } else {
            id = free_list_.back();
            free_list_.pop_back();
        }
    } else {
        assert(next_id_ <= kMaxElementId && "element id space exhausted");
        id = static_cast<ElementId>(next_id_++);
    }
    live_.insert(id);
    return id;
}

auto ElementIdAllocator::free(ElementId id) -> void {
    if (id == kRootElementId) {
        return;
    }
    auto const found = live_.find(id);
    if (found == live_.end()) {
        lm_log("Ignoring free of id " + std::to_string(id) + " that is not alive", "ElementIdAllocator", "INFO");
        return;
    }
    live_.erase(found);
    free_list_.push_back(id);
}

auto ElementIdAllocator::clear() -> void {
    live_.clear();
    free_list_.clear();
    next_id_ = kRootElementId + 1;
}

auto ElementIdAllocator::is_alive(ElementId id) const -> bool {
    return id == kRootElementId || live_.contains(id);
}

auto ElementIdAllocator::live_ids() const -> std::vector<ElementId> {
    std::vector<ElementId> ids(live_.begin(), live_.end());
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace LM::Dom
