#pragma once

#include <loom/core/RuntimeOptions.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <deque>
#include <limits>
#include <vector>

namespace LM::Dom {

using ElementId = std::uint32_t;

// Reserved identity of the mount root: always alive, never handed out, never freed.
inline constexpr ElementId kRootElementId = 0;
inline constexpr ElementId kMaxElementId  = std::numeric_limits<ElementId>::max();

class ElementIdAllocator {
public:
    ElementIdAllocator() = default;
    explicit ElementIdAllocator(IdReuseOrder order)
        : reuse_order_(order) {}

    // Pops a freed id when one is waiting, otherwise advances the counter.
    // Running past kMaxElementId fresh ids is a contract violation; the counter never wraps to the root.
    [[nodiscard]] auto allocate() -> ElementId;
    // No-op for the root and for ids that are not alive.
    auto free(ElementId id) -> void;
    auto clear() -> void;

    [[nodiscard]] auto is_alive(ElementId id) const -> bool;

    [[nodiscard]] auto count() const -> std::size_t {
        return live_.size() + 1;
    }

    [[nodiscard]] auto user_count() const -> std::size_t {
        return live_.size();
    }

    [[nodiscard]] auto free_list_size() const -> std::size_t {
        return free_list_.size();
    }

    [[nodiscard]] auto reuse_order() const -> IdReuseOrder {
        return reuse_order_;
    }

    // Id the next allocation hands out when the free list is empty.
    [[nodiscard]] auto next_fresh_id() const -> std::uint64_t {
        return next_id_;
    }

    [[nodiscard]] auto live_ids() const -> std::vector<ElementId>;

private:
    IdReuseOrder                    reuse_order_ = IdReuseOrder::Lifo;
    std::uint64_t                   next_id_     = kRootElementId + 1;
    phmap::flat_hash_set<ElementId> live_{};
    std::deque<ElementId>           free_list_{};
};

} // namespace LM::Dom
