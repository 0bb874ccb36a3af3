#include <doctest/doctest.h>

#include <loom/dom/ElementId.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <vector>

using namespace LM;
using namespace LM::Dom;

TEST_SUITE("dom.element_id") {
    TEST_CASE("fresh_allocator_has_only_root") {
        ElementIdAllocator ids;
        CHECK(ids.count() == 1);
        CHECK(ids.user_count() == 0);
        CHECK(ids.is_alive(kRootElementId));
        CHECK_FALSE(ids.is_alive(1));
        CHECK(ids.live_ids().empty());
    }

    TEST_CASE("sequential_allocation_starts_at_one") {
        ElementIdAllocator ids;
        CHECK(ids.allocate() == 1);
        CHECK(ids.allocate() == 2);
        CHECK(ids.allocate() == 3);
        CHECK(ids.count() == 4);
        CHECK(ids.user_count() == 3);
        CHECK(ids.live_ids() == std::vector<ElementId>{1, 2, 3});
    }

    TEST_CASE("many_allocations_are_unique_and_never_root") {
        ElementIdAllocator ids;
        std::set<ElementId> seen;
        for (int i = 0; i < 1000; ++i) {
            auto id = ids.allocate();
            CHECK(id != kRootElementId);
            CHECK(seen.insert(id).second);
        }
        CHECK(ids.user_count() == 1000);
        CHECK(ids.count() == 1 + ids.user_count());
    }

    TEST_CASE("free_then_allocate_reuses_slot") {
        ElementIdAllocator ids;
        (void)ids.allocate();
        auto second = ids.allocate();
        ids.free(second);
        CHECK_FALSE(ids.is_alive(second));
        CHECK(ids.free_list_size() == 1);
        CHECK(ids.allocate() == second); // slot reused
        CHECK(ids.is_alive(second));
        CHECK(ids.free_list_size() == 0);
        CHECK(ids.allocate() == 3);
    }

    TEST_CASE("free_of_root_is_noop") {
        ElementIdAllocator ids;
        (void)ids.allocate();
        ids.free(kRootElementId);
        CHECK(ids.count() == 2);
        CHECK(ids.is_alive(kRootElementId));
        CHECK(ids.free_list_size() == 0);
    }

    TEST_CASE("double_free_is_idempotent") {
        ElementIdAllocator ids;
        auto a = ids.allocate();
        auto b = ids.allocate();
        ids.free(a);
        ids.free(a);
        CHECK(ids.user_count() == 1);
        CHECK(ids.free_list_size() == 1);
        CHECK(ids.is_alive(b));

        // Freeing an id that was never handed out changes nothing.
        ids.free(99);
        CHECK(ids.user_count() == 1);
        CHECK(ids.free_list_size() == 1);

        CHECK(ids.allocate() == a);
        CHECK(ids.allocate() == 3);
    }

    TEST_CASE("lifo_reuse_hands_out_most_recent_first") {
        ElementIdAllocator ids{IdReuseOrder::Lifo};
        for (int i = 0; i < 5; ++i) {
            (void)ids.allocate();
        }
        ids.free(2);
        ids.free(4);
        ids.free(3);
        CHECK(ids.allocate() == 3);
        CHECK(ids.allocate() == 4);
        CHECK(ids.allocate() == 2);
        CHECK(ids.allocate() == 6);
    }

    TEST_CASE("fifo_reuse_hands_out_oldest_first") {
        ElementIdAllocator ids{IdReuseOrder::Fifo};
        CHECK(ids.reuse_order() == IdReuseOrder::Fifo);
        for (int i = 0; i < 5; ++i) {
            (void)ids.allocate();
        }
        ids.free(2);
        ids.free(4);
        ids.free(3);
        CHECK(ids.allocate() == 2);
        CHECK(ids.allocate() == 4);
        CHECK(ids.allocate() == 3);
        CHECK(ids.allocate() == 6);
    }

    TEST_CASE("reused_ids_come_from_freed_set") {
        ElementIdAllocator ids;
        std::vector<ElementId> allocated;
        for (int i = 0; i < 10; ++i) {
            allocated.push_back(ids.allocate());
        }
        std::set<ElementId> freed{allocated[1], allocated[4], allocated[7]};
        for (auto id : freed) {
            ids.free(id);
        }
        std::set<ElementId> reused;
        for (int i = 0; i < 3; ++i) {
            reused.insert(ids.allocate());
        }
        CHECK(reused == freed);
        CHECK(ids.allocate() == 11);
    }

    TEST_CASE("count_identity_holds_through_mixed_operations") {
        ElementIdAllocator ids;
        std::vector<ElementId> live;
        for (int round = 0; round < 50; ++round) {
            live.push_back(ids.allocate());
            live.push_back(ids.allocate());
            if (round % 3 == 0) {
                ids.free(live.front());
                live.erase(live.begin());
            }
            CHECK(ids.count() == 1 + ids.user_count());
            CHECK(ids.user_count() == live.size());
        }
        std::sort(live.begin(), live.end());
        CHECK(ids.live_ids() == live);
    }

    TEST_CASE("clear_returns_to_fresh_state") {
        ElementIdAllocator ids;
        (void)ids.allocate();
        auto b = ids.allocate();
        ids.free(b);
        ids.clear();
        CHECK(ids.count() == 1);
        CHECK(ids.user_count() == 0);
        CHECK(ids.free_list_size() == 0);
        CHECK(ids.allocate() == 1);
    }

    TEST_CASE("fresh_counter_is_wider_than_the_id_space") {
        ElementIdAllocator ids;
        CHECK(ids.next_fresh_id() == 1);
        CHECK(kMaxElementId == std::numeric_limits<std::uint32_t>::max());
        static_assert(std::numeric_limits<decltype(ids.next_fresh_id())>::max() > kMaxElementId);

        auto a = ids.allocate();
        (void)ids.allocate();
        CHECK(ids.next_fresh_id() == 3);
        ids.free(a);
        CHECK(ids.allocate() == a);
        CHECK(ids.next_fresh_id() == 3);
        ids.clear();
        CHECK(ids.next_fresh_id() == 1);
    }
}
