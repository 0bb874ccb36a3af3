#pragma once
#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>

namespace LM {

enum class IdReuseOrder {
    Lifo, // most recently freed id is handed out first
    Fifo
};

enum class SlotValidation {
    Permissive,
    Strict // dynamic slot indices must form dense 0..N-1 ranges per slot space
};

struct RuntimeOptions {
    static constexpr std::size_t kUnlimitedTemplates = std::numeric_limits<std::size_t>::max();

    // User-provided so `= {}` below compiles on GCC (bug 96645); members keep their initializers.
    RuntimeOptions() noexcept {}

    IdReuseOrder   element_id_reuse = IdReuseOrder::Lifo;
    SlotValidation slot_validation  = SlotValidation::Permissive;
    std::size_t    max_templates    = kUnlimitedTemplates;

    // Overrides fields from LOOM_ID_REUSE, LOOM_SLOT_VALIDATION and LOOM_MAX_TEMPLATES.
    [[nodiscard]] static auto FromEnvironment(RuntimeOptions base = {}) -> RuntimeOptions;
};

[[nodiscard]] auto parse_id_reuse_order(std::string_view text) -> std::optional<IdReuseOrder>;
[[nodiscard]] auto parse_slot_validation(std::string_view text) -> std::optional<SlotValidation>;
[[nodiscard]] auto parse_template_limit(std::string_view text) -> std::optional<std::size_t>;

[[nodiscard]] auto to_string(IdReuseOrder order) -> std::string_view;
[[nodiscard]] auto to_string(SlotValidation validation) -> std::string_view;

} // namespace LM
