#include <loom/core/RuntimeOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>

namespace LM {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto equals_ignore_case(std::string_view lhs, std::string_view rhs) -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i]))
            != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

auto read_env(char const* name) -> std::optional<std::string_view> {
    if (const char* env = std::getenv(name)) {
        if (*env) {
            return std::string_view{env};
        }
    }
    return std::nullopt;
}

} // namespace

auto parse_id_reuse_order(std::string_view text) -> std::optional<IdReuseOrder> {
    text = trim(text);
    if (equals_ignore_case(text, "lifo")) {
        return IdReuseOrder::Lifo;
    }
    if (equals_ignore_case(text, "fifo")) {
        return IdReuseOrder::Fifo;
    }
    return std::nullopt;
}

auto parse_slot_validation(std::string_view text) -> std::optional<SlotValidation> {
    text = trim(text);
    if (equals_ignore_case(text, "permissive")) {
        return SlotValidation::Permissive;
    }
    if (equals_ignore_case(text, "strict")) {
        return SlotValidation::Strict;
    }
    return std::nullopt;
}

auto parse_template_limit(std::string_view text) -> std::optional<std::size_t> {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto to_string(IdReuseOrder order) -> std::string_view {
    switch (order) {
    case IdReuseOrder::Lifo:
        return "lifo";
    case IdReuseOrder::Fifo:
        return "fifo";
    }
    return "lifo";
}

auto to_string(SlotValidation validation) -> std::string_view {
    switch (validation) {
    case SlotValidation::Permissive:
        return "permissive";
    case SlotValidation::Strict:
        return "strict";
    }
    return "permissive";
}

auto RuntimeOptions::FromEnvironment(RuntimeOptions base) -> RuntimeOptions {
    if (auto value = read_env("LOOM_ID_REUSE")) {
        if (auto parsed = parse_id_reuse_order(*value)) {
            base.element_id_reuse = *parsed;
        } else {
            lm_log("Ignoring unrecognised LOOM_ID_REUSE value: " + std::string(*value), "Runtime", "WARN");
        }
    }
    if (auto value = read_env("LOOM_SLOT_VALIDATION")) {
        if (auto parsed = parse_slot_validation(*value)) {
            base.slot_validation = *parsed;
        } else {
            lm_log("Ignoring unrecognised LOOM_SLOT_VALIDATION value: " + std::string(*value), "Runtime", "WARN");
        }
    }
    if (auto value = read_env("LOOM_MAX_TEMPLATES")) {
        if (auto parsed = parse_template_limit(*value)) {
            base.max_templates = *parsed;
        } else {
            lm_log("Ignoring unrecognised LOOM_MAX_TEMPLATES value: " + std::string(*value), "Runtime", "WARN");
        }
    }
    return base;
}

} // namespace LM
