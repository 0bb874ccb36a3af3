#pragma once

#include <loom/core/Error.hpp>
#include <loom/core/RuntimeOptions.hpp>
#include <loom/template/Template.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace LM {

// Owns compiled templates. Ids are dense and assigned in registration order from 0;
// names are unique and registering a known name returns the existing id.
class TemplateRegistry {
public:
    TemplateRegistry() = default;
    explicit TemplateRegistry(std::size_t max_templates)
        : max_templates_(max_templates) {}

    auto register_template(Template&& tmpl) -> Expected<TemplateId>;
    auto clear() -> void;

    [[nodiscard]] auto count() const -> std::size_t {
        return templates_.size();
    }
    [[nodiscard]] auto max_templates() const -> std::size_t {
        return max_templates_;
    }

    [[nodiscard]] auto contains(TemplateId id) const -> bool {
        return id < templates_.size();
    }
    [[nodiscard]] auto contains_name(std::string_view name) const -> bool;
    [[nodiscard]] auto find_by_name(std::string_view name) const -> std::optional<TemplateId>;

    [[nodiscard]] auto get(TemplateId id) const -> Template const&;
    [[nodiscard]] auto name(TemplateId id) const -> std::string const&;

    [[nodiscard]] auto templates() const -> std::span<Template const> {
        return templates_;
    }

private:
    std::size_t                                    max_templates_ = RuntimeOptions::kUnlimitedTemplates;
    std::vector<Template>                          templates_{};
    phmap::flat_hash_map<std::string, TemplateId> by_name_{};
};

} // namespace LM
