#include <loom/template/TemplateRegistry.hpp>

#include "log/TaggedLogger.hpp"

#include <cassert>
#include <utility>

namespace LM {

auto TemplateRegistry::register_template(Template&& tmpl) -> Expected<TemplateId> {
    if (auto existing = find_by_name(tmpl.name())) {
        lm_log("Template '" + tmpl.name() + "' already registered as id " + std::to_string(*existing)
                   + ", discarding new structure",
               "TemplateRegistry", "INFO");
        return *existing;
    }
    if (templates_.size() >= max_templates_) {
        lm_log("Template limit reached while registering '" + tmpl.name() + "'", "TemplateRegistry", "ERROR");
        return make_error(Error::Code::CapacityExceeded,
                          "template registry is full (" + std::to_string(max_templates_) + " templates)");
    }
    auto const id = static_cast<TemplateId>(templates_.size());
    by_name_.emplace(tmpl.name(), id);
    templates_.push_back(std::move(tmpl));
    lm_log("Registered template '" + templates_.back().name() + "' as id " + std::to_string(id), "TemplateRegistry", "INFO");
    return id;
}

auto TemplateRegistry::clear() -> void {
    templates_.clear();
    by_name_.clear();
}

auto TemplateRegistry::contains_name(std::string_view name) const -> bool {
    return find_by_name(name).has_value();
}

auto TemplateRegistry::find_by_name(std::string_view name) const -> std::optional<TemplateId> {
    auto const found = by_name_.find(name);
    if (found == by_name_.end()) {
        return std::nullopt;
    }
    return found->second;
}

auto TemplateRegistry::get(TemplateId id) const -> Template const& {
    assert(contains(id));
    return templates_[id];
}

auto TemplateRegistry::name(TemplateId id) const -> std::string const& {
    return get(id).name();
}

} // namespace LM
