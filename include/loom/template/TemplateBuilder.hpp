#pragma once

#include <loom/core/Error.hpp>
#include <loom/template/Template.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace LM {

/*
 * Incremental construction of a Template. Nodes receive indices in push order;
 * a parent of kNoParent makes the node a root. Attributes may be pushed in any
 * order and are grouped per owning element by build().
 */
class TemplateBuilder {
public:
    static constexpr std::int64_t kNoParent = -1;

    explicit TemplateBuilder(std::string name);

    auto push_element(TagId tag, std::int64_t parent = kNoParent) -> Expected<std::uint32_t>;
    auto push_text(std::string text, std::int64_t parent = kNoParent) -> Expected<std::uint32_t>;
    auto push_dynamic(std::uint32_t dynamic_index, std::int64_t parent = kNoParent) -> Expected<std::uint32_t>;
    auto push_dynamic_text(std::uint32_t dynamic_index, std::int64_t parent = kNoParent) -> Expected<std::uint32_t>;

    // Both return the pending attribute's position in push order.
    auto push_static_attr(std::uint32_t node, std::string name, std::string value) -> Expected<std::uint32_t>;
    auto push_dynamic_attr(std::uint32_t node, std::uint32_t dynamic_index) -> Expected<std::uint32_t>;

    [[nodiscard]] auto name() const -> std::string const& {
        return name_;
    }
    [[nodiscard]] auto node_count() const -> std::size_t {
        return nodes_.size();
    }
    [[nodiscard]] auto root_count() const -> std::size_t {
        return roots_.size();
    }
    [[nodiscard]] auto attr_count() const -> std::size_t {
        return attributes_.size();
    }

    // Moves the pending state into a Template; the builder is left empty under the same name.
    [[nodiscard]] auto build() -> Template;

private:
    auto push_node(TemplateNode node, std::int64_t parent) -> Expected<std::uint32_t>;
    auto require_element(std::int64_t index, char const* operation) const -> Expected<void>;

    std::string                    name_;
    std::vector<TemplateNode>      nodes_{};
    std::vector<TemplateAttribute> attributes_{};
    std::vector<std::uint32_t>     roots_{};
};

} // namespace LM
