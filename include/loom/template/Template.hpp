#pragma once

#include <loom/dsl/Tags.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace LM {

using TemplateId = std::uint32_t;

enum class TemplateNodeKind : std::uint8_t {
    Element     = 0,
    Text        = 1,
    Dynamic     = 2,
    DynamicText = 3,
};

enum class TemplateAttributeKind : std::uint8_t {
    Static  = 0,
    Dynamic = 1,
};

struct TemplateNode {
    TemplateNodeKind           kind = TemplateNodeKind::Element;
    TagId                      tag  = Tag::Unknown; // elements only
    std::string                text;                // text nodes only
    std::uint32_t              dynamic_index = 0;   // Dynamic and DynamicText only
    std::vector<std::uint32_t> children;            // indices into the node table
    std::uint32_t              first_attr = 0;      // start of this node's range in the attribute table
    std::uint32_t              attr_count = 0;

    auto operator==(TemplateNode const&) const -> bool = default;
};

struct TemplateAttribute {
    TemplateAttributeKind kind = TemplateAttributeKind::Static;
    std::string           name;
    std::string           value;
    std::uint32_t         dynamic_index = 0;
    std::uint32_t         owner         = 0; // index of the element carrying the attribute

    auto operator==(TemplateAttribute const&) const -> bool = default;
};

/*
 * Flattened, immutable form of a node tree: a node table, an attribute table in
 * which every element's attributes occupy one contiguous range, and the ordered
 * list of root indices. Produced by TemplateBuilder::build().
 * Index arguments out of range are contract violations.
 */
class Template {
public:
    Template() = default;

    [[nodiscard]] auto name() const -> std::string const& {
        return name_;
    }

    [[nodiscard]] auto node_count() const -> std::size_t {
        return nodes_.size();
    }
    [[nodiscard]] auto root_count() const -> std::size_t {
        return roots_.size();
    }
    [[nodiscard]] auto attr_total_count() const -> std::size_t {
        return attributes_.size();
    }

    [[nodiscard]] auto nodes() const -> std::span<TemplateNode const> {
        return nodes_;
    }
    [[nodiscard]] auto attributes() const -> std::span<TemplateAttribute const> {
        return attributes_;
    }
    [[nodiscard]] auto roots() const -> std::span<std::uint32_t const> {
        return roots_;
    }

    [[nodiscard]] auto root_index(std::size_t i) const -> std::uint32_t;
    [[nodiscard]] auto node(std::size_t index) const -> TemplateNode const&;
    [[nodiscard]] auto attribute(std::size_t index) const -> TemplateAttribute const&;

    [[nodiscard]] auto node_kind(std::size_t index) const -> TemplateNodeKind;
    [[nodiscard]] auto node_tag(std::size_t index) const -> TagId;
    [[nodiscard]] auto node_text(std::size_t index) const -> std::string_view;
    [[nodiscard]] auto node_dynamic_index(std::size_t index) const -> std::uint32_t;
    [[nodiscard]] auto node_child_count(std::size_t index) const -> std::size_t;
    [[nodiscard]] auto node_child_at(std::size_t index, std::size_t child) const -> std::uint32_t;
    [[nodiscard]] auto node_attr_count(std::size_t index) const -> std::size_t;
    [[nodiscard]] auto node_first_attr(std::size_t index) const -> std::uint32_t;

    [[nodiscard]] auto attr_kind(std::size_t index) const -> TemplateAttributeKind;
    [[nodiscard]] auto attr_name(std::size_t index) const -> std::string_view;
    [[nodiscard]] auto attr_value(std::size_t index) const -> std::string_view;
    [[nodiscard]] auto attr_dynamic_index(std::size_t index) const -> std::uint32_t;
    [[nodiscard]] auto attr_owner(std::size_t index) const -> std::uint32_t;

    [[nodiscard]] auto static_attr_count() const -> std::size_t {
        return static_attr_count_;
    }
    [[nodiscard]] auto dynamic_attr_count() const -> std::size_t {
        return dynamic_attr_count_;
    }
    [[nodiscard]] auto dynamic_node_count() const -> std::size_t {
        return dynamic_node_count_;
    }
    [[nodiscard]] auto dynamic_text_count() const -> std::size_t {
        return dynamic_text_count_;
    }

    // Node table, attribute table and roots compare equal; the name is ignored.
    [[nodiscard]] auto same_structure(Template const& other) const -> bool;

private:
    friend class TemplateBuilder;

    Template(std::string name,
             std::vector<TemplateNode> nodes,
             std::vector<TemplateAttribute> attributes,
             std::vector<std::uint32_t> roots);

    std::string                    name_;
    std::vector<TemplateNode>      nodes_;
    std::vector<TemplateAttribute> attributes_;
    std::vector<std::uint32_t>     roots_;
    std::size_t                    static_attr_count_  = 0;
    std::size_t                    dynamic_attr_count_ = 0;
    std::size_t                    dynamic_node_count_ = 0;
    std::size_t                    dynamic_text_count_ = 0;
};

[[nodiscard]] auto template_node_kind_to_string(TemplateNodeKind kind) -> std::string_view;
[[nodiscard]] auto template_attribute_kind_to_string(TemplateAttributeKind kind) -> std::string_view;

} // namespace LM
