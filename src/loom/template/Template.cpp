#include <loom/template/Template.hpp>

#include <cassert>
#include <utility>

namespace LM {

Template::Template(std::string name,
                   std::vector<TemplateNode> nodes,
                   std::vector<TemplateAttribute> attributes,
                   std::vector<std::uint32_t> roots)
    : name_(std::move(name))
    , nodes_(std::move(nodes))
    , attributes_(std::move(attributes))
    , roots_(std::move(roots)) {
    for (auto const& entry : nodes_) {
        if (entry.kind == TemplateNodeKind::Dynamic) {
            ++dynamic_node_count_;
        } else if (entry.kind == TemplateNodeKind::DynamicText) {
            ++dynamic_text_count_;
        }
    }
    for (auto const& attr : attributes_) {
        if (attr.kind == TemplateAttributeKind::Static) {
            ++static_attr_count_;
        } else {
            ++dynamic_attr_count_;
        }
    }
}

auto Template::root_index(std::size_t i) const -> std::uint32_t {
    assert(i < roots_.size());
    return roots_[i];
}

auto Template::node(std::size_t index) const -> TemplateNode const& {
    assert(index < nodes_.size());
    return nodes_[index];
}

auto Template::attribute(std::size_t index) const -> TemplateAttribute const& {
    assert(index < attributes_.size());
    return attributes_[index];
}

auto Template::node_kind(std::size_t index) const -> TemplateNodeKind {
    return node(index).kind;
}

auto Template::node_tag(std::size_t index) const -> TagId {
    auto const& entry = node(index);
    assert(entry.kind == TemplateNodeKind::Element && "node_tag requires an element");
    return entry.tag;
}

auto Template::node_text(std::size_t index) const -> std::string_view {
    auto const& entry = node(index);
    assert(entry.kind == TemplateNodeKind::Text && "node_text requires a text node");
    return entry.text;
}

auto Template::node_dynamic_index(std::size_t index) const -> std::uint32_t {
    auto const& entry = node(index);
    assert((entry.kind == TemplateNodeKind::Dynamic || entry.kind == TemplateNodeKind::DynamicText)
           && "node_dynamic_index requires a dynamic node");
    return entry.dynamic_index;
}

auto Template::node_child_count(std::size_t index) const -> std::size_t {
    return node(index).children.size();
}

auto Template::node_child_at(std::size_t index, std::size_t child) const -> std::uint32_t {
    auto const& entry = node(index);
    assert(child < entry.children.size());
    return entry.children[child];
}

auto Template::node_attr_count(std::size_t index) const -> std::size_t {
    return node(index).attr_count;
}

auto Template::node_first_attr(std::size_t index) const -> std::uint32_t {
    return node(index).first_attr;
}

auto Template::attr_kind(std::size_t index) const -> TemplateAttributeKind {
    return attribute(index).kind;
}

auto Template::attr_name(std::size_t index) const -> std::string_view {
    auto const& attr = attribute(index);
    assert(attr.kind == TemplateAttributeKind::Static && "attr_name requires a static attribute");
    return attr.name;
}

auto Template::attr_value(std::size_t index) const -> std::string_view {
    auto const& attr = attribute(index);
    assert(attr.kind == TemplateAttributeKind::Static && "attr_value requires a static attribute");
    return attr.value;
}

auto Template::attr_dynamic_index(std::size_t index) const -> std::uint32_t {
    auto const& attr = attribute(index);
    assert(attr.kind == TemplateAttributeKind::Dynamic && "attr_dynamic_index requires a dynamic attribute");
    return attr.dynamic_index;
}

auto Template::attr_owner(std::size_t index) const -> std::uint32_t {
    return attribute(index).owner;
}

auto Template::same_structure(Template const& other) const -> bool {
    return nodes_ == other.nodes_ && attributes_ == other.attributes_ && roots_ == other.roots_;
}

auto template_node_kind_to_string(TemplateNodeKind kind) -> std::string_view {
    switch (kind) {
    case TemplateNodeKind::Element:
        return "element";
    case TemplateNodeKind::Text:
        return "text";
    case TemplateNodeKind::Dynamic:
        return "dynamic";
    case TemplateNodeKind::DynamicText:
        return "dynamic_text";
    }
    return "unknown";
}

auto template_attribute_kind_to_string(TemplateAttributeKind kind) -> std::string_view {
    switch (kind) {
    case TemplateAttributeKind::Static:
        return "static";
    case TemplateAttributeKind::Dynamic:
        return "dynamic";
    }
    return "unknown";
}

} // namespace LM
