#include <loom/dsl/Node.hpp>

#include <cassert>
#include <utility>

namespace LM {

namespace {

template <typename Counter>
auto count_subtree(Node const& node, Counter&& counter) -> std::size_t {
    std::size_t total = counter(node);
    if (node.is_element()) {
        for (auto const& item : node.items()) {
            total += count_subtree(item, counter);
        }
    }
    return total;
}

auto count_kind(Node const& node, NodeKind kind) -> std::size_t {
    return count_subtree(node, [kind](Node const& current) -> std::size_t {
        return current.kind() == kind ? 1 : 0;
    });
}

} // namespace

auto Node::Text(std::string content) -> Node {
    return Node{TextData{std::move(content)}};
}

auto Node::Element(TagId tag) -> Node {
    return Node{ElementData{tag, {}}};
}

auto Node::DynamicText(std::uint32_t index) -> Node {
    return Node{DynamicTextData{index}};
}

auto Node::DynamicNode(std::uint32_t index) -> Node {
    return Node{DynamicNodeData{index}};
}

auto Node::StaticAttr(std::string name, std::string value) -> Node {
    return Node{StaticAttrData{std::move(name), std::move(value)}};
}

auto Node::DynamicAttr(std::uint32_t index) -> Node {
    return Node{DynamicAttrData{index}};
}

Node::Node(Data data)
    : data_(std::move(data)) {}

Node::~Node()                                = default;
Node::Node(Node&&) noexcept                  = default;
auto Node::operator=(Node&&) noexcept -> Node& = default;

auto Node::add_item(Node&& item) -> Expected<void> {
    auto* element = std::get_if<ElementData>(&data_);
    if (element == nullptr) {
        return make_error(Error::Code::InvalidType,
                          "add_item requires an element parent, got " + std::string(node_kind_to_string(kind())));
    }
    element->items.push_back(std::move(item));
    return {};
}

auto Node::tag() const -> TagId {
    auto const* element = std::get_if<ElementData>(&data_);
    assert(element != nullptr && "tag() requires an element node");
    return element->tag;
}

auto Node::dynamic_index() const -> std::uint32_t {
    switch (kind()) {
    case NodeKind::DynamicText:
        return std::get<DynamicTextData>(data_).index;
    case NodeKind::DynamicNode:
        return std::get<DynamicNodeData>(data_).index;
    case NodeKind::DynamicAttr:
        return std::get<DynamicAttrData>(data_).index;
    default:
        break;
    }
    assert(false && "dynamic_index() requires a dynamic node");
    return 0;
}

auto Node::text() const -> std::string_view {
    auto const* text = std::get_if<TextData>(&data_);
    assert(text != nullptr && "text() requires a text node");
    return text->content;
}

auto Node::attr_name() const -> std::string_view {
    auto const* attr = std::get_if<StaticAttrData>(&data_);
    assert(attr != nullptr && "attr_name() requires a static attribute");
    return attr->name;
}

auto Node::attr_value() const -> std::string_view {
    auto const* attr = std::get_if<StaticAttrData>(&data_);
    assert(attr != nullptr && "attr_value() requires a static attribute");
    return attr->value;
}

auto Node::items() const -> std::span<Node const> {
    auto const* element = std::get_if<ElementData>(&data_);
    assert(element != nullptr && "items() requires an element node");
    return element->items;
}

auto Node::item_at(std::size_t index) const -> Node const& {
    auto const all = items();
    assert(index < all.size());
    return all[index];
}

auto Node::item_count() const -> std::size_t {
    if (!is_element()) {
        return 0;
    }
    return items().size();
}

auto Node::child_count() const -> std::size_t {
    if (!is_element()) {
        return 0;
    }
    std::size_t count = 0;
    for (auto const& item : items()) {
        if (!item.is_attribute()) {
            ++count;
        }
    }
    return count;
}

auto Node::attr_count() const -> std::size_t {
    return item_count() - child_count();
}

auto Node::count_nodes() const -> std::size_t {
    return count_subtree(*this, [](Node const& current) -> std::size_t {
        return current.is_attribute() ? 0 : 1;
    });
}

auto Node::count_dyn_text() const -> std::size_t {
    return count_kind(*this, NodeKind::DynamicText);
}

auto Node::count_dyn_node() const -> std::size_t {
    return count_kind(*this, NodeKind::DynamicNode);
}

auto Node::count_dyn_attr() const -> std::size_t {
    return count_kind(*this, NodeKind::DynamicAttr);
}

auto Node::count_static_attr() const -> std::size_t {
    return count_kind(*this, NodeKind::StaticAttr);
}

auto node_kind_to_string(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Text:
        return "text";
    case NodeKind::Element:
        return "element";
    case NodeKind::DynamicText:
        return "dynamic_text";
    case NodeKind::DynamicNode:
        return "dynamic_node";
    case NodeKind::StaticAttr:
        return "static_attr";
    case NodeKind::DynamicAttr:
        return "dynamic_attr";
    }
    return "unknown";
}

} // namespace LM
