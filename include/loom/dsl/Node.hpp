#pragma once

#include <loom/core/Error.hpp>
#include <loom/dsl/Tags.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace LM {

enum class NodeKind : std::uint8_t {
    Text        = 0,
    Element     = 1,
    DynamicText = 2,
    DynamicNode = 3,
    StaticAttr  = 4,
    DynamicAttr = 5,
};

class Node;

struct TextData {
    std::string content;
};

struct ElementData {
    TagId             tag = Tag::Unknown;
    std::vector<Node> items; // attributes and children, in insertion order
};

struct DynamicTextData {
    std::uint32_t index = 0;
};

struct DynamicNodeData {
    std::uint32_t index = 0;
};

struct StaticAttrData {
    std::string name;
    std::string value;
};

struct DynamicAttrData {
    std::uint32_t index = 0;
};

/*
 * One DSL-constructed UI fragment. Elements exclusively own their items, so a
 * Node is a tree; it can be moved but never copied. Accessors that do not apply
 * to the node's kind are contract violations and assert.
 */
class Node {
public:
    // Alternative order matches the NodeKind codes.
    using Data = std::variant<TextData, ElementData, DynamicTextData, DynamicNodeData, StaticAttrData, DynamicAttrData>;

    static auto Text(std::string content) -> Node;
    static auto Element(TagId tag) -> Node;
    static auto DynamicText(std::uint32_t index) -> Node;
    static auto DynamicNode(std::uint32_t index) -> Node;
    static auto StaticAttr(std::string name, std::string value) -> Node;
    static auto DynamicAttr(std::uint32_t index) -> Node;

    explicit Node(Data data);
    ~Node();
    Node(Node&&) noexcept;
    auto operator=(Node&&) noexcept -> Node&;
    Node(Node const&)                    = delete;
    auto operator=(Node const&) -> Node& = delete;

    // Appends item to this element. On a non-element the item is left untouched.
    auto add_item(Node&& item) -> Expected<void>;

    [[nodiscard]] auto kind() const -> NodeKind {
        return static_cast<NodeKind>(data_.index());
    }
    [[nodiscard]] auto is_element() const -> bool {
        return kind() == NodeKind::Element;
    }
    [[nodiscard]] auto is_attribute() const -> bool {
        return kind() == NodeKind::StaticAttr || kind() == NodeKind::DynamicAttr;
    }
    [[nodiscard]] auto data() const -> Data const& {
        return data_;
    }

    [[nodiscard]] auto tag() const -> TagId;
    [[nodiscard]] auto dynamic_index() const -> std::uint32_t;
    [[nodiscard]] auto text() const -> std::string_view;
    [[nodiscard]] auto attr_name() const -> std::string_view;
    [[nodiscard]] auto attr_value() const -> std::string_view;
    [[nodiscard]] auto items() const -> std::span<Node const>;
    [[nodiscard]] auto item_at(std::size_t index) const -> Node const&;

    [[nodiscard]] auto item_count() const -> std::size_t;
    [[nodiscard]] auto child_count() const -> std::size_t;
    [[nodiscard]] auto attr_count() const -> std::size_t;

    // Text, DynamicText, DynamicNode and Element nodes in the subtree, this node included.
    [[nodiscard]] auto count_nodes() const -> std::size_t;
    [[nodiscard]] auto count_dyn_text() const -> std::size_t;
    [[nodiscard]] auto count_dyn_node() const -> std::size_t;
    [[nodiscard]] auto count_dyn_attr() const -> std::size_t;
    [[nodiscard]] auto count_static_attr() const -> std::size_t;

private:
    Data data_;
};

[[nodiscard]] auto node_kind_to_string(NodeKind kind) -> std::string_view;

} // namespace LM
