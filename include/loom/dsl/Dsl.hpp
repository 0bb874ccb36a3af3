#pragma once

#include <loom/dsl/Node.hpp>

#include <type_traits>
#include <utility>

// Declarative construction of Node trees:
//   el_div(attr("class", "card"), el_h1(text("Title")), dyn_text(0))
namespace LM::Dsl {

[[nodiscard]] inline auto text(std::string content) -> Node {
    return Node::Text(std::move(content));
}

[[nodiscard]] inline auto dyn_text(std::uint32_t index) -> Node {
    return Node::DynamicText(index);
}

[[nodiscard]] inline auto dyn_node(std::uint32_t index) -> Node {
    return Node::DynamicNode(index);
}

[[nodiscard]] inline auto attr(std::string name, std::string value) -> Node {
    return Node::StaticAttr(std::move(name), std::move(value));
}

[[nodiscard]] inline auto dyn_attr(std::uint32_t index) -> Node {
    return Node::DynamicAttr(index);
}

template <typename... Items>
[[nodiscard]] auto element(TagId tag, Items&&... items) -> Node {
    static_assert((std::is_same_v<std::remove_cvref_t<Items>, Node> && ...), "element items must be Nodes");
    static_assert((!std::is_lvalue_reference_v<Items> && ...), "element takes ownership of its items; pass temporaries or std::move");
    ElementData data{tag, {}};
    data.items.reserve(sizeof...(Items));
    (data.items.push_back(std::forward<Items>(items)), ...);
    return Node{std::move(data)};
}

#define LM_DSL_TAG_HELPER(name, tag)                              \
    template <typename... Items>                                  \
    [[nodiscard]] auto name(Items&&... items) -> Node {           \
        return element(tag, std::forward<Items>(items)...);       \
    }

LM_DSL_TAG_HELPER(el_div, Tag::Div)
LM_DSL_TAG_HELPER(el_span, Tag::Span)
LM_DSL_TAG_HELPER(el_p, Tag::P)
LM_DSL_TAG_HELPER(el_section, Tag::Section)
LM_DSL_TAG_HELPER(el_header, Tag::Header)
LM_DSL_TAG_HELPER(el_footer, Tag::Footer)
LM_DSL_TAG_HELPER(el_nav, Tag::Nav)
LM_DSL_TAG_HELPER(el_main, Tag::Main)
LM_DSL_TAG_HELPER(el_article, Tag::Article)
LM_DSL_TAG_HELPER(el_aside, Tag::Aside)
LM_DSL_TAG_HELPER(el_h1, Tag::H1)
LM_DSL_TAG_HELPER(el_h2, Tag::H2)
LM_DSL_TAG_HELPER(el_h3, Tag::H3)
LM_DSL_TAG_HELPER(el_h4, Tag::H4)
LM_DSL_TAG_HELPER(el_h5, Tag::H5)
LM_DSL_TAG_HELPER(el_h6, Tag::H6)
LM_DSL_TAG_HELPER(el_ul, Tag::Ul)
LM_DSL_TAG_HELPER(el_ol, Tag::Ol)
LM_DSL_TAG_HELPER(el_li, Tag::Li)
LM_DSL_TAG_HELPER(el_button, Tag::Button)
LM_DSL_TAG_HELPER(el_input, Tag::Input)
LM_DSL_TAG_HELPER(el_form, Tag::Form)
LM_DSL_TAG_HELPER(el_textarea, Tag::Textarea)
LM_DSL_TAG_HELPER(el_select, Tag::Select)
LM_DSL_TAG_HELPER(el_option, Tag::Option)
LM_DSL_TAG_HELPER(el_label, Tag::Label)
LM_DSL_TAG_HELPER(el_a, Tag::A)
LM_DSL_TAG_HELPER(el_img, Tag::Img)
LM_DSL_TAG_HELPER(el_table, Tag::Table)
LM_DSL_TAG_HELPER(el_thead, Tag::Thead)
LM_DSL_TAG_HELPER(el_tbody, Tag::Tbody)
LM_DSL_TAG_HELPER(el_tr, Tag::Tr)
LM_DSL_TAG_HELPER(el_td, Tag::Td)
LM_DSL_TAG_HELPER(el_th, Tag::Th)
LM_DSL_TAG_HELPER(el_strong, Tag::Strong)
LM_DSL_TAG_HELPER(el_em, Tag::Em)
LM_DSL_TAG_HELPER(el_br, Tag::Br)
LM_DSL_TAG_HELPER(el_hr, Tag::Hr)
LM_DSL_TAG_HELPER(el_pre, Tag::Pre)
LM_DSL_TAG_HELPER(el_code, Tag::Code)

#undef LM_DSL_TAG_HELPER

} // namespace LM::Dsl
