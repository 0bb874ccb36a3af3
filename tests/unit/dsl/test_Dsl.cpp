#include <loom/dsl/Dsl.hpp>

#include <doctest/doctest.h>

#include <functional>
#include <vector>

using namespace LM;
using namespace LM::Dsl;

TEST_SUITE("dsl.builders") {
    TEST_CASE("Leaf helpers match the Node constructors") {
        CHECK(text("hi").kind() == NodeKind::Text);
        CHECK(dyn_text(4).dynamic_index() == 4);
        CHECK(dyn_node(5).kind() == NodeKind::DynamicNode);
        CHECK(attr("href", "/home").attr_value() == "/home");
        CHECK(dyn_attr(1).kind() == NodeKind::DynamicAttr);
    }

    TEST_CASE("Element with mixed attributes and children") {
        auto node = el_div(attr("class", "card"),
                           el_h1(text("Title")),
                           dyn_attr(0),
                           el_p(text("Body"), dyn_text(0)));
        CHECK(node.tag() == Tag::Div);
        CHECK(node.item_count() == 4);
        CHECK(node.child_count() == 2);
        CHECK(node.attr_count() == 2);
        CHECK(node.count_nodes() == 6);
        CHECK(node.count_dyn_text() == 1);
        CHECK(node.count_dyn_attr() == 1);
        CHECK(node.count_static_attr() == 1);
    }

    TEST_CASE("Span and button under a div") {
        auto tree = el_div(el_span(text("inner")), el_button(dyn_text(0), dyn_attr(0)));
        CHECK(tree.count_nodes() == 5);
        CHECK(tree.count_dyn_text() == 1);
        CHECK(tree.count_dyn_attr() == 1);
    }

    TEST_CASE("Deeply nested elements") {
        auto tree = el_section(el_article(el_header(el_nav(el_ul(el_li(el_a(attr("href", "#"), text("link"))))))));
        CHECK(tree.count_nodes() == 8);
        CHECK(tree.count_static_attr() == 1);
        Node const* cursor = &tree;
        std::vector<TagId> tags;
        while (cursor->is_element()) {
            tags.push_back(cursor->tag());
            cursor = &cursor->items().back();
        }
        CHECK(tags == std::vector<TagId>{Tag::Section, Tag::Article, Tag::Header, Tag::Nav, Tag::Ul, Tag::Li, Tag::A});
        CHECK(cursor->text() == "link");
    }

    TEST_CASE("Every tag helper produces its tag") {
        std::vector<std::pair<TagId, std::function<Node()>>> helpers{
            {Tag::Div, [] { return el_div(); }},         {Tag::Span, [] { return el_span(); }},
            {Tag::P, [] { return el_p(); }},             {Tag::Section, [] { return el_section(); }},
            {Tag::Header, [] { return el_header(); }},   {Tag::Footer, [] { return el_footer(); }},
            {Tag::Nav, [] { return el_nav(); }},         {Tag::Main, [] { return el_main(); }},
            {Tag::Article, [] { return el_article(); }}, {Tag::Aside, [] { return el_aside(); }},
            {Tag::H1, [] { return el_h1(); }},           {Tag::H2, [] { return el_h2(); }},
            {Tag::H3, [] { return el_h3(); }},           {Tag::H4, [] { return el_h4(); }},
            {Tag::H5, [] { return el_h5(); }},           {Tag::H6, [] { return el_h6(); }},
            {Tag::Ul, [] { return el_ul(); }},           {Tag::Ol, [] { return el_ol(); }},
            {Tag::Li, [] { return el_li(); }},           {Tag::Button, [] { return el_button(); }},
            {Tag::Input, [] { return el_input(); }},     {Tag::Form, [] { return el_form(); }},
            {Tag::Textarea, [] { return el_textarea(); }}, {Tag::Select, [] { return el_select(); }},
            {Tag::Option, [] { return el_option(); }},   {Tag::Label, [] { return el_label(); }},
            {Tag::A, [] { return el_a(); }},             {Tag::Img, [] { return el_img(); }},
            {Tag::Table, [] { return el_table(); }},     {Tag::Thead, [] { return el_thead(); }},
            {Tag::Tbody, [] { return el_tbody(); }},     {Tag::Tr, [] { return el_tr(); }},
            {Tag::Td, [] { return el_td(); }},           {Tag::Th, [] { return el_th(); }},
            {Tag::Strong, [] { return el_strong(); }},   {Tag::Em, [] { return el_em(); }},
            {Tag::Br, [] { return el_br(); }},           {Tag::Hr, [] { return el_hr(); }},
            {Tag::Pre, [] { return el_pre(); }},         {Tag::Code, [] { return el_code(); }},
        };
        CHECK(helpers.size() == kKnownTagCount);
        for (auto const& [tag, make] : helpers) {
            auto node = make();
            CHECK(node.kind() == NodeKind::Element);
            CHECK(node.tag() == tag);
            CHECK(node.item_count() == 0);
        }
    }

    TEST_CASE("element() accepts moved nodes built elsewhere") {
        auto label = el_label(text("Name"));
        auto input = el_input(attr("type", "text"), dyn_attr(0));
        auto form  = element(Tag::Form, std::move(label), std::move(input), el_button(text("Save")));
        CHECK(form.child_count() == 3);
        CHECK(form.count_nodes() == 6);
        CHECK(form.count_dyn_attr() == 1);
    }
}
