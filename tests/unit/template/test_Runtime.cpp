#include <loom/dsl/Dsl.hpp>
#include <loom/runtime/Runtime.hpp>

#include <doctest/doctest.h>

#include <utility>
#include <vector>

using namespace LM;
using namespace LM::Dsl;

TEST_SUITE("template.runtime") {
    TEST_CASE("Default runtime") {
        Runtime runtime;
        CHECK(runtime.options().element_id_reuse == IdReuseOrder::Lifo);
        CHECK(runtime.options().slot_validation == SlotValidation::Permissive);
        CHECK(runtime.templates().count() == 0);
        CHECK(runtime.element_ids().count() == 1);
        CHECK(runtime.element_ids().reuse_order() == IdReuseOrder::Lifo);
    }

    TEST_CASE("Options reach the allocator and registry") {
        RuntimeOptions options;
        options.element_id_reuse = IdReuseOrder::Fifo;
        options.max_templates    = 1;
        Runtime runtime{options};
        CHECK(runtime.element_ids().reuse_order() == IdReuseOrder::Fifo);
        CHECK(runtime.templates().max_templates() == 1);

        REQUIRE(runtime.compile(el_div(), "one").has_value());
        auto second = runtime.compile(el_div(), "two");
        REQUIRE_FALSE(second.has_value());
        CHECK(second.error().code == Error::Code::CapacityExceeded);
    }

    TEST_CASE("Compile and register through the runtime") {
        Runtime runtime;
        std::vector<Node> roots;
        roots.push_back(el_h1(text("Title")));
        roots.push_back(el_p(dyn_text(0)));
        auto page = runtime.compile(std::move(roots), "page");
        REQUIRE(page.has_value());
        CHECK(*page == 0);

        TemplateBuilder builder{"row"};
        auto tr = *builder.push_element(Tag::Tr);
        REQUIRE(builder.push_dynamic(0, tr).has_value());
        auto row = runtime.register_template(builder);
        REQUIRE(row.has_value());
        CHECK(*row == 1);
        CHECK(builder.node_count() == 0);

        auto const& registry = std::as_const(runtime).templates();
        CHECK(registry.get(*page).root_count() == 2);
        CHECK(registry.get(*row).dynamic_node_count() == 1);
        CHECK(registry.find_by_name("row") == row.value());
    }

    TEST_CASE("Strict runtime rejects sparse slots") {
        RuntimeOptions options;
        options.slot_validation = SlotValidation::Strict;
        Runtime runtime{options};
        auto id = runtime.compile(el_div(dyn_text(1)), "sparse");
        REQUIRE_FALSE(id.has_value());
        CHECK(id.error().code == Error::Code::MalformedInput);
        CHECK(runtime.templates().count() == 0);
    }

    TEST_CASE("Element ids are allocated through the runtime") {
        Runtime runtime;
        auto a = runtime.element_ids().allocate();
        auto b = runtime.element_ids().allocate();
        CHECK(a == 1);
        CHECK(b == 2);
        runtime.element_ids().free(a);
        CHECK(runtime.element_ids().allocate() == a);
    }
}
