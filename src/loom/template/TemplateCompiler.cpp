#include <loom/template/TemplateCompiler.hpp>
#include <loom/template/TemplateBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>
#include <variant>

namespace LM {

namespace {

auto emit(TemplateBuilder& builder, Node const& node, std::int64_t parent) -> Expected<std::uint32_t>;

struct FlattenVisitor {
    TemplateBuilder& builder;
    std::int64_t     parent = TemplateBuilder::kNoParent;

    auto operator()(TextData const& data) const -> Expected<std::uint32_t> {
        return builder.push_text(data.content, parent);
    }

    auto operator()(DynamicTextData const& data) const -> Expected<std::uint32_t> {
        return builder.push_dynamic_text(data.index, parent);
    }

    auto operator()(DynamicNodeData const& data) const -> Expected<std::uint32_t> {
        return builder.push_dynamic(data.index, parent);
    }

    auto operator()(StaticAttrData const&) const -> Expected<std::uint32_t> {
        return make_error(Error::Code::InvalidType, "static attribute cannot be flattened as a template node");
    }

    auto operator()(DynamicAttrData const&) const -> Expected<std::uint32_t> {
        return make_error(Error::Code::InvalidType, "dynamic attribute cannot be flattened as a template node");
    }

    auto operator()(ElementData const& data) const -> Expected<std::uint32_t> {
        auto index = builder.push_element(data.tag, parent);
        if (!index) {
            return index;
        }
        for (auto const& item : data.items) {
            if (item.kind() == NodeKind::StaticAttr) {
                if (auto pushed = builder.push_static_attr(*index, std::string(item.attr_name()), std::string(item.attr_value())); !pushed) {
                    return std::unexpected(pushed.error());
                }
            } else if (item.kind() == NodeKind::DynamicAttr) {
                if (auto pushed = builder.push_dynamic_attr(*index, item.dynamic_index()); !pushed) {
                    return std::unexpected(pushed.error());
                }
            }
        }
        for (auto const& item : data.items) {
            if (item.is_attribute()) {
                continue;
            }
            if (auto child = emit(builder, item, *index); !child) {
                return child;
            }
        }
        return index;
    }
};

auto emit(TemplateBuilder& builder, Node const& node, std::int64_t parent) -> Expected<std::uint32_t> {
    return std::visit(FlattenVisitor{.builder = builder, .parent = parent}, node.data());
}

// Each slot space must be exactly {0, 1, ..., N-1}.
auto check_dense(std::vector<std::uint32_t> indices, std::string_view space) -> Expected<void> {
    std::sort(indices.begin(), indices.end());
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] != i) {
            bool const duplicate = i > 0 && indices[i] == indices[i - 1];
            return make_error(Error::Code::MalformedInput,
                              std::string(space) + " slot indices are not dense: "
                                  + (duplicate ? "duplicate index " : "missing index ") + std::to_string(duplicate ? indices[i] : i)
                                  + " among " + std::to_string(indices.size()) + " slots");
        }
    }
    return {};
}

auto validate_slots(Template const& tmpl) -> Expected<void> {
    std::vector<std::uint32_t> text_slots;
    std::vector<std::uint32_t> node_slots;
    std::vector<std::uint32_t> attr_slots;
    for (auto const& node : tmpl.nodes()) {
        if (node.kind == TemplateNodeKind::DynamicText) {
            text_slots.push_back(node.dynamic_index);
        } else if (node.kind == TemplateNodeKind::Dynamic) {
            node_slots.push_back(node.dynamic_index);
        }
    }
    for (auto const& attr : tmpl.attributes()) {
        if (attr.kind == TemplateAttributeKind::Dynamic) {
            attr_slots.push_back(attr.dynamic_index);
        }
    }
    if (auto checked = check_dense(std::move(text_slots), "dynamic text"); !checked) {
        return checked;
    }
    if (auto checked = check_dense(std::move(node_slots), "dynamic node"); !checked) {
        return checked;
    }
    return check_dense(std::move(attr_slots), "dynamic attribute");
}

} // namespace

auto TemplateCompiler::Flatten(std::vector<Node>&& roots, std::string name, CompileOptions const& options)
    -> Expected<Template> {
    auto owned = std::move(roots);
    roots.clear();

    if (owned.empty()) {
        return make_error(Error::Code::InvalidArgument, "template '" + name + "' has no roots");
    }

    TemplateBuilder builder{std::move(name)};
    for (auto const& root : owned) {
        if (auto index = emit(builder, root, TemplateBuilder::kNoParent); !index) {
            lm_log("Compiling '" + builder.name() + "' failed: " + describeError(index.error()), "TemplateCompiler", "ERROR");
            return std::unexpected(index.error());
        }
    }

    auto tmpl = builder.build();
    if (options.slot_validation == SlotValidation::Strict) {
        if (auto valid = validate_slots(tmpl); !valid) {
            lm_log("Rejecting '" + tmpl.name() + "': " + describeError(valid.error()), "TemplateCompiler", "WARN");
            return std::unexpected(valid.error());
        }
    }
    return tmpl;
}

auto TemplateCompiler::Compile(std::vector<Node>&& roots,
                               std::string name,
                               TemplateRegistry& registry,
                               CompileOptions const& options) -> Expected<TemplateId> {
    auto tmpl = Flatten(std::move(roots), std::move(name), options);
    if (!tmpl) {
        return std::unexpected(tmpl.error());
    }
    return registry.register_template(std::move(*tmpl));
}

auto TemplateCompiler::Compile(Node&& root, std::string name, TemplateRegistry& registry, CompileOptions const& options)
    -> Expected<TemplateId> {
    std::vector<Node> roots;
    roots.push_back(std::move(root));
    return Compile(std::move(roots), std::move(name), registry, options);
}

} // namespace LM
