#include <loom/template/TemplateBuilder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace LM {

TemplateBuilder::TemplateBuilder(std::string name)
    : name_(std::move(name)) {}

auto TemplateBuilder::require_element(std::int64_t index, char const* operation) const -> Expected<void> {
    if (index < 0 || static_cast<std::uint64_t>(index) >= nodes_.size()) {
        return make_error(Error::Code::OutOfRange,
                          std::string(operation) + ": node " + std::to_string(index) + " is out of range ("
                              + std::to_string(nodes_.size()) + " nodes)");
    }
    auto const& target = nodes_[static_cast<std::size_t>(index)];
    if (target.kind != TemplateNodeKind::Element) {
        return make_error(Error::Code::InvalidType,
                          std::string(operation) + ": node " + std::to_string(index) + " is a "
                              + std::string(template_node_kind_to_string(target.kind)) + ", not an element");
    }
    return {};
}

auto TemplateBuilder::push_node(TemplateNode node, std::int64_t parent) -> Expected<std::uint32_t> {
    if (parent != kNoParent) {
        if (auto valid = require_element(parent, "push"); !valid) {
            lm_log(describeError(valid.error()), "TemplateBuilder", "WARN");
            return std::unexpected(valid.error());
        }
    }
    auto const index = static_cast<std::uint32_t>(nodes_.size());
    nodes_.push_back(std::move(node));
    if (parent == kNoParent) {
        roots_.push_back(index);
    } else {
        nodes_[static_cast<std::size_t>(parent)].children.push_back(index);
    }
    return index;
}

auto TemplateBuilder::push_element(TagId tag, std::int64_t parent) -> Expected<std::uint32_t> {
    TemplateNode node{};
    node.kind = TemplateNodeKind::Element;
    node.tag  = tag;
    return push_node(std::move(node), parent);
}

auto TemplateBuilder::push_text(std::string text, std::int64_t parent) -> Expected<std::uint32_t> {
    TemplateNode node{};
    node.kind = TemplateNodeKind::Text;
    node.text = std::move(text);
    return push_node(std::move(node), parent);
}

auto TemplateBuilder::push_dynamic(std::uint32_t dynamic_index, std::int64_t parent) -> Expected<std::uint32_t> {
    TemplateNode node{};
    node.kind          = TemplateNodeKind::Dynamic;
    node.dynamic_index = dynamic_index;
    return push_node(std::move(node), parent);
}

auto TemplateBuilder::push_dynamic_text(std::uint32_t dynamic_index, std::int64_t parent) -> Expected<std::uint32_t> {
    TemplateNode node{};
    node.kind          = TemplateNodeKind::DynamicText;
    node.dynamic_index = dynamic_index;
    return push_node(std::move(node), parent);
}

auto TemplateBuilder::push_static_attr(std::uint32_t node, std::string name, std::string value)
    -> Expected<std::uint32_t> {
    if (auto valid = require_element(node, "push_static_attr"); !valid) {
        return std::unexpected(valid.error());
    }
    auto const index = static_cast<std::uint32_t>(attributes_.size());
    attributes_.push_back(TemplateAttribute{.kind          = TemplateAttributeKind::Static,
                                            .name          = std::move(name),
                                            .value         = std::move(value),
                                            .dynamic_index = 0,
                                            .owner         = node});
    nodes_[node].attr_count++;
    return index;
}

auto TemplateBuilder::push_dynamic_attr(std::uint32_t node, std::uint32_t dynamic_index) -> Expected<std::uint32_t> {
    if (auto valid = require_element(node, "push_dynamic_attr"); !valid) {
        return std::unexpected(valid.error());
    }
    auto const index = static_cast<std::uint32_t>(attributes_.size());
    attributes_.push_back(TemplateAttribute{.kind          = TemplateAttributeKind::Dynamic,
                                            .name          = {},
                                            .value         = {},
                                            .dynamic_index = dynamic_index,
                                            .owner         = node});
    nodes_[node].attr_count++;
    return index;
}

auto TemplateBuilder::build() -> Template {
    // Group attributes by owner in node order, keeping push order inside each group.
    std::stable_sort(attributes_.begin(), attributes_.end(), [](TemplateAttribute const& lhs, TemplateAttribute const& rhs) {
        return lhs.owner < rhs.owner;
    });
    std::uint32_t cursor = 0;
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        nodes_[i].first_attr = cursor;
        cursor += nodes_[i].attr_count;
    }

    lm_log("Built template '" + name_ + "' with " + std::to_string(nodes_.size()) + " nodes, "
               + std::to_string(attributes_.size()) + " attributes, " + std::to_string(roots_.size()) + " roots",
           "TemplateBuilder", "INFO");

    Template result{name_, std::move(nodes_), std::move(attributes_), std::move(roots_)};
    nodes_.clear();
    attributes_.clear();
    roots_.clear();
    return result;
}

} // namespace LM
