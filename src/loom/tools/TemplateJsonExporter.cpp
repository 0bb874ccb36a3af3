#include <loom/tools/TemplateJsonExporter.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

namespace LM {

namespace {

using Json = nlohmann::json;

auto node_to_json(TemplateNode const& node, TemplateJsonOptions const& options) -> Json {
    Json entry = Json::object();
    entry["kind"] = template_node_kind_to_string(node.kind);
    switch (node.kind) {
    case TemplateNodeKind::Element:
        entry["tag"] = node.tag;
        if (options.include_tag_names) {
            entry["tag_name"] = tag_name(node.tag);
        }
        entry["children"] = node.children;
        entry["attributes"] = Json{{"first", node.first_attr}, {"count", node.attr_count}};
        break;
    case TemplateNodeKind::Text:
        entry["text"] = node.text;
        break;
    case TemplateNodeKind::Dynamic:
    case TemplateNodeKind::DynamicText:
        entry["dynamic_index"] = node.dynamic_index;
        break;
    }
    return entry;
}

auto attribute_to_json(TemplateAttribute const& attr) -> Json {
    Json entry = Json::object();
    entry["kind"]  = template_attribute_kind_to_string(attr.kind);
    entry["owner"] = attr.owner;
    if (attr.kind == TemplateAttributeKind::Static) {
        entry["name"]  = attr.name;
        entry["value"] = attr.value;
    } else {
        entry["dynamic_index"] = attr.dynamic_index;
    }
    return entry;
}

auto template_to_json(Template const& tmpl, TemplateId id, TemplateJsonOptions const& options) -> Json {
    Json doc = Json::object();
    doc["id"]    = id;
    doc["name"]  = tmpl.name();
    doc["roots"] = Json(std::vector<std::uint32_t>(tmpl.roots().begin(), tmpl.roots().end()));

    Json nodes = Json::array();
    for (auto const& node : tmpl.nodes()) {
        nodes.push_back(node_to_json(node, options));
    }
    doc["nodes"] = std::move(nodes);

    Json attributes = Json::array();
    for (auto const& attr : tmpl.attributes()) {
        attributes.push_back(attribute_to_json(attr));
    }
    doc["attributes"] = std::move(attributes);

    if (options.include_slot_counts) {
        doc["slots"] = Json{{"dynamic_nodes", tmpl.dynamic_node_count()},
                            {"dynamic_text", tmpl.dynamic_text_count()},
                            {"dynamic_attributes", tmpl.dynamic_attr_count()},
                            {"static_attributes", tmpl.static_attr_count()}};
    }
    return doc;
}

} // namespace

auto TemplateJsonExporter::Export(TemplateRegistry const& registry, TemplateId id, TemplateJsonOptions const& options)
    -> Expected<std::string> {
    if (!registry.contains(id)) {
        return make_error(Error::Code::NotFound, "no template registered with id " + std::to_string(id));
    }
    try {
        return template_to_json(registry.get(id), id, options).dump(options.indent);
    } catch (Json::exception const& ex) {
        lm_log(std::string("Template JSON export failed: ") + ex.what(), "TemplateJsonExporter", "ERROR");
        return make_error(Error::Code::MalformedInput, ex.what());
    }
}

auto TemplateJsonExporter::ExportAll(TemplateRegistry const& registry, TemplateJsonOptions const& options)
    -> Expected<std::string> {
    Json doc = Json::object();
    doc["count"] = registry.count();
    Json templates = Json::array();
    for (TemplateId id = 0; id < registry.count(); ++id) {
        templates.push_back(template_to_json(registry.get(id), id, options));
    }
    doc["templates"] = std::move(templates);
    try {
        return doc.dump(options.indent);
    } catch (Json::exception const& ex) {
        lm_log(std::string("Template JSON export failed: ") + ex.what(), "TemplateJsonExporter", "ERROR");
        return make_error(Error::Code::MalformedInput, ex.what());
    }
}

} // namespace LM
