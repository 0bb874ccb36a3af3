#pragma once

#include <loom/core/Error.hpp>
#include <loom/template/TemplateRegistry.hpp>

#include <string>

namespace LM {

struct TemplateJsonOptions {
    int  indent            = 2; // -1 for compact output
    bool include_tag_names = true;
    bool include_slot_counts = true;
};

class TemplateJsonExporter {
public:
    static auto Export(TemplateRegistry const& registry, TemplateId id, TemplateJsonOptions const& options = TemplateJsonOptions{})
        -> Expected<std::string>;
    static auto ExportAll(TemplateRegistry const& registry, TemplateJsonOptions const& options = TemplateJsonOptions{})
        -> Expected<std::string>;
};

} // namespace LM
