#include <loom/runtime/Runtime.hpp>
#include <loom/template/TemplateCompiler.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace LM {

Runtime::Runtime(RuntimeOptions options)
    : options_(options)
    , templates_(options.max_templates)
    , element_ids_(options.element_id_reuse) {
    lm_log("Runtime created (id reuse " + std::string(to_string(options_.element_id_reuse)) + ", slot validation "
               + std::string(to_string(options_.slot_validation)) + ")",
           "Runtime", "INFO");
}

auto Runtime::compile(std::vector<Node>&& roots, std::string name) -> Expected<TemplateId> {
    CompileOptions compile_options{.slot_validation = options_.slot_validation};
    return TemplateCompiler::Compile(std::move(roots), std::move(name), templates_, compile_options);
}

auto Runtime::compile(Node&& root, std::string name) -> Expected<TemplateId> {
    CompileOptions compile_options{.slot_validation = options_.slot_validation};
    return TemplateCompiler::Compile(std::move(root), std::move(name), templates_, compile_options);
}

auto Runtime::register_template(TemplateBuilder& builder) -> Expected<TemplateId> {
    return templates_.register_template(builder.build());
}

} // namespace LM
