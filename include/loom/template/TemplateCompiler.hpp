#pragma once

#include <loom/core/Error.hpp>
#include <loom/core/RuntimeOptions.hpp>
#include <loom/dsl/Node.hpp>
#include <loom/template/Template.hpp>
#include <loom/template/TemplateRegistry.hpp>

#include <string>
#include <vector>

namespace LM {

struct CompileOptions {
    SlotValidation slot_validation = SlotValidation::Permissive;
};

/*
 * Flattens Node trees into a Template by pre-order traversal. Node indices are
 * assigned sequentially across all roots; each element's attributes are recorded
 * before its children are visited. Dynamic slot indices pass through unchanged.
 *
 * The roots are consumed whether or not compilation succeeds.
 */
class TemplateCompiler {
public:
    static auto Flatten(std::vector<Node>&& roots, std::string name, CompileOptions const& options = {})
        -> Expected<Template>;

    static auto Compile(std::vector<Node>&& roots,
                        std::string name,
                        TemplateRegistry& registry,
                        CompileOptions const& options = {}) -> Expected<TemplateId>;

    static auto Compile(Node&& root, std::string name, TemplateRegistry& registry, CompileOptions const& options = {})
        -> Expected<TemplateId>;
};

} // namespace LM
