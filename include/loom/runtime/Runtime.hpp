#pragma once

#include <loom/core/Error.hpp>
#include <loom/core/RuntimeOptions.hpp>
#include <loom/dom/ElementId.hpp>
#include <loom/dsl/Node.hpp>
#include <loom/template/TemplateBuilder.hpp>
#include <loom/template/TemplateRegistry.hpp>

#include <string>
#include <vector>

namespace LM {

// Context handle owning one template registry and one element id allocator,
// both configured from the runtime options. Not thread-safe.
class Runtime {
public:
    explicit Runtime(RuntimeOptions options = {});

    Runtime(Runtime const&)                    = delete;
    auto operator=(Runtime const&) -> Runtime& = delete;

    auto compile(std::vector<Node>&& roots, std::string name) -> Expected<TemplateId>;
    auto compile(Node&& root, std::string name) -> Expected<TemplateId>;
    auto register_template(TemplateBuilder& builder) -> Expected<TemplateId>;

    [[nodiscard]] auto options() const -> RuntimeOptions const& {
        return options_;
    }
    [[nodiscard]] auto templates() -> TemplateRegistry& {
        return templates_;
    }
    [[nodiscard]] auto templates() const -> TemplateRegistry const& {
        return templates_;
    }
    [[nodiscard]] auto element_ids() -> Dom::ElementIdAllocator& {
        return element_ids_;
    }
    [[nodiscard]] auto element_ids() const -> Dom::ElementIdAllocator const& {
        return element_ids_;
    }

private:
    RuntimeOptions          options_;
    TemplateRegistry        templates_;
    Dom::ElementIdAllocator element_ids_;
};

} // namespace LM
