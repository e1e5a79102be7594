//! # Environment
//!
//! Describes the execution context code is compiled for. Environments are
//! immutable values: deriving one (`with_typescript()`, `with_target()`)
//! returns a new value.

#pragma once

#include <cstddef>
#include <string>

namespace weave::core {

/// Where the compiled code runs.
enum class ExecutionTarget { NodeJs, Browser, EdgeWorker };

/// Module system flavor the output targets.
enum class ModuleSystem { EsModule, CommonJs };

[[nodiscard]] const char* execution_target_name(ExecutionTarget target);
[[nodiscard]] const char* module_system_name(ModuleSystem system);

struct Environment {
    ExecutionTarget target = ExecutionTarget::NodeJs;
    ModuleSystem module_system = ModuleSystem::EsModule;
    bool typescript = false;

    [[nodiscard]] bool is_typescript_enabled() const {
        return typescript;
    }

    [[nodiscard]] Environment with_typescript() const {
        Environment env = *this;
        env.typescript = true;
        return env;
    }

    [[nodiscard]] Environment with_target(ExecutionTarget new_target) const {
        Environment env = *this;
        env.target = new_target;
        return env;
    }

    [[nodiscard]] size_t hash() const;

    /// e.g. "browser/esm+ts"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Environment&) const = default;
};

} // namespace weave::core
