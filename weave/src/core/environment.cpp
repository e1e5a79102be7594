#include "core/environment.hpp"

#include <functional>

namespace weave::core {

const char* execution_target_name(ExecutionTarget target) {
    switch (target) {
    case ExecutionTarget::NodeJs:
        return "node";
    case ExecutionTarget::Browser:
        return "browser";
    case ExecutionTarget::EdgeWorker:
        return "edge";
    }
    return "unknown";
}

const char* module_system_name(ModuleSystem system) {
    switch (system) {
    case ModuleSystem::EsModule:
        return "esm";
    case ModuleSystem::CommonJs:
        return "cjs";
    }
    return "unknown";
}

size_t Environment::hash() const {
    size_t h = static_cast<size_t>(target);
    h = h * 31 + static_cast<size_t>(module_system);
    h = h * 31 + std::hash<bool>{}(typescript);
    return h;
}

std::string Environment::to_string() const {
    std::string s = execution_target_name(target);
    s += '/';
    s += module_system_name(module_system);
    if (typescript) {
        s += "+ts";
    }
    return s;
}

} // namespace weave::core
