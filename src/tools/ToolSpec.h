#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"

enum class ToolOrigin { Builtin, Generated };

/**
 * @brief Registered capability contract. Immutable once registered.
 */
struct ToolSpec {
    std::string name;
    ToolKind kind = ToolKind::Composite;
    std::string description;
    nlohmann::json inputContract = nlohmann::json::object();   // JSON Schema of args
    nlohmann::json outputContract = nlohmann::json::object();  // fields apply returns
    ToolOrigin origin = ToolOrigin::Builtin;
    std::string contentHash;
    std::string sourcePath;  // generated tools only

    /** Spec of a compiled-in tool; hash covers name, kind and implementation version. */
    static ToolSpec forBuiltin(const ITool& tool);

    nlohmann::json toJson() const;
};

inline std::string toolOriginName(ToolOrigin origin) {
    return origin == ToolOrigin::Builtin ? "builtin" : "generated";
}
