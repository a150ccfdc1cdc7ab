#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ToolRegistry;

struct ManifestStep {
    std::string tool;
    nlohmann::json args = nlohmann::json::object();
    bool generated = false;  // tool synthesized while planning this manifest
};

/**
 * @brief Ordered pipeline of tool invocations.
 *
 * Wire form: {"pipeline": [{"tool": <name>, "args": {...}, "generated": true}, ...]}
 */
struct Manifest {
    std::vector<ManifestStep> steps;

    nlohmann::json toJson() const;

    /** @throws MalformedManifest when the document does not have the wire form */
    static Manifest fromJson(const nlohmann::json& doc);

    /** @throws MalformedManifest naming the first step whose tool is not registered */
    void requireRegistered(const ToolRegistry& registry) const;
};
