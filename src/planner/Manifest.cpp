#include "planner/Manifest.h"
#include "core/Errors.h"
#include "tools/ToolRegistry.h"

nlohmann::json Manifest::toJson() const {
    nlohmann::json pipeline = nlohmann::json::array();
    for (const auto& step : steps) {
        nlohmann::json s = {{"tool", step.tool}, {"args", step.args}};
        if (step.generated) s["generated"] = true;
        pipeline.push_back(s);
    }
    return {{"pipeline", pipeline}};
}

Manifest Manifest::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object() || !doc.contains("pipeline") || !doc["pipeline"].is_array()) {
        throw MalformedManifest("manifest has no \"pipeline\" array", {{"manifest", doc}});
    }
    if (doc["pipeline"].empty()) {
        throw MalformedManifest("manifest pipeline is empty", {{"manifest", doc}});
    }

    Manifest manifest;
    size_t index = 0;
    for (const auto& s : doc["pipeline"]) {
        if (!s.is_object() || !s.contains("tool") || !s["tool"].is_string() || s["tool"].get<std::string>().empty()) {
            throw MalformedManifest("step " + std::to_string(index) + " has no tool name", {{"step", s}});
        }
        ManifestStep step;
        step.tool = s["tool"].get<std::string>();
        if (s.contains("args")) {
            if (!s["args"].is_object()) {
                throw MalformedManifest("step " + std::to_string(index) + " args must be an object", {{"step", s}});
            }
            step.args = s["args"];
        }
        step.generated = s.contains("generated") && s["generated"].is_boolean() && s["generated"].get<bool>();
        manifest.steps.push_back(std::move(step));
        index++;
    }
    return manifest;
}

void Manifest::requireRegistered(const ToolRegistry& registry) const {
    for (size_t i = 0; i < steps.size(); ++i) {
        if (!registry.hasTool(steps[i].tool)) {
            throw MalformedManifest("step " + std::to_string(i) + " uses unregistered tool " + steps[i].tool,
                                    {{"step", i}, {"tool", steps[i].tool}});
        }
    }
}
