#include "tools/ToolRegistry.h"
#include <algorithm>
#include <stdexcept>
#include "core/Errors.h"
#include "utils/Hash.h"
#include "utils/Logger.h"

ToolSpec ToolSpec::forBuiltin(const ITool& tool) {
    ToolSpec spec;
    spec.name = tool.getName();
    spec.kind = tool.getKind();
    spec.description = tool.getDescription();
    spec.inputContract = tool.getSchema();
    spec.outputContract = {{"output_path", "string"}, {"summary", "object"}};
    spec.origin = ToolOrigin::Builtin;
    spec.contentHash = sha256Hex("builtin:" + spec.name + ":" + toolKindName(spec.kind) + ":" + tool.getVersion());
    return spec;
}

nlohmann::json ToolSpec::toJson() const {
    nlohmann::json j = {{"name", name},
                        {"kind", toolKindName(kind)},
                        {"description", description},
                        {"input", inputContract},
                        {"output", outputContract},
                        {"origin", toolOriginName(origin)},
                        {"content_hash", contentHash}};
    if (!sourcePath.empty()) j["source_path"] = sourcePath;
    return j;
}

std::optional<ToolSpec> ToolRegistry::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(name);
    if (it == tools.end()) return std::nullopt;
    return it->second.spec;
}

ToolRegistry::RegisterOutcome ToolRegistry::registerTool(const ToolSpec& spec, std::shared_ptr<ITool> tool) {
    if (!tool) throw std::invalid_argument("registerTool: null implementation for " + spec.name);
    if (spec.name.empty()) throw std::invalid_argument("registerTool: empty tool name");

    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(spec.name);
    if (it != tools.end()) {
        if (it->second.spec.contentHash == spec.contentHash) {
            Logger::getInstance().debug("Tool already registered with identical content: " + spec.name);
            return RegisterOutcome::AlreadyPresent;
        }
        throw RegistryConflict("Tool name already registered with different content: " + spec.name,
                               {{"tool", spec.name},
                                {"registered_hash", it->second.spec.contentHash},
                                {"rejected_hash", spec.contentHash}});
    }

    tools.emplace(spec.name, Entry{spec, std::move(tool)});
    Logger::getInstance().info("Registered " + toolOriginName(spec.origin) + " tool: " + spec.name);
    return RegisterOutcome::Registered;
}

ToolRegistry::RegisterOutcome ToolRegistry::registerTool(std::shared_ptr<ITool> tool) {
    if (!tool) throw std::invalid_argument("registerTool: null implementation");
    ToolSpec spec = ToolSpec::forBuiltin(*tool);
    return registerTool(spec, std::move(tool));
}

void ToolRegistry::replaceTool(const ToolSpec& spec, std::shared_ptr<ITool> tool) {
    if (!tool) throw std::invalid_argument("replaceTool: null implementation for " + spec.name);
    std::lock_guard<std::mutex> lock(mtx);
    tools[spec.name] = Entry{spec, std::move(tool)};
    Logger::getInstance().warn("Replaced tool implementation: " + spec.name);
}

std::shared_ptr<ITool> ToolRegistry::getTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.tool;
}

std::vector<ToolSpec> ToolRegistry::list() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ToolSpec> specs;
    specs.reserve(tools.size());
    for (const auto& [name, entry] : tools) {
        specs.push_back(entry.spec);
    }
    std::sort(specs.begin(), specs.end(), [](const ToolSpec& a, const ToolSpec& b) { return a.name < b.name; });
    return specs;
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;
    for (const auto& spec : list()) {
        nlohmann::json schema;
        schema["name"] = spec.name;
        schema["kind"] = toolKindName(spec.kind);
        schema["description"] = spec.description;
        schema["parameters"] = spec.inputContract;
        schemas.push_back(schema);
    }
    return schemas;
}

size_t ToolRegistry::getToolCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.size();
}

bool ToolRegistry::hasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.count(name) > 0;
}
