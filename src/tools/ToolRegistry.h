#pragma once
#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/ITool.h"
#include "tools/ToolSpec.h"

/**
 * @brief 工具注册中心
 *
 * Single source of truth for what can run. Shared between concurrent jobs,
 * so every operation is synchronized. A registered spec is never silently
 * overwritten.
 */
class ToolRegistry {
public:
    enum class RegisterOutcome { Registered, AlreadyPresent };

    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    std::optional<ToolSpec> lookup(const std::string& name) const;

    /**
     * @brief 注册一个工具
     *
     * Re-registering the same name with the same content hash is a no-op.
     * @throws RegistryConflict when the name is taken by a different implementation
     */
    RegisterOutcome registerTool(const ToolSpec& spec, std::shared_ptr<ITool> tool);

    /** Registers a built-in tool, deriving its spec. */
    RegisterOutcome registerTool(std::shared_ptr<ITool> tool);

    /** Explicit replacement of a registered implementation. */
    void replaceTool(const ToolSpec& spec, std::shared_ptr<ITool> tool);

    /**
     * @brief 获取工具实例
     * @return nullptr when the name is not registered
     */
    std::shared_ptr<ITool> getTool(const std::string& name) const;

    std::vector<ToolSpec> list() const;

    /**
     * @brief Planner-facing catalogue:
     * [{"name", "kind", "description", "parameters"}]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    size_t getToolCount() const;
    bool hasTool(const std::string& name) const;

private:
    struct Entry {
        ToolSpec spec;
        std::shared_ptr<ITool> tool;
    };

    mutable std::mutex mtx;
    std::unordered_map<std::string, Entry> tools;
};
