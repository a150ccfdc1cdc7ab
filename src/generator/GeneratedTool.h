#pragma once
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "tools/ITool.h"
#include "tools/ToolSpec.h"

/**
 * @brief A generated Python tool, run out of process.
 *
 * Each call starts `timeout <limit> python -I <script> apply|verify ...` with the
 * step's output directory as working directory. The script prints one JSON
 * object; the last JSON line of stdout is taken as the result.
 */
class GeneratedTool : public ITool {
public:
    GeneratedTool(ToolSpec spec, const Config::Pipeline& cfg);

    std::string getName() const override { return spec.name; }
    std::string getDescription() const override { return spec.description; }
    nlohmann::json getSchema() const override { return spec.inputContract; }
    ToolKind getKind() const override { return spec.kind; }
    std::string getVersion() const override { return spec.contentHash; }

    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override;
    nlohmann::json verify(const ToolContext& ctx, const nlohmann::json& args, const nlohmann::json& applied) override;

    /** Last line of @p output that parses as a JSON object, or null. */
    static nlohmann::json parseOutput(const std::string& output);
    static bool insideDirectory(const std::string& path, const std::string& directory);

private:
    ToolSpec spec;
    std::string python;
    int timeoutSec;

    nlohmann::json invoke(const ToolContext& ctx, const std::vector<std::string>& scriptArgs) const;
};
