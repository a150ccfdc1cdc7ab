#include "generator/GeneratedTool.h"
#include <filesystem>
#include <sstream>
#include "utils/Logger.h"
#include "utils/Subprocess.h"

namespace fs = std::filesystem;

namespace {
constexpr int kTimeoutExitCode = 124;  // coreutils timeout

std::string tail(const std::string& text, size_t maxLen = 400) {
    return text.size() <= maxLen ? text : "..." + text.substr(text.size() - maxLen);
}
}

GeneratedTool::GeneratedTool(ToolSpec spec, const Config::Pipeline& cfg)
    : spec(std::move(spec)), python(cfg.python), timeoutSec(cfg.generatedToolTimeoutSec) {}

nlohmann::json GeneratedTool::parseOutput(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    nlohmann::json last;
    while (std::getline(in, line)) {
        size_t start = line.find('{');
        if (start == std::string::npos) continue;
        nlohmann::json parsed = nlohmann::json::parse(line.substr(start), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) last = parsed;
    }
    return last;
}

bool GeneratedTool::insideDirectory(const std::string& path, const std::string& directory) {
    std::error_code ec;
    fs::path dir = fs::weakly_canonical(fs::absolute(directory), ec);
    if (ec) return false;
    if (!dir.has_filename()) dir = dir.parent_path();
    fs::path target = fs::weakly_canonical(fs::absolute(fs::path(directory) / path), ec);
    if (ec) return false;

    auto d = dir.begin();
    auto t = target.begin();
    for (; d != dir.end(); ++d, ++t) {
        if (t == target.end() || *d != *t) return false;
    }
    return true;
}

nlohmann::json GeneratedTool::invoke(const ToolContext& ctx, const std::vector<std::string>& scriptArgs) const {
    checkCancelled(ctx.cancel);
    fs::path workDir = fs::absolute(ctx.outputDir.empty() ? fs::path(".") : fs::path(ctx.outputDir));
    fs::create_directories(workDir);

    std::vector<std::string> argv = {"timeout", std::to_string(timeoutSec), python, "-I",
                                     fs::absolute(spec.sourcePath).string()};
    argv.insert(argv.end(), scriptArgs.begin(), scriptArgs.end());
    std::string command = "cd " + shellQuote(workDir.string()) + " && exec " + buildCommandLine(argv);

    Logger::getInstance().debug("Generated tool: " + command);
    ProcessResult proc = runProcess({"sh", "-c", command}, true);

    if (proc.exitCode == kTimeoutExitCode) {
        return ToolResult::error(spec.name + " exceeded " + std::to_string(timeoutSec) + "s", "ExecutionTimeout");
    }
    nlohmann::json result = parseOutput(proc.output);
    if (proc.exitCode != 0) {
        std::string message = result.is_object() && result.contains("error")
                                  ? result["error"].dump()
                                  : tail(proc.output);
        return ToolResult::error(spec.name + " exited with " + std::to_string(proc.exitCode) + ": " + message);
    }
    if (!result.is_object()) {
        return ToolResult::error(spec.name + " printed no JSON result: " + tail(proc.output));
    }
    return result;
}

nlohmann::json GeneratedTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    std::string input = ctx.inputPath.empty() ? "" : fs::absolute(ctx.inputPath).string();
    nlohmann::json result = invoke(ctx, {"apply", "--input", input, "--output-dir",
                                         fs::absolute(ctx.outputDir.empty() ? "." : ctx.outputDir).string(),
                                         "--args", args.dump()});
    if (ToolResult::isError(result)) return result;

    if (!result.contains("output_path") || !result["output_path"].is_string()) {
        return ToolResult::error(spec.name + " result has no output_path");
    }
    const std::string outputPath = result["output_path"].get<std::string>();
    if (!insideDirectory(outputPath, ctx.outputDir.empty() ? "." : ctx.outputDir)) {
        Logger::getInstance().error(spec.name + " wrote outside its output directory: " + outputPath);
        return ToolResult::error(spec.name + " reported output outside the output directory: " + outputPath,
                                 "SandboxViolation");
    }
    if (fs::path(outputPath).is_relative()) {
        result["output_path"] = (fs::absolute(ctx.outputDir.empty() ? "." : ctx.outputDir) / outputPath).string();
    }
    return result;
}

nlohmann::json GeneratedTool::verify(const ToolContext& ctx, const nlohmann::json& args,
                                     const nlohmann::json& applied) {
    nlohmann::json withResult = args;
    withResult["result"] = applied;
    nlohmann::json result = invoke(ctx, {"verify", "--args", withResult.dump()});
    if (ToolResult::isError(result)) {
        result["verified"] = false;
        result["check"] = "generated_verify";
        if (!result.contains("category")) result["category"] = "ToolError";
    }
    return result;
}
