#include "generator/ToolGenerator.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "core/Errors.h"
#include "generator/GeneratedTool.h"
#include "utils/Hash.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {

const char* kContract = R"(The tool is a standalone Python 3 script run as a command line program:

  python tool.py apply --input <input file> --output-dir <dir> --args '<json object>'
  python tool.py verify --args '<json object>'

apply processes the input file and prints exactly one JSON object on the last line of stdout:
  {"output_path": "<file inside --output-dir>", "summary": {...}}
verify receives the apply arguments plus "result" (the apply output) and prints:
  {"verified": true|false, "metrics": {...}, "error": "<reason when false>"}
On failure print {"error": "<reason>"} and exit with a non-zero status.

Rules:
- Use argparse for the command line.
- Write files only inside --output-dir, naming them from the input file's stem.
- Never hard-code absolute paths, never use "..".
- No eval, exec, compile, __import__, subprocess, os.system or network access.
- No getattr, setattr, globals, vars or dunder attributes; no wildcard imports.
- From os use only os.path (import os.path, or from os import path).
- Reply with the Python source only.)";

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot read " + path.string());
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot write " + path.string());
    out << content;
}

std::string jsonTypeName(const nlohmann::json& value) {
    if (value.is_boolean()) return "boolean";
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    return "string";
}

}

ToolGenerator::ToolGenerator(std::shared_ptr<LLMClient> llm, ToolRegistry& registry, const Config::Pipeline& cfg,
                             AuditSink* audit)
    : llm(std::move(llm)), registry(registry), cfg(cfg), screen(cfg.allowedImports), audit(audit) {}

std::string ToolGenerator::kindDirectory(ToolKind kind) {
    switch (kind) {
        case ToolKind::Detector: return "detectors";
        case ToolKind::Transform: return "transforms";
        case ToolKind::Composite: return "composites";
    }
    return "composites";
}

std::string ToolGenerator::buildSystemPrompt() const {
    std::string libraries;
    for (const auto& lib : cfg.allowedImports) {
        if (!libraries.empty()) libraries += ", ";
        libraries += lib;
    }
    return "You write privacy protection tools for video and audio files.\n\n" + std::string(kContract) +
           "\n\nOnly these modules may be imported: " + libraries + ".";
}

std::string ToolGenerator::buildPrompt(const GenerationRequest& request) const {
    std::string prompt = "Tool name: " + request.name + "\nWhat it must do: " + request.description;
    if (!request.arguments.empty()) prompt += "\nArguments it receives: " + request.arguments.dump();
    if (!request.previousFailure.empty()) {
        prompt += "\n\nThe previous attempt was rejected: " + request.previousFailure +
                  "\nWrite it differently so it passes.";
    }
    return prompt;
}

ToolSpec ToolGenerator::makeSpec(const std::string& name, ToolKind kind, const std::string& description,
                                 const nlohmann::json& arguments, const std::string& source,
                                 const std::string& path) const {
    nlohmann::json properties = nlohmann::json::object();
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        properties[it.key()] = {{"type", jsonTypeName(it.value())}};
    }

    ToolSpec spec;
    spec.name = name;
    spec.kind = kind;
    spec.description = description;
    spec.inputContract = {{"type", "object"}, {"properties", properties}};
    spec.outputContract = {{"output_path", "string"}, {"summary", "object"}};
    spec.origin = ToolOrigin::Generated;
    spec.contentHash = sha256Hex(source);
    spec.sourcePath = path;
    return spec;
}

void ToolGenerator::record(AuditOutcome outcome, nlohmann::json detail) const {
    if (!audit) return;
    try {
        audit->append(AuditEntry::now(AuditStage::Generate, outcome, std::move(detail)));
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Audit append failed: ") + e.what());
    }
}

ToolSpec ToolGenerator::generate(const GenerationRequest& request) {
    auto& logger = Logger::getInstance();
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    };

    if (auto existing = registry.lookup(request.name)) {
        logger.info("Tool " + request.name + " already registered, reusing it");
        return *existing;
    }

    logger.stage("Generating tool " + request.name);
    std::string source;
    try {
        source = stripCodeFence(llm->chat(buildPrompt(request), buildSystemPrompt()));
    } catch (const std::exception& e) {
        record(AuditOutcome::Fail, {{"tool", request.name}, {"reason", e.what()}, {"elapsed_sec", elapsed()}});
        throw GenerationFailure("synthesis of " + request.name + " failed: " + e.what(), {{"tool", request.name}});
    }
    if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
        record(AuditOutcome::Fail, {{"tool", request.name}, {"reason", "empty source"}, {"elapsed_sec", elapsed()}});
        throw GenerationFailure("model returned no source for " + request.name, {{"tool", request.name}});
    }

    ScreenResult verdict = screen.screen(source);
    if (!verdict.passed) {
        logger.warn("Sandbox screen rejected " + request.name + ": " + verdict.summary());
        record(AuditOutcome::Fail, {{"tool", request.name},
                                    {"reason", "sandbox screen"},
                                    {"violations", verdict.violations},
                                    {"elapsed_sec", elapsed()}});
        throw GenerationFailure("sandbox screen rejected " + request.name + ": " + verdict.summary(),
                                {{"tool", request.name}, {"violations", verdict.violations}});
    }

    const ToolKind kind = request.kind ? *request.kind : inferToolKind(request.name);
    const fs::path dir = fs::path(cfg.generatedToolsDir) / kindDirectory(kind);
    const fs::path finalPath = fs::absolute(dir / (request.name + ".py"));
    ToolSpec spec = makeSpec(request.name, kind, request.description, request.arguments, source, finalPath.string());
    // Staged under a content-specific name; only the registration winner moves it into place.
    const fs::path staged = fs::absolute(dir / (request.name + ".py." + spec.contentHash.substr(0, 12) + ".tmp"));

    try {
        fs::create_directories(dir);
        writeFile(staged, source);
    } catch (const std::exception& e) {
        record(AuditOutcome::Fail, {{"tool", request.name}, {"reason", e.what()}, {"elapsed_sec", elapsed()}});
        throw GenerationFailure("cannot store " + request.name + ": " + e.what(), {{"tool", request.name}});
    }

    try {
        auto outcome = registry.registerTool(spec, std::make_shared<GeneratedTool>(spec, cfg));
        if (outcome == ToolRegistry::RegisterOutcome::Registered) {
            fs::rename(staged, finalPath);
        } else {
            fs::remove(staged);
        }
    } catch (const RegistryConflict& e) {
        fs::remove(staged);
        auto winner = registry.lookup(request.name);
        if (!winner) throw;
        logger.warn(std::string(e.what()) + "; adopting the registered " + request.name);
        record(AuditOutcome::Ok, {{"tool", request.name}, {"adopted", winner->contentHash}, {"elapsed_sec", elapsed()}});
        return *winner;
    }

    logger.success("Generated " + request.name + " (" + toolKindName(kind) + ") at " + finalPath.string());
    record(AuditOutcome::Ok, {{"tool", request.name},
                              {"kind", toolKindName(kind)},
                              {"hash", spec.contentHash},
                              {"path", finalPath.string()},
                              {"elapsed_sec", elapsed()}});
    return spec;
}

size_t ToolGenerator::loadGeneratedTools() {
    auto& logger = Logger::getInstance();
    size_t loaded = 0;

    for (ToolKind kind : {ToolKind::Detector, ToolKind::Transform, ToolKind::Composite}) {
        fs::path dir = fs::path(cfg.generatedToolsDir) / kindDirectory(kind);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".py") continue;
            const std::string name = entry.path().stem().string();
            std::string source = readFile(entry.path());

            ScreenResult verdict = screen.screen(source);
            if (!verdict.passed) {
                logger.warn("Skipping " + entry.path().string() + ": " + verdict.summary());
                continue;
            }
            ToolSpec spec = makeSpec(name, kind, "Previously generated " + toolKindName(kind) + " " + name,
                                     nlohmann::json::object(), source, fs::absolute(entry.path()).string());
            try {
                if (registry.registerTool(spec, std::make_shared<GeneratedTool>(spec, cfg)) ==
                    ToolRegistry::RegisterOutcome::Registered) {
                    loaded++;
                }
            } catch (const RegistryConflict& e) {
                logger.warn(std::string("Skipping ") + entry.path().string() + ": " + e.what());
            }
        }
    }
    if (loaded > 0) logger.info("Loaded " + std::to_string(loaded) + " generated tool(s)");
    return loaded;
}
