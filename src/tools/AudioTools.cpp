#include "tools/AudioTools.h"
#include <algorithm>
#include <fstream>
#include "audio/AudioDecoder.h"
#include "audio/AudioRedactor.h"
#include "audio/PhraseExtractor.h"
#include "audio/PhraseLocalizer.h"
#include "audio/WavWriter.h"
#include "core/Errors.h"
#include "utils/Logger.h"
#include "verification/AudioVerification.h"

// ============================================================================
// Shared passes
// ============================================================================

namespace {

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Cannot read " + path);
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }
}

void writeJsonFile(const std::string& path, const nlohmann::json& doc) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("Cannot write " + path);
    out << doc.dump(2);
}

std::vector<std::string> phrasesFrom(const nlohmann::json& arr) {
    std::vector<std::string> phrases;
    for (const auto& p : arr) {
        if (p.is_string()) phrases.push_back(p.get<std::string>());
    }
    return phrases;
}

PhraseLocalizer localizerFor(const nlohmann::json& args) {
    return PhraseLocalizer(args.value("fuzzy_threshold", 0.8));
}

nlohmann::json runKeywordDetection(const ToolServices& services, const ToolContext& ctx, const nlohmann::json& args) {
    std::string audioPath = args.value("audio_path", ctx.inputPath);
    AudioBuffer audio = AudioDecoder::decodeFile(audioPath);
    checkCancelled(ctx.cancel);

    std::vector<TranscriptWord> words = services.transcriber->transcribe(audio);
    checkCancelled(ctx.cancel);

    std::vector<std::string> phrases;
    if (args.contains("phrases") && args["phrases"].is_array()) {
        phrases = phrasesFrom(args["phrases"]);
    } else {
        PhraseExtractor extractor(services.llm);
        phrases = extractor.extract(transcriptText(words), args.value("request", std::string()));
    }

    RedactionMode mode = redactionModeFromName(args.value("mode", services.config.audio.mode));
    std::vector<RedactionSegment> segments = localizerFor(args).segments(words, phrases, mode);
    if (args.value("normalize_segments", false)) {
        segments = AudioRedactor::normalizeSegments(segments, audio.duration());
    }

    std::string path = ToolResult::outputPath(ctx, audioPath, "_segments", ".json");
    writeJsonFile(path, {{"audio_path", audioPath},
                         {"duration", audio.duration()},
                         {"phrases", phrases},
                         {"words", wordsToJson(words)},
                         {"segments", segmentsToJson(segments)}});
    Logger::getInstance().info("Localized " + std::to_string(segments.size()) + " segment(s) for " +
                               std::to_string(phrases.size()) + " phrase(s)");

    return {{"segments_path", path},
            {"audio_path", audioPath},
            {"summary", {{"phrases", phrases}, {"segments", segments.size()}, {"duration", audio.duration()}}}};
}

nlohmann::json verifySegmentsFile(const std::string& segmentsPath) {
    nlohmann::json doc = readJsonFile(segmentsPath);
    return AudioVerification::verifyTemporalIntegrity(segmentsFromJson(doc.at("segments")),
                                                      doc.at("duration").get<double>())
        .toJson();
}

nlohmann::json runMute(const ToolServices& services, const ToolContext& ctx, const nlohmann::json& args,
                       const std::string& segmentsPath) {
    std::string audioPath = args.value("audio_path", ctx.inputPath);
    nlohmann::json doc = readJsonFile(segmentsPath);
    AudioBuffer audio = AudioDecoder::decodeFile(audioPath);
    checkCancelled(ctx.cancel);

    std::vector<RedactionSegment> segments = segmentsFromJson(doc.at("segments"));
    const double leadPad = args.value("lead_pad_sec", 0.0);
    const bool overrideMode = args.contains("mode");
    const RedactionMode mode = redactionModeFromName(args.value("mode", services.config.audio.mode));
    for (auto& seg : segments) {
        seg.start = std::max(0.0, seg.start - leadPad);
        if (overrideMode) seg.mode = mode;
    }
    // After padding, which can make neighbours overlap again
    if (args.value("normalize_segments", false)) {
        segments = AudioRedactor::normalizeSegments(segments, audio.duration());
    }

    const double tailPad = args.value("tail_pad_sec", services.config.audio.tailPadSec);
    AudioBuffer redacted = AudioRedactor::apply(audio, segments, tailPad);
    std::string out = ToolResult::outputPath(ctx, audioPath, "_muted", ".wav");
    WavWriter::write(out, redacted);

    return {{"output_path", out},
            {"segments_path", segmentsPath},
            {"segments", segmentsToJson(segments)},
            {"summary", {{"segments", segments.size()}, {"tail_pad_sec", tailPad}, {"duration", redacted.duration()}}}};
}

// Temporal integrity of the applied segments, then compliance of the written audio.
nlohmann::json verifyMuted(const ToolServices& services, const nlohmann::json& args, const nlohmann::json& output) {
    nlohmann::json doc = readJsonFile(output.at("segments_path").get<std::string>());
    VerificationResult temporal = AudioVerification::verifyTemporalIntegrity(
        segmentsFromJson(output.at("segments")), doc.at("duration").get<double>());
    if (!temporal.verified) return temporal.toJson();

    AudioBuffer redacted = AudioDecoder::decodeFile(output.at("output_path").get<std::string>());
    VerificationResult compliance = AudioVerification::verifyCompliance(
        *services.transcriber, redacted, phrasesFrom(doc.at("phrases")), localizerFor(args));
    compliance.metrics["temporal_integrity"] = temporal.metrics;
    return compliance.toJson();
}

nlohmann::json repairSegments(const nlohmann::json& args) {
    nlohmann::json adjusted = args;
    adjusted["normalize_segments"] = true;
    return adjusted;
}

// Wider padding around each segment; a "none" mode is replaced by silence.
nlohmann::json widerRedaction(const nlohmann::json& args, int attempt, const Config::Audio& cfg) {
    nlohmann::json adjusted = args;
    adjusted["lead_pad_sec"] = 0.1 * attempt;
    adjusted["tail_pad_sec"] = cfg.tailPadSec + 0.25 * attempt;
    if (adjusted.value("mode", cfg.mode) == "none") adjusted["mode"] = "silence";
    return adjusted;
}

template <typename Fn>
nlohmann::json guarded(const char* what, Fn fn) {
    try {
        return fn();
    } catch (const ShieldError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string(what) + " failed: " + e.what());
        return ToolResult::error(e.what());
    }
}

const nlohmann::json kAudioPathArg = {{"type", "string"}, {"description", "Input audio (defaults to the job input)"}};
const nlohmann::json kModeArg = {{"type", "string"},
                                 {"enum", {"silence", "beep", "none"}},
                                 {"description", "How flagged audio is replaced"}};
const nlohmann::json kRequestArg = {{"type", "string"}, {"description", "What to remove, in the user's words"}};
const nlohmann::json kPhrasesArg = {{"type", "array"},
                                    {"items", {{"type", "string"}}},
                                    {"description", "Exact phrases to remove; skips the language model when given"}};

}

// ============================================================================
// DetectKeywordsTool
// ============================================================================

DetectKeywordsTool::DetectKeywordsTool(const ToolServices& services) : services(services) {}

std::string DetectKeywordsTool::getDescription() const {
    return "Transcribes audio with word timestamps and finds the spoken phrases the request asks to remove. "
           "Produces a segments file (segments_path) for mute_segments.";
}

nlohmann::json DetectKeywordsTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"audio_path", kAudioPathArg}, {"request", kRequestArg}, {"phrases", kPhrasesArg}, {"mode", kModeArg}}}};
}

nlohmann::json DetectKeywordsTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    return guarded("detect_keywords", [&] {
        nlohmann::json result = runKeywordDetection(services, ctx, args);
        result["output_path"] = result["audio_path"];
        return result;
    });
}

nlohmann::json DetectKeywordsTool::verify(const ToolContext& ctx, const nlohmann::json& args,
                                          const nlohmann::json& applied) {
    (void)ctx;
    (void)args;
    return verifySegmentsFile(applied.at("segments_path").get<std::string>());
}

nlohmann::json DetectKeywordsTool::adjustArguments(const nlohmann::json& args, int attempt,
                                                   const nlohmann::json& diagnostics) const {
    (void)attempt;
    (void)diagnostics;
    return repairSegments(args);
}

// ============================================================================
// MuteSegmentsTool
// ============================================================================

MuteSegmentsTool::MuteSegmentsTool(const ToolServices& services) : services(services) {}

std::string MuteSegmentsTool::getDescription() const {
    return "Silences or beeps the segments of a segments file (use \"$prev.segments_path\" after detect_keywords).";
}

nlohmann::json MuteSegmentsTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"audio_path", kAudioPathArg},
              {"segments_path", {{"type", "string"}, {"description", "Segments file from detect_keywords"}}},
              {"mode", kModeArg},
              {"tail_pad_sec", {{"type", "number"}, {"description", "Extra seconds redacted after each segment"}}}}},
            {"required", {"segments_path"}}};
}

nlohmann::json MuteSegmentsTool::apply(const ToolContext& ctx, const nlohmann::json& args) {
    if (!args.contains("segments_path") || !args["segments_path"].is_string()) {
        return ToolResult::error("mute_segments needs segments_path");
    }
    return guarded("mute_segments",
                   [&] { return runMute(services, ctx, args, args["segments_path"].get<std::string>()); });
}

nlohmann::json MuteSegmentsTool::verify(const ToolContext& ctx, const nlohmann::json& args,
                                        const nlohmann::json& applied) {
    (void)ctx;
    return verifyMuted(services, args, applied);
}

nlohmann::json MuteSegmentsTool::adjustArguments(const nlohmann::json& args, int attempt,
                                                 const nlohmann::json& diagnostics) const {
    if (diagnostics.value("check", std::string()) == "temporal_integrity") return repairSegments(args);
    return widerRedaction(args, attempt, services.config.audio);
}

// ============================================================================
// MuteKeywordsTool
// ============================================================================

MuteKeywordsTool::MuteKeywordsTool(const ToolServices& services) : services(services) {}

std::string MuteKeywordsTool::getDescription() const {
    return "Removes spoken phrases from audio: transcribes, finds what the request targets, "
           "verifies the segments, mutes them and re-transcribes to confirm they are gone.";
}

nlohmann::json MuteKeywordsTool::getSchema() const {
    return {{"type", "object"},
            {"properties",
             {{"audio_path", kAudioPathArg}, {"request", kRequestArg}, {"phrases", kPhrasesArg}, {"mode", kModeArg}}}};
}

nlohmann::json MuteKeywordsTool::detect(const ToolContext& ctx, const nlohmann::json& args) {
    return guarded("mute_keywords detection", [&] { return runKeywordDetection(services, ctx, args); });
}

nlohmann::json MuteKeywordsTool::verifyDetection(const ToolContext& ctx, const nlohmann::json& args,
                                                 const nlohmann::json& detection) {
    (void)ctx;
    (void)args;
    return verifySegmentsFile(detection.at("segments_path").get<std::string>());
}

nlohmann::json MuteKeywordsTool::transform(const ToolContext& ctx, const nlohmann::json& args,
                                           const nlohmann::json& detection) {
    return guarded("mute_keywords transform", [&] {
        return runMute(services, ctx, args, detection.at("segments_path").get<std::string>());
    });
}

nlohmann::json MuteKeywordsTool::verifyTransform(const ToolContext& ctx, const nlohmann::json& args,
                                                 const nlohmann::json& detection, const nlohmann::json& output) {
    (void)ctx;
    (void)detection;
    return verifyMuted(services, args, output);
}

nlohmann::json MuteKeywordsTool::adjustArguments(const nlohmann::json& args, int attempt,
                                                 const nlohmann::json& diagnostics) const {
    if (diagnostics.value("check", std::string()) == "temporal_integrity") return repairSegments(args);
    return widerRedaction(args, attempt, services.config.audio);
}
