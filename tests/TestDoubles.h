#pragma once
#include <algorithm>
#include <atomic>
#include <cmath>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

#include "audio/Transcript.h"
#include "audit/AuditSink.h"
#include "core/LLMClient.h"
#include "tools/ITool.h"
#include "video/FaceDetector.h"
#include "video/FrameIO.h"

namespace fs = std::filesystem;

// Scripted language model: replies are consumed in order, the last one repeats.
class MockLLMClient : public LLMClient {
public:
    MockLLMClient() : LLMClient("fake_key", "http://localhost:1", "fake_model") {}

    void queueChat(const std::string& reply) {
        std::lock_guard<std::mutex> lock(mtx);
        chatReplies.push_back(reply);
    }

    void queueJson(const nlohmann::json& reply) {
        std::lock_guard<std::mutex> lock(mtx);
        jsonReplies.push_back(reply);
    }

    std::string chat(const std::string& prompt, const std::string& role) override {
        std::lock_guard<std::mutex> lock(mtx);
        prompts.push_back(prompt);
        chatCalls++;
        if (chatReplies.empty()) return "";
        std::string reply = chatReplies.front();
        if (chatReplies.size() > 1) chatReplies.pop_front();
        (void)role;
        return reply;
    }

    nlohmann::json chatJson(const std::string& prompt, const std::string& role) override {
        std::lock_guard<std::mutex> lock(mtx);
        prompts.push_back(prompt);
        jsonCalls++;
        (void)role;
        if (jsonReplies.empty()) throw std::runtime_error("LLM returned no choices");
        nlohmann::json reply = jsonReplies.front();
        if (jsonReplies.size() > 1) jsonReplies.pop_front();
        if (!reply.is_object()) throw std::runtime_error("LLM returned JSON that is not an object");
        return reply;
    }

    int chatCalls = 0;
    int jsonCalls = 0;
    std::vector<std::string> prompts;

private:
    std::mutex mtx;
    std::deque<std::string> chatReplies;
    std::deque<nlohmann::json> jsonReplies;
};

class RecordingAuditSink : public AuditSink {
public:
    void append(const AuditEntry& entry) override {
        std::lock_guard<std::mutex> lock(mtx);
        entries.push_back(entry);
    }

    size_t count(AuditStage stage, AuditOutcome outcome) {
        std::lock_guard<std::mutex> lock(mtx);
        size_t n = 0;
        for (const auto& e : entries) {
            if (e.stage == stage && e.outcome == outcome) n++;
        }
        return n;
    }

    std::vector<AuditEntry> entries;

private:
    std::mutex mtx;
};

// ----------------------------------------------------------------------------
// Video
// ----------------------------------------------------------------------------

// Returns script[i] on the i-th detect() call, nothing past the end.
class ScriptedFaceDetector : public IFaceDetector {
public:
    explicit ScriptedFaceDetector(std::vector<std::vector<FaceDetection>> script = {}) : script(std::move(script)) {}

    std::vector<FaceDetection> detect(const cv::Mat& bgr) override {
        (void)bgr;
        size_t i = calls++;
        return i < script.size() ? script[i] : std::vector<FaceDetection>{};
    }
    std::string name() const override { return "scripted"; }

    std::vector<std::vector<FaceDetection>> script;
    size_t calls = 0;
};

class MemoryFrameSource : public FrameSource {
public:
    MemoryFrameSource(std::vector<cv::Mat> frames, double rate = 30.0) : frames(std::move(frames)), rate(rate) {}

    bool read(cv::Mat& frame) override {
        if (next >= frames.size()) return false;
        frame = frames[next++].clone();
        return true;
    }
    double fps() const override { return rate; }
    cv::Size frameSize() const override { return frames.empty() ? cv::Size() : frames.front().size(); }
    void rewind() override { next = 0; }

private:
    std::vector<cv::Mat> frames;
    double rate;
    size_t next = 0;
};

class MemoryFrameSink : public FrameSink {
public:
    void write(const cv::Mat& frame) override { frames.push_back(frame.clone()); }
    std::vector<cv::Mat> frames;
};

inline std::vector<cv::Mat> flatFrames(int count, cv::Size size = cv::Size(160, 120), int value = 128) {
    std::vector<cv::Mat> frames;
    for (int i = 0; i < count; ++i) frames.push_back(cv::Mat(size, CV_8UC3, cv::Scalar::all(value)));
    return frames;
}

// High-frequency texture, sharp under the Laplacian.
inline cv::Mat checkerboard(cv::Size size, int cell = 2) {
    cv::Mat img(size, CV_8UC3);
    for (int y = 0; y < size.height; ++y) {
        for (int x = 0; x < size.width; ++x) {
            uchar v = ((x / cell + y / cell) % 2) ? 255 : 0;
            img.at<cv::Vec3b>(y, x) = cv::Vec3b(v, v, v);
        }
    }
    return img;
}

// ----------------------------------------------------------------------------
// Audio
// ----------------------------------------------------------------------------

// One spoken word, rendered as a sine tone at its own frequency.
struct ToneWord {
    std::string text;
    double start = 0.0;
    double end = 0.0;
    double frequency = 440.0;
};

inline AudioBuffer renderTones(const std::vector<ToneWord>& words, double duration, int sampleRate = 16000,
                               float amplitude = 0.5f) {
    AudioBuffer audio;
    audio.sampleRate = sampleRate;
    audio.channels = 1;
    audio.samples.assign(static_cast<size_t>(std::lround(duration * sampleRate)), 0.0f);
    const double twoPi = 2.0 * 3.14159265358979323846;
    for (const auto& w : words) {
        size_t begin = audio.frameAt(w.start);
        size_t end = audio.frameAt(w.end);
        for (size_t f = begin; f < end; ++f) {
            audio.samples[f] = amplitude * static_cast<float>(std::sin(twoPi * w.frequency * f / sampleRate));
        }
    }
    return audio;
}

/**
 * Recognizes a scripted word when its tone still dominates its interval.
 * Silence and the redaction beep both erase it; mode "none" leaves it audible.
 */
class ToneTranscriber : public ITranscriber {
public:
    explicit ToneTranscriber(std::vector<ToneWord> script) : script(std::move(script)) {}

    std::vector<TranscriptWord> transcribe(const AudioBuffer& audio) override {
        calls++;
        std::vector<TranscriptWord> out;
        for (const auto& w : script) {
            if (audible(audio, w)) out.push_back(TranscriptWord{w.text, w.start, w.end});
        }
        return out;
    }

    static bool audible(const AudioBuffer& audio, const ToneWord& w) {
        const size_t begin = audio.frameAt(w.start);
        const size_t end = audio.frameAt(w.end);
        if (end <= begin + 16) return false;
        const size_t ch = static_cast<size_t>(audio.channels);
        const double twoPi = 2.0 * 3.14159265358979323846;

        double energy = 0.0, i = 0.0, q = 0.0;
        for (size_t f = begin; f < end; ++f) {
            double x = audio.samples[f * ch];
            double phase = twoPi * w.frequency * f / audio.sampleRate;
            energy += x * x;
            i += x * std::cos(phase);
            q += x * std::sin(phase);
        }
        const double n = static_cast<double>(end - begin);
        const double rms = std::sqrt(energy / n);
        if (rms < 0.01) return false;
        const double toneAmplitude = 2.0 * std::sqrt(i * i + q * q) / n;
        return toneAmplitude / (std::sqrt(2.0) * rms) > 0.5;
    }

    std::vector<ToneWord> script;
    int calls = 0;
};

/**
 * Streaming double: words are committed once the fed audio passes their end.
 * With throwOnFeed set the first feed() fails like a crashed recognizer.
 */
// Finds each vocabulary tone wherever it sounds, with times relative to the
// buffer it is given, so it can sit behind a sliding window.
class ScanningToneTranscriber : public ITranscriber {
public:
    explicit ScanningToneTranscriber(std::vector<ToneWord> vocabulary) : vocabulary(std::move(vocabulary)) {}

    std::vector<TranscriptWord> transcribe(const AudioBuffer& audio) override {
        calls++;
        const double hop = 0.02;
        const double total = audio.duration();
        std::vector<TranscriptWord> out;
        for (const auto& v : vocabulary) {
            double runStart = -1.0;
            double t = 0.0;
            for (; t + hop <= total + 1e-9; t += hop) {
                const bool on = ToneTranscriber::audible(audio, ToneWord{v.text, t, t + hop, v.frequency});
                if (on && runStart < 0.0) runStart = t;
                if (!on && runStart >= 0.0) {
                    if (t - runStart >= 0.06) out.push_back(TranscriptWord{v.text, runStart, t});
                    runStart = -1.0;
                }
            }
            if (runStart >= 0.0 && total - runStart >= 0.06) out.push_back(TranscriptWord{v.text, runStart, total});
        }
        std::sort(out.begin(), out.end(),
                  [](const TranscriptWord& a, const TranscriptWord& b) { return a.start < b.start; });
        return out;
    }

    std::atomic<int> calls{0};

private:
    std::vector<ToneWord> vocabulary;
};

class ScriptedStreamingTranscriber : public IStreamingTranscriber {
public:
    explicit ScriptedStreamingTranscriber(std::vector<TranscriptWord> script, bool throwOnFeed = false)
        : script(std::move(script)), throwOnFeed(throwOnFeed) {}

    void feed(const AudioBuffer& chunk) override {
        if (throwOnFeed) throw std::runtime_error("recognizer crashed");
        std::lock_guard<std::mutex> lock(mtx);
        fed += chunk.duration();
    }

    std::vector<TranscriptWord> poll() override {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<TranscriptWord> out;
        while (next < script.size() && script[next].end <= fed) out.push_back(script[next++]);
        return out;
    }

    double committedUntil() const override {
        std::lock_guard<std::mutex> lock(mtx);
        return fed;
    }

    void finish() override {
        std::lock_guard<std::mutex> lock(mtx);
        fed = std::numeric_limits<double>::infinity();
    }

private:
    std::vector<TranscriptWord> script;
    bool throwOnFeed;
    mutable std::mutex mtx;
    double fed = 0.0;
    size_t next = 0;
};

// ----------------------------------------------------------------------------
// Tools
// ----------------------------------------------------------------------------

// Tool whose phases are lambdas; counts every call.
class ScriptedTool : public ITool {
public:
    using Apply = std::function<nlohmann::json(const ToolContext&, const nlohmann::json&)>;
    using Verify = std::function<nlohmann::json(const nlohmann::json& args, const nlohmann::json& applied)>;

    ScriptedTool(std::string name, ToolKind kind, Apply apply, Verify verify)
        : name(std::move(name)), kind(kind), applyFn(std::move(apply)), verifyFn(std::move(verify)) {}

    std::string getName() const override { return name; }
    std::string getDescription() const override { return "scripted " + name; }
    nlohmann::json getSchema() const override { return schema; }
    ToolKind getKind() const override { return kind; }

    nlohmann::json apply(const ToolContext& ctx, const nlohmann::json& args) override {
        applyCalls++;
        seenArgs.push_back(args);
        return applyFn(ctx, args);
    }
    nlohmann::json verify(const ToolContext&, const nlohmann::json& args, const nlohmann::json& applied) override {
        verifyCalls++;
        return verifyFn(args, applied);
    }
    nlohmann::json adjustArguments(const nlohmann::json& args, int attempt, const nlohmann::json&) const override {
        nlohmann::json adjusted = args;
        adjusted["attempt"] = attempt;
        return adjusted;
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    std::atomic<int> applyCalls{0};
    std::atomic<int> verifyCalls{0};
    std::vector<nlohmann::json> seenArgs;

private:
    std::string name;
    ToolKind kind;
    Apply applyFn;
    Verify verifyFn;
};

// Writes <stem>_out.txt into the step directory.
inline nlohmann::json writeOutput(const ToolContext& ctx, const std::string& suffix = "_out") {
    std::string path = ToolResult::outputPath(ctx, ctx.inputPath.empty() ? "input" : ctx.inputPath, suffix, ".txt");
    std::ofstream(path) << "redacted";
    return {{"output_path", path}, {"summary", {{"written", path}}}};
}

inline nlohmann::json passed(const std::string& check = "scripted") {
    return {{"verified", true}, {"check", check}, {"metrics", nlohmann::json::object()}};
}

inline nlohmann::json failedCheck(const std::string& check, const std::string& category, const std::string& error) {
    return {{"verified", false}, {"check", check}, {"category", category}, {"error", error},
            {"metrics", nlohmann::json::object()}};
}

// Two-phase tool; detection verification answers come from a script, the last one repeats.
class ScriptedPhasedTool : public PhasedTool {
public:
    ScriptedPhasedTool(std::string name, std::vector<nlohmann::json> detectionChecks)
        : name(std::move(name)), detectionChecks(std::move(detectionChecks)) {}

    std::string getName() const override { return name; }
    std::string getDescription() const override { return "scripted two-phase " + name; }
    nlohmann::json getSchema() const override {
        return {{"type", "object"}, {"properties", {{"video_path", {{"type", "string"}}}}}};
    }
    ToolKind getKind() const override { return ToolKind::Composite; }

    nlohmann::json detect(const ToolContext& ctx, const nlohmann::json& args) override {
        (void)args;
        detectCalls++;
        return {{"detections_path", ctx.outputDir + "/detections.json"}, {"summary", nlohmann::json::object()}};
    }
    nlohmann::json verifyDetection(const ToolContext&, const nlohmann::json&, const nlohmann::json&) override {
        size_t i = static_cast<size_t>(detectionVerifyCalls++);
        if (detectionChecks.empty()) return passed("continuity");
        return detectionChecks[std::min(i, detectionChecks.size() - 1)];
    }
    nlohmann::json transform(const ToolContext& ctx, const nlohmann::json&, const nlohmann::json&) override {
        transformCalls++;
        return writeOutput(ctx, "_blurred");
    }
    nlohmann::json verifyTransform(const ToolContext&, const nlohmann::json&, const nlohmann::json&,
                                   const nlohmann::json&) override {
        return passed("intensity");
    }

    std::atomic<int> detectCalls{0};
    std::atomic<int> detectionVerifyCalls{0};
    std::atomic<int> transformCalls{0};

private:
    std::string name;
    std::vector<nlohmann::json> detectionChecks;
};

inline fs::path freshDirectory(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}
