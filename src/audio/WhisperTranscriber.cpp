#include "audio/WhisperTranscriber.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include "audio/AudioDecoder.h"
#include "audio/WavWriter.h"
#include "utils/Logger.h"
#include "utils/Subprocess.h"

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

fs::path tempStem() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return fs::temp_directory_path() / ("wordshield_asr_" + std::to_string(gen()));
}

}

WhisperTranscriber::WhisperTranscriber(const Config::Audio& cfg)
    : binary(cfg.whisperBinary), model(cfg.whisperModel), language(cfg.language) {}

std::vector<TranscriptWord> WhisperTranscriber::parseOutput(const nlohmann::json& doc) {
    std::vector<TranscriptWord> words;
    if (!doc.contains("transcription") || !doc["transcription"].is_array()) {
        throw std::runtime_error("whisper output has no transcription array");
    }
    for (const auto& seg : doc["transcription"]) {
        std::string text = trim(seg.value("text", std::string()));
        if (text.empty() || text.front() == '[') continue;  // [_BEG_], [BLANK_AUDIO]
        const auto& off = seg.at("offsets");
        TranscriptWord w;
        w.text = text;
        w.start = off.value("from", 0) / 1000.0;
        w.end = off.value("to", 0) / 1000.0;
        if (w.end <= w.start) continue;
        words.push_back(std::move(w));
    }
    return words;
}

std::vector<TranscriptWord> WhisperTranscriber::transcribe(const AudioBuffer& audio) {
    if (audio.frameCount() == 0) return {};

    const fs::path stem = tempStem();
    const fs::path wavPath = stem.string() + ".wav";
    const fs::path jsonPath = stem.string() + ".json";
    WavWriter::write(wavPath.string(), AudioDecoder::convert(audio, 16000, 1));

    ProcessResult r = runProcess({binary, "--model", model, "--file", wavPath.string(), "--language", language,
                                  "--max-len", "1", "--split-on-word", "--output-json", "--output-file",
                                  stem.string()},
                                 true);

    std::error_code ec;
    fs::remove(wavPath, ec);
    if (r.exitCode != 0) {
        fs::remove(jsonPath, ec);
        throw std::runtime_error("whisper exited with " + std::to_string(r.exitCode) + ": " + r.output.substr(0, 500));
    }

    std::ifstream in(jsonPath);
    if (!in.is_open()) throw std::runtime_error("whisper output missing: " + jsonPath.string());
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        in.close();
        fs::remove(jsonPath, ec);
        throw std::runtime_error(std::string("whisper output unparsable: ") + e.what());
    }
    in.close();
    fs::remove(jsonPath, ec);

    std::vector<TranscriptWord> words = parseOutput(doc);
    Logger::getInstance().debug("whisper: " + std::to_string(words.size()) + " words");
    return words;
}

WindowedStreamingTranscriber::WindowedStreamingTranscriber(ITranscriber& offline, double windowSec, double stepSec,
                                                           double marginSec)
    : offline(offline), windowSec(windowSec), stepSec(stepSec), marginSec(marginSec) {
    if (stepSec <= 0.0 || marginSec < 0.0 || windowSec < stepSec + marginSec) {
        throw std::invalid_argument("stream window " + std::to_string(windowSec) + "s cannot hold step " +
                                    std::to_string(stepSec) + "s plus margin " + std::to_string(marginSec) + "s");
    }
}

void WindowedStreamingTranscriber::feed(const AudioBuffer& chunk) {
    std::lock_guard<std::mutex> lock(mtx);
    if (context.samples.empty()) {
        context.sampleRate = chunk.sampleRate;
        context.channels = chunk.channels;
    }
    context.samples.insert(context.samples.end(), chunk.samples.begin(), chunk.samples.end());
    sinceLast += chunk.duration();

    const double uncommitted = contextStart + context.duration() - horizon;
    if (sinceLast >= stepSec && uncommitted > marginSec) transcribeContext(false);
}

void WindowedStreamingTranscriber::transcribeContext(bool final) {
    sinceLast = 0.0;
    std::vector<TranscriptWord> words = offline.transcribe(context);
    const double windowEnd = contextStart + context.duration();
    double cut = final ? windowEnd : windowEnd - marginSec;

    // A word straddling the cut is left for the next window
    if (!final) {
        for (const auto& w : words) {
            if (w.start + contextStart < cut && w.end + contextStart > cut) cut = w.start + contextStart;
        }
    }

    for (const auto& w : words) {
        const double start = w.start + contextStart;
        const double end = w.end + contextStart;
        // Earlier windows already committed words centred before the horizon
        if ((start + end) / 2.0 >= horizon && end <= cut) fresh.push_back(TranscriptWord{w.text, start, end});
    }
    horizon = std::max(horizon, cut);

    // Context never drops audio past the horizon
    const double keepFrom = std::min(horizon, windowEnd - windowSec);
    if (keepFrom > contextStart) {
        const size_t frame = context.frameAt(keepFrom - contextStart);
        contextStart += static_cast<double>(frame) / (context.sampleRate > 0 ? context.sampleRate : 1);
        context = context.slice(frame, context.frameCount());
    }
}

std::vector<TranscriptWord> WindowedStreamingTranscriber::poll() {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<TranscriptWord> out;
    out.swap(fresh);
    return out;
}

double WindowedStreamingTranscriber::committedUntil() const {
    std::lock_guard<std::mutex> lock(mtx);
    return horizon;
}

void WindowedStreamingTranscriber::finish() {
    std::lock_guard<std::mutex> lock(mtx);
    if (contextStart + context.duration() > horizon) transcribeContext(true);
}
