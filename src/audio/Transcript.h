#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/AudioBuffer.h"

struct TranscriptWord {
    std::string text;
    double start = 0.0;  // seconds
    double end = 0.0;
};

inline nlohmann::json wordsToJson(const std::vector<TranscriptWord>& words) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& w : words) arr.push_back({{"text", w.text}, {"start", w.start}, {"end", w.end}});
    return arr;
}

inline std::string transcriptText(const std::vector<TranscriptWord>& words) {
    std::string text;
    for (const auto& w : words) {
        if (!text.empty()) text += " ";
        text += w.text;
    }
    return text;
}

/**
 * @brief Whole-buffer transcription with word-level timestamps.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;
    virtual std::vector<TranscriptWord> transcribe(const AudioBuffer& audio) = 0;
};

/**
 * @brief Incremental transcription over consecutive chunks.
 *
 * Words are committed once final. committedUntil() is the stream time up to
 * which no further words will appear.
 */
class IStreamingTranscriber {
public:
    virtual ~IStreamingTranscriber() = default;
    virtual void feed(const AudioBuffer& chunk) = 0;
    /** Words committed since the previous call. */
    virtual std::vector<TranscriptWord> poll() = 0;
    virtual double committedUntil() const = 0;
    /** End of stream: commit everything left. */
    virtual void finish() = 0;
};
