#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "audio/AudioBuffer.h"

enum class RedactionMode { Silence, Beep, None };

std::string redactionModeName(RedactionMode mode);
/** @throws std::invalid_argument on unknown names */
RedactionMode redactionModeFromName(const std::string& name);

struct RedactionSegment {
    double start = 0.0;
    double end = 0.0;
    RedactionMode mode = RedactionMode::Silence;

    nlohmann::json toJson() const;
    static RedactionSegment fromJson(const nlohmann::json& j);
};

std::vector<RedactionSegment> segmentsFromJson(const nlohmann::json& arr);
nlohmann::json segmentsToJson(const std::vector<RedactionSegment>& segments);

namespace AudioRedactor {
    constexpr double kBeepFrequencyHz = 1000.0;
    constexpr float kBeepAmplitude = 0.1f;  // -20 dBFS

    /**
     * @brief Overwrites frames [beginFrame, endFrame) of @p audio.
     * @param streamOffsetSec stream time of frame 0, keeps the tone phase continuous across chunks
     */
    void fill(AudioBuffer& audio, size_t beginFrame, size_t endFrame, RedactionMode mode, double streamOffsetSec = 0.0);

    /** Applies each segment plus @p tailPadSec, clipped to the track. */
    AudioBuffer apply(const AudioBuffer& audio, const std::vector<RedactionSegment>& segments, double tailPadSec = 0.15);

    /** Same as apply() on a buffer that starts at @p streamOffsetSec within a longer stream. */
    void applyInPlace(AudioBuffer& audio, const std::vector<RedactionSegment>& segments, double tailPadSec,
                      double streamOffsetSec);

    /** Sorted, clipped to [0, duration], empty segments dropped and overlapping ones merged. */
    std::vector<RedactionSegment> normalizeSegments(std::vector<RedactionSegment> segments, double duration);
}
