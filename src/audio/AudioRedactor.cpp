#include "audio/AudioRedactor.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::string redactionModeName(RedactionMode mode) {
    switch (mode) {
        case RedactionMode::Silence: return "silence";
        case RedactionMode::Beep: return "beep";
        case RedactionMode::None: return "none";
    }
    return "silence";
}

RedactionMode redactionModeFromName(const std::string& name) {
    if (name == "silence" || name == "mute") return RedactionMode::Silence;
    if (name == "beep") return RedactionMode::Beep;
    if (name == "none") return RedactionMode::None;
    throw std::invalid_argument("Unknown redaction mode: " + name);
}

nlohmann::json RedactionSegment::toJson() const {
    return {{"start", start}, {"end", end}, {"mode", redactionModeName(mode)}};
}

RedactionSegment RedactionSegment::fromJson(const nlohmann::json& j) {
    RedactionSegment s;
    s.start = j.at("start").get<double>();
    s.end = j.at("end").get<double>();
    s.mode = redactionModeFromName(j.value("mode", std::string("silence")));
    return s;
}

std::vector<RedactionSegment> segmentsFromJson(const nlohmann::json& arr) {
    std::vector<RedactionSegment> out;
    for (const auto& j : arr) out.push_back(RedactionSegment::fromJson(j));
    return out;
}

nlohmann::json segmentsToJson(const std::vector<RedactionSegment>& segments) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : segments) arr.push_back(s.toJson());
    return arr;
}

namespace AudioRedactor {

void fill(AudioBuffer& audio, size_t beginFrame, size_t endFrame, RedactionMode mode, double streamOffsetSec) {
    if (mode == RedactionMode::None) return;
    endFrame = std::min(endFrame, audio.frameCount());
    const size_t ch = static_cast<size_t>(audio.channels);
    const double twoPi = 2.0 * 3.14159265358979323846;

    for (size_t f = beginFrame; f < endFrame; ++f) {
        float value = 0.0f;
        if (mode == RedactionMode::Beep) {
            double t = streamOffsetSec + static_cast<double>(f) / audio.sampleRate;
            value = kBeepAmplitude * static_cast<float>(std::sin(twoPi * kBeepFrequencyHz * t));
        }
        for (size_t c = 0; c < ch; ++c) audio.samples[f * ch + c] = value;
    }
}

void applyInPlace(AudioBuffer& audio, const std::vector<RedactionSegment>& segments, double tailPadSec,
                  double streamOffsetSec) {
    const double bufferEnd = streamOffsetSec + audio.duration();
    for (const auto& seg : segments) {
        double s = std::max(seg.start, streamOffsetSec);
        double e = std::min(seg.end + tailPadSec, bufferEnd);
        if (e <= s) continue;
        fill(audio, audio.frameAt(s - streamOffsetSec), audio.frameAt(e - streamOffsetSec), seg.mode, streamOffsetSec);
    }
}

AudioBuffer apply(const AudioBuffer& audio, const std::vector<RedactionSegment>& segments, double tailPadSec) {
    AudioBuffer out = audio;
    applyInPlace(out, segments, tailPadSec, 0.0);
    return out;
}

std::vector<RedactionSegment> normalizeSegments(std::vector<RedactionSegment> segments, double duration) {
    std::sort(segments.begin(), segments.end(),
              [](const RedactionSegment& a, const RedactionSegment& b) { return a.start < b.start; });
    std::vector<RedactionSegment> out;
    for (auto seg : segments) {
        seg.start = std::max(0.0, seg.start);
        seg.end = std::min(duration, seg.end);
        if (!(seg.start < seg.end)) continue;
        if (!out.empty() && seg.start <= out.back().end) {
            out.back().end = std::max(out.back().end, seg.end);
        } else {
            out.push_back(seg);
        }
    }
    return out;
}

}
