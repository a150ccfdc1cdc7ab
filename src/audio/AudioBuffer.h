#pragma once
#include <algorithm>
#include <cmath>
#include <vector>

/**
 * @brief Interleaved float PCM in [-1, 1].
 */
struct AudioBuffer {
    int sampleRate = 16000;
    int channels = 1;
    std::vector<float> samples;

    size_t frameCount() const { return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0; }

    double duration() const { return sampleRate > 0 ? static_cast<double>(frameCount()) / sampleRate : 0.0; }

    /** Frame index of @p seconds, clamped to [0, frameCount()]. */
    size_t frameAt(double seconds) const {
        if (seconds <= 0.0) return 0;
        size_t f = static_cast<size_t>(std::llround(seconds * sampleRate));
        return std::min(f, frameCount());
    }

    /** Frames [begin, end) as a new buffer. */
    AudioBuffer slice(size_t beginFrame, size_t endFrame) const {
        AudioBuffer out;
        out.sampleRate = sampleRate;
        out.channels = channels;
        endFrame = std::min(endFrame, frameCount());
        if (beginFrame < endFrame) {
            out.samples.assign(samples.begin() + beginFrame * channels, samples.begin() + endFrame * channels);
        }
        return out;
    }
};
