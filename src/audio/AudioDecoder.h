#pragma once
#include <string>
#include "audio/AudioBuffer.h"

namespace AudioDecoder {
    /**
     * @brief Decodes the first audio stream of a file to interleaved float PCM
     * at the source rate and channel count.
     * @throws std::runtime_error on open/decode failures
     */
    AudioBuffer decodeFile(const std::string& path);

    /** Resamples and remixes through libswresample. */
    AudioBuffer convert(const AudioBuffer& input, int sampleRate, int channels);
}
