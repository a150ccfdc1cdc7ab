#pragma once
#include <string>
#include "audio/AudioBuffer.h"

namespace WavWriter {
    /** Writes 16-bit PCM RIFF/WAVE at the buffer's rate and channel count. */
    void write(const std::string& path, const AudioBuffer& buffer);
}
