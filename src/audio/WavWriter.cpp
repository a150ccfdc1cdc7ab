#include "audio/WavWriter.h"
#include <cstdint>
#include <fstream>
#include <stdexcept>

namespace {
    void put16(std::ofstream& out, uint16_t v) {
        char b[2] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff)};
        out.write(b, 2);
    }

    void put32(std::ofstream& out, uint32_t v) {
        char b[4] = {static_cast<char>(v & 0xff), static_cast<char>((v >> 8) & 0xff),
                     static_cast<char>((v >> 16) & 0xff), static_cast<char>((v >> 24) & 0xff)};
        out.write(b, 4);
    }
}

namespace WavWriter {

void write(const std::string& path, const AudioBuffer& buffer) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) throw std::runtime_error("Cannot write WAV: " + path);

    const uint16_t channels = static_cast<uint16_t>(buffer.channels);
    const uint32_t rate = static_cast<uint32_t>(buffer.sampleRate);
    const uint32_t dataBytes = static_cast<uint32_t>(buffer.samples.size() * sizeof(int16_t));

    out.write("RIFF", 4);
    put32(out, 36 + dataBytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    put32(out, 16);
    put16(out, 1);  // PCM
    put16(out, channels);
    put32(out, rate);
    put32(out, rate * channels * 2);
    put16(out, static_cast<uint16_t>(channels * 2));
    put16(out, 16);
    out.write("data", 4);
    put32(out, dataBytes);

    for (float s : buffer.samples) {
        float clamped = s > 1.0f ? 1.0f : (s < -1.0f ? -1.0f : s);
        put16(out, static_cast<uint16_t>(static_cast<int16_t>(clamped * 32767.0f)));
    }
    if (!out.good()) throw std::runtime_error("Short write to WAV: " + path);
}

}
