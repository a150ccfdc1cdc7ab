#include "audio/LiveAudioRedactor.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "pipeline/BoundedQueue.h"
#include "utils/Logger.h"

namespace {

using Clock = std::chrono::steady_clock;

struct Chunk {
    size_t index = 0;
    double start = 0.0;
    double end = 0.0;
    AudioBuffer audio;
    Clock::time_point arrival;
};

// Transcript state shared between the recognizer thread and the releaser.
struct SharedTranscript {
    std::mutex mtx;
    std::condition_variable changed;
    std::vector<TranscriptWord> words;
    std::vector<RedactionSegment> flagged;
    double horizon = 0.0;
    bool complete = false;
    bool failed = false;
};

Clock::duration seconds(double s) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(s));
}

}

double LiveAudioParams::requiredDelay(const Config::Audio& cfg) {
    return cfg.streamStepSec + cfg.streamMarginSec + cfg.lookaheadSec + cfg.chunkSec;
}

LiveAudioParams LiveAudioParams::fromConfig(const Config::Audio& cfg) {
    const double required = requiredDelay(cfg);
    if (cfg.playbackDelaySec < required) {
        throw std::runtime_error("Invalid config value in audio: playback_delay_sec " +
                                 std::to_string(cfg.playbackDelaySec) + " is below stream_step_sec + " +
                                 "stream_margin_sec + lookahead_sec + chunk_sec = " + std::to_string(required) +
                                 "; every chunk would be released silenced");
    }
    LiveAudioParams p;
    p.playbackDelaySec = cfg.playbackDelaySec;
    p.chunkSec = cfg.chunkSec;
    p.bufferDepth = cfg.bufferDepth;
    p.behindPolicy = cfg.behindPolicy == "delay" ? BehindPolicy::Delay : BehindPolicy::Silence;
    p.maxExtraDelaySec = cfg.maxExtraDelaySec;
    p.lookaheadSec = cfg.lookaheadSec;
    p.mode = redactionModeFromName(cfg.mode);
    p.tailPadSec = cfg.tailPadSec;
    return p;
}

LiveAudioRedactor::LiveAudioRedactor(IStreamingTranscriber& transcriber, std::vector<std::string> phrases,
                                     const LiveAudioParams& params, const PhraseLocalizer& localizer)
    : transcriber(transcriber), phrases(std::move(phrases)), params(params), localizer(localizer) {}

AudioBuffer LiveAudioRedactor::run(const AudioBuffer& input, LiveAudioStats* stats, const CancellationToken* cancel) {
    auto& logger = Logger::getInstance();
    LiveAudioStats local;
    BoundedQueue<Chunk> playback(params.bufferDepth);
    BoundedQueue<AudioBuffer> recognition(params.bufferDepth);
    SharedTranscript shared;
    std::exception_ptr asrError;
    auto isCancelled = [cancel] { return cancel && cancel->cancelled(); };

    const size_t chunkFrames = std::max<size_t>(1, static_cast<size_t>(std::lround(params.chunkSec * input.sampleRate)));

    std::thread ingest([&] {
        bool recognizing = true;
        for (size_t begin = 0, index = 0; begin < input.frameCount() && !isCancelled(); begin += chunkFrames, ++index) {
            Chunk c;
            c.index = index;
            c.audio = input.slice(begin, begin + chunkFrames);
            c.start = static_cast<double>(begin) / input.sampleRate;
            c.end = c.start + c.audio.duration();
            c.arrival = Clock::now();
            // After a recognizer failure the rest is still played out, silenced
            if (recognizing) recognizing = recognition.push(c.audio);
            if (!playback.push(std::move(c))) break;
            if (params.pace) std::this_thread::sleep_for(seconds(params.chunkSec));
        }
        recognition.stop();
        playback.stop();
    });

    std::thread recognizer([&] {
        auto publish = [&](bool done) {
            std::vector<TranscriptWord> fresh = transcriber.poll();
            std::lock_guard<std::mutex> lock(shared.mtx);
            shared.words.insert(shared.words.end(), fresh.begin(), fresh.end());
            if (!fresh.empty()) shared.flagged = localizer.segments(shared.words, phrases, params.mode);
            shared.horizon = done ? std::numeric_limits<double>::infinity() : transcriber.committedUntil();
            shared.complete = done;
            shared.changed.notify_all();
        };
        try {
            AudioBuffer chunk;
            while (recognition.pop(chunk)) {
                if (isCancelled()) break;
                transcriber.feed(chunk);
                publish(false);
            }
            if (!isCancelled()) {
                transcriber.finish();
                publish(true);
            }
        } catch (...) {
            asrError = std::current_exception();
            recognition.stop();
            std::lock_guard<std::mutex> lock(shared.mtx);
            shared.failed = true;
            shared.changed.notify_all();
        }
    });

    AudioBuffer output;
    output.sampleRate = input.sampleRate;
    output.channels = input.channels;

    Chunk chunk;
    while (playback.pop(chunk)) {
        if (isCancelled()) break;
        std::this_thread::sleep_until(chunk.arrival + seconds(params.playbackDelaySec));

        std::unique_lock<std::mutex> lock(shared.mtx);
        auto covered = [&] {
            return !shared.failed && (shared.complete || shared.horizon >= chunk.end + params.lookaheadSec);
        };
        if (!covered() && params.behindPolicy == BehindPolicy::Delay) {
            shared.changed.wait_until(lock, Clock::now() + seconds(params.maxExtraDelaySec),
                                      [&] { return covered() || shared.failed; });
        }

        local.chunks++;
        if (!covered()) {
            AudioRedactor::fill(chunk.audio, 0, chunk.audio.frameCount(), RedactionMode::Silence);
            local.chunksFailClosed++;
            logger.warn("Transcript behind playback at " + std::to_string(chunk.start) + "s; chunk released silenced");
        } else {
            bool touched = false;
            for (const auto& seg : shared.flagged) {
                if (seg.start < chunk.end && seg.end + params.tailPadSec > chunk.start) touched = true;
            }
            if (touched) {
                AudioRedactor::applyInPlace(chunk.audio, shared.flagged, params.tailPadSec, chunk.start);
                local.chunksRedacted++;
            }
        }
        lock.unlock();
        output.samples.insert(output.samples.end(), chunk.audio.samples.begin(), chunk.audio.samples.end());
    }

    playback.stop();
    recognition.stop();
    ingest.join();
    recognizer.join();

    {
        std::lock_guard<std::mutex> lock(shared.mtx);
        local.segments = shared.flagged;
    }
    if (stats) *stats = local;
    if (asrError) std::rethrow_exception(asrError);
    return output;
}
