#pragma once
#include <string>
#include <vector>
#include "audio/AudioRedactor.h"
#include "audio/PhraseLocalizer.h"
#include "audio/Transcript.h"
#include "core/ConfigManager.h"
#include "pipeline/CancellationToken.h"

enum class BehindPolicy { Silence, Delay };

struct LiveAudioParams {
    double playbackDelaySec = 3.0;
    double chunkSec = 0.25;
    size_t bufferDepth = 64;
    BehindPolicy behindPolicy = BehindPolicy::Silence;
    double maxExtraDelaySec = 1.0;
    // Committed transcript must reach this far past a chunk before it is released,
    // so a phrase that starts inside the chunk is complete when it is localized.
    double lookaheadSec = 1.0;
    RedactionMode mode = RedactionMode::Silence;
    double tailPadSec = 0.15;
    bool pace = false;  // feed chunks in real time

    /**
     * @throws std::runtime_error when the playback delay is shorter than the
     * transcript can lag (stream step + margin + lookahead + one chunk)
     */
    static LiveAudioParams fromConfig(const Config::Audio& cfg);

    /** Delay needed to release chunks covered by a windowed streaming transcript. */
    static double requiredDelay(const Config::Audio& cfg);
};

struct LiveAudioStats {
    int chunks = 0;
    int chunksRedacted = 0;
    int chunksFailClosed = 0;
    std::vector<RedactionSegment> segments;
};

/**
 * @brief Live phrase censoring through a playback delay buffer.
 *
 * Chunks wait in a bounded queue for the playback delay while a streaming
 * transcriber commits words. Just before release, every flagged interval
 * overlapping the chunk is overwritten. A chunk the transcriber has not yet
 * covered is released as silence, never unredacted.
 */
class LiveAudioRedactor {
public:
    LiveAudioRedactor(IStreamingTranscriber& transcriber, std::vector<std::string> phrases,
                      const LiveAudioParams& params, const PhraseLocalizer& localizer = PhraseLocalizer());

    /**
     * @brief Streams @p input chunk by chunk and returns what was released.
     * @throws the transcriber's error after the stream has been released fail-closed
     */
    AudioBuffer run(const AudioBuffer& input, LiveAudioStats* stats = nullptr,
                    const CancellationToken* cancel = nullptr);

private:
    IStreamingTranscriber& transcriber;
    std::vector<std::string> phrases;
    LiveAudioParams params;
    PhraseLocalizer localizer;
};
