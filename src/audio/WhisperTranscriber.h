#pragma once
#include <mutex>
#include <string>
#include "audio/Transcript.h"
#include "core/ConfigManager.h"

/**
 * @brief Runs the whisper.cpp command line tool on a temporary 16 kHz mono WAV
 * and reads its JSON output, one segment per word.
 */
class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const Config::Audio& cfg);

    /** @throws std::runtime_error when the binary fails or its output is missing */
    std::vector<TranscriptWord> transcribe(const AudioBuffer& audio) override;

    /** Parses whisper's --output-json document. */
    static std::vector<TranscriptWord> parseOutput(const nlohmann::json& doc);

private:
    std::string binary;
    std::string model;
    std::string language;
};

/**
 * @brief Sliding-window streaming on top of an offline transcriber.
 *
 * Every @p stepSec of new audio the last @p windowSec of context is
 * transcribed again. Words that are new (their middle lies past the committed
 * horizon) and end before the trailing @p marginSec are committed, so the
 * horizon trails the stream by at most marginSec + stepSec plus the time one
 * transcription takes.
 */
class WindowedStreamingTranscriber : public IStreamingTranscriber {
public:
    /** @throws std::invalid_argument when the window cannot hold a step plus the margin */
    WindowedStreamingTranscriber(ITranscriber& offline, double windowSec = 5.0, double stepSec = 0.5,
                                 double marginSec = 0.5);

    void feed(const AudioBuffer& chunk) override;
    std::vector<TranscriptWord> poll() override;
    double committedUntil() const override;
    void finish() override;

private:
    ITranscriber& offline;
    double windowSec;
    double stepSec;
    double marginSec;

    AudioBuffer context;  // most recent audio, from contextStart on
    double contextStart = 0.0;
    double sinceLast = 0.0;
    double horizon = 0.0;
    std::vector<TranscriptWord> fresh;
    mutable std::mutex mtx;

    void transcribeContext(bool final);
};
