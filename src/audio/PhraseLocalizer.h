#pragma once
#include <string>
#include <vector>
#include "audio/AudioRedactor.h"
#include "audio/Transcript.h"

struct PhraseMatch {
    std::string phrase;
    size_t firstWord = 0;
    size_t lastWord = 0;
    double start = 0.0;
    double end = 0.0;
    double similarity = 1.0;
};

/**
 * @brief Finds sensitive phrases in a word-timestamped transcript.
 *
 * Words and phrases are lower-cased and stripped of punctuation.
 * A single-word phrase needs an exact match. A multi-word phrase matches a
 * run of n-1, n or n+1 consecutive words whose joined text is at least
 * @c fuzzyThreshold similar. After a match the scan resumes past the span.
 */
class PhraseLocalizer {
public:
    explicit PhraseLocalizer(double fuzzyThreshold = 0.8);

    std::vector<PhraseMatch> locate(const std::vector<TranscriptWord>& words,
                                    const std::vector<std::string>& phrases) const;

    /** Matches as segments, ordered by start time. */
    std::vector<RedactionSegment> segments(const std::vector<TranscriptWord>& words,
                                           const std::vector<std::string>& phrases, RedactionMode mode) const;

private:
    double fuzzyThreshold;
};
