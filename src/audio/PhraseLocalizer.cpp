#include "audio/PhraseLocalizer.h"
#include <algorithm>
#include "utils/TextNormalize.h"

namespace {

struct WindowScore {
    size_t length = 0;
    double score = -1.0;
};

// Best fuzzy window starting at `pos`; lengths n, n-1, n+1 in that order of preference.
WindowScore bestWindow(const std::vector<std::string>& tokens, size_t pos, const std::string& target, size_t n) {
    WindowScore best;
    const size_t candidates[] = {n, n - 1, n + 1};
    for (size_t len : candidates) {
        if (len == 0 || pos + len > tokens.size()) continue;
        double s = TextNormalize::similarity(TextNormalize::join(tokens, pos, pos + len), target);
        if (s > best.score) {
            best.score = s;
            best.length = len;
        }
    }
    return best;
}

}

PhraseLocalizer::PhraseLocalizer(double fuzzyThreshold) : fuzzyThreshold(fuzzyThreshold) {}

std::vector<PhraseMatch> PhraseLocalizer::locate(const std::vector<TranscriptWord>& words,
                                                 const std::vector<std::string>& phrases) const {
    // Flattened normalized sequence; `origin` maps back to the transcript index
    std::vector<std::string> tokens;
    std::vector<size_t> origin;
    for (size_t i = 0; i < words.size(); ++i) {
        std::string n = TextNormalize::normalizeWord(words[i].text);
        if (n.empty()) continue;
        tokens.push_back(n);
        origin.push_back(i);
    }

    std::vector<PhraseMatch> matches;
    for (const auto& phrase : phrases) {
        std::vector<std::string> target = TextNormalize::normalizedTokens(phrase);
        const size_t n = target.size();
        if (n == 0) continue;
        const std::string joined = TextNormalize::join(target, 0, n);

        size_t i = 0;
        while (i < tokens.size()) {
            if (n == 1) {
                if (tokens[i] == target[0]) {
                    const auto& w = words[origin[i]];
                    matches.push_back(PhraseMatch{phrase, origin[i], origin[i], w.start, w.end, 1.0});
                }
                ++i;
                continue;
            }

            WindowScore here = bestWindow(tokens, i, joined, n);
            if (here.score < fuzzyThreshold) {
                ++i;
                continue;
            }
            // A better-aligned window one word later wins over a sloppy one here
            if (i + 1 < tokens.size() && bestWindow(tokens, i + 1, joined, n).score > here.score) {
                ++i;
                continue;
            }

            size_t first = origin[i];
            size_t last = origin[i + here.length - 1];
            matches.push_back(PhraseMatch{phrase, first, last, words[first].start, words[last].end, here.score});
            i += here.length;
        }
    }

    std::sort(matches.begin(), matches.end(), [](const PhraseMatch& a, const PhraseMatch& b) {
        return a.start < b.start;
    });
    return matches;
}

std::vector<RedactionSegment> PhraseLocalizer::segments(const std::vector<TranscriptWord>& words,
                                                        const std::vector<std::string>& phrases,
                                                        RedactionMode mode) const {
    std::vector<RedactionSegment> out;
    for (const auto& m : locate(words, phrases)) {
        out.push_back(RedactionSegment{m.start, m.end, mode});
    }
    return out;
}
