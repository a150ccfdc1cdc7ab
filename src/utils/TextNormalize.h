#pragma once
#include <string>
#include <vector>

namespace TextNormalize {
    /**
     * Lower-cases ASCII letters and drops ASCII and common Unicode punctuation
     * (curly quotes, dashes, ellipses). Digits and other non-ASCII letters are kept.
     */
    std::string normalizeWord(const std::string& word);

    /** Splits on whitespace, normalizes each token and drops the ones that become empty. */
    std::vector<std::string> normalizedTokens(const std::string& text);

    /** Joins tokens with single spaces. */
    std::string join(const std::vector<std::string>& tokens, size_t begin, size_t end);

    size_t levenshtein(const std::string& a, const std::string& b);

    /** 1 - distance / max(len), in [0, 1]. Two empty strings compare equal. */
    double similarity(const std::string& a, const std::string& b);

    /** Lower case, separators (space, dash, dot) folded to '_', runs of '_' collapsed. */
    std::string toSnakeIdentifier(const std::string& name);
}
