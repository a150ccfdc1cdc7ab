#include "utils/TextNormalize.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

// Length of the UTF-8 sequence starting at @p i and its code point; 0 when malformed.
size_t decodeUtf8(const std::string& s, size_t i, char32_t& cp) {
    const unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len = lead >= 0xF0 ? 4 : lead >= 0xE0 ? 3 : lead >= 0xC0 ? 2 : 0;
    if (len == 0 || i + len > s.size()) return 0;
    cp = lead & (0x7F >> len);
    for (size_t k = 1; k < len; ++k) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    return len;
}

// Curly quotes, dashes, ellipses and the like, which ASR output and model replies mix freely.
bool isUnicodePunctuation(char32_t cp) {
    return (cp >= 0x00A0 && cp <= 0x00BF) || cp == 0x00D7 || cp == 0x00F7 || (cp >= 0x2000 && cp <= 0x206F) ||
           (cp >= 0x3000 && cp <= 0x303F) || (cp >= 0xFE10 && cp <= 0xFE6F) || (cp >= 0xFF01 && cp <= 0xFF0F) ||
           (cp >= 0xFF1A && cp <= 0xFF20);
}

}

namespace TextNormalize {

std::string normalizeWord(const std::string& word) {
    std::string out;
    out.reserve(word.size());
    for (size_t i = 0; i < word.size();) {
        unsigned char c = static_cast<unsigned char>(word[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
            ++i;
            continue;
        }
        char32_t cp = 0;
        size_t len = decodeUtf8(word, i, cp);
        if (len == 0) {
            out.push_back(word[i++]);
            continue;
        }
        if (!isUnicodePunctuation(cp)) out.append(word, i, len);
        i += len;
    }
    return out;
}

std::vector<std::string> normalizedTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream ss(text);
    std::string raw;
    while (ss >> raw) {
        std::string n = normalizeWord(raw);
        if (!n.empty()) tokens.push_back(n);
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens, size_t begin, size_t end) {
    std::string out;
    end = std::min(end, tokens.size());
    for (size_t i = begin; i < end; ++i) {
        if (i > begin) out += " ";
        out += tokens[i];
    }
    return out;
}

size_t levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double similarity(const std::string& a, const std::string& b) {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein(a, b)) / static_cast<double>(longest);
}

std::string toSnakeIdentifier(const std::string& name) {
    std::string out;
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (c == ' ' || c == '-' || c == '.' || c == '_') {
            if (!out.empty() && out.back() != '_') out.push_back('_');
        }
    }
    while (!out.empty() && out.back() == '_') out.pop_back();
    return out;
}

}
