#include <gtest/gtest.h>
#include "audio/PhraseLocalizer.h"
#include "utils/TextNormalize.h"

namespace {

std::vector<TranscriptWord> words(const std::vector<std::string>& texts) {
    std::vector<TranscriptWord> out;
    double t = 0.0;
    for (const auto& text : texts) {
        out.push_back(TranscriptWord{text, t, t + 0.4});
        t += 0.5;
    }
    return out;
}

}

TEST(PhraseLocalizerTest, SingleWordNeedsExactMatch) {
    auto w = words({"my", "Password:", "is", "PASSWORDS", "and", "password"});
    std::vector<PhraseMatch> m = PhraseLocalizer().locate(w, {"password"});
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m[0].firstWord, 1u);
    EXPECT_EQ(m[1].firstWord, 5u);
    EXPECT_DOUBLE_EQ(m[0].start, 0.5);
    EXPECT_DOUBLE_EQ(m[0].end, 0.9);
}

TEST(PhraseLocalizerTest, AddressSpanIsBoundedByWordTimestamps) {
    auto w = words({"I", "live", "at", "123", "Main", "Street.", "okay"});
    std::vector<PhraseMatch> m = PhraseLocalizer(0.8).locate(w, {"123 Main Street"});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].firstWord, 3u);
    EXPECT_EQ(m[0].lastWord, 5u);
    EXPECT_DOUBLE_EQ(m[0].start, w[3].start);
    EXPECT_DOUBLE_EQ(m[0].end, w[5].end);
    EXPECT_DOUBLE_EQ(m[0].similarity, 1.0);
}

TEST(PhraseLocalizerTest, FuzzyMultiWordMatch) {
    auto w = words({"send", "it", "to", "123", "Maine", "Street"});
    std::vector<PhraseMatch> m = PhraseLocalizer(0.8).locate(w, {"123 Main Street"});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].firstWord, 3u);
    EXPECT_EQ(m[0].lastWord, 5u);
    EXPECT_LT(m[0].similarity, 1.0);
    EXPECT_GE(m[0].similarity, 0.8);
}

TEST(PhraseLocalizerTest, SplitWordUsesTheLongerWindow) {
    // The recognizer split "street" in two
    auto w = words({"on", "main", "st", "reet", "today"});
    std::vector<PhraseMatch> m = PhraseLocalizer(0.8).locate(w, {"main street"});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].firstWord, 1u);
    EXPECT_EQ(m[0].lastWord, 3u);
}

TEST(PhraseLocalizerTest, DissimilarPhraseIsNotMatched) {
    auto w = words({"I", "live", "at", "9", "Oak", "Avenue"});
    EXPECT_TRUE(PhraseLocalizer(0.8).locate(w, {"123 Main Street"}).empty());
}

TEST(PhraseLocalizerTest, SegmentsAreOrderedByStart) {
    auto w = words({"call", "555", "0199", "about", "the", "password"});
    std::vector<RedactionSegment> s = PhraseLocalizer().segments(w, {"password", "555 0199"}, RedactionMode::Beep);
    ASSERT_EQ(s.size(), 2u);
    EXPECT_DOUBLE_EQ(s[0].start, 0.5);
    EXPECT_DOUBLE_EQ(s[0].end, 1.4);
    EXPECT_DOUBLE_EQ(s[1].start, 2.5);
    EXPECT_EQ(s[1].mode, RedactionMode::Beep);
}

TEST(PhraseLocalizerTest, EmptyInputs) {
    EXPECT_TRUE(PhraseLocalizer().locate({}, {"secret"}).empty());
    EXPECT_TRUE(PhraseLocalizer().locate(words({"a", "secret"}), {}).empty());
    EXPECT_TRUE(PhraseLocalizer().locate(words({"a", "secret"}), {"  ...  "}).empty());
}

TEST(PhraseLocalizerTest, CurlyQuotesDoNotBlockExactMatch) {
    auto w = words({"it’s", "“Smith”", "here"});
    std::vector<PhraseMatch> m = PhraseLocalizer().locate(w, {"Smith"});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].firstWord, 1u);

    m = PhraseLocalizer().locate(w, {"its"});
    ASSERT_EQ(m.size(), 1u);
    EXPECT_EQ(m[0].firstWord, 0u);
}

TEST(TextNormalizeTest, DropsUnicodePunctuationKeepsLetters) {
    EXPECT_EQ(TextNormalize::normalizeWord("“Hello,”"), "hello");
    EXPECT_EQ(TextNormalize::normalizeWord("don’t"), "dont");
    EXPECT_EQ(TextNormalize::normalizeWord("wait…"), "wait");
    EXPECT_EQ(TextNormalize::normalizeWord("—"), "");
    EXPECT_EQ(TextNormalize::normalizeWord("«café»"), "café");
    EXPECT_EQ(TextNormalize::normalizeWord("Zürich"), "zürich");
    EXPECT_EQ(TextNormalize::normalizedTokens("— hi —").size(), 1u);
}
