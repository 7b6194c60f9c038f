#include <gtest/gtest.h>
#include "detector/ocr/text_processing.hpp"

using namespace text_processing;

namespace
{
    TextRegion region(const std::string &text, double confidence, int top = 10)
    {
        TextRegion r;
        r.text = text;
        r.confidence = confidence;
        r.top = top;
        r.bottom = top + 20;
        return r;
    }
}

TEST(TextProcessingTest, CountsCodePoints)
{
    EXPECT_EQ(countCharacters(""), 0);
    EXPECT_EQ(countCharacters("hello"), 5);
    EXPECT_EQ(countCharacters("caf\xC3\xA9"), 4);
}

TEST(TextProcessingTest, NoRegionsIsNotAScreenshot)
{
    TextAnalysis analysis = evaluate({}, 100);
    EXPECT_FALSE(analysis.screenshot);
    EXPECT_EQ(analysis.total_chars, 0);
}

TEST(TextProcessingTest, ThresholdRule)
{
    TextAnalysis analysis = evaluate({region("Settings", 0.9), region("Wi-Fi", 0.8)}, 400);
    EXPECT_EQ(analysis.total_chars, 13);
    EXPECT_NEAR(analysis.avg_confidence, 0.85, 1e-9);
    EXPECT_TRUE(analysis.screenshot);
}

TEST(TextProcessingTest, TooFewCharactersIsRegular)
{
    EXPECT_FALSE(evaluate({region("STOP", 0.95)}, 400).screenshot);
}

TEST(TextProcessingTest, LowConfidenceIsRegular)
{
    TextParams params;
    params.extra_heuristics = false;
    EXPECT_FALSE(evaluate({region("blurry sign in the distance", 0.3)}, 400, params).screenshot);
}

TEST(TextProcessingTest, ZeroMinimumCharactersAcceptsConfidentText)
{
    TextParams params;
    params.min_chars = 0;
    EXPECT_TRUE(evaluate({region("a", 0.9)}, 400, params).screenshot);
}

TEST(TextProcessingTest, CaptionRuleNeedsBottomText)
{
    // Average confidence below the threshold rule, long confident lines at the bottom
    std::vector<TextRegion> regions = {
        region("Posted a new photo from the weekend trip", 0.75, 320),
        region("Liked by many people and some friends", 0.75, 350),
        region("x", 0.05, 360),
        region("y", 0.05, 370),
        region("z", 0.05, 380)};

    TextParams params;
    params.min_confidence = 0.9;
    TextAnalysis analysis = evaluate(regions, 400, params);
    EXPECT_TRUE(analysis.has_bottom_text);
    EXPECT_EQ(analysis.high_conf_regions, 2);
    EXPECT_EQ(analysis.large_text_blocks, 2);
    EXPECT_TRUE(analysis.screenshot);

    // Same text at the top of the frame; too unsure for the dense-text rule
    EXPECT_LT(analysis.avg_confidence, params.dense_min_confidence);
    for (auto &r : regions)
        r.top = 10;
    EXPECT_FALSE(evaluate(regions, 400, params).screenshot);
}

TEST(TextProcessingTest, DenseTextRule)
{
    std::vector<TextRegion> regions = {
        region("The quick brown fox jumps over the lazy dog", 0.5),
        region("Pack my box with five dozen liquor jugs", 0.5)};

    TextParams params;
    params.min_confidence = 0.6;
    EXPECT_TRUE(evaluate(regions, 400, params).screenshot);

    params.extra_heuristics = false;
    EXPECT_FALSE(evaluate(regions, 400, params).screenshot);
}
