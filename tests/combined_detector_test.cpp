#include <gtest/gtest.h>
#include <memory>
#include "detector/combined_detector.hpp"
#include "test_helpers.hpp"

using namespace testing_helpers;

namespace
{
    struct CombinedFixture
    {
        CombinedFixture()
        {
            auto fastDetector = std::make_unique<FakeDetector>(DetectionMethod::HORIZONTAL);
            auto slowDetector = std::make_unique<FakeDetector>(DetectionMethod::OCR);
            fast = fastDetector.get();
            slow = slowDetector.get();
            combined = std::make_unique<CombinedDetector>(std::move(fastDetector), std::move(slowDetector));
            combined->initialize();
        }

        FakeDetector *fast = nullptr;
        FakeDetector *slow = nullptr;
        std::unique_ptr<CombinedDetector> combined;
    };
}

TEST(CombinedDetectorTest, PositiveFastVerdictSkipsFallback)
{
    CombinedFixture f;
    DetectionOutcome outcome = f.combined->classify("/images/shot.png");

    EXPECT_TRUE(outcome.screenshot);
    EXPECT_EQ(outcome.method, DetectionMethod::HORIZONTAL);
    EXPECT_EQ(f.fast->calls(), 1);
    EXPECT_EQ(f.slow->calls(), 0);
}

TEST(CombinedDetectorTest, NegativeFastVerdictRunsFallback)
{
    CombinedFixture f;
    DetectionOutcome outcome = f.combined->classify("/images/beach.jpg");

    EXPECT_FALSE(outcome.screenshot);
    EXPECT_EQ(outcome.method, DetectionMethod::OCR);
    EXPECT_EQ(outcome.processing_time_ms, 2);
    EXPECT_EQ(f.fast->calls(), 1);
    EXPECT_EQ(f.slow->calls(), 1);
}

TEST(CombinedDetectorTest, DecodeFailureIsNotRetried)
{
    CombinedFixture f;
    EXPECT_THROW(f.combined->classify("/images/broken.jpg"), DecodeError);
    EXPECT_EQ(f.slow->calls(), 0);
}

TEST(CombinedDetectorTest, InitializesAndTerminatesBoth)
{
    CombinedFixture f;
    EXPECT_TRUE(f.combined->isInitialized());

    f.combined->terminate();
    EXPECT_TRUE(f.fast->terminated());
    EXPECT_TRUE(f.slow->terminated());
    EXPECT_FALSE(f.combined->isInitialized());
}

TEST(CombinedDetectorTest, FallbackInitFailurePropagates)
{
    CombinedDetector combined(std::make_unique<FakeDetector>(),
                              std::make_unique<FakeDetector>(DetectionMethod::OCR, true));
    EXPECT_THROW(combined.initialize(), ModelLoadError);
}
