#include <gtest/gtest.h>

#include "backend/tracking/completionevaluator.h"

namespace Encore {
namespace {

TEST(CompletionEvaluatorTest, HalfOfTheTrackIsTheThreshold)
{
    EXPECT_FALSE(CompletionEvaluator::isComplete(99.9, 200.0));
    EXPECT_TRUE(CompletionEvaluator::isComplete(100.0, 200.0));
    EXPECT_TRUE(CompletionEvaluator::isComplete(200.0, 200.0));
}

TEST(CompletionEvaluatorTest, UnknownDurationNeverCompletes)
{
    EXPECT_FALSE(CompletionEvaluator::isComplete(0.0, 0.0));
    EXPECT_FALSE(CompletionEvaluator::isComplete(5000.0, 0.0));
    EXPECT_FALSE(CompletionEvaluator::isComplete(5000.0, -30.0));
}

TEST(CompletionEvaluatorTest, NoAbsoluteFloorOrCap)
{
    // Short tracks only need half their length
    EXPECT_TRUE(CompletionEvaluator::isComplete(5.0, 10.0));
    // Long tracks still need half, not a fixed number of minutes
    EXPECT_FALSE(CompletionEvaluator::isComplete(600.0, 3600.0));
}

TEST(CompletionEvaluatorTest, RepeatedCallsAgree)
{
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(CompletionEvaluator::isComplete(150.0, 300.0));
    }
}

TEST(CompletionEvaluatorTest, CompletionRatio)
{
    EXPECT_DOUBLE_EQ(0.5, CompletionEvaluator::completionRatio(100.0, 200.0));
    EXPECT_DOUBLE_EQ(1.25, CompletionEvaluator::completionRatio(250.0, 200.0));
    EXPECT_DOUBLE_EQ(0.0, CompletionEvaluator::completionRatio(100.0, 0.0));
}

} // namespace
} // namespace Encore
