#include <gtest/gtest.h>
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "pipeline/CancellationToken.h"

TEST(ErrorsTest, CategoryNamesRoundTrip) {
    for (ErrorCategory c : {ErrorCategory::PlanningFailure, ErrorCategory::TemporalIntegrityError,
                            ErrorCategory::SandboxViolation, ErrorCategory::Cancelled}) {
        EXPECT_EQ(categoryFromName(categoryName(c)), c);
    }
    EXPECT_EQ(categoryFromName("SomethingElse"), ErrorCategory::ToolError);
}

TEST(ErrorsTest, FatalCategoriesSkipRecovery) {
    EXPECT_TRUE(isFatal(ErrorCategory::SandboxViolation));
    EXPECT_TRUE(isFatal(ErrorCategory::MissingInput));
    EXPECT_TRUE(isFatal(ErrorCategory::RegistryConflict));
    EXPECT_FALSE(isFatal(ErrorCategory::DetectionVerificationFailure));
    EXPECT_FALSE(isFatal(ErrorCategory::ExecutionTimeout));
    EXPECT_FALSE(isFatal(ErrorCategory::GenerationFailure));
}

TEST(ErrorsTest, TypedErrorCarriesCategoryAndDetail) {
    try {
        throw TemporalIntegrityError("reversed segment", {{"index", 2}});
    } catch (const ShieldError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::TemporalIntegrityError);
        EXPECT_EQ(e.detail()["index"], 2);
        EXPECT_EQ(e.toJson()["category"], "TemporalIntegrityError");
        EXPECT_FALSE(e.fatal());
    }
}

TEST(CancellationTokenTest, ChildSeesParentCancellation) {
    auto parent = std::make_shared<CancellationToken>();
    CancellationToken child(parent);
    EXPECT_FALSE(child.cancelled());
    parent->cancel();
    EXPECT_TRUE(child.cancelled());
    EXPECT_THROW(child.throwIfCancelled(), JobCancelled);
}

TEST(CancellationTokenTest, ChildCancellationDoesNotReachParent) {
    auto parent = std::make_shared<CancellationToken>();
    CancellationToken child(parent);
    child.cancel();
    EXPECT_FALSE(parent->cancelled());
    EXPECT_NO_THROW(checkCancelled(nullptr));
}

TEST(ConfigTest, DefaultsAndOverrides) {
    Config cfg = Config::fromJson({{"pipeline", {{"max_local_retries", 1}}},
                                   {"video", {{"retry_kernels", {61, 99}}}},
                                   {"audio", {{"mode", "beep"}}}});
    EXPECT_EQ(cfg.pipeline.maxLocalRetries, 1);
    EXPECT_EQ(cfg.pipeline.maxReplans, 2);
    EXPECT_EQ(cfg.video.maxPredictedFrames, 60);
    ASSERT_EQ(cfg.video.retryKernels.size(), 2u);
    EXPECT_EQ(cfg.video.retryKernels[1], 99);
    EXPECT_EQ(cfg.audio.mode, "beep");
}

TEST(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load("/nonexistent/wordshield.json"), std::runtime_error);
}
