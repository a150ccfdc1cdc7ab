#include <gtest/gtest.h>
#include "verification/VideoVerification.h"
#include "video/LiveVideoPipeline.h"
#include "TestDoubles.h"

namespace {

TrackingParams everyFrame() {
    TrackingParams p;
    p.detectEvery = 1;
    return p;
}

}

TEST(LiveVideoPipelineTest, ReleasesEveryFrameInOrder) {
    ScriptedFaceDetector detector({{{cv::Rect(40, 30, 40, 40), 0.9f}}});
    std::vector<cv::Mat> frames;
    for (int i = 0; i < 20; ++i) frames.push_back(cv::Mat(120, 160, CV_8UC3, cv::Scalar::all(i * 10)));
    MemoryFrameSource source(frames);
    MemoryFrameSink sink;

    LiveVideoPipeline pipeline(detector, everyFrame(), BlurParams(), 4, 0.2);
    LiveVideoStats stats = pipeline.run(source, sink);

    EXPECT_EQ(stats.framesRead, 20);
    EXPECT_EQ(stats.framesReleased, 20);
    ASSERT_EQ(sink.frames.size(), 20u);
    for (int i = 0; i < 20; ++i) EXPECT_EQ(sink.frames[i].at<cv::Vec3b>(0, 0)[0], i * 10) << "frame " << i;
    // Detected once, then carried by prediction
    EXPECT_EQ(stats.regionsBlurred, 20);
    EXPECT_EQ(stats.tracking.tracksCreated, 1);
    EXPECT_EQ(stats.tracking.predictedFrames, 19);
}

TEST(LiveVideoPipelineTest, FacesAreBlurredBeforeRelease) {
    ScriptedFaceDetector detector(std::vector<std::vector<FaceDetection>>(5, {{cv::Rect(40, 30, 40, 40), 0.9f}}));
    MemoryFrameSource source(std::vector<cv::Mat>(5, checkerboard(cv::Size(160, 120))));
    MemoryFrameSink sink;

    LiveVideoPipeline pipeline(detector, everyFrame(), BlurParams());
    pipeline.run(source, sink);

    ASSERT_EQ(sink.frames.size(), 5u);
    for (const auto& f : sink.frames) {
        EXPECT_LT(VideoVerification::laplacianVariance(f(cv::Rect(20, 10, 80, 80))), 50.0);
        EXPECT_GT(VideoVerification::laplacianVariance(f(cv::Rect(110, 0, 50, 50))), 1000.0);
    }
}

TEST(LiveVideoPipelineTest, CancelledRunReleasesNothing) {
    ScriptedFaceDetector detector;
    MemoryFrameSource source(flatFrames(10));
    MemoryFrameSink sink;
    CancellationToken cancel;
    cancel.cancel();

    LiveVideoPipeline pipeline(detector, everyFrame(), BlurParams());
    LiveVideoStats stats = pipeline.run(source, sink, &cancel);
    EXPECT_EQ(stats.framesReleased, 0);
    EXPECT_TRUE(sink.frames.empty());
}
