#pragma once
#include "pipeline/CancellationToken.h"
#include "video/FaceBlurrer.h"
#include "video/FaceTrackingEngine.h"
#include "video/FrameIO.h"

struct LiveVideoStats {
    int framesRead = 0;
    int framesReleased = 0;
    int regionsBlurred = 0;
    TrackingStats tracking;
};

/**
 * @brief Live censoring: a capture thread feeds a bounded queue, the
 * consumer detects and blurs each frame and releases it after a fixed delay.
 *
 * There is no verification before release.
 */
class LiveVideoPipeline {
public:
    LiveVideoPipeline(IFaceDetector& detector, const TrackingParams& tracking, const BlurParams& blur,
                      size_t queueDepth = 8, double playbackDelaySec = 0.0);

    /** Runs until the source ends or @p cancel fires. */
    LiveVideoStats run(FrameSource& source, FrameSink& sink, const CancellationToken* cancel = nullptr);

private:
    IFaceDetector& detector;
    TrackingParams tracking;
    BlurParams blur;
    size_t queueDepth;
    double playbackDelaySec;
};
