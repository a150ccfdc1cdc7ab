#include "video/LiveVideoPipeline.h"
#include <cmath>
#include <deque>
#include <exception>
#include <thread>
#include "pipeline/BoundedQueue.h"
#include "utils/Logger.h"

LiveVideoPipeline::LiveVideoPipeline(IFaceDetector& detector, const TrackingParams& tracking, const BlurParams& blur,
                                     size_t queueDepth, double playbackDelaySec)
    : detector(detector), tracking(tracking), blur(blur), queueDepth(queueDepth), playbackDelaySec(playbackDelaySec) {}

LiveVideoStats LiveVideoPipeline::run(FrameSource& source, FrameSink& sink, const CancellationToken* cancel) {
    LiveVideoStats stats;
    BoundedQueue<cv::Mat> queue(queueDepth);
    std::exception_ptr producerError;

    std::thread producer([&] {
        try {
            cv::Mat frame;
            while (!(cancel && cancel->cancelled()) && source.read(frame)) {
                stats.framesRead++;
                if (!queue.push(frame.clone())) break;
            }
        } catch (...) {
            producerError = std::current_exception();
        }
        queue.stop();
    });

    const size_t delayFrames = static_cast<size_t>(std::lround(playbackDelaySec * source.fps()));
    FaceTrackingEngine engine(detector, tracking);
    std::deque<cv::Mat> playback;
    cv::Mat frame;
    try {
        while (queue.pop(frame)) {
            if (cancel && cancel->cancelled()) break;
            FrameResult observed = engine.process(frame);
            std::vector<cv::Rect> boxes;
            for (const auto& o : observed.faces) boxes.push_back(o.box);
            stats.regionsBlurred += static_cast<int>(FaceBlurrer::blurRegions(frame, boxes, blur).size());

            playback.push_back(frame);
            while (playback.size() > delayFrames) {
                sink.write(playback.front());
                playback.pop_front();
                stats.framesReleased++;
            }
        }
    } catch (...) {
        queue.stop();
        producer.join();
        throw;
    }
    queue.stop();
    producer.join();
    if (producerError) std::rethrow_exception(producerError);

    if (cancel && cancel->cancelled()) {
        Logger::getInstance().warn("Live video cancelled; " + std::to_string(playback.size()) + " buffered frames discarded");
    } else {
        while (!playback.empty()) {
            sink.write(playback.front());
            playback.pop_front();
            stats.framesReleased++;
        }
    }
    stats.tracking = engine.stats();
    return stats;
}
