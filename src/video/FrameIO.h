#pragma once
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

/**
 * @brief Sequential frame input. rewind() restarts from the first frame,
 * which the offline two-pass flow relies on.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool read(cv::Mat& frame) = 0;
    virtual double fps() const = 0;
    virtual cv::Size frameSize() const = 0;
    virtual void rewind() = 0;
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void write(const cv::Mat& frame) = 0;
};

/** File or device capture. A numeric source ("0") opens a camera. */
class VideoFileSource : public FrameSource {
public:
    /** @throws std::runtime_error when the source cannot be opened */
    explicit VideoFileSource(const std::string& source);
    bool read(cv::Mat& frame) override;
    double fps() const override;
    cv::Size frameSize() const override;
    void rewind() override;

private:
    std::string source;
    cv::VideoCapture cap;
    void open();
};

/** mp4v-encoded output file. */
class VideoFileSink : public FrameSink {
public:
    /** @throws std::runtime_error when the writer cannot be opened */
    VideoFileSink(const std::string& path, double fps, const cv::Size& size);
    void write(const cv::Mat& frame) override;

private:
    cv::VideoWriter writer;
};
