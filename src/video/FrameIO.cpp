#include "video/FrameIO.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

VideoFileSource::VideoFileSource(const std::string& source) : source(source) {
    open();
}

void VideoFileSource::open() {
    bool isDevice = !source.empty() &&
                    std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c); });
    if (isDevice) {
        cap.open(std::stoi(source));
    } else {
        cap.open(source);
    }
    if (!cap.isOpened()) {
        throw std::runtime_error("Cannot open video source: " + source);
    }
}

bool VideoFileSource::read(cv::Mat& frame) {
    return cap.read(frame) && !frame.empty();
}

double VideoFileSource::fps() const {
    double f = cap.get(cv::CAP_PROP_FPS);
    return f > 0.0 ? f : 30.0;
}

cv::Size VideoFileSource::frameSize() const {
    return cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                    static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
}

void VideoFileSource::rewind() {
    if (!cap.set(cv::CAP_PROP_POS_FRAMES, 0)) {
        cap.release();
        open();
    }
}

VideoFileSink::VideoFileSink(const std::string& path, double fps, const cv::Size& size) {
    writer.open(path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), fps, size);
    if (!writer.isOpened()) {
        throw std::runtime_error("Cannot open video writer: " + path);
    }
}

void VideoFileSink::write(const cv::Mat& frame) {
    writer.write(frame);
}
