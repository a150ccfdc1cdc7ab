#include "video/ContrastEnhancer.h"
#include <vector>
#include <opencv2/imgproc.hpp>

ContrastEnhancer::ContrastEnhancer(const ContrastParams& params) : params(params) {}

bool ContrastEnhancer::isGrayscale(const cv::Mat& frame) {
    if (frame.channels() == 1) return true;
    if (frame.channels() != 3) return false;

    std::vector<cv::Mat> ch;
    cv::split(frame, ch);
    cv::Mat d1, d2;
    cv::absdiff(ch[0], ch[1], d1);
    cv::absdiff(ch[1], ch[2], d2);
    return cv::mean(d1)[0] < 2.0 && cv::mean(d2)[0] < 2.0;
}

bool ContrastEnhancer::isLowContrast(const cv::Mat& frame) const {
    cv::Mat gray;
    if (frame.channels() == 3) {
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame;
    }
    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    return stddev[0] < params.lowContrastStdDev;
}

cv::Mat ContrastEnhancer::enhance(const cv::Mat& frame) const {
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(params.clipLimit, cv::Size(params.tileSize, params.tileSize));

    cv::Mat equalized;
    if (frame.channels() == 1) {
        cv::Mat gray;
        clahe->apply(frame, gray);
        cv::cvtColor(gray, equalized, cv::COLOR_GRAY2BGR);
    } else {
        cv::Mat lab;
        cv::cvtColor(frame, lab, cv::COLOR_BGR2Lab);
        std::vector<cv::Mat> planes;
        cv::split(lab, planes);
        clahe->apply(planes[0], planes[0]);
        cv::merge(planes, lab);
        cv::cvtColor(lab, equalized, cv::COLOR_Lab2BGR);
    }

    cv::Mat blurred, sharpened;
    cv::GaussianBlur(equalized, blurred, cv::Size(0, 0), 3.0);
    cv::addWeighted(equalized, 1.5, blurred, -0.5, 0, sharpened);
    return sharpened;
}

cv::Mat ContrastEnhancer::prepare(const cv::Mat& frame) const {
    if (needsEnhancement(frame)) return enhance(frame);
    return frame;
}
