#include "video/KalmanMotion.h"
#include <algorithm>

namespace {

using Mat8 = cv::Matx<float, 8, 8>;
using Mat4 = cv::Matx<float, 4, 4>;
using Mat48 = cv::Matx<float, 4, 8>;

Mat8 transition(float dt) {
    Mat8 F = Mat8::eye();
    for (int i = 0; i < 4; ++i) F(i, i + 4) = dt;
    return F;
}

Mat8 processNoise(const KalmanParams& p) {
    Mat8 Q = Mat8::zeros();
    for (int i = 0; i < 4; ++i) {
        Q(i, i) = p.processNoisePosition;
        Q(i + 4, i + 4) = p.processNoiseVelocity;
    }
    return Q;
}

Mat48 measurementMatrix() {
    Mat48 H = Mat48::zeros();
    for (int i = 0; i < 4; ++i) H(i, i) = 1.0f;
    return H;
}

}

namespace KalmanMotion {

KalmanState init(const cv::Rect2f& box, const KalmanParams& params) {
    KalmanState s;
    s.x = cv::Matx<float, 8, 1>::zeros();
    s.x(0) = box.x;
    s.x(1) = box.y;
    s.x(2) = box.width;
    s.x(3) = box.height;
    s.P = Mat8::eye();
    for (int i = 4; i < 8; ++i) s.P(i, i) = params.initialVelocityVariance;
    return s;
}

KalmanState predict(const KalmanState& state, float dt, const KalmanParams& params) {
    const Mat8 F = transition(dt);
    KalmanState next;
    next.x = F * state.x;
    next.P = F * state.P * F.t() + processNoise(params);
    return next;
}

KalmanState correct(const KalmanState& state, const cv::Rect2f& measured, const KalmanParams& params) {
    const Mat48 H = measurementMatrix();
    const cv::Matx<float, 4, 1> z(measured.x, measured.y, measured.width, measured.height);
    const Mat4 R = Mat4::eye() * params.measurementNoise;

    const cv::Matx<float, 4, 1> innovation = z - H * state.x;
    const Mat4 S = H * state.P * H.t() + R;
    const cv::Matx<float, 8, 4> K = state.P * H.t() * S.inv(cv::DECOMP_CHOLESKY);

    KalmanState next;
    next.x = state.x + K * innovation;
    next.P = (Mat8::eye() - K * H) * state.P;
    return next;
}

cv::Rect2f box(const KalmanState& state) {
    return cv::Rect2f(state.x(0), state.x(1), std::max(1.0f, state.x(2)), std::max(1.0f, state.x(3)));
}

cv::Vec4f velocity(const KalmanState& state) {
    return cv::Vec4f(state.x(4), state.x(5), state.x(6), state.x(7));
}

}
