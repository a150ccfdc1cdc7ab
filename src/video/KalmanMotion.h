#pragma once
#include <opencv2/core.hpp>

/**
 * @brief Constant-velocity Kalman filter over (x, y, w, h, vx, vy, vw, vh).
 *
 * Every function is pure: it takes a state and returns the next one.
 */
struct KalmanParams {
    float processNoisePosition = 0.01f;
    float processNoiseVelocity = 1.0f;
    float measurementNoise = 0.05f;
    float initialVelocityVariance = 10.0f;
};

struct KalmanState {
    cv::Matx<float, 8, 1> x;
    cv::Matx<float, 8, 8> P;
};

namespace KalmanMotion {
    KalmanState init(const cv::Rect2f& box, const KalmanParams& params = KalmanParams());

    /** x(t) = x(t-1) + v(t-1) * dt, velocity held constant. */
    KalmanState predict(const KalmanState& state, float dt, const KalmanParams& params = KalmanParams());

    /** Folds a measured box into the state. */
    KalmanState correct(const KalmanState& state, const cv::Rect2f& measured,
                        const KalmanParams& params = KalmanParams());

    cv::Rect2f box(const KalmanState& state);
    cv::Vec4f velocity(const KalmanState& state);
}
