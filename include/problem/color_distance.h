#pragma once

#include <cmath>
#include <stdexcept>
#include <vector>
#include <opencv2/core.hpp>

namespace problem {

/**
 * Euclidean distance between two color vectors of the same channel count
 *
 * Works for integer (RGB) and real (HSB) channels. The difference is taken
 * in floating point so unsigned channels do not wrap.
 */
template <typename T, int N>
float euclidean_distance(const cv::Vec<T, N>& a, const cv::Vec<T, N>& b) {
    static_assert(N >= 1, "color vectors need at least one channel");

    float sum_of_squares = 0.0f;
    for (int c = 0; c < N; ++c) {
        float diff = static_cast<float>(a[c]) - static_cast<float>(b[c]);
        sum_of_squares += diff * diff;
    }
    return std::sqrt(sum_of_squares);
}

/**
 * Euclidean distance for channel vectors whose length is only known at runtime
 * @throws std::invalid_argument if the vectors are empty or differ in length
 */
template <typename T>
float euclidean_distance(const std::vector<T>& a, const std::vector<T>& b) {
    if (a.empty() || a.size() != b.size()) {
        throw std::invalid_argument("euclidean_distance: vectors must be non-empty and of equal length");
    }

    float sum_of_squares = 0.0f;
    for (size_t c = 0; c < a.size(); ++c) {
        float diff = static_cast<float>(a[c]) - static_cast<float>(b[c]);
        sum_of_squares += diff * diff;
    }
    return std::sqrt(sum_of_squares);
}

} // namespace problem
