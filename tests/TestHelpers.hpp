/**
 * @file TestHelpers.hpp
 * @brief Shared signal generators and checks for the unit tests
 */

#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "Common.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

namespace cough {
namespace test {

/**
 * @brief Tạo tín hiệu sine để test
 */
inline std::vector<float> generateSineWave(float frequency, float sampleRate,
                                           float duration, float amplitude = 1.0f,
                                           float phase = 0.0f) {
    size_t numSamples = static_cast<size_t>(sampleRate * duration);
    std::vector<float> signal(numSamples);

    for (size_t i = 0; i < numSamples; ++i) {
        double t = static_cast<double>(i) / sampleRate;
        signal[i] = amplitude * static_cast<float>(std::sin(2.0 * PI * frequency * t + phase));
    }

    return signal;
}

/**
 * @brief Tạo tín hiệu nhiễu Gaussian (seed cố định để test lặp lại được)
 */
inline std::vector<float> generateNoise(size_t numSamples, float amplitude = 0.1f,
                                        uint32_t seed = 42) {
    std::vector<float> noise(numSamples);
    std::mt19937 gen(seed);
    std::normal_distribution<float> dist(0.0f, amplitude);

    for (size_t i = 0; i < numSamples; ++i) {
        noise[i] = dist(gen);
    }

    return noise;
}

/**
 * @brief RMS của đoạn [begin, end)
 */
inline float rmsOf(const std::vector<float>& signal, size_t begin, size_t end) {
    if (end <= begin || end > signal.size()) return 0.0f;

    double sumSquared = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sumSquared += static_cast<double>(signal[i]) * signal[i];
    }
    return static_cast<float>(std::sqrt(sumSquared / (end - begin)));
}

/**
 * @brief Kiểm tra xem giá trị có nằm trong khoảng không
 */
inline bool isInRange(float value, float min, float max) {
    return value >= min && value <= max;
}

inline const char* passFail(bool ok) {
    return ok ? "PASS" : "FAIL";
}

} // namespace test
} // namespace cough

#endif // TEST_HELPERS_HPP
