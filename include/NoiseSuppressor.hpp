/**
 * @file NoiseSuppressor.hpp
 * @brief Spectral gating noise reduction
 *
 * Ước lượng phổ công suất nhiễu dừng từ đoạn đầu của bản ghi, sau đó trừ
 * ngưỡng nhiễu khỏi magnitude của từng bin thời gian-tần số và tái tạo
 * tín hiệu bằng ISTFT với pha gốc.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef NOISE_SUPPRESSOR_HPP
#define NOISE_SUPPRESSOR_HPP

#include "Common.h"
#include "SpectralTransform.hpp"

#include <vector>

namespace cough {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Độ dài đoạn tham chiếu nhiễu (giây)
constexpr float DEFAULT_REFERENCE_DURATION_S = 0.5f;

/// Hệ số giảm nhiễu (càng lớn càng giảm mạnh)
constexpr float DEFAULT_NOISE_REDUCTION_LEVEL = 1.5f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct NoiseConfig
 * @brief Cấu hình cho NoiseSuppressor
 */
struct NoiseConfig {
    float referenceDurationS = DEFAULT_REFERENCE_DURATION_S;
    float level = DEFAULT_NOISE_REDUCTION_LEVEL;
    StftConfig stft;

    NoiseConfig() = default;
};

/**
 * @class NoiseProfile
 * @brief Công suất nhiễu trung bình theo từng frequency bin
 *
 * Bất biến sau khi tạo.
 */
class NoiseProfile {
public:
    NoiseProfile(std::vector<float> binPower, int windowSize, int hopLength,
                 size_t referenceSamples)
        : m_binPower(std::move(binPower))
        , m_windowSize(windowSize)
        , m_hopLength(hopLength)
        , m_referenceSamples(referenceSamples) {}

    const std::vector<float>& binPower() const { return m_binPower; }
    float operator[](size_t bin) const { return m_binPower[bin]; }
    size_t numBins() const { return m_binPower.size(); }
    int windowSize() const { return m_windowSize; }
    int hopLength() const { return m_hopLength; }

    /// Số mẫu đã dùng làm tham chiếu
    size_t referenceSamples() const { return m_referenceSamples; }

private:
    std::vector<float> m_binPower;
    int m_windowSize;
    int m_hopLength;
    size_t m_referenceSamples;
};

// ============================================================================
// NOISE SUPPRESSOR CLASS
// ============================================================================

/**
 * @class NoiseSuppressor
 * @brief Spectral gating: mag' = max(mag - level * noise[bin], 0)
 */
class NoiseSuppressor {
public:
    explicit NoiseSuppressor(const NoiseConfig& config = NoiseConfig());

    /**
     * @brief Ước lượng nhiễu từ referenceDurationS giây đầu tiên
     *
     * Nếu tín hiệu ngắn hơn đoạn tham chiếu, toàn bộ tín hiệu được dùng
     * (trường hợp suy biến: gần như toàn bộ năng lượng sẽ bị loại bỏ).
     */
    NoiseProfile estimateNoise(const AudioSignal& signal) const;

    /**
     * @brief Giảm nhiễu toàn bộ tín hiệu với profile cho trước
     * @return Tín hiệu đã giảm nhiễu, cùng độ dài và sample rate
     */
    AudioSignal suppress(const AudioSignal& signal, const NoiseProfile& profile) const;

    /**
     * @brief estimateNoise + suppress
     */
    AudioSignal process(const AudioSignal& signal) const;

    /**
     * @brief Áp dụng spectral gating lên phổ (giữ nguyên pha)
     */
    static SpectrumFrame gate(const SpectrumFrame& spectrum,
                              const NoiseProfile& profile,
                              float level);

    const NoiseConfig& getConfig() const { return m_config; }

private:
    NoiseConfig m_config;
    SpectralTransform m_transform;
};

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

/**
 * @brief estimate_noise(signal, sample_rate, reference_duration_s)
 */
NoiseProfile estimateNoise(const AudioSignal& signal,
                           float referenceDurationS = DEFAULT_REFERENCE_DURATION_S);

/**
 * @brief suppress(signal, profile, level)
 */
AudioSignal suppress(const AudioSignal& signal, const NoiseProfile& profile,
                     float level = DEFAULT_NOISE_REDUCTION_LEVEL);

} // namespace cough

#endif // NOISE_SUPPRESSOR_HPP
