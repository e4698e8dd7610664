/**
 * @file FeatureExtraction.h
 * @brief Mel-spectrogram feature extraction for cough classification
 *
 * Quy trình trích xuất đặc trưng:
 * 1. Power spectrogram |STFT|^2 (cửa sổ 2048, centered framing)
 * 2. Mel filterbank tam giác (mặc định Slaney scale + Slaney area norm)
 * 3. Power -> dB với ref = max, amin = 1e-10, top_db = 80
 * 4. Min-max normalization về [low, high]
 * 5. Tensor shape (1, 1, nMels, timeSteps) cho CNN
 *
 * @author Research Team
 * @date 2026
 */

#ifndef FEATURE_EXTRACTION_H
#define FEATURE_EXTRACTION_H

#include "Common.h"
#include "SpectralTransform.hpp"

#include <vector>
#include <cstdint>
#include <array>
#include <string>

namespace cough {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số lượng Mel bands (chiều cao input của CNN)
constexpr int DEFAULT_NUM_MELS = 128;

/// Giá trị nhỏ nhất trước khi lấy log
constexpr float POWER_TO_DB_AMIN = 1e-10f;

/// Dải động tối đa (dB) dưới đỉnh
constexpr float DEFAULT_TOP_DB = 80.0f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @enum DegeneratePolicy
 * @brief Cách xử lý khi spectrogram hằng (max(db) == min(db))
 */
enum class DegeneratePolicy {
    MIDPOINT = 0,     ///< Điền (low + high) / 2 và bật cờ degenerate
    THROW = 1         ///< Ném DegenerateNormalizationError
};

/**
 * @struct MelConfig
 * @brief Cấu hình cho MelFeaturizer
 */
struct MelConfig {
    int nMels = DEFAULT_NUM_MELS;
    int hopLength = DEFAULT_HOP_LENGTH;
    int windowSize = DEFAULT_WINDOW_SIZE;
    float fMin = 0.0f;                  ///< Tần số thấp nhất (Hz)
    float fMax = 0.0f;                  ///< Tần số cao nhất (Hz), 0 = sampleRate / 2
    bool htk = false;                   ///< HTK mel scale thay vì Slaney
    float topDb = DEFAULT_TOP_DB;       ///< <= 0 tắt giới hạn dải động
    float normLow = 0.0f;
    float normHigh = 1.0f;
    DegeneratePolicy degeneratePolicy = DegeneratePolicy::MIDPOINT;

    MelConfig() = default;
};

/**
 * @struct FeatureTensor
 * @brief Mel-spectrogram đã chuẩn hóa, nMels x timeSteps
 *
 * Lưu row-major theo mel band: data[mel * timeSteps + t], trùng với
 * layout NCHW của tensor (1, 1, nMels, timeSteps).
 */
struct FeatureTensor {
    std::vector<float> data;
    int nMels;
    int timeSteps;
    bool degenerate;        ///< Đã dùng giá trị midpoint thay cho normalization

    FeatureTensor() : nMels(0), timeSteps(0), degenerate(false) {}

    float& at(int mel, int t) { return data[static_cast<size_t>(mel) * timeSteps + t]; }
    float at(int mel, int t) const { return data[static_cast<size_t>(mel) * timeSteps + t]; }

    /**
     * @brief Shape 4-D cho inference: (batch, channel, height, width)
     */
    std::array<int64_t, 4> shape() const {
        return {1, 1, static_cast<int64_t>(nMels), static_cast<int64_t>(timeSteps)};
    }

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
};

/**
 * @struct MelFilterbank
 * @brief Ma trận filter nMels x numBins, kèm vùng khác 0 của mỗi filter
 */
struct MelFilterbank {
    std::vector<std::vector<float>> weights;    ///< [mel][bin]
    std::vector<int> startBin;                  ///< Bin đầu tiên khác 0
    std::vector<int> endBin;                    ///< Bin cuối cùng khác 0 (exclusive)
    uint32_t sampleRate = 0;
    int windowSize = 0;
};

// ============================================================================
// MAIN CLASS
// ============================================================================

/**
 * @class MelFeaturizer
 * @brief Chuyển tín hiệu thành mel-spectrogram chuẩn hóa
 *
 * Filterbank phụ thuộc sample rate của tín hiệu nên được dựng cho mỗi
 * lần gọi. Instance không giữ trạng thái thay đổi, featurize() có thể gọi
 * đồng thời từ nhiều thread.
 */
class MelFeaturizer {
public:
    /**
     * @brief Constructor
     * @throws InvalidParameterError nếu cấu hình sai
     */
    explicit MelFeaturizer(const MelConfig& config = MelConfig());

    // ========================================================================
    // MAIN EXTRACTION METHODS
    // ========================================================================

    /**
     * @brief Trích xuất mel-spectrogram chuẩn hóa
     *
     * @param signal Tín hiệu mono (không rỗng, sampleRate > 0)
     * @return FeatureTensor nMels x timeSteps, giá trị trong [normLow, normHigh]
     * @throws InvalidParameterError nếu tín hiệu rỗng hoặc sampleRate = 0
     * @throws DegenerateNormalizationError nếu policy = THROW và spectrogram hằng
     */
    FeatureTensor featurize(const AudioSignal& signal) const;

    /**
     * @brief Mel power spectrogram (chưa chuyển dB), nMels x frames
     */
    std::vector<float> melPowerSpectrogram(const AudioSignal& signal, int& numFrames) const;

    // ========================================================================
    // DSP HELPER METHODS
    // ========================================================================

    /**
     * @brief Dựng mel filterbank tam giác
     *
     * Trọng số của filter m tại tần số f (Hz):
     *   lower = (f - f[m]) / (f[m+1] - f[m])
     *   upper = (f[m+2] - f) / (f[m+2] - f[m+1])
     *   w = max(0, min(lower, upper))
     * Với Slaney norm, mỗi filter nhân thêm 2 / (f[m+2] - f[m]).
     */
    static MelFilterbank buildFilterbank(uint32_t sampleRate, int windowSize, int nMels,
                                         float fMin, float fMax, bool htk);

    /**
     * @brief 10*log10(max(amin, P)) - 10*log10(max(amin, max(P))), sau đó
     *        kẹp dưới tại max(db) - topDb (nếu topDb > 0)
     */
    static void powerToDb(std::vector<float>& values, float amin = POWER_TO_DB_AMIN,
                          float topDb = DEFAULT_TOP_DB);

    /**
     * @brief Min-max normalization in-place về [low, high]
     * @return true nếu spectrogram hằng và đã dùng fallback midpoint
     * @throws DegenerateNormalizationError nếu hằng và policy = THROW
     */
    static bool normalize(std::vector<float>& values, float low, float high,
                          DegeneratePolicy policy = DegeneratePolicy::MIDPOINT);

    // ========================================================================
    // UTILITY METHODS
    // ========================================================================

    /**
     * @brief Hz -> Mel
     *
     * HTK:    m = 2595 * log10(1 + f/700)
     * Slaney: tuyến tính dưới 1 kHz (f / (200/3)), logarit phía trên
     */
    static double hzToMel(double freq, bool htk = false);

    /**
     * @brief Mel -> Hz (nghịch đảo của hzToMel)
     */
    static double melToHz(double mel, bool htk = false);

    const MelConfig& getConfig() const { return m_config; }

private:
    static void validateConfig(const MelConfig& config);

    MelConfig m_config;
    SpectralTransform m_transform;
};

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

/**
 * @brief featurize(signal, sample_rate, n_mels, hop_length, norm_range)
 */
FeatureTensor featurize(const AudioSignal& signal,
                        int nMels = DEFAULT_NUM_MELS,
                        int hopLength = DEFAULT_HOP_LENGTH,
                        float normLow = 0.0f,
                        float normHigh = 1.0f);

} // namespace cough

#endif // FEATURE_EXTRACTION_H
