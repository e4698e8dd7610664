/**
 * @file SignalPrep.hpp
 * @brief Audio ingestion and cough-segment isolation
 *
 * Pipeline stages covered here:
 *   1. WAV loading (via dr_wav) at the native sample rate
 *   2. Down-mix to mono
 *   3. Cough segment extraction (amplitude onset + pre-roll)
 *
 * Không có resampling: tần số lấy mẫu gốc được truyền nguyên vẹn
 * đến giai đoạn trích xuất đặc trưng.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef SIGNAL_PREP_HPP
#define SIGNAL_PREP_HPP

#include "Common.h"

#include <vector>
#include <string>
#include <cstdint>
#include <cmath>

namespace cough {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Ngưỡng biên độ mặc định để phát hiện tiếng ho
constexpr float DEFAULT_AMPLITUDE_THRESHOLD = 0.05f;

/// Độ dài đoạn ho trích xuất (giây)
constexpr float DEFAULT_SEGMENT_DURATION_S = 1.0f;

/// Khoảng lấy trước điểm bắt đầu tiếng ho (giây)
constexpr float DEFAULT_PRE_ROLL_S = 0.5f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct AudioData
 * @brief Dữ liệu WAV thô (interleaved) và metadata
 */
struct AudioData {
    std::vector<float> samples;     ///< Mẫu interleaved (normalized float)
    uint32_t sampleRate;            ///< Tần số lấy mẫu gốc (Hz)
    uint16_t channels;              ///< Số kênh âm thanh
    uint64_t totalFrames;           ///< Số PCM frames

    AudioData() : sampleRate(0), channels(0), totalFrames(0) {}
};

/**
 * @struct SegmentConfig
 * @brief Cấu hình cho CoughSegmenter
 */
struct SegmentConfig {
    float amplitudeThreshold = DEFAULT_AMPLITUDE_THRESHOLD;
    float segmentDurationS = DEFAULT_SEGMENT_DURATION_S;
    float preRollS = DEFAULT_PRE_ROLL_S;

    SegmentConfig() = default;
};

/**
 * @struct CoughSegment
 * @brief Đoạn tín hiệu chứa tiếng ho đã được cắt
 */
struct CoughSegment {
    AudioSignal signal;             ///< Dữ liệu đoạn ho
    size_t startIndex;              ///< Vị trí bắt đầu trong tín hiệu gốc
    size_t endIndex;                ///< Vị trí kết thúc (exclusive)
    size_t onsetIndex;              ///< Mẫu đầu tiên vượt ngưỡng
    bool truncated;                 ///< Ngắn hơn thời lượng yêu cầu

    CoughSegment() : startIndex(0), endIndex(0), onsetIndex(0), truncated(false) {}

    size_t length() const { return endIndex - startIndex; }
};

// ============================================================================
// AUDIO LOADER
// ============================================================================

/**
 * @class AudioLoader
 * @brief Đọc file WAV thành AudioSignal mono
 *
 * Hỗ trợ các định dạng mà dr_wav hỗ trợ: 8/16/24/32-bit PCM, IEEE float.
 * Output luôn là float normalized [-1.0, 1.0].
 */
class AudioLoader {
public:
    /**
     * @brief Đọc file WAV
     * @param filePath Đường dẫn file WAV
     * @param verbose In metadata của file ra stdout
     * @return Tín hiệu mono tại tần số lấy mẫu gốc
     * @throws AudioLoadError nếu không mở/giải mã được
     */
    static AudioSignal loadWav(const std::string& filePath, bool verbose = true);

    /**
     * @brief Đọc WAV từ byte stream trong bộ nhớ
     * @throws AudioLoadError nếu không giải mã được
     */
    static AudioSignal loadWavMemory(const std::vector<uint8_t>& bytes, bool verbose = true);

    /**
     * @brief Chuyển đổi multi-channel interleaved sang mono
     *
     * mono[i] = (ch1[i] + ch2[i] + ... + chN[i]) / N
     */
    static std::vector<float> convertToMono(const std::vector<float>& input,
                                            uint16_t channels);

private:
    static AudioSignal toSignal(AudioData&& audioData, const std::string& source,
                                bool verbose);
};

// ============================================================================
// COUGH SEGMENTER
// ============================================================================

/**
 * @class CoughSegmenter
 * @brief Tách một đoạn cố định quanh tiếng ho đầu tiên
 *
 * Thuật toán:
 * 1. Tìm mẫu đầu tiên có |x| > amplitudeThreshold
 * 2. start = max(0, onset - preRoll * sampleRate)
 * 3. end = min(length, start + segmentDuration * sampleRate)
 *
 * Đoạn trả về có thể ngắn hơn segmentDuration nếu chạm cuối tín hiệu.
 */
class CoughSegmenter {
public:
    explicit CoughSegmenter(const SegmentConfig& config = SegmentConfig());

    /**
     * @brief Trích xuất đoạn ho
     * @throws NoActivityDetectedError nếu không có mẫu nào vượt ngưỡng
     * @throws InvalidParameterError nếu tín hiệu rỗng hoặc cấu hình sai
     */
    CoughSegment extract(const AudioSignal& signal) const;

    const SegmentConfig& getConfig() const { return m_config; }

    /**
     * @brief Chỉ số mẫu đầu tiên có |x| > threshold, hoặc -1
     */
    static long findOnset(const std::vector<float>& samples, float threshold);

private:
    static void validateConfig(const SegmentConfig& config);

    SegmentConfig m_config;
};

/**
 * @brief extract_segment(signal, sample_rate, amplitude_threshold, segment_duration_s, pre_roll_s)
 */
CoughSegment extractSegment(const AudioSignal& signal,
                            float amplitudeThreshold = DEFAULT_AMPLITUDE_THRESHOLD,
                            float segmentDurationS = DEFAULT_SEGMENT_DURATION_S,
                            float preRollS = DEFAULT_PRE_ROLL_S);

// ============================================================================
// INLINE UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Tính giá trị tuyệt đối tối đa trong vector
 */
inline float findMaxAbsValue(const std::vector<float>& samples) {
    float maxVal = 0.0f;
    for (const auto& s : samples) {
        float absVal = std::fabs(s);
        if (absVal > maxVal) {
            maxVal = absVal;
        }
    }
    return maxVal;
}

/**
 * @brief Root mean square của tín hiệu
 */
inline float computeRMS(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;

    double sumSquared = 0.0;
    for (const auto& s : samples) {
        sumSquared += static_cast<double>(s) * s;
    }
    return static_cast<float>(std::sqrt(sumSquared / samples.size()));
}

} // namespace cough

#endif // SIGNAL_PREP_HPP
