/**
 * @file Common.h
 * @brief Common definitions and types for the Cough Classification pipeline
 *
 * Chứa các định nghĩa chung, types, constants và các loại lỗi được sử dụng
 * xuyên suốt dự án.
 */

#ifndef COMMON_H
#define COMMON_H

#include <cstdint>
#include <vector>
#include <string>
#include <cmath>
#include <stdexcept>

namespace cough {

// ============================================================================
// TYPE DEFINITIONS
// ============================================================================

/// Kiểu dữ liệu cho accumulator (precision cao hơn cho tính toán)
using AccumType = double;

// ============================================================================
// CONSTANTS
// ============================================================================

/// Pi constant
constexpr double PI = 3.14159265358979323846;

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum ProcessingStage
 * @brief Các giai đoạn xử lý trong pipeline
 */
enum class ProcessingStage {
    LOADING = 0,          ///< Đang tải file
    TRANSFORMING = 1,     ///< STFT / ISTFT
    DENOISING = 2,        ///< Spectral gating
    SEGMENTING = 3,       ///< Tách đoạn ho
    EXTRACTING = 4,       ///< Trích xuất mel-spectrogram
    CLASSIFYING = 5,      ///< Phân loại
    REPORTING = 6,        ///< Ghi kết quả
    COMPLETE = 7          ///< Hoàn thành
};

/**
 * @brief Chuyển đổi ProcessingStage sang string
 */
inline std::string stageToString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::LOADING: return "Loading";
        case ProcessingStage::TRANSFORMING: return "Spectral Transform";
        case ProcessingStage::DENOISING: return "Noise Suppression";
        case ProcessingStage::SEGMENTING: return "Segmenting";
        case ProcessingStage::EXTRACTING: return "Feature Extraction";
        case ProcessingStage::CLASSIFYING: return "Classification";
        case ProcessingStage::REPORTING: return "Reporting";
        case ProcessingStage::COMPLETE: return "Complete";
        default: return "Unknown Stage";
    }
}

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct AudioSignal
 * @brief Tín hiệu âm thanh mono kèm tần số lấy mẫu gốc
 *
 * Tần số lấy mẫu luôn được giữ nguyên từ lúc đọc file đến lúc
 * trích xuất đặc trưng (pipeline không resample).
 */
struct AudioSignal {
    std::vector<float> samples;     ///< Mảng mẫu tín hiệu
    uint32_t sampleRate;            ///< Tần số lấy mẫu (Hz)

    AudioSignal() : sampleRate(0) {}
    AudioSignal(std::vector<float> s, uint32_t rate)
        : samples(std::move(s)), sampleRate(rate) {}

    /**
     * @brief Thời lượng tín hiệu (giây)
     */
    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) / sampleRate : 0.0;
    }

    bool empty() const { return samples.empty(); }
    size_t size() const { return samples.size(); }
};

// ============================================================================
// ERROR TYPES
// ============================================================================

/**
 * @class PipelineError
 * @brief Lỗi gốc của pipeline, ghi nhận giai đoạn phát sinh lỗi
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ProcessingStage stage, const std::string& message)
        : std::runtime_error("[" + stageToString(stage) + "] " + message)
        , m_stage(stage) {}

    ProcessingStage stage() const { return m_stage; }

private:
    ProcessingStage m_stage;
};

/// Tham số không hợp lệ (window/hop, ngưỡng, tín hiệu rỗng...)
class InvalidParameterError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/**
 * @class NoActivityDetectedError
 * @brief Không có mẫu nào vượt ngưỡng biên độ
 */
class NoActivityDetectedError : public PipelineError {
public:
    NoActivityDetectedError(float threshold, float peakAmplitude)
        : PipelineError(ProcessingStage::SEGMENTING,
                        "No cough detected: peak amplitude " + std::to_string(peakAmplitude) +
                        " does not exceed threshold " + std::to_string(threshold))
        , m_threshold(threshold)
        , m_peakAmplitude(peakAmplitude) {}

    float threshold() const { return m_threshold; }
    float peakAmplitude() const { return m_peakAmplitude; }

private:
    float m_threshold;
    float m_peakAmplitude;
};

/// Spectrogram hằng (ví dụ tín hiệu im lặng), chỉ khi policy = THROW
class DegenerateNormalizationError : public PipelineError {
public:
    explicit DegenerateNormalizationError(const std::string& message)
        : PipelineError(ProcessingStage::EXTRACTING, message) {}
};

/// Shape của tensor không khớp với model (lỗi cấu hình, không phục hồi)
class ModelShapeError : public PipelineError {
public:
    explicit ModelShapeError(const std::string& message)
        : PipelineError(ProcessingStage::CLASSIFYING, message) {}
};

/// Không load được model
class ModelLoadError : public PipelineError {
public:
    explicit ModelLoadError(const std::string& message)
        : PipelineError(ProcessingStage::LOADING, message) {}
};

/// Không đọc/giải mã được file âm thanh
class AudioLoadError : public PipelineError {
public:
    explicit AudioLoadError(const std::string& message)
        : PipelineError(ProcessingStage::LOADING, message) {}
};

} // namespace cough

#endif // COMMON_H
