/**
 * @file CoughPipeline.h
 * @brief End-to-end cough classification pipeline
 *
 * Điều phối các giai đoạn cho một request:
 *
 *   AudioSignal
 *     -> (duration > 1 s) NoiseSuppressor -> CoughSegmenter
 *     -> MelFeaturizer
 *     -> ClassificationEngine
 *     -> ClassificationResult
 *
 * Bản ghi ngắn (<= minDurationForSegmentationS) được featurize trực tiếp,
 * bỏ qua giảm nhiễu và tách đoạn. Các giai đoạn chạy tuần tự; mỗi giai
 * đoạn trả về giá trị mới, không giữ tham chiếu tới input.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef COUGH_PIPELINE_H
#define COUGH_PIPELINE_H

#include "Common.h"
#include "NoiseSuppressor.hpp"
#include "SignalPrep.hpp"
#include "FeatureExtraction.h"
#include "CnnInference.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cough {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Bản ghi dài hơn ngưỡng này mới qua giảm nhiễu + tách đoạn (giây)
constexpr float DEFAULT_MIN_DURATION_FOR_SEGMENTATION_S = 1.0f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct PipelineConfig
 * @brief Cấu hình toàn bộ pipeline
 */
struct PipelineConfig {
    NoiseConfig noise;
    SegmentConfig segment;
    MelConfig mel;

    std::vector<std::string> classNames = defaultClassNames();

    float minDurationForSegmentationS = DEFAULT_MIN_DURATION_FOR_SEGMENTATION_S;
    bool verbose = true;                ///< In progress từng giai đoạn

    PipelineConfig() = default;
};

/**
 * @struct PipelineResult
 * @brief Kết quả của một request cùng thông tin chẩn đoán các giai đoạn
 */
struct PipelineResult {
    ClassificationResult classification;

    bool preprocessed;              ///< Đã qua giảm nhiễu + tách đoạn
    size_t segmentStart;            ///< Vị trí đoạn ho trong bản ghi (mẫu)
    size_t segmentLength;           ///< Độ dài đoạn đưa vào featurizer (mẫu)
    bool segmentTruncated;
    int timeSteps;                  ///< Số frame của mel-spectrogram
    bool degenerateFeatures;        ///< Normalization dùng fallback midpoint
    float totalTimeMs;

    PipelineResult()
        : preprocessed(false), segmentStart(0), segmentLength(0)
        , segmentTruncated(false), timeSteps(0), degenerateFeatures(false)
        , totalTimeMs(0.0f) {}

    std::string describe() const;
};

// ============================================================================
// PIPELINE CLASS
// ============================================================================

/**
 * @class CoughPipeline
 * @brief Chạy toàn bộ chuỗi xử lý trên một AudioSignal
 *
 * Backend là đối tượng chia sẻ duy nhất; run() là const nên một pipeline
 * có thể phục vụ nhiều request đồng thời.
 */
class CoughPipeline {
public:
    /**
     * @throws InvalidParameterError nếu cấu hình sai hoặc backend null
     */
    CoughPipeline(const PipelineConfig& config,
                  std::shared_ptr<const InferenceBackend> backend);

    /**
     * @brief Phân loại một bản ghi
     *
     * @throws InvalidParameterError tín hiệu rỗng / sampleRate = 0
     * @throws NoActivityDetectedError không có tiếng ho (không featurize)
     * @throws DegenerateNormalizationError nếu policy = THROW
     * @throws ModelShapeError shape không khớp model
     */
    PipelineResult run(const AudioSignal& signal) const;

    /**
     * @brief Giảm nhiễu + tách đoạn nếu bản ghi đủ dài, ngược lại trả về nguyên bản
     */
    CoughSegment isolateCough(const AudioSignal& signal) const;

    const PipelineConfig& getConfig() const { return m_config; }

private:
    PipelineConfig m_config;
    NoiseSuppressor m_suppressor;
    CoughSegmenter m_segmenter;
    MelFeaturizer m_featurizer;
    ClassificationEngine m_engine;
};

} // namespace cough

#endif // COUGH_PIPELINE_H
