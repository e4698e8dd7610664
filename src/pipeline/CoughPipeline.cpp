/**
 * @file CoughPipeline.cpp
 * @brief Implementation of the end-to-end cough classification pipeline
 *
 * @author Research Team
 * @date 2026
 */

#include "CoughPipeline.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cough {

// ============================================================================
// PIPELINE RESULT
// ============================================================================

std::string PipelineResult::describe() const {
    std::ostringstream oss;
    oss << classification.describe() << "\n";
    oss << "  Preprocessed: " << (preprocessed ? "yes" : "no (short recording)")
        << ", segment [" << segmentStart << ", " << segmentStart + segmentLength << ")";
    if (segmentTruncated) {
        oss << " (truncated)";
    }
    oss << "\n  Mel frames: " << timeSteps;
    if (degenerateFeatures) {
        oss << " (constant spectrogram)";
    }
    oss << "\n  Total time: " << std::fixed << std::setprecision(2) << totalTimeMs << " ms";
    return oss.str();
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

CoughPipeline::CoughPipeline(const PipelineConfig& config,
                             std::shared_ptr<const InferenceBackend> backend)
    : m_config(config)
    , m_suppressor(config.noise)
    , m_segmenter(config.segment)
    , m_featurizer(config.mel)
    , m_engine(std::move(backend), config.classNames)
{
    if (config.minDurationForSegmentationS < 0.0f) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
            "minimum duration for segmentation must be non-negative");
    }
}

// ============================================================================
// STAGES
// ============================================================================

CoughSegment CoughPipeline::isolateCough(const AudioSignal& signal) const {
    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::LOADING, "input signal is empty");
    }
    if (signal.sampleRate == 0) {
        throw InvalidParameterError(ProcessingStage::LOADING, "sample rate must be positive");
    }

    // Bản ghi ngắn: dùng nguyên tín hiệu thô
    if (signal.durationSeconds() <= m_config.minDurationForSegmentationS) {
        if (m_config.verbose) {
            std::cout << "[CoughPipeline] Recording is " << signal.durationSeconds()
                      << " s, skipping noise suppression and segmentation" << std::endl;
        }

        CoughSegment whole;
        whole.signal = signal;
        whole.startIndex = 0;
        whole.endIndex = signal.size();
        whole.onsetIndex = 0;
        return whole;
    }

    // ----- BƯỚC 1: Giảm nhiễu -----
    if (m_config.verbose) {
        std::cout << "[CoughPipeline] Stage: " << stageToString(ProcessingStage::DENOISING)
                  << " (level " << m_config.noise.level << ")" << std::endl;
    }
    AudioSignal denoised = m_suppressor.process(signal);

    // ----- BƯỚC 2: Tách đoạn ho -----
    if (m_config.verbose) {
        std::cout << "[CoughPipeline] Stage: " << stageToString(ProcessingStage::SEGMENTING)
                  << " (threshold " << m_config.segment.amplitudeThreshold << ")" << std::endl;
    }
    CoughSegment segment = m_segmenter.extract(denoised);

    if (m_config.verbose) {
        std::cout << "[CoughSegmenter] Onset at sample " << segment.onsetIndex
                  << ", segment [" << segment.startIndex << ", " << segment.endIndex << ")"
                  << ", RMS " << computeRMS(segment.signal.samples) << std::endl;
    }

    return segment;
}

PipelineResult CoughPipeline::run(const AudioSignal& signal) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    PipelineResult result;

    // ----- BƯỚC 1 + 2: Giảm nhiễu và tách đoạn -----
    CoughSegment segment = isolateCough(signal);

    result.preprocessed = signal.durationSeconds() > m_config.minDurationForSegmentationS;
    result.segmentStart = segment.startIndex;
    result.segmentLength = segment.length();
    result.segmentTruncated = segment.truncated;

    // ----- BƯỚC 3: Mel-spectrogram -----
    if (m_config.verbose) {
        std::cout << "[CoughPipeline] Stage: " << stageToString(ProcessingStage::EXTRACTING)
                  << " (" << m_config.mel.nMels << " mels, hop "
                  << m_config.mel.hopLength << ")" << std::endl;
    }
    FeatureTensor features = m_featurizer.featurize(segment.signal);

    result.timeSteps = features.timeSteps;
    result.degenerateFeatures = features.degenerate;

    // ----- BƯỚC 4: Phân loại -----
    if (m_config.verbose) {
        std::cout << "[CoughPipeline] Stage: " << stageToString(ProcessingStage::CLASSIFYING)
                  << " (backend " << m_engine.getBackend().name() << ")" << std::endl;
    }
    result.classification = m_engine.classify(features);

    auto endTime = std::chrono::high_resolution_clock::now();
    result.totalTimeMs = std::chrono::duration<float, std::milli>(endTime - startTime).count();

    if (m_config.verbose) {
        std::cout << "[ClassificationEngine] " << result.classification.describe() << std::endl;
    }

    return result;
}

} // namespace cough
