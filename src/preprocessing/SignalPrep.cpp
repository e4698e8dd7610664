/**
 * @file SignalPrep.cpp
 * @brief Implementation of audio ingestion and cough segmentation
 *
 * Bao gồm:
 * - AudioLoader: đọc WAV (dr_wav), down-mix về mono
 * - CoughSegmenter: tách đoạn ho dựa trên ngưỡng biên độ
 *
 * @author Research Team
 * @date 2026
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "SignalPrep.hpp"

#include <algorithm>
#include <iostream>
#include <string>

// ----------------------------------------------------------------------------
// dr_wav - Single-header WAV file library
// Định nghĩa DR_WAV_IMPLEMENTATION chỉ trong một file .cpp
// ----------------------------------------------------------------------------
#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace cough {

namespace {

/**
 * @brief Đọc toàn bộ PCM frames từ một drwav đã init, rồi uninit
 */
AudioData readAllFrames(drwav& wav) {
    AudioData audioData;
    audioData.sampleRate = wav.sampleRate;
    audioData.channels = wav.channels;
    audioData.totalFrames = wav.totalPCMFrameCount;

    if (audioData.sampleRate == 0 || audioData.channels == 0 ||
        audioData.totalFrames == 0) {
        drwav_uninit(&wav);
        return audioData;
    }

    audioData.samples.resize(static_cast<size_t>(audioData.totalFrames) * audioData.channels);

    drwav_uint64 framesRead = drwav_read_pcm_frames_f32(&wav, audioData.totalFrames,
                                                        audioData.samples.data());

    if (framesRead != audioData.totalFrames) {
        std::cerr << "[AudioLoader] Warning: Read " << framesRead
                  << " frames, expected " << audioData.totalFrames << std::endl;
        audioData.samples.resize(static_cast<size_t>(framesRead) * audioData.channels);
        audioData.totalFrames = framesRead;
    }

    drwav_uninit(&wav);
    return audioData;
}

} // namespace

// ============================================================================
// AUDIO LOADER
// ============================================================================

AudioSignal AudioLoader::loadWav(const std::string& filePath, bool verbose) {
    /**
     * dr_wav tự động xử lý:
     * - Các định dạng bit depth khác nhau (8, 16, 24, 32-bit)
     * - PCM và IEEE float
     * - Endianness
     */

    drwav wav;

    if (!drwav_init_file(&wav, filePath.c_str(), nullptr)) {
        throw AudioLoadError("failed to open WAV file: " + filePath);
    }

    return toSignal(readAllFrames(wav), filePath, verbose);
}

AudioSignal AudioLoader::loadWavMemory(const std::vector<uint8_t>& bytes, bool verbose) {
    if (bytes.empty()) {
        throw AudioLoadError("empty WAV byte stream");
    }

    drwav wav;

    if (!drwav_init_memory(&wav, bytes.data(), bytes.size(), nullptr)) {
        throw AudioLoadError("failed to decode WAV byte stream");
    }

    return toSignal(readAllFrames(wav), "<memory>", verbose);
}

AudioSignal AudioLoader::toSignal(AudioData&& audioData, const std::string& source,
                                  bool verbose) {
    if (audioData.sampleRate == 0 || audioData.channels == 0 || audioData.samples.empty()) {
        throw AudioLoadError("invalid WAV parameters or no audio data in " + source);
    }

    if (verbose) {
        std::cout << "[AudioLoader] Loaded " << source << std::endl;
        std::cout << "  - Sample rate: " << audioData.sampleRate << " Hz" << std::endl;
        std::cout << "  - Channels: " << audioData.channels << std::endl;
        std::cout << "  - Total frames: " << audioData.totalFrames << std::endl;
    }

    AudioSignal signal;
    signal.sampleRate = audioData.sampleRate;

    if (audioData.channels > 1) {
        signal.samples = convertToMono(audioData.samples, audioData.channels);
    } else {
        signal.samples = std::move(audioData.samples);
    }

    return signal;
}

std::vector<float> AudioLoader::convertToMono(const std::vector<float>& input,
                                              uint16_t channels) {
    /**
     * Input được giả định là interleaved:
     * [L0, R0, L1, R1, L2, R2, ...]
     */

    if (channels <= 1) {
        return input;
    }

    size_t numFrames = input.size() / channels;
    std::vector<float> output(numFrames);

    float invChannels = 1.0f / channels;

    for (size_t i = 0; i < numFrames; ++i) {
        float sum = 0.0f;

        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += input[i * channels + ch];
        }

        output[i] = sum * invChannels;
    }

    return output;
}

// ============================================================================
// COUGH SEGMENTER
// ============================================================================

CoughSegmenter::CoughSegmenter(const SegmentConfig& config)
    : m_config(config)
{
    validateConfig(m_config);
}

void CoughSegmenter::validateConfig(const SegmentConfig& config) {
    if (!(config.amplitudeThreshold >= 0.0f)) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
            "amplitude threshold must be non-negative");
    }
    if (!(config.segmentDurationS > 0.0f)) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
            "segment duration must be positive");
    }
    if (!(config.preRollS >= 0.0f)) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
            "pre-roll must be non-negative");
    }
}

long CoughSegmenter::findOnset(const std::vector<float>& samples, float threshold) {
    for (size_t i = 0; i < samples.size(); ++i) {
        if (std::fabs(samples[i]) > threshold) {
            return static_cast<long>(i);
        }
    }
    return -1;
}

CoughSegment CoughSegmenter::extract(const AudioSignal& signal) const {
    /**
     * Phân đoạn tiếng ho dựa trên biên độ
     *
     * Thuật toán:
     * 1. Tìm mẫu đầu tiên vượt ngưỡng biên độ
     * 2. Lùi lại preRoll giây (không nhỏ hơn 0)
     * 3. Lấy segmentDuration giây kể từ đó (không vượt quá cuối tín hiệu)
     */

    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
                                    "cannot segment an empty signal");
    }
    if (signal.sampleRate == 0) {
        throw InvalidParameterError(ProcessingStage::SEGMENTING,
                                    "sample rate must be positive");
    }

    // ----- BƯỚC 1: Tìm onset -----
    long onset = findOnset(signal.samples, m_config.amplitudeThreshold);

    if (onset < 0) {
        throw NoActivityDetectedError(m_config.amplitudeThreshold,
                                      findMaxAbsValue(signal.samples));
    }

    // ----- BƯỚC 2: Tính biên đoạn -----
    const size_t preRoll = static_cast<size_t>(m_config.preRollS * signal.sampleRate);
    const size_t segmentLength = static_cast<size_t>(m_config.segmentDurationS * signal.sampleRate);
    const size_t onsetIdx = static_cast<size_t>(onset);

    CoughSegment segment;
    segment.onsetIndex = onsetIdx;
    segment.startIndex = onsetIdx > preRoll ? onsetIdx - preRoll : 0;
    segment.endIndex = std::min(signal.size(), segment.startIndex + segmentLength);
    segment.truncated = segment.length() < segmentLength;

    // ----- BƯỚC 3: Copy dữ liệu -----
    segment.signal.sampleRate = signal.sampleRate;
    segment.signal.samples.assign(signal.samples.begin() + segment.startIndex,
                                  signal.samples.begin() + segment.endIndex);

    if (segment.truncated) {
        std::cerr << "[CoughSegmenter] Warning: segment truncated to "
                  << segment.length() << " samples (requested " << segmentLength << ")"
                  << std::endl;
    }

    return segment;
}

CoughSegment extractSegment(const AudioSignal& signal,
                            float amplitudeThreshold,
                            float segmentDurationS,
                            float preRollS) {
    SegmentConfig config;
    config.amplitudeThreshold = amplitudeThreshold;
    config.segmentDurationS = segmentDurationS;
    config.preRollS = preRollS;

    CoughSegmenter segmenter(config);
    return segmenter.extract(signal);
}

} // namespace cough
