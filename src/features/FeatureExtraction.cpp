/**
 * @file FeatureExtraction.cpp
 * @brief Implementation of mel-spectrogram feature extraction
 *
 * Triển khai chi tiết MelFeaturizer: filterbank, power -> dB và
 * min-max normalization. Các hằng số mel scale khớp với librosa
 * để model đã huấn luyện nhận được cùng phân bố đầu vào.
 *
 * @author Research Team
 * @date 2026
 */

#include "FeatureExtraction.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>

namespace cough {

// ============================================================================
// CONSTANTS - Slaney mel scale
// ============================================================================

namespace {

constexpr double SLANEY_F_SP = 200.0 / 3.0;            ///< Hz / mel trong vùng tuyến tính
constexpr double SLANEY_MIN_LOG_HZ = 1000.0;           ///< Điểm chuyển sang vùng log
constexpr double SLANEY_MIN_LOG_MEL = SLANEY_MIN_LOG_HZ / SLANEY_F_SP;  // 15

double slaneyLogStep() {
    static const double logStep = std::log(6.4) / 27.0;
    return logStep;
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

MelFeaturizer::MelFeaturizer(const MelConfig& config)
    : m_config(config)
    , m_transform(config.windowSize)
{
    validateConfig(m_config);
}

void MelFeaturizer::validateConfig(const MelConfig& config) {
    if (config.nMels <= 0) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
            "number of mel bands must be positive, got " + std::to_string(config.nMels));
    }
    if (config.hopLength <= 0) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
            "hop length must be positive, got " + std::to_string(config.hopLength));
    }
    SpectralTransform::validateParameters(config.windowSize, config.hopLength);

    if (!(config.normLow < config.normHigh)) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
            "normalization range requires low < high");
    }
    if (config.fMin < 0.0f || (config.fMax > 0.0f && config.fMax <= config.fMin)) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
            "invalid mel frequency range");
    }
}

// ============================================================================
// MEL SCALE CONVERSION
// ============================================================================

double MelFeaturizer::hzToMel(double freq, bool htk) {
    if (htk) {
        return 2595.0 * std::log10(1.0 + freq / 700.0);
    }

    // Vùng tuyến tính
    double mel = freq / SLANEY_F_SP;

    // Vùng logarit
    if (freq >= SLANEY_MIN_LOG_HZ) {
        mel = SLANEY_MIN_LOG_MEL + std::log(freq / SLANEY_MIN_LOG_HZ) / slaneyLogStep();
    }
    return mel;
}

double MelFeaturizer::melToHz(double mel, bool htk) {
    if (htk) {
        return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0);
    }

    double freq = SLANEY_F_SP * mel;

    if (mel >= SLANEY_MIN_LOG_MEL) {
        freq = SLANEY_MIN_LOG_HZ * std::exp(slaneyLogStep() * (mel - SLANEY_MIN_LOG_MEL));
    }
    return freq;
}

// ============================================================================
// FILTERBANK
// ============================================================================

MelFilterbank MelFeaturizer::buildFilterbank(uint32_t sampleRate, int windowSize, int nMels,
                                             float fMin, float fMax, bool htk) {
    /**
     * Khởi tạo Mel Filterbank
     *
     * 1. Chuyển đổi fMin/fMax sang Mel scale
     * 2. Tạo nMels + 2 điểm đều trên Mel scale
     * 3. Chuyển ngược về Hz
     * 4. Tính trọng số tam giác trên tần số của từng FFT bin
     * 5. Slaney norm (diện tích mỗi filter xấp xỉ bằng nhau)
     */

    if (sampleRate == 0 || windowSize <= 0 || nMels <= 0) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
                                    "invalid filterbank parameters");
    }

    const double highFreq = fMax > 0.0f ? fMax : sampleRate / 2.0;
    if (!(highFreq > fMin)) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
            "mel upper frequency " + std::to_string(highFreq) +
            " Hz must exceed lower frequency " + std::to_string(fMin) + " Hz");
    }

    const int numBins = windowSize / 2 + 1;

    // ----- BƯỚC 1 + 2 + 3: Các điểm mel -----
    const double melLow = hzToMel(fMin, htk);
    const double melHigh = hzToMel(highFreq, htk);

    std::vector<double> hzPoints(nMels + 2);
    for (int i = 0; i < nMels + 2; ++i) {
        double mel = melLow + i * (melHigh - melLow) / (nMels + 1);
        hzPoints[i] = melToHz(mel, htk);
    }

    // Tần số trung tâm của từng FFT bin
    std::vector<double> binFreqs(numBins);
    for (int k = 0; k < numBins; ++k) {
        binFreqs[k] = static_cast<double>(k) * sampleRate / windowSize;
    }

    MelFilterbank bank;
    bank.sampleRate = sampleRate;
    bank.windowSize = windowSize;
    bank.weights.assign(nMels, std::vector<float>(numBins, 0.0f));
    bank.startBin.assign(nMels, numBins);
    bank.endBin.assign(nMels, 0);

    // ----- BƯỚC 4 + 5: Trọng số -----
    int emptyFilters = 0;

    for (int m = 0; m < nMels; ++m) {
        const double left = hzPoints[m];
        const double center = hzPoints[m + 1];
        const double right = hzPoints[m + 2];

        const double enorm = 2.0 / (right - left);

        for (int k = 0; k < numBins; ++k) {
            double lower = (binFreqs[k] - left) / (center - left);
            double upper = (right - binFreqs[k]) / (right - center);
            double w = std::max(0.0, std::min(lower, upper));

            if (w > 0.0) {
                bank.weights[m][k] = static_cast<float>(htk ? w : w * enorm);
                bank.startBin[m] = std::min(bank.startBin[m], k);
                bank.endBin[m] = std::max(bank.endBin[m], k + 1);
            }
        }

        if (bank.endBin[m] == 0) {
            bank.startBin[m] = 0;
            ++emptyFilters;
        }
    }

    if (emptyFilters > 0) {
        std::cerr << "[MelFeaturizer] Warning: " << emptyFilters << " of " << nMels
                  << " mel filters are empty (too many mel bands for window "
                  << windowSize << " at " << sampleRate << " Hz)" << std::endl;
    }

    return bank;
}

// ============================================================================
// MEL POWER SPECTROGRAM
// ============================================================================

std::vector<float> MelFeaturizer::melPowerSpectrogram(const AudioSignal& signal,
                                                      int& numFrames) const {
    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
                                    "cannot featurize an empty signal");
    }
    if (signal.sampleRate == 0) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
                                    "sample rate must be positive");
    }

    const MelFilterbank bank = buildFilterbank(signal.sampleRate, m_config.windowSize,
                                               m_config.nMels, m_config.fMin,
                                               m_config.fMax, m_config.htk);

    SpectrumFrame spectrum = m_transform.stft(signal.samples, m_config.hopLength);

    const int nMels = m_config.nMels;
    const int frames = spectrum.numFrames;
    numFrames = frames;

    std::vector<float> melPower(static_cast<size_t>(nMels) * frames, 0.0f);

    // Mỗi frame chỉ ghi cột t của nó
    #pragma omp parallel for schedule(static)
    for (int t = 0; t < frames; ++t) {
        for (int m = 0; m < nMels; ++m) {
            const std::vector<float>& filter = bank.weights[m];

            AccumType sum = 0.0;
            for (int k = bank.startBin[m]; k < bank.endBin[m]; ++k) {
                sum += static_cast<AccumType>(filter[k]) * spectrum.power(k, t);
            }
            melPower[static_cast<size_t>(m) * frames + t] = static_cast<float>(sum);
        }
    }

    return melPower;
}

// ============================================================================
// POWER TO DB & NORMALIZATION
// ============================================================================

void MelFeaturizer::powerToDb(std::vector<float>& values, float amin, float topDb) {
    if (values.empty()) {
        return;
    }
    if (!(amin > 0.0f)) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING, "amin must be positive");
    }

    // ref = max(P)
    const float refPower = *std::max_element(values.begin(), values.end());
    const double refDb = 10.0 * std::log10(std::max(amin, refPower));

    float maxDb = -std::numeric_limits<float>::infinity();

    for (auto& v : values) {
        v = static_cast<float>(10.0 * std::log10(std::max(amin, v)) - refDb);
        maxDb = std::max(maxDb, v);
    }

    if (topDb > 0.0f) {
        const float floorDb = maxDb - topDb;
        for (auto& v : values) {
            v = std::max(v, floorDb);
        }
    }
}

bool MelFeaturizer::normalize(std::vector<float>& values, float low, float high,
                              DegeneratePolicy policy) {
    if (!(low < high)) {
        throw InvalidParameterError(ProcessingStage::EXTRACTING,
                                    "normalization range requires low < high");
    }
    if (values.empty()) {
        return false;
    }

    auto minMax = std::minmax_element(values.begin(), values.end());
    const float minVal = *minMax.first;
    const float maxVal = *minMax.second;

    // Spectrogram hằng: (x - min) / (max - min) sẽ là 0/0
    if (!(maxVal > minVal)) {
        if (policy == DegeneratePolicy::THROW) {
            throw DegenerateNormalizationError(
                "constant spectrogram (" + std::to_string(maxVal) +
                " dB everywhere), cannot min-max normalize");
        }

        std::fill(values.begin(), values.end(), 0.5f * (low + high));
        return true;
    }

    const float scale = (high - low) / (maxVal - minVal);

    // Hai biên được gán chính xác, phần còn lại kẹp trong [low, high]
    for (auto& v : values) {
        if (v == maxVal) {
            v = high;
        } else {
            v = std::min(high, std::max(low, (v - minVal) * scale + low));
        }
    }

    return false;
}

// ============================================================================
// MAIN EXTRACTION
// ============================================================================

FeatureTensor MelFeaturizer::featurize(const AudioSignal& signal) const {
    // ----- BƯỚC 1 + 2: Mel power spectrogram -----
    int frames = 0;
    std::vector<float> mel = melPowerSpectrogram(signal, frames);

    // ----- BƯỚC 3: Power -> dB -----
    powerToDb(mel, POWER_TO_DB_AMIN, m_config.topDb);

    // ----- BƯỚC 4: Normalization -----
    FeatureTensor tensor;
    tensor.nMels = m_config.nMels;
    tensor.timeSteps = frames;
    tensor.degenerate = normalize(mel, m_config.normLow, m_config.normHigh,
                                  m_config.degeneratePolicy);
    tensor.data = std::move(mel);

    if (tensor.degenerate) {
        std::cerr << "[MelFeaturizer] Warning: constant spectrogram, filled with midpoint "
                  << 0.5f * (m_config.normLow + m_config.normHigh) << std::endl;
    }

    return tensor;
}

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

FeatureTensor featurize(const AudioSignal& signal, int nMels, int hopLength,
                        float normLow, float normHigh) {
    MelConfig config;
    config.nMels = nMels;
    config.hopLength = hopLength;
    config.normLow = normLow;
    config.normHigh = normHigh;

    MelFeaturizer featurizer(config);
    return featurizer.featurize(signal);
}

} // namespace cough
