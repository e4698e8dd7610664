/**
 * @file NoiseSuppressor.cpp
 * @brief Implementation of spectral gating noise reduction
 *
 * @author Research Team
 * @date 2026
 */

#include "NoiseSuppressor.hpp"

#include <algorithm>
#include <complex>
#include <iostream>
#include <string>

namespace cough {

NoiseSuppressor::NoiseSuppressor(const NoiseConfig& config)
    : m_config(config)
    , m_transform(config.stft.windowSize)
{
    SpectralTransform::validateParameters(config.stft.windowSize, config.stft.hopLength);

    if (!(config.referenceDurationS > 0.0f)) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
            "reference duration must be positive");
    }
    if (!(config.level >= 0.0f)) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
            "noise reduction level must be non-negative");
    }
}

// ============================================================================
// NOISE ESTIMATION
// ============================================================================

NoiseProfile NoiseSuppressor::estimateNoise(const AudioSignal& signal) const {
    /**
     * noise[k] = mean_f |X(k, f)|^2  trên đoạn tham chiếu
     */

    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
                                    "cannot estimate noise of an empty signal");
    }
    if (signal.sampleRate == 0) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
                                    "sample rate must be positive");
    }

    size_t referenceSamples = static_cast<size_t>(m_config.referenceDurationS * signal.sampleRate);

    if (referenceSamples == 0 || referenceSamples >= signal.size()) {
        if (referenceSamples > signal.size()) {
            std::cerr << "[NoiseSuppressor] Warning: signal (" << signal.size()
                      << " samples) shorter than noise reference window ("
                      << referenceSamples << "), using the whole signal" << std::endl;
        }
        referenceSamples = signal.size();
    }

    std::vector<float> reference(signal.samples.begin(),
                                 signal.samples.begin() + referenceSamples);

    SpectrumFrame spectrum = m_transform.stft(reference, m_config.stft.hopLength);

    std::vector<float> binPower(spectrum.numBins, 0.0f);

    for (int k = 0; k < spectrum.numBins; ++k) {
        AccumType sum = 0.0;
        for (int f = 0; f < spectrum.numFrames; ++f) {
            sum += spectrum.power(k, f);
        }
        binPower[k] = static_cast<float>(sum / spectrum.numFrames);
    }

    return NoiseProfile(std::move(binPower), m_transform.windowSize(),
                        m_config.stft.hopLength, referenceSamples);
}

// ============================================================================
// SPECTRAL GATING
// ============================================================================

SpectrumFrame NoiseSuppressor::gate(const SpectrumFrame& spectrum,
                                    const NoiseProfile& profile,
                                    float level) {
    if (profile.numBins() != static_cast<size_t>(spectrum.numBins)) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
            "noise profile has " + std::to_string(profile.numBins()) +
            " bins, spectrum has " + std::to_string(spectrum.numBins));
    }

    SpectrumFrame gated = spectrum;

    for (int k = 0; k < spectrum.numBins; ++k) {
        const float threshold = level * profile[k];

        for (int f = 0; f < spectrum.numFrames; ++f) {
            const std::complex<float>& x = spectrum.at(k, f);

            // Spectral floor: magnitude không bao giờ âm
            float magnitude = std::max(std::abs(x) - threshold, 0.0f);

            gated.at(k, f) = std::polar(magnitude, std::arg(x));
        }
    }

    return gated;
}

AudioSignal NoiseSuppressor::suppress(const AudioSignal& signal,
                                      const NoiseProfile& profile) const {
    /**
     * Quy trình:
     * 1. STFT toàn bộ tín hiệu
     * 2. Trừ level * noise[bin] khỏi magnitude, kẹp về 0
     * 3. Ghép magnitude mới với pha gốc
     * 4. ISTFT để tái tạo tín hiệu miền thời gian
     */

    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
                                    "cannot suppress noise of an empty signal");
    }
    if (profile.windowSize() != m_transform.windowSize()) {
        throw InvalidParameterError(ProcessingStage::DENOISING,
            "noise profile window " + std::to_string(profile.windowSize()) +
            " does not match transform window " + std::to_string(m_transform.windowSize()));
    }

    // ----- BƯỚC 1: STFT -----
    SpectrumFrame spectrum = m_transform.stft(signal.samples, profile.hopLength());

    // ----- BƯỚC 2 + 3: Spectral gating -----
    SpectrumFrame gated = gate(spectrum, profile, m_config.level);

    // ----- BƯỚC 4: ISTFT -----
    AudioSignal denoised;
    denoised.sampleRate = signal.sampleRate;
    denoised.samples = m_transform.istft(gated, profile.hopLength(), signal.size());

    return denoised;
}

AudioSignal NoiseSuppressor::process(const AudioSignal& signal) const {
    NoiseProfile profile = estimateNoise(signal);
    return suppress(signal, profile);
}

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

NoiseProfile estimateNoise(const AudioSignal& signal, float referenceDurationS) {
    NoiseConfig config;
    config.referenceDurationS = referenceDurationS;

    NoiseSuppressor suppressor(config);
    return suppressor.estimateNoise(signal);
}

AudioSignal suppress(const AudioSignal& signal, const NoiseProfile& profile, float level) {
    NoiseConfig config;
    config.level = level;
    config.stft.windowSize = profile.windowSize();
    config.stft.hopLength = profile.hopLength();

    NoiseSuppressor suppressor(config);
    return suppressor.suppress(signal, profile);
}

} // namespace cough
