/**
 * @file test_features.cpp
 * @brief Unit tests for MelFeaturizer
 *
 * Kiểm tra mel scale, filterbank, power -> dB, normalization và
 * shape của FeatureTensor.
 */

#include "FeatureExtraction.h"
#include "TestHelpers.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

using namespace cough;
using namespace cough::test;

// ============================================================================
// TEST CASES
// ============================================================================

/**
 * Test 1: Chuyển đổi Hz <-> Mel (Slaney và HTK)
 */
bool testMelConversion() {
    std::cout << "\n[TEST] Mel Scale Conversion..." << std::endl;

    // Slaney: tuyến tính dưới 1 kHz
    bool linearCorrect = std::fabs(MelFeaturizer::hzToMel(500.0) - 7.5) < 1e-9 &&
                         std::fabs(MelFeaturizer::hzToMel(1000.0) - 15.0) < 1e-9;

    // Slaney: logarit phía trên, 6400 Hz = 15 + 27
    bool logCorrect = std::fabs(MelFeaturizer::hzToMel(6400.0) - 42.0) < 1e-6;

    bool inverseCorrect = std::fabs(MelFeaturizer::melToHz(MelFeaturizer::hzToMel(4000.0)) - 4000.0) < 1e-6 &&
                          std::fabs(MelFeaturizer::melToHz(7.5) - 500.0) < 1e-9;

    // HTK: 700 Hz -> 2595 * log10(2)
    double htkMel = MelFeaturizer::hzToMel(700.0, true);
    bool htkCorrect = std::fabs(htkMel - 2595.0 * std::log10(2.0)) < 1e-6 &&
                      std::fabs(MelFeaturizer::melToHz(htkMel, true) - 700.0) < 1e-6;

    std::cout << "  Slaney linear: " << passFail(linearCorrect) << std::endl;
    std::cout << "  Slaney log: " << passFail(logCorrect) << std::endl;
    std::cout << "  Inverse: " << passFail(inverseCorrect) << std::endl;
    std::cout << "  HTK: " << passFail(htkCorrect) << std::endl;

    return linearCorrect && logCorrect && inverseCorrect && htkCorrect;
}

/**
 * Test 2: Filterbank 128 mels @ 22.05 kHz
 */
bool testFilterbank() {
    std::cout << "\n[TEST] Mel Filterbank..." << std::endl;

    MelFilterbank bank = MelFeaturizer::buildFilterbank(22050, 2048, 128, 0.0f, 0.0f, false);

    bool shapeCorrect = bank.weights.size() == 128 && bank.weights[0].size() == 1025;

    bool allNonEmpty = true;
    bool nonNegative = true;
    bool centersIncreasing = true;
    int previousPeak = -1;

    for (int m = 0; m < 128 && shapeCorrect; ++m) {
        if (bank.endBin[m] <= bank.startBin[m]) {
            allNonEmpty = false;
        }

        const auto& w = bank.weights[m];
        for (float v : w) {
            if (v < 0.0f) nonNegative = false;
        }

        int peak = static_cast<int>(std::max_element(w.begin(), w.end()) - w.begin());
        if (peak < previousPeak) centersIncreasing = false;
        previousPeak = peak;
    }

    std::cout << "  Shape: " << bank.weights.size() << " x "
              << (bank.weights.empty() ? 0 : bank.weights[0].size()) << std::endl;
    std::cout << "  Non-empty filters: " << passFail(allNonEmpty) << std::endl;
    std::cout << "  Non-negative weights: " << passFail(nonNegative) << std::endl;
    std::cout << "  Increasing centers: " << passFail(centersIncreasing) << std::endl;

    return shapeCorrect && allNonEmpty && nonNegative && centersIncreasing;
}

/**
 * Test 3: Power -> dB với ref = max, amin và top_db
 */
bool testPowerToDb() {
    std::cout << "\n[TEST] Power To dB..." << std::endl;

    std::vector<float> values = {4.0f, 2.0f};
    MelFeaturizer::powerToDb(values);
    bool refCorrect = std::fabs(values[0]) < 1e-6f &&
                      std::fabs(values[1] + 3.0103f) < 1e-3f;

    // 1e-3 -> -30 dB, 0 -> amin = -100 dB -> kẹp tại -80 dB
    std::vector<float> clipped = {1.0f, 1e-3f, 0.0f};
    MelFeaturizer::powerToDb(clipped);
    bool topDbCorrect = std::fabs(clipped[1] + 30.0f) < 1e-3f &&
                        std::fabs(clipped[2] + 80.0f) < 1e-3f;

    // top_db <= 0: không kẹp
    std::vector<float> unclipped = {1.0f, 0.0f};
    MelFeaturizer::powerToDb(unclipped, POWER_TO_DB_AMIN, 0.0f);
    bool disabledCorrect = std::fabs(unclipped[1] + 100.0f) < 1e-3f;

    std::cout << "  ref = max: " << passFail(refCorrect) << std::endl;
    std::cout << "  top_db clip: " << passFail(topDbCorrect) << std::endl;
    std::cout << "  top_db disabled: " << passFail(disabledCorrect) << std::endl;

    return refCorrect && topDbCorrect && disabledCorrect;
}

/**
 * Test 4: Normalization đạt đúng hai biên
 */
bool testNormalizationBounds() {
    std::cout << "\n[TEST] Normalization Bounds..." << std::endl;

    auto samples = generateSineWave(660.0f, 22050.0f, 1.0f, 0.4f);
    auto noise = generateNoise(samples.size(), 0.02f, 9);
    for (size_t i = 0; i < samples.size(); ++i) samples[i] += noise[i];
    AudioSignal signal(samples, 22050);

    FeatureTensor unit = featurize(signal);
    auto unitRange = std::minmax_element(unit.data.begin(), unit.data.end());
    bool unitCorrect = *unitRange.first == 0.0f && *unitRange.second == 1.0f && !unit.degenerate;

    FeatureTensor symmetric = featurize(signal, DEFAULT_NUM_MELS, DEFAULT_HOP_LENGTH, -1.0f, 1.0f);
    auto symRange = std::minmax_element(symmetric.data.begin(), symmetric.data.end());
    bool symmetricCorrect = *symRange.first == -1.0f && *symRange.second == 1.0f;

    std::cout << "  [0, 1] range: [" << *unitRange.first << ", " << *unitRange.second << "]" << std::endl;
    std::cout << "  [-1, 1] range: [" << *symRange.first << ", " << *symRange.second << "]" << std::endl;

    return unitCorrect && symmetricCorrect;
}

/**
 * Test 5: Tín hiệu im lặng 1 s -> fallback midpoint, không NaN
 */
bool testSilentSignal() {
    std::cout << "\n[TEST] Silent Signal (Midpoint Fallback)..." << std::endl;

    AudioSignal signal(std::vector<float>(22050, 0.0f), 22050);

    FeatureTensor tensor = featurize(signal);

    bool flagSet = tensor.degenerate;
    bool allMidpoint = !tensor.empty();
    for (float v : tensor.data) {
        if (v != 0.5f) {
            allMidpoint = false;
            break;
        }
    }
    bool shapeCorrect = tensor.nMels == 128 && tensor.timeSteps == 44;

    std::cout << "  Degenerate flag: " << passFail(flagSet) << std::endl;
    std::cout << "  All cells 0.5: " << passFail(allMidpoint) << std::endl;
    std::cout << "  Shape: (1, 1, " << tensor.nMels << ", " << tensor.timeSteps << ")" << std::endl;

    return flagSet && allMidpoint && shapeCorrect;
}

/**
 * Test 6: Policy THROW với spectrogram hằng
 */
bool testDegenerateThrowPolicy() {
    std::cout << "\n[TEST] Degenerate Throw Policy..." << std::endl;

    MelConfig config;
    config.degeneratePolicy = DegeneratePolicy::THROW;
    MelFeaturizer featurizer(config);

    bool thrown = false;
    try {
        featurizer.featurize(AudioSignal(std::vector<float>(8000, 0.0f), 8000));
    } catch (const DegenerateNormalizationError& e) {
        thrown = e.stage() == ProcessingStage::EXTRACTING;
        std::cout << "  Message: " << e.what() << std::endl;
    }

    std::cout << "  Thrown: " << passFail(thrown) << std::endl;

    return thrown;
}

/**
 * Test 7: Shape tensor và số frame theo hop
 */
bool testTensorShape() {
    std::cout << "\n[TEST] Feature Tensor Shape..." << std::endl;

    AudioSignal signal(generateNoise(22050, 0.1f), 22050);

    FeatureTensor tensor = featurize(signal, 128, 512);
    auto shape = tensor.shape();
    bool shapeCorrect = shape[0] == 1 && shape[1] == 1 && shape[2] == 128 && shape[3] == 44 &&
                        tensor.size() == static_cast<size_t>(128 * 44);

    // Row-major theo mel band
    bool layoutCorrect = &tensor.at(1, 0) == &tensor.data[44] &&
                         &tensor.at(127, 43) == &tensor.data.back();

    // 1 + 22050 / 256 = 87
    FeatureTensor fine = featurize(signal, 64, 256);
    bool hopCorrect = fine.nMels == 64 && fine.timeSteps == 87;

    std::cout << "  Shape: (" << shape[0] << ", " << shape[1] << ", "
              << shape[2] << ", " << shape[3] << ")" << std::endl;
    std::cout << "  Hop 256 frames: " << fine.timeSteps << " (expected: 87)" << std::endl;

    return shapeCorrect && layoutCorrect && hopCorrect;
}

/**
 * Test 8: Năng lượng của sine 1 kHz rơi vào mel band chứa 1 kHz
 */
bool testSineEnergyBand() {
    std::cout << "\n[TEST] Sine Energy Band..." << std::endl;

    const uint32_t sampleRate = 22050;
    AudioSignal signal(generateSineWave(1000.0f, static_cast<float>(sampleRate), 1.0f, 0.5f),
                       sampleRate);

    FeatureTensor tensor = featurize(signal);
    MelFilterbank bank = MelFeaturizer::buildFilterbank(sampleRate, 2048, 128, 0.0f, 0.0f, false);

    const int frame = tensor.timeSteps / 2;
    int bestBand = 0;
    for (int m = 1; m < tensor.nMels; ++m) {
        if (tensor.at(m, frame) > tensor.at(bestBand, frame)) bestBand = m;
    }

    // Main lobe của Hann: bin 1 kHz +/- 2
    const int peakBin = static_cast<int>(std::lround(1000.0 * 2048 / sampleRate));
    bool bandCovers = bank.startBin[bestBand] <= peakBin + 2 && bank.endBin[bestBand] > peakBin - 2;

    std::cout << "  Best band: " << bestBand << " (bins " << bank.startBin[bestBand]
              << "-" << bank.endBin[bestBand] << "), 1 kHz bin: " << peakBin << std::endl;

    return bandCovers;
}

/**
 * Test 9: Tham số không hợp lệ
 */
bool testInvalidParameters() {
    std::cout << "\n[TEST] Featurizer Invalid Parameters..." << std::endl;

    AudioSignal signal(generateNoise(8000, 0.1f), 8000);
    int rejected = 0;

    try { featurize(signal, 0); } catch (const InvalidParameterError&) { rejected++; }
    try { featurize(signal, 128, 0); } catch (const InvalidParameterError&) { rejected++; }
    try { featurize(signal, 128, 512, 1.0f, 1.0f); } catch (const InvalidParameterError&) { rejected++; }
    try { featurize(signal, 128, 512, 1.0f, 0.0f); } catch (const InvalidParameterError&) { rejected++; }
    try { featurize(AudioSignal({}, 8000)); } catch (const InvalidParameterError&) { rejected++; }
    try { featurize(AudioSignal({0.1f, 0.2f}, 0)); } catch (const InvalidParameterError&) { rejected++; }

    std::cout << "  Rejected: " << rejected << "/6" << std::endl;

    return rejected == 6;
}

/**
 * Test 10: Cùng input cho cùng tensor
 */
bool testDeterminism() {
    std::cout << "\n[TEST] Determinism..." << std::endl;

    AudioSignal signal(generateNoise(44100, 0.2f, 21), 44100);
    MelFeaturizer featurizer;

    FeatureTensor first = featurizer.featurize(signal);
    FeatureTensor second = featurizer.featurize(signal);

    bool identical = first.data == second.data && first.timeSteps == second.timeSteps;
    std::cout << "  Identical tensors: " << passFail(identical) << std::endl;

    return identical;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Mel Featurizer Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 10;

    if (testMelConversion()) passed++;
    if (testFilterbank()) passed++;
    if (testPowerToDb()) passed++;
    if (testNormalizationBounds()) passed++;
    if (testSilentSignal()) passed++;
    if (testDegenerateThrowPolicy()) passed++;
    if (testTensorShape()) passed++;
    if (testSineEnergyBand()) passed++;
    if (testInvalidParameters()) passed++;
    if (testDeterminism()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
