/**
 * @file test_signal_prep.cpp
 * @brief Unit tests for AudioLoader, CoughSegmenter and NoiseSuppressor
 *
 * Kiểm tra các chức năng của:
 * - Đọc WAV và down-mix mono (AudioLoader)
 * - Tách đoạn ho theo ngưỡng biên độ (CoughSegmenter)
 * - Giảm nhiễu spectral gating (NoiseSuppressor)
 */

#include "SignalPrep.hpp"
#include "NoiseSuppressor.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using namespace cough;
using namespace cough::test;

// ============================================================================
// TEST HELPER FUNCTIONS
// ============================================================================

namespace {

void appendLE(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

/**
 * @brief Tạo byte stream WAV 16-bit PCM từ các mẫu interleaved
 */
std::vector<uint8_t> makeWav16(const std::vector<int16_t>& interleaved,
                               uint16_t channels, uint32_t sampleRate) {
    const uint32_t dataBytes = static_cast<uint32_t>(interleaved.size() * 2);
    std::vector<uint8_t> out;

    out.insert(out.end(), {'R', 'I', 'F', 'F'});
    appendLE(out, 36 + dataBytes, 4);
    out.insert(out.end(), {'W', 'A', 'V', 'E'});

    out.insert(out.end(), {'f', 'm', 't', ' '});
    appendLE(out, 16, 4);                               // fmt chunk size
    appendLE(out, 1, 2);                                // PCM
    appendLE(out, channels, 2);
    appendLE(out, sampleRate, 4);
    appendLE(out, sampleRate * channels * 2, 4);        // byte rate
    appendLE(out, channels * 2, 2);                     // block align
    appendLE(out, 16, 2);                               // bits per sample

    out.insert(out.end(), {'d', 'a', 't', 'a'});
    appendLE(out, dataBytes, 4);
    for (int16_t s : interleaved) {
        appendLE(out, static_cast<uint16_t>(s), 2);
    }

    return out;
}

} // namespace

// ============================================================================
// AUDIO LOADER TESTS
// ============================================================================

/**
 * Test 1: Down-mix đa kênh về mono
 */
bool testConvertToMono() {
    std::cout << "\n[TEST] Convert To Mono..." << std::endl;

    std::vector<float> stereo = {1.0f, 3.0f, 2.0f, 4.0f, -1.0f, 1.0f};
    auto mono = AudioLoader::convertToMono(stereo, 2);

    bool sizeCorrect = mono.size() == 3;
    bool valuesCorrect = sizeCorrect &&
                         std::fabs(mono[0] - 2.0f) < 1e-6f &&
                         std::fabs(mono[1] - 3.0f) < 1e-6f &&
                         std::fabs(mono[2] - 0.0f) < 1e-6f;

    std::cout << "  Size check: " << passFail(sizeCorrect) << std::endl;
    std::cout << "  Values check: " << passFail(valuesCorrect) << std::endl;

    return sizeCorrect && valuesCorrect;
}

/**
 * Test 2: Đọc WAV stereo từ bộ nhớ
 */
bool testLoadWavMemory() {
    std::cout << "\n[TEST] Load WAV From Memory..." << std::endl;

    // L = 0.5, R = 0 -> mono 0.25
    std::vector<int16_t> pcm = {16384, 0, 16384, 0, -16384, 0, 0, 0};
    auto bytes = makeWav16(pcm, 2, 8000);

    AudioSignal signal = AudioLoader::loadWavMemory(bytes);

    bool rateCorrect = signal.sampleRate == 8000;
    bool sizeCorrect = signal.size() == 4;
    bool valuesCorrect = sizeCorrect &&
                         std::fabs(signal.samples[0] - 0.25f) < 1e-4f &&
                         std::fabs(signal.samples[2] + 0.25f) < 1e-4f &&
                         std::fabs(signal.samples[3]) < 1e-6f;

    std::cout << "  Sample rate: " << signal.sampleRate << " (expected: 8000)" << std::endl;
    std::cout << "  Samples: " << signal.size() << " (expected: 4)" << std::endl;
    std::cout << "  Values check: " << passFail(valuesCorrect) << std::endl;

    return rateCorrect && sizeCorrect && valuesCorrect;
}

/**
 * Test 2b: verbose = false không in gì ra stdout
 */
bool testLoadWavQuiet() {
    std::cout << "\n[TEST] Load WAV Quiet..." << std::endl;

    std::vector<int16_t> pcm = {8192, -8192, 8192, -8192};
    auto bytes = makeWav16(pcm, 1, 16000);

    // Chuyển hướng stdout tạm thời
    std::ostringstream quietOut;
    std::streambuf* previous = std::cout.rdbuf(quietOut.rdbuf());
    AudioSignal quiet = AudioLoader::loadWavMemory(bytes, false);
    std::cout.rdbuf(previous);

    std::ostringstream verboseOut;
    previous = std::cout.rdbuf(verboseOut.rdbuf());
    AudioSignal verbose = AudioLoader::loadWavMemory(bytes, true);
    std::cout.rdbuf(previous);

    bool quietSilent = quietOut.str().empty();
    bool verbosePrinted = verboseOut.str().find("[AudioLoader]") != std::string::npos;
    bool sameSignal = quiet.samples == verbose.samples && quiet.sampleRate == 16000;

    std::cout << "  Quiet load silent: " << passFail(quietSilent) << std::endl;
    std::cout << "  Verbose load prints: " << passFail(verbosePrinted) << std::endl;

    return quietSilent && verbosePrinted && sameSignal;
}

/**
 * Test 3: Đọc WAV từ file, giữ nguyên sample rate
 */
bool testLoadWavFile() {
    std::cout << "\n[TEST] Load WAV File..." << std::endl;

    std::vector<int16_t> pcm(44100, 0);
    pcm[1000] = 8192;   // 0.25
    auto bytes = makeWav16(pcm, 1, 44100);

    fs::path tempFile = fs::temp_directory_path() / "cough_test_load.wav";
    {
        std::ofstream ofs(tempFile, std::ios::binary);
        ofs.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    AudioSignal signal = AudioLoader::loadWav(tempFile.string());
    fs::remove(tempFile);

    bool rateCorrect = signal.sampleRate == 44100;
    bool sizeCorrect = signal.size() == 44100;
    bool durationCorrect = std::fabs(signal.durationSeconds() - 1.0) < 1e-9;
    bool valueCorrect = sizeCorrect && std::fabs(signal.samples[1000] - 0.25f) < 1e-4f;

    std::cout << "  Duration: " << signal.durationSeconds() << " s" << std::endl;
    std::cout << "  Value check: " << passFail(valueCorrect) << std::endl;

    return rateCorrect && sizeCorrect && durationCorrect && valueCorrect;
}

/**
 * Test 4: Dữ liệu hỏng -> AudioLoadError
 */
bool testLoadWavInvalid() {
    std::cout << "\n[TEST] Load Invalid WAV..." << std::endl;

    int rejected = 0;

    try { AudioLoader::loadWavMemory({}); } catch (const AudioLoadError&) { rejected++; }

    std::vector<uint8_t> garbage = {'n', 'o', 't', ' ', 'a', ' ', 'w', 'a', 'v', 'e'};
    try { AudioLoader::loadWavMemory(garbage); } catch (const AudioLoadError&) { rejected++; }

    try {
        AudioLoader::loadWav("/nonexistent/dir/missing.wav");
    } catch (const AudioLoadError& e) {
        rejected++;
        std::cout << "  Message: " << e.what() << std::endl;
    }

    std::cout << "  Rejected: " << rejected << "/3" << std::endl;

    return rejected == 3;
}

// ============================================================================
// COUGH SEGMENTER TESTS
// ============================================================================

/**
 * Test 5: Xung 0.3 tại giữa bản ghi 2 s @ 44.1 kHz
 */
bool testImpulseSegment() {
    std::cout << "\n[TEST] Impulse Segment (2 s @ 44.1 kHz)..." << std::endl;

    AudioSignal signal(std::vector<float>(88200, 0.0f), 44100);
    signal.samples[22050] = 0.3f;

    CoughSegment segment = extractSegment(signal, 0.05f, 1.0f, 0.5f);

    bool onsetCorrect = segment.onsetIndex == 22050;
    bool startCorrect = segment.startIndex == 0;
    bool lengthCorrect = segment.length() == 44100 && segment.signal.size() == 44100;
    bool notTruncated = !segment.truncated;
    bool peakKept = segment.signal.samples[22050] == 0.3f;

    std::cout << "  Onset: " << segment.onsetIndex << " (expected: 22050)" << std::endl;
    std::cout << "  Start: " << segment.startIndex << " (expected: 0)" << std::endl;
    std::cout << "  Length: " << segment.length() << " (expected: 44100)" << std::endl;

    return onsetCorrect && startCorrect && lengthCorrect && notTruncated && peakKept;
}

/**
 * Test 6: Đoạn chạm cuối tín hiệu bị cắt ngắn
 */
bool testTruncatedSegment() {
    std::cout << "\n[TEST] Truncated Segment..." << std::endl;

    AudioSignal signal(std::vector<float>(16000, 0.0f), 8000);
    signal.samples[15000] = -0.6f;

    CoughSegment segment = extractSegment(signal);

    // start = 15000 - 4000, end = min(16000, 11000 + 8000)
    bool startCorrect = segment.startIndex == 11000;
    bool endCorrect = segment.endIndex == 16000;
    bool truncated = segment.truncated && segment.length() == 5000;

    std::cout << "  Segment: [" << segment.startIndex << ", " << segment.endIndex << ")" << std::endl;

    return startCorrect && endCorrect && truncated;
}

/**
 * Test 7: Không có mẫu vượt ngưỡng
 */
bool testNoActivity() {
    std::cout << "\n[TEST] No Activity Detected..." << std::endl;

    AudioSignal signal(std::vector<float>(16000, 0.01f), 16000);
    signal.samples[500] = 0.05f;    // bằng ngưỡng, chưa vượt

    bool thrown = false;
    bool peakCorrect = false;

    try {
        extractSegment(signal, 0.05f);
    } catch (const NoActivityDetectedError& e) {
        thrown = true;
        peakCorrect = std::fabs(e.peakAmplitude() - 0.05f) < 1e-6f &&
                      e.threshold() == 0.05f &&
                      e.stage() == ProcessingStage::SEGMENTING;
        std::cout << "  Message: " << e.what() << std::endl;
    }

    std::cout << "  Thrown: " << passFail(thrown) << std::endl;
    std::cout << "  Peak reported: " << passFail(peakCorrect) << std::endl;

    return thrown && peakCorrect;
}

/**
 * Test 8: Cấu hình segmenter không hợp lệ
 */
bool testSegmenterInvalidParameters() {
    std::cout << "\n[TEST] Segmenter Invalid Parameters..." << std::endl;

    AudioSignal signal(std::vector<float>(1000, 0.5f), 1000);
    int rejected = 0;

    try { extractSegment(signal, -0.1f); } catch (const InvalidParameterError&) { rejected++; }
    try { extractSegment(signal, 0.05f, 0.0f); } catch (const InvalidParameterError&) { rejected++; }
    try { extractSegment(signal, 0.05f, 1.0f, -0.5f); } catch (const InvalidParameterError&) { rejected++; }
    try { extractSegment(AudioSignal({}, 1000)); } catch (const InvalidParameterError&) { rejected++; }
    try { extractSegment(AudioSignal({0.5f}, 0)); } catch (const InvalidParameterError&) { rejected++; }

    std::cout << "  Rejected: " << rejected << "/5" << std::endl;

    return rejected == 5;
}

// ============================================================================
// NOISE SUPPRESSOR TESTS
// ============================================================================

/**
 * Test 9: Magnitude sau gating không âm, bin dưới ngưỡng về 0
 */
bool testNoiseFloorNonNegative() {
    std::cout << "\n[TEST] Spectral Gating Floor..." << std::endl;

    AudioSignal signal(generateNoise(22050, 0.2f, 3), 22050);

    NoiseProfile profile = estimateNoise(signal, 0.5f);
    SpectrumFrame spectrum = stft(signal.samples, profile.windowSize(), profile.hopLength());

    // level rất lớn -> toàn bộ bị kẹp về 0
    SpectrumFrame gated = NoiseSuppressor::gate(spectrum, profile, 1e6f);

    bool allZero = true;
    for (const auto& c : gated.data) {
        if (std::abs(c) != 0.0f) {
            allZero = false;
            break;
        }
    }

    // level mặc định -> 0 <= mag' <= mag, pha giữ nguyên ở các bin còn năng lượng
    SpectrumFrame partial = NoiseSuppressor::gate(spectrum, profile, DEFAULT_NOISE_REDUCTION_LEVEL);
    bool bounded = true;
    for (size_t i = 0; i < spectrum.data.size(); ++i) {
        float before = std::abs(spectrum.data[i]);
        float after = std::abs(partial.data[i]);
        if (!(after >= 0.0f) || after > before + 1e-4f) {
            bounded = false;
            break;
        }
    }

    // level = 0 -> giữ nguyên
    SpectrumFrame untouched = NoiseSuppressor::gate(spectrum, profile, 0.0f);
    double maxDiff = 0.0;
    for (size_t i = 0; i < spectrum.data.size(); ++i) {
        maxDiff = std::max(maxDiff, static_cast<double>(
            std::abs(untouched.data[i] - spectrum.data[i])));
    }

    bool unchanged = maxDiff < 1e-3;

    std::cout << "  Large level zeroes spectrum: " << passFail(allZero) << std::endl;
    std::cout << "  Gated magnitudes within [0, original]: " << passFail(bounded) << std::endl;
    std::cout << "  Zero level keeps spectrum: " << passFail(unchanged) << std::endl;

    return allZero && bounded && unchanged;
}

/**
 * Test 10: Giảm nhiễu nền, giữ tiếng ho
 */
bool testNoiseReduction() {
    std::cout << "\n[TEST] Noise Reduction..." << std::endl;

    const uint32_t sampleRate = 16000;
    std::vector<float> samples = generateNoise(2 * sampleRate, 0.01f, 11);

    // Burst 1 kHz từ 1.0 s đến 1.5 s
    auto burst = generateSineWave(1000.0f, static_cast<float>(sampleRate), 0.5f, 0.5f);
    for (size_t i = 0; i < burst.size(); ++i) {
        samples[sampleRate + i] += burst[i];
    }

    AudioSignal signal(samples, sampleRate);

    NoiseSuppressor suppressor;
    AudioSignal denoised = suppressor.process(signal);

    bool lengthCorrect = denoised.size() == signal.size() &&
                         denoised.sampleRate == signal.sampleRate;

    float noiseBefore = rmsOf(signal.samples, 0, sampleRate / 2);
    float noiseAfter = rmsOf(denoised.samples, 0, sampleRate / 2);

    // Giữa burst, tránh vùng chuyển tiếp
    size_t burstBegin = sampleRate + sampleRate / 8;
    size_t burstEnd = sampleRate + 3 * sampleRate / 8;
    float burstBefore = rmsOf(signal.samples, burstBegin, burstEnd);
    float burstAfter = rmsOf(denoised.samples, burstBegin, burstEnd);

    bool noiseReduced = noiseAfter < 0.9f * noiseBefore;
    bool burstKept = isInRange(burstAfter / burstBefore, 0.9f, 1.1f);

    std::cout << "  Noise RMS: " << noiseBefore << " -> " << noiseAfter << std::endl;
    std::cout << "  Burst RMS: " << burstBefore << " -> " << burstAfter << std::endl;
    std::cout << "  Noise check: " << passFail(noiseReduced) << std::endl;
    std::cout << "  Burst check: " << passFail(burstKept) << std::endl;

    return lengthCorrect && noiseReduced && burstKept;
}

/**
 * Test 11: Tín hiệu ngắn hơn đoạn tham chiếu dùng toàn bộ tín hiệu
 */
bool testShortNoiseReference() {
    std::cout << "\n[TEST] Short Noise Reference..." << std::endl;

    AudioSignal signal(generateNoise(1600, 0.1f, 5), 8000);   // 0.2 s

    NoiseProfile profile = estimateNoise(signal, 0.5f);

    bool wholeSignal = profile.referenceSamples() == signal.size();
    bool binsCorrect = profile.numBins() == static_cast<size_t>(DEFAULT_WINDOW_SIZE / 2 + 1);

    bool nonNegative = true;
    for (float p : profile.binPower()) {
        if (!(p >= 0.0f)) nonNegative = false;
    }

    std::cout << "  Reference samples: " << profile.referenceSamples()
              << " (expected: " << signal.size() << ")" << std::endl;

    return wholeSignal && binsCorrect && nonNegative;
}

/**
 * Test 12: Tham số giảm nhiễu không hợp lệ
 */
bool testNoiseInvalidParameters() {
    std::cout << "\n[TEST] Noise Suppressor Invalid Parameters..." << std::endl;

    AudioSignal signal(generateNoise(16000, 0.1f), 16000);
    NoiseProfile profile = estimateNoise(signal);

    int rejected = 0;

    try { suppress(signal, profile, -1.0f); } catch (const InvalidParameterError&) { rejected++; }

    try {
        NoiseProfile wrong(std::vector<float>(10, 0.0f), DEFAULT_WINDOW_SIZE, DEFAULT_HOP_LENGTH, 10);
        SpectrumFrame spectrum = stft(signal.samples, DEFAULT_WINDOW_SIZE, DEFAULT_HOP_LENGTH);
        NoiseSuppressor::gate(spectrum, wrong, 1.5f);
    } catch (const InvalidParameterError&) { rejected++; }

    try { estimateNoise(AudioSignal({}, 16000)); } catch (const InvalidParameterError&) { rejected++; }

    std::cout << "  Rejected: " << rejected << "/3" << std::endl;

    return rejected == 3;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Signal Preparation Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 13;

    // AudioLoader tests
    std::cout << "\n--- AudioLoader Tests ---" << std::endl;
    if (testConvertToMono()) passed++;
    if (testLoadWavMemory()) passed++;
    if (testLoadWavQuiet()) passed++;
    if (testLoadWavFile()) passed++;
    if (testLoadWavInvalid()) passed++;

    // CoughSegmenter tests
    std::cout << "\n--- CoughSegmenter Tests ---" << std::endl;
    if (testImpulseSegment()) passed++;
    if (testTruncatedSegment()) passed++;
    if (testNoActivity()) passed++;
    if (testSegmenterInvalidParameters()) passed++;

    // NoiseSuppressor tests
    std::cout << "\n--- NoiseSuppressor Tests ---" << std::endl;
    if (testNoiseFloorNonNegative()) passed++;
    if (testNoiseReduction()) passed++;
    if (testShortNoiseReference()) passed++;
    if (testNoiseInvalidParameters()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
