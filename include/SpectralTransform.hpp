/**
 * @file SpectralTransform.hpp
 * @brief Short-Time Fourier Transform (STFT) và biến đổi ngược (ISTFT)
 *
 * Nền tảng cho mọi xử lý miền tần số trong pipeline phân loại tiếng ho:
 * spectral gating (NoiseSuppressor) và mel-spectrogram (MelFeaturizer).
 *
 * Quy ước:
 * - Cửa sổ Hann dạng periodic, kích thước FFT = kích thước cửa sổ
 * - Framing dạng "centered": tín hiệu được pad 0 mỗi bên windowSize/2 mẫu,
 *   nên tín hiệu ngắn hơn một cửa sổ vẫn cho ra ít nhất một frame
 * - ISTFT dùng weighted overlap-add, chuẩn hóa bởi window sum-square
 *
 * FFT được tính bằng FFTW3 (single precision).
 *
 * @author Research Team
 * @date 2026
 */

#ifndef SPECTRAL_TRANSFORM_HPP
#define SPECTRAL_TRANSFORM_HPP

#include "Common.h"

#include <vector>
#include <complex>
#include <memory>
#include <cstddef>

namespace cough {

// ============================================================================
// CONSTANTS
// ============================================================================

/// Kích thước cửa sổ STFT mặc định (samples)
constexpr int DEFAULT_WINDOW_SIZE = 2048;

/// Hop length mặc định = windowSize / 4
constexpr int DEFAULT_HOP_LENGTH = DEFAULT_WINDOW_SIZE / 4;

/// Sai số round-trip tối đa cho phép (mean absolute error)
constexpr float ROUND_TRIP_TOLERANCE = 1e-3f;

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct StftConfig
 * @brief Cấu hình cho STFT
 */
struct StftConfig {
    int windowSize = DEFAULT_WINDOW_SIZE;   ///< Kích thước cửa sổ / FFT
    int hopLength = DEFAULT_HOP_LENGTH;     ///< Bước nhảy giữa các frame

    StftConfig() = default;
};

/**
 * @struct SpectrumFrame
 * @brief Ma trận phổ phức, chỉ số (frequency bin, time frame)
 *
 * Dữ liệu lưu theo bin-major: data[bin * numFrames + frame].
 * Magnitude và phase là các view được suy ra, không lưu riêng.
 */
struct SpectrumFrame {
    std::vector<std::complex<float>> data;
    int numBins;            ///< windowSize / 2 + 1
    int numFrames;          ///< Số frame thời gian
    int windowSize;         ///< Kích thước cửa sổ đã dùng
    int hopLength;          ///< Hop length đã dùng

    SpectrumFrame() : numBins(0), numFrames(0), windowSize(0), hopLength(0) {}

    /**
     * @brief Cấp phát bộ nhớ cho bins x frames
     */
    void allocate(int bins, int frames) {
        numBins = bins;
        numFrames = frames;
        data.assign(static_cast<size_t>(bins) * frames, std::complex<float>(0.0f, 0.0f));
    }

    std::complex<float>& at(int bin, int frame) {
        return data[static_cast<size_t>(bin) * numFrames + frame];
    }

    const std::complex<float>& at(int bin, int frame) const {
        return data[static_cast<size_t>(bin) * numFrames + frame];
    }

    float magnitude(int bin, int frame) const { return std::abs(at(bin, frame)); }

    float phase(int bin, int frame) const { return std::arg(at(bin, frame)); }

    float power(int bin, int frame) const { return std::norm(at(bin, frame)); }

    bool empty() const { return data.empty(); }
};

// ============================================================================
// SPECTRAL TRANSFORM CLASS
// ============================================================================

// Forward declaration (ẩn chi tiết FFTW plans)
struct FftPlans;

/**
 * @class SpectralTransform
 * @brief STFT / ISTFT với kích thước cửa sổ cố định
 *
 * FFTW plans được tạo một lần trong constructor và chỉ được thực thi
 * qua new-array execute API, nên một instance có thể dùng đồng thời
 * từ nhiều thread.
 */
class SpectralTransform {
public:
    /**
     * @brief Constructor - tạo cửa sổ Hann và FFTW plans
     * @param windowSize Kích thước cửa sổ (> 0)
     * @throws InvalidParameterError nếu windowSize <= 0
     */
    explicit SpectralTransform(int windowSize = DEFAULT_WINDOW_SIZE);

    ~SpectralTransform();

    SpectralTransform(const SpectralTransform&) = delete;
    SpectralTransform& operator=(const SpectralTransform&) = delete;

    SpectralTransform(SpectralTransform&&) noexcept;
    SpectralTransform& operator=(SpectralTransform&&) noexcept;

    /**
     * @brief Tính STFT của tín hiệu
     *
     * @param signal Tín hiệu miền thời gian (không rỗng)
     * @param hopLength Bước nhảy (0 < hop <= windowSize)
     * @return Phổ phức (windowSize/2+1) x numFrames
     * @throws InvalidParameterError nếu tham số sai hoặc tín hiệu rỗng
     */
    SpectrumFrame stft(const std::vector<float>& signal, int hopLength) const;

    /**
     * @brief Biến đổi ngược, tái tạo tín hiệu miền thời gian
     *
     * @param spectrum Phổ phức với windowSize trùng instance này
     * @param hopLength Bước nhảy đã dùng khi phân tích
     * @param length Độ dài mong muốn (0 = hop * (numFrames - 1))
     * @return Tín hiệu tái tạo
     */
    std::vector<float> istft(const SpectrumFrame& spectrum, int hopLength,
                             size_t length = 0) const;

    int windowSize() const { return m_windowSize; }

    int numBins() const { return m_windowSize / 2 + 1; }

    const std::vector<float>& window() const { return m_window; }

    /**
     * @brief Kiểm tra tham số STFT
     * @throws InvalidParameterError
     */
    static void validateParameters(int windowSize, int hopLength);

    /**
     * @brief Số frame cho tín hiệu độ dài length (centered framing)
     */
    static int frameCount(size_t length, int windowSize, int hopLength);

private:
    void initHannWindow();

    int m_windowSize;
    std::vector<float> m_window;
    std::unique_ptr<FftPlans> m_plans;
};

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

/**
 * @brief stft(signal, window_size, hop_length)
 */
SpectrumFrame stft(const std::vector<float>& signal, int windowSize, int hopLength);

/**
 * @brief istft(spectrum, hop_length) - windowSize lấy từ spectrum
 */
std::vector<float> istft(const SpectrumFrame& spectrum, int hopLength, size_t length = 0);

} // namespace cough

#endif // SPECTRAL_TRANSFORM_HPP
