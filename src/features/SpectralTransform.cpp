/**
 * @file SpectralTransform.cpp
 * @brief Implementation of STFT / ISTFT using FFTW3
 *
 * @author Research Team
 * @date 2026
 */

#include "SpectralTransform.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <string>

#include <fftw3.h>

namespace cough {

namespace {

// FFTW planner không thread-safe, chỉ execute là an toàn
std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

// ============================================================================
// FFTW PLANS (PIMPL)
// ============================================================================

struct FftPlans {
    fftwf_plan forward = nullptr;   ///< real -> complex, kích thước n
    fftwf_plan inverse = nullptr;   ///< complex -> real, kích thước n

    explicit FftPlans(int n) {
        std::lock_guard<std::mutex> lock(plannerMutex());

        float* real = fftwf_alloc_real(n);
        fftwf_complex* freq = fftwf_alloc_complex(n / 2 + 1);

        // FFTW_UNALIGNED: buffers trong stft/istft được cấp phát riêng mỗi thread
        forward = fftwf_plan_dft_r2c_1d(n, real, freq, FFTW_ESTIMATE | FFTW_UNALIGNED);
        inverse = fftwf_plan_dft_c2r_1d(n, freq, real, FFTW_ESTIMATE | FFTW_UNALIGNED);

        fftwf_free(real);
        fftwf_free(freq);
    }

    ~FftPlans() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (forward) fftwf_destroy_plan(forward);
        if (inverse) fftwf_destroy_plan(inverse);
    }

    FftPlans(const FftPlans&) = delete;
    FftPlans& operator=(const FftPlans&) = delete;
};

// ============================================================================
// CONSTRUCTOR & DESTRUCTOR
// ============================================================================

SpectralTransform::SpectralTransform(int windowSize)
    : m_windowSize(windowSize)
{
    if (windowSize <= 0) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "window size must be positive, got " + std::to_string(windowSize));
    }

    initHannWindow();
    m_plans = std::make_unique<FftPlans>(m_windowSize);

    if (!m_plans->forward || !m_plans->inverse) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "FFTW could not create plans for size " + std::to_string(windowSize));
    }
}

SpectralTransform::~SpectralTransform() = default;

SpectralTransform::SpectralTransform(SpectralTransform&&) noexcept = default;
SpectralTransform& SpectralTransform::operator=(SpectralTransform&&) noexcept = default;

void SpectralTransform::initHannWindow() {
    /**
     * Periodic Hann window: w[n] = 0.5 - 0.5 * cos(2πn / N)
     *
     * Dạng periodic (chia cho N, không phải N-1) cho tổng bình phương
     * hằng số khi hop = N/4, cần cho tái tạo chính xác trong ISTFT.
     */

    m_window.resize(m_windowSize);

    for (int n = 0; n < m_windowSize; ++n) {
        m_window[n] = static_cast<float>(
            0.5 - 0.5 * std::cos(2.0 * PI * n / m_windowSize));
    }
}

// ============================================================================
// PARAMETER VALIDATION
// ============================================================================

void SpectralTransform::validateParameters(int windowSize, int hopLength) {
    if (windowSize <= 0) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "window size must be positive, got " + std::to_string(windowSize));
    }
    if (hopLength <= 0) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "hop length must be positive, got " + std::to_string(hopLength));
    }
    if (hopLength > windowSize) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "hop length " + std::to_string(hopLength) +
            " exceeds window size " + std::to_string(windowSize));
    }
}

int SpectralTransform::frameCount(size_t length, int windowSize, int hopLength) {
    // Sau khi pad windowSize/2 mỗi bên
    size_t padded = length + 2 * static_cast<size_t>(windowSize / 2);
    if (padded < static_cast<size_t>(windowSize)) {
        return 1;
    }
    return 1 + static_cast<int>((padded - windowSize) / hopLength);
}

// ============================================================================
// FORWARD TRANSFORM
// ============================================================================

SpectrumFrame SpectralTransform::stft(const std::vector<float>& signal, int hopLength) const {
    /**
     * Quy trình:
     * 1. Pad 0 mỗi bên windowSize/2 mẫu (centered framing)
     * 2. Với mỗi frame: nhân cửa sổ Hann, FFT thực -> phức
     * 3. Lưu nửa phổ dương (windowSize/2 + 1 bins)
     */

    validateParameters(m_windowSize, hopLength);

    if (signal.empty()) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
                                    "cannot transform an empty signal");
    }

    const int n = m_windowSize;
    const int pad = n / 2;
    const int bins = numBins();

    // ----- BƯỚC 1: Centered padding -----
    std::vector<float> padded(signal.size() + 2 * static_cast<size_t>(pad), 0.0f);
    std::copy(signal.begin(), signal.end(), padded.begin() + pad);

    const int frames = frameCount(signal.size(), n, hopLength);

    SpectrumFrame spectrum;
    spectrum.windowSize = n;
    spectrum.hopLength = hopLength;
    spectrum.allocate(bins, frames);

    // ----- BƯỚC 2 + 3: FFT từng frame -----
    // Mỗi frame chỉ ghi vào cột của nó, kết quả giống hệt khi chạy tuần tự
    #pragma omp parallel
    {
        float* frameIn = fftwf_alloc_real(n);
        fftwf_complex* frameOut = fftwf_alloc_complex(bins);

        #pragma omp for schedule(static)
        for (int f = 0; f < frames; ++f) {
            const size_t start = static_cast<size_t>(f) * hopLength;

            for (int i = 0; i < n; ++i) {
                size_t idx = start + i;
                frameIn[i] = idx < padded.size() ? padded[idx] * m_window[i] : 0.0f;
            }

            fftwf_execute_dft_r2c(m_plans->forward, frameIn, frameOut);

            for (int k = 0; k < bins; ++k) {
                spectrum.at(k, f) = std::complex<float>(frameOut[k][0], frameOut[k][1]);
            }
        }

        fftwf_free(frameIn);
        fftwf_free(frameOut);
    }

    return spectrum;
}

// ============================================================================
// INVERSE TRANSFORM
// ============================================================================

std::vector<float> SpectralTransform::istft(const SpectrumFrame& spectrum,
                                            int hopLength,
                                            size_t length) const {
    /**
     * Weighted overlap-add:
     *   y[t] = sum_f w[t - f*hop] * x_f[t - f*hop] / sum_f w[t - f*hop]^2
     *
     * Chia cho window sum-square bù lại năng lượng bị cửa sổ làm giảm,
     * kể cả tại hai biên của tín hiệu. Những vị trí có tổng gần 0
     * được giữ nguyên (không chia).
     */

    validateParameters(m_windowSize, hopLength);

    if (spectrum.empty() || spectrum.numFrames <= 0) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
                                    "cannot invert an empty spectrum");
    }
    if (spectrum.numBins != numBins()) {
        throw InvalidParameterError(ProcessingStage::TRANSFORMING,
            "spectrum has " + std::to_string(spectrum.numBins) +
            " bins, transform expects " + std::to_string(numBins()));
    }

    const int n = m_windowSize;
    const int bins = numBins();
    const int frames = spectrum.numFrames;
    const float scale = 1.0f / static_cast<float>(n);

    // ----- BƯỚC 1: IFFT từng frame, nhân cửa sổ tổng hợp -----
    std::vector<float> frameBuffer(static_cast<size_t>(frames) * n, 0.0f);

    #pragma omp parallel
    {
        fftwf_complex* frameIn = fftwf_alloc_complex(bins);
        float* frameOut = fftwf_alloc_real(n);

        #pragma omp for schedule(static)
        for (int f = 0; f < frames; ++f) {
            for (int k = 0; k < bins; ++k) {
                const auto& c = spectrum.at(k, f);
                frameIn[k][0] = c.real();
                frameIn[k][1] = c.imag();
            }

            // c2r ghi đè input, frameIn được nạp lại mỗi vòng
            fftwf_execute_dft_c2r(m_plans->inverse, frameIn, frameOut);

            float* dst = frameBuffer.data() + static_cast<size_t>(f) * n;
            for (int i = 0; i < n; ++i) {
                dst[i] = frameOut[i] * scale * m_window[i];
            }
        }

        fftwf_free(frameIn);
        fftwf_free(frameOut);
    }

    // ----- BƯỚC 2: Overlap-add (tuần tự vì các frame chồng lấp) -----
    const size_t expectedLen = static_cast<size_t>(n) + static_cast<size_t>(hopLength) * (frames - 1);
    std::vector<float> y(expectedLen, 0.0f);
    std::vector<float> windowSumSquare(expectedLen, 0.0f);

    for (int f = 0; f < frames; ++f) {
        const size_t start = static_cast<size_t>(f) * hopLength;
        const float* src = frameBuffer.data() + static_cast<size_t>(f) * n;

        for (int i = 0; i < n; ++i) {
            y[start + i] += src[i];
            windowSumSquare[start + i] += m_window[i] * m_window[i];
        }
    }

    // ----- BƯỚC 3: Chuẩn hóa bởi window sum-square -----
    const float tiny = std::numeric_limits<float>::min();
    for (size_t t = 0; t < expectedLen; ++t) {
        if (windowSumSquare[t] > tiny) {
            y[t] /= windowSumSquare[t];
        }
    }

    // ----- BƯỚC 4: Cắt phần pad của centered framing -----
    const size_t start = static_cast<size_t>(n / 2);
    const size_t natural = expectedLen > 2 * start ? expectedLen - 2 * start : 0;
    const size_t outLen = length > 0 ? length : natural;

    std::vector<float> output(outLen, 0.0f);
    for (size_t i = 0; i < outLen && start + i < expectedLen; ++i) {
        output[i] = y[start + i];
    }

    return output;
}

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

SpectrumFrame stft(const std::vector<float>& signal, int windowSize, int hopLength) {
    SpectralTransform::validateParameters(windowSize, hopLength);
    SpectralTransform transform(windowSize);
    return transform.stft(signal, hopLength);
}

std::vector<float> istft(const SpectrumFrame& spectrum, int hopLength, size_t length) {
    SpectralTransform::validateParameters(spectrum.windowSize, hopLength);
    SpectralTransform transform(spectrum.windowSize);
    return transform.istft(spectrum, hopLength, length);
}

} // namespace cough
