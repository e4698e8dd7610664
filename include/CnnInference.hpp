/**
 * @file CnnInference.hpp
 * @brief CNN inference and classification for cough mel-spectrograms
 *
 * Module này nhận FeatureTensor (1, 1, nMels, T) từ MelFeaturizer và
 * trả về nhãn dự đoán cùng phân phối xác suất trên các class.
 *
 * Kiến trúc:
 * - InferenceBackend: interface hẹp "tensor -> logits", forward là const
 * - OnnxBackend: ONNX Runtime session (PIMPL), load một lần, chỉ đọc
 * - CallbackBackend: std::function cho model in-process và test
 * - ClassificationEngine: softmax + arg-max (hòa thì chọn index nhỏ nhất)
 *
 * Backend là đối tượng duy nhất được chia sẻ giữa các request. Sau khi
 * load nó không thay đổi, nên classify() có thể gọi đồng thời.
 *
 * @author Research Team
 * @date 2026
 */

#ifndef CNN_INFERENCE_HPP
#define CNN_INFERENCE_HPP

#include "Common.h"
#include "FeatureExtraction.h"

#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <utility>
#include <cstdint>

namespace cough {

// Forward declaration for PIMPL pattern (hide ONNX Runtime details)
class OnnxBackendImpl;

// ============================================================================
// CONSTANTS
// ============================================================================

/// Số channel input (mel-spectrogram một kênh)
constexpr int CNN_INPUT_CHANNELS = 1;

/// Rank của tensor input (N, C, H, W)
constexpr int CNN_INPUT_RANK = 4;

/**
 * @brief Từ vựng class mặc định, đúng thứ tự output của model
 */
inline std::vector<std::string> defaultClassNames() {
    return {"neither", "viral", "bacterial"};
}

// ============================================================================
// ENUMS
// ============================================================================

/**
 * @enum ExecutionProvider
 * @brief Thiết bị chạy inference
 */
enum class ExecutionProvider {
    CPU,                ///< CPU inference
    CUDA                ///< NVIDIA GPU (nếu ONNX Runtime build có CUDA)
};

std::string providerToString(ExecutionProvider provider);

// ============================================================================
// DATA STRUCTURES
// ============================================================================

/**
 * @struct BackendConfig
 * @brief Cấu hình cho OnnxBackend
 *
 * Chọn thiết bị tường minh qua provider, không có trạng thái toàn cục.
 */
struct BackendConfig {
    std::string modelPath;                          ///< Đường dẫn file ONNX model
    ExecutionProvider provider = ExecutionProvider::CPU;
    int numThreads = 1;                             ///< Số threads cho CPU inference
    int deviceId = 0;                               ///< GPU id khi provider = CUDA
    bool enableMemoryArena = true;                  ///< Tối ưu memory allocation
    bool verbose = true;                            ///< In thông tin model khi load

    BackendConfig() = default;
};

/**
 * @struct ModelInfo
 * @brief Thông tin về model đã load
 *
 * Chiều động (dynamic axis) được ONNX Runtime báo là -1.
 */
struct ModelInfo {
    std::vector<std::string> inputNames;
    std::vector<std::string> outputNames;

    std::vector<std::vector<int64_t>> inputShapes;
    std::vector<std::vector<int64_t>> outputShapes;
};

/**
 * @struct ClassificationResult
 * @brief Kết quả phân loại một đoạn ho
 */
struct ClassificationResult {
    std::string label;                                          ///< Class dự đoán
    int predictedIndex;                                         ///< Index của class dự đoán
    float confidence;                                           ///< Xác suất của class dự đoán
    std::vector<std::pair<std::string, float>> probabilities;   ///< Theo thứ tự từ vựng
    float inferenceTimeMs;                                      ///< Thời gian forward (ms)

    ClassificationResult() : predictedIndex(-1), confidence(0.0f), inferenceTimeMs(0.0f) {}

    /**
     * @brief Xác suất của một class theo tên
     * @throws InvalidParameterError nếu tên không có trong từ vựng
     */
    float probabilityOf(const std::string& className) const;

    /**
     * @brief Mô tả kết quả
     */
    std::string describe() const;
};

// ============================================================================
// INFERENCE BACKENDS
// ============================================================================

/**
 * @class InferenceBackend
 * @brief Interface model: tensor cố định shape -> vector logits
 */
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    /**
     * @brief Forward pass
     * @param tensor Mel-spectrogram (1, 1, nMels, T)
     * @return Logits (chưa softmax)
     */
    virtual std::vector<float> forward(const FeatureTensor& tensor) const = 0;

    /**
     * @brief Kiểm tra tensor có khớp input khai báo của model không
     * @throws ModelShapeError
     */
    virtual void validateInput(const FeatureTensor& tensor) const;

    /**
     * @brief Số logits model khai báo, -1 nếu không biết trước
     */
    virtual int64_t outputWidth() const { return -1; }

    virtual std::string name() const = 0;
};

/**
 * @class OnnxBackend
 * @brief Backend dùng ONNX Runtime C++ API
 *
 * Session được tạo trong constructor và không thay đổi sau đó.
 * Ort::Session::Run an toàn khi gọi đồng thời.
 */
class OnnxBackend : public InferenceBackend {
public:
    /**
     * @brief Load model ONNX
     * @throws ModelLoadError nếu không mở/parse được file hoặc provider không có
     * @throws ModelShapeError nếu model không có đúng một input/output tensor
     */
    explicit OnnxBackend(const BackendConfig& config);

    ~OnnxBackend() override;

    OnnxBackend(const OnnxBackend&) = delete;
    OnnxBackend& operator=(const OnnxBackend&) = delete;

    std::vector<float> forward(const FeatureTensor& tensor) const override;

    /**
     * @brief checkInputShape() với shape input khai báo trong model
     */
    void validateInput(const FeatureTensor& tensor) const override;

    /**
     * @brief Chiều cuối của output đầu tiên nếu cố định, ngược lại -1
     */
    int64_t outputWidth() const override;

    std::string name() const override { return "onnx:" + providerToString(m_config.provider); }

    const ModelInfo& getModelInfo() const { return m_modelInfo; }
    const BackendConfig& getConfig() const { return m_config; }

private:
    BackendConfig m_config;
    ModelInfo m_modelInfo;
    std::unique_ptr<OnnxBackendImpl> m_impl;
};

/**
 * @brief Callback inference tùy chỉnh (model in-process, test)
 */
using CustomInferenceCallback = std::function<std::vector<float>(const FeatureTensor&)>;

/**
 * @class CallbackBackend
 * @brief Bọc một CustomInferenceCallback thành InferenceBackend
 *
 * Callback phải an toàn khi gọi đồng thời nếu backend được chia sẻ.
 */
class CallbackBackend : public InferenceBackend {
public:
    /**
     * @param outputWidth Số logits callback trả về, -1 nếu không khai báo
     */
    explicit CallbackBackend(CustomInferenceCallback callback,
                             std::string name = "callback",
                             int64_t outputWidth = -1);

    std::vector<float> forward(const FeatureTensor& tensor) const override;

    int64_t outputWidth() const override { return m_outputWidth; }

    std::string name() const override { return m_name; }

private:
    CustomInferenceCallback m_callback;
    std::string m_name;
    int64_t m_outputWidth;
};

// ============================================================================
// CLASSIFICATION ENGINE
// ============================================================================

/**
 * @class ClassificationEngine
 * @brief Forward + softmax + arg-max trên một backend và từ vựng cố định
 */
class ClassificationEngine {
public:
    /**
     * @throws InvalidParameterError nếu backend null, từ vựng rỗng hoặc trùng tên
     * @throws ModelShapeError nếu outputWidth() của backend khác số class
     */
    ClassificationEngine(std::shared_ptr<const InferenceBackend> backend,
                         std::vector<std::string> classNames = defaultClassNames());

    /**
     * @brief Phân loại một FeatureTensor
     * @throws ModelShapeError nếu shape input sai hoặc số logits != số class
     */
    ClassificationResult classify(const FeatureTensor& tensor) const;

    const std::vector<std::string>& getClassNames() const { return m_classNames; }
    const InferenceBackend& getBackend() const { return *m_backend; }

    /**
     * @brief Softmax với max-subtraction
     */
    static std::vector<float> softmax(const std::vector<float>& logits);

    /**
     * @brief Index của phần tử lớn nhất, hòa thì chọn index nhỏ nhất
     */
    static int argMax(const std::vector<float>& values);

    /**
     * @brief Từ vựng phải không rỗng và không trùng tên
     * @throws InvalidParameterError
     */
    static void validateClassNames(const std::vector<std::string>& classNames);

private:
    std::shared_ptr<const InferenceBackend> m_backend;
    std::vector<std::string> m_classNames;
};

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

/**
 * @brief classify(feature_tensor, model, class_names)
 */
ClassificationResult classify(const FeatureTensor& tensor,
                              const InferenceBackend& backend,
                              const std::vector<std::string>& classNames = defaultClassNames());

/**
 * @brief Kiểm tra shape input khai báo của model với FeatureTensor
 *
 * Rank phải là 4, channel cố định phải bằng 1, các chiều cố định khác
 * phải khớp tensor. Chiều < 0 là dynamic axis và luôn được chấp nhận.
 *
 * @throws ModelShapeError
 */
void checkInputShape(const std::vector<int64_t>& declared, const FeatureTensor& tensor);

/**
 * @brief Các execution provider mà ONNX Runtime hiện tại hỗ trợ
 */
std::vector<ExecutionProvider> getSupportedProviders();

} // namespace cough

#endif // CNN_INFERENCE_HPP
