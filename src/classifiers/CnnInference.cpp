/**
 * @file CnnInference.cpp
 * @brief Implementation of CNN inference and classification
 *
 * Triển khai inference với:
 * - ONNX Runtime C++ API (OnnxBackend)
 * - Custom callback interface (CallbackBackend)
 *
 * @author Research Team
 * @date 2026
 */

#include "CnnInference.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <set>
#include <sstream>

#include <onnxruntime_cxx_api.h>

namespace cough {

namespace {

std::string shapeToString(const std::vector<int64_t>& shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        oss << shape[i];
        if (i + 1 < shape.size()) oss << ", ";
    }
    oss << ")";
    return oss.str();
}

/**
 * @brief Forward + softmax + arg-max, dùng chung cho engine và hàm tự do
 */
ClassificationResult runClassification(const FeatureTensor& tensor,
                                       const InferenceBackend& backend,
                                       const std::vector<std::string>& classNames) {
    if (tensor.empty() || tensor.size() != static_cast<size_t>(tensor.nMels) * tensor.timeSteps) {
        throw ModelShapeError("feature tensor is empty or inconsistent with its shape");
    }

    backend.validateInput(tensor);

    auto startTime = std::chrono::high_resolution_clock::now();
    std::vector<float> logits = backend.forward(tensor);
    auto endTime = std::chrono::high_resolution_clock::now();

    if (logits.size() != classNames.size()) {
        throw ModelShapeError("model produced " + std::to_string(logits.size()) +
                              " logits for " + std::to_string(classNames.size()) + " classes");
    }

    for (float v : logits) {
        if (!std::isfinite(v)) {
            throw PipelineError(ProcessingStage::CLASSIFYING, "model produced non-finite logits");
        }
    }

    std::vector<float> probs = ClassificationEngine::softmax(logits);
    int maxIdx = ClassificationEngine::argMax(probs);

    ClassificationResult result;
    result.predictedIndex = maxIdx;
    result.label = classNames[maxIdx];
    result.confidence = probs[maxIdx];
    result.inferenceTimeMs = std::chrono::duration<float, std::milli>(endTime - startTime).count();

    result.probabilities.reserve(classNames.size());
    for (size_t i = 0; i < classNames.size(); ++i) {
        result.probabilities.emplace_back(classNames[i], probs[i]);
    }

    return result;
}

} // namespace

// ============================================================================
// PIMPL IMPLEMENTATION CLASS
// ============================================================================

/**
 * @class OnnxBackendImpl
 * @brief PIMPL class hiding ONNX Runtime details
 */
class OnnxBackendImpl {
public:
    std::unique_ptr<Ort::Env> env;
    std::unique_ptr<Ort::Session> session;
    std::unique_ptr<Ort::SessionOptions> sessionOptions;

    std::vector<const char*> inputNames;
    std::vector<const char*> outputNames;

    Ort::AllocatorWithDefaultOptions allocator;
};

// ============================================================================
// UTILITY FUNCTIONS IMPLEMENTATION
// ============================================================================

std::string providerToString(ExecutionProvider provider) {
    switch (provider) {
        case ExecutionProvider::CPU: return "cpu";
        case ExecutionProvider::CUDA: return "cuda";
        default: return "unknown";
    }
}

// ============================================================================
// CLASSIFICATION RESULT IMPLEMENTATION
// ============================================================================

float ClassificationResult::probabilityOf(const std::string& className) const {
    for (const auto& entry : probabilities) {
        if (entry.first == className) {
            return entry.second;
        }
    }
    throw InvalidParameterError(ProcessingStage::CLASSIFYING,
                                "unknown class name: " + className);
}

std::string ClassificationResult::describe() const {
    std::ostringstream oss;
    oss << "Prediction: " << label
        << " (confidence: " << std::fixed << std::setprecision(3) << confidence << ")"
        << ", inference time: " << inferenceTimeMs << " ms";

    oss << "\n  Probabilities: [";
    for (size_t i = 0; i < probabilities.size(); ++i) {
        oss << probabilities[i].first << "=" << std::setprecision(3) << probabilities[i].second;
        if (i + 1 < probabilities.size()) oss << ", ";
    }
    oss << "]";

    return oss.str();
}

// ============================================================================
// INFERENCE BACKEND
// ============================================================================

void InferenceBackend::validateInput(const FeatureTensor& tensor) const {
    (void)tensor;
}

// ============================================================================
// ONNX BACKEND IMPLEMENTATION
// ============================================================================

OnnxBackend::OnnxBackend(const BackendConfig& config)
    : m_config(config)
    , m_impl(std::make_unique<OnnxBackendImpl>())
{
    if (config.modelPath.empty()) {
        throw ModelLoadError("model path is empty");
    }
    if (config.numThreads < 0) {
        throw InvalidParameterError(ProcessingStage::LOADING,
            "thread count must be non-negative, got " + std::to_string(config.numThreads));
    }

    try {
        // Create ONNX Runtime environment
        m_impl->env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "CoughClassifier");

        // Session options
        m_impl->sessionOptions = std::make_unique<Ort::SessionOptions>();
        m_impl->sessionOptions->SetIntraOpNumThreads(config.numThreads);
        m_impl->sessionOptions->SetGraphOptimizationLevel(
            GraphOptimizationLevel::ORT_ENABLE_ALL);

        if (config.enableMemoryArena) {
            m_impl->sessionOptions->EnableMemPattern();
            m_impl->sessionOptions->EnableCpuMemArena();
        }

        if (config.provider == ExecutionProvider::CUDA) {
            auto providers = getSupportedProviders();
            if (std::find(providers.begin(), providers.end(), ExecutionProvider::CUDA) ==
                providers.end()) {
                throw ModelLoadError("CUDA execution provider is not available in this "
                                     "ONNX Runtime build");
            }

            OrtCUDAProviderOptions cudaOptions;
            cudaOptions.device_id = config.deviceId;
            m_impl->sessionOptions->AppendExecutionProvider_CUDA(cudaOptions);
        }

        // Create session
        m_impl->session = std::make_unique<Ort::Session>(
            *m_impl->env, config.modelPath.c_str(), *m_impl->sessionOptions);

        // Get input/output info
        size_t numInputs = m_impl->session->GetInputCount();
        size_t numOutputs = m_impl->session->GetOutputCount();

        for (size_t i = 0; i < numInputs; ++i) {
            auto inputName = m_impl->session->GetInputNameAllocated(i, m_impl->allocator);
            m_modelInfo.inputNames.push_back(inputName.get());

            auto inputInfo = m_impl->session->GetInputTypeInfo(i);
            auto tensorInfo = inputInfo.GetTensorTypeAndShapeInfo();
            m_modelInfo.inputShapes.push_back(tensorInfo.GetShape());
        }

        for (size_t i = 0; i < numOutputs; ++i) {
            auto outputName = m_impl->session->GetOutputNameAllocated(i, m_impl->allocator);
            m_modelInfo.outputNames.push_back(outputName.get());

            auto outputInfo = m_impl->session->GetOutputTypeInfo(i);
            auto tensorInfo = outputInfo.GetTensorTypeAndShapeInfo();
            m_modelInfo.outputShapes.push_back(tensorInfo.GetShape());
        }
    }
    catch (const Ort::Exception& e) {
        throw ModelLoadError("ONNX Runtime could not load " + config.modelPath + ": " + e.what());
    }

    if (m_modelInfo.inputNames.size() != 1 || m_modelInfo.outputNames.empty()) {
        throw ModelShapeError("expected exactly one input and at least one output, model has " +
                              std::to_string(m_modelInfo.inputNames.size()) + " inputs and " +
                              std::to_string(m_modelInfo.outputNames.size()) + " outputs");
    }

    // Con trỏ tên chỉ lấy sau khi các vector string đã cố định
    for (const auto& n : m_modelInfo.inputNames) {
        m_impl->inputNames.push_back(n.c_str());
    }
    m_impl->outputNames.push_back(m_modelInfo.outputNames.front().c_str());

    if (config.verbose) {
        std::cout << "[ClassificationEngine] Model loaded successfully: " << config.modelPath << "\n";
        std::cout << "  Provider: " << providerToString(config.provider)
                  << ", input " << m_modelInfo.inputNames.front()
                  << " " << shapeToString(m_modelInfo.inputShapes.front())
                  << ", output " << m_modelInfo.outputNames.front()
                  << " " << shapeToString(m_modelInfo.outputShapes.front()) << "\n";
    }
}

OnnxBackend::~OnnxBackend() = default;

void OnnxBackend::validateInput(const FeatureTensor& tensor) const {
    checkInputShape(m_modelInfo.inputShapes.front(), tensor);
}

int64_t OnnxBackend::outputWidth() const {
    const std::vector<int64_t>& declared = m_modelInfo.outputShapes.front();
    if (declared.empty() || declared.back() < 0) {
        return -1;
    }
    return declared.back();
}

std::vector<float> OnnxBackend::forward(const FeatureTensor& tensor) const {
    const auto shape = tensor.shape();
    std::vector<int64_t> inputShape(shape.begin(), shape.end());

    try {
        auto memoryInfo = Ort::MemoryInfo::CreateCpu(
            OrtArenaAllocator, OrtMemTypeDefault);

        // Input chỉ được đọc
        auto inputTensor = Ort::Value::CreateTensor<float>(
            memoryInfo, const_cast<float*>(tensor.data.data()), tensor.data.size(),
            inputShape.data(), inputShape.size());

        // Run inference
        auto outputTensors = m_impl->session->Run(
            Ort::RunOptions{nullptr},
            m_impl->inputNames.data(), &inputTensor, 1,
            m_impl->outputNames.data(), m_impl->outputNames.size());

        // Get output
        auto& outputTensor = outputTensors[0];
        auto* outputData = outputTensor.GetTensorData<float>();
        auto outputInfo = outputTensor.GetTensorTypeAndShapeInfo();
        size_t outputSize = outputInfo.GetElementCount();

        return std::vector<float>(outputData, outputData + outputSize);
    }
    catch (const Ort::Exception& e) {
        throw PipelineError(ProcessingStage::CLASSIFYING,
                            std::string("ONNX Runtime inference failed: ") + e.what());
    }
}

// ============================================================================
// CALLBACK BACKEND IMPLEMENTATION
// ============================================================================

CallbackBackend::CallbackBackend(CustomInferenceCallback callback, std::string name,
                                 int64_t outputWidth)
    : m_callback(std::move(callback))
    , m_name(std::move(name))
    , m_outputWidth(outputWidth)
{
    if (!m_callback) {
        throw InvalidParameterError(ProcessingStage::CLASSIFYING,
                                    "inference callback is empty");
    }
}

std::vector<float> CallbackBackend::forward(const FeatureTensor& tensor) const {
    return m_callback(tensor);
}

// ============================================================================
// CLASSIFICATION ENGINE IMPLEMENTATION
// ============================================================================

ClassificationEngine::ClassificationEngine(std::shared_ptr<const InferenceBackend> backend,
                                           std::vector<std::string> classNames)
    : m_backend(std::move(backend))
    , m_classNames(std::move(classNames))
{
    if (!m_backend) {
        throw InvalidParameterError(ProcessingStage::CLASSIFYING, "inference backend is null");
    }
    validateClassNames(m_classNames);

    // Lỗi cấu hình: báo ngay, không đợi đến lần forward đầu tiên
    const int64_t width = m_backend->outputWidth();
    if (width >= 0 && width != static_cast<int64_t>(m_classNames.size())) {
        throw ModelShapeError("model " + m_backend->name() + " declares " +
                              std::to_string(width) + " outputs for " +
                              std::to_string(m_classNames.size()) + " classes");
    }
}

void ClassificationEngine::validateClassNames(const std::vector<std::string>& classNames) {
    if (classNames.empty()) {
        throw InvalidParameterError(ProcessingStage::CLASSIFYING,
                                    "class vocabulary is empty");
    }

    std::set<std::string> seen;
    for (const auto& name : classNames) {
        if (!seen.insert(name).second) {
            throw InvalidParameterError(ProcessingStage::CLASSIFYING,
                                        "duplicate class name: " + name);
        }
    }
}

ClassificationResult ClassificationEngine::classify(const FeatureTensor& tensor) const {
    return runClassification(tensor, *m_backend, m_classNames);
}

std::vector<float> ClassificationEngine::softmax(const std::vector<float>& logits) {
    if (logits.empty()) {
        return {};
    }

    std::vector<float> probs(logits.size());

    // Find max for numerical stability
    float maxLogit = *std::max_element(logits.begin(), logits.end());

    // Compute exp and sum
    double sumExp = 0.0;
    for (size_t i = 0; i < logits.size(); ++i) {
        probs[i] = std::exp(logits[i] - maxLogit);
        sumExp += probs[i];
    }

    // Normalize
    for (float& p : probs) {
        p = static_cast<float>(p / sumExp);
    }

    return probs;
}

int ClassificationEngine::argMax(const std::vector<float>& values) {
    // std::max_element trả về phần tử lớn nhất đầu tiên
    auto maxIt = std::max_element(values.begin(), values.end());
    return static_cast<int>(std::distance(values.begin(), maxIt));
}

// ============================================================================
// CONVENIENCE FUNCTIONS
// ============================================================================

ClassificationResult classify(const FeatureTensor& tensor,
                              const InferenceBackend& backend,
                              const std::vector<std::string>& classNames) {
    ClassificationEngine::validateClassNames(classNames);
    return runClassification(tensor, backend, classNames);
}

void checkInputShape(const std::vector<int64_t>& declared, const FeatureTensor& tensor) {
    const auto shape = tensor.shape();
    const std::vector<int64_t> actual(shape.begin(), shape.end());

    if (declared.size() != static_cast<size_t>(CNN_INPUT_RANK)) {
        throw ModelShapeError("model input rank is " + std::to_string(declared.size()) +
                              ", expected " + std::to_string(CNN_INPUT_RANK) + " " +
                              shapeToString(declared));
    }
    if (declared[1] >= 0 && declared[1] != CNN_INPUT_CHANNELS) {
        throw ModelShapeError("model expects " + std::to_string(declared[1]) +
                              " input channels, mel-spectrogram has " +
                              std::to_string(CNN_INPUT_CHANNELS));
    }

    // Chiều < 0 là dynamic axis
    for (int d = 0; d < CNN_INPUT_RANK; ++d) {
        if (declared[d] >= 0 && declared[d] != actual[d]) {
            throw ModelShapeError("model expects input " + shapeToString(declared) +
                                  ", feature tensor is " +
                                  shapeToString(actual));
        }
    }
}

std::vector<ExecutionProvider> getSupportedProviders() {
    std::vector<ExecutionProvider> providers;

    // CPU is always available
    providers.push_back(ExecutionProvider::CPU);

    auto availableProviders = Ort::GetAvailableProviders();
    for (const auto& provider : availableProviders) {
        if (provider == "CUDAExecutionProvider") {
            providers.push_back(ExecutionProvider::CUDA);
        }
    }

    return providers;
}

} // namespace cough
