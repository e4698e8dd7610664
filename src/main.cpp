/**
 * @file main.cpp
 * @brief Main entry point for the cough classifier
 *
 * Chương trình phân loại một bản ghi tiếng ho thành
 * neither / viral / bacterial và ghi kết quả ra output.txt.
 *
 * Pipeline:
 *   Phase 1: Audio Loading (WAV, native sample rate, mono)
 *   Phase 2: Noise Suppression + Cough Segmentation (bản ghi > 1 s)
 *   Phase 3: Mel-spectrogram (128 mels, dB, min-max normalization)
 *   Phase 4: CNN Classification (ONNX Runtime)
 *
 * Usage:
 *   ./cough_classifier --model model.onnx --input cough.wav [--output-dir out]
 *
 * Exit codes:
 *   0 success, 1 usage / invalid parameter, 2 audio load failure,
 *   3 no cough detected, 4 model load / shape error,
 *   5 degenerate normalization, 6 report write failure
 */

#include "Common.h"
#include "SignalPrep.hpp"
#include "CnnInference.hpp"
#include "CoughPipeline.h"
#include "ReportWriter.hpp"

#include <iostream>
#include <string>
#include <memory>
#include <stdexcept>

using namespace cough;

namespace {

// ============================================================================
// EXIT CODES
// ============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_AUDIO_LOAD = 2;
constexpr int EXIT_NO_ACTIVITY = 3;
constexpr int EXIT_MODEL = 4;
constexpr int EXIT_DEGENERATE = 5;
constexpr int EXIT_REPORT = 6;

/// Thư mục output mặc định
const char* const DEFAULT_OUTPUT_DIR = "output";

/**
 * @struct CliOptions
 * @brief Tham số dòng lệnh
 */
struct CliOptions {
    std::string modelPath;
    std::string inputPath;
    std::string outputDir = DEFAULT_OUTPUT_DIR;
    BackendConfig backend;
    PipelineConfig pipeline;
};

void printUsage(const char* programName) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║     Cough Classifier - neither / viral / bacterial           ║\n";
    std::cout << "║     Mel-spectrogram + CNN (ONNX Runtime)                     ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";
    std::cout << "Usage: " << programName << " --model <model.onnx> --input <cough.wav> [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h                 Show this help message\n";
    std::cout << "  --model <path>             ONNX model file (required)\n";
    std::cout << "  --input <path>             Input WAV file (required)\n";
    std::cout << "  --output-dir <dir>         Directory for output.txt (default: output)\n";
    std::cout << "  --threshold <amp>          Cough amplitude threshold (default: 0.05)\n";
    std::cout << "  --noise-level <k>          Noise reduction level (default: 1.5)\n";
    std::cout << "  --hop <samples>            Mel hop length (default: 512)\n";
    std::cout << "  --mels <n>                 Number of mel bands (default: 128)\n";
    std::cout << "  --provider cpu|cuda        Execution provider (default: cpu)\n";
    std::cout << "  --threads <n>              Intra-op threads for inference (default: 1)\n";
    std::cout << "  --degenerate midpoint|error  Constant spectrogram policy (default: midpoint)\n";
    std::cout << "  --quiet                    Only print the final prediction\n";
    std::cout << "\n";
    std::cout << "Processing Pipeline:\n";
    std::cout << "  Phase 1: Load WAV at native sample rate, down-mix to mono\n";
    std::cout << "  Phase 2: Recordings longer than 1 s:\n";
    std::cout << "    - Spectral gating noise suppression (first 0.5 s as noise reference)\n";
    std::cout << "    - 1 s cough segment starting 0.5 s before the first loud sample\n";
    std::cout << "  Phase 3: Mel-spectrogram -> dB (ref = max) -> [0, 1]\n";
    std::cout << "  Phase 4: CNN forward pass, softmax, arg-max\n";
    std::cout << "\n";
}

float parseFloat(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        float v = std::stof(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return v;
    }
    catch (const std::logic_error&) {
        throw InvalidParameterError(ProcessingStage::LOADING,
                                    "invalid number for " + flag + ": " + value);
    }
}

int parseInt(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
        return v;
    }
    catch (const std::logic_error&) {
        throw InvalidParameterError(ProcessingStage::LOADING,
                                    "invalid integer for " + flag + ": " + value);
    }
}

/**
 * @brief Parse argv
 * @return false nếu chỉ cần in help
 * @throws InvalidParameterError nếu tham số sai
 */
bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (arg == "--quiet") {
            options.pipeline.verbose = false;
            options.backend.verbose = false;
            continue;
        }

        // Các option còn lại đều cần một giá trị
        if (i + 1 >= argc) {
            throw InvalidParameterError(ProcessingStage::LOADING,
                                        "missing value for option " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--model") {
            options.modelPath = value;
        }
        else if (arg == "--input") {
            options.inputPath = value;
        }
        else if (arg == "--output-dir") {
            options.outputDir = value;
        }
        else if (arg == "--threshold") {
            options.pipeline.segment.amplitudeThreshold = parseFloat(arg, value);
        }
        else if (arg == "--noise-level") {
            options.pipeline.noise.level = parseFloat(arg, value);
        }
        else if (arg == "--hop") {
            options.pipeline.mel.hopLength = parseInt(arg, value);
        }
        else if (arg == "--mels") {
            options.pipeline.mel.nMels = parseInt(arg, value);
        }
        else if (arg == "--threads") {
            options.backend.numThreads = parseInt(arg, value);
        }
        else if (arg == "--provider") {
            if (value == "cpu") {
                options.backend.provider = ExecutionProvider::CPU;
            } else if (value == "cuda") {
                options.backend.provider = ExecutionProvider::CUDA;
            } else {
                throw InvalidParameterError(ProcessingStage::LOADING,
                                            "unknown provider: " + value);
            }
        }
        else if (arg == "--degenerate") {
            if (value == "midpoint") {
                options.pipeline.mel.degeneratePolicy = DegeneratePolicy::MIDPOINT;
            } else if (value == "error") {
                options.pipeline.mel.degeneratePolicy = DegeneratePolicy::THROW;
            } else {
                throw InvalidParameterError(ProcessingStage::LOADING,
                                            "unknown degenerate policy: " + value);
            }
        }
        else {
            throw InvalidParameterError(ProcessingStage::LOADING, "unknown option " + arg);
        }
    }

    if (options.modelPath.empty() || options.inputPath.empty()) {
        throw InvalidParameterError(ProcessingStage::LOADING,
                                    "both --model and --input are required");
    }

    options.backend.modelPath = options.modelPath;
    return true;
}

/**
 * @brief Phân loại một file WAV và ghi output.txt
 */
int processSingleFile(const CliOptions& options) {
    const bool verbose = options.pipeline.verbose;

    if (verbose) {
        std::cout << "\n[Mode] Single File Classification\n";
        std::cout << "Input: " << options.inputPath << "\n";
        std::cout << "Model: " << options.modelPath << "\n\n";
    }

    // ----- Phase 1: Audio -----
    AudioSignal signal = AudioLoader::loadWav(options.inputPath, verbose);

    // ----- Model -----
    std::shared_ptr<const InferenceBackend> backend =
        std::make_shared<OnnxBackend>(options.backend);
    CoughPipeline pipeline(options.pipeline, backend);

    // ----- Phase 2 - 4 -----
    PipelineResult result = pipeline.run(signal);

    if (verbose) {
        std::cout << "\n" << result.describe() << "\n\n";
    }

    // ----- Report -----
    std::string outputPath = ReportWriter::writeFile(result.classification, options.outputDir);

    std::cout << ReportWriter::format(result.classification);
    std::cout << "Prediction written to " << outputPath << std::endl;

    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;

    try {
        if (!parseArguments(argc, argv, options)) {
            printUsage(argv[0]);
            return EXIT_OK;
        }
    }
    catch (const InvalidParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        return processSingleFile(options);
    }
    catch (const AudioLoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_AUDIO_LOAD;
    }
    catch (const NoActivityDetectedError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_NO_ACTIVITY;
    }
    catch (const ModelLoadError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_MODEL;
    }
    catch (const ModelShapeError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_MODEL;
    }
    catch (const DegenerateNormalizationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_DEGENERATE;
    }
    catch (const InvalidParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    catch (const PipelineError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        switch (e.stage()) {
            case ProcessingStage::REPORTING: return EXIT_REPORT;
            case ProcessingStage::CLASSIFYING: return EXIT_MODEL;
            default: return EXIT_USAGE;
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
