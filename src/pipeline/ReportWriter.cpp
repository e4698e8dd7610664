/**
 * @file ReportWriter.cpp
 * @brief Implementation of the text report sink
 *
 * @author Research Team
 * @date 2026
 */

#include "ReportWriter.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cough {

std::string ReportWriter::format(const ClassificationResult& result) {
    std::ostringstream oss;
    oss << "Prediction: " << result.label << "\n";
    oss << "Class probabilities:\n";

    for (const auto& entry : result.probabilities) {
        oss << "  " << entry.first << ": "
            << std::fixed << std::setprecision(4) << entry.second << "\n";
    }

    return oss.str();
}

std::string ReportWriter::writeFile(const ClassificationResult& result,
                                    const std::string& outputDir) {
    if (outputDir.empty()) {
        throw PipelineError(ProcessingStage::REPORTING, "output directory is empty");
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        throw PipelineError(ProcessingStage::REPORTING,
                            "cannot create output directory " + outputDir + ": " + ec.message());
    }

    const fs::path outputPath = fs::path(outputDir) / REPORT_FILENAME;

    std::ofstream file(outputPath);
    if (!file.is_open()) {
        throw PipelineError(ProcessingStage::REPORTING,
                            "cannot open " + outputPath.string() + " for writing");
    }

    file << format(result);
    file.close();

    if (file.fail()) {
        throw PipelineError(ProcessingStage::REPORTING,
                            "failed writing " + outputPath.string());
    }

    return outputPath.string();
}

} // namespace cough
