/**
 * @file ReportWriter.hpp
 * @brief Text report sink for classification results
 *
 * Định dạng output.txt:
 *
 *   Prediction: <label>
 *   Class probabilities:
 *     <class>: <xác suất, 4 chữ số thập phân>
 *
 * @author Research Team
 * @date 2026
 */

#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "CnnInference.hpp"

#include <string>

namespace cough {

/// Tên file kết quả trong thư mục output
constexpr const char* REPORT_FILENAME = "output.txt";

/**
 * @class ReportWriter
 * @brief Ghi ClassificationResult ra file văn bản
 */
class ReportWriter {
public:
    /**
     * @brief Nội dung báo cáo
     */
    static std::string format(const ClassificationResult& result);

    /**
     * @brief Tạo outputDir (nếu chưa có) và ghi outputDir/output.txt
     * @return Đường dẫn file đã ghi
     * @throws PipelineError (stage REPORTING) nếu không tạo/ghi được
     */
    static std::string writeFile(const ClassificationResult& result,
                                 const std::string& outputDir);
};

} // namespace cough

#endif // REPORT_WRITER_HPP
