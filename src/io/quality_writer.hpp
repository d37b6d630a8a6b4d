/**
 * @file quality_writer.hpp
 * @brief Запись отчётов о качестве колонки в Markdown и JSON
 */

#pragma once

#include "model/quality.hpp"
#include <filesystem>
#include <string>

namespace striplog::io {

struct QualityWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

/**
 * @brief Отчёт в JSON-строку
 */
[[nodiscard]] std::string qualityReportToJson(const striplog::model::QualityReport& report, int indent = 2);

/**
 * @brief Отчёт в Markdown
 */
[[nodiscard]] std::string qualityReportToMarkdown(const striplog::model::QualityReport& report);

/**
 * @brief Записать отчёт (report.json и report.md) в указанный каталог.
 */
QualityWriteResult writeQualityReports(
    const striplog::model::QualityReport& report,
    const std::filesystem::path& output_dir
);

} // namespace striplog::io
