/**
 * @file quality_writer.cpp
 * @brief Запись отчётов о качестве колонки
 */

#include "quality_writer.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace striplog::io {

using namespace striplog::model;

std::string qualityReportToMarkdown(const QualityReport& report) {
    std::ostringstream out;
    auto summary = report.summarize();

    out << "# Отчёт о качестве колонки\n\n";
    out << "- Источник: " << (report.meta.source.empty() ? "-" : report.meta.source) << "\n";
    out << "- Порядок: " << report.meta.order << "\n";
    out << "- Интервалов: " << report.meta.interval_count << "\n";
    out << "- Версия приложения: " << report.meta.app_version << "\n";
    out << "- Схема отчёта: " << report.meta.schema_version << "\n";
    out << "- Время: " << report.meta.timestamp << "\n\n";

    out << "## Сводка\n";
    out << "- Статус: " << qualityStatusToString(summary.status) << "\n";
    out << "- OK: " << summary.ok << ", WARN: " << summary.warning
        << ", FAIL: " << summary.fail << ", SKIPPED: " << summary.skipped << "\n\n";

    out << "## Проверки\n";
    out << "| Проверка | Статус | Детали |\n";
    out << "|----------|--------|--------|\n";
    for (const auto& check : report.checks) {
        out << "| " << check.title << " | " << qualityStatusToString(check.status)
            << " | " << check.details << " |\n";
    }

    return out.str();
}

std::string qualityReportToJson(const QualityReport& report, int indent) {
    nlohmann::json j;
    auto summary = report.summarize();

    j["schema_version"] = report.meta.schema_version;
    j["meta"] = {
        {"app_version", report.meta.app_version},
        {"source", report.meta.source},
        {"order", report.meta.order},
        {"interval_count", report.meta.interval_count},
        {"timestamp", report.meta.timestamp}
    };

    j["checks"] = nlohmann::json::array();
    for (const auto& check : report.checks) {
        nlohmann::json c;
        c["id"] = check.id;
        c["title"] = check.title;
        c["status"] = std::string(qualityStatusToString(check.status));
        c["details"] = check.details;
        c["indices"] = check.indices;
        j["checks"].push_back(c);
    }

    j["summary"] = {
        {"status", std::string(qualityStatusToString(summary.status))},
        {"ok", summary.ok},
        {"warning", summary.warning},
        {"fail", summary.fail},
        {"skipped", summary.skipped}
    };

    return j.dump(indent);
}

QualityWriteResult writeQualityReports(
    const QualityReport& report,
    const std::filesystem::path& output_dir
) {
    std::filesystem::create_directories(output_dir);
    QualityWriteResult result;

    auto json_path = output_dir / "report.json";
    auto md_path = output_dir / "report.md";

    atomicWrite(json_path, qualityReportToJson(report));
    atomicWrite(md_path, qualityReportToMarkdown(report));

    result.json_path = json_path;
    result.markdown_path = md_path;
    return result;
}

} // namespace striplog::io
