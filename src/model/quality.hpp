/**
 * @file quality.hpp
 * @brief Структуры данных для отчёта о качестве колонки
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace striplog::model {

enum class QualityStatus {
    Ok,
    Warning,
    Fail,
    Skipped
};

struct QualityCheck {
    std::string id;
    std::string title;
    QualityStatus status = QualityStatus::Skipped;
    std::string details;
    std::vector<size_t> indices;  ///< Индексы интервалов, к которым относится замечание
};

struct QualityMeta {
    std::string schema_version = "1.0.0";
    std::string app_version;
    std::string source;
    std::string order;
    size_t interval_count = 0;
    std::string timestamp;
};

struct QualitySummary {
    QualityStatus status = QualityStatus::Ok;
    size_t ok = 0;
    size_t warning = 0;
    size_t fail = 0;
    size_t skipped = 0;
};

struct QualityReport {
    QualityMeta meta;
    std::vector<QualityCheck> checks;

    [[nodiscard]] QualitySummary summarize() const noexcept {
        QualitySummary summary;
        for (const auto& check : checks) {
            switch (check.status) {
            case QualityStatus::Ok: summary.ok++; break;
            case QualityStatus::Warning: summary.warning++; break;
            case QualityStatus::Fail: summary.fail++; break;
            case QualityStatus::Skipped: summary.skipped++; break;
            }
        }
        if (summary.fail > 0) {
            summary.status = QualityStatus::Fail;
        } else if (summary.warning > 0) {
            summary.status = QualityStatus::Warning;
        } else if (summary.ok > 0) {
            summary.status = QualityStatus::Ok;
        } else {
            summary.status = QualityStatus::Skipped;
        }
        return summary;
    }
};

[[nodiscard]] inline std::string_view qualityStatusToString(QualityStatus status) noexcept {
    switch (status) {
    case QualityStatus::Ok: return "OK";
    case QualityStatus::Warning: return "WARN";
    case QualityStatus::Fail: return "FAIL";
    case QualityStatus::Skipped: return "SKIPPED";
    }
    return "UNKNOWN";
}

} // namespace striplog::model
