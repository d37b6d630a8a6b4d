/**
 * @file quality.cpp
 * @brief Реализация проверок качества колонки
 */

#include "quality.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace striplog::core {
namespace {

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string formatDepth(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

std::string joinIndices(const std::vector<size_t>& indices) {
    std::ostringstream oss;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << indices[i];
    }
    return oss.str();
}

QualityCheck makeOrderCheck(const Striplog& strip) {
    QualityCheck check;
    check.id = "order";
    check.title = "Порядок колонки";
    check.status = QualityStatus::Ok;
    check.details = "Порядок: " + toString(strip.order()) +
                    ", интервалов: " + std::to_string(strip.size()) +
                    ", от " + formatDepth(strip.start().z()) +
                    " до " + formatDepth(strip.stop().z());
    return check;
}

QualityCheck makeGapsCheck(const Striplog& strip) {
    QualityCheck check;
    check.id = "gaps";
    check.title = "Разрывы между интервалами";

    if (strip.order() == Order::None) {
        check.status = QualityStatus::Skipped;
        check.details = "Колонка точек, разрывы не проверяются";
        return check;
    }

    check.indices = strip.gapIndices();
    if (check.indices.empty()) {
        check.status = QualityStatus::Ok;
        check.details = "Разрывов нет";
        return check;
    }

    double total = 0.0;
    if (auto gaps = strip.findGaps()) {
        total = gaps->cum();
    }
    check.status = QualityStatus::Warning;
    check.details = "Разрывов: " + std::to_string(check.indices.size()) +
                    ", суммарно " + formatDepth(total) +
                    ", после интервалов: " + joinIndices(check.indices);
    return check;
}

QualityCheck makeOverlapsCheck(const Striplog& strip) {
    QualityCheck check;
    check.id = "overlaps";
    check.title = "Перекрытия интервалов";

    check.indices = strip.overlapIndices();
    if (check.indices.empty()) {
        check.status = QualityStatus::Ok;
        check.details = "Перекрытий нет";
        return check;
    }

    check.status = QualityStatus::Fail;
    check.details = "Перекрытий: " + std::to_string(check.indices.size()) +
                    ", интервалы: " + joinIndices(check.indices);
    return check;
}

QualityCheck makeThinBedsCheck(const Striplog& strip, const std::optional<double>& limit) {
    QualityCheck check;
    check.id = "thin_beds";
    check.title = "Тонкие пласты";

    if (!limit.has_value()) {
        check.status = QualityStatus::Skipped;
        check.details = "Порог мощности не задан";
        return check;
    }

    for (size_t i = 0; i < strip.size(); ++i) {
        if (strip[i].kind() == IntervalKind::Interval && strip[i].thickness() < *limit) {
            check.indices.push_back(i);
        }
    }
    if (check.indices.empty()) {
        check.status = QualityStatus::Ok;
        check.details = "Все пласты не тоньше " + formatDepth(*limit);
    } else {
        check.status = QualityStatus::Warning;
        check.details = "Тоньше " + formatDepth(*limit) + ": " + joinIndices(check.indices);
    }
    return check;
}

QualityCheck makeComponentsCheck(const Striplog& strip) {
    QualityCheck check;
    check.id = "components";
    check.title = "Интервалы без компонентов";

    for (size_t i = 0; i < strip.size(); ++i) {
        if (strip[i].components().empty()) {
            check.indices.push_back(i);
        }
    }
    if (check.indices.empty()) {
        check.status = QualityStatus::Ok;
        check.details = "У всех интервалов есть компоненты";
    } else {
        check.status = QualityStatus::Warning;
        check.details = "Без компонентов: " + joinIndices(check.indices);
    }
    return check;
}

QualityCheck makeUncertaintyCheck(const Striplog& strip) {
    QualityCheck check;
    check.id = "uncertainty";
    check.title = "Неопределённость границ";
    check.status = QualityStatus::Ok;

    double worst = 0.0;
    for (size_t i = 0; i < strip.size(); ++i) {
        const double u = std::max(strip[i].top().uncertainty(), strip[i].base().uncertainty());
        if (u > 0.0) {
            check.indices.push_back(i);
            worst = std::max(worst, u);
        }
    }
    if (check.indices.empty()) {
        check.details = "Все границы заданы точно";
    } else {
        check.details = "Границы с неопределённостью у " + std::to_string(check.indices.size()) +
                        " интервалов, наибольшая " + formatDepth(worst);
    }
    return check;
}

} // namespace

model::QualityReport buildQualityReport(
    const Striplog& strip,
    const model::OperationSettings& settings
) {
    QualityReport report;
    report.meta.app_version = STRIPLOG_VERSION;
    report.meta.source = strip.source();
    report.meta.order = toString(strip.order());
    report.meta.interval_count = strip.size();
    report.meta.timestamp = isoTimestampNow();

    report.checks.push_back(makeOrderCheck(strip));
    report.checks.push_back(makeGapsCheck(strip));
    report.checks.push_back(makeOverlapsCheck(strip));
    report.checks.push_back(makeThinBedsCheck(strip, settings.thin_bed_limit));
    report.checks.push_back(makeComponentsCheck(strip));
    report.checks.push_back(makeUncertaintyCheck(strip));
    return report;
}

} // namespace striplog::core
