/**
 * @file quality.hpp
 * @brief Контроль качества колонки
 */

#pragma once

#include "core/striplog.hpp"
#include "model/quality.hpp"
#include "model/settings.hpp"

namespace striplog::core {

/**
 * @brief Построить отчёт о качестве колонки.
 *
 * Проверки: порядок, разрывы, перекрытия, тонкие пласты (порог из
 * settings.thin_bed_limit, без порога SKIPPED), интервалы без
 * компонентов, неопределённость границ.
 */
[[nodiscard]] model::QualityReport buildQualityReport(
    const Striplog& strip,
    const model::OperationSettings& settings = {}
);

} // namespace striplog::core
