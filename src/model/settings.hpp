/**
 * @file settings.hpp
 * @brief Параметры операций над колонкой
 */

#pragma once

#include "types.hpp"
#include <optional>
#include <string>

namespace striplog::model {

/**
 * @brief Критерий отбраковки тонких интервалов
 *
 * Должен быть задан ровно один из limit, n, percentile.
 */
struct PruneCriteria {
    std::optional<double> limit;       ///< Удалить интервалы тоньше limit
    std::optional<size_t> n;           ///< Удалить n самых тонких
    std::optional<double> percentile;  ///< Удалить самые тонкие percentile %
    bool keep_ends = false;            ///< Не удалять первый и последний интервал

    [[nodiscard]] int modeCount() const noexcept {
        return static_cast<int>(limit.has_value()) +
               static_cast<int>(n.has_value()) +
               static_cast<int>(percentile.has_value());
    }
};

/**
 * @brief Настройки операций, хранимые вместе с документом
 */
struct OperationSettings {
    AnnealMode anneal_mode = AnnealMode::Middle;
    PruneCriteria prune;

    std::string merge_attribute;       ///< Атрибут приоритета для композитинга
    bool merge_reverse = false;        ///< Меньшее значение побеждает

    bool strict_neighbours = true;     ///< Сравнивать весь список компонентов

    double log_step = 1.0;             ///< Шаг растеризации
    double log_undefined = 0.0;        ///< Значение вне интервалов (NaN в документе записывается как null)

    std::optional<double> thin_bed_limit;  ///< Порог тонкого пласта для контроля качества
};

} // namespace striplog::model
