/**
 * @file compositing.hpp
 * @brief Приоритетное совмещение перекрывающихся интервалов
 *
 * Проход по таблице событий (кровли и подошвы всех интервалов
 * сверху вниз) со стеком открытых интервалов, упорядоченным по
 * атрибуту приоритета. В каждой точке разреза результат берёт
 * содержимое интервала с наивысшим приоритетом.
 */

#pragma once

#include "core/striplog.hpp"
#include <string>
#include <vector>

namespace striplog::core {

/**
 * @brief Тип события
 */
enum class Boundary {
    Top,
    Base
};

/**
 * @brief Событие таблицы: граница интервала на уровне z
 */
struct MergeEvent {
    Boundary boundary = Boundary::Top;
    double z = 0.0;
    size_t index = 0;  ///< Индекс интервала в исходной колонке

    bool operator==(const MergeEvent&) const = default;
};

/**
 * @brief Значение атрибута приоритета для интервала
 *
 * Поиск по порядку: "top", "base", "thickness", "middle" (числа),
 * затем поле данных интервала, затем свойство основного компонента.
 *
 * @throws StriplogError Атрибут не найден
 */
[[nodiscard]] Value priorityOf(const Interval& interval, const std::string& attr);

/**
 * @brief Таблица кровель и подошв сверху вниз
 *
 * Для каждого интервала сначала кровля, затем подошва; при равных
 * уровнях сохраняется порядок интервалов в колонке.
 */
[[nodiscard]] std::vector<MergeEvent> buildEventTable(const Striplog& strip);

/**
 * @brief Таблица совмещения: пары (кровля, подошва) без перекрытий
 *
 * @param attr Атрибут приоритета
 * @param reverse true: побеждает меньшее значение
 * @throws StriplogError Атрибут не найден или значения несравнимы
 */
[[nodiscard]] std::vector<MergeEvent> buildMergeTable(const Striplog& strip,
                                                      const std::string& attr,
                                                      bool reverse = false);

/**
 * @brief Колонка из таблицы совмещения; пары нулевой мощности отбрасываются
 */
[[nodiscard]] Striplog striplogFromMergeTable(const Striplog& strip,
                                              const std::vector<MergeEvent>& table);

/**
 * @brief Совместить перекрывающиеся интервалы по приоритету
 */
[[nodiscard]] Striplog mergeByPriority(const Striplog& strip,
                                       const std::string& attr,
                                       bool reverse = false);

} // namespace striplog::core
