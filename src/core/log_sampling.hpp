/**
 * @file log_sampling.hpp
 * @brief Растеризация колонки в каротаж с постоянным шагом
 */

#pragma once

#include "core/striplog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace striplog::core {

/**
 * @brief Опции растеризации
 */
struct LogOptions {
    double step = 1.0;                          ///< Шаг дискретизации
    std::optional<double> start;                ///< Начало (по умолчанию начало колонки)
    std::optional<double> stop;                 ///< Конец (по умолчанию конец колонки)
    std::optional<std::vector<double>> basis;   ///< Готовая основа; задаёт start, stop и step

    std::optional<std::string> field;           ///< Брать значения из поля данных
    bool bins = true;                           ///< Номер в таблице вместо самого значения

    std::optional<ComponentList> table;         ///< Таблица компонентов (иначе строится по колонке)
    std::optional<ValueList> value_table;       ///< Таблица значений поля (иначе строится по колонке)
    std::vector<std::string> match_only;        ///< Сравнивать компоненты только по этим свойствам

    double undefined = 0.0;                     ///< Значение вне интервалов и для ненайденных ключей
};

/**
 * @brief Результат растеризации
 */
struct SampledLog {
    std::vector<double> values;    ///< Отсчёты
    std::vector<double> basis;     ///< Уровни отсчётов
    ComponentList components;      ///< Таблица компонентов (номер = индекс + 1)
    ValueList field_values;        ///< Таблица значений поля (номер = индекс + 1)
};

/**
 * @brief Равномерная основа: точки start + i * step, i = 0 .. ceil((stop - start) / step)
 *
 * Последняя точка не меньше stop; если шаг не делит диапазон, она лежит за stop.
 *
 * @throws StriplogError step <= 0 или stop < start
 */
[[nodiscard]] std::vector<double> makeBasis(double start, double stop, double step);

/**
 * @brief Растеризация колонки
 *
 * Интервал заполняет отсчёты основы, лежащие между его кровлей и подошвой
 * включительно; первый из них имеет номер ceil((top - start) / step).
 * На общей границе двух интервалов отсчёт получает значение нижнего из них.
 *
 * @throws StriplogError Некорректные шаг, диапазон или основа
 */
[[nodiscard]] SampledLog toLog(const Striplog& strip, const LogOptions& options = {});

/**
 * @brief Логическая маска: true там, где значение определено и не равно нулю
 */
[[nodiscard]] std::vector<bool> toFlag(const Striplog& strip, const LogOptions& options = {});

/**
 * @brief Каротаж логического атрибута основного компонента
 *
 * Таблица состоит из {attr: false} и {attr: true}, так что отсчёт
 * равен 0 или 1. Вне интервалов и для интервалов без логического
 * attr получается -2.
 */
[[nodiscard]] SampledLog toBinaryLog(const Striplog& strip, const std::string& attr, double step = 1.0);

} // namespace striplog::core
