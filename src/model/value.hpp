/**
 * @file value.hpp
 * @brief Значение свойства компонента или поля данных интервала
 *
 * Закрытый набор типов вместо динамических атрибутов:
 * отсутствие значения, число, логическое, строка, список.
 */

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace striplog::model {

struct Value;

/// Список значений (результат накопления данных при слиянии интервалов)
using ValueList = std::vector<Value>;

/**
 * @brief Значение свойства
 */
struct Value {
    using Storage = std::variant<std::monostate, double, bool, std::string, ValueList>;

    Storage data;

    Value() = default;
    Value(double v) : data(v) {}
    Value(int v) : data(static_cast<double>(v)) {}
    Value(bool v) : data(v) {}
    Value(std::string v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(ValueList v) : data(std::move(v)) {}

    [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool isNumber() const noexcept { return std::holds_alternative<double>(data); }
    [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool isList() const noexcept { return std::holds_alternative<ValueList>(data); }

    [[nodiscard]] double asNumber() const { return std::get<double>(data); }
    [[nodiscard]] bool asBool() const { return std::get<bool>(data); }
    [[nodiscard]] const std::string& asString() const { return std::get<std::string>(data); }
    [[nodiscard]] const ValueList& asList() const { return std::get<ValueList>(data); }

    /**
     * @brief Истинность значения
     *
     * Ложны: отсутствие, 0, false, пустая строка, пустой список.
     */
    [[nodiscard]] bool truthy() const noexcept;

    /**
     * @brief Текстовое представление (для сводок и описаний)
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const Value& other) const { return data == other.data; }
};

/// Словарь данных интервала
using DataMap = std::map<std::string, Value>;

/**
 * @brief Сравнение двух значений для приоритетного слияния
 *
 * Числа сравниваются численно, строки лексикографически, логические
 * как 0/1. Разнотипные значения несравнимы.
 *
 * @return Отрицательное, ноль или положительное
 * @throws std::invalid_argument Если значения несравнимы
 */
[[nodiscard]] int compareValues(const Value& a, const Value& b);

/**
 * @brief Привести оба значения к спискам и объединить
 */
[[nodiscard]] Value listAndAdd(const Value& a, const Value& b);

/**
 * @brief Разбор скалярного значения из текста
 *
 * Строка, целиком являющаяся числом, становится числом.
 */
[[nodiscard]] Value parseScalar(std::string_view text);

} // namespace striplog::model
