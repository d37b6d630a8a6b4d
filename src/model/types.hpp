/**
 * @file types.hpp
 * @brief Базовые перечисления и их преобразования
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace striplog::model {

/**
 * @brief Порядок (направление оси) колонки
 */
enum class Order {
    Depth,      ///< Глубины растут вниз: кровля выше подошвы численно меньше
    Elevation,  ///< Отметки растут вверх: кровля численно больше подошвы
    None        ///< Точки без мощности (кровля = подошва)
};

/**
 * @brief Вид интервала
 */
enum class IntervalKind {
    Point,      ///< Нулевая мощность
    Interval    ///< Положительная мощность
};

/**
 * @brief Взаимное расположение двух интервалов
 */
enum class Relationship {
    None,         ///< Не пересекаются и не соприкасаются
    Contains,     ///< Первый целиком содержит второй
    ContainedBy,  ///< Первый целиком лежит во втором
    Partially,    ///< Частичное перекрытие
    Touches       ///< Общая граница без перекрытия
};

/**
 * @brief Режим заполнения разрывов (anneal)
 */
enum class AnnealMode {
    Middle,  ///< Разрыв делится пополам между соседями
    Down,    ///< Верхний сосед продлевается вниз
    Up       ///< Нижний сосед продлевается вверх
};

[[nodiscard]] inline std::string toString(Order order) {
    switch (order) {
        case Order::Depth: return "depth";
        case Order::Elevation: return "elevation";
        case Order::None: return "none";
    }
    return "none";
}

/**
 * @brief Парсинг порядка из строки
 *
 * Решает первая буква: "a" (auto) даёт nullopt (автоопределение),
 * "d" глубина, "n" точки, всё остальное отметки.
 */
[[nodiscard]] inline std::optional<Order> parseOrder(std::string_view str) {
    if (str.empty()) return std::nullopt;
    switch (str.front()) {
        case 'a': case 'A': return std::nullopt;
        case 'd': case 'D': return Order::Depth;
        case 'n': case 'N': return Order::None;
        default: return Order::Elevation;
    }
}

[[nodiscard]] inline std::string toString(IntervalKind kind) {
    return kind == IntervalKind::Point ? "point" : "interval";
}

[[nodiscard]] inline std::string toString(Relationship rel) {
    switch (rel) {
        case Relationship::None: return "none";
        case Relationship::Contains: return "contains";
        case Relationship::ContainedBy: return "containedby";
        case Relationship::Partially: return "partially";
        case Relationship::Touches: return "touches";
    }
    return "none";
}

[[nodiscard]] inline std::string toString(AnnealMode mode) {
    switch (mode) {
        case AnnealMode::Middle: return "middle";
        case AnnealMode::Down: return "down";
        case AnnealMode::Up: return "up";
    }
    return "middle";
}

[[nodiscard]] inline AnnealMode parseAnnealMode(std::string_view str) {
    if (str == "down") return AnnealMode::Down;
    if (str == "up") return AnnealMode::Up;
    return AnnealMode::Middle;
}

} // namespace striplog::model
