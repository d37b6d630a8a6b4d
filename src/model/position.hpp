/**
 * @file position.hpp
 * @brief Позиция на оси глубин/отметок (кровля или подошва)
 */

#pragma once

#include "value.hpp"
#include <compare>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace striplog::model {

/**
 * @brief Ошибка построения позиции
 */
class PositionError : public std::runtime_error {
public:
    explicit PositionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Точка на одномерной оси с необязательной неопределённостью
 *
 * Задаётся серединой, либо верхней и нижней границей (тогда середина
 * вычисляется). Координаты x/y задаются только парой.
 */
class Position {
public:
    /**
     * @brief Позиция по одному значению (upper = lower = middle)
     */
    explicit Position(double middle);

    /**
     * @brief Полная форма
     *
     * @throws PositionError Если нет ни middle, ни пары upper/lower,
     *         либо задана только одна из координат x/y
     */
    Position(std::optional<double> middle,
             std::optional<double> upper,
             std::optional<double> lower,
             std::optional<double> x = std::nullopt,
             std::optional<double> y = std::nullopt,
             std::string units = "m",
             DataMap meta = {});

    /**
     * @brief Позиция по границам неопределённости
     */
    [[nodiscard]] static Position fromBounds(double upper, double lower);

    [[nodiscard]] const std::optional<double>& middle() const noexcept { return middle_; }
    [[nodiscard]] double upper() const noexcept { return upper_; }
    [[nodiscard]] double lower() const noexcept { return lower_; }
    [[nodiscard]] const std::optional<double>& x() const noexcept { return x_; }
    [[nodiscard]] const std::optional<double>& y() const noexcept { return y_; }
    [[nodiscard]] const std::string& units() const noexcept { return units_; }
    [[nodiscard]] const DataMap& meta() const noexcept { return meta_; }

    [[nodiscard]] bool hasCoordinates() const noexcept { return x_.has_value(); }

    /**
     * @brief Рабочее значение: middle, либо среднее границ
     */
    [[nodiscard]] double z() const noexcept {
        return middle_.has_value() ? *middle_ : (upper_ + lower_) / 2.0;
    }

    /**
     * @brief Размах неопределённости |upper - lower|
     */
    [[nodiscard]] double uncertainty() const noexcept;

    /**
     * @brief Пара (lower, upper)
     */
    [[nodiscard]] std::pair<double, double> span() const noexcept {
        return {lower_, upper_};
    }

    /**
     * @brief Поменять upper и lower местами (смена глубин на отметки)
     */
    void invert() noexcept;

    /**
     * @brief Копия, сдвинутая на delta вместе с границами
     */
    [[nodiscard]] Position shifted(double delta) const;

    bool operator==(const Position& other) const noexcept { return z() == other.z(); }
    std::partial_ordering operator<=>(const Position& other) const noexcept { return z() <=> other.z(); }

private:
    std::optional<double> middle_;
    double upper_ = 0.0;
    double lower_ = 0.0;
    std::optional<double> x_;
    std::optional<double> y_;
    std::string units_ = "m";
    DataMap meta_;
};

} // namespace striplog::model
