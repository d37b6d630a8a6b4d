/**
 * @file position.cpp
 * @brief Реализация позиции
 */

#include "position.hpp"
#include <cmath>

namespace striplog::model {

Position::Position(double middle)
    : middle_(middle)
    , upper_(middle)
    , lower_(middle) {}

Position::Position(std::optional<double> middle,
                   std::optional<double> upper,
                   std::optional<double> lower,
                   std::optional<double> x,
                   std::optional<double> y,
                   std::string units,
                   DataMap meta)
    : middle_(middle)
    , units_(std::move(units)) {
    if (!middle.has_value() && !(upper.has_value() && lower.has_value())) {
        throw PositionError("Нужно задать middle, либо upper и lower");
    }

    upper_ = upper.has_value() ? *upper : *middle;
    lower_ = lower.has_value() ? *lower : *middle;

    if (x.has_value() != y.has_value()) {
        throw PositionError("Координаты x и y задаются только вместе");
    }
    x_ = x;
    y_ = y;

    // Пустые элементы метаданных не сохраняются
    for (auto& [key, value] : meta) {
        if (!key.empty() && value.truthy()) {
            meta_.emplace(key, std::move(value));
        }
    }
}

Position Position::fromBounds(double upper, double lower) {
    return Position(std::nullopt, upper, lower);
}

double Position::uncertainty() const noexcept {
    return std::abs(upper_ - lower_);
}

void Position::invert() noexcept {
    std::swap(upper_, lower_);
}

Position Position::shifted(double delta) const {
    Position result = *this;
    if (result.middle_.has_value()) {
        *result.middle_ += delta;
    }
    result.upper_ += delta;
    result.lower_ += delta;
    return result;
}

} // namespace striplog::model
