/**
 * @file interval.cpp
 * @brief Реализация интервала и попарной алгебры
 */

#include "interval.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace striplog::model {

struct Interval::Exploded {
    Interval upper;
    Interval middle;
    Interval lower;
};

namespace {

std::string formatFixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string stripPunctuation(const std::string& text) {
    const char* chars = " .,";
    auto first = text.find_first_not_of(chars);
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(chars);
    return text.substr(first, last - first + 1);
}

// Координата вдоль направления "сверху вниз"
double strat(double z, Order order) noexcept {
    return order == Order::Elevation ? -z : z;
}

} // namespace

Interval::Interval(Position top,
                   Position base,
                   std::string description,
                   ComponentList components,
                   DataMap data)
    : top_(std::move(top))
    , base_(std::move(base))
    , description_(std::move(description))
    , components_(std::move(components))
    , data_(std::move(data)) {}

Interval::Interval(double top,
                   double base,
                   std::string description,
                   ComponentList components,
                   DataMap data)
    : Interval(Position(top), Position(base), std::move(description),
               std::move(components), std::move(data)) {}

Interval Interval::point(Position at,
                         std::string description,
                         ComponentList components,
                         DataMap data) {
    Position base = at;
    return Interval(std::move(at), std::move(base), std::move(description),
                    std::move(components), std::move(data));
}

double Interval::thickness() const noexcept {
    return std::abs(base_.z() - top_.z());
}

double Interval::minThickness() const noexcept {
    return std::abs(base_.upper() - top_.lower());
}

double Interval::maxThickness() const noexcept {
    return std::abs(base_.lower() - top_.upper());
}

std::string Interval::summary(const std::optional<std::string>& fmt, bool initial) const {
    if (components_.empty()) {
        return description_;
    }

    std::string joined;
    for (size_t i = 0; i < components_.size(); ++i) {
        if (i > 0) {
            joined += " with ";
        }
        joined += components_[i].summary(fmt, initial);
    }
    return formatFixed(thickness(), 2) + " " + top_.units() + " of " + joined;
}

void Interval::invert() noexcept {
    top_.invert();
    base_.invert();
    std::swap(top_, base_);
}

Interval Interval::inverted() const {
    Interval result = *this;
    result.invert();
    return result;
}

// ============================================================================
// Взаимное расположение
// ============================================================================

Order Interval::commonOrder(const Interval& other) const {
    const bool self_thick = kind() == IntervalKind::Interval;
    const bool other_thick = other.kind() == IntervalKind::Interval;
    if (self_thick && other_thick && order() != other.order()) {
        throw IntervalError("Интервалы имеют разный порядок: " +
                            std::string(toString(order())) + " и " +
                            std::string(toString(other.order())));
    }
    if (self_thick) {
        return order();
    }
    if (other_thick) {
        return other.order();
    }
    return Order::Depth;
}

Relationship Interval::relationship(const Interval& other) const {
    const Order ord = commonOrder(other);
    const double a0 = strat(top_.z(), ord);
    const double a1 = strat(base_.z(), ord);
    const double b0 = strat(other.top_.z(), ord);
    const double b1 = strat(other.base_.z(), ord);

    if (b0 > a0 && b1 < a1) {
        return Relationship::Contains;
    }
    if (a0 > b0 && a1 < b1) {
        return Relationship::ContainedBy;
    }

    const double overlap = std::min(a1, b1) - std::max(a0, b0);
    if (overlap > 0.0) {
        if (a0 <= b0 && a1 >= b1) {
            return Relationship::Contains;
        }
        if (b0 <= a0 && b1 >= a1) {
            return Relationship::ContainedBy;
        }
        return Relationship::Partially;
    }

    if (a0 == b1 || a1 == b0 || a0 == b0 || a1 == b1) {
        return Relationship::Touches;
    }
    return Relationship::None;
}

bool Interval::anyOverlaps(const Interval& other) const {
    switch (relationship(other)) {
        case Relationship::Contains:
        case Relationship::ContainedBy:
        case Relationship::Partially:
            return true;
        default:
            return false;
    }
}

bool Interval::spans(double d) const noexcept {
    const double lo = std::min(top_.z(), base_.z());
    const double hi = std::max(top_.z(), base_.z());
    return lo <= d && d <= hi;
}

bool Interval::isAbove(const Interval& other) const noexcept {
    Order ord = order();
    if (kind() == IntervalKind::Point && other.kind() == IntervalKind::Interval) {
        ord = other.order();
    }
    return strat(top_.z(), ord) < strat(other.top_.z(), ord);
}

// ============================================================================
// Алгебра
// ============================================================================

std::pair<Interval, Interval> Interval::splitAt(double d) const {
    if (!spans(d)) {
        throw IntervalError("Уровень " + formatFixed(d, 2) + " вне интервала [" +
                            formatFixed(top_.z(), 2) + ", " + formatFixed(base_.z(), 2) + "]");
    }
    Interval upper = *this;
    Interval lower = *this;
    upper.base_ = Position(d);
    lower.top_ = Position(d);
    return {std::move(upper), std::move(lower)};
}

Interval::Exploded Interval::explode(const Interval& other) const {
    const Order ord = commonOrder(other);

    const Interval* upper_src = this;
    const Interval* lower_src = &other;
    const double self_top = strat(top_.z(), ord);
    const double other_top = strat(other.top_.z(), ord);
    if (other_top < self_top) {
        std::swap(upper_src, lower_src);
    } else if (other_top == self_top &&
               strat(other.base_.z(), ord) > strat(base_.z(), ord)) {
        // При общей кровле верхним считается охватывающий интервал
        std::swap(upper_src, lower_src);
    }

    const Interval& u = *upper_src;
    const Interval& l = *lower_src;

    switch (u.relationship(l)) {
        case Relationship::Partially: {
            Interval upper = u;
            upper.base_ = l.top_;
            auto [middle, lower] = l.splitAt(u.base_.z());
            return Exploded{std::move(upper), std::move(middle), std::move(lower)};
        }
        case Relationship::Contains: {
            auto [upper_tmp, lower] = u.splitAt(l.base_.z());
            Interval upper = upper_tmp.splitAt(l.top_.z()).first;
            return Exploded{std::move(upper), l, std::move(lower)};
        }
        default:
            throw IntervalError("Интервалы не перекрываются");
    }
}

DataMap Interval::combineData(const Interval& other) const {
    DataMap result = data_;
    for (const auto& [key, value] : other.data_) {
        auto it = result.find(key);
        if (it != result.end()) {
            it->second = listAndAdd(it->second, value);
        } else {
            result.emplace(key, value);
        }
    }
    return result;
}

std::string Interval::blendDescriptions(const Interval& other) const {
    if (components_ == other.components_) {
        return stripPunctuation(description_);
    }

    const Interval* thin = this;
    const Interval* thick = &other;
    if (thin->thickness() > thick->thickness()) {
        std::swap(thin, thick);
    }

    const double total = thin->thickness() + thick->thickness();
    const double prop = total > 0.0 ? 100.0 * thick->thickness() / total : 50.0;

    std::string d1 = stripPunctuation(thick->description_);
    if (d1.empty()) {
        d1 = thick->summary();
    }
    std::string d2 = stripPunctuation(thin->description_);
    if (d2.empty()) {
        d2 = thin->summary();
    }
    if (d1.empty()) {
        return {};
    }
    return formatFixed(prop, 1) + "% " + d1 + " with " + formatFixed(100.0 - prop, 1) + "% " + d2;
}

void Interval::combineFrom(const Interval& self, const Interval& other, bool blend) {
    if (!blend) {
        components_ = other.components_;
        description_ = other.description_;
        data_ = other.data_;
        return;
    }

    ComponentList components = self.components_;
    for (const auto& c : other.components_) {
        if (std::find(components.begin(), components.end(), c) == components.end()) {
            components.push_back(c);
        }
    }
    description_ = self.blendDescriptions(other);
    data_ = self.combineData(other);
    components_ = std::move(components);
}

Interval Interval::intersect(const Interval& other, bool blend) const {
    if (!anyOverlaps(other)) {
        throw IntervalError("Для пересечения интервалы должны перекрываться");
    }
    Interval result = explode(other).middle;
    result.combineFrom(*this, other, blend);
    return result;
}

std::vector<Interval> Interval::merge(const Interval& other, bool blend) const {
    if (!anyOverlaps(other)) {
        throw IntervalError("Для слияния интервалы должны перекрываться");
    }

    Exploded pieces = explode(other);
    std::vector<Interval> result;

    if (!blend && partiallyOverlaps(other)) {
        if (isAbove(other)) {
            result.push_back(std::move(pieces.upper));
            result.push_back(other);
        } else {
            result.push_back(other);
            result.push_back(std::move(pieces.lower));
        }
        result.erase(std::remove_if(result.begin(), result.end(),
                                    [](const Interval& iv) { return iv.thickness() == 0.0; }),
                     result.end());
        return result;
    }

    pieces.middle.combineFrom(*this, other, blend);
    if (pieces.upper.thickness() > 0.0) {
        result.push_back(std::move(pieces.upper));
    }
    result.push_back(std::move(pieces.middle));
    if (pieces.lower.thickness() > 0.0) {
        result.push_back(std::move(pieces.lower));
    }
    return result;
}

Interval Interval::unionWith(const Interval& other, bool blend) const {
    const Relationship rel = relationship(other);
    if (rel == Relationship::None) {
        throw IntervalError("Для объединения интервалы должны перекрываться или соприкасаться");
    }

    const Order ord = commonOrder(other);
    const Position& top = strat(other.top_.z(), ord) < strat(top_.z(), ord) ? other.top_ : top_;
    const Position& base = strat(other.base_.z(), ord) > strat(base_.z(), ord) ? other.base_ : base_;

    Interval result = *this;
    result.top_ = top;
    result.base_ = base;
    result.combineFrom(*this, other, blend);
    return result;
}

IntervalDifference Interval::difference(const Interval& other) const {
    const Relationship rel = relationship(other);
    if (rel == Relationship::None || rel == Relationship::Touches) {
        return *this;
    }
    if (rel == Relationship::ContainedBy ||
        (top_.z() == other.top_.z() && base_.z() == other.base_.z())) {
        return std::monostate{};
    }
    if (rel == Relationship::Contains) {
        Exploded pieces = explode(other);
        if (pieces.upper.thickness() == 0.0) {
            return std::move(pieces.lower);
        }
        if (pieces.lower.thickness() == 0.0) {
            return std::move(pieces.upper);
        }
        return std::make_pair(std::move(pieces.upper), std::move(pieces.lower));
    }
    if (isAbove(other)) {
        return splitAt(other.top_.z()).first;
    }
    return splitAt(other.base_.z()).second;
}

Interval Interval::plus(const Component& component) const {
    Interval result = *this;
    result.components_.push_back(component);
    const std::string addition = component.summary();
    if (result.description_.empty()) {
        result.description_ = addition;
    } else if (!addition.empty()) {
        result.description_ += " with " + addition;
    }
    return result;
}

} // namespace striplog::model
