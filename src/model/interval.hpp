/**
 * @file interval.hpp
 * @brief Интервал колонки: кровля, подошва, компоненты, описание, данные
 *
 * Интервал также владеет попарной алгеброй: взаимное расположение,
 * разбиение, пересечение, объединение, слияние и разность.
 */

#pragma once

#include "component.hpp"
#include "position.hpp"
#include "types.hpp"
#include "value.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace striplog::model {

/**
 * @brief Ошибка операции над интервалами
 */
class IntervalError : public std::runtime_error {
public:
    explicit IntervalError(const std::string& message)
        : std::runtime_error(message) {}
};

class Interval;

/**
 * @brief Результат разности интервалов
 *
 * monostate: ничего не осталось; Interval: один кусок (в том числе
 * исходный интервал без изменений); pair: верхний и нижний куски.
 */
using IntervalDifference = std::variant<std::monostate, Interval, std::pair<Interval, Interval>>;

/**
 * @brief Интервал или точка (кровля = подошва)
 */
class Interval {
public:
    Interval(Position top,
             Position base,
             std::string description = {},
             ComponentList components = {},
             DataMap data = {});

    Interval(double top,
             double base,
             std::string description = {},
             ComponentList components = {},
             DataMap data = {});

    /**
     * @brief Точечный интервал (подошва совпадает с кровлей)
     */
    [[nodiscard]] static Interval point(Position at,
                                        std::string description = {},
                                        ComponentList components = {},
                                        DataMap data = {});

    // === Доступ ===

    [[nodiscard]] const Position& top() const noexcept { return top_; }
    [[nodiscard]] const Position& base() const noexcept { return base_; }
    void setTop(Position top) { top_ = std::move(top); }
    void setTop(double z) { top_ = Position(z); }
    void setBase(Position base) { base_ = std::move(base); }
    void setBase(double z) { base_ = Position(z); }

    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    void setDescription(std::string description) { description_ = std::move(description); }

    [[nodiscard]] const ComponentList& components() const noexcept { return components_; }
    void setComponents(ComponentList components) { components_ = std::move(components); }

    [[nodiscard]] const DataMap& data() const noexcept { return data_; }
    [[nodiscard]] DataMap& data() noexcept { return data_; }

    /**
     * @brief Основной (первый) компонент или nullptr
     */
    [[nodiscard]] const Component* primary() const noexcept {
        return components_.empty() ? nullptr : &components_.front();
    }

    // === Производные величины ===

    [[nodiscard]] double thickness() const noexcept;
    [[nodiscard]] double middle() const noexcept { return (top_.z() + base_.z()) / 2.0; }

    /**
     * @brief Минимально возможная мощность с учётом неопределённости границ
     */
    [[nodiscard]] double minThickness() const noexcept;

    /**
     * @brief Максимально возможная мощность с учётом неопределённости границ
     */
    [[nodiscard]] double maxThickness() const noexcept;

    [[nodiscard]] IntervalKind kind() const noexcept {
        return thickness() == 0.0 ? IntervalKind::Point : IntervalKind::Interval;
    }

    /**
     * @brief Elevation, если кровля численно выше подошвы, иначе Depth
     */
    [[nodiscard]] Order order() const noexcept {
        return top_.z() > base_.z() ? Order::Elevation : Order::Depth;
    }

    /**
     * @brief Нет ни компонентов, ни данных
     */
    [[nodiscard]] bool empty() const noexcept { return components_.empty() && data_.empty(); }

    /**
     * @brief Текстовая сводка: "20.00 m of grey, sandstone"
     *
     * Берётся из компонентов, при их отсутствии из описания.
     * Пустая строка, если нет ни того, ни другого.
     */
    [[nodiscard]] std::string summary(const std::optional<std::string>& fmt = std::nullopt,
                                      bool initial = false) const;

    /**
     * @brief Перевернуть интервал (глубины <-> отметки) на месте
     */
    void invert() noexcept;

    /**
     * @brief Перевёрнутая копия
     */
    [[nodiscard]] Interval inverted() const;

    // === Взаимное расположение ===

    /**
     * @brief Классификация взаимного расположения с учётом порядка
     *
     * @throws IntervalError Если оба интервала имеют мощность,
     *         но разный порядок
     */
    [[nodiscard]] Relationship relationship(const Interval& other) const;

    [[nodiscard]] bool anyOverlaps(const Interval& other) const;
    [[nodiscard]] bool partiallyOverlaps(const Interval& other) const {
        return relationship(other) == Relationship::Partially;
    }
    [[nodiscard]] bool completelyContains(const Interval& other) const {
        return relationship(other) == Relationship::Contains;
    }
    [[nodiscard]] bool isContainedBy(const Interval& other) const {
        return relationship(other) == Relationship::ContainedBy;
    }
    [[nodiscard]] bool touches(const Interval& other) const {
        return relationship(other) == Relationship::Touches;
    }

    /**
     * @brief Лежит ли уровень d внутри интервала (границы включены)
     */
    [[nodiscard]] bool spans(double d) const noexcept;

    /**
     * @brief Выше ли этот интервал (по кровле) с учётом порядка
     */
    [[nodiscard]] bool isAbove(const Interval& other) const noexcept;

    // === Алгебра ===

    /**
     * @brief Разбить на уровне d
     * @return Пара (верхний, нижний); содержимое копируется без смешивания
     * @throws IntervalError Если d вне интервала
     */
    [[nodiscard]] std::pair<Interval, Interval> splitAt(double d) const;

    /**
     * @brief Область перекрытия
     *
     * @param blend true: компоненты, описания и данные объединяются;
     *              false: содержимое берётся из other
     * @throws IntervalError Если интервалы не перекрываются
     */
    [[nodiscard]] Interval intersect(const Interval& other, bool blend = true) const;

    /**
     * @brief Разбиение общей протяжённости на неперекрывающиеся куски
     *
     * Куски идут сверху вниз; средний кусок объединяет содержимое
     * как в intersect(). Куски нулевой мощности сверху и снизу
     * отбрасываются. При частичном перекрытии без смешивания
     * возвращаются два куска: хвост верхнего интервала и other целиком.
     *
     * @throws IntervalError Если интервалы не перекрываются
     */
    [[nodiscard]] std::vector<Interval> merge(const Interval& other, bool blend = true) const;

    /**
     * @brief Объединение в один интервал от верхней кровли до нижней подошвы
     *
     * @throws IntervalError Если интервалы не перекрываются и не соприкасаются
     */
    [[nodiscard]] Interval unionWith(const Interval& other, bool blend = true) const;

    /**
     * @brief Разность: часть этого интервала вне other
     */
    [[nodiscard]] IntervalDifference difference(const Interval& other) const;

    /**
     * @brief Добавить компонент: он дописывается в конец списка,
     *        а описание дополняется " with <сводка>"
     */
    [[nodiscard]] Interval plus(const Component& component) const;

    Interval operator+(const Interval& other) const { return unionWith(other); }
    Interval operator+(const Component& component) const { return plus(component); }

    /**
     * @brief Равенство только по кровле (для упорядочивания)
     */
    bool operator==(const Interval& other) const noexcept { return top_ == other.top_; }

    /**
     * @brief Стратиграфический порядок: выше (по кровле) идёт раньше
     */
    bool operator<(const Interval& other) const noexcept { return isAbove(other); }

private:
    struct Exploded;

    /**
     * @brief Разложение двух перекрывающихся интервалов на три куска
     *
     * upper и lower: неперекрытые хвосты, middle: область перекрытия
     * с содержимым нижнего (по кровле) интервала. Если один интервал
     * содержит другой, разрез идёт по границам вложенного.
     */
    [[nodiscard]] Exploded explode(const Interval& other) const;

    [[nodiscard]] Order commonOrder(const Interval& other) const;
    [[nodiscard]] DataMap combineData(const Interval& other) const;
    [[nodiscard]] std::string blendDescriptions(const Interval& other) const;
    void combineFrom(const Interval& self, const Interval& other, bool blend);

    Position top_;
    Position base_;
    std::string description_;
    ComponentList components_;
    DataMap data_;
};

} // namespace striplog::model
