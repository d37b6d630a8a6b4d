/**
 * @file striplog.cpp
 * @brief Реализация колонки и алгоритмов над последовательностью интервалов
 */

#include "striplog.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <regex>
#include <set>

namespace striplog::core {

namespace {

// Координата вдоль направления "сверху вниз"
double strat(double z, Order order) noexcept {
    return order == Order::Elevation ? -z : z;
}

// Точечная колонка для поиска разрывов ведёт себя как колонка глубин
Order scanOrder(Order order) noexcept {
    return order == Order::Elevation ? Order::Elevation : Order::Depth;
}

std::vector<size_t> findIncongruities(const std::vector<Interval>& intervals,
                                      Order order,
                                      bool overlaps) {
    std::vector<size_t> hits;
    if (intervals.size() < 2) {
        return hits;
    }
    const Order ord = scanOrder(order);
    for (size_t i = 0; i + 1 < intervals.size(); ++i) {
        const double base = strat(intervals[i].base().z(), ord);
        const double next_top = strat(intervals[i + 1].top().z(), ord);
        if (overlaps ? base > next_top : base < next_top) {
            hits.push_back(i);
        }
    }
    return hits;
}

void checkIndex(size_t index, size_t size) {
    if (index >= size) {
        throw StriplogError("Индекс " + std::to_string(index) +
                            " вне диапазона (интервалов: " + std::to_string(size) + ")");
    }
}

double meanOf(const std::vector<double>& values) {
    if (values.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

bool samePrimary(const Interval& a, const Interval& b) {
    const Component* pa = a.primary();
    const Component* pb = b.primary();
    if (pa == nullptr || pb == nullptr) {
        return pa == pb;
    }
    return *pa == *pb;
}

void checkCompatible(Order a, Order b) {
    if (a != Order::None && b != Order::None && a != b) {
        throw StriplogError("Колонки имеют разный порядок: " + toString(a) + " и " + toString(b));
    }
}

} // namespace

// ============================================================================
// Построение и нормализация
// ============================================================================

Striplog::Striplog(std::vector<Interval> intervals,
                   std::optional<Order> order,
                   std::string source)
    : source_(std::move(source)) {
    if (intervals.empty()) {
        throw StriplogError("Нельзя создать пустую колонку");
    }
    order_ = order.has_value() ? *order : detectOrder(intervals);
    intervals_ = normalized(std::move(intervals), order_);
}

Order Striplog::detectOrder(const std::vector<Interval>& intervals) {
    auto all = [&intervals](auto pred) {
        return std::all_of(intervals.begin(), intervals.end(), pred);
    };
    if (all([](const Interval& iv) { return iv.base().z() == iv.top().z(); })) {
        return Order::None;
    }
    if (all([](const Interval& iv) { return iv.base().z() >= iv.top().z(); })) {
        return Order::Depth;
    }
    if (all([](const Interval& iv) { return iv.base().z() <= iv.top().z(); })) {
        return Order::Elevation;
    }
    throw StriplogError("Не удалось определить порядок по кровлям и подошвам");
}

std::vector<Interval> Striplog::normalized(std::vector<Interval> intervals, Order order) {
    if (intervals.empty()) {
        throw StriplogError("Колонка не может быть пустой");
    }

    for (const auto& iv : intervals) {
        const double top = iv.top().z();
        const double base = iv.base().z();
        switch (order) {
            case Order::Depth:
                if (base < top) {
                    throw StriplogError("Задан порядок depth, но подошва выше кровли");
                }
                break;
            case Order::Elevation:
                if (base > top) {
                    throw StriplogError("Задан порядок elevation, но подошва выше кровли");
                }
                break;
            case Order::None:
                if (base != top) {
                    throw StriplogError("Задан порядок none, но кровля не совпадает с подошвой");
                }
                break;
        }
    }

    // Сверху вниз; при общей кровле первым идёт более тонкий интервал
    const Order ord = scanOrder(order);
    std::stable_sort(intervals.begin(), intervals.end(),
                     [ord](const Interval& a, const Interval& b) {
                         const double ta = strat(a.top().z(), ord);
                         const double tb = strat(b.top().z(), ord);
                         if (ta != tb) {
                             return ta < tb;
                         }
                         return strat(a.base().z(), ord) < strat(b.base().z(), ord);
                     });
    return intervals;
}

void Striplog::commit(std::vector<Interval> intervals) {
    intervals_ = normalized(std::move(intervals), order_);
}

// ============================================================================
// Доступ и изменение
// ============================================================================

const Interval& Striplog::at(size_t index) const {
    checkIndex(index, intervals_.size());
    return intervals_[index];
}

std::optional<Striplog> Striplog::slice(size_t begin, size_t end) const {
    end = std::min(end, intervals_.size());
    if (begin >= end) {
        return std::nullopt;
    }
    std::vector<Interval> part(intervals_.begin() + static_cast<std::ptrdiff_t>(begin),
                               intervals_.begin() + static_cast<std::ptrdiff_t>(end));
    return Striplog(std::move(part), order_, source_);
}

std::optional<Striplog> Striplog::select(const std::vector<size_t>& indices) const {
    std::vector<Interval> part;
    part.reserve(indices.size());
    for (size_t index : indices) {
        checkIndex(index, intervals_.size());
        part.push_back(intervals_[index]);
    }
    if (part.empty()) {
        return std::nullopt;
    }
    return Striplog(std::move(part), order_, source_);
}

void Striplog::replace(size_t index, Interval interval) {
    checkIndex(index, intervals_.size());
    std::vector<Interval> list = intervals_;
    list[index] = std::move(interval);
    commit(std::move(list));
}

void Striplog::assign(const std::vector<size_t>& indices, std::vector<Interval> intervals) {
    if (indices.size() != intervals.size()) {
        throw StriplogError("Число индексов (" + std::to_string(indices.size()) +
                            ") не совпадает с числом интервалов (" +
                            std::to_string(intervals.size()) + ")");
    }
    std::vector<Interval> list = intervals_;
    for (size_t i = 0; i < indices.size(); ++i) {
        checkIndex(indices[i], list.size());
        list[indices[i]] = std::move(intervals[i]);
    }
    commit(std::move(list));
}

void Striplog::erase(const std::vector<size_t>& indices) {
    std::set<size_t> doomed;
    for (size_t index : indices) {
        checkIndex(index, intervals_.size());
        doomed.insert(index);
    }
    if (doomed.size() == intervals_.size()) {
        throw StriplogError("Нельзя удалить все интервалы колонки");
    }

    std::vector<Interval> list;
    list.reserve(intervals_.size() - doomed.size());
    for (size_t i = 0; i < intervals_.size(); ++i) {
        if (doomed.count(i) == 0) {
            list.push_back(intervals_[i]);
        }
    }
    commit(std::move(list));
}

void Striplog::append(Interval interval) {
    std::vector<Interval> list = intervals_;
    list.push_back(std::move(interval));
    commit(std::move(list));
}

void Striplog::insert(size_t index, Interval interval) {
    if (index > intervals_.size()) {
        throw StriplogError("Позиция вставки " + std::to_string(index) + " вне диапазона");
    }
    std::vector<Interval> list = intervals_;
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(index), std::move(interval));
    commit(std::move(list));
}

void Striplog::extend(const Striplog& other) {
    std::vector<Interval> list = intervals_;
    list.insert(list.end(), other.intervals_.begin(), other.intervals_.end());
    commit(std::move(list));
}

Interval Striplog::pop(std::optional<size_t> index) {
    const size_t i = index.value_or(intervals_.size() - 1);
    checkIndex(i, intervals_.size());
    if (intervals_.size() == 1) {
        throw StriplogError("Нельзя извлечь последний интервал колонки");
    }
    Interval removed = intervals_[i];
    std::vector<Interval> list = intervals_;
    list.erase(list.begin() + static_cast<std::ptrdiff_t>(i));
    commit(std::move(list));
    return removed;
}

Striplog Striplog::operator+(const Striplog& other) const {
    std::vector<Interval> list = intervals_;
    list.insert(list.end(), other.intervals_.begin(), other.intervals_.end());
    return Striplog(std::move(list), std::nullopt, source_);
}

Striplog Striplog::operator+(const Interval& interval) const {
    std::vector<Interval> list = intervals_;
    list.push_back(interval);
    return Striplog(std::move(list), std::nullopt, source_);
}

// ============================================================================
// Сводки
// ============================================================================

bool Striplog::contains(const Component& component) const {
    return std::any_of(intervals_.begin(), intervals_.end(), [&component](const Interval& iv) {
        const auto& comps = iv.components();
        return std::find(comps.begin(), comps.end(), component) != comps.end();
    });
}

Position Striplog::start() const {
    if (order_ == Order::Depth) {
        auto it = std::min_element(intervals_.begin(), intervals_.end(),
                                   [](const Interval& a, const Interval& b) { return a.top().z() < b.top().z(); });
        return it->top();
    }
    auto it = std::min_element(intervals_.begin(), intervals_.end(),
                               [](const Interval& a, const Interval& b) { return a.base().z() < b.base().z(); });
    return it->base();
}

Position Striplog::stop() const {
    if (order_ == Order::Depth) {
        auto it = std::max_element(intervals_.begin(), intervals_.end(),
                                   [](const Interval& a, const Interval& b) { return a.base().z() < b.base().z(); });
        return it->base();
    }
    auto it = std::max_element(intervals_.begin(), intervals_.end(),
                               [](const Interval& a, const Interval& b) { return a.top().z() < b.top().z(); });
    return it->top();
}

double Striplog::cum() const noexcept {
    double total = 0.0;
    for (const auto& iv : intervals_) {
        total += iv.thickness();
    }
    return total;
}

std::vector<UniqueEntry> Striplog::unique() const {
    std::vector<UniqueEntry> table;
    for (const auto& iv : intervals_) {
        const Component* primary = iv.primary();
        auto it = std::find_if(table.begin(), table.end(), [primary](const UniqueEntry& entry) {
            if (primary == nullptr) {
                return !entry.component.has_value();
            }
            return entry.component.has_value() && *entry.component == *primary;
        });
        if (it == table.end()) {
            UniqueEntry entry;
            if (primary != nullptr) {
                entry.component = *primary;
            }
            entry.thickness = iv.thickness();
            table.push_back(std::move(entry));
        } else {
            it->thickness += iv.thickness();
        }
    }
    std::stable_sort(table.begin(), table.end(), [](const UniqueEntry& a, const UniqueEntry& b) {
        return a.thickness > b.thickness;
    });
    return table;
}

ComponentList Striplog::components() const {
    ComponentList result;
    for (auto& entry : unique()) {
        if (entry.component.has_value()) {
            result.push_back(std::move(*entry.component));
        }
    }
    return result;
}

std::vector<size_t> Striplog::thinnestIndices(size_t n) const {
    std::vector<size_t> order(intervals_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return intervals_[a].thickness() < intervals_[b].thickness();
    });
    order.resize(std::min(n, order.size()));
    return order;
}

std::vector<size_t> Striplog::thickestIndices(size_t n) const {
    std::vector<size_t> order(intervals_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [this](size_t a, size_t b) {
        return intervals_[a].thickness() < intervals_[b].thickness();
    });
    const size_t count = std::min(n, order.size());
    return std::vector<size_t>(order.end() - static_cast<std::ptrdiff_t>(count), order.end());
}

Striplog Striplog::thickest(size_t n) const {
    auto result = select(thickestIndices(n));
    if (!result) {
        throw StriplogError("Нужно запросить хотя бы один интервал");
    }
    return std::move(*result);
}

Striplog Striplog::thinnest(size_t n) const {
    auto result = select(thinnestIndices(n));
    if (!result) {
        throw StriplogError("Нужно запросить хотя бы один интервал");
    }
    return std::move(*result);
}

std::optional<size_t> Striplog::indexAt(double d) const {
    for (size_t i = 0; i < intervals_.size(); ++i) {
        if (intervals_[i].spans(d)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<Interval> Striplog::readAt(double d) const {
    if (auto index = indexAt(d)) {
        return intervals_[*index];
    }
    return std::nullopt;
}

std::vector<size_t> Striplog::findIndices(const std::string& pattern, bool ignore_case) const {
    std::regex re;
    try {
        auto flags = std::regex::ECMAScript;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        re = std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw StriplogError("Некорректное регулярное выражение '" + pattern + "': " + e.what());
    }

    std::vector<size_t> hits;
    for (size_t i = 0; i < intervals_.size(); ++i) {
        const Interval& iv = intervals_[i];
        std::string text = iv.description();
        if (text.empty() && iv.primary() != nullptr) {
            text = iv.primary()->summary();
        }
        if (std::regex_search(text, re)) {
            hits.push_back(i);
        }
    }
    return hits;
}

std::vector<size_t> Striplog::findIndices(const Component& component) const {
    std::vector<size_t> hits;
    for (size_t i = 0; i < intervals_.size(); ++i) {
        const auto& comps = intervals_[i].components();
        if (std::find(comps.begin(), comps.end(), component) != comps.end()) {
            hits.push_back(i);
        }
    }
    return hits;
}

std::optional<Striplog> Striplog::find(const std::string& pattern, bool ignore_case) const {
    return select(findIndices(pattern, ignore_case));
}

std::optional<Striplog> Striplog::find(const Component& component) const {
    return select(findIndices(component));
}

std::vector<double> Striplog::getData(const std::string& field, double fallback) const {
    std::vector<double> result;
    result.reserve(intervals_.size());
    for (const auto& iv : intervals_) {
        auto it = iv.data().find(field);
        if (it == iv.data().end()) {
            result.push_back(fallback);
        } else if (it->second.isNumber()) {
            result.push_back(it->second.asNumber());
        } else if (it->second.isBool()) {
            result.push_back(it->second.asBool() ? 1.0 : 0.0);
        } else {
            result.push_back(fallback);
        }
    }
    return result;
}

Striplog Striplog::extract(const std::vector<double>& log,
                           const std::vector<double>& basis,
                           const std::string& name,
                           Reducer reducer) const {
    if (log.size() != basis.size()) {
        throw StriplogError("Размеры каротажа (" + std::to_string(log.size()) +
                            ") и его основы (" + std::to_string(basis.size()) + ") не совпадают");
    }
    if (!reducer) {
        reducer = meanOf;
    }

    std::map<size_t, std::vector<double>> groups;
    for (size_t i = 0; i < basis.size(); ++i) {
        if (auto index = indexAt(basis[i])) {
            groups[*index].push_back(log[i]);
        }
    }

    std::vector<Interval> list = intervals_;
    for (const auto& [index, samples] : groups) {
        list[index].data()[name] = Value{reducer(samples)};
    }
    return Striplog(std::move(list), order_, source_);
}

// ============================================================================
// Разрывы и перекрытия
// ============================================================================

std::vector<size_t> Striplog::incongruities(bool overlaps) const {
    return findIncongruities(intervals_, order_, overlaps);
}

std::optional<Striplog> Striplog::incongruityIntervals(bool overlaps) const {
    const auto hits = incongruities(overlaps);
    if (hits.empty()) {
        return std::nullopt;
    }

    const Order ord = scanOrder(order_);
    std::vector<Interval> result;
    result.reserve(hits.size());
    for (size_t i : hits) {
        const Interval& iv = intervals_[i];
        const Interval& next = intervals_[i + 1];
        if (overlaps) {
            const Position& base = strat(iv.base().z(), ord) < strat(next.base().z(), ord)
                ? iv.base() : next.base();
            result.emplace_back(next.top(), base);
        } else {
            result.emplace_back(iv.base(), next.top());
        }
    }
    return Striplog(std::move(result), ord, source_);
}

std::vector<size_t> Striplog::gapIndices() const {
    return incongruities(false);
}

std::vector<size_t> Striplog::overlapIndices() const {
    return incongruities(true);
}

std::optional<Striplog> Striplog::findGaps() const {
    return incongruityIntervals(false);
}

std::optional<Striplog> Striplog::findOverlaps() const {
    return incongruityIntervals(true);
}

void Striplog::mergeOverlaps() {
    std::set<double> boundaries;
    for (const auto& iv : intervals_) {
        boundaries.insert(iv.top().z());
        boundaries.insert(iv.base().z());
    }
    const size_t limit = 4 * boundaries.size() * boundaries.size() + 16;

    std::vector<Interval> list = intervals_;
    for (size_t step = 0;; ++step) {
        const auto hits = findIncongruities(list, order_, true);
        if (hits.empty()) {
            break;
        }
        if (step >= limit) {
            throw StriplogError("Слияние перекрытий не сошлось за " + std::to_string(limit) + " шагов");
        }

        const size_t i = hits.front();
        std::vector<Interval> pieces;
        try {
            pieces = list[i].merge(list[i + 1]);
        } catch (const IntervalError& e) {
            throw StriplogError("Не удалось слить интервалы " + std::to_string(i) + " и " +
                                std::to_string(i + 1) + ": " + e.what());
        }

        std::vector<Interval> next;
        next.reserve(list.size() + pieces.size());
        next.insert(next.end(), list.begin(), list.begin() + static_cast<std::ptrdiff_t>(i));
        next.insert(next.end(), pieces.begin(), pieces.end());
        next.insert(next.end(), list.begin() + static_cast<std::ptrdiff_t>(i + 2), list.end());
        list = normalized(std::move(next), order_);
    }
    intervals_ = std::move(list);
}

void Striplog::anneal(AnnealMode mode) {
    const auto gaps = gapIndices();
    if (gaps.empty()) {
        return;
    }

    std::vector<Interval> list = intervals_;
    for (size_t i : gaps) {
        Interval& before = list[i];
        Interval& after = list[i + 1];
        switch (mode) {
            case AnnealMode::Middle: {
                const double middle = (before.base().z() + after.top().z()) / 2.0;
                before.setBase(middle);
                after.setTop(middle);
                break;
            }
            case AnnealMode::Down:
                before.setBase(after.top().z());
                break;
            case AnnealMode::Up:
                after.setTop(before.base().z());
                break;
        }
    }
    commit(std::move(list));
}

void Striplog::prune(const PruneCriteria& criteria) {
    if (criteria.modeCount() != 1) {
        throw StriplogError("Для отбраковки нужен ровно один критерий: limit, n или percentile");
    }

    std::vector<size_t> doomed;
    if (criteria.limit.has_value()) {
        for (size_t i = 0; i < intervals_.size(); ++i) {
            if (intervals_[i].thickness() < *criteria.limit) {
                doomed.push_back(i);
            }
        }
    } else if (criteria.n.has_value()) {
        doomed = thinnestIndices(*criteria.n);
    } else {
        const double pct = *criteria.percentile;
        if (pct < 0.0 || pct > 100.0) {
            throw StriplogError("Процентиль должен лежать в диапазоне [0, 100]");
        }
        const auto n = static_cast<size_t>(std::floor(static_cast<double>(intervals_.size()) * pct / 100.0));
        doomed = thinnestIndices(n);
    }

    if (criteria.keep_ends) {
        const size_t last = intervals_.size() - 1;
        doomed.erase(std::remove_if(doomed.begin(), doomed.end(),
                                    [last](size_t i) { return i == 0 || i == last; }),
                     doomed.end());
    }

    if (doomed.empty()) {
        return;
    }
    erase(doomed);
}

Striplog Striplog::mergeNeighbours(bool strict) const {
    std::vector<Interval> result;
    result.push_back(intervals_.front());

    for (size_t i = 1; i < intervals_.size(); ++i) {
        const Interval& lower = intervals_[i];
        Interval& current = result.back();

        const bool touching = current.touches(lower);
        const bool similar = strict ? current.components() == lower.components()
                                    : samePrimary(current, lower);
        if (touching && similar) {
            current = current.unionWith(lower);
        } else {
            result.push_back(lower);
        }
    }
    return Striplog(std::move(result), order_, source_);
}

// ============================================================================
// Операции над колонками
// ============================================================================

Striplog Striplog::unionWith(const Striplog& other) const {
    checkCompatible(order_, other.order_);

    std::vector<Interval> result;
    result.reserve(intervals_.size());
    for (const auto& iv : intervals_) {
        Interval current = iv;
        for (const auto& jv : other.intervals_) {
            if (current.anyOverlaps(jv)) {
                current = current.unionWith(jv);
            }
        }
        result.push_back(std::move(current));
    }
    return Striplog(std::move(result), std::nullopt, source_);
}

std::optional<Striplog> Striplog::intersect(const Striplog& other) const {
    checkCompatible(order_, other.order_);

    std::vector<Interval> result;
    for (const auto& iv : intervals_) {
        for (const auto& jv : other.intervals_) {
            if (iv.anyOverlaps(jv)) {
                result.push_back(iv.intersect(jv));
            }
        }
    }
    if (result.empty()) {
        return std::nullopt;
    }
    return Striplog(std::move(result), std::nullopt, source_);
}

Striplog Striplog::fill(const std::optional<Component>& component) const {
    auto gaps = findGaps();
    if (!gaps) {
        return *this;
    }

    ComponentList filler;
    if (component.has_value()) {
        filler.push_back(*component);
    }

    std::vector<Interval> list = intervals_;
    for (const auto& gap : *gaps) {
        Interval iv = gap;
        iv.setComponents(filler);
        list.push_back(std::move(iv));
    }

    std::optional<Order> order;
    if (order_ != Order::None) {
        order = order_;
    }
    return Striplog(std::move(list), order, source_);
}

void Striplog::invert() {
    Order flipped = order_;
    if (order_ == Order::Depth) {
        flipped = Order::Elevation;
    } else if (order_ == Order::Elevation) {
        flipped = Order::Depth;
    }

    std::vector<Interval> list = intervals_;
    for (auto& iv : list) {
        iv.invert();
    }
    intervals_ = normalized(std::move(list), flipped);
    order_ = flipped;
}

Striplog Striplog::inverted() const {
    Striplog result = *this;
    result.invert();
    return result;
}

void Striplog::crop(std::optional<double> start, std::optional<double> stop) {
    const double a = start.has_value() ? *start : this->start().z();
    const double b = stop.has_value() ? *stop : this->stop().z();

    if (order_ == Order::None) {
        const double lo = std::min(a, b);
        const double hi = std::max(a, b);
        std::vector<Interval> list;
        for (const auto& iv : intervals_) {
            const double z = iv.top().z();
            if (lo <= z && z <= hi) {
                list.push_back(iv);
            }
        }
        if (list.empty()) {
            throw StriplogError("В диапазоне обрезки нет ни одной точки");
        }
        commit(std::move(list));
        return;
    }

    const double upper = order_ == Order::Depth ? std::min(a, b) : std::max(a, b);
    const double lower = order_ == Order::Depth ? std::max(a, b) : std::min(a, b);

    const auto first = indexAt(upper);
    const auto last = indexAt(lower);
    if (!first || !last || *last < *first) {
        throw StriplogError("Границы обрезки должны лежать внутри колонки");
    }

    std::vector<Interval> list;
    if (*first == *last) {
        list.push_back(intervals_[*first].splitAt(upper).second.splitAt(lower).first);
    } else {
        Interval head = intervals_[*first].splitAt(upper).second;
        Interval tail = intervals_[*last].splitAt(lower).first;
        if (head.thickness() > 0.0) {
            list.push_back(std::move(head));
        }
        for (size_t i = *first + 1; i < *last; ++i) {
            list.push_back(intervals_[i]);
        }
        if (tail.thickness() > 0.0) {
            list.push_back(std::move(tail));
        }
    }
    if (list.empty()) {
        throw StriplogError("После обрезки колонка пуста");
    }
    commit(std::move(list));
}

Striplog Striplog::cropped(std::optional<double> start, std::optional<double> stop) const {
    Striplog result = *this;
    result.crop(start, stop);
    return result;
}

Striplog Striplog::shifted(std::optional<double> delta, std::optional<double> start) const {
    if (!delta.has_value()) {
        if (!start.has_value()) {
            throw StriplogError("Нужно задать сдвиг или новое начало колонки");
        }
        delta = *start - this->start().z();
    }

    std::vector<Interval> list = intervals_;
    for (auto& iv : list) {
        iv.setTop(iv.top().shifted(*delta));
        iv.setBase(iv.base().shifted(*delta));
    }
    return Striplog(std::move(list), order_, source_);
}

double Striplog::netToGross(const std::string& attr) const {
    double net = 0.0;
    double non = 0.0;
    for (const auto& iv : intervals_) {
        const Component* primary = iv.primary();
        const Value* value = primary != nullptr ? primary->get(attr) : nullptr;
        if (value != nullptr && value->truthy()) {
            net += iv.thickness();
        } else {
            non += iv.thickness();
        }
    }
    if (net + non == 0.0) {
        throw StriplogError("Суммарная мощность колонки равна нулю");
    }
    return net / (net + non);
}

bool Striplog::isBinary(const std::string& attr) const {
    return std::all_of(intervals_.begin(), intervals_.end(), [&attr](const Interval& iv) {
        const Component* primary = iv.primary();
        if (primary == nullptr || primary->empty()) {
            return false;
        }
        const Value* value = attr.empty() ? &primary->properties().front().second : primary->get(attr);
        return value != nullptr && value->isBool();
    });
}

} // namespace striplog::core
