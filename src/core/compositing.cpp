/**
 * @file compositing.cpp
 * @brief Реализация приоритетного совмещения
 */

#include "compositing.hpp"
#include <algorithm>
#include <stdexcept>

namespace striplog::core {

namespace {

double strat(double z, Order order) noexcept {
    return order == Order::Elevation ? -z : z;
}

int compareOrThrow(const Value& a, const Value& b, const std::string& attr) {
    try {
        return compareValues(a, b);
    } catch (const std::invalid_argument& e) {
        throw StriplogError("Атрибут '" + attr + "': " + e.what());
    }
}

} // namespace

Value priorityOf(const Interval& interval, const std::string& attr) {
    if (attr == "top") return Value{interval.top().z()};
    if (attr == "base") return Value{interval.base().z()};
    if (attr == "thickness") return Value{interval.thickness()};
    if (attr == "middle") return Value{interval.middle()};

    auto it = interval.data().find(attr);
    if (it != interval.data().end()) {
        return it->second;
    }
    if (const Component* primary = interval.primary()) {
        if (const Value* value = primary->get(attr)) {
            return *value;
        }
    }
    throw StriplogError("У интервала нет атрибута '" + attr + "'");
}

std::vector<MergeEvent> buildEventTable(const Striplog& strip) {
    std::vector<MergeEvent> table;
    table.reserve(strip.size() * 2);
    for (size_t i = 0; i < strip.size(); ++i) {
        table.push_back({Boundary::Top, strip[i].top().z(), i});
        table.push_back({Boundary::Base, strip[i].base().z(), i});
    }

    const Order ord = strip.order();
    std::stable_sort(table.begin(), table.end(), [ord](const MergeEvent& a, const MergeEvent& b) {
        return strat(a.z, ord) < strat(b.z, ord);
    });
    return table;
}

std::vector<MergeEvent> buildMergeTable(const Striplog& strip,
                                        const std::string& attr,
                                        bool reverse) {
    std::vector<Value> priority;
    priority.reserve(strip.size());
    for (const auto& iv : strip) {
        priority.push_back(priorityOf(iv, attr));
    }

    // Новый интервал перекрывает текущий при >= (или <= для reverse)
    auto beats = [&](size_t challenger, size_t holder) {
        const int cmp = compareOrThrow(priority[challenger], priority[holder], attr);
        return reverse ? cmp <= 0 : cmp >= 0;
    };
    // Стек упорядочен так, что текущий источник лежит последним
    auto stackLess = [&](size_t a, size_t b) {
        const int cmp = compareOrThrow(priority[a], priority[b], attr);
        return reverse ? cmp > 0 : cmp < 0;
    };

    std::vector<MergeEvent> merged;
    std::vector<size_t> stack;

    for (const auto& event : buildEventTable(strip)) {
        if (event.boundary == Boundary::Top) {
            const bool wins = stack.empty() || beats(event.index, stack.back());
            if (wins) {
                if (!stack.empty()) {
                    merged.push_back({Boundary::Base, event.z, stack.back()});
                }
                merged.push_back(event);
            }
            stack.push_back(event.index);
            std::stable_sort(stack.begin(), stack.end(), stackLess);
            continue;
        }

        const bool current = !stack.empty() && stack.back() == event.index;
        if (current) {
            merged.push_back(event);
        }
        auto it = std::find(stack.begin(), stack.end(), event.index);
        if (it != stack.end()) {
            stack.erase(it);
        }
        if (current && !stack.empty()) {
            merged.push_back({Boundary::Top, event.z, stack.back()});
        }
    }
    return merged;
}

Striplog striplogFromMergeTable(const Striplog& strip, const std::vector<MergeEvent>& table) {
    if (table.size() % 2 != 0) {
        throw StriplogError("Таблица совмещения содержит непарные границы");
    }

    std::vector<Interval> pieces;
    for (size_t i = 0; i + 1 < table.size(); i += 2) {
        const MergeEvent& top = table[i];
        const MergeEvent& base = table[i + 1];
        if (top.z == base.z) {
            continue;
        }
        Interval piece = strip[top.index];
        piece.setTop(top.z);
        piece.setBase(base.z);
        pieces.push_back(std::move(piece));
    }

    if (pieces.empty()) {
        throw StriplogError("После совмещения не осталось интервалов ненулевой мощности");
    }
    return Striplog(std::move(pieces), std::nullopt, strip.source());
}

Striplog mergeByPriority(const Striplog& strip, const std::string& attr, bool reverse) {
    return striplogFromMergeTable(strip, buildMergeTable(strip, attr, reverse));
}

} // namespace striplog::core
