/**
 * @file log_sampling.cpp
 * @brief Реализация растеризации колонки
 */

#include "log_sampling.hpp"
#include <algorithm>
#include <cmath>

namespace striplog::core {

namespace {

constexpr double SAMPLE_TOLERANCE = 1e-9;

ComponentList restrictTable(const ComponentList& table, const std::vector<std::string>& keys) {
    ComponentList result;
    for (const auto& c : table) {
        Component restricted = c.restrictedTo(keys);
        if (std::find(result.begin(), result.end(), restricted) == result.end()) {
            result.push_back(std::move(restricted));
        }
    }
    return result;
}

ValueList collectFieldValues(const Striplog& strip, const std::string& field) {
    ValueList values;
    for (const auto& iv : strip) {
        auto it = iv.data().find(field);
        if (it == iv.data().end() || !it->second.truthy()) {
            continue;
        }
        if (std::find(values.begin(), values.end(), it->second) == values.end()) {
            values.push_back(it->second);
        }
    }
    return values;
}

double keyForField(const Interval& iv, const LogOptions& options, const ValueList& table) {
    auto it = iv.data().find(*options.field);
    if (it == iv.data().end() || !it->second.truthy()) {
        return options.undefined;
    }
    const Value& value = it->second;
    if (options.bins) {
        auto pos = std::find(table.begin(), table.end(), value);
        if (pos == table.end()) {
            return options.undefined;
        }
        return static_cast<double>(pos - table.begin() + 1);
    }
    if (value.isNumber()) {
        return value.asNumber();
    }
    if (value.isBool()) {
        return value.asBool() ? 1.0 : 0.0;
    }
    return options.undefined;
}

double keyForComponent(const Interval& iv, const LogOptions& options, const ComponentList& table) {
    const Component* primary = iv.primary();
    if (primary == nullptr) {
        return options.undefined;
    }
    Component key = options.match_only.empty() ? *primary : primary->restrictedTo(options.match_only);
    auto pos = std::find(table.begin(), table.end(), key);
    if (pos == table.end()) {
        return options.undefined;
    }
    return static_cast<double>(pos - table.begin() + 1);
}

// Номер первого отсчёта, отстоящего от начала основы не меньше чем на offset
size_t sampleIndex(double offset, double step) {
    return static_cast<size_t>(std::ceil(offset / step - SAMPLE_TOLERANCE));
}

} // namespace

std::vector<double> makeBasis(double start, double stop, double step) {
    if (!(step > 0.0)) {
        throw StriplogError("Шаг растеризации должен быть положительным");
    }
    if (stop < start) {
        throw StriplogError("Конец растеризации меньше начала");
    }

    const size_t count = sampleIndex(stop - start, step) + 1;
    std::vector<double> basis(count);
    for (size_t i = 0; i < count; ++i) {
        basis[i] = start + step * static_cast<double>(i);
    }
    return basis;
}

SampledLog toLog(const Striplog& strip, const LogOptions& options) {
    SampledLog result;

    double start = 0.0;
    double stop = 0.0;
    double step = options.step;
    if (options.basis.has_value()) {
        if (options.basis->size() < 2) {
            throw StriplogError("Основа растеризации должна содержать хотя бы два отсчёта");
        }
        result.basis = *options.basis;
        start = result.basis.front();
        stop = result.basis.back();
        step = result.basis[1] - result.basis[0];
        if (!(step > 0.0)) {
            throw StriplogError("Основа растеризации должна возрастать");
        }
    } else {
        start = options.start.value_or(strip.start().z());
        stop = options.stop.value_or(strip.stop().z());
        result.basis = makeBasis(start, stop, step);
        stop = result.basis.back();
    }

    if (options.field.has_value()) {
        result.field_values = options.value_table.has_value()
            ? *options.value_table
            : collectFieldValues(strip, *options.field);
    } else {
        result.components = options.table.has_value() ? *options.table : strip.components();
        if (!options.match_only.empty()) {
            result.components = restrictTable(result.components, options.match_only);
        }
    }

    const size_t count = result.basis.size();
    result.values.assign(count, options.undefined);

    for (const auto& iv : strip) {
        const double zmin = std::min(iv.top().z(), iv.base().z());
        const double zmax = std::max(iv.top().z(), iv.base().z());
        if (zmax < start || zmin > stop) {
            continue;
        }

        const double key = options.field.has_value()
            ? keyForField(iv, options, result.field_values)
            : keyForComponent(iv, options, result.components);

        const size_t first = sampleIndex(std::max(start, zmin) - start, step);
        for (size_t i = first; i < count && result.basis[i] <= zmax + SAMPLE_TOLERANCE; ++i) {
            result.values[i] = key;
        }
    }
    return result;
}

std::vector<bool> toFlag(const Striplog& strip, const LogOptions& options) {
    const SampledLog log = toLog(strip, options);
    std::vector<bool> flags;
    flags.reserve(log.values.size());
    for (double v : log.values) {
        flags.push_back(!std::isnan(v) && v != 0.0);
    }
    return flags;
}

SampledLog toBinaryLog(const Striplog& strip, const std::string& attr, double step) {
    LogOptions options;
    options.step = step;
    options.match_only = {attr};
    options.undefined = -1.0;
    options.table = ComponentList{Component{{attr, false}}, Component{{attr, true}}};

    SampledLog log = toLog(strip, options);
    for (auto& v : log.values) {
        v -= 1.0;
    }
    return log;
}

} // namespace striplog::core
