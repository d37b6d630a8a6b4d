/**
 * @file value.cpp
 * @brief Реализация значений свойств
 */

#include "value.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace striplog::model {

namespace {

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

int typeRank(const Value& v) {
    if (v.isNumber() || v.isBool()) return 0;
    if (v.isString()) return 1;
    return 2;
}

double numericOf(const Value& v) {
    if (v.isBool()) {
        return v.asBool() ? 1.0 : 0.0;
    }
    return v.asNumber();
}

} // namespace

bool Value::truthy() const noexcept {
    if (const auto* d = std::get_if<double>(&data)) return *d != 0.0;
    if (const auto* b = std::get_if<bool>(&data)) return *b;
    if (const auto* s = std::get_if<std::string>(&data)) return !s->empty();
    if (const auto* l = std::get_if<ValueList>(&data)) return !l->empty();
    return false;
}

std::string Value::toString() const {
    if (isNull()) {
        return {};
    }
    if (const auto* d = std::get_if<double>(&data)) {
        std::ostringstream ss;
        ss << *d;
        return ss.str();
    }
    if (const auto* b = std::get_if<bool>(&data)) {
        return *b ? "true" : "false";
    }
    if (const auto* s = std::get_if<std::string>(&data)) {
        return *s;
    }

    std::string result = "[";
    const auto& list = std::get<ValueList>(data);
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) result += ", ";
        result += list[i].toString();
    }
    result += "]";
    return result;
}

int compareValues(const Value& a, const Value& b) {
    int rank_a = typeRank(a);
    int rank_b = typeRank(b);
    if (rank_a != rank_b || rank_a == 2) {
        throw std::invalid_argument(
            "Несравнимые значения: '" + a.toString() + "' и '" + b.toString() + "'");
    }

    if (rank_a == 0) {
        double x = numericOf(a);
        double y = numericOf(b);
        if (x < y) return -1;
        if (x > y) return 1;
        return 0;
    }

    return a.asString().compare(b.asString());
}

Value listAndAdd(const Value& a, const Value& b) {
    ValueList result;
    if (a.isList()) {
        result = a.asList();
    } else {
        result.push_back(a);
    }
    if (b.isList()) {
        const auto& tail = b.asList();
        result.insert(result.end(), tail.begin(), tail.end());
    } else {
        result.push_back(b);
    }
    return Value{std::move(result)};
}

Value parseScalar(std::string_view text) {
    std::string s = trim(text);
    if (s.empty()) {
        return Value{std::string(text)};
    }

    char* end = nullptr;
    double number = std::strtod(s.c_str(), &end);
    if (end == s.c_str() + s.size()) {
        return Value{number};
    }
    return Value{std::string(text)};
}

} // namespace striplog::model
