/**
 * @file component.cpp
 * @brief Реализация компонента
 */

#include "component.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace striplog::model {

namespace {

std::string toLowerAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string toUpperAscii(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string capitalize(std::string_view text) {
    std::string result = toLowerAscii(text);
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string titleCase(std::string_view text) {
    std::string result = toLowerAscii(text);
    bool word_start = true;
    for (auto& ch : result) {
        if (std::isalpha(static_cast<unsigned char>(ch))) {
            if (word_start) {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return result;
}

std::string applyConversion(const std::string& value, char conversion) {
    switch (conversion) {
        case 'u': return toUpperAscii(value);
        case 'l': return toLowerAscii(value);
        case 'c': return capitalize(value);
        case 't': return titleCase(value);
        default: return value;
    }
}

Value normalizeValue(Value value) {
    if (value.isString()) {
        return parseScalar(value.asString());
    }
    return value;
}

// Ключ -> значение для сравнения: только строки и логические
std::map<std::string, Value> comparableView(const std::vector<Component::Property>& props) {
    std::map<std::string, Value> view;
    for (const auto& [key, value] : props) {
        if (value.isString()) {
            if (!value.asString().empty()) {
                view[toLowerAscii(key)] = Value{toLowerAscii(value.asString())};
            }
        } else if (value.isBool()) {
            view[toLowerAscii(key)] = value;
        }
    }
    return view;
}

} // namespace

Component::Component(std::initializer_list<Property> properties)
    : Component(std::vector<Property>(properties)) {}

Component::Component(std::vector<Property> properties) {
    for (auto& [key, value] : properties) {
        if (value.isNull()) {
            continue;
        }
        set(key, std::move(value));
    }
}

const Value* Component::get(std::string_view key) const noexcept {
    for (const auto& [k, v] : properties_) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

void Component::set(const std::string& key, Value value) {
    value = normalizeValue(std::move(value));
    for (auto& [k, v] : properties_) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    properties_.emplace_back(key, std::move(value));
}

void Component::erase(std::string_view key) {
    properties_.erase(
        std::remove_if(properties_.begin(), properties_.end(),
                       [key](const Property& p) { return p.first == key; }),
        properties_.end());
}

std::string Component::summary(const std::optional<std::string>& fmt,
                               bool initial,
                               const std::string& fallback) const {
    if (!fallback.empty() && properties_.empty()) {
        return fallback;
    }
    if (fmt.has_value() && fmt->empty()) {
        return fallback;
    }

    std::string result;
    if (!fmt.has_value()) {
        bool first = true;
        for (const auto& [key, value] : properties_) {
            std::string text = value.toString();
            if (text.empty()) {
                continue;
            }
            if (!first) {
                result += ", ";
            }
            result += text;
            first = false;
        }
        if (initial && !result.empty()) {
            result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
        }
        return result;
    }

    const std::string& f = *fmt;
    size_t pos = 0;
    while (pos < f.size()) {
        char ch = f[pos];
        if (ch == '{' && pos + 1 < f.size() && f[pos + 1] == '{') {
            result += '{';
            pos += 2;
            continue;
        }
        if (ch == '}' && pos + 1 < f.size() && f[pos + 1] == '}') {
            result += '}';
            pos += 2;
            continue;
        }
        if (ch != '{') {
            result += ch;
            ++pos;
            continue;
        }

        size_t close = f.find('}', pos);
        if (close == std::string::npos) {
            throw ComponentError("Ошибка построения сводки: незакрытое поле в формате '" + f + "'");
        }

        std::string field = f.substr(pos + 1, close - pos - 1);
        char conversion = '\0';
        if (auto bang = field.find('!'); bang != std::string::npos) {
            if (bang + 1 < field.size()) {
                conversion = field[bang + 1];
            }
            field = field.substr(0, bang);
        }

        const Value* value = get(field);
        result += value ? applyConversion(value->toString(), conversion) : std::string("_");
        pos = close + 1;
    }
    return result;
}

Component Component::restrictedTo(const std::vector<std::string>& keys) const {
    Component result;
    for (const auto& [key, value] : properties_) {
        if (std::find(keys.begin(), keys.end(), key) != keys.end()) {
            result.properties_.emplace_back(key, value);
        }
    }
    return result;
}

bool Component::operator==(const Component& other) const {
    return comparableView(properties_) == comparableView(other.properties_);
}

} // namespace striplog::model
