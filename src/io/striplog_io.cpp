/**
 * @file striplog_io.cpp
 * @brief Реализация работы с документами колонки
 */

#include "striplog_io.hpp"
#include "file_utils.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <limits>

namespace striplog::io {

// Порядок свойств компонента значим для сводки, поэтому объекты упорядоченные
using json = nlohmann::ordered_json;

namespace {

// === Сериализация базовых типов ===

json valueToJson(const Value& v) {
    if (v.isNull()) return nullptr;
    if (v.isNumber()) return v.asNumber();
    if (v.isBool()) return v.asBool();
    if (v.isString()) return v.asString();

    json arr = json::array();
    for (const auto& item : v.asList()) {
        arr.push_back(valueToJson(item));
    }
    return arr;
}

Value valueFromJson(const json& j) {
    if (j.is_null()) return Value{};
    if (j.is_boolean()) return Value{j.get<bool>()};
    if (j.is_number()) return Value{j.get<double>()};
    if (j.is_string()) return Value{j.get<std::string>()};
    if (j.is_array()) {
        ValueList list;
        for (const auto& item : j) {
            list.push_back(valueFromJson(item));
        }
        return Value{std::move(list)};
    }
    throw DocumentError("Вложенные объекты в значениях не поддерживаются");
}

json dataToJson(const DataMap& data) {
    json j = json::object();
    for (const auto& [key, value] : data) {
        j[key] = valueToJson(value);
    }
    return j;
}

DataMap dataFromJson(const json& j) {
    if (!j.is_object()) {
        throw DocumentError("Ожидался объект данных");
    }
    DataMap data;
    for (const auto& [key, value] : j.items()) {
        data.emplace(key, valueFromJson(value));
    }
    return data;
}

json componentToJson(const Component& c) {
    json j = json::object();
    for (const auto& [key, value] : c.properties()) {
        j[key] = valueToJson(value);
    }
    return j;
}

Component componentFromJson(const json& j) {
    if (!j.is_object()) {
        throw DocumentError("Компонент должен быть объектом");
    }
    std::vector<Component::Property> props;
    for (const auto& [key, value] : j.items()) {
        props.emplace_back(key, valueFromJson(value));
    }
    return Component(std::move(props));
}

std::optional<double> optionalNumber(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<double>();
}

json positionToJson(const Position& p) {
    const bool plain = p.middle().has_value()
        && p.upper() == *p.middle()
        && p.lower() == *p.middle()
        && !p.hasCoordinates()
        && p.units() == "m"
        && p.meta().empty();
    if (plain) {
        return *p.middle();
    }

    json j = json::object();
    if (p.middle().has_value()) {
        j["middle"] = *p.middle();
    }
    j["upper"] = p.upper();
    j["lower"] = p.lower();
    if (p.hasCoordinates()) {
        j["x"] = *p.x();
        j["y"] = *p.y();
    }
    j["units"] = p.units();
    if (!p.meta().empty()) {
        j["meta"] = dataToJson(p.meta());
    }
    return j;
}

Position positionFromJson(const json& j) {
    if (j.is_number()) {
        return Position(j.get<double>());
    }
    if (!j.is_object()) {
        throw DocumentError("Позиция должна быть числом или объектом");
    }
    return Position(optionalNumber(j, "middle"),
                    optionalNumber(j, "upper"),
                    optionalNumber(j, "lower"),
                    optionalNumber(j, "x"),
                    optionalNumber(j, "y"),
                    j.value("units", std::string("m")),
                    j.contains("meta") ? dataFromJson(j.at("meta")) : DataMap{});
}

json intervalToJson(const Interval& iv) {
    json j;
    j["top"] = positionToJson(iv.top());
    j["base"] = positionToJson(iv.base());
    j["description"] = iv.description();
    j["components"] = json::array();
    for (const auto& c : iv.components()) {
        j["components"].push_back(componentToJson(c));
    }
    j["data"] = dataToJson(iv.data());
    return j;
}

Interval intervalFromJson(const json& j) {
    if (!j.is_object() || !j.contains("top")) {
        throw DocumentError("Интервал должен быть объектом с полем top");
    }
    Position top = positionFromJson(j.at("top"));
    Position base = (j.contains("base") && !j.at("base").is_null())
        ? positionFromJson(j.at("base"))
        : top;

    ComponentList components;
    if (j.contains("components")) {
        for (const auto& cj : j.at("components")) {
            components.push_back(componentFromJson(cj));
        }
    }

    return Interval(std::move(top), std::move(base),
                    j.value("description", std::string()),
                    std::move(components),
                    j.contains("data") ? dataFromJson(j.at("data")) : DataMap{});
}

// === Настройки ===

json pruneToJson(const PruneCriteria& p) {
    json j;
    j["limit"] = p.limit.has_value() ? json(*p.limit) : json(nullptr);
    j["n"] = p.n.has_value() ? json(*p.n) : json(nullptr);
    j["percentile"] = p.percentile.has_value() ? json(*p.percentile) : json(nullptr);
    j["keep_ends"] = p.keep_ends;
    return j;
}

PruneCriteria pruneFromJson(const json& j) {
    PruneCriteria p;
    p.limit = optionalNumber(j, "limit");
    if (j.contains("n") && !j.at("n").is_null()) {
        p.n = j.at("n").get<size_t>();
    }
    p.percentile = optionalNumber(j, "percentile");
    p.keep_ends = j.value("keep_ends", false);
    return p;
}

json settingsToJson(const OperationSettings& s) {
    json j;
    j["anneal_mode"] = toString(s.anneal_mode);
    j["prune"] = pruneToJson(s.prune);
    j["merge_attribute"] = s.merge_attribute;
    j["merge_reverse"] = s.merge_reverse;
    j["strict_neighbours"] = s.strict_neighbours;
    j["log_step"] = s.log_step;
    j["log_undefined"] = std::isnan(s.log_undefined) ? json(nullptr) : json(s.log_undefined);
    j["thin_bed_limit"] = s.thin_bed_limit.has_value() ? json(*s.thin_bed_limit) : json(nullptr);
    return j;
}

OperationSettings settingsFromJson(const json& j) {
    OperationSettings s;
    s.anneal_mode = parseAnnealMode(j.value("anneal_mode", std::string("middle")));
    if (j.contains("prune") && j.at("prune").is_object()) {
        s.prune = pruneFromJson(j.at("prune"));
    }
    s.merge_attribute = j.value("merge_attribute", std::string());
    s.merge_reverse = j.value("merge_reverse", false);
    s.strict_neighbours = j.value("strict_neighbours", true);
    s.log_step = j.value("log_step", 1.0);
    // null в документе означает NaN
    if (j.contains("log_undefined")) {
        s.log_undefined = optionalNumber(j, "log_undefined")
            .value_or(std::numeric_limits<double>::quiet_NaN());
    }
    s.thin_bed_limit = optionalNumber(j, "thin_bed_limit");
    return s;
}

// === Документ ===

json documentToJsonInternal(const StriplogDocument& doc) {
    json j;
    j["format"] = DOCUMENT_FORMAT_ID;
    j["version"] = DOCUMENT_FORMAT_VERSION;
    j["source"] = doc.striplog.source();
    j["order"] = toString(doc.striplog.order());
    j["settings"] = settingsToJson(doc.settings);

    json intervals = json::array();
    for (const auto& iv : doc.striplog) {
        intervals.push_back(intervalToJson(iv));
    }
    j["intervals"] = intervals;
    return j;
}

StriplogDocument documentFromJsonInternal(const json& j) {
    if (!j.is_object()) {
        throw DocumentError("Документ должен быть JSON-объектом");
    }

    // Проверка формата
    std::string format = j.value("format", "");
    if (format != DOCUMENT_FORMAT_ID) {
        throw DocumentError("Неверный формат документа: '" + format + "'");
    }

    if (!j.contains("intervals") || !j.at("intervals").is_array()) {
        throw DocumentError("В документе нет списка интервалов");
    }

    std::vector<Interval> intervals;
    const auto& items = j.at("intervals");
    for (size_t i = 0; i < items.size(); ++i) {
        try {
            intervals.push_back(intervalFromJson(items.at(i)));
        } catch (const DocumentError& e) {
            throw DocumentError("Интервал " + std::to_string(i) + ": " + e.what());
        } catch (const json::exception& e) {
            throw DocumentError("Интервал " + std::to_string(i) + ": " + e.what());
        } catch (const PositionError& e) {
            throw DocumentError("Интервал " + std::to_string(i) + ": " + e.what());
        }
    }

    const auto order = parseOrder(j.value("order", std::string("auto")));

    try {
        OperationSettings settings;
        if (j.contains("settings") && j.at("settings").is_object()) {
            settings = settingsFromJson(j.at("settings"));
        }
        return StriplogDocument{
            core::Striplog(std::move(intervals), order, j.value("source", std::string())),
            settings
        };
    } catch (const core::StriplogError& e) {
        throw DocumentError(std::string("Некорректная колонка: ") + e.what());
    } catch (const json::exception& e) {
        throw DocumentError(std::string("Некорректные настройки: ") + e.what());
    }
}

StriplogDocument parseDocument(const json& j) {
    try {
        return documentFromJsonInternal(j);
    } catch (const json::exception& e) {
        throw DocumentError("Ошибка структуры документа: " + std::string(e.what()));
    }
}

json parseOrThrow(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw DocumentError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
}

} // anonymous namespace

bool isStriplogDocument(const std::filesystem::path& path) noexcept {
    try {
        if (!std::filesystem::exists(path)) {
            return false;
        }
        json j = json::parse(readTextFile(path), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return false;
        }
        return j.value("format", "") == DOCUMENT_FORMAT_ID;
    } catch (const std::exception&) {
        return false;
    }
}

StriplogDocument loadDocument(const std::filesystem::path& path) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const FileError& e) {
        throw DocumentError(e.what());
    }
    return parseDocument(parseOrThrow(text));
}

void saveDocument(const StriplogDocument& document, const std::filesystem::path& path) {
    try {
        atomicWrite(path, documentToJsonInternal(document).dump(2));
    } catch (const FileError& e) {
        throw DocumentError(std::string("Ошибка сохранения файла: ") + e.what());
    }
}

std::string documentToJson(const StriplogDocument& document, int indent) {
    return documentToJsonInternal(document).dump(indent);
}

StriplogDocument documentFromJson(const std::string& json_str) {
    return parseDocument(parseOrThrow(json_str));
}

std::string striplogToJson(const core::Striplog& strip, int indent) {
    return documentToJsonInternal(StriplogDocument{strip, OperationSettings{}}).dump(indent);
}

core::Striplog striplogFromJson(const std::string& json_str) {
    return documentFromJson(json_str).striplog;
}

std::string sampledLogToJson(const core::SampledLog& log, int indent) {
    json j;
    j["basis"] = log.basis;

    json values = json::array();
    for (double v : log.values) {
        values.push_back(std::isnan(v) ? json(nullptr) : json(v));
    }
    j["values"] = values;

    json components = json::array();
    for (const auto& c : log.components) {
        components.push_back(componentToJson(c));
    }
    j["components"] = components;

    json field_values = json::array();
    for (const auto& v : log.field_values) {
        field_values.push_back(valueToJson(v));
    }
    j["field_values"] = field_values;

    return j.dump(indent);
}

} // namespace striplog::io
