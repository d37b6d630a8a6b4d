/**
 * @file striplog_io.hpp
 * @brief Чтение и запись документов колонки (JSON)
 */

#pragma once

#include "core/log_sampling.hpp"
#include "core/striplog.hpp"
#include "model/settings.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace striplog::io {

using namespace striplog::model;

/// Текущая версия формата документа
constexpr const char* DOCUMENT_FORMAT_VERSION = "1.0.0";

/// Идентификатор формата
constexpr const char* DOCUMENT_FORMAT_ID = "striplog-document";

/**
 * @brief Ошибка работы с документом
 */
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Документ: колонка и настройки операций над ней
 */
struct StriplogDocument {
    core::Striplog striplog;
    OperationSettings settings;
};

/**
 * @brief Загрузка документа из файла
 *
 * @throws DocumentError При ошибке чтения, парсинга или нарушении
 *         инвариантов колонки
 */
[[nodiscard]] StriplogDocument loadDocument(const std::filesystem::path& path);

/**
 * @brief Сохранение документа в файл
 *
 * Выполняет атомарную запись (через временный файл).
 *
 * @throws DocumentError При ошибке записи
 */
void saveDocument(const StriplogDocument& document, const std::filesystem::path& path);

/**
 * @brief Проверка, является ли файл документом колонки
 */
[[nodiscard]] bool isStriplogDocument(const std::filesystem::path& path) noexcept;

/**
 * @brief Документ в JSON-строку
 */
[[nodiscard]] std::string documentToJson(const StriplogDocument& document, int indent = 2);

/**
 * @brief Документ из JSON-строки
 * @throws DocumentError При ошибке парсинга
 */
[[nodiscard]] StriplogDocument documentFromJson(const std::string& json);

/**
 * @brief Колонка в JSON-строку (документ с настройками по умолчанию)
 */
[[nodiscard]] std::string striplogToJson(const core::Striplog& strip, int indent = 2);

/**
 * @brief Колонка из JSON-строки документа (настройки игнорируются)
 * @throws DocumentError При ошибке парсинга
 */
[[nodiscard]] core::Striplog striplogFromJson(const std::string& json);

/**
 * @brief Растеризованный каротаж в JSON: basis, values, таблица ключей
 */
[[nodiscard]] std::string sampledLogToJson(const core::SampledLog& log, int indent = 2);

} // namespace striplog::io
