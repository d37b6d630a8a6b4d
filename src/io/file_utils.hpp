/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace striplog::io {

/**
 * @brief Ошибка файловой операции
 */
class FileError : public std::runtime_error {
public:
    explicit FileError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 *
 * Каталог назначения создаётся при необходимости. При ошибке исходный
 * файл остаётся нетронутым, временный удаляется.
 *
 * @throws FileError При ошибке записи или переименования
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Прочитать файл целиком
 * @throws FileError Если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

} // namespace striplog::io
