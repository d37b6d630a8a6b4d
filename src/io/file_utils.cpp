/**
 * @file file_utils.cpp
 * @brief Вспомогательные функции для работы с файлами
 */

#include "file_utils.hpp"
#include <fstream>
#include <sstream>

namespace striplog::io {

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw FileError("Не удалось создать каталог " + dir.string() + ": " + ec.message());
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw FileError("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            ofs.close();
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw FileError("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw FileError("Не удалось атомарно сохранить файл " + path.string() + ": " + ec.message());
    }
}

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FileError("Не удалось открыть файл: " + path.string());
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

} // namespace striplog::io
