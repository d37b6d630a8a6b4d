/**
 * @file command_runner.hpp
 * @brief Выполнение команд striplog-tool над документами колонки
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace striplog::app {

/**
 * @brief Выполнить команду командной строки.
 *
 * Команды:
 *   --summary <doc>
 *   --qc <doc> [--out <каталог>] [--thin <порог>]
 *   --anneal <doc> --out <doc> [--mode middle|down|up]
 *   --merge-overlaps <doc> --out <doc>
 *   --merge-neighbours <doc> --out <doc> [--loose]
 *   --prune <doc> --out <doc> [--limit x | --n k | --percentile p] [--keep-ends]
 *   --composite <doc> --out <doc> [--attr <имя>] [--reverse]
 *   --to-log <doc> [--step s] [--out <файл>]
 *
 * Параметры, не заданные флагами, берутся из настроек документа.
 *
 * @param args Аргументы без имени программы
 * @param out Поток результатов
 * @param err Поток сообщений об ошибках
 * @return 0 при успехе, 1 при ошибке
 */
int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

/**
 * @brief Текст справки по командам
 */
[[nodiscard]] std::string usageText();

} // namespace striplog::app
