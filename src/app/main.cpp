/**
 * @file main.cpp
 * @brief Точка входа striplog-tool
 */

#include "command_runner.hpp"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        if (argc < 2 || std::string_view(argv[1]) == "--help") {
            std::cout << striplog::app::usageText();
            return argc < 2 ? 1 : 0;
        }

        std::vector<std::string> args(argv + 1, argv + argc);
        return striplog::app::runCommand(args, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
