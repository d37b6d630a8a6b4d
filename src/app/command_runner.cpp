/**
 * @file command_runner.cpp
 * @brief Выполнение команд striplog-tool
 */

#include "command_runner.hpp"
#include "core/compositing.hpp"
#include "core/log_sampling.hpp"
#include "core/quality.hpp"
#include "io/file_utils.hpp"
#include "io/quality_writer.hpp"
#include "io/striplog_io.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace striplog::app {
namespace {

using namespace striplog::model;

/**
 * @brief Разобранные аргументы команды
 */
struct CommandArgs {
    std::string command;
    std::filesystem::path input;
    std::filesystem::path output;

    std::optional<AnnealMode> mode;
    std::optional<double> limit;
    std::optional<size_t> n;
    std::optional<double> percentile;
    bool keep_ends = false;
    bool loose = false;
    std::optional<std::string> attr;
    bool reverse = false;
    std::optional<double> step;
    std::optional<double> thin;
};

const std::string_view COMMANDS[] = {
    "--summary", "--qc", "--to-log", "--anneal", "--merge-overlaps",
    "--merge-neighbours", "--prune", "--composite"
};

double parseNumber(const std::string& flag, const std::string& text) {
    try {
        size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Некорректное число для " + flag + ": '" + text + "'");
    }
}

CommandArgs parseArgs(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("Не указана команда");
    }

    CommandArgs parsed;
    parsed.command = args[0];
    if (std::find(std::begin(COMMANDS), std::end(COMMANDS), parsed.command) == std::end(COMMANDS)) {
        throw std::invalid_argument("Неизвестная команда: '" + parsed.command + "'");
    }
    if (args.size() < 2) {
        throw std::invalid_argument("Не указан документ для " + parsed.command);
    }
    parsed.input = args[1];

    auto next = [&args](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Нет значения для " + args[i]);
        }
        return args[++i];
    };

    for (size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--out") {
            parsed.output = next(i);
        } else if (arg == "--mode") {
            const std::string& value = next(i);
            if (value != "middle" && value != "down" && value != "up") {
                throw std::invalid_argument("Неизвестный режим: '" + value + "'");
            }
            parsed.mode = parseAnnealMode(value);
        } else if (arg == "--limit") {
            parsed.limit = parseNumber(arg, next(i));
        } else if (arg == "--n") {
            double value = parseNumber(arg, next(i));
            if (value < 0.0 || std::floor(value) != value) {
                throw std::invalid_argument("--n должно быть неотрицательным целым");
            }
            parsed.n = static_cast<size_t>(value);
        } else if (arg == "--percentile") {
            parsed.percentile = parseNumber(arg, next(i));
        } else if (arg == "--keep-ends") {
            parsed.keep_ends = true;
        } else if (arg == "--loose") {
            parsed.loose = true;
        } else if (arg == "--attr") {
            parsed.attr = next(i);
        } else if (arg == "--reverse") {
            parsed.reverse = true;
        } else if (arg == "--step") {
            parsed.step = parseNumber(arg, next(i));
        } else if (arg == "--thin") {
            parsed.thin = parseNumber(arg, next(i));
        } else {
            throw std::invalid_argument("Неизвестный аргумент: '" + arg + "'");
        }
    }
    return parsed;
}

void requireOutput(const CommandArgs& args) {
    if (args.output.empty()) {
        throw std::invalid_argument("Для " + args.command + " нужен --out <файл>");
    }
}

std::string formatDepth(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

int runSummary(const io::StriplogDocument& doc, std::ostream& out) {
    const auto& strip = doc.striplog;
    out << "Источник: " << (strip.source().empty() ? "-" : strip.source()) << "\n";
    out << "Порядок: " << toString(strip.order()) << "\n";
    out << "Интервалов: " << strip.size() << "\n";
    out << "Начало: " << formatDepth(strip.start().z()) << "\n";
    out << "Конец: " << formatDepth(strip.stop().z()) << "\n";
    out << "Суммарная мощность: " << formatDepth(strip.cum()) << "\n";
    out << "Компоненты:\n";
    for (const auto& entry : strip.unique()) {
        std::string name = entry.component.has_value()
            ? entry.component->summary(std::nullopt, true, "-")
            : std::string("-");
        out << "  " << name << ": " << formatDepth(entry.thickness) << "\n";
    }
    return 0;
}

int runQuality(const io::StriplogDocument& doc, const CommandArgs& args, std::ostream& out) {
    auto settings = doc.settings;
    if (args.thin.has_value()) {
        settings.thin_bed_limit = args.thin;
    }

    auto report = core::buildQualityReport(doc.striplog, settings);
    auto summary = report.summarize();

    if (args.output.empty()) {
        out << io::qualityReportToMarkdown(report);
    } else {
        auto written = io::writeQualityReports(report, args.output);
        out << "Отчёт сохранён: " << written.markdown_path.string() << "\n";
    }
    return summary.status == QualityStatus::Fail ? 1 : 0;
}

int saveResult(io::StriplogDocument doc, core::Striplog result,
               const CommandArgs& args, std::ostream& out) {
    const size_t before = doc.striplog.size();
    doc.striplog = std::move(result);
    io::saveDocument(doc, args.output);
    out << args.command << ": " << before << " -> " << doc.striplog.size()
        << " интервалов, сохранено в " << args.output.string() << "\n";
    return 0;
}

int runToLog(const io::StriplogDocument& doc, const CommandArgs& args, std::ostream& out) {
    core::LogOptions options;
    options.step = args.step.value_or(doc.settings.log_step);
    options.undefined = doc.settings.log_undefined;

    auto log = core::toLog(doc.striplog, options);
    auto text = io::sampledLogToJson(log);
    if (args.output.empty()) {
        out << text << "\n";
    } else {
        io::atomicWrite(args.output, text);
        out << "Каротаж (" << log.values.size() << " отсчётов) сохранён в "
            << args.output.string() << "\n";
    }
    return 0;
}

int dispatch(const CommandArgs& args, std::ostream& out) {
    auto doc = io::loadDocument(args.input);

    if (args.command == "--summary") {
        return runSummary(doc, out);
    }
    if (args.command == "--qc") {
        return runQuality(doc, args, out);
    }
    if (args.command == "--to-log") {
        return runToLog(doc, args, out);
    }

    requireOutput(args);
    core::Striplog result = doc.striplog;

    if (args.command == "--anneal") {
        AnnealMode mode = args.mode.value_or(doc.settings.anneal_mode);
        doc.settings.anneal_mode = mode;
        result.anneal(mode);
    } else if (args.command == "--merge-overlaps") {
        result.mergeOverlaps();
    } else if (args.command == "--merge-neighbours") {
        bool strict = args.loose ? false : doc.settings.strict_neighbours;
        result = result.mergeNeighbours(strict);
    } else if (args.command == "--prune") {
        PruneCriteria criteria = doc.settings.prune;
        if (args.limit.has_value() || args.n.has_value() || args.percentile.has_value()) {
            criteria = PruneCriteria{};
            criteria.limit = args.limit;
            criteria.n = args.n;
            criteria.percentile = args.percentile;
        }
        criteria.keep_ends = criteria.keep_ends || args.keep_ends;
        result.prune(criteria);
    } else if (args.command == "--composite") {
        std::string attr = args.attr.value_or(doc.settings.merge_attribute);
        if (attr.empty()) {
            throw std::invalid_argument("Для --composite нужен --attr <имя>");
        }
        bool reverse = args.reverse || doc.settings.merge_reverse;
        result = core::mergeByPriority(result, attr, reverse);
    } else {
        throw std::invalid_argument("Неизвестная команда: '" + args.command + "'");
    }

    return saveResult(std::move(doc), std::move(result), args, out);
}

} // namespace

std::string usageText() {
    return
        "Использование: striplog-tool <команда> <документ> [опции]\n"
        "  --summary <doc>\n"
        "  --qc <doc> [--out <каталог>] [--thin <порог>]\n"
        "  --anneal <doc> --out <doc> [--mode middle|down|up]\n"
        "  --merge-overlaps <doc> --out <doc>\n"
        "  --merge-neighbours <doc> --out <doc> [--loose]\n"
        "  --prune <doc> --out <doc> [--limit x | --n k | --percentile p] [--keep-ends]\n"
        "  --composite <doc> --out <doc> --attr <имя> [--reverse]\n"
        "  --to-log <doc> [--step s] [--out <файл>]\n";
}

int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    try {
        return dispatch(parseArgs(args), out);
    } catch (const std::invalid_argument& e) {
        err << "Ошибка аргументов: " << e.what() << "\n" << usageText();
        return 1;
    } catch (const std::exception& e) {
        err << "Ошибка: " << e.what() << "\n";
        return 1;
    }
}

} // namespace striplog::app
