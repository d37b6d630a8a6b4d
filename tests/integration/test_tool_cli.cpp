/**
 * @file test_tool_cli.cpp
 * @brief Интеграционный тест команд striplog-tool
 */

#include <doctest/doctest.h>
#include "app/command_runner.hpp"
#include "io/striplog_io.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

using striplog::app::runCommand;

namespace {

namespace fs = std::filesystem;

std::string fixture(const std::string& name) {
    return (fs::path(STRIPLOG_SOURCE_DIR) / "tests" / "fixtures" / name).string();
}

struct RunResult {
    int code = 0;
    std::string out;
    std::string err;
};

RunResult run(const std::vector<std::string>& args) {
    std::ostringstream out;
    std::ostringstream err;
    RunResult res;
    res.code = runCommand(args, out, err);
    res.out = out.str();
    res.err = err.str();
    return res;
}

fs::path tempPath(const std::string& name) {
    auto path = fs::temp_directory_path() / name;
    std::error_code ec;
    fs::remove_all(path, ec);
    return path;
}

} // namespace

TEST_CASE("summary command") {
    auto res = run({"--summary", fixture("lappy.json")});
    CHECK(res.code == 0);
    CHECK(res.out.find("Источник: lappy") != std::string::npos);
    CHECK(res.out.find("Интервалов: 4") != std::string::npos);
    CHECK(res.out.find("Начало: 50.00") != std::string::npos);
    CHECK(res.out.find("Конец: 90.00") != std::string::npos);
    CHECK(res.out.find("Компоненты:") != std::string::npos);
    CHECK(res.err.empty());
}

TEST_CASE("editing commands save a new document") {
    SUBCASE("merge overlaps") {
        auto out = tempPath("striplog_cli_merged.json");
        auto res = run({"--merge-overlaps", fixture("lappy.json"), "--out", out.string()});
        CHECK(res.code == 0);
        auto doc = striplog::io::loadDocument(out);
        CHECK_FALSE(doc.striplog.findOverlaps().has_value());
        CHECK(doc.striplog.start().z() == doctest::Approx(50.0));
        CHECK(doc.striplog.stop().z() == doctest::Approx(90.0));
        fs::remove(out);
    }

    SUBCASE("anneal uses the document mode") {
        auto out = tempPath("striplog_cli_annealed.json");
        auto res = run({"--anneal", fixture("gappy.json"), "--out", out.string()});
        CHECK(res.code == 0);
        auto doc = striplog::io::loadDocument(out);
        CHECK_FALSE(doc.striplog.findGaps().has_value());
        REQUIRE(doc.striplog.size() == 4);
        CHECK(doc.striplog[0].base().z() == doctest::Approx(112.0));
        CHECK(doc.settings.anneal_mode == striplog::model::AnnealMode::Down);
        fs::remove(out);
    }

    SUBCASE("anneal mode from the flag") {
        auto out = tempPath("striplog_cli_annealed_up.json");
        auto res = run({"--anneal", fixture("gappy.json"), "--out", out.string(), "--mode", "up"});
        CHECK(res.code == 0);
        auto doc = striplog::io::loadDocument(out);
        CHECK(doc.striplog[1].top().z() == doctest::Approx(110.0));
        CHECK(doc.settings.anneal_mode == striplog::model::AnnealMode::Up);
        fs::remove(out);
    }

    SUBCASE("prune by limit") {
        auto out = tempPath("striplog_cli_pruned.json");
        auto res = run({"--prune", fixture("gappy.json"), "--out", out.string(), "--limit", "2"});
        CHECK(res.code == 0);
        CHECK(res.out.find("4 -> 3") != std::string::npos);
        auto doc = striplog::io::loadDocument(out);
        CHECK(doc.striplog.size() == 3);
        fs::remove(out);
    }

    SUBCASE("composite by top") {
        auto out = tempPath("striplog_cli_composite.json");
        auto res = run({"--composite", fixture("lappy.json"), "--out", out.string(), "--attr", "top"});
        CHECK(res.code == 0);
        auto doc = striplog::io::loadDocument(out);
        CHECK(doc.striplog.size() == 4);
        CHECK_FALSE(doc.striplog.findOverlaps().has_value());
        CHECK_FALSE(doc.striplog.findGaps().has_value());
        fs::remove(out);
    }
}

TEST_CASE("to-log command writes samples") {
    auto out = tempPath("striplog_cli_log.json");
    auto res = run({"--to-log", fixture("gappy.json"), "--out", out.string()});
    CHECK(res.code == 0);
    CHECK(res.out.find("81 отсчётов") != std::string::npos);

    std::ifstream ifs(out);
    nlohmann::json j;
    ifs >> j;
    REQUIRE(j["values"].size() == 81);
    CHECK(j["basis"][0] == 100.0);
    // Разрыв 110..112 заполнен значением по умолчанию документа
    CHECK(j["values"][21] == -1.0);
    CHECK(j["components"].size() == 3);
    ifs.close();
    fs::remove(out);
}

TEST_CASE("qc command") {
    auto lappy = run({"--qc", fixture("lappy.json")});
    CHECK(lappy.code == 1);
    CHECK(lappy.out.find("# Отчёт о качестве колонки") != std::string::npos);

    auto out_dir = tempPath("striplog_cli_qc");
    auto gappy = run({"--qc", fixture("gappy.json"), "--out", out_dir.string()});
    CHECK(gappy.code == 0);
    CHECK(fs::exists(out_dir / "report.json"));
    CHECK(fs::exists(out_dir / "report.md"));

    std::ifstream ifs(out_dir / "report.json");
    nlohmann::json j;
    ifs >> j;
    CHECK(j["summary"]["status"] == "WARN");
    ifs.close();

    std::error_code ec;
    fs::remove_all(out_dir, ec);
}

TEST_CASE("command errors") {
    SUBCASE("unknown command") {
        auto res = run({"--explode", fixture("lappy.json"), "--out", "unused.json"});
        CHECK(res.code == 1);
        CHECK(res.err.find("Неизвестная команда") != std::string::npos);

        // Команда проверяется раньше, чем --out и сам документ
        auto bare = run({"--explode", tempPath("striplog_cli_absent.json").string()});
        CHECK(bare.code == 1);
        CHECK(bare.err.find("Неизвестная команда") != std::string::npos);
        CHECK(bare.err.find("нужен --out") == std::string::npos);
    }

    SUBCASE("fractional count for prune") {
        auto out = tempPath("striplog_cli_fractional.json");
        auto res = run({"--prune", fixture("gappy.json"), "--out", out.string(), "--n", "2.7"});
        CHECK(res.code == 1);
        CHECK(res.err.find("--n") != std::string::npos);
        CHECK_FALSE(fs::exists(out));
    }

    SUBCASE("unknown flag") {
        auto res = run({"--summary", fixture("lappy.json"), "--colour"});
        CHECK(res.code == 1);
        CHECK(res.err.find("Использование") != std::string::npos);
    }

    SUBCASE("missing document") {
        auto res = run({"--summary", tempPath("striplog_cli_absent.json").string()});
        CHECK(res.code == 1);
        CHECK(res.err.find("Ошибка:") != std::string::npos);
    }

    SUBCASE("missing output") {
        auto res = run({"--anneal", fixture("gappy.json")});
        CHECK(res.code == 1);
        CHECK(res.err.find("--out") != std::string::npos);
    }

    SUBCASE("bad mode") {
        auto res = run({"--anneal", fixture("gappy.json"), "--out", "unused.json", "--mode", "sideways"});
        CHECK(res.code == 1);
        CHECK(res.err.find("sideways") != std::string::npos);
    }
}
