/*
 * Unit tests for command-line parsing
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/cli/args.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace qscope;

namespace {

class RecordingLogger : public logging::Logger {
public:
    void info(std::string_view msg) override { infos.emplace_back(msg); }
    void warn(std::string_view msg) override { infos.emplace_back(msg); }
    void error(std::string_view msg) override { errors.emplace_back(msg); }
    void debug(std::string_view) override {}

    std::vector<std::string> infos;
    std::vector<std::string> errors;
};

config::ParseResult parse_args(std::vector<std::string> args, RecordingLogger& log) {
    args.insert(args.begin(), "qscope");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return cli::parse(static_cast<int>(argv.size()), argv.data(), log);
}

} // namespace

TEST_SUITE("CLI Args") {
    TEST_CASE("help and version are show-only") {
        RecordingLogger log;
        auto help = parse_args({"--help"}, log);
        CHECK(help.show_only);
        CHECK_FALSE(help.request.has_value());
        REQUIRE_FALSE(log.infos.empty());
        CHECK(log.infos.back().find("--gates") != std::string::npos);

        auto version = parse_args({"-v"}, log);
        CHECK(version.show_only);
        CHECK(log.infos.back().rfind("qscope v", 0) == 0);
    }

    TEST_CASE("a circuit source is required") {
        RecordingLogger log;
        auto pr = parse_args({}, log);
        CHECK_FALSE(pr.show_only);
        CHECK_FALSE(pr.request.has_value());
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].find("circuit is required") != std::string::npos);
    }

    TEST_CASE("circuit file and inline gates are exclusive") {
        RecordingLogger log;
        auto pr = parse_args({"--circuit", "c.json", "--gates", "H:0:0"}, log);
        CHECK_FALSE(pr.request.has_value());
        CHECK(log.errors.size() == 1);
    }

    TEST_CASE("full option set") {
        RecordingLogger log;
        auto pr = parse_args({"--gates", "H:0:0,X:1:1", "--final", "--reference", "ref.json",
                              "--config", "custom.conf", "--max-qubits", "4", "--max-gates", "9",
                              "--backend", "strided", "--no-matrices", "--no-narration",
                              "--indent=-1", "-d"}, log);
        REQUIRE(pr.request.has_value());
        const auto& req = *pr.request;
        CHECK(req.inline_gates.value() == "H:0:0,X:1:1");
        CHECK_FALSE(req.circuit_path.has_value());
        CHECK(req.reference_path.value() == "ref.json");
        CHECK(req.final_only);
        CHECK(req.indent == -1);
        CHECK(req.overrides.max_qubits.value() == 4);
        CHECK(req.overrides.max_gates.value() == 9);
        CHECK(req.overrides.backend.value() == "strided");
        CHECK(req.overrides.no_matrices);
        CHECK(req.overrides.no_narration);
        CHECK(pr.config_path == "custom.conf");
        CHECK(pr.debug);
        CHECK(log.errors.empty());
    }

    TEST_CASE("defaults") {
        RecordingLogger log;
        auto pr = parse_args({"--circuit", "c.json"}, log);
        REQUIRE(pr.request.has_value());
        CHECK(pr.request->circuit_path.value() == "c.json");
        CHECK(pr.request->indent == 2);
        CHECK_FALSE(pr.request->final_only);
        CHECK_FALSE(pr.request->overrides.max_qubits.has_value());
        CHECK_FALSE(pr.request->overrides.backend.has_value());
        CHECK(pr.config_path == "qscope.conf");
        CHECK_FALSE(pr.debug);
    }

    TEST_CASE("argument errors") {
        RecordingLogger log;
        auto bad_int = parse_args({"--gates", "H:0:0", "--max-qubits", "many"}, log);
        CHECK_FALSE(bad_int.request.has_value());
        auto unknown = parse_args({"--gates", "H:0:0", "--shots", "10"}, log);
        CHECK_FALSE(unknown.request.has_value());
        REQUIRE(log.errors.size() == 2);
        CHECK(log.errors[1].find("Argument error") != std::string::npos);
    }
}
