/*
 * Unit tests for the command-line runner
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/app/runner.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

using namespace qscope;
using json = nlohmann::json;

namespace {

class RecordingLogger : public logging::Logger {
public:
    void info(std::string_view) override {}
    void warn(std::string_view msg) override { warnings.emplace_back(msg); }
    void error(std::string_view msg) override { errors.emplace_back(msg); }
    void debug(std::string_view) override {}

    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

std::string write_temp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

config::RunRequest inline_request(const std::string& gates) {
    config::RunRequest req;
    req.inline_gates = gates;
    req.indent = -1;
    return req;
}

} // namespace

TEST_SUITE("Runner") {
    TEST_CASE("resolve_config applies CLI overrides and validates") {
        RecordingLogger log;
        config::ConfigOverrides overrides;
        overrides.max_qubits = 5;
        auto cfg = app::resolve_config("/nonexistent/qscope.conf", overrides, log);
        REQUIRE(cfg.has_value());
        CHECK(cfg->max_qubits == 5);

        overrides.backend = "gpu";
        CHECK_FALSE(app::resolve_config("/nonexistent/qscope.conf", overrides, log).has_value());
        REQUIRE_FALSE(log.errors.empty());
        CHECK(log.errors.back().rfind("Config: ", 0) == 0);
    }

    TEST_CASE("inline gates produce a full trace") {
        RecordingLogger log;
        std::ostringstream out;
        CHECK(app::run(inline_request("H:0:0"), config::EngineConfig{}, log, out) == 0);
        const auto j = json::parse(out.str());
        CHECK(j["steps"].size() == 2);
        CHECK(j["final_metrics"]["von_neumann_entropy"].get<double>() == doctest::Approx(1.0));
        CHECK_FALSE(j.contains("error"));
    }

    TEST_CASE("final-only summary") {
        RecordingLogger log;
        std::ostringstream out;
        auto req = inline_request("X:0:0");
        req.final_only = true;
        CHECK(app::run(req, config::EngineConfig{}, log, out) == 0);
        const auto j = json::parse(out.str());
        CHECK(j["measurement_probabilities"][1].get<double>() == doctest::Approx(1.0));
        CHECK_FALSE(j.contains("steps"));
    }

    TEST_CASE("circuit document with options") {
        RecordingLogger log;
        std::ostringstream out;
        config::RunRequest req;
        req.circuit_path = write_temp("qscope_runner_circuit.json",
            R"({"gates": [{"gate": "H", "qubit": 0, "position": 0}],
                "options": {"include_narration": false, "backend": "strided"}})");
        CHECK(app::run(req, config::EngineConfig{}, log, out) == 0);
        const auto j = json::parse(out.str());
        CHECK_FALSE(j["steps"][1].contains("narration"));
        CHECK(j["steps"][1].contains("gate_matrix"));
    }

    TEST_CASE("reference file") {
        RecordingLogger log;
        std::ostringstream out;
        auto req = inline_request("X:0:0");
        req.final_only = true;
        req.reference_path = write_temp("qscope_runner_ref.json", R"([0, 1])");
        CHECK(app::run(req, config::EngineConfig{}, log, out) == 0);
        CHECK(json::parse(out.str())["fidelity"].get<double>() == doctest::Approx(1.0));
    }

    TEST_CASE("CNOT falls back with an error") {
        RecordingLogger log;
        std::ostringstream out;
        CHECK(app::run(inline_request("H:0:0,CNOT:1:1"), config::EngineConfig{}, log, out) == 1);
        const auto j = json::parse(out.str());
        REQUIRE(j.contains("error"));
        CHECK(j["error"].get<std::string>().find("CNOT") != std::string::npos);
        CHECK(j["steps"][0]["operation"] == "error");
        CHECK(log.errors.size() == 1);
    }

    TEST_CASE("resource limits fall back with an error") {
        RecordingLogger log;
        std::ostringstream out;
        config::EngineConfig cfg;
        cfg.max_qubits = 2;
        CHECK(app::run(inline_request("H:5:0"), cfg, log, out) == 1);
        const auto j = json::parse(out.str());
        CHECK(j["error"] == "Circuit uses 6 qubits, maximum is 2");
        CHECK(log.warnings.size() == 1);
    }

    TEST_CASE("out-of-range qubit index falls back with an error") {
        RecordingLogger log;
        std::ostringstream out;
        CHECK(app::run(inline_request("H:2147483647"), config::EngineConfig{}, log, out) == 1);
        const auto j = json::parse(out.str());
        CHECK(j["error"] == "Qubit index 2147483647 is out of range");
        CHECK(log.errors.size() == 1);
    }

    TEST_CASE("precondition failures are reported as internal errors") {
        RecordingLogger log;
        std::ostringstream out;
        config::EngineConfig cfg;
        cfg.backend = "gpu";
        CHECK(app::run(inline_request("H:0:0"), cfg, log, out) == 2);
        CHECK(json::parse(out.str())["error"] == "Internal simulation failure");
        REQUIRE(log.errors.size() == 1);
        CHECK(log.errors[0].rfind("Internal error: ", 0) == 0);
    }

    TEST_CASE("unreadable or invalid circuit documents") {
        RecordingLogger log;
        std::ostringstream missing_out;
        config::RunRequest missing;
        missing.circuit_path = "/nonexistent/circuit.json";
        CHECK(app::run(missing, config::EngineConfig{}, log, missing_out) == 1);
        CHECK(json::parse(missing_out.str())["error"].get<std::string>().find("Cannot open") != std::string::npos);

        std::ostringstream broken_out;
        config::RunRequest broken;
        broken.circuit_path = write_temp("qscope_runner_broken.json", "{\"gates\": [");
        CHECK(app::run(broken, config::EngineConfig{}, log, broken_out) == 1);
        CHECK(json::parse(broken_out.str())["error"].get<std::string>().find("Invalid circuit document") !=
              std::string::npos);
    }

    TEST_CASE("read_file") {
        const auto path = write_temp("qscope_runner_text.txt", "hello");
        CHECK(app::read_file(path) == "hello");
        CHECK_THROWS_AS(app::read_file("/nonexistent/file"), std::runtime_error);
    }
}
