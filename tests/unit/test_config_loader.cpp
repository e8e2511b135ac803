/*
 * Unit tests for config loading and precedence
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/config/loader.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace qscope::config;

namespace {

std::string write_temp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

void clear_env() {
    unsetenv("QSCOPE_MAX_QUBITS");
    unsetenv("QSCOPE_MAX_GATES");
    unsetenv("QSCOPE_BACKEND");
}

} // namespace

TEST_SUITE("Config Loader") {
    TEST_CASE("defaults are valid") {
        EngineConfig cfg;
        CHECK(cfg.max_qubits == 10);
        CHECK(cfg.max_gates == 100);
        CHECK(cfg.backend == "kronecker");
        CHECK(validate_final(cfg).empty());
    }

    TEST_CASE("missing file is optional") {
        EngineConfig cfg;
        CHECK(load_from_file(cfg, "/nonexistent/qscope.conf").empty());
        CHECK(cfg.max_qubits == 10);
    }

    TEST_CASE("JSON file") {
        EngineConfig cfg;
        const auto path = write_temp("qscope_test_config.json",
            R"({"max_qubits": 6, "max_gates": 40, "backend": "strided", "include_narration": false})");
        CHECK(load_from_file(cfg, path).empty());
        CHECK(cfg.max_qubits == 6);
        CHECK(cfg.max_gates == 40);
        CHECK(cfg.backend == "strided");
        CHECK_FALSE(cfg.include_narration);
        CHECK(cfg.include_gate_matrices);
    }

    TEST_CASE("JSON file with wrong types leaves config untouched") {
        EngineConfig cfg;
        const auto path = write_temp("qscope_test_bad.json", R"({"max_qubits": "six", "include_narration": 1})");
        const auto errs = load_from_file(cfg, path);
        CHECK(errs.size() == 2);
        CHECK(cfg.max_qubits == 10);
    }

    TEST_CASE("malformed JSON is reported") {
        EngineConfig cfg;
        const auto path = write_temp("qscope_test_broken.json", "{\"max_qubits\": ");
        const auto errs = load_from_file(cfg, path);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("Failed to read") != std::string::npos);
    }

    TEST_CASE("key=value file") {
        EngineConfig cfg;
        const auto path = write_temp("qscope_test.conf",
            "# engine limits\nmax_qubits = 4\nmax_gates=12\ninclude_gate_matrices=off\nbackend=STRIDED\nunknown=1\n");
        CHECK(load_from_file(cfg, path).empty());
        CHECK(cfg.max_qubits == 4);
        CHECK(cfg.max_gates == 12);
        CHECK_FALSE(cfg.include_gate_matrices);
        CHECK(cfg.backend == "STRIDED");
        CHECK(validate_final(cfg).empty());
    }

    TEST_CASE("key=value file with a bad number") {
        EngineConfig cfg;
        const auto path = write_temp("qscope_test_badnum.conf", "max_qubits=many\n");
        const auto errs = load_from_file(cfg, path);
        REQUIRE(errs.size() == 1);
        CHECK(errs[0].find("max_qubits") != std::string::npos);
    }

    TEST_CASE("environment overrides the file, CLI overrides the environment") {
        clear_env();
        EngineConfig cfg;
        cfg.max_qubits = 4;
        setenv("QSCOPE_MAX_QUBITS", "7", 1);
        setenv("QSCOPE_BACKEND", "strided", 1);
        CHECK(apply_env_overrides(cfg).empty());
        CHECK(cfg.max_qubits == 7);
        CHECK(cfg.backend == "strided");

        ConfigOverrides cli;
        cli.max_qubits = 3;
        cli.no_narration = true;
        apply_cli_overrides(cfg, cli);
        CHECK(cfg.max_qubits == 3);
        CHECK(cfg.backend == "strided");
        CHECK_FALSE(cfg.include_narration);
        CHECK(cfg.include_gate_matrices);

        setenv("QSCOPE_MAX_GATES", "lots", 1);
        CHECK(apply_env_overrides(cfg).size() == 1);
        clear_env();
    }

    TEST_CASE("validate_final ranges") {
        EngineConfig cfg;
        cfg.max_qubits = 0;
        cfg.max_gates = -1;
        cfg.backend = "gpu";
        const auto errs = validate_final(cfg);
        CHECK(errs.size() == 3);

        EngineConfig high;
        high.max_qubits = 21;
        CHECK(validate_final(high).size() == 1);
        high.max_qubits = 20;
        CHECK(validate_final(high).empty());
    }
}
