/*
 * Unit tests for config value validation
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/config/validator.hpp>

using namespace qscope::config;

TEST_SUITE("Config Validator") {
    TEST_CASE("parse_int - valid integers") {
        std::string err;
        int v = 0;
        CHECK(parse_int("42", v, err));
        CHECK(v == 42);
        CHECK(parse_int("-3", v, err));
        CHECK(v == -3);
        CHECK(parse_int("+7", v, err));
        CHECK(v == 7);
    }

    TEST_CASE("parse_int - invalid integers") {
        std::string err;
        int v = 5;
        CHECK_FALSE(parse_int("", v, err));
        CHECK(err.find("empty") != std::string::npos);
        CHECK_FALSE(parse_int("4x", v, err));
        CHECK(err.find("not an integer") != std::string::npos);
        CHECK_FALSE(parse_int("-", v, err));
        CHECK_FALSE(parse_int("1.5", v, err));
        CHECK_FALSE(parse_int("99999999999", v, err));
        CHECK(err.find("out of range") != std::string::npos);
        CHECK(v == 5);
    }

    TEST_CASE("parse_bool") {
        std::string err;
        bool b = false;
        CHECK(parse_bool("true", b, err));
        CHECK(b);
        CHECK(parse_bool("OFF", b, err));
        CHECK_FALSE(b);
        CHECK(parse_bool("1", b, err));
        CHECK(b);
        CHECK_FALSE(parse_bool("maybe", b, err));
        CHECK(err.find("boolean") != std::string::npos);
    }

    TEST_CASE("validate_range") {
        std::string err;
        CHECK(validate_range("max_qubits", 1, 1, 20, err));
        CHECK(validate_range("max_qubits", 20, 1, 20, err));
        CHECK_FALSE(validate_range("max_qubits", 21, 1, 20, err));
        CHECK(err == "max_qubits must be in [1, 20], got 21");
    }

    TEST_CASE("is_known_backend") {
        std::string err;
        CHECK(is_known_backend("kronecker", err));
        CHECK(is_known_backend("STRIDED", err));
        CHECK_FALSE(is_known_backend("cuquantum", err));
        CHECK(err.find("cuquantum") != std::string::npos);
    }
}
