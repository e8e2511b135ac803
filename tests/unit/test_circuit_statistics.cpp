/*
 * Unit tests for circuit statistics
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/analytics/circuit_statistics.hpp>

using namespace qscope::analytics;
using namespace qscope::quantum;

TEST_SUITE("Circuit Statistics") {
    TEST_CASE("empty circuit") {
        const auto s = compute_statistics(normalize({}));
        CHECK(s.total_gates == 0);
        CHECK(s.depth == 0);
        CHECK(s.num_qubits == 2);
        CHECK(s.density == doctest::Approx(0.0));
        CHECK(s.parallelization_factor == doctest::Approx(1.0));
        CHECK(s.complexity_class == "trivial");
        CHECK(s.estimated_execution_time == doctest::Approx(0.0));
        CHECK(s.optimization_suggestions.empty());
    }

    TEST_CASE("counts, depth and density") {
        const auto s = compute_statistics(normalize({{"H", 0, 0}, {"H", 0, 1}, {"X", 1, 0}, {"I", 1, 2}}));
        CHECK(s.total_gates == 4);
        CHECK(s.gate_counts.at("H") == 2);
        CHECK(s.gate_counts.at("X") == 1);
        CHECK(s.gate_counts.at("I") == 1);
        CHECK(s.gate_counts.count("Y") == 0);
        CHECK(s.depth == 3);
        CHECK(s.num_qubits == 2);
        CHECK(s.density == doctest::Approx(4.0 / 6.0));
        CHECK(s.parallelization_factor == doctest::Approx(4.0 / 3.0));
        CHECK(s.complexity_class == "simple");
        CHECK(s.estimated_execution_time == doctest::Approx(2.9));
        CHECK(s.resources.memory == "O(2^2)");
        CHECK(s.resources.time_complexity == "O(4 * 2^2)");
    }

    TEST_CASE("optimization suggestions") {
        const auto s = compute_statistics(normalize({{"H", 0, 0}, {"H", 0, 1}, {"X", 1, 0}, {"I", 1, 2}}));
        REQUIRE(s.optimization_suggestions.size() == 2);
        CHECK(s.optimization_suggestions[0] == "Consecutive H gates on qubit 0 (positions 0 and 1) cancel out");
        CHECK(s.optimization_suggestions[1] == "Remove 1 identity gates");

        // gates on other qubits in between do not break the pair
        const auto split = suggest_optimizations(normalize({{"Z", 0, 0}, {"X", 1, 1}, {"Z", 0, 2}}));
        CHECK(split.size() == 1);

        // a run of three reports one pair, never overlapping ones
        const auto run = suggest_optimizations(normalize({{"X", 0, 0}, {"X", 0, 1}, {"X", 0, 2}}));
        REQUIRE(run.size() == 1);
        CHECK(run[0] == "Consecutive X gates on qubit 0 (positions 0 and 1) cancel out");
        const auto four = suggest_optimizations(normalize({{"Y", 0, 0}, {"Y", 0, 1}, {"Y", 0, 2}, {"Y", 0, 3}}));
        REQUIRE(four.size() == 2);
        CHECK(four[1] == "Consecutive Y gates on qubit 0 (positions 2 and 3) cancel out");

        // identity pairs are reported once as removable, not as cancelling
        const auto ids = suggest_optimizations(normalize({{"I", 0, 0}, {"I", 0, 1}}));
        REQUIRE(ids.size() == 1);
        CHECK(ids[0] == "Remove 2 identity gates");
    }

    TEST_CASE("complexity classes") {
        CHECK(classify_complexity(0, 0) == "trivial");
        CHECK(classify_complexity(10, 5) == "simple");
        CHECK(classify_complexity(10, 6) == "moderate");
        CHECK(classify_complexity(50, 20) == "moderate");
        CHECK(classify_complexity(51, 3) == "complex");
    }

    TEST_CASE("gate costs") {
        CHECK(gate_cost(GateKind::H) == doctest::Approx(1.0));
        CHECK(gate_cost(GateKind::Y) == doctest::Approx(0.8));
        CHECK(gate_cost(GateKind::Z) == doctest::Approx(0.5));
        CHECK(gate_cost(GateKind::I) == doctest::Approx(0.1));
    }
}
