/*
 * Unit tests for partial trace and Bloch coordinates
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <qscope/errors.hpp>
#include <qscope/quantum/bloch.hpp>
#include <qscope/quantum/cpu_evolver.hpp>
#include <qscope/quantum/density_matrix.hpp>
#include <qscope/quantum/evolution.hpp>

#include <cmath>
#include <stdexcept>

using namespace qscope::quantum;

namespace {

StateVector run(const std::vector<RawGate>& gates) {
    KroneckerEvolver evolver;
    return evolve(normalize(gates), evolver, EvolutionLimits{}).back();
}

} // namespace

TEST_SUITE("Partial Trace") {
    TEST_CASE("single-qubit reduction of a product state") {
        const auto psi = run({{"X", 1, 0}, {"I", 0, 0}});  // |q1=1, q0=0>
        const auto rho0 = reduce_qubit(psi, 2, 0);
        const auto rho1 = reduce_qubit(psi, 2, 1);
        CHECK(rho0.matrix()(0, 0).real() == doctest::Approx(1.0));
        CHECK(rho1.matrix()(1, 1).real() == doctest::Approx(1.0));
        CHECK(rho0.purity() == doctest::Approx(1.0));
        CHECK_NOTHROW(check_density(rho0));
    }

    TEST_CASE("pair reduction keeps the kept-qubit bit order") {
        const auto psi = run({{"X", 2, 0}});  // index 4 on three qubits
        const auto rho = reduce_pair(psi, 3, 2, 0);
        REQUIRE(rho.dim() == 4);
        // kept[0] = qubit 2 is bit 0 of the reduced index
        CHECK(rho.matrix()(1, 1).real() == doctest::Approx(1.0));
        CHECK(rho.trace() == doctest::Approx(1.0));
        CHECK((rho.kept_qubits() == std::vector<int>{2, 0}));
    }

    TEST_CASE("maximally entangled input gives a mixed reduced state") {
        const double s = 1.0 / std::sqrt(2.0);
        const StateVector bell = {Complex(s, 0), Complex(0, 0), Complex(0, 0), Complex(s, 0)};
        const auto rho = reduce_qubit(bell, 2, 0);
        CHECK(rho.purity() == doctest::Approx(0.5));
        CHECK(std::abs(rho.matrix()(0, 1)) < 1e-12);
        CHECK_NOTHROW(check_density(rho));
    }

    TEST_CASE("invalid kept qubits") {
        const auto psi = ground_state(2);
        CHECK_THROWS_AS(reduce_qubit(psi, 2, 2), std::out_of_range);
        CHECK_THROWS_AS(reduce_pair(psi, 2, 1, 1), std::out_of_range);
        CHECK_THROWS_AS(reduce_qubit(psi, 3, 0), std::invalid_argument);
    }

    TEST_CASE("check_density rejects a bad trace") {
        Matrix m(2);
        m(0, 0) = Complex(0.7, 0);
        CHECK_THROWS_AS(check_density(DensityMatrix({0}, m)), qscope::InternalInvariantViolation);
    }
}

TEST_SUITE("Bloch Vectors") {
    TEST_CASE("ground state points to +z") {
        const auto b = bloch_vector(ground_state(1), 1, 0);
        CHECK(b.x == doctest::Approx(0.0));
        CHECK(b.y == doctest::Approx(0.0));
        CHECK(b.z == doctest::Approx(1.0));
        CHECK(b.length() == doctest::Approx(1.0));
    }

    TEST_CASE("H gives (1, 0, 0)") {
        const auto b = bloch_vector(run({{"H", 0, 0}}), 1, 0);
        CHECK(b.x == doctest::Approx(1.0));
        CHECK(std::abs(b.y) < 1e-9);
        CHECK(std::abs(b.z) < 1e-9);
    }

    TEST_CASE("Y on |+> points to -x") {
        const auto b = bloch_vector(run({{"H", 0, 0}, {"Y", 0, 1}}), 1, 0);
        CHECK(b.x == doctest::Approx(-1.0));
    }

    TEST_CASE("closed form agrees with the density-matrix form") {
        const auto psi = run({{"H", 0, 0}, {"Y", 1, 0}, {"H", 1, 1}, {"Z", 0, 2}, {"X", 2, 2}});
        for (int q = 0; q < 3; ++q) {
            const auto a = bloch_vector(psi, 3, q);
            const auto b = bloch_from_density(reduce_qubit(psi, 3, q));
            CHECK(a.x == doctest::Approx(b.x));
            CHECK(a.y == doctest::Approx(b.y));
            CHECK(a.z == doctest::Approx(b.z));
        }
        CHECK(all_bloch_vectors(psi, 3).size() == 3);
    }
}
