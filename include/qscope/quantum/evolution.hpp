/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/circuit.hpp"
#include "qscope/quantum/linalg.hpp"
#include "qscope/quantum/simulator.hpp"
#include "qscope/quantum/types.hpp"

#include <cstddef>
#include <vector>

namespace qscope::quantum {

struct EvolutionLimits {
    int max_qubits{10};
    int max_gates{100};
};

// |0...0>
StateVector ground_state(int num_qubits);

/**
 * @brief Full-system operator for a single-qubit gate.
 *
 * Kronecker product of 2x2 factors from qubit n-1 (most significant) down to
 * qubit 0, so row/column index bit b is the value of qubit b, matching
 * (i >> b) & 1. The factor at `target` is the gate matrix, the rest identity.
 */
Matrix system_operator(GateKind kind, int target, int num_qubits);

StateVector apply_operator(const Matrix& op, const StateVector& state);

// Throws InternalInvariantViolation when |norm^2 - 1| exceeds kNormTolerance.
void check_normalized(const StateVector& state);

// Throws ResourceLimitExceeded. Called before any 2^n allocation.
void enforce_limits(const QuantumCircuit& circuit, const EvolutionLimits& limits);

/**
 * @brief Runs the circuit and returns gate_count + 1 snapshots.
 *
 * Snapshot 0 is the ground state; snapshot k is the state after gate k-1 of
 * the ordered circuit. Limits are enforced first and the norm is checked
 * after every application.
 */
std::vector<StateVector> evolve(const QuantumCircuit& circuit,
                                const IStateEvolver& evolver,
                                const EvolutionLimits& limits);

} // namespace qscope::quantum
