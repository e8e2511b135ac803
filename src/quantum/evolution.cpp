/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/evolution.hpp"
#include "qscope/errors.hpp"

#include <cmath>
#include <fmt/format.h>

namespace qscope::quantum {

StateVector ground_state(int num_qubits) {
    if (num_qubits <= 0) {
        throw std::invalid_argument("State requires a positive number of qubits");
    }
    StateVector state(dimension_for(num_qubits), Complex(0.0, 0.0));
    state[0] = Complex(1.0, 0.0);
    return state;
}

Matrix system_operator(GateKind kind, int target, int num_qubits) {
    if (target < 0 || target >= num_qubits) {
        throw std::out_of_range("Qubit index out of range");
    }
    const Matrix gate = Matrix::from_2x2(gate_matrix(kind));
    const Matrix id = Matrix::identity(2);

    Matrix op = (num_qubits - 1 == target) ? gate : id;
    for (int q = num_qubits - 2; q >= 0; --q) {
        op = kron(op, q == target ? gate : id);
    }
    return op;
}

StateVector apply_operator(const Matrix& op, const StateVector& state) {
    return mat_vec(op, state);
}

void check_normalized(const StateVector& state) {
    const double n2 = norm_squared(state);
    if (std::abs(n2 - 1.0) > kNormTolerance) {
        throw InternalInvariantViolation(fmt::format("State norm drifted to {:.12f}", n2));
    }
}

void enforce_limits(const QuantumCircuit& circuit, const EvolutionLimits& limits) {
    if (circuit.num_qubits() > limits.max_qubits) {
        throw ResourceLimitExceeded(fmt::format("Circuit uses {} qubits, maximum is {}",
                                                circuit.num_qubits(), limits.max_qubits));
    }
    if (limits.max_gates >= 0 && circuit.gate_count() > static_cast<std::size_t>(limits.max_gates)) {
        throw ResourceLimitExceeded(fmt::format("Circuit has {} gates, maximum is {}",
                                                circuit.gate_count(), limits.max_gates));
    }
}

std::vector<StateVector> evolve(const QuantumCircuit& circuit,
                                const IStateEvolver& evolver,
                                const EvolutionLimits& limits) {
    enforce_limits(circuit, limits);

    const int n = circuit.num_qubits();
    std::vector<StateVector> snapshots;
    snapshots.reserve(circuit.gate_count() + 1);
    snapshots.push_back(ground_state(n));

    for (const auto& gate : circuit.gates()) {
        StateVector next = snapshots.back();
        evolver.apply(gate, n, next);
        check_normalized(next);
        snapshots.push_back(std::move(next));
    }
    return snapshots;
}

} // namespace qscope::quantum
