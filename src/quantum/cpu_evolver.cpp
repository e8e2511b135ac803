/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/cpu_evolver.hpp"
#include "qscope/quantum/evolution.hpp"

#include <stdexcept>

namespace qscope::quantum {

void StridedEvolver::apply(const GateSpec& gate, int num_qubits, StateVector& state) const {
    if (gate.qubit < 0 || gate.qubit >= num_qubits) {
        throw std::out_of_range("Qubit index out of range");
    }
    if (state.size() != dimension_for(num_qubits)) {
        throw std::invalid_argument("State size does not match qubit count");
    }

    const Matrix2& u = gate_matrix(gate.kind);
    const size_t qubit_mask = size_t(1) << gate.qubit;

    for (size_t i = 0; i < state.size(); ++i) {
        if ((i & qubit_mask) == 0) {  // qubit is 0
            size_t j = i | qubit_mask;  // corresponding index with qubit = 1

            Complex alpha = state[i];
            Complex beta = state[j];

            state[i] = u[0] * alpha + u[1] * beta;
            state[j] = u[2] * alpha + u[3] * beta;
        }
    }
}

void KroneckerEvolver::apply(const GateSpec& gate, int num_qubits, StateVector& state) const {
    if (state.size() != dimension_for(num_qubits)) {
        throw std::invalid_argument("State size does not match qubit count");
    }
    const Matrix op = system_operator(gate.kind, gate.qubit, num_qubits);
    state = apply_operator(op, state);
}

} // namespace qscope::quantum
