/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/linalg.hpp"
#include "qscope/quantum/types.hpp"

#include <vector>

namespace qscope::quantum {

/**
 * Reduced density matrix of a subset of qubits.
 * Kept qubit kept_qubits()[j] is bit j of the reduced basis index.
 */
class DensityMatrix {
public:
    DensityMatrix(std::vector<int> kept_qubits, Matrix rho);

    const std::vector<int>& kept_qubits() const { return kept_; }
    const Matrix& matrix() const { return rho_; }
    std::size_t dim() const { return rho_.dim(); }

    double trace() const;
    // Tr(rho^2)
    double purity() const;

private:
    std::vector<int> kept_;
    Matrix rho_;
};

/**
 * @brief Partial trace of a pure state over the complement of `kept`.
 *
 * rho[a,b] = sum_k psi(kept=a, traced=k) * conj(psi(kept=b, traced=k)).
 * Throws std::out_of_range for repeated or out-of-range qubits.
 */
DensityMatrix reduce(const StateVector& state, int num_qubits, const std::vector<int>& kept);

DensityMatrix reduce_qubit(const StateVector& state, int num_qubits, int qubit);
DensityMatrix reduce_pair(const StateVector& state, int num_qubits, int first, int second);

// Trace 1 and Hermitian within kNormTolerance, else InternalInvariantViolation.
void check_density(const DensityMatrix& rho);

} // namespace qscope::quantum
