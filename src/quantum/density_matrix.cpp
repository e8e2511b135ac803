/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/density_matrix.hpp"
#include "qscope/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace qscope::quantum {

namespace {

// Scatters the bits of `value` into the basis positions listed in `qubits`.
size_t scatter_bits(size_t value, const std::vector<int>& qubits) {
    size_t index = 0;
    for (size_t j = 0; j < qubits.size(); ++j) {
        if ((value >> j) & 1U) index |= size_t(1) << qubits[j];
    }
    return index;
}

} // namespace

DensityMatrix::DensityMatrix(std::vector<int> kept_qubits, Matrix rho)
    : kept_(std::move(kept_qubits))
    , rho_(std::move(rho)) {}

double DensityMatrix::trace() const {
    return rho_.trace().real();
}

double DensityMatrix::purity() const {
    return multiply(rho_, rho_).trace().real();
}

DensityMatrix reduce(const StateVector& state, int num_qubits, const std::vector<int>& kept) {
    if (state.size() != dimension_for(num_qubits)) {
        throw std::invalid_argument("State size does not match qubit count");
    }
    std::vector<bool> is_kept(static_cast<size_t>(num_qubits), false);
    for (int q : kept) {
        if (q < 0 || q >= num_qubits || is_kept[q]) {
            throw std::out_of_range(fmt::format("Invalid kept qubit {}", q));
        }
        is_kept[q] = true;
    }
    std::vector<int> traced;
    for (int q = 0; q < num_qubits; ++q) {
        if (!is_kept[q]) traced.push_back(q);
    }

    const size_t kept_dim = size_t(1) << kept.size();
    const size_t traced_dim = size_t(1) << traced.size();

    std::vector<size_t> kept_offset(kept_dim);
    for (size_t a = 0; a < kept_dim; ++a) kept_offset[a] = scatter_bits(a, kept);
    std::vector<size_t> traced_offset(traced_dim);
    for (size_t k = 0; k < traced_dim; ++k) traced_offset[k] = scatter_bits(k, traced);

    Matrix rho(kept_dim);
    for (size_t a = 0; a < kept_dim; ++a) {
        for (size_t b = a; b < kept_dim; ++b) {
            Complex acc(0.0, 0.0);
            for (size_t k = 0; k < traced_dim; ++k) {
                acc += state[kept_offset[a] | traced_offset[k]] *
                       std::conj(state[kept_offset[b] | traced_offset[k]]);
            }
            rho(a, b) = acc;
            rho(b, a) = std::conj(acc);
        }
    }
    return DensityMatrix(kept, std::move(rho));
}

DensityMatrix reduce_qubit(const StateVector& state, int num_qubits, int qubit) {
    return reduce(state, num_qubits, {qubit});
}

DensityMatrix reduce_pair(const StateVector& state, int num_qubits, int first, int second) {
    return reduce(state, num_qubits, {first, second});
}

void check_density(const DensityMatrix& rho) {
    const double tr = rho.trace();
    if (std::abs(tr - 1.0) > kNormTolerance) {
        throw InternalInvariantViolation(fmt::format("Reduced density matrix has trace {:.12f}", tr));
    }
    if (!is_hermitian(rho.matrix(), kNormTolerance)) {
        throw InternalInvariantViolation("Reduced density matrix is not Hermitian");
    }
}

} // namespace qscope::quantum
