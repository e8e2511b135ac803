/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/bloch.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace qscope::quantum {

double BlochVector::length() const {
    return std::sqrt(x * x + y * y + z * z);
}

BlochVector bloch_vector(const StateVector& state, int num_qubits, int qubit) {
    if (qubit < 0 || qubit >= num_qubits) {
        throw std::out_of_range("Qubit index out of range");
    }
    if (state.size() != dimension_for(num_qubits)) {
        throw std::invalid_argument("State size does not match qubit count");
    }

    const size_t bit = size_t(1) << qubit;
    double p0 = 0.0;
    double p1 = 0.0;
    Complex coherence(0.0, 0.0);  // sum conj(alpha) * beta

    for (size_t i = 0; i < state.size(); ++i) {
        if (i & bit) continue;
        const Complex alpha = state[i];
        const Complex beta = state[i | bit];
        p0 += std::norm(alpha);
        p1 += std::norm(beta);
        coherence += std::conj(alpha) * beta;
    }

    return BlochVector{2.0 * coherence.real(), 2.0 * coherence.imag(), p0 - p1};
}

BlochVector bloch_from_density(const DensityMatrix& rho) {
    if (rho.dim() != 2) {
        throw std::invalid_argument("Bloch vector requires a single-qubit density matrix");
    }
    const Matrix& m = rho.matrix();
    // rho = (I + xX + yY + zZ) / 2, so rho_10 = (x + iy) / 2
    return BlochVector{2.0 * m(1, 0).real(), 2.0 * m(1, 0).imag(),
                       m(0, 0).real() - m(1, 1).real()};
}

std::vector<BlochVector> all_bloch_vectors(const StateVector& state, int num_qubits) {
    std::vector<BlochVector> out;
    out.reserve(static_cast<size_t>(num_qubits));
    for (int q = 0; q < num_qubits; ++q) {
        out.push_back(bloch_vector(state, num_qubits, q));
    }
    return out;
}

} // namespace qscope::quantum
