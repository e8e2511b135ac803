/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/density_matrix.hpp"
#include "qscope/quantum/types.hpp"

#include <vector>

namespace qscope::quantum {

struct BlochVector {
    double x{0.0};
    double y{0.0};
    double z{1.0};

    double length() const;
};

/**
 * Closed-form single-qubit Bloch vector. With alpha/beta the amplitudes where
 * the qubit is 0/1 and the other qubits fixed, summed over those other qubits:
 * x = 2 Re(conj(alpha) beta), y = 2 Im(conj(alpha) beta), z = |alpha|^2 - |beta|^2.
 */
BlochVector bloch_vector(const StateVector& state, int num_qubits, int qubit);

// Tr(rho X), Tr(rho Y), Tr(rho Z) of a 2x2 density matrix.
BlochVector bloch_from_density(const DensityMatrix& rho);

std::vector<BlochVector> all_bloch_vectors(const StateVector& state, int num_qubits);

} // namespace qscope::quantum
