/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <complex>
#include <cstddef>
#include <vector>

namespace qscope::quantum {

using Complex = std::complex<double>;
using StateVector = std::vector<Complex>;

// Row-major 2x2 matrix: {u00, u01, u10, u11}
using Matrix2 = std::array<Complex, 4>;

constexpr double kNormTolerance = 1e-9;
constexpr double kProbabilityFloor = 1e-16;

inline std::size_t dimension_for(int num_qubits) {
    return std::size_t(1) << num_qubits;
}

} // namespace qscope::quantum
