/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/simulator.hpp"

namespace qscope::quantum {

/**
 * Strided CPU evolver: for every basis index with the target bit clear,
 * updates the amplitude pair (i, i | bit) with the 2x2 gate matrix.
 */
class StridedEvolver : public IStateEvolver {
public:
    void apply(const GateSpec& gate, int num_qubits, StateVector& state) const override;
    std::string backend_name() const override { return "STRIDED"; }
};

/**
 * Reference evolver: builds the full system operator as a Kronecker product
 * and multiplies it into the state.
 */
class KroneckerEvolver : public IStateEvolver {
public:
    void apply(const GateSpec& gate, int num_qubits, StateVector& state) const override;
    std::string backend_name() const override { return "KRONECKER"; }
};

} // namespace qscope::quantum
