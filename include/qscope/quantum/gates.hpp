/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/types.hpp"

#include <array>
#include <string>

namespace qscope::quantum {

/**
 * Supported single-qubit gates. The set is closed: every dispatch on a
 * GateKind is an exhaustive switch.
 */
enum class GateKind {
    H,  // Hadamard
    X,  // Pauli-X
    Y,  // Pauli-Y
    Z,  // Pauli-Z
    I   // Identity
};

constexpr std::size_t kGateKindCount = 5;

// Canonical 2x2 unitary for the gate, from a table built once.
const Matrix2& gate_matrix(GateKind kind);

const std::array<GateKind, kGateKindCount>& all_gate_kinds();

// "H", "X", "Y", "Z", "I"
std::string gate_symbol(GateKind kind);

// "Hadamard", "Pauli-X", ...
std::string gate_name(GateKind kind);

// Accepts H/X/Y/Z/I, lowercase forms and "id". Throws MalformedCircuit otherwise.
GateKind parse_gate_kind(const std::string& token);

// H, X, Y and Z square to the identity.
bool is_self_inverse(GateKind kind);

} // namespace qscope::quantum
