/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/gates.hpp"
#include "qscope/errors.hpp"

#include <cmath>
#include <fmt/format.h>

namespace qscope::quantum {

namespace {

std::size_t table_index(GateKind kind) {
    switch (kind) {
        case GateKind::H: return 0;
        case GateKind::X: return 1;
        case GateKind::Y: return 2;
        case GateKind::Z: return 3;
        case GateKind::I: return 4;
    }
    throw std::invalid_argument("Unknown gate kind");
}

std::array<Matrix2, kGateKindCount> build_table() {
    const double s = 1.0 / std::sqrt(2.0);
    std::array<Matrix2, kGateKindCount> table{};
    table[table_index(GateKind::H)] = {Complex(s, 0), Complex(s, 0), Complex(s, 0), Complex(-s, 0)};
    table[table_index(GateKind::X)] = {Complex(0, 0), Complex(1, 0), Complex(1, 0), Complex(0, 0)};
    table[table_index(GateKind::Y)] = {Complex(0, 0), Complex(0, -1), Complex(0, 1), Complex(0, 0)};
    table[table_index(GateKind::Z)] = {Complex(1, 0), Complex(0, 0), Complex(0, 0), Complex(-1, 0)};
    table[table_index(GateKind::I)] = {Complex(1, 0), Complex(0, 0), Complex(0, 0), Complex(1, 0)};
    return table;
}

} // namespace

const Matrix2& gate_matrix(GateKind kind) {
    static const std::array<Matrix2, kGateKindCount> table = build_table();
    return table[table_index(kind)];
}

const std::array<GateKind, kGateKindCount>& all_gate_kinds() {
    static const std::array<GateKind, kGateKindCount> kinds = {
        GateKind::H, GateKind::X, GateKind::Y, GateKind::Z, GateKind::I};
    return kinds;
}

std::string gate_symbol(GateKind kind) {
    switch (kind) {
        case GateKind::H: return "H";
        case GateKind::X: return "X";
        case GateKind::Y: return "Y";
        case GateKind::Z: return "Z";
        case GateKind::I: return "I";
    }
    return "?";
}

std::string gate_name(GateKind kind) {
    switch (kind) {
        case GateKind::H: return "Hadamard";
        case GateKind::X: return "Pauli-X";
        case GateKind::Y: return "Pauli-Y";
        case GateKind::Z: return "Pauli-Z";
        case GateKind::I: return "Identity";
    }
    return "Unknown";
}

GateKind parse_gate_kind(const std::string& token) {
    if (token == "H" || token == "h") return GateKind::H;
    if (token == "X" || token == "x") return GateKind::X;
    if (token == "Y" || token == "y") return GateKind::Y;
    if (token == "Z" || token == "z") return GateKind::Z;
    if (token == "I" || token == "i" || token == "id") return GateKind::I;
    throw MalformedCircuit(fmt::format("Unsupported gate type: {}", token));
}

bool is_self_inverse(GateKind kind) {
    switch (kind) {
        case GateKind::H:
        case GateKind::X:
        case GateKind::Y:
        case GateKind::Z:
            return true;
        case GateKind::I:
            return false;
    }
    return false;
}

} // namespace qscope::quantum
