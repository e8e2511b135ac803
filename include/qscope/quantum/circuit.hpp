/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/gates.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace qscope::quantum {

/**
 * Gate as received from a collaborator, before the kind token is checked.
 */
struct RawGate {
    std::string kind{"I"};
    int qubit{0};
    int position{0};
};

struct GateSpec {
    GateKind kind;
    int qubit;
    int position;
};

/**
 * Position-ordered gate sequence.
 *
 * Gates are stable-sorted by position, so gates sharing a position keep their
 * insertion order. The qubit count is max(qubit) + 1, or kDefaultQubits for
 * an empty circuit.
 */
class QuantumCircuit {
public:
    static constexpr int kDefaultQubits = 2;

    QuantumCircuit();
    explicit QuantumCircuit(std::vector<GateSpec> gates);

    int num_qubits() const { return num_qubits_; }
    const std::vector<GateSpec>& gates() const { return gates_; }
    std::size_t gate_count() const { return gates_.size(); }
    bool empty() const { return gates_.empty(); }

    // max(position) + 1, 0 when empty
    int depth() const;

    std::vector<GateSpec> gates_on_qubit(int qubit) const;
    std::vector<GateSpec> gates_at_position(int position) const;

private:
    int num_qubits_;
    std::vector<GateSpec> gates_;
};

// Parses kind tokens and builds the ordered circuit. Throws MalformedCircuit.
QuantumCircuit normalize(const std::vector<RawGate>& raw);

} // namespace qscope::quantum
