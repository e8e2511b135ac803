/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/circuit.hpp"
#include "qscope/errors.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>
#include <fmt/format.h>

namespace qscope::quantum {

QuantumCircuit::QuantumCircuit()
    : num_qubits_(kDefaultQubits) {}

QuantumCircuit::QuantumCircuit(std::vector<GateSpec> gates)
    : num_qubits_(kDefaultQubits)
    , gates_(std::move(gates)) {
    for (const auto& gate : gates_) {
        if (gate.qubit < 0) {
            throw MalformedCircuit(fmt::format("Qubit index must be non-negative (got {})", gate.qubit));
        }
        if (gate.qubit == std::numeric_limits<int>::max()) {
            throw ResourceLimitExceeded(fmt::format("Qubit index {} is out of range", gate.qubit));
        }
        if (gate.position == std::numeric_limits<int>::max()) {
            throw ResourceLimitExceeded(fmt::format("Gate position {} is out of range", gate.position));
        }
        if (gate.position < 0) {
            throw MalformedCircuit(fmt::format("Gate position must be non-negative (got {})", gate.position));
        }
    }

    std::stable_sort(gates_.begin(), gates_.end(),
                     [](const GateSpec& a, const GateSpec& b) { return a.position < b.position; });

    if (!gates_.empty()) {
        auto widest = std::max_element(gates_.begin(), gates_.end(),
                                       [](const GateSpec& a, const GateSpec& b) { return a.qubit < b.qubit; });
        num_qubits_ = widest->qubit + 1;
    }
}

int QuantumCircuit::depth() const {
    int max_position = -1;
    for (const auto& gate : gates_) {
        max_position = std::max(max_position, gate.position);
    }
    return max_position + 1;
}

std::vector<GateSpec> QuantumCircuit::gates_on_qubit(int qubit) const {
    std::vector<GateSpec> out;
    std::copy_if(gates_.begin(), gates_.end(), std::back_inserter(out),
                 [qubit](const GateSpec& g) { return g.qubit == qubit; });
    return out;
}

std::vector<GateSpec> QuantumCircuit::gates_at_position(int position) const {
    std::vector<GateSpec> out;
    std::copy_if(gates_.begin(), gates_.end(), std::back_inserter(out),
                 [position](const GateSpec& g) { return g.position == position; });
    return out;
}

QuantumCircuit normalize(const std::vector<RawGate>& raw) {
    std::vector<GateSpec> gates;
    gates.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const RawGate& r = raw[i];
        GateKind kind;
        try {
            kind = parse_gate_kind(r.kind);
        } catch (const MalformedCircuit& e) {
            throw MalformedCircuit(fmt::format("Gate {}: {}", i, e.what()));
        }
        gates.push_back({kind, r.qubit, r.position});
    }
    return QuantumCircuit(std::move(gates));
}

} // namespace qscope::quantum
