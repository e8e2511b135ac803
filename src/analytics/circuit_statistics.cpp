/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/analytics/circuit_statistics.hpp"

#include <fmt/format.h>

namespace qscope::analytics {

using quantum::GateKind;

std::string classify_complexity(int total_gates, int depth) {
    if (total_gates == 0) return "trivial";
    if (total_gates <= 10 && depth <= 5) return "simple";
    if (total_gates <= 50 && depth <= 20) return "moderate";
    return "complex";
}

double gate_cost(GateKind kind) {
    switch (kind) {
        case GateKind::H: return 1.0;
        case GateKind::X: return 0.8;
        case GateKind::Y: return 0.8;
        case GateKind::Z: return 0.5;
        case GateKind::I: return 0.1;
    }
    return 1.0;
}

std::vector<std::string> suggest_optimizations(const quantum::QuantumCircuit& circuit) {
    std::vector<std::string> suggestions;

    for (int q = 0; q < circuit.num_qubits(); ++q) {
        const auto on_qubit = circuit.gates_on_qubit(q);
        for (size_t i = 1; i < on_qubit.size(); ++i) {
            const auto& prev = on_qubit[i - 1];
            const auto& cur = on_qubit[i];
            if (prev.kind == cur.kind && quantum::is_self_inverse(cur.kind)) {
                suggestions.push_back(fmt::format(
                    "Consecutive {} gates on qubit {} (positions {} and {}) cancel out",
                    quantum::gate_symbol(cur.kind), q, prev.position, cur.position));
                ++i;
            }
        }
    }

    int identities = 0;
    for (const auto& g : circuit.gates()) {
        if (g.kind == GateKind::I) ++identities;
    }
    if (identities > 0) {
        suggestions.push_back(fmt::format("Remove {} identity gates", identities));
    }
    return suggestions;
}

CircuitStatistics compute_statistics(const quantum::QuantumCircuit& circuit) {
    CircuitStatistics s;
    s.total_gates = static_cast<int>(circuit.gate_count());
    s.depth = circuit.depth();
    s.num_qubits = circuit.num_qubits();

    for (const auto& g : circuit.gates()) {
        s.gate_counts[quantum::gate_symbol(g.kind)] += 1;
        s.estimated_execution_time += gate_cost(g.kind);
    }

    if (s.depth > 0) {
        s.density = static_cast<double>(s.total_gates) /
                    (static_cast<double>(s.num_qubits) * s.depth);
        s.parallelization_factor = static_cast<double>(s.total_gates) / s.depth;
    }
    s.complexity_class = classify_complexity(s.total_gates, s.depth);

    s.resources.qubits = s.num_qubits;
    s.resources.gates = s.total_gates;
    s.resources.memory = fmt::format("O(2^{})", s.num_qubits);
    s.resources.time_complexity = fmt::format("O({} * 2^{})", s.total_gates, s.num_qubits);

    s.optimization_suggestions = suggest_optimizations(circuit);
    return s;
}

} // namespace qscope::analytics
