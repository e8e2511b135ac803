/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/circuit.hpp"

#include <map>
#include <string>
#include <vector>

namespace qscope::analytics {

struct ResourceRequirements {
    int qubits{0};
    int gates{0};
    std::string memory;          // "O(2^n)"
    std::string time_complexity; // "O(g * 2^n)"
};

struct CircuitStatistics {
    int total_gates{0};
    std::map<std::string, int> gate_counts;  // keyed by gate symbol
    int depth{0};
    int num_qubits{0};
    double density{0.0};
    double parallelization_factor{1.0};
    std::string complexity_class{"trivial"};
    double estimated_execution_time{0.0};
    ResourceRequirements resources;
    std::vector<std::string> optimization_suggestions;
};

// trivial / simple / moderate / complex
std::string classify_complexity(int total_gates, int depth);

// Relative cost of one gate in the execution-time estimate.
double gate_cost(quantum::GateKind kind);

/**
 * @brief Hints for shortening the circuit.
 *
 * Reports consecutive identical self-inverse gates on the same qubit (they
 * cancel) and identity gates that can be dropped.
 */
std::vector<std::string> suggest_optimizations(const quantum::QuantumCircuit& circuit);

CircuitStatistics compute_statistics(const quantum::QuantumCircuit& circuit);

} // namespace qscope::analytics
