/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/analytics/circuit_statistics.hpp"
#include "qscope/analytics/metrics.hpp"
#include "qscope/narration/narrator.hpp"
#include "qscope/quantum/bloch.hpp"
#include "qscope/quantum/circuit.hpp"
#include "qscope/quantum/linalg.hpp"
#include "qscope/quantum/simulator.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qscope::engine {

struct SimulationOptions {
    std::optional<quantum::StateVector> reference;  // ground state when absent
    bool include_gate_matrices{true};
    bool include_narration{true};
    quantum::EvolverFactory::Backend backend{quantum::EvolverFactory::Backend::KRONECKER};
};

struct AmplitudeInfo {
    std::size_t index{0};
    double magnitude{0.0};
    double phase{0.0};
    double probability{0.0};
    double real{0.0};
    double imag{0.0};
    std::string basis_state;
};

struct SimulationStep {
    int index{0};
    std::optional<quantum::GateSpec> gate;  // absent for step 0
    quantum::StateVector state;
    std::vector<quantum::BlochVector> bloch;  // indexed by qubit
    std::vector<double> probabilities;
    std::vector<AmplitudeInfo> amplitudes;
    std::optional<quantum::Matrix> gate_matrix;
    std::optional<narration::StepNarration> narration;
    std::optional<narration::StateChanges> changes;
    std::string explanation;
    analytics::MetricsBundle metrics;
};

struct SimulationResult {
    int num_qubits{quantum::QuantumCircuit::kDefaultQubits};
    std::vector<SimulationStep> steps;
    analytics::MetricsBundle final_metrics;
    analytics::EntanglementAnalysis entanglement_analysis;
    analytics::CoherenceMeasures coherence;
    analytics::InformationMetrics information;
    analytics::DistanceMetrics distance;
    analytics::GeometricMetrics geometric;
    analytics::CircuitStatistics statistics;
};

struct FinalResult {
    int num_qubits{quantum::QuantumCircuit::kDefaultQubits};
    std::vector<quantum::BlochVector> bloch;
    double purity{1.0};
    double fidelity{1.0};  // versus the reference state
    double entanglement{0.0};
    std::vector<double> probabilities;
};

} // namespace qscope::engine
