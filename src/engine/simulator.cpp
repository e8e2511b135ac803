/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/engine/simulator.hpp"
#include "qscope/errors.hpp"

#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace qscope::engine {

using quantum::StateVector;

namespace {

constexpr double kReferenceNormTolerance = 1e-6;

} // namespace

void check_reference(const StateVector& reference, int num_qubits) {
    const std::size_t expected = quantum::dimension_for(num_qubits);
    if (reference.size() != expected) {
        throw MalformedCircuit(fmt::format("Reference state has dimension {}, expected {}",
                                           reference.size(), expected));
    }
    const double norm = quantum::norm_squared(reference);
    if (std::abs(norm - 1.0) > kReferenceNormTolerance) {
        throw MalformedCircuit(fmt::format("Reference state is not normalized (norm^2 = {:.6f})", norm));
    }
}

Simulator::Simulator(config::EngineConfig config, logging::Logger& log)
    : config_(std::move(config))
    , limits_{config_.max_qubits, config_.max_gates}
    , backend_(quantum::EvolverFactory::parse_backend(config_.backend))
    , log_(log) {
}

SimulationOptions Simulator::default_options() const {
    SimulationOptions options;
    options.include_gate_matrices = config_.include_gate_matrices;
    options.include_narration = config_.include_narration;
    options.backend = backend_;
    return options;
}

std::vector<StateVector> Simulator::run(const quantum::QuantumCircuit& circuit,
                                        const std::optional<StateVector>& reference,
                                        quantum::EvolverFactory::Backend backend) const {
    try {
        quantum::enforce_limits(circuit, limits_);
    } catch (const ResourceLimitExceeded& e) {
        log_.warn(fmt::format("Rejected circuit: {}", e.what()));
        throw;
    }
    if (reference) check_reference(*reference, circuit.num_qubits());

    auto evolver = quantum::EvolverFactory::create(backend);
    log_.debug(fmt::format("Evolving {} gates on {} qubits ({} backend)",
                           circuit.gate_count(), circuit.num_qubits(), evolver->backend_name()));
    return quantum::evolve(circuit, *evolver, limits_);
}

SimulationStep Simulator::make_step(int index, const quantum::QuantumCircuit& circuit,
                                    const std::vector<StateVector>& snapshots,
                                    const SimulationOptions& options) const {
    const int n = circuit.num_qubits();
    const StateVector& state = snapshots[static_cast<std::size_t>(index)];

    SimulationStep step;
    step.index = index;
    step.state = state;
    step.bloch = quantum::all_bloch_vectors(state, n);
    step.probabilities = analytics::probabilities(state);
    step.amplitudes.reserve(state.size());
    for (std::size_t i = 0; i < state.size(); ++i) {
        AmplitudeInfo a;
        a.index = i;
        a.magnitude = std::abs(state[i]);
        a.phase = std::arg(state[i]);
        a.probability = std::norm(state[i]);
        a.real = state[i].real();
        a.imag = state[i].imag();
        a.basis_state = narration::basis_label(i, n);
        step.amplitudes.push_back(std::move(a));
    }
    step.metrics = analytics::compute_metrics(state, n, options.reference);

    if (index == 0) {
        step.explanation = narration::explain_initialization(n);
        return step;
    }

    const quantum::GateSpec& gate = circuit.gates()[static_cast<std::size_t>(index - 1)];
    const StateVector& before = snapshots[static_cast<std::size_t>(index - 1)];
    step.gate = gate;
    if (options.include_gate_matrices && n <= config_.matrix_qubit_limit) {
        step.gate_matrix = quantum::system_operator(gate.kind, gate.qubit, n);
    }
    if (options.include_narration) {
        step.narration = narration::narrate(gate, before, state, n);
    }
    step.changes = narration::analyze_changes(before, state, n);
    step.explanation = narration::explain_step(gate);
    return step;
}

SimulationResult Simulator::simulate(const quantum::QuantumCircuit& circuit,
                                     const SimulationOptions& options) const {
    const auto snapshots = run(circuit, options.reference, options.backend);
    const int n = circuit.num_qubits();

    SimulationResult result;
    result.num_qubits = n;
    result.steps.reserve(snapshots.size());
    for (std::size_t i = 0; i < snapshots.size(); ++i) {
        result.steps.push_back(make_step(static_cast<int>(i), circuit, snapshots, options));
        log_.debug(fmt::format("Step {}/{}: {}", i, snapshots.size() - 1,
                               result.steps.back().explanation));
    }

    const SimulationStep& last = result.steps.back();
    result.final_metrics = last.metrics;
    result.entanglement_analysis =
        analytics::analyze_entanglement(result.final_metrics.entanglement.overall, n);
    result.coherence = analytics::coherence_measures(last.state);
    result.information = analytics::information_metrics(last.state);
    result.distance = analytics::distance_metrics(last.state);
    result.geometric = analytics::geometric_metrics(last.state, n);
    result.statistics = analytics::compute_statistics(circuit);
    return result;
}

SimulationResult Simulator::simulate(const std::vector<quantum::RawGate>& gates,
                                     const SimulationOptions& options) const {
    return simulate(quantum::normalize(gates), options);
}

FinalResult Simulator::simulate_final(const quantum::QuantumCircuit& circuit,
                                      const std::optional<StateVector>& reference) const {
    const auto snapshots = run(circuit, reference, backend_);
    const StateVector& psi = snapshots.back();
    const int n = circuit.num_qubits();

    FinalResult result;
    result.num_qubits = n;
    result.bloch = quantum::all_bloch_vectors(psi, n);
    result.purity = analytics::purity(psi);
    result.fidelity = analytics::fidelity(reference ? *reference : quantum::ground_state(n), psi);
    result.entanglement = analytics::entanglement_profile(psi, n).overall;
    result.probabilities = analytics::probabilities(psi);
    return result;
}

FinalResult Simulator::simulate_final(const std::vector<quantum::RawGate>& gates,
                                      const std::optional<StateVector>& reference) const {
    return simulate_final(quantum::normalize(gates), reference);
}

} // namespace qscope::engine
