/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/narration/narrator.hpp"
#include "qscope/errors.hpp"
#include "qscope/quantum/linalg.hpp"

#include <cmath>
#include <utility>
#include <fmt/format.h>

namespace qscope::narration {

namespace {

constexpr double kMagnitudeFloor = 1e-10;

void require_same_size(const StateVector& before, const StateVector& after) {
    if (before.size() != after.size()) {
        throw InternalInvariantViolation(fmt::format(
            "Snapshot size changed from {} to {}", before.size(), after.size()));
    }
}

} // namespace

GateDescription describe_gate(GateKind kind) {
    GateDescription d;
    d.symbol = quantum::gate_symbol(kind);
    d.name = quantum::gate_name(kind);
    switch (kind) {
        case GateKind::H:
            d.matrix_literal = "(1/√2)[[1, 1], [1, -1]]";
            d.basis_action = "H|0⟩ = (|0⟩ + |1⟩)/√2, H|1⟩ = (|0⟩ - |1⟩)/√2";
            d.physical_effect = "Creates superposition - equal probability amplitudes for |0⟩ and |1⟩";
            d.bloch_action = "Rotation to equator, creating equal superposition";
            d.movement = {"Y then X", "90° then 180°", "To equator"};
            break;
        case GateKind::X:
            d.matrix_literal = "[[0, 1], [1, 0]]";
            d.basis_action = "X|0⟩ = |1⟩, X|1⟩ = |0⟩";
            d.physical_effect = "Bit flip operation - rotates 180° around X-axis on Bloch sphere";
            d.bloch_action = "180° rotation around X-axis (bit flip)";
            d.movement = {"X", "180°", "Flip across XZ-plane"};
            break;
        case GateKind::Y:
            d.matrix_literal = "[[0, -i], [i, 0]]";
            d.basis_action = "Y|0⟩ = i|1⟩, Y|1⟩ = -i|0⟩";
            d.physical_effect = "Bit and phase flip - rotates 180° around Y-axis with complex phase";
            d.bloch_action = "180° rotation around Y-axis (bit + phase flip)";
            d.movement = {"Y", "180°", "Rotate around Y-axis"};
            break;
        case GateKind::Z:
            d.matrix_literal = "[[1, 0], [0, -1]]";
            d.basis_action = "Z|0⟩ = |0⟩, Z|1⟩ = -|1⟩";
            d.physical_effect = "Phase flip operation - rotates 180° around Z-axis";
            d.bloch_action = "180° rotation around Z-axis (phase flip)";
            d.movement = {"Z", "180°", "Flip across XY-plane"};
            break;
        case GateKind::I:
            d.matrix_literal = "[[1, 0], [0, 1]]";
            d.basis_action = "I|0⟩ = |0⟩, I|1⟩ = |1⟩";
            d.physical_effect = "Identity operation - no change to the quantum state";
            d.bloch_action = "No rotation - vector unchanged";
            d.movement = {"none", "0°", "No movement"};
            break;
    }
    return d;
}

std::string basis_label(std::size_t index, int num_qubits) {
    std::string label(static_cast<size_t>(num_qubits > 0 ? num_qubits : 0), '0');
    for (int b = 0; b < num_qubits; ++b) {
        if ((index >> b) & 1ULL) label[static_cast<size_t>(num_qubits - 1 - b)] = '1';
    }
    return label;
}

StateChanges analyze_changes(const StateVector& before, const StateVector& after, int num_qubits) {
    require_same_size(before, after);

    StateChanges changes;
    changes.fidelity = std::norm(quantum::inner_product(before, after));
    changes.amplitude_changes.reserve(before.size());

    for (size_t i = 0; i < before.size(); ++i) {
        AmplitudeChange c;
        c.basis_state = basis_label(i, num_qubits);
        c.before_probability = std::norm(before[i]);
        c.after_probability = std::norm(after[i]);
        c.probability_change = c.after_probability - c.before_probability;
        c.before_magnitude = std::abs(before[i]);
        c.after_magnitude = std::abs(after[i]);
        c.phase_change = std::arg(after[i]) - std::arg(before[i]);
        changes.total_probability_change += std::abs(c.probability_change);
        changes.amplitude_changes.push_back(std::move(c));
    }
    return changes;
}

std::vector<PhaseChange> phase_changes(const StateVector& before, const StateVector& after,
                                       int num_qubits) {
    require_same_size(before, after);

    std::vector<PhaseChange> out;
    for (size_t i = 0; i < before.size(); ++i) {
        if (std::abs(before[i]) > kMagnitudeFloor && std::abs(after[i]) > kMagnitudeFloor) {
            out.push_back({basis_label(i, num_qubits), std::arg(after[i]) - std::arg(before[i])});
        }
    }
    return out;
}

EntanglementImpact entanglement_impact(int num_qubits) {
    EntanglementImpact impact;
    impact.description = num_qubits < 2
        ? "Single qubit operation - no entanglement possible"
        : "Local single-qubit operation - entanglement structure preserved";
    return impact;
}

StepNarration narrate(const GateSpec& gate, const StateVector& before, const StateVector& after,
                      int num_qubits) {
    StepNarration n;
    n.gate = describe_gate(gate.kind);
    n.operation = fmt::format("Apply {} gate to qubit {}", n.gate.symbol, gate.qubit);
    n.target_qubit = gate.qubit;
    n.phase_changes = phase_changes(before, after, num_qubits);
    n.entanglement = entanglement_impact(num_qubits);
    return n;
}

std::string explain_step(const GateSpec& gate) {
    const int q = gate.qubit;
    switch (gate.kind) {
        case GateKind::H:
            return fmt::format("Applied Hadamard gate to qubit {}. Creates superposition: "
                               "transforms |0⟩ → (|0⟩ + |1⟩)/√2 and |1⟩ → (|0⟩ - |1⟩)/√2", q);
        case GateKind::X:
            return fmt::format("Applied Pauli-X gate to qubit {}. Bit flip operation: "
                               "transforms |0⟩ → |1⟩ and |1⟩ → |0⟩", q);
        case GateKind::Y:
            return fmt::format("Applied Pauli-Y gate to qubit {}. Bit and phase flip: "
                               "transforms |0⟩ → i|1⟩ and |1⟩ → -i|0⟩", q);
        case GateKind::Z:
            return fmt::format("Applied Pauli-Z gate to qubit {}. Phase flip operation: "
                               "transforms |0⟩ → |0⟩ and |1⟩ → -|1⟩", q);
        case GateKind::I:
            return fmt::format("Applied Identity gate to qubit {}. No change to the qubit state", q);
    }
    return fmt::format("Applied {} gate to qubit {}", quantum::gate_symbol(gate.kind), q);
}

std::string explain_initialization(int num_qubits) {
    return fmt::format("Initialize {}-qubit system in |{}⟩ state", num_qubits,
                       std::string(static_cast<size_t>(num_qubits), '0'));
}

} // namespace qscope::narration
