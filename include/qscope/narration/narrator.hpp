/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/circuit.hpp"
#include "qscope/quantum/gates.hpp"
#include "qscope/quantum/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace qscope::narration {

using quantum::GateKind;
using quantum::GateSpec;
using quantum::StateVector;

struct BlochMovement {
    std::string axis;
    std::string angle;
    std::string description;
};

/**
 * Static text for one gate kind: matrix literal, action on |0> and |1>,
 * physical effect and Bloch-sphere movement.
 */
struct GateDescription {
    std::string symbol;
    std::string name;
    std::string matrix_literal;
    std::string basis_action;
    std::string physical_effect;
    std::string bloch_action;
    BlochMovement movement;
};

GateDescription describe_gate(GateKind kind);

// MSB-first binary label of a basis index, num_qubits digits wide.
std::string basis_label(std::size_t index, int num_qubits);

struct AmplitudeChange {
    std::string basis_state;
    double before_probability{0.0};
    double after_probability{0.0};
    double probability_change{0.0};
    double before_magnitude{0.0};
    double after_magnitude{0.0};
    double phase_change{0.0};  // arg(after) - arg(before), not wrapped
};

struct StateChanges {
    double fidelity{1.0};  // |<before|after>|^2
    std::vector<AmplitudeChange> amplitude_changes;
    double total_probability_change{0.0};
};

// Throws InternalInvariantViolation when the snapshots differ in size.
StateChanges analyze_changes(const StateVector& before, const StateVector& after, int num_qubits);

struct PhaseChange {
    std::string basis_state;
    double phase_change{0.0};
};

// Only basis states where both magnitudes exceed 1e-10.
std::vector<PhaseChange> phase_changes(const StateVector& before, const StateVector& after,
                                       int num_qubits);

struct EntanglementImpact {
    std::string type{"local_operation"};
    std::string description;
};

EntanglementImpact entanglement_impact(int num_qubits);

struct StepNarration {
    std::string operation;  // "Apply H gate to qubit 0"
    GateDescription gate;
    int target_qubit{0};
    std::vector<PhaseChange> phase_changes;
    EntanglementImpact entanglement;
};

StepNarration narrate(const GateSpec& gate, const StateVector& before, const StateVector& after,
                      int num_qubits);

// One-line explanation attached to every step after the first.
std::string explain_step(const GateSpec& gate);

// "Initialize 2-qubit system in |00> state"
std::string explain_initialization(int num_qubits);

} // namespace qscope::narration
