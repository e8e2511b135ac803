/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/config/types.hpp"
#include "qscope/engine/result.hpp"
#include "qscope/logging/logger.hpp"
#include "qscope/quantum/evolution.hpp"

#include <optional>
#include <vector>

namespace qscope::engine {

/**
 * @brief Step-by-step simulation and analytics of single-qubit circuits.
 *
 * Holds only immutable configuration and a logger reference, so one instance
 * may serve concurrent calls. Every call evolves from |0...0> and returns a
 * fresh result.
 *
 * Errors are thrown as EngineError subclasses:
 * - MalformedCircuit for unsupported gates or a bad reference state
 * - ResourceLimitExceeded before any 2^n allocation
 * - InternalInvariantViolation for norm drift or a broken reduced state
 */
class Simulator {
public:
    // Throws std::invalid_argument for an unknown backend name.
    Simulator(config::EngineConfig config, logging::Logger& log);

    const config::EngineConfig& config() const { return config_; }

    // Options seeded from the configuration.
    SimulationOptions default_options() const;

    SimulationResult simulate(const quantum::QuantumCircuit& circuit,
                              const SimulationOptions& options) const;
    SimulationResult simulate(const std::vector<quantum::RawGate>& gates,
                              const SimulationOptions& options) const;

    FinalResult simulate_final(const quantum::QuantumCircuit& circuit,
                               const std::optional<quantum::StateVector>& reference = std::nullopt) const;
    FinalResult simulate_final(const std::vector<quantum::RawGate>& gates,
                               const std::optional<quantum::StateVector>& reference = std::nullopt) const;

private:
    std::vector<quantum::StateVector> run(const quantum::QuantumCircuit& circuit,
                                          const std::optional<quantum::StateVector>& reference,
                                          quantum::EvolverFactory::Backend backend) const;

    SimulationStep make_step(int index, const quantum::QuantumCircuit& circuit,
                             const std::vector<quantum::StateVector>& snapshots,
                             const SimulationOptions& options) const;

    config::EngineConfig config_;
    quantum::EvolutionLimits limits_;
    quantum::EvolverFactory::Backend backend_;
    logging::Logger& log_;
};

// Throws MalformedCircuit unless the reference has 2^n entries and unit norm within 1e-6.
void check_reference(const quantum::StateVector& reference, int num_qubits);

} // namespace qscope::engine
