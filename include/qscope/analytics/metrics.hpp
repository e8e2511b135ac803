/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/bloch.hpp"
#include "qscope/quantum/density_matrix.hpp"
#include "qscope/quantum/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qscope::analytics {

using quantum::StateVector;
using QubitPair = std::pair<int, int>;

/*
 * Global metrics work on the basis-probability distribution p_i = |amp_i|^2.
 * Every function is total: an empty state yields the ground-state values.
 */
std::vector<double> probabilities(const StateVector& state);
double purity(const StateVector& state);

// -sum p log2 p over p > 1e-16. Reported as "von_neumann_entropy" although it
// is the Shannon entropy of the measurement distribution of the global state.
double distribution_entropy(const StateVector& state);

double linear_entropy(const StateVector& state);
double participation_ratio(const StateVector& state);
double effective_dimension(const StateVector& state);

// -sum lambda log2 lambda over eigenvalues lambda > 1e-16.
double subsystem_entropy(const quantum::DensityMatrix& rho);

// sum |amp| - sqrt(sum p); a magnitude-sum heuristic, not the off-diagonal l1 norm.
double l1_coherence(const StateVector& state);

// log2(N) - distribution entropy.
double relative_entropy_coherence(const StateVector& state);

// |<reference|state>|^2. Throws MalformedCircuit on dimension mismatch.
double fidelity(const StateVector& reference, const StateVector& state);

// sqrt(1 - fidelity), valid for pure states.
double trace_distance(const StateVector& reference, const StateVector& state);

struct EntanglementProfile {
    std::vector<double> qubit_entropy;
    std::map<QubitPair, double> pair_entropy;
    std::map<QubitPair, double> mutual_information;
    double overall{0.0};  // mean of qubit_entropy
};

/**
 * @brief Eigenvalue-based subsystem entropies for every qubit and every pair.
 *
 * Reduced states are checked for trace and Hermiticity; a failure raises
 * InternalInvariantViolation.
 */
EntanglementProfile entanglement_profile(const StateVector& state, int num_qubits);

struct MetricsBundle {
    double purity{1.0};
    double von_neumann_entropy{0.0};
    double linear_entropy{0.0};
    double participation_ratio{1.0};
    double effective_dimension{1.0};
    EntanglementProfile entanglement;
    double l1_coherence{0.0};
    double relative_entropy_coherence{0.0};
    double fidelity{1.0};
    double trace_distance{0.0};
};

// Reference defaults to the ground state of the same size.
MetricsBundle compute_metrics(const StateVector& state, int num_qubits,
                              const std::optional<StateVector>& reference = std::nullopt);

struct EntanglementAnalysis {
    std::string type;
    double measure{0.0};
    std::string description;
    double max_entanglement{0.0};
};

EntanglementAnalysis analyze_entanglement(double measure, int num_qubits);

struct CoherenceMeasures {
    double l1_norm_coherence{0.0};
    double relative_entropy_coherence{0.0};
    std::string coherence_basis{"computational"};
};

CoherenceMeasures coherence_measures(const StateVector& state);

struct InformationMetrics {
    double shannon_entropy{0.0};
    double renyi_entropy_2{0.0};
    double fisher_information{0.0};
    double max_entropy{0.0};
};

InformationMetrics information_metrics(const StateVector& state);

struct DistanceMetrics {
    double ground_state_fidelity{1.0};
    double uniform_state_fidelity{0.0};
    double ground_state_trace_distance{0.0};
    double uniform_state_trace_distance{1.0};
};

DistanceMetrics distance_metrics(const StateVector& state);

struct GeometricMetrics {
    std::vector<double> qubit_purity;  // Tr(rho_q^2)
    double average_qubit_purity{1.0};
    std::optional<quantum::BlochVector> bloch;  // single-qubit systems only
    double bloch_length{1.0};  // mean over qubits when there is more than one
};

GeometricMetrics geometric_metrics(const StateVector& state, int num_qubits);

} // namespace qscope::analytics
