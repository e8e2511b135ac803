/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/analytics/metrics.hpp"
#include "qscope/errors.hpp"
#include "qscope/quantum/evolution.hpp"
#include "qscope/quantum/linalg.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace qscope::analytics {

using quantum::kProbabilityFloor;

namespace {

double sum_of_squares(const std::vector<double>& probs) {
    double sum = 0.0;
    for (double p : probs) sum += p * p;
    return sum;
}

double shannon(const std::vector<double>& probs) {
    double h = 0.0;
    for (double p : probs) {
        if (p > kProbabilityFloor) h -= p * std::log2(p);
    }
    return h;
}

} // namespace

std::vector<double> probabilities(const StateVector& state) {
    std::vector<double> out;
    out.reserve(state.size());
    for (const auto& amp : state) out.push_back(std::norm(amp));
    return out;
}

double purity(const StateVector& state) {
    if (state.empty()) return 1.0;
    return sum_of_squares(probabilities(state));
}

double distribution_entropy(const StateVector& state) {
    return shannon(probabilities(state));
}

double linear_entropy(const StateVector& state) {
    return 1.0 - purity(state);
}

double participation_ratio(const StateVector& state) {
    const double sum = sum_of_squares(probabilities(state));
    return sum < kProbabilityFloor ? 1.0 : 1.0 / sum;
}

double effective_dimension(const StateVector& state) {
    const double p = purity(state);
    return p < kProbabilityFloor ? 1.0 : 1.0 / p;
}

double subsystem_entropy(const quantum::DensityMatrix& rho) {
    double s = 0.0;
    for (double lambda : quantum::hermitian_eigenvalues(rho.matrix())) {
        if (lambda > kProbabilityFloor) s -= lambda * std::log2(lambda);
    }
    return s;
}

double l1_coherence(const StateVector& state) {
    double magnitude_sum = 0.0;
    double probability_sum = 0.0;
    for (const auto& amp : state) {
        magnitude_sum += std::abs(amp);
        probability_sum += std::norm(amp);
    }
    return magnitude_sum - std::sqrt(probability_sum);
}

double relative_entropy_coherence(const StateVector& state) {
    if (state.empty()) return 0.0;
    return std::log2(static_cast<double>(state.size())) - distribution_entropy(state);
}

double fidelity(const StateVector& reference, const StateVector& state) {
    if (reference.size() != state.size()) {
        throw MalformedCircuit(fmt::format("Reference state has dimension {}, expected {}",
                                           reference.size(), state.size()));
    }
    return std::norm(quantum::inner_product(reference, state));
}

double trace_distance(const StateVector& reference, const StateVector& state) {
    return std::sqrt(std::max(0.0, 1.0 - fidelity(reference, state)));
}

EntanglementProfile entanglement_profile(const StateVector& state, int num_qubits) {
    EntanglementProfile profile;
    profile.qubit_entropy.reserve(static_cast<size_t>(num_qubits));

    for (int q = 0; q < num_qubits; ++q) {
        const auto rho = quantum::reduce_qubit(state, num_qubits, q);
        quantum::check_density(rho);
        profile.qubit_entropy.push_back(subsystem_entropy(rho));
    }

    for (int i = 0; i < num_qubits; ++i) {
        for (int j = i + 1; j < num_qubits; ++j) {
            const auto rho_ij = quantum::reduce_pair(state, num_qubits, i, j);
            quantum::check_density(rho_ij);
            const double s_ij = subsystem_entropy(rho_ij);
            profile.pair_entropy[{i, j}] = s_ij;
            profile.mutual_information[{i, j}] =
                profile.qubit_entropy[i] + profile.qubit_entropy[j] - s_ij;
        }
    }

    if (num_qubits > 0) {
        double total = 0.0;
        for (double s : profile.qubit_entropy) total += s;
        profile.overall = total / num_qubits;
    }
    return profile;
}

MetricsBundle compute_metrics(const StateVector& state, int num_qubits,
                              const std::optional<StateVector>& reference) {
    MetricsBundle m;
    if (state.empty()) return m;

    m.purity = purity(state);
    m.von_neumann_entropy = distribution_entropy(state);
    m.linear_entropy = 1.0 - m.purity;
    m.participation_ratio = participation_ratio(state);
    m.effective_dimension = effective_dimension(state);
    m.entanglement = entanglement_profile(state, num_qubits);
    m.l1_coherence = l1_coherence(state);
    m.relative_entropy_coherence = relative_entropy_coherence(state);

    const StateVector& ref = reference ? *reference : quantum::ground_state(num_qubits);
    m.fidelity = fidelity(ref, state);
    m.trace_distance = trace_distance(ref, state);
    return m;
}

EntanglementAnalysis analyze_entanglement(double measure, int num_qubits) {
    EntanglementAnalysis a;
    a.measure = measure;
    if (num_qubits < 2) {
        a.type = "none";
        a.measure = 0.0;
        a.description = "Single qubit - no entanglement";
        return a;
    }

    if (measure < 0.1) {
        a.type = "separable";
        a.description = "State is approximately separable (product state)";
    } else if (measure < 0.5) {
        a.type = "weakly_entangled";
        a.description = "State shows weak entanglement";
    } else if (measure < 0.9) {
        a.type = "moderately_entangled";
        a.description = "State is moderately entangled";
    } else {
        a.type = "strongly_entangled";
        a.description = "State is strongly entangled";
    }
    a.max_entanglement = std::log2(static_cast<double>(std::min(2, num_qubits)));
    return a;
}

CoherenceMeasures coherence_measures(const StateVector& state) {
    CoherenceMeasures c;
    c.l1_norm_coherence = l1_coherence(state);
    c.relative_entropy_coherence = relative_entropy_coherence(state);
    return c;
}

InformationMetrics information_metrics(const StateVector& state) {
    InformationMetrics info;
    if (state.empty()) return info;

    const auto probs = probabilities(state);
    const size_t n = probs.size();
    info.shannon_entropy = shannon(probs);

    const double collision = sum_of_squares(probs);
    info.renyi_entropy_2 = collision < kProbabilityFloor ? 0.0 : -std::log2(collision);

    if (n > 1) {
        double fisher = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const double x = static_cast<double>(i) / static_cast<double>(n - 1);
            fisher += probs[i] * x * x;
        }
        info.fisher_information = 4.0 * fisher;
    }
    info.max_entropy = std::log2(static_cast<double>(n));
    return info;
}

DistanceMetrics distance_metrics(const StateVector& state) {
    DistanceMetrics d;
    if (state.empty()) return d;

    StateVector ground(state.size(), quantum::Complex(0.0, 0.0));
    ground[0] = quantum::Complex(1.0, 0.0);
    const double amp = 1.0 / std::sqrt(static_cast<double>(state.size()));
    const StateVector uniform(state.size(), quantum::Complex(amp, 0.0));

    d.ground_state_fidelity = fidelity(ground, state);
    d.uniform_state_fidelity = fidelity(uniform, state);
    d.ground_state_trace_distance = trace_distance(ground, state);
    d.uniform_state_trace_distance = trace_distance(uniform, state);
    return d;
}

GeometricMetrics geometric_metrics(const StateVector& state, int num_qubits) {
    GeometricMetrics g;
    if (state.empty() || num_qubits <= 0) return g;

    double purity_sum = 0.0;
    double length_sum = 0.0;
    for (int q = 0; q < num_qubits; ++q) {
        const double p = quantum::reduce_qubit(state, num_qubits, q).purity();
        g.qubit_purity.push_back(p);
        purity_sum += p;
        length_sum += quantum::bloch_vector(state, num_qubits, q).length();
    }
    g.average_qubit_purity = purity_sum / num_qubits;
    g.bloch_length = length_sum / num_qubits;
    if (num_qubits == 1) {
        g.bloch = quantum::bloch_vector(state, num_qubits, 0);
    }
    return g;
}

} // namespace qscope::analytics
