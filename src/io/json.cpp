/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/io/json.hpp"
#include "qscope/config/validator.hpp"
#include "qscope/errors.hpp"

#include <fmt/format.h>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace qscope::io {

namespace {

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, sep)) parts.push_back(trim(item));
    return parts;
}

int int_field(const json& item, const char* key, std::size_t index) {
    if (!item.contains(key)) return 0;
    const auto& v = item.at(key);
    if (!v.is_number_integer()) {
        throw MalformedCircuit(fmt::format("Gate {}: '{}' must be an integer", index, key));
    }
    constexpr auto lo = std::numeric_limits<int>::min();
    constexpr auto hi = std::numeric_limits<int>::max();
    const bool in_range = v.is_number_unsigned()
        ? v.get<std::uint64_t>() < static_cast<std::uint64_t>(hi)
        : v.get<std::int64_t>() >= lo && v.get<std::int64_t>() < hi;
    if (!in_range) {
        throw MalformedCircuit(fmt::format("Gate {}: '{}' is out of range ({})", index, key, v.dump()));
    }
    return static_cast<int>(v.get<std::int64_t>());
}

bool bool_option(const json& options, const char* key, bool current) {
    if (!options.contains(key)) return current;
    const auto& v = options.at(key);
    if (!v.is_boolean()) throw MalformedCircuit(fmt::format("Option '{}' must be a boolean", key));
    return v.get<bool>();
}

std::string pair_key(const analytics::QubitPair& p) {
    return fmt::format("{}-{}", p.first, p.second);
}

json bloch_to_json(const quantum::BlochVector& b) {
    return json{{"x", b.x}, {"y", b.y}, {"z", b.z}};
}

json bloch_map_to_json(const std::vector<quantum::BlochVector>& vectors) {
    json out = json::object();
    for (std::size_t q = 0; q < vectors.size(); ++q) {
        out[std::to_string(q)] = bloch_to_json(vectors[q]);
    }
    return out;
}

json metrics_to_json(const analytics::MetricsBundle& m) {
    json subsystem = json::object();
    for (const auto& [pair, s] : m.entanglement.pair_entropy) subsystem[pair_key(pair)] = s;
    json mutual = json::object();
    for (const auto& [pair, mi] : m.entanglement.mutual_information) mutual[pair_key(pair)] = mi;

    return json{
        {"purity", m.purity},
        {"von_neumann_entropy", m.von_neumann_entropy},
        {"linear_entropy", m.linear_entropy},
        {"participation_ratio", m.participation_ratio},
        {"effective_dimension", m.effective_dimension},
        {"entanglement", m.entanglement.overall},
        {"entanglement_entropy", m.entanglement.qubit_entropy},
        {"subsystem_entropy", subsystem},
        {"mutual_information", mutual},
        {"l1_coherence", m.l1_coherence},
        {"relative_entropy_coherence", m.relative_entropy_coherence},
        {"fidelity", m.fidelity},
        {"trace_distance", m.trace_distance},
    };
}

json narration_to_json(const narration::StepNarration& n) {
    json phases = json::array();
    for (const auto& p : n.phase_changes) {
        phases.push_back({{"basis_state", "|" + p.basis_state + "⟩"}, {"phase_change", p.phase_change}});
    }
    return json{
        {"gate_type", n.gate.symbol},
        {"target_qubit", n.target_qubit},
        {"mathematical_operation", {
            {"description", n.operation},
            {"matrix_representation", n.gate.matrix_literal},
            {"action_on_basis", n.gate.basis_action},
        }},
        {"physical_interpretation", {
            {"description", n.gate.physical_effect},
            {"bloch_sphere_action", n.gate.bloch_action},
        }},
        {"bloch_sphere_movement", {
            {"axis", n.gate.movement.axis},
            {"angle", n.gate.movement.angle},
            {"description", n.gate.movement.description},
        }},
        {"phase_information", {{"phase_changes", phases}}},
        {"entanglement_impact", {
            {"type", n.entanglement.type},
            {"description", n.entanglement.description},
        }},
    };
}

json changes_to_json(const narration::StateChanges& c) {
    json amplitudes = json::array();
    for (const auto& a : c.amplitude_changes) {
        amplitudes.push_back({
            {"basis_state", a.basis_state},
            {"before_probability", a.before_probability},
            {"after_probability", a.after_probability},
            {"probability_change", a.probability_change},
            {"before_magnitude", a.before_magnitude},
            {"after_magnitude", a.after_magnitude},
            {"phase_change", a.phase_change},
        });
    }
    return json{
        {"fidelity", c.fidelity},
        {"amplitude_changes", amplitudes},
        {"total_probability_change", c.total_probability_change},
    };
}

json step_to_json(const engine::SimulationStep& s) {
    json j;
    j["step"] = s.index;
    if (s.gate) {
        j["operation"] = quantum::gate_symbol(s.gate->kind);
        j["qubit"] = s.gate->qubit;
        j["position"] = s.gate->position;
    } else {
        j["operation"] = "initialization";
    }

    json state = json::array();
    json amplitudes = json::array();
    for (const auto& a : s.amplitudes) {
        state.push_back({
            {"index", a.index},
            {"amplitude", complex_to_json(s.state[a.index])},
            {"probability", a.probability},
            {"basis_state", a.basis_state},
        });
        amplitudes.push_back({
            {"index", a.index},
            {"magnitude", a.magnitude},
            {"phase", a.phase},
            {"probability", a.probability},
            {"real", a.real},
            {"imaginary", a.imag},
            {"basis_state", a.basis_state},
        });
    }
    j["state_vector"] = state;
    j["bloch_vectors"] = bloch_map_to_json(s.bloch);
    j["probability_amplitudes"] = amplitudes;
    j["measurement_probabilities"] = s.probabilities;
    if (s.gate_matrix) j["gate_matrix"] = matrix_to_json(*s.gate_matrix);
    if (s.narration) j["narration"] = narration_to_json(*s.narration);
    if (s.changes) j["state_changes"] = changes_to_json(*s.changes);
    j["explanation"] = s.explanation;
    j["metrics"] = metrics_to_json(s.metrics);
    return j;
}

json statistics_to_json(const analytics::CircuitStatistics& s) {
    return json{
        {"total_gates", s.total_gates},
        {"gate_counts", s.gate_counts},
        {"circuit_depth", s.depth},
        {"num_qubits", s.num_qubits},
        {"density", s.density},
        {"parallelization_factor", s.parallelization_factor},
        {"complexity_class", s.complexity_class},
        {"estimated_execution_time", s.estimated_execution_time},
        {"resource_requirements", {
            {"qubits", s.resources.qubits},
            {"gates", s.resources.gates},
            {"memory", s.resources.memory},
            {"time_complexity", s.resources.time_complexity},
        }},
        {"optimization_suggestions", s.optimization_suggestions},
    };
}

} // namespace

std::vector<quantum::RawGate> parse_gates(const json& doc) {
    const json* list = &doc;
    if (doc.is_object()) {
        if (!doc.contains("gates")) return {};
        list = &doc.at("gates");
    }
    if (!list->is_array()) throw MalformedCircuit("'gates' must be an array");

    std::vector<quantum::RawGate> gates;
    gates.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& item = (*list)[i];
        if (!item.is_object()) throw MalformedCircuit(fmt::format("Gate {}: expected an object", i));

        quantum::RawGate g;
        if (item.contains("gate")) {
            if (!item.at("gate").is_string()) {
                throw MalformedCircuit(fmt::format("Gate {}: 'gate' must be a string", i));
            }
            g.kind = item.at("gate").get<std::string>();
        }
        g.qubit = int_field(item, "qubit", i);
        g.position = int_field(item, "position", i);
        gates.push_back(std::move(g));
    }
    return gates;
}

std::vector<quantum::RawGate> parse_inline_gates(const std::string& text) {
    std::vector<quantum::RawGate> gates;
    for (const auto& item : split(text, ',')) {
        if (item.empty()) continue;
        const auto fields = split(item, ':');
        if (fields.size() < 2 || fields.size() > 3) {
            throw MalformedCircuit(fmt::format("Invalid gate '{}': expected KIND:QUBIT[:POSITION]", item));
        }
        quantum::RawGate g;
        g.kind = fields[0];
        std::string err;
        if (!config::parse_int(fields[1], g.qubit, err)) {
            throw MalformedCircuit(fmt::format("Invalid gate '{}': {}", item, err));
        }
        g.position = static_cast<int>(gates.size());
        if (fields.size() == 3 && !config::parse_int(fields[2], g.position, err)) {
            throw MalformedCircuit(fmt::format("Invalid gate '{}': {}", item, err));
        }
        gates.push_back(std::move(g));
    }
    return gates;
}

quantum::StateVector parse_state_vector(const json& doc) {
    if (!doc.is_array()) throw MalformedCircuit("Reference state must be an array");

    quantum::StateVector state;
    state.reserve(doc.size());
    for (const auto& v : doc) {
        if (v.is_number()) {
            state.emplace_back(v.get<double>(), 0.0);
        } else if (v.is_object() && v.contains("real") && v.at("real").is_number()) {
            const double im = v.contains("imag") && v.at("imag").is_number() ? v.at("imag").get<double>() : 0.0;
            state.emplace_back(v.at("real").get<double>(), im);
        } else if (v.is_array() && v.size() == 2 && v[0].is_number() && v[1].is_number()) {
            state.emplace_back(v[0].get<double>(), v[1].get<double>());
        } else {
            throw MalformedCircuit(fmt::format("Invalid amplitude in reference state: {}", v.dump()));
        }
    }
    return state;
}

void apply_options(const json& doc, engine::SimulationOptions& options) {
    if (!doc.is_object() || !doc.contains("options")) return;
    const auto& o = doc.at("options");
    if (!o.is_object()) throw MalformedCircuit("'options' must be an object");

    options.include_gate_matrices = bool_option(o, "include_gate_matrices", options.include_gate_matrices);
    options.include_narration = bool_option(o, "include_narration", options.include_narration);
    if (o.contains("backend")) {
        if (!o.at("backend").is_string()) throw MalformedCircuit("Option 'backend' must be a string");
        try {
            options.backend = quantum::EvolverFactory::parse_backend(o.at("backend").get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw MalformedCircuit(e.what());
        }
    }
    if (o.contains("reference")) options.reference = parse_state_vector(o.at("reference"));
}

json complex_to_json(const quantum::Complex& z) {
    return json{{"real", z.real()}, {"imag", z.imag()}};
}

json matrix_to_json(const quantum::Matrix& m) {
    json rows = json::array();
    for (std::size_t r = 0; r < m.dim(); ++r) {
        json row = json::array();
        for (std::size_t c = 0; c < m.dim(); ++c) row.push_back(complex_to_json(m(r, c)));
        rows.push_back(std::move(row));
    }
    return rows;
}

json to_json(const engine::SimulationResult& result) {
    json steps = json::array();
    for (const auto& s : result.steps) steps.push_back(step_to_json(s));

    const auto& ea = result.entanglement_analysis;
    const auto& g = result.geometric;
    json geometric{
        {"qubit_purities", g.qubit_purity},
        {"average_qubit_purity", g.average_qubit_purity},
        {"bloch_vector_length", g.bloch_length},
    };
    if (g.bloch) geometric["bloch_vector"] = bloch_to_json(*g.bloch);

    return json{
        {"num_qubits", result.num_qubits},
        {"steps", steps},
        {"final_metrics", metrics_to_json(result.final_metrics)},
        {"entanglement_analysis", {
            {"type", ea.type},
            {"measure", ea.measure},
            {"description", ea.description},
            {"max_entanglement", ea.max_entanglement},
        }},
        {"coherence_measures", {
            {"l1_norm_coherence", result.coherence.l1_norm_coherence},
            {"relative_entropy_coherence", result.coherence.relative_entropy_coherence},
            {"coherence_basis", result.coherence.coherence_basis},
        }},
        {"information_metrics", {
            {"shannon_entropy", result.information.shannon_entropy},
            {"renyi_entropy_2", result.information.renyi_entropy_2},
            {"fisher_information", result.information.fisher_information},
            {"max_entropy", result.information.max_entropy},
        }},
        {"distance_metrics", {
            {"ground_state_fidelity", result.distance.ground_state_fidelity},
            {"uniform_state_fidelity", result.distance.uniform_state_fidelity},
            {"ground_state_trace_distance", result.distance.ground_state_trace_distance},
            {"uniform_state_trace_distance", result.distance.uniform_state_trace_distance},
        }},
        {"geometric_metrics", geometric},
        {"circuit_statistics", statistics_to_json(result.statistics)},
    };
}

json to_json(const engine::FinalResult& result) {
    return json{
        {"num_qubits", result.num_qubits},
        {"bloch_vectors", bloch_map_to_json(result.bloch)},
        {"purity", result.purity},
        {"fidelity", result.fidelity},
        {"entanglement", result.entanglement},
        {"measurement_probabilities", result.probabilities},
    };
}

json fallback_result(const std::string& message) {
    json step{
        {"step", 0},
        {"operation", "error"},
        {"explanation", "Simulation error: " + message},
        {"state_vector", json::array({{
            {"index", 0},
            {"amplitude", complex_to_json({1.0, 0.0})},
            {"probability", 1.0},
            {"basis_state", "0"},
        }})},
        {"bloch_vectors", {{"0", bloch_to_json(quantum::BlochVector{})}}},
        {"probability_amplitudes", json::array({{
            {"index", 0},
            {"magnitude", 1.0},
            {"phase", 0.0},
            {"probability", 1.0},
        }})},
        {"measurement_probabilities", json::array({1.0})},
    };
    return json{
        {"steps", json::array({step})},
        {"final_metrics", {
            {"purity", 1.0},
            {"entanglement", 0.0},
            {"fidelity", 1.0},
            {"error", message},
        }},
        {"entanglement_analysis", {{"type", "error"}, {"measure", 0.0}}},
        {"coherence_measures", {{"l1_norm_coherence", 0.0}}},
        {"circuit_statistics", {{"total_gates", 0}, {"circuit_depth", 0}, {"num_qubits", 1}}},
        {"error", message},
    };
}

} // namespace qscope::io
