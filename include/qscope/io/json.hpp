/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/engine/result.hpp"
#include "qscope/quantum/circuit.hpp"
#include "qscope/quantum/linalg.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace qscope::io {

using json = nlohmann::json;

/**
 * @brief Reads the gate list of a circuit document.
 *
 * Accepts {"gates": [...]} or a bare array. Missing "gate" defaults to "I",
 * missing "qubit"/"position" to 0. Wrong field types throw MalformedCircuit.
 */
std::vector<quantum::RawGate> parse_gates(const json& doc);

// "H:0:0,X:1:1"; a missing position defaults to the item's index in the list.
std::vector<quantum::RawGate> parse_inline_gates(const std::string& text);

// Array of {"real","imag"} objects, [re, im] pairs or plain numbers.
quantum::StateVector parse_state_vector(const json& doc);

// Applies doc["options"] (include_gate_matrices, include_narration, backend, reference).
void apply_options(const json& doc, engine::SimulationOptions& options);

json complex_to_json(const quantum::Complex& z);
json matrix_to_json(const quantum::Matrix& m);

json to_json(const engine::SimulationResult& result);
json to_json(const engine::FinalResult& result);

// Ground-state placeholder carrying the error message.
json fallback_result(const std::string& message);

} // namespace qscope::io
