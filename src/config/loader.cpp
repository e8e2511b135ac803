#include <qscope/config/loader.hpp>

#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <qscope/config/validator.hpp>

namespace qscope::config {

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static void set_int(int& field, const std::string& key, const std::string& val,
                    std::vector<std::string>& errs) {
    std::string e;
    int v = 0;
    if (parse_int(val, v, e)) field = v;
    else errs.push_back(fmt::format("{}: {}", key, e));
}

static void set_bool(bool& field, const std::string& key, const std::string& val,
                     std::vector<std::string>& errs) {
    std::string e;
    bool v = false;
    if (parse_bool(val, v, e)) field = v;
    else errs.push_back(fmt::format("{}: {}", key, e));
}

static std::vector<std::string> load_key_value(EngineConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (key == "max_qubits") set_int(cfg.max_qubits, key, val, errs);
        else if (key == "max_gates") set_int(cfg.max_gates, key, val, errs);
        else if (key == "matrix_qubit_limit") set_int(cfg.matrix_qubit_limit, key, val, errs);
        else if (key == "include_gate_matrices") set_bool(cfg.include_gate_matrices, key, val, errs);
        else if (key == "include_narration") set_bool(cfg.include_narration, key, val, errs);
        else if (key == "backend") cfg.backend = val;
    }
    return errs;
}

static bool is_integer(const nlohmann::json& v) { return v.is_number_integer(); }
static bool is_boolean(const nlohmann::json& v) { return v.is_boolean(); }
static bool is_string(const nlohmann::json& v) { return v.is_string(); }

static std::vector<std::string> load_json(EngineConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) {
        errs.push_back("config must be a JSON object");
        return errs;
    }
    auto expect = [&](const char* key, bool (*ok)(const nlohmann::json&), const char* what) {
        if (j.contains(key) && !ok(j.at(key))) errs.push_back(fmt::format("'{}' must be {}", key, what));
    };
    expect("max_qubits", is_integer, "an integer");
    expect("max_gates", is_integer, "an integer");
    expect("matrix_qubit_limit", is_integer, "an integer");
    expect("include_gate_matrices", is_boolean, "a boolean");
    expect("include_narration", is_boolean, "a boolean");
    expect("backend", is_string, "a string");
    if (!errs.empty()) return errs;

    if (j.contains("max_qubits")) cfg.max_qubits = j.at("max_qubits").get<int>();
    if (j.contains("max_gates")) cfg.max_gates = j.at("max_gates").get<int>();
    if (j.contains("matrix_qubit_limit")) cfg.matrix_qubit_limit = j.at("matrix_qubit_limit").get<int>();
    if (j.contains("include_gate_matrices")) cfg.include_gate_matrices = j.at("include_gate_matrices").get<bool>();
    if (j.contains("include_narration")) cfg.include_narration = j.at("include_narration").get<bool>();
    if (j.contains("backend")) cfg.backend = j.at("backend").get<std::string>();
    return errs;
}

std::vector<std::string> load_from_file(EngineConfig& cfg, const std::string& path) {
    std::vector<std::string> errs;
    std::ifstream in(path);
    if (!in.good()) return errs; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    std::string text = buffer.str();
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        try {
            return load_json(cfg, text);
        } catch (const nlohmann::json::exception& ex) {
            errs.push_back(fmt::format("Failed to read {}: {}", path, ex.what()));
        }
    } else {
        return load_key_value(cfg, text);
    }
    return errs;
}

std::vector<std::string> apply_env_overrides(EngineConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("QSCOPE_MAX_QUBITS")) set_int(cfg.max_qubits, "QSCOPE_MAX_QUBITS", v, errs);
    if (const char* v = std::getenv("QSCOPE_MAX_GATES"))  set_int(cfg.max_gates, "QSCOPE_MAX_GATES", v, errs);
    if (const char* v = std::getenv("QSCOPE_BACKEND"))    cfg.backend = v;
    return errs;
}

void apply_cli_overrides(EngineConfig& cfg, const ConfigOverrides& overrides) {
    if (overrides.max_qubits) cfg.max_qubits = *overrides.max_qubits;
    if (overrides.max_gates) cfg.max_gates = *overrides.max_gates;
    if (overrides.backend) cfg.backend = *overrides.backend;
    if (overrides.no_matrices) cfg.include_gate_matrices = false;
    if (overrides.no_narration) cfg.include_narration = false;
}

std::vector<std::string> validate_final(const EngineConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!validate_range("max_qubits", cfg.max_qubits, 1, 20, e)) errs.push_back(e);
    if (!validate_range("max_gates", cfg.max_gates, 0, INT_MAX, e)) errs.push_back(e);
    if (!validate_range("matrix_qubit_limit", cfg.matrix_qubit_limit, 0, 20, e)) errs.push_back(e);
    if (!is_known_backend(cfg.backend, e)) errs.push_back(e);
    return errs;
}

} // namespace qscope::config
