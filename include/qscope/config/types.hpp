#pragma once

#include <optional>
#include <string>

namespace qscope::config {

struct EngineConfig {
    int max_qubits{10};
    int max_gates{100};
    int matrix_qubit_limit{5};   // full-system gate matrices only up to this many qubits
    bool include_gate_matrices{true};
    bool include_narration{true};
    std::string backend{"kronecker"};
};

// Values given on the command line; applied last.
struct ConfigOverrides {
    std::optional<int> max_qubits;
    std::optional<int> max_gates;
    std::optional<std::string> backend;
    bool no_matrices{false};
    bool no_narration{false};
};

struct RunRequest {
    std::optional<std::string> circuit_path;
    std::optional<std::string> inline_gates;  // "H:0:0,X:1:1"
    std::optional<std::string> reference_path;
    bool final_only{false};
    int indent{2};
    ConfigOverrides overrides;
};

struct ParseResult {
    std::optional<RunRequest> request; // present when arguments are valid
    std::string config_path{"qscope.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace qscope::config
