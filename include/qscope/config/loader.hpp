#pragma once

#include <string>
#include <vector>

#include <qscope/config/types.hpp>

namespace qscope::config {

// Read configuration from file (JSON or key=value). Returns list of errors (empty if ok).
std::vector<std::string> load_from_file(EngineConfig& cfg, const std::string& path);

// Apply QSCOPE_* environment variables (MAX_QUBITS, MAX_GATES, BACKEND) on top of current cfg.
std::vector<std::string> apply_env_overrides(EngineConfig& cfg);

void apply_cli_overrides(EngineConfig& cfg, const ConfigOverrides& overrides);

// Validate final config (limits in range, known backend). Returns list of errors.
std::vector<std::string> validate_final(const EngineConfig& cfg);

} // namespace qscope::config
