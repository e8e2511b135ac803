#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include <qscope/config/types.hpp>
#include <qscope/logging/logger.hpp>

namespace qscope::app {

// Defaults, then config file, then QSCOPE_* environment, then CLI. Logs every
// error and returns nullopt when the result is not usable.
std::optional<qscope::config::EngineConfig> resolve_config(const std::string& config_path,
                                                           const qscope::config::ConfigOverrides& overrides,
                                                           qscope::logging::Logger& log);

// Whole file as a string. Throws std::runtime_error when it cannot be opened.
std::string read_file(const std::string& path);

/**
 * Runs one request and writes the JSON result to `out`.
 *
 * Engine errors are logged and replaced by a fallback result. Returns 0 on
 * success, 1 for rejected input and 2 for an internal failure.
 */
int run(const qscope::config::RunRequest& request, const qscope::config::EngineConfig& cfg,
        qscope::logging::Logger& log, std::ostream& out);

} // namespace qscope::app
