#pragma once

#include <qscope/config/types.hpp>
#include <qscope/logging/logger.hpp>

namespace qscope::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
qscope::config::ParseResult parse(int argc, char** argv, qscope::logging::Logger& log);

} // namespace qscope::cli
