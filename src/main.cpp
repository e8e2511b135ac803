/*
 * qscope command-line driver
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <iostream>

#include <qscope/app/runner.hpp>
#include <qscope/cli/args.hpp>
#include <qscope/logging/fmt_logger.hpp>

int main(int argc, char** argv) {
    qscope::logging::FmtLogger log;
    auto parsed = qscope::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.request.has_value()) {
        return 1;
    }
    log.set_debug(parsed.debug);

    const auto& request = *parsed.request;
    auto cfg = qscope::app::resolve_config(parsed.config_path, request.overrides, log);
    if (!cfg.has_value()) {
        return 1;
    }
    return qscope::app::run(request, *cfg, log, std::cout);
}
