#include <qscope/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef QSCOPE_VERSION
#define QSCOPE_VERSION "0.0.0"
#endif

namespace qscope::cli {

qscope::config::ParseResult parse(int argc, char** argv, qscope::logging::Logger& log) {
    qscope::config::ParseResult pr;
    cxxopts::Options options("qscope", "Step-by-step state-vector simulation and analytics");
    options.add_options()
        ("circuit",    "Circuit JSON file ({\"gates\": [...], \"options\": {...}})", cxxopts::value<std::string>())
        ("gates",      "Inline gates KIND:QUBIT[:POSITION], comma separated", cxxopts::value<std::string>())
        ("final",      "Print only the final-state summary")
        ("reference",  "JSON file with the reference state vector", cxxopts::value<std::string>())
        ("config",     "Path to config file (qscope.conf)", cxxopts::value<std::string>()->default_value("qscope.conf"))
        ("max-qubits", "Maximum number of qubits", cxxopts::value<int>())
        ("max-gates",  "Maximum number of gates", cxxopts::value<int>())
        ("backend",    "State evolver (kronecker|strided)", cxxopts::value<std::string>())
        ("no-matrices",  "Omit full-system gate matrices")
        ("no-narration", "Omit per-step narration")
        ("indent",     "JSON indentation (-1 for compact)", cxxopts::value<int>()->default_value("2"))
        ("d,debug",    "Enable debug logging")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("qscope v{}", QSCOPE_VERSION));
            pr.show_only = true;
            return pr;
        }
        if (result.count("circuit") && result.count("gates")) {
            log.error(fmt::format("Use either --circuit or --gates, not both\n\n{}", options.help()));
            return pr;
        }
        if (!result.count("circuit") && !result.count("gates")) {
            log.error(fmt::format("A circuit is required (--circuit or --gates)\n\n{}", options.help()));
            return pr;
        }

        qscope::config::RunRequest req;
        if (result.count("circuit"))   req.circuit_path = result["circuit"].as<std::string>();
        if (result.count("gates"))     req.inline_gates = result["gates"].as<std::string>();
        if (result.count("reference")) req.reference_path = result["reference"].as<std::string>();
        req.final_only = result.count("final") > 0;
        req.indent = result["indent"].as<int>();
        if (result.count("max-qubits")) req.overrides.max_qubits = result["max-qubits"].as<int>();
        if (result.count("max-gates"))  req.overrides.max_gates = result["max-gates"].as<int>();
        if (result.count("backend"))    req.overrides.backend = result["backend"].as<std::string>();
        req.overrides.no_matrices = result.count("no-matrices") > 0;
        req.overrides.no_narration = result.count("no-narration") > 0;

        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.request = req;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace qscope::cli
