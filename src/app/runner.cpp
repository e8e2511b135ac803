#include <qscope/app/runner.hpp>

#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

#include <fmt/core.h>

#include <qscope/config/loader.hpp>
#include <qscope/engine/simulator.hpp>
#include <qscope/errors.hpp>
#include <qscope/io/json.hpp>

namespace qscope::app {

using qscope::io::json;

static json parse_document(const std::string& text, const std::string& what) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedCircuit(fmt::format("Invalid {}: {}", what, e.what()));
    }
}

static void write_json(std::ostream& out, const json& j, int indent) {
    out << j.dump(indent) << '\n';
}

std::optional<qscope::config::EngineConfig> resolve_config(const std::string& config_path,
                                                           const qscope::config::ConfigOverrides& overrides,
                                                           qscope::logging::Logger& log) {
    qscope::config::EngineConfig cfg;
    auto errs = qscope::config::load_from_file(cfg, config_path);
    auto env_errs = qscope::config::apply_env_overrides(cfg);
    errs.insert(errs.end(), env_errs.begin(), env_errs.end());
    qscope::config::apply_cli_overrides(cfg, overrides);
    auto final_errs = qscope::config::validate_final(cfg);
    errs.insert(errs.end(), final_errs.begin(), final_errs.end());

    if (!errs.empty()) {
        for (const auto& e : errs) log.error(fmt::format("Config: {}", e));
        return std::nullopt;
    }
    log.debug(fmt::format("Config: max_qubits={} max_gates={} backend={} matrices={} narration={}",
                          cfg.max_qubits, cfg.max_gates, cfg.backend,
                          cfg.include_gate_matrices, cfg.include_narration));
    return cfg;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) throw std::runtime_error(fmt::format("Cannot open {}", path));
    std::stringstream buffer; buffer << in.rdbuf();
    return buffer.str();
}

int run(const qscope::config::RunRequest& request, const qscope::config::EngineConfig& cfg,
        qscope::logging::Logger& log, std::ostream& out) {
    try {
        const qscope::engine::Simulator simulator(cfg, log);
        auto options = simulator.default_options();

        std::vector<qscope::quantum::RawGate> gates;
        if (request.circuit_path) {
            const json doc = parse_document(read_file(*request.circuit_path), "circuit document");
            gates = qscope::io::parse_gates(doc);
            qscope::io::apply_options(doc, options);
        } else if (request.inline_gates) {
            gates = qscope::io::parse_inline_gates(*request.inline_gates);
        }
        if (request.reference_path) {
            const json doc = parse_document(read_file(*request.reference_path), "reference state");
            options.reference = qscope::io::parse_state_vector(doc);
        }

        log.debug(fmt::format("Simulating {} gates", gates.size()));
        if (request.final_only) {
            write_json(out, qscope::io::to_json(simulator.simulate_final(gates, options.reference)),
                       request.indent);
        } else {
            write_json(out, qscope::io::to_json(simulator.simulate(gates, options)), request.indent);
        }
        return 0;
    } catch (const InternalInvariantViolation& e) {
        log.error(fmt::format("Internal invariant violated: {}", e.what()));
        write_json(out, qscope::io::fallback_result("Internal simulation failure"), request.indent);
        return 2;
    } catch (const EngineError& e) {
        log.error(e.what());
        write_json(out, qscope::io::fallback_result(e.what()), request.indent);
        return 1;
    } catch (const std::runtime_error& e) {
        log.error(e.what());
        write_json(out, qscope::io::fallback_result(e.what()), request.indent);
        return 1;
    } catch (const std::logic_error& e) {
        log.error(fmt::format("Internal error: {}", e.what()));
        write_json(out, qscope::io::fallback_result("Internal simulation failure"), request.indent);
        return 2;
    }
}

} // namespace qscope::app
