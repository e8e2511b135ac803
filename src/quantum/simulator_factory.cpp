/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "qscope/quantum/simulator.hpp"
#include "qscope/quantum/cpu_evolver.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace qscope::quantum {

std::unique_ptr<IStateEvolver> EvolverFactory::create(Backend backend) {
    switch (backend) {
        case Backend::KRONECKER:
            return std::make_unique<KroneckerEvolver>();

        case Backend::STRIDED:
            return std::make_unique<StridedEvolver>();
    }
    throw std::runtime_error("Unknown evolver backend");
}

std::vector<EvolverFactory::Backend> EvolverFactory::available_backends() {
    return {Backend::KRONECKER, Backend::STRIDED};
}

std::string EvolverFactory::backend_name(Backend backend) {
    switch (backend) {
        case Backend::KRONECKER:
            return "KRONECKER";
        case Backend::STRIDED:
            return "STRIDED";
    }
    return "UNKNOWN";
}

EvolverFactory::Backend EvolverFactory::parse_backend(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (Backend b : available_backends()) {
        if (backend_name(b) == upper) return b;
    }
    throw std::invalid_argument("Unknown evolver backend: " + name);
}

} // namespace qscope::quantum
