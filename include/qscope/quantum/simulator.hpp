/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include "qscope/quantum/circuit.hpp"
#include "qscope/quantum/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace qscope::quantum {

/**
 * Applies one gate to a state vector in place.
 * Implementations hold no state between calls.
 */
class IStateEvolver {
public:
    virtual ~IStateEvolver() = default;

    virtual void apply(const GateSpec& gate, int num_qubits, StateVector& state) const = 0;
    virtual std::string backend_name() const = 0;
};

/**
 * Factory for creating state evolvers
 */
class EvolverFactory {
public:
    enum class Backend {
        KRONECKER,  // full 2^n x 2^n operator built by tensor product
        STRIDED     // in-place update of amplitude pairs differing in the target bit
    };

    static std::unique_ptr<IStateEvolver> create(Backend backend);
    static std::vector<Backend> available_backends();
    static std::string backend_name(Backend backend);

    // "kronecker" / "strided", case-insensitive. Throws std::invalid_argument.
    static Backend parse_backend(const std::string& name);
};

} // namespace qscope::quantum
