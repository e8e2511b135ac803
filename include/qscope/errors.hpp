/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace qscope {

/**
 * Base class for every error raised by the simulation engine.
 * Collaborators catch this type to map engine failures to a fallback result.
 */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unsupported gate token, negative qubit/position, bad reference state.
class MalformedCircuit : public EngineError {
public:
    using EngineError::EngineError;
};

// Qubit or gate count above the configured ceiling. Raised before allocation.
class ResourceLimitExceeded : public EngineError {
public:
    using EngineError::EngineError;
};

// Numerical invariant broken inside the engine (norm drift, non-Hermitian
// reduced state). Never a user error.
class InternalInvariantViolation : public EngineError {
public:
    using EngineError::EngineError;
};

} // namespace qscope
