//
//  compile_status.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace reelforge {

enum class ErrorKind {
    None,
    ValidationError,
    AssetUnavailableError,
    TimelineGapError,
    TimelineOverlapError,
    UnfeasibleTimingError,
    InternalConsistencyError,
};

const char *to_string(ErrorKind kind);

/// One broken rule, tied to the entity that broke it.
struct Violation {
    std::string entity;  ///< Entity id (e.g. "clip-2") or "spec"
    std::string rule;    ///< Short rule key, e.g. "zero-length"
    std::string message;
};

/**
 * @brief Result of a compile stage.
 *
 * When `ok == true`, `kind` is `None` and `message` is empty. On failure,
 * `message` summarizes the error and `violations` lists every offending
 * entity (validation reports all of them, other stages usually one).
 */
struct CompileStatus {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::vector<Violation> violations;
};

inline CompileStatus make_ok() { return CompileStatus{}; }

inline CompileStatus make_error(ErrorKind kind, std::string message,
                                std::vector<Violation> violations = {}) {
    return CompileStatus{false, kind, std::move(message), std::move(violations)};
}

// Human readable multi-line rendering ("kind: message" + one line per violation).
std::string describe(const CompileStatus &status);

}  // namespace reelforge
