//
//  compile_status.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "compile_status.hpp"

#include <sstream>

namespace reelforge {

const char *to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::ValidationError:
            return "ValidationError";
        case ErrorKind::AssetUnavailableError:
            return "AssetUnavailableError";
        case ErrorKind::TimelineGapError:
            return "TimelineGapError";
        case ErrorKind::TimelineOverlapError:
            return "TimelineOverlapError";
        case ErrorKind::UnfeasibleTimingError:
            return "UnfeasibleTimingError";
        case ErrorKind::InternalConsistencyError:
            return "InternalConsistencyError";
    }
    return "Unknown";
}

std::string describe(const CompileStatus &status) {
    if (status.ok) {
        return "ok";
    }
    std::ostringstream oss;
    oss << to_string(status.kind) << ": " << status.message;
    for (const auto &v : status.violations) {
        oss << "\n  - [" << v.entity << "] " << v.rule << ": " << v.message;
    }
    return oss.str();
}

}  // namespace reelforge
