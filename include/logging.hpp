//
//  logging.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace reelforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Map a CLI level name onto a verbosity; unknown names yield Error.
LogVerbosity parse_log_verbosity(const std::string &name);

// Fixed-precision seconds used in log lines so timeline values line up.
inline std::string fmt_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << seconds << "s";
    return oss.str();
}

}  // namespace reelforge

inline constexpr reelforge::LogVerbosity rf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return reelforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return reelforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return reelforge::LogVerbosity::Info;
    }
    // Everything else (probe/timeline/mix/etc.) treated as debug-level.
    return reelforge::LogVerbosity::Debug;
}

inline bool rf_should_log(const char *level) {
    const auto current = reelforge::get_log_verbosity();
    const auto sev = rf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void rf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[ReelForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[ReelForge][" << level << "] " << msg << std::endl;
    }
}

#define RF_LOG(level, message)                                              \
    do {                                                                    \
        if (rf_should_log(level)) {                                         \
            std::ostringstream _rf_log_ss;                                  \
            _rf_log_ss << message;                                          \
            rf_log_impl(level, _rf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
