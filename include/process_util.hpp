//
//  process_util.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

namespace reelforge {

// Quote one argument for a POSIX shell (single quotes, embedded ' escaped).
std::string shell_quote(const std::string &arg);

// Join argv into a shell command line, quoting every element.
std::string join_command(const std::vector<std::string> &argv);

// Run a command line through the shell, appending its stdout to `output`.
// Returns the exit code, or -1 when the process could not be started.
int run_capture(const std::string &command, std::string &output);

}  // namespace reelforge
