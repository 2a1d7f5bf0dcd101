//
//  process_util.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "process_util.hpp"

#include <cerrno>
#include <cstdio>
#include <sys/wait.h>
#include <system_error>

#include "logging.hpp"

namespace reelforge {

std::string shell_quote(const std::string &arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string join_command(const std::vector<std::string> &argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) {
            cmd += ' ';
        }
        cmd += shell_quote(argv[i]);
    }
    return cmd;
}

int run_capture(const std::string &command, std::string &output) {
    RF_LOG("debug", "exec: " << command);
    FILE *pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        RF_LOG("error", "popen failed errno=" << errno << " ("
                                              << std::generic_category().message(errno) << ")");
        return -1;
    }
    char buffer[4096];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    const int status = ::pclose(pipe);
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

}  // namespace reelforge
