//
//  main.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ffmpeg_encoder.hpp"
#include "logging.hpp"
#include "reelforge.hpp"
#include "reelforge_version.hpp"
#include "spec_loader.hpp"

namespace {

std::optional<double> parse_number(const std::string &s) {
    char *end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (s.empty() || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

// Same ceiling as settings.probe_workers.
constexpr long kMaxJobs = 256;

std::optional<unsigned> parse_jobs(const std::string &s) {
    char *end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || end == nullptr || *end != '\0' || errno == ERANGE || v < 1 ||
        v > kMaxJobs) {
        return std::nullopt;
    }
    return static_cast<unsigned>(v);
}

bool write_text(const std::string &path, const std::string &text) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) return false;
    out << text << "\n";
    return out.good();
}

void print_usage(std::ostream &os) {
    os << "ReelForge " << REELFORGE_VERSION_DISPLAY << "\n"
       << "Copyright (c) 2025 Till Toenshoff\n\n"
       << "usage for rendering:\n"
       << "  reelforge <spec.json> <output.mp4> [options]\n"
       << "usage for planning only:\n"
       << "  reelforge <spec.json> --plan-only [--plan-out FILE]\n"
       << "Options:\n"
       << "  --plan-only             Compile and emit the plan, do not run ffmpeg.\n"
       << "  --print-plan            Write the plan JSON to stdout.\n"
       << "  --plan-out FILE         Write the plan JSON to FILE.\n"
       << "  --jobs N                Concurrent asset probes (default: 4).\n"
       << "  --probe-timeout SECONDS Per-asset probe timeout, 0 disables (default: 30).\n"
       << "  --ffprobe PATH          ffprobe executable (default: ffprobe).\n"
       << "  --ffmpeg PATH           ffmpeg executable (default: ffmpeg).\n"
       << "  --log-level LEVEL       Set logging verbosity (default: info).\n"
       << "  --version, -v           Print the version and exit.\n"
       << "  --help, -h              Print this help and exit.\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "ReelForge " << REELFORGE_VERSION_DISPLAY << "\n";
        return 0;
    }
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        print_usage(std::cout);
        return 0;
    }

    std::vector<std::string> positional;
    bool plan_only = false;
    bool print_plan = false;
    std::string plan_out;
    std::optional<unsigned> jobs;
    std::optional<double> probe_timeout;
    std::string ffprobe_path = "ffprobe";
    reelforge::EncoderOptions encoder;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--plan-only") {
            plan_only = true;
        } else if (arg == "--print-plan") {
            print_plan = true;
        } else if (arg == "--plan-out" && i + 1 < argc) {
            plan_out = argv[++i];
        } else if (arg == "--jobs" && i + 1 < argc) {
            jobs = parse_jobs(argv[++i]);
            if (!jobs) {
                std::cerr << "--jobs expects an integer between 1 and " << kMaxJobs << "\n";
                return 2;
            }
        } else if (arg == "--probe-timeout" && i + 1 < argc) {
            probe_timeout = parse_number(argv[++i]);
            if (!probe_timeout || *probe_timeout < 0) {
                std::cerr << "--probe-timeout expects a non-negative number of seconds\n";
                return 2;
            }
        } else if (arg == "--ffprobe" && i + 1 < argc) {
            ffprobe_path = argv[++i];
        } else if (arg == "--ffmpeg" && i + 1 < argc) {
            encoder.ffmpeg_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            reelforge::set_log_verbosity(reelforge::parse_log_verbosity(argv[++i]));
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage(std::cerr);
        return 2;
    }
    if (positional.size() > 2 || (!plan_only && positional.size() != 2)) {
        std::cerr << "Invalid arguments. See --help for usage.\n";
        return 2;
    }
    const std::string spec_path = positional[0];

    auto loaded = reelforge::load_spec_file(spec_path);
    if (!loaded.status.ok) {
        RF_LOG("error", "reelforge: failed to load spec:\n" << reelforge::describe(loaded.status));
        return 1;
    }
    if (jobs) {
        loaded.spec.options.probe_workers = *jobs;
    }
    if (probe_timeout) {
        loaded.spec.options.probe_timeout = *probe_timeout;
    }

    auto probe = std::make_shared<reelforge::FfprobeMediaProbe>(ffprobe_path);
    auto result = reelforge::compile_spec(loaded.spec, probe);
    if (!result.status.ok) {
        RF_LOG("error", "reelforge: failed to compile:\n" << reelforge::describe(result.status));
        return 1;
    }

    const std::string json = reelforge::plan_to_json(result.plan);
    if (print_plan || (plan_only && plan_out.empty())) {
        std::cout << json << "\n";
    }
    if (!plan_out.empty()) {
        if (!write_text(plan_out, json)) {
            RF_LOG("error", "reelforge: failed to write plan to " << plan_out);
            return 1;
        }
        RF_LOG("info", "plan written to " << plan_out);
    }
    if (plan_only) {
        return 0;
    }

    const std::string output_path = positional[1];
    const auto encoded = reelforge::encode_plan(result.plan, output_path, encoder);
    if (!encoded.ok) {
        RF_LOG("error", "reelforge: failed to encode: " << encoded.message);
        return 1;
    }

    std::cout << "Wrote: " << output_path << "\n";
    return 0;
}
