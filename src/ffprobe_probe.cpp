//
//  ffprobe_probe.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"
#include "media_probe.hpp"
#include "process_util.hpp"

using json = nlohmann::json;

namespace reelforge {

namespace {

// ffprobe prints durations as strings ("12.345000"); "N/A" and friends are rejected.
bool parse_seconds(const json &v, double &out) {
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    if (!v.is_string()) {
        return false;
    }
    const std::string s = v.get<std::string>();
    char *end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') {
        return false;
    }
    out = d;
    return true;
}

ProbeResult fail(const std::string &asset, std::string msg) {
    RF_LOG("warn", "probe failed for " << asset << ": " << msg);
    ProbeResult r;
    r.message = std::move(msg);
    return r;
}

}  // namespace

ProbeResult parse_ffprobe_json(const std::string &asset, const std::string &text) {
    json root = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded() || !root.is_object()) {
        return fail(asset, "ffprobe output is not JSON");
    }

    ProbeResult result;
    double duration = 0.0;
    bool have_duration = false;
    auto fmt = root.find("format");
    if (fmt != root.end() && fmt->is_object() && fmt->contains("duration")) {
        have_duration = parse_seconds((*fmt)["duration"], duration);
    }

    auto streams = root.find("streams");
    if (streams != root.end() && streams->is_array()) {
        for (const auto &s : *streams) {
            if (!s.is_object()) {
                continue;
            }
            const std::string type = s.value("codec_type", std::string());
            if (type == "video" && result.info.width == 0) {
                if (s.contains("width") && s["width"].is_number_unsigned()) {
                    result.info.width = s["width"].get<uint32_t>();
                }
                if (s.contains("height") && s["height"].is_number_unsigned()) {
                    result.info.height = s["height"].get<uint32_t>();
                }
            } else if (type == "audio") {
                result.info.has_audio = true;
            }
            // Container without a duration: fall back to the longest stream.
            double stream_duration = 0.0;
            if (!have_duration && s.contains("duration") &&
                parse_seconds(s["duration"], stream_duration) && stream_duration > duration) {
                duration = stream_duration;
            }
        }
    }

    if (!(duration > 0.0)) {
        return fail(asset, "no usable duration reported");
    }
    result.info.duration = duration;
    result.ok = true;
    RF_LOG("debug", "probed " << asset << ": duration=" << fmt_seconds(duration)
                              << " size=" << result.info.width << "x" << result.info.height
                              << " audio=" << result.info.has_audio);
    return result;
}

FfprobeMediaProbe::FfprobeMediaProbe(std::string ffprobe_path)
    : ffprobe_path_(std::move(ffprobe_path)) {}

ProbeResult FfprobeMediaProbe::probe(const std::string &asset) {
    const std::vector<std::string> argv = {ffprobe_path_,  "-v",           "error",
                                           "-print_format", "json",         "-show_format",
                                           "-show_streams", asset};
    std::string output;
    const int rc = run_capture(join_command(argv) + " 2>/dev/null", output);
    if (rc != 0) {
        return fail(asset, "ffprobe exited with code " + std::to_string(rc));
    }
    return parse_ffprobe_json(asset, output);
}

}  // namespace reelforge
