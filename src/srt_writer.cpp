//
//  srt_writer.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_writer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace reelforge {

namespace {

std::string alignment_tag(const std::string &position) {
    if (position == "top") return "{\\an8}";
    if (position == "middle" || position == "center") return "{\\an5}";
    return {};
}

std::string styled_text(const SubtitleCue &cue) {
    if (!cue.style) {
        return cue.text;
    }
    const SubtitleStyle &s = *cue.style;
    std::string attrs;
    if (!s.font.empty()) attrs += " face=\"" + s.font + "\"";
    if (s.size > 0) attrs += " size=\"" + std::to_string(s.size) + "\"";
    if (!s.color.empty()) attrs += " color=\"" + s.color + "\"";
    std::string text = alignment_tag(s.position);
    if (attrs.empty()) {
        return text + cue.text;
    }
    return text + "<font" + attrs + ">" + cue.text + "</font>";
}

}  // namespace

std::string srt_timestamp(double seconds) {
    const int64_t total_ms = std::max<int64_t>(0, std::llround(seconds * 1000.0));
    const int64_t h = total_ms / 3600000;
    const int64_t m = (total_ms / 60000) % 60;
    const int64_t s = (total_ms / 1000) % 60;
    const int64_t ms = total_ms % 1000;
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ':' << std::setw(2) << m << ':'
        << std::setw(2) << s << ',' << std::setw(3) << ms;
    return oss.str();
}

std::string render_srt(const std::vector<SubtitleCue> &cues) {
    std::ostringstream oss;
    size_t n = 1;
    for (const auto &cue : cues) {
        oss << n++ << "\n"
            << srt_timestamp(cue.start) << " --> " << srt_timestamp(cue.end) << "\n"
            << styled_text(cue) << "\n\n";
    }
    return oss.str();
}

}  // namespace reelforge
