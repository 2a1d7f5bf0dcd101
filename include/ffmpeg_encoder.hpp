//
//  ffmpeg_encoder.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "composition_plan.hpp"

namespace reelforge {

struct EncoderOptions {
    std::string ffmpeg_path = "ffmpeg";
    std::string video_codec_args = "-c:v libx264 -preset fast -crf 20 -pix_fmt yuv420p";
    std::string audio_codec_args = "-c:a aac -b:a 192k";
};

/// Encoder outcome; exit_code is ffmpeg's own and is passed through as-is.
struct EncodeStatus {
    bool ok{false};
    int exit_code{0};
    std::string message;
};

// Translate a plan into an ffmpeg -filter_complex graph. `srt_path` is the
// side file holding plan.srt (only read when the plan burns subtitles).
std::string build_filter_graph(const CompositionPlan &plan, const std::string &srt_path);

// Full ffmpeg argument vector (argv[0] included).
std::vector<std::string> build_ffmpeg_args(const CompositionPlan &plan,
                                           const std::string &output_path,
                                           const std::string &srt_path,
                                           const EncoderOptions &options = {});

// Write the SRT side file (when the plan has cues) and run ffmpeg once. The
// plan is not modified, so a failed run may simply be retried.
EncodeStatus encode_plan(const CompositionPlan &plan, const std::string &output_path,
                         const EncoderOptions &options = {});

}  // namespace reelforge
