//
//  media_probe.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "spec_model.hpp"

namespace reelforge {

struct ProbeResult {
    bool ok{false};
    MediaInfo info;
    std::string message;  ///< Failure reason when ok == false
};

/**
 * @brief Media probe collaborator: asset reference in, duration + resolution out.
 *
 * Implementations are called concurrently for distinct assets and must be
 * thread-safe. A failed probe is reported through ProbeResult, not thrown.
 */
class MediaProbe {
   public:
    virtual ~MediaProbe() = default;
    virtual ProbeResult probe(const std::string &asset) = 0;
};

/// Probe backed by the `ffprobe` executable (JSON output).
class FfprobeMediaProbe : public MediaProbe {
   public:
    explicit FfprobeMediaProbe(std::string ffprobe_path = "ffprobe");
    ProbeResult probe(const std::string &asset) override;

   private:
    std::string ffprobe_path_;
};

// Parse the JSON printed by `ffprobe -print_format json -show_format -show_streams`.
// Exposed for tests.
ProbeResult parse_ffprobe_json(const std::string &asset, const std::string &text);

}  // namespace reelforge
