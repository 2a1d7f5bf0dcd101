//
//  srt_writer.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "spec_model.hpp"

namespace reelforge {

// SubRip timestamp, HH:MM:SS,mmm (rounded to the nearest millisecond).
std::string srt_timestamp(double seconds);

// Render cues (in the given order) as a SubRip document. Cue styles become
// <font> tags and an {\anN} alignment override understood by libass.
std::string render_srt(const std::vector<SubtitleCue> &cues);

}  // namespace reelforge
