//
//  spec_validator.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include "compile_status.hpp"
#include "spec_model.hpp"

namespace reelforge {

// Structural validation, run before any asset is probed. Reports every
// violation found (not just the first) as a single ValidationError.
CompileStatus validate_spec(const VideoSpec &spec);

// Rules that need native durations: trim ranges against the source length,
// narration overlap using resolved ends, legacy overlay windows whose end
// comes from the asset, and source-relative overlay sizes. Also reported
// exhaustively as ValidationError.
CompileStatus validate_resolved(const VideoSpec &spec, const MediaTable &media);

// Give legacy open-ended overlay windows their end (start + native duration)
// and place start-less legacy narration after the track before it. Must run
// before validate_resolved.
void resolve_open_windows(VideoSpec &spec, const MediaTable &media);

}  // namespace reelforge
