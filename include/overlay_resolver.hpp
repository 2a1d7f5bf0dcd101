//
//  overlay_resolver.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "spec_model.hpp"

namespace reelforge {

/// Output-pixel placement of an overlay.
struct PixelRect {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t w = 0;
    uint32_t h = 0;
};

struct ResolvedOverlay {
    size_t overlay_index = 0;  ///< Declaration index in the spec
    std::string id;
    std::string asset;
    PixelRect rect;
    int z_index = 0;           ///< Explicit z-index, 0 when none was given
    size_t draw_rank = 0;      ///< 0 = bottom-most
    bool loop = false;
    std::vector<TimeWindow> intervals;  ///< Clipped, merged, sorted, non-overlapping
};

/// Maximal time range over which the same overlays are visible.
struct OverlayStackSpan {
    double start = 0.0;
    double end = 0.0;
    std::vector<size_t> layers;  ///< Indices into OverlayPlan::overlays, bottom to top
};

struct OverlayPlan {
    std::vector<ResolvedOverlay> overlays;  ///< Sorted by draw_rank
    std::vector<OverlayStackSpan> stacks;
};

// Clip windows to [0, total], merge overlapping or touching windows of the
// same overlay, and derive draw order. Draw order is (z_index, declaration
// index): without z-indices it is pure declaration order, later drawn on top.
// `media` supplies the native size for CoordinateUnits::Source overlays.
OverlayPlan resolve_overlays(const std::vector<Overlay> &overlays, const OutputSettings &output,
                             const MediaTable &media, double total_duration);

// Exposed for tests: clip + sort + merge one window list. The union of the
// visible time is preserved exactly; windows separated by any gap stay apart.
std::vector<TimeWindow> normalize_windows(std::vector<TimeWindow> windows, double total_duration);

}  // namespace reelforge
