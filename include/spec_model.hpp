//
//  spec_model.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reelforge {

/// @ingroup api
/// Probed properties of a media asset; immutable once resolved.
struct MediaInfo {
    double duration = 0.0;  ///< Native duration in seconds
    uint32_t width = 0;     ///< Native width (0 for audio-only assets)
    uint32_t height = 0;    ///< Native height (0 for audio-only assets)
    bool has_audio = false; ///< True when at least one audio stream exists
};

/// @ingroup api
/// Base-track element occupying the slot [start, end] on the output clock.
struct Clip {
    std::string id;
    std::string asset;               ///< Local path or URL; empty for blank clips
    double start = 0.0;
    double end = 0.0;
    std::optional<double> trim_in;   ///< Source in-point (seconds)
    std::optional<double> trim_out;  ///< Source out-point (seconds)
    bool allow_trim = false;         ///< Prefer cutting trim_out over speeding up
    bool blank = false;              ///< Placeholder filled with the background colour
    double gain_db = 0.0;
    bool mute = false;
};

struct TimeWindow {
    double start = 0.0;
    double end = 0.0;
};

// Normalized: position and size are fractions of the output frame.
// Pixels: both in output pixels.
// Source: position as Normalized, size as a factor of the asset's own
// dimensions (the legacy avatar form).
enum class CoordinateUnits { Normalized, Pixels, Source };

/// @ingroup api
/// Avatar/overlay element floating above the base track.
struct Overlay {
    std::string id;
    std::string asset;
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;
    CoordinateUnits units = CoordinateUnits::Normalized;
    std::vector<TimeWindow> windows;
    std::optional<int> z_index;
    bool loop = false;
    // Legacy single window with an open end: resolved to start + native duration.
    bool window_end_from_asset = false;
};

struct SubtitleStyle {
    std::string font;
    int size = 0;       ///< 0 keeps the renderer default
    std::string color;
    std::string position;
};

struct SubtitleCue {
    std::string id;
    std::string text;
    double start = 0.0;
    double end = 0.0;
    std::optional<SubtitleStyle> style;
};

enum class AudioKind { Narration, Bgm, Base };

struct AudioTrack {
    std::string id;
    AudioKind kind = AudioKind::Narration;
    std::string asset;
    double start = 0.0;
    std::optional<double> end;  ///< Defaults to start + native duration
    double gain_db = 0.0;
    double fade_in = 0.0;
    double fade_out = 0.0;
    // Legacy narration entry without a start: placed at the resolved end of
    // the previous audio track.
    bool start_after_previous = false;
};

enum class SubtitleMode { Burn, Soft };

struct OutputSettings {
    uint32_t width = 1920;
    uint32_t height = 1080;
    double fps = 30.0;
    SubtitleMode subtitle_mode = SubtitleMode::Burn;
    std::string background = "black";
};

/// Tunables for a compile run. Every threshold is configurable; nothing is
/// hard-wired into the timeline math.
struct CompileOptions {
    double speed_epsilon = 0.001;  ///< |source - slot| below this means no time transform
    double gap_tolerance = 0.001;  ///< Seams closer than this are contiguous
    double min_speed = 0.25;
    double max_speed = 4.0;
    double duck_db = 12.0;         ///< Attenuation applied under narration
    unsigned probe_workers = 4;
    double probe_timeout = 30.0;   ///< Seconds per probe; <= 0 disables
};

/// The whole input document in typed form.
struct VideoSpec {
    std::vector<Clip> clips;
    std::vector<Overlay> overlays;
    std::vector<SubtitleCue> subtitles;
    std::vector<AudioTrack> audio;
    OutputSettings output;
    CompileOptions options;
};

/// Probed media keyed by asset reference, filled once per compile run.
using MediaTable = std::map<std::string, MediaInfo>;

const char *to_string(AudioKind kind);
const char *to_string(SubtitleMode mode);

// max(end) over all clips; 0 when there are none.
double total_duration(const VideoSpec &spec);

// Explicit end, or start + native duration when the track leaves it open.
// Not clamped to the timeline.
double audio_track_end(const AudioTrack &track, const MediaTable &media);

}  // namespace reelforge
