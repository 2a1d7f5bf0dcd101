//
//  reelforge.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "reelforge.hpp"
#include "reelforge_version.hpp"

#include <chrono>
#include <utility>

#include "audio_mix_planner.hpp"
#include "duration_resolver.hpp"
#include "logging.hpp"
#include "overlay_resolver.hpp"
#include "spec_loader.hpp"
#include "spec_validator.hpp"
#include "timeline_compiler.hpp"

namespace reelforge {

std::string version_string() { return REELFORGE_VERSION_DISPLAY; }

namespace {

CompileResult fail(CompileStatus status) {
    RF_LOG("debug", "compile aborted: " << to_string(status.kind) << ": " << status.message);
    CompileResult r;
    r.status = std::move(status);
    return r;
}

long long ms_since(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - t)
        .count();
}

}  // namespace

CompileResult compile_spec(const VideoSpec &input, const std::shared_ptr<MediaProbe> &probe) {
    const auto t0 = std::chrono::steady_clock::now();
    RF_LOG("debug", "compile_spec clips=" << input.clips.size()
                                          << " overlays=" << input.overlays.size()
                                          << " subtitles=" << input.subtitles.size()
                                          << " audio=" << input.audio.size());
    if (!probe) {
        return fail(make_error(ErrorKind::AssetUnavailableError, "no media probe configured"));
    }

    auto status = validate_spec(input);
    if (!status.ok) {
        return fail(std::move(status));
    }

    // Fresh cache per run: assets may change between invocations.
    MediaTable media;
    DurationResolver resolver(probe, input.options.probe_workers, input.options.probe_timeout);
    status = resolver.resolve_all(referenced_assets(input), media);
    if (!status.ok) {
        return fail(std::move(status));
    }
    const auto t_probe = std::chrono::steady_clock::now();

    VideoSpec spec = input;
    resolve_open_windows(spec, media);
    status = validate_resolved(spec, media);
    if (!status.ok) {
        return fail(std::move(status));
    }

    Timeline timeline;
    status = compile_timeline(spec, media, timeline);
    if (!status.ok) {
        return fail(std::move(status));
    }

    // Overlay and audio planning are independent of each other.
    const OverlayPlan overlays =
        resolve_overlays(spec.overlays, spec.output, media, timeline.total_duration);
    const MixPlan mix = plan_audio_mix(spec, timeline, media);

    CompileResult result;
    status = emit_plan(spec, timeline, overlays, mix, media, result.plan);
    if (!status.ok) {
        return fail(std::move(status));
    }
    result.status = make_ok();

    RF_LOG("debug", "compile_spec timings ms: probe=" << ms_since(t0) - ms_since(t_probe)
                                                      << " total=" << ms_since(t0));
    RF_LOG("info", "compiled " << timeline.segments.size() << " segment(s), "
                               << overlays.overlays.size() << " overlay(s), " << mix.layers.size()
                               << " audio layer(s) into " << result.plan.operations.size()
                               << " operation(s), duration "
                               << fmt_seconds(timeline.total_duration));
    return result;
}

CompileResult compile_file(const std::string &spec_path,
                           const std::shared_ptr<MediaProbe> &probe) {
    RF_LOG("debug", "compile_file spec=" << spec_path);
    LoadResult loaded = load_spec_file(spec_path);
    if (!loaded.status.ok) {
        return fail(std::move(loaded.status));
    }
    return compile_spec(loaded.spec, probe);
}

}  // namespace reelforge
