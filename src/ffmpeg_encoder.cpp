//
//  ffmpeg_encoder.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ffmpeg_encoder.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "process_util.hpp"

namespace reelforge {

namespace {

// Fixed notation keeps the graph text stable across runs and locales.
std::string num(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << v;
    std::string s = oss.str();
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s.empty() || s == "-0" ? "0" : s;
}

// Filter arguments treat ':' '\'' and '\\' specially (Windows drive letters included).
std::string escape_filter_path(const std::string &path) {
    std::string out;
    for (char c : path) {
        if (c == '\\' || c == ':' || c == '\'') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::vector<std::string> split_args(const std::string &s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) {
        out.push_back(tok);
    }
    return out;
}

// "in3" -> "[3:v]" / "[3:a]"; everything else is a graph label.
std::string pad(const std::string &label, char media) {
    if (label.size() > 2 && label.compare(0, 2, "in") == 0) {
        return "[" + label.substr(2) + ":" + media + "]";
    }
    return "[" + label + "]";
}

std::string video_chain(const PlanOperation &op, const CompositionPlan &plan,
                        const std::string &srt_path) {
    const auto &out = plan.output;
    std::ostringstream f;
    switch (op.kind) {
        case OpKind::Color:
            f << "color=c=" << op.mode << ":s=" << out.width << "x" << out.height
              << ":r=" << num(out.fps) << ":d=" << num(op.end - op.start);
            break;
        case OpKind::Trim:
            f << pad(op.inputs[0], 'v') << "trim=start=" << num(op.start) << ":end="
              << num(op.end) << ",setpts=PTS-STARTPTS";
            break;
        case OpKind::Speed:
            // setpts multiplies timestamps: half speed doubles them.
            f << pad(op.inputs[0], 'v') << "setpts=" << num(1.0 / op.factor) << "*PTS";
            break;
        case OpKind::Scale: {
            const double slot = op.end - op.start;
            f << pad(op.inputs[0], 'v') << "scale=" << op.rect.w << ":" << op.rect.h
              << ":force_original_aspect_ratio=decrease,pad=" << op.rect.w << ":" << op.rect.h
              << ":(ow-iw)/2:(oh-ih)/2:color=" << out.background << ",setsar=1,fps="
              << num(out.fps) << ",tpad=stop_mode=clone:stop_duration=" << num(slot)
              << ",trim=duration=" << num(slot) << ",setpts=PTS-STARTPTS";
            break;
        }
        case OpKind::Concat:
            for (const auto &in : op.inputs) {
                f << pad(in, 'v');
            }
            f << "concat=n=" << op.inputs.size() << ":v=1:a=0";
            break;
        case OpKind::Overlay: {
            const std::string src = op.output + ".src";
            f << pad(op.inputs[1], 'v') << "scale=" << op.rect.w << ":" << op.rect.h
              << ",setpts=PTS-STARTPTS+" << num(op.start) << "/TB[" << src << "];"
              << pad(op.inputs[0], 'v') << "[" << src << "]overlay=x=" << op.rect.x
              << ":y=" << op.rect.y << ":eof_action=pass:enable='";
            for (size_t i = 0; i < op.windows.size(); ++i) {
                if (i) f << "+";
                f << "between(t," << num(op.windows[i].start) << "," << num(op.windows[i].end)
                  << ")";
            }
            f << "'";
            break;
        }
        case OpKind::Subtitles:
            if (op.mode == "burn") {
                f << pad(op.inputs[0], 'v') << "subtitles=filename='"
                  << escape_filter_path(srt_path) << "'";
            } else {
                f << pad(op.inputs[0], 'v') << "null";
            }
            break;
        default:
            return {};
    }
    f << "[" << op.output << "]";
    return f.str();
}

// Piecewise gain as a volume expression over the layer-local clock.
std::string volume_expression(const PlanOperation &op) {
    std::ostringstream e;
    size_t open = 0;
    for (size_t i = 0; i < op.gains.size(); ++i) {
        const double linear = std::pow(10.0, op.gains[i].gain_db / 20.0);
        if (i + 1 == op.gains.size()) {
            e << num(linear);
        } else {
            e << "if(lt(t," << num(op.gains[i].end - op.start) << ")," << num(linear) << ",";
            ++open;
        }
    }
    for (size_t i = 0; i < open; ++i) e << ")";
    return op.gains.empty() ? "1" : e.str();
}

std::string audio_chain(const PlanOperation &op, const CompositionPlan &plan) {
    std::ostringstream f;
    if (op.kind == OpKind::AudioLayer) {
        const double dur = op.end - op.start;
        const long long delay_ms = std::llround(op.start * 1000.0);
        f << pad(op.inputs[0], 'a') << "atrim=start=" << num(op.offset)
          << ":end=" << num(op.offset + dur) << ",asetpts=PTS-STARTPTS,volume=eval=frame:volume='"
          << volume_expression(op) << "'";
        if (op.fade_in > 0.0) {
            f << ",afade=t=in:st=0:d=" << num(op.fade_in);
        }
        if (op.fade_out > 0.0) {
            f << ",afade=t=out:st=" << num(std::max(0.0, dur - op.fade_out))
              << ":d=" << num(op.fade_out);
        }
        f << ",adelay=delays=" << delay_ms << ":all=1";
    } else if (op.kind == OpKind::Mix) {
        for (const auto &in : op.inputs) {
            f << pad(in, 'a');
        }
        f << "amix=inputs=" << op.inputs.size() << ":duration=longest:normalize=0"
          << ",apad,atrim=end=" << num(plan.total_duration);
    } else {
        return {};
    }
    f << "[" << op.output << "]";
    return f.str();
}

}  // namespace

std::string build_filter_graph(const CompositionPlan &plan, const std::string &srt_path) {
    std::vector<std::string> chains;
    for (const auto &op : plan.operations) {
        std::string chain = video_chain(op, plan, srt_path);
        if (chain.empty()) {
            chain = audio_chain(op, plan);
        }
        if (!chain.empty()) {
            chains.push_back(std::move(chain));
        }
    }
    std::string graph;
    for (size_t i = 0; i < chains.size(); ++i) {
        if (i) graph += ";";
        graph += chains[i];
    }
    return graph;
}

std::vector<std::string> build_ffmpeg_args(const CompositionPlan &plan,
                                           const std::string &output_path,
                                           const std::string &srt_path,
                                           const EncoderOptions &options) {
    std::vector<std::string> args = {options.ffmpeg_path, "-y", "-hide_banner", "-loglevel",
                                     "error"};
    for (const auto &in : plan.inputs) {
        if (in.loop) {
            args.insert(args.end(), {"-stream_loop", "-1"});
        }
        args.insert(args.end(), {"-i", in.asset});
    }
    const bool soft_subs =
        !plan.subtitles.empty() && plan.output.subtitle_mode == SubtitleMode::Soft;
    if (soft_subs) {
        args.insert(args.end(), {"-i", srt_path});
    }

    args.insert(args.end(), {"-filter_complex", build_filter_graph(plan, srt_path)});
    args.insert(args.end(), {"-map", "[" + plan.video_label + "]"});
    if (!plan.audio_label.empty()) {
        args.insert(args.end(), {"-map", "[" + plan.audio_label + "]"});
    }
    if (soft_subs) {
        args.insert(args.end(),
                    {"-map", std::to_string(plan.inputs.size()) + ":s", "-c:s", "mov_text"});
    }

    for (auto &a : split_args(options.video_codec_args)) args.push_back(std::move(a));
    if (plan.audio_label.empty()) {
        args.push_back("-an");
    } else {
        for (auto &a : split_args(options.audio_codec_args)) args.push_back(std::move(a));
    }
    args.insert(args.end(), {"-r", num(plan.output.fps), "-t", num(plan.total_duration),
                             output_path});
    return args;
}

EncodeStatus encode_plan(const CompositionPlan &plan, const std::string &output_path,
                         const EncoderOptions &options) {
    EncodeStatus status;
    const std::string srt_path =
        std::filesystem::path(output_path).replace_extension(".srt").string();
    if (!plan.subtitles.empty()) {
        std::ofstream srt(srt_path, std::ios::binary);
        if (!srt.is_open()) {
            RF_LOG("error", "open failed for " << srt_path << " errno=" << errno << " ("
                                               << std::generic_category().message(errno)
                                               << ")");
            status.message = "cannot write subtitle file " + srt_path;
            return status;
        }
        srt << plan.srt;
        if (!srt.good()) {
            status.message = "short write to " + srt_path;
            return status;
        }
    }

    const auto args = build_ffmpeg_args(plan, output_path, srt_path, options);
    RF_LOG("info", "encoding " << fmt_seconds(plan.total_duration) << " to " << output_path);
    std::string ignored_stdout;
    status.exit_code = run_capture(join_command(args), ignored_stdout);
    status.ok = status.exit_code == 0;
    if (!status.ok) {
        status.message = "ffmpeg exited with code " + std::to_string(status.exit_code);
        RF_LOG("error", status.message);
    }
    return status;
}

}  // namespace reelforge
