//
//  reelforge.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <string>

#include "compile_status.hpp"
#include "composition_plan.hpp"
#include "media_probe.hpp"
#include "spec_model.hpp"

namespace reelforge {

/// @defgroup api ReelForge Public API
/// Public, supported C++ interfaces for compiling video specs into composition plans.
/// @{

/**
 * @brief Outcome of a compile run.
 *
 * `plan` is only meaningful when `status.ok`; a failed run never carries a
 * partial plan.
 */
struct CompileResult {
    CompileStatus status;
    CompositionPlan plan;
};

/**
 * @brief Return the ReelForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/**
 * @brief Compile an in-memory spec into a composition plan.
 *
 * Runs validation, asset probing (parallel, deduplicated, per-run cache),
 * timeline compilation, overlay resolution, audio mix planning and plan
 * emission. Thresholds are taken from `spec.options`.
 *
 * @param spec Typed spec, usually from load_spec_file().
 * @param probe Media probe collaborator; shared with probe worker threads.
 */
CompileResult compile_spec(const VideoSpec &spec,
                           const std::shared_ptr<MediaProbe> &probe);  ///< @ingroup api

/// Load a JSON spec from disk and compile it.
CompileResult compile_file(const std::string &spec_path,
                           const std::shared_ptr<MediaProbe> &probe);  ///< @ingroup api

/// @}

}  // namespace reelforge
