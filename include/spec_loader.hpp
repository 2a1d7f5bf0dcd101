//
//  spec_loader.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "compile_status.hpp"
#include "spec_model.hpp"

namespace reelforge {

struct LoadResult {
    CompileStatus status;
    VideoSpec spec;
};

// Parse a JSON spec document into the typed model. Shape problems (wrong
// types, unknown kinds, syntax errors) are all collected as violations of a
// ValidationError; the loader never throws.
LoadResult load_spec_string(const std::string &text);

// Same as load_spec_string, reading from a file. Relative asset paths are
// resolved against the directory containing the spec.
LoadResult load_spec_file(const std::string &path);

}  // namespace reelforge
