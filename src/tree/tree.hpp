#pragma once

#include "lib.hpp"

#include <cstddef>

namespace Tree {

struct FlattenResult {
    size_t Moved = 0;
    size_t Skipped = 0;
    size_t Errors = 0;
};

// Moves the files sitting directly inside each immediate (non-hidden) subdirectory of srcDir into dstDir.
// Never overwrites: a name already present in dstDir leaves the source file where it is.
FlattenResult Flatten(const fs::path &srcDir, const fs::path &dstDir);

} // namespace Tree
