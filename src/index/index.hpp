#pragma once

#include "image/image.hpp"
#include "lib.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Index {

struct NameFields {
    std::string Station;
    std::string Location;
    std::string Angle;
};

struct IndexRow {
    std::string Stem;
    std::string Station;
    std::string Location;
    std::string Angle;
    std::string RelPath; // always forward slashes
    std::string Url;
};

struct RunOptions {
    fs::path InputDir;
    fs::path OutputDir;
    std::string BaseUrl;
    Image::EncodeOptions Encode;
    bool Overwrite = false;
    bool SkipWebpInputs = false;
};

struct RunCounters {
    size_t Converted = 0;
    size_t Skipped = 0;
    size_t Errors = 0;

    [[nodiscard]] size_t Total() const { return Converted + Skipped + Errors; }
};

struct RunResult {
    std::vector<IndexRow> Rows;
    RunCounters Counters;
};

// Splits on '_' and keeps the first three segments; missing segments are empty.
NameFields ParseName(std::string_view stem);

// Strips every trailing '/' from baseUrl before joining.
std::string JoinUrl(std::string_view baseUrl, std::string_view relPath);

IndexRow MakeRow(const fs::path &outputRoot, const fs::path &dstPath, std::string_view baseUrl);

std::string EscapeField(std::string_view field);

void WriteTable(const fs::path &path, const std::vector<IndexRow> &rows);

/**
 * Walks options.InputDir recursively, converting (or copying, for .webp inputs) every accepted image into the
 * mirrored location under options.OutputDir. Existing outputs are re-indexed instead of rewritten unless
 * options.Overwrite is set. Per-file failures are logged and counted; only a missing input directory throws.
 *
 * Row order follows the directory traversal and is not sorted.
 */
RunResult Run(const RunOptions &options);

} // namespace Index
