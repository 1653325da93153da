#include "image/image.hpp"
#include "index.hpp"
#include "lib.hpp"

#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace Index {

namespace {

enum class Outcome { Ignored, SkippedNative, SkippedExisting, Converted, Failed };

Outcome ProcessFile(const RunOptions &options, const fs::path &src, std::vector<IndexRow> &rows) {
    const bool isWebp = Image::IsWebp(src);

    // .webp inputs are dropped here, before the output is even looked at, so they never reach the index
    if (isWebp && options.SkipWebpInputs) {
        spdlog::debug("Skipping WebP input: {}", src.string());
        return Outcome::SkippedNative;
    }
    if (!isWebp && !Image::IsConvertible(src)) {
        return Outcome::Ignored;
    }

    auto dst = options.OutputDir / src.lexically_relative(options.InputDir);
    dst.replace_extension(Image::WEBP_EXT);

    std::error_code ec;
    const bool exists = fs::exists(dst, ec);
    if (ec) {
        spdlog::error("{} -> {}: {}", src.string(), dst.string(), ec.message());
        return Outcome::Failed;
    }
    if (exists && !options.Overwrite) {
        spdlog::debug("Output exists, re-indexing: {}", dst.string());
        rows.push_back(MakeRow(options.OutputDir, dst, options.BaseUrl));
        return Outcome::SkippedExisting;
    }

    try {
        if (isWebp) {
            Image::CopyFile(src, dst);
            spdlog::debug("Copied {} -> {}", src.string(), dst.string());
        } else {
            Image::ConvertToWebp(src, dst, options.Encode);
            spdlog::debug("Converted {} -> {}", src.string(), dst.string());
        }
        rows.push_back(MakeRow(options.OutputDir, dst, options.BaseUrl));
    } catch (const std::exception &e) {
        spdlog::error("{} -> {}: {}", src.string(), dst.string(), e.what());
        return Outcome::Failed;
    }
    return Outcome::Converted;
}

// Recurses without following directory symlinks; a directory that cannot be listed is logged and left out.
// Each directory is listed completely before any of its files is visited, so outputs written next to their
// inputs are never picked up as inputs.
template <typename Visit>
void WalkFiles(const fs::path &dir, const Visit &visit) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::error("Cannot read directory {}: {}", dir.string(), ec.message());
        return;
    }

    std::vector<fs::path> files, subdirs;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto &entry = *it;
        std::error_code sec;
        if (entry.is_directory(sec) && !entry.is_symlink(sec)) {
            subdirs.push_back(entry.path());
        } else if (entry.is_regular_file(sec)) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        spdlog::error("Failed while reading directory {}: {}", dir.string(), ec.message());
    }

    for (const auto &file : files) {
        visit(file);
    }
    for (const auto &sub : subdirs) {
        WalkFiles(sub, visit);
    }
}

} // namespace

RunResult Run(const RunOptions &options) {
    if (!fs::is_directory(options.InputDir)) {
        throw lib::FileError(options.InputDir, "Input dir does not exist or is not a directory");
    }

    RunResult result;
    auto &counters = result.Counters;

    WalkFiles(options.InputDir, [&](const fs::path &src) {
        switch (ProcessFile(options, src, result.Rows)) {
        case Outcome::Ignored:
            break;
        case Outcome::SkippedNative:
        case Outcome::SkippedExisting:
            ++counters.Skipped;
            break;
        case Outcome::Converted:
            ++counters.Converted;
            break;
        case Outcome::Failed:
            ++counters.Errors;
            break;
        }
    });

    return result;
}

} // namespace Index
