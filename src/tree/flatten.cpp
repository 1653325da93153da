#include "tree.hpp"
#include "lib.hpp"

#include <system_error>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

void MoveFile(const fs::path &src, const fs::path &dst) {
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw lib::FileError(src, fmt::format("Failed to move to {}: {}", dst.string(), ec.message()));
    }
    fs::copy_file(src, dst, fs::copy_options::none);
    fs::remove(src);
}

bool IsHidden(const fs::path &path) {
    const auto name = path.filename().string();
    return !name.empty() && name.front() == '.';
}

} // namespace

Tree::FlattenResult Tree::Flatten(const fs::path &srcDir, const fs::path &dstDir) {
    if (!fs::is_directory(srcDir)) {
        throw lib::FileError(srcDir, "Source dir does not exist or is not a directory");
    }
    fs::create_directories(dstDir);

    FlattenResult result;
    for (const auto &sub : fs::directory_iterator(srcDir)) {
        if (!sub.is_directory() || IsHidden(sub.path())) {
            continue;
        }
        std::vector<fs::path> files;
        for (const auto &entry : fs::directory_iterator(sub.path())) {
            if (entry.is_regular_file()) {
                files.push_back(entry.path());
            }
        }
        for (const auto &file : files) {
            const auto dst = dstDir / file.filename();
            if (fs::exists(dst)) {
                spdlog::debug("Not overwriting {}", dst.string());
                ++result.Skipped;
                continue;
            }
            try {
                MoveFile(file, dst);
                ++result.Moved;
            } catch (const std::exception &e) {
                spdlog::error("{} -> {}: {}", file.string(), dst.string(), e.what());
                ++result.Errors;
            }
        }
    }
    return result;
}
