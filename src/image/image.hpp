#pragma once

#include "lib.hpp"

#include <string_view>

namespace Image {

inline constexpr std::string_view WEBP_EXT = ".webp";

struct EncodeOptions {
    int Quality = 82;      // 0-100, ignored when Lossless
    bool Lossless = false;
    bool KeepExif = false;
    int Method = 6;        // 0 (fast) - 6 (small)
};

void Initialize();

// true for the raster extensions that get re-encoded (.jpg, .png, ...); extension is matched case-insensitively
bool IsConvertible(const fs::path &path);

bool IsWebp(const fs::path &path);

void ConvertToWebp(const fs::path &srcPath, const fs::path &dstPath, const EncodeOptions &options = {});

void CopyFile(const fs::path &srcPath, const fs::path &dstPath);

} // namespace Image
