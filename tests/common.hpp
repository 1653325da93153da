#pragma once

#ifdef WIN32
#define _CRTDBG_MAP_ALLOC
#include <stdlib.h>
#include <crtdbg.h>
#define CATCH_CONFIG_WINDOWS_CRTDBG
#endif

#include <catch2/catch_all.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <FreeImagePlus.h>

#include "lib.hpp"
#include "tests/asset.h"

inline fs::path GetPath(const std::wstring& filename, const std::wstring& subdir = L"") {
    auto base = fs::path(TEST_ASSET_DIR) / subdir;
    return filename.empty() ? base : base / filename;
}

inline fs::path GetOutputPath(const std::wstring& filename = L"") {
    return GetPath(filename, L"tmp");
}

// empty directory under tmp, wiped on every call
inline fs::path FreshDir(const std::wstring& name) {
    const auto dir = GetOutputPath(name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline std::vector<uint8_t> ReadBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

inline std::string ReadText(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

inline void WriteBytes(const fs::path& path, const std::string& bytes) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// gradient test image; 8bpp gets FreeImage's default greyscale palette
inline fipImage MakeImage(const unsigned bpp, const unsigned width = 24, const unsigned height = 16) {
    fipImage img(FIT_BITMAP, width, height, bpp);
    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            if (bpp == 8) {
                BYTE index = static_cast<BYTE>((x * 255) / width);
                img.setPixelIndex(x, y, &index);
            } else {
                RGBQUAD color{};
                color.rgbRed = static_cast<BYTE>((x * 255) / width);
                color.rgbGreen = static_cast<BYTE>((y * 255) / height);
                color.rgbBlue = 0x80;
                color.rgbReserved = static_cast<BYTE>(x % 2 ? 0x40 : 0xFF);
                img.setPixelColor(x, y, &color);
            }
        }
    }
    return img;
}

inline fs::path SaveImage(fipImage& img, const fs::path& path) {
    fs::create_directories(path.parent_path());
    REQUIRE(img.save(path.string().c_str()));
    return path;
}

inline fs::path WriteImage(const fs::path& path, const unsigned bpp = 24) {
    auto img = MakeImage(bpp);
    return SaveImage(img, path);
}

inline void Setup()
{
#ifdef WIN32
    _CrtSetDbgFlag(_CRTDBG_ALLOC_MEM_DF | _CRTDBG_LEAK_CHECK_DF);
#endif

    if (const fs::path tmp = GetOutputPath(); !fs::exists(tmp))
    {
        fs::create_directories(tmp);
    }
}
