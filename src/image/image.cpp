#include "image.hpp"
#include "lib.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <spdlog/spdlog.h>

namespace {
constexpr std::array<std::string_view, 7> CONVERTIBLE_EXTS = {".jpg", ".jpeg", ".png", ".bmp",
                                                                ".tif", ".tiff", ".gif"};
}

void Image::Initialize() {
    FreeImage_Initialise();
    FreeImage_SetOutputMessage([](FREE_IMAGE_FORMAT, const char *msg) {
        spdlog::error(msg);
    });
}

bool Image::IsConvertible(const fs::path &path) {
    const auto ext = lib::ToLower(path.extension().string());
    return std::find(CONVERTIBLE_EXTS.begin(), CONVERTIBLE_EXTS.end(), ext) != CONVERTIBLE_EXTS.end();
}

bool Image::IsWebp(const fs::path &path) {
    return lib::ToLower(path.extension().string()) == WEBP_EXT;
}
