#include <filesystem>
#include <optional>
#include <span>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "image.hpp"
#include "lib.hpp"
#include "utils.hpp"

namespace Image {

namespace {

void Encode(const std::span<const uint8_t> rgb, const int width, const int height, const EncodeOptions &options,
            webp::MemoryWriter &writer) {
    WebPConfig config;
    webp::Ensure(WebPConfigInit(&config) != 0, "WebPConfigInit failed (libwebp version mismatch)");
    if (options.Lossless) {
        config.lossless = 1;
    } else {
        config.quality = static_cast<float>(options.Quality);
    }
    config.method = options.Method;
    webp::Ensure(WebPValidateConfig(&config) != 0, "Invalid WebP configuration (quality={}, method={})",
                 options.Quality, options.Method);

    webp::Picture picture;
    picture->use_argb = options.Lossless ? 1 : 0;
    picture->width = width;
    picture->height = height;
    webp::Ensure(WebPPictureImportRGB(picture.get(), rgb.data(), width * 3) != 0,
                 "Failed to import {}x{} RGB picture", width, height);

    picture->writer = WebPMemoryWrite;
    picture->custom_ptr = writer.get();
    webp::Ensure(WebPEncode(&config, picture.get()) != 0, "WebPEncode failed: {}",
                 webp::ErrorName(picture->error_code));
}

void WriteWithExif(const fs::path &dstPath, const std::span<const uint8_t> bitstream,
                   const std::span<const uint8_t> exif) {
    const WebPData image{bitstream.data(), bitstream.size()};
    const webp::MuxPtr mux(WebPMuxCreate(&image, 0));
    webp::Ensure(mux != nullptr, "WebPMuxCreate failed");

    const WebPData chunk{exif.data(), exif.size()};
    auto err = WebPMuxSetChunk(mux.get(), "EXIF", &chunk, 1);
    webp::Ensure(err == WEBP_MUX_OK, "Failed to attach EXIF chunk: {}", webp::ErrorName(err));

    webp::Data assembled;
    err = WebPMuxAssemble(mux.get(), assembled.get());
    webp::Ensure(err == WEBP_MUX_OK, "WebPMuxAssemble failed: {}", webp::ErrorName(err));

    WriteFileData(dstPath, assembled.data());
}

} // namespace

void ConvertToWebp(const fs::path &srcPath, const fs::path &dstPath, const EncodeOptions &options) {
    if (dstPath.has_parent_path()) {
        fs::create_directories(dstPath.parent_path());
    }

    auto img = OpenImage(srcPath);
    std::optional<std::vector<uint8_t> > exif;
    if (options.KeepExif) {
        exif = ReadExif(img);
    }
    NormalizeToRgb(img, srcPath);

    const auto width = static_cast<int>(img.getWidth());
    const auto height = static_cast<int>(img.getHeight());
    const auto rgb = ExtractRgb(img);

    webp::MemoryWriter writer;
    try {
        Encode(rgb, width, height, options, writer);
    } catch (const std::runtime_error &e) {
        throw lib::FileError(srcPath, e.what());
    }

    if (exif) {
        spdlog::debug("Attaching {} byte EXIF block from {}", exif->size(), srcPath.string());
        WriteWithExif(dstPath, writer.data(), *exif);
    } else {
        WriteFileData(dstPath, writer.data());
    }
}

void CopyFile(const fs::path &srcPath, const fs::path &dstPath) {
    // copying a file onto itself already has the wanted result
    if (fs::exists(dstPath) && fs::equivalent(srcPath, dstPath)) {
        return;
    }
    if (dstPath.has_parent_path()) {
        fs::create_directories(dstPath.parent_path());
    }
    fs::copy_file(srcPath, dstPath, fs::copy_options::overwrite_existing);
}

} // namespace Image
