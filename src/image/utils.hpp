#pragma once

#include "lib.hpp"

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <vector>

#include <FreeImagePlus.h>
#include <webp/encode.h>
#include <webp/mux.h>

namespace webp {
template <typename... Args>
void Ensure(const bool cond, fmt::format_string<Args...> msg_fmt, Args &&... args) {
    if (!cond) {
        const auto msg = fmt::format(msg_fmt, std::forward<Args>(args)...);
        throw std::runtime_error(msg);
    }
}

inline const char *ErrorName(const WebPEncodingError err) {
    switch (err) {
    case VP8_ENC_OK:
        return "ok";
    case VP8_ENC_ERROR_OUT_OF_MEMORY:
        return "out of memory";
    case VP8_ENC_ERROR_BITSTREAM_OUT_OF_MEMORY:
        return "bitstream out of memory";
    case VP8_ENC_ERROR_NULL_PARAMETER:
        return "null parameter";
    case VP8_ENC_ERROR_INVALID_CONFIGURATION:
        return "invalid configuration";
    case VP8_ENC_ERROR_BAD_DIMENSION:
        return "bad dimension";
    case VP8_ENC_ERROR_PARTITION0_OVERFLOW:
        return "partition0 overflow";
    case VP8_ENC_ERROR_PARTITION_OVERFLOW:
        return "partition overflow";
    case VP8_ENC_ERROR_BAD_WRITE:
        return "bad write";
    case VP8_ENC_ERROR_FILE_TOO_BIG:
        return "file too big";
    case VP8_ENC_ERROR_USER_ABORT:
        return "user abort";
    default:
        return "unknown error";
    }
}

inline const char *ErrorName(const WebPMuxError err) {
    switch (err) {
    case WEBP_MUX_OK:
        return "ok";
    case WEBP_MUX_NOT_FOUND:
        return "not found";
    case WEBP_MUX_INVALID_ARGUMENT:
        return "invalid argument";
    case WEBP_MUX_BAD_DATA:
        return "bad data";
    case WEBP_MUX_MEMORY_ERROR:
        return "memory error";
    case WEBP_MUX_NOT_ENOUGH_DATA:
        return "not enough data";
    default:
        return "unknown error";
    }
}

class Picture {
public:
    Picture() {
        Ensure(WebPPictureInit(&m_pic) != 0, "WebPPictureInit failed (libwebp version mismatch)");
    }
    ~Picture() { WebPPictureFree(&m_pic); }

    Picture(const Picture &) = delete;
    Picture &operator=(const Picture &) = delete;

    WebPPicture *get() { return &m_pic; }
    WebPPicture *operator->() { return &m_pic; }

private:
    WebPPicture m_pic{};
};

class MemoryWriter {
public:
    MemoryWriter() { WebPMemoryWriterInit(&m_writer); }
    ~MemoryWriter() { WebPMemoryWriterClear(&m_writer); }

    MemoryWriter(const MemoryWriter &) = delete;
    MemoryWriter &operator=(const MemoryWriter &) = delete;

    WebPMemoryWriter *get() { return &m_writer; }

    [[nodiscard]] std::span<const uint8_t> data() const { return {m_writer.mem, m_writer.size}; }

private:
    WebPMemoryWriter m_writer{};
};

// owns the bytes handed out by WebPMuxAssemble
class Data {
public:
    Data() { WebPDataInit(&m_data); }
    ~Data() { WebPDataClear(&m_data); }

    Data(const Data &) = delete;
    Data &operator=(const Data &) = delete;

    WebPData *get() { return &m_data; }

    [[nodiscard]] std::span<const uint8_t> data() const { return {m_data.bytes, m_data.size}; }

private:
    WebPData m_data{};
};

struct MuxDeleter {
    void operator()(WebPMux *mux) const { WebPMuxDelete(mux); }
};
using MuxPtr = std::unique_ptr<WebPMux, MuxDeleter>;
} // namespace webp

namespace Image {

inline FREE_IMAGE_FORMAT GetFreeImageFormat(const fs::path &path) {
#ifdef _WIN32
    const auto fif = FreeImage_GetFileTypeU(path.c_str());
    return fif != FIF_UNKNOWN ? fif : FreeImage_GetFIFFromFilenameU(path.c_str());
#else
    const auto fif = FreeImage_GetFileType(path.c_str());
    return fif != FIF_UNKNOWN ? fif : FreeImage_GetFIFFromFilename(path.c_str());
#endif
}

inline bool LoadFipImage(fipImage &img, const fs::path &path) {
#ifdef _WIN32
    return img.loadU(path.c_str());
#else
    return img.load(path.c_str());
#endif
}

inline fipImage OpenImage(const fs::path &srcPath) {
    const auto fif = GetFreeImageFormat(srcPath);
    if (fif == FIF_UNKNOWN || !FreeImage_FIFSupportsReading(fif)) {
        throw lib::FileError(srcPath, "Unsupported or unrecognized image format");
    }
    fipImage img;
    if (!LoadFipImage(img, srcPath)) {
        throw lib::FileError(srcPath, "Failed to load image");
    }
    return img;
}

// raw EXIF block as stored by the decoder, must be read before any conversion
inline std::optional<std::vector<uint8_t> > ReadExif(const fipImage &img) {
    fipTag tag;
    if (!img.getMetadata(FIMD_EXIF_RAW, "ExifRaw", tag) || tag.getLength() == 0) {
        return std::nullopt;
    }
    const auto *bytes = static_cast<const uint8_t *>(tag.getValue());
    return std::vector<uint8_t>(bytes, bytes + tag.getLength());
}

// palette, grey, grey+alpha, RGBA, CMYK and high bit depth images all end up as 24bpp RGB; alpha is dropped
inline void NormalizeToRgb(fipImage &img, const fs::path &srcPath) {
    if (img.getImageType() != FIT_BITMAP) {
        if (!img.convertToType(FIT_BITMAP)) {
            throw lib::FileError(srcPath, fmt::format("Failed to convert image type {} to bitmap",
                                                      static_cast<int>(img.getImageType())));
        }
    }
    if (img.getBitsPerPixel() != 24 || img.getColorType() != FIC_RGB) {
        if (!img.convertTo24Bits()) {
            throw lib::FileError(srcPath, fmt::format("Failed to convert {}bpp image to RGB", img.getBitsPerPixel()));
        }
    }
}

// top-down, tightly packed RGB rows
inline std::vector<uint8_t> ExtractRgb(const fipImage &img) {
    constexpr size_t channels = 3;
    const size_t width = img.getWidth();
    const size_t height = img.getHeight();
    const size_t pitch = img.getScanWidth();
    const BYTE *srcBits = img.accessPixels();

    std::vector<uint8_t> rgb(width * height * channels);
    for (size_t y = 0; y < height; ++y) {
        const BYTE *srcRow = srcBits + (height - 1 - y) * pitch;
        for (size_t x = 0; x < width; ++x) {
            const BYTE *src = srcRow + x * channels;
            const size_t idx = channels * (y * width + x);
            rgb[idx + 0] = src[FI_RGBA_RED];
            rgb[idx + 1] = src[FI_RGBA_GREEN];
            rgb[idx + 2] = src[FI_RGBA_BLUE];
        }
    }
    return rgb;
}

inline void WriteFileData(const fs::path &path, const std::span<const uint8_t> data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw lib::FileError(path, "Failed to create file");
    }
    file.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw lib::FileError(path, "Failed to write file");
    }
}

} // namespace Image
