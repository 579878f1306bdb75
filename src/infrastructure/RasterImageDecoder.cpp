/**
 * @file RasterImageDecoder.cpp
 * @brief stb_image, libtiff and libwebp backed implementation of RasterImageDecoder.
 */

#include "infrastructure/RasterImageDecoder.hpp"
#include "domain/PipelineError.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_PSD
#define STBI_NO_HDR
#define STBI_NO_PIC
#define STBI_NO_PNM
#include <stb_image.h>

#include <tiffio.h>
#include <webp/decode.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <iostream>
#include <memory>
#include <vector>

namespace marklens::infrastructure {

using domain::ErrorKind;
using domain::ImageFormat;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

// Same per-side limit as stb_image; the pixel cap keeps the RGBA raster under 1 GiB.
constexpr uint32_t kMaxDimension = 1u << 24;
constexpr uint64_t kMaxPixels = 1ull << 28;

PipelineError ConversionFailure(const std::string& message) {
    std::cerr << "[RasterImageDecoder] " << message << std::endl;
    return PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize, message);
}

unsigned char Flatten(unsigned char value, unsigned char alpha) {
    // Composite onto white.
    return static_cast<unsigned char>((value * alpha + 255 * (255 - alpha) + 127) / 255);
}

// Converts 1..4 channel interleaved samples into gray or RGB without alpha.
DecodedImage FromInterleaved(const unsigned char* data, int width, int height, int channels) {
    DecodedImage image;
    image.width = width;
    image.height = height;
    image.components = (channels <= 2) ? 1 : 3;

    const std::size_t pixels = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    image.samples.resize(pixels * static_cast<std::size_t>(image.components));

    for (std::size_t i = 0; i < pixels; ++i) {
        const unsigned char* px = data + i * static_cast<std::size_t>(channels);
        char* out = &image.samples[i * static_cast<std::size_t>(image.components)];
        switch (channels) {
            case 1:
                out[0] = static_cast<char>(px[0]);
                break;
            case 2:
                out[0] = static_cast<char>(Flatten(px[0], px[1]));
                break;
            case 3:
                out[0] = static_cast<char>(px[0]);
                out[1] = static_cast<char>(px[1]);
                out[2] = static_cast<char>(px[2]);
                break;
            default:
                out[0] = static_cast<char>(Flatten(px[0], px[3]));
                out[1] = static_cast<char>(Flatten(px[1], px[3]));
                out[2] = static_cast<char>(Flatten(px[2], px[3]));
                break;
        }
    }
    return image;
}

struct StbiFree {
    void operator()(stbi_uc* p) const { if (p) stbi_image_free(p); }
};

DecodedImage DecodeWithStb(const std::string& encoded, ImageFormat format) {
    int width = 0, height = 0, channels = 0;
    std::unique_ptr<stbi_uc, StbiFree> data(stbi_load_from_memory(
        reinterpret_cast<const stbi_uc*>(encoded.data()), static_cast<int>(encoded.size()),
        &width, &height, &channels, 0));
    if (!data) {
        throw ConversionFailure(std::string("Failed to decode ") + ImageFormatToString(format) + ": " + stbi_failure_reason());
    }
    return FromInterleaved(data.get(), width, height, channels);
}

// In-memory source for TIFFClientOpen.
struct TiffMemorySource {
    const std::string* data;
    toff_t offset;
};

tmsize_t TiffRead(thandle_t handle, void* buffer, tmsize_t size) {
    auto* src = static_cast<TiffMemorySource*>(handle);
    if (src->offset >= src->data->size()) return 0;
    tmsize_t available = static_cast<tmsize_t>(src->data->size() - src->offset);
    tmsize_t count = std::min(size, available);
    std::memcpy(buffer, src->data->data() + src->offset, static_cast<std::size_t>(count));
    src->offset += static_cast<toff_t>(count);
    return count;
}

tmsize_t TiffWrite(thandle_t, void*, tmsize_t) {
    return 0;
}

toff_t TiffSeek(thandle_t handle, toff_t offset, int whence) {
    auto* src = static_cast<TiffMemorySource*>(handle);
    switch (whence) {
        case SEEK_SET: src->offset = offset; break;
        case SEEK_CUR: src->offset += offset; break;
        case SEEK_END: src->offset = src->data->size() + offset; break;
        default: break;
    }
    return src->offset;
}

int TiffClose(thandle_t) {
    return 0;
}

toff_t TiffSize(thandle_t handle) {
    return static_cast<TiffMemorySource*>(handle)->data->size();
}

int TiffMap(thandle_t, void**, toff_t*) {
    return 0;
}

void TiffUnmap(thandle_t, void*, toff_t) {}

struct TiffCloser {
    void operator()(TIFF* tif) const { if (tif) TIFFClose(tif); }
};

DecodedImage DecodeTiff(const std::string& encoded) {
    TiffMemorySource source{&encoded, 0};
    std::unique_ptr<TIFF, TiffCloser> tif(TIFFClientOpen("memory", "r", &source,
                                                         TiffRead, TiffWrite, TiffSeek, TiffClose,
                                                         TiffSize, TiffMap, TiffUnmap));
    if (!tif) {
        throw ConversionFailure("Failed to open TIFF stream");
    }

    uint32_t width = 0, height = 0;
    TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &width);
    TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &height);
    if (width == 0 || height == 0) {
        throw ConversionFailure("TIFF has no image dimensions");
    }
    if (width > kMaxDimension || height > kMaxDimension
        || static_cast<uint64_t>(width) * height > kMaxPixels) {
        throw ConversionFailure("TIFF dimensions " + std::to_string(width) + "x" + std::to_string(height)
                                + " exceed the supported size");
    }

    std::vector<uint32_t> raster(static_cast<std::size_t>(width) * height);
    if (!TIFFReadRGBAImageOriented(tif.get(), width, height, raster.data(), ORIENTATION_TOPLEFT, 1)) {
        throw ConversionFailure("Failed to decode TIFF raster (unsupported photometric or corrupt data)");
    }

    std::vector<unsigned char> rgba(raster.size() * 4);
    for (std::size_t i = 0; i < raster.size(); ++i) {
        rgba[i * 4 + 0] = static_cast<unsigned char>(TIFFGetR(raster[i]));
        rgba[i * 4 + 1] = static_cast<unsigned char>(TIFFGetG(raster[i]));
        rgba[i * 4 + 2] = static_cast<unsigned char>(TIFFGetB(raster[i]));
        rgba[i * 4 + 3] = static_cast<unsigned char>(TIFFGetA(raster[i]));
    }
    return FromInterleaved(rgba.data(), static_cast<int>(width), static_cast<int>(height), 4);
}

struct WebPFreeDeleter {
    void operator()(uint8_t* p) const { if (p) WebPFree(p); }
};

DecodedImage DecodeWebp(const std::string& encoded) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(encoded.data());
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(bytes, encoded.size(), &features) != VP8_STATUS_OK) {
        throw ConversionFailure("WEBP feature detection failed");
    }
    if (features.has_animation) {
        std::cerr << "[RasterImageDecoder] Animated WEBP: only the first frame is used." << std::endl;
    }

    int width = 0, height = 0;
    std::unique_ptr<uint8_t, WebPFreeDeleter> decoded(WebPDecodeRGBA(bytes, encoded.size(), &width, &height));
    if (!decoded) {
        throw ConversionFailure("WEBP decode failed");
    }
    return FromInterleaved(decoded.get(), width, height, 4);
}

} // namespace

DecodedImage RasterImageDecoder::Decode(const std::string& encoded, ImageFormat format) {
    if (encoded.empty()) {
        throw ConversionFailure(std::string("Empty ") + ImageFormatToString(format) + " file");
    }
    try {
        switch (format) {
            case ImageFormat::Tiff:
                return DecodeTiff(encoded);
            case ImageFormat::Webp:
                return DecodeWebp(encoded);
            case ImageFormat::Png:
            case ImageFormat::Jpeg:
            case ImageFormat::Gif:
            case ImageFormat::Bmp:
                return DecodeWithStb(encoded, format);
        }
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConversionFailure(std::string("Failed to decode ") + ImageFormatToString(format) + ": " + e.what());
    }
    throw ConversionFailure("Unhandled image format");
}

std::optional<JpegHeader> RasterImageDecoder::ProbeJpeg(const std::string& encoded) {
    JpegHeader header;
    if (!stbi_info_from_memory(reinterpret_cast<const stbi_uc*>(encoded.data()), static_cast<int>(encoded.size()),
                               &header.width, &header.height, &header.components)) {
        return std::nullopt;
    }
    // CMYK/YCCK JPEGs need an Adobe decode array; those are re-encoded instead.
    if (header.components != 1 && header.components != 3) {
        return std::nullopt;
    }
    return header;
}

} // namespace marklens::infrastructure
