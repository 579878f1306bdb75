/**
 * @file FormatDetector.cpp
 * @brief Implementation of FormatDetector.
 */

#include "infrastructure/FormatDetector.hpp"
#include "domain/PipelineError.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace marklens::infrastructure {

using domain::ErrorKind;
using domain::ImageFormat;
using domain::ImageInput;
using domain::InputKind;
using domain::PdfInput;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

// PDF readers accept a header anywhere in the first KiB.
constexpr std::size_t kSniffLength = 1024;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c){ return std::tolower(c); });
    return value;
}

bool StartsWith(const std::string& data, const std::string& prefix) {
    return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
}

const std::map<std::string, ImageFormat>& ImageExtensions() {
    static const std::map<std::string, ImageFormat> extensions = {
        {".png", ImageFormat::Png},
        {".jpg", ImageFormat::Jpeg},
        {".jpeg", ImageFormat::Jpeg},
        {".gif", ImageFormat::Gif},
        {".bmp", ImageFormat::Bmp},
        {".tif", ImageFormat::Tiff},
        {".tiff", ImageFormat::Tiff},
        {".webp", ImageFormat::Webp}
    };
    return extensions;
}

std::string DescribeKind(const InputKind& kind) {
    if (const auto* image = std::get_if<ImageInput>(&kind)) {
        return ImageFormatToString(image->format);
    }
    return "PDF";
}

bool SameKind(const InputKind& a, const InputKind& b) {
    if (a.index() != b.index()) return false;
    const auto* imageA = std::get_if<ImageInput>(&a);
    const auto* imageB = std::get_if<ImageInput>(&b);
    return !imageA || imageA->format == imageB->format;
}

} // namespace

bool FormatDetector::IsImageExtension(const std::string& extension) {
    return ImageExtensions().count(ToLower(extension)) > 0;
}

std::optional<InputKind> FormatDetector::KindFromExtension(const std::string& extension) {
    std::string ext = ToLower(extension);
    if (ext == ".pdf") {
        return InputKind{PdfInput{}};
    }
    auto it = ImageExtensions().find(ext);
    if (it != ImageExtensions().end()) {
        return InputKind{ImageInput{it->second}};
    }
    return std::nullopt;
}

std::optional<InputKind> FormatDetector::KindFromContent(const std::string& header) {
    if (StartsWith(header, "\x89PNG\r\n\x1a\n")) return InputKind{ImageInput{ImageFormat::Png}};
    if (StartsWith(header, "\xFF\xD8\xFF")) return InputKind{ImageInput{ImageFormat::Jpeg}};
    if (StartsWith(header, "GIF87a") || StartsWith(header, "GIF89a")) return InputKind{ImageInput{ImageFormat::Gif}};
    if (StartsWith(header, "BM")) return InputKind{ImageInput{ImageFormat::Bmp}};
    if (StartsWith(header, std::string("II*\0", 4)) || StartsWith(header, std::string("MM\0*", 4))) {
        return InputKind{ImageInput{ImageFormat::Tiff}};
    }
    if (header.size() >= 12 && StartsWith(header, "RIFF") && header.compare(8, 4, "WEBP") == 0) {
        return InputKind{ImageInput{ImageFormat::Webp}};
    }
    if (header.find("%PDF-") != std::string::npos) {
        return InputKind{PdfInput{}};
    }
    return std::nullopt;
}

domain::SourceDocument FormatDetector::Detect(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw PipelineError(ErrorKind::ConversionError, PipelineStage::Ingest,
                            "File not found or not a regular file: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PipelineError(ErrorKind::ConversionError, PipelineStage::Ingest, "Could not open: " + path);
    }
    std::string header(kSniffLength, '\0');
    file.read(&header[0], static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<std::size_t>(file.gcount()));

    std::string extension = fs::path(path).extension().string();
    auto byExtension = KindFromExtension(extension);
    auto byContent = KindFromContent(header);

    if (!byContent) {
        std::string what = byExtension
            ? "content does not look like " + DescribeKind(*byExtension)
            : "neither a PDF nor a supported image (" + (extension.empty() ? std::string("no extension") : extension) + ")";
        throw PipelineError(ErrorKind::UnsupportedFormat, PipelineStage::Ingest, path + ": " + what);
    }

    if (byExtension && !SameKind(*byExtension, *byContent)) {
        std::cerr << "[FormatDetector] " << path << " has extension " << extension
                  << " but contains " << DescribeKind(*byContent) << "; using content." << std::endl;
    }

    return domain::SourceDocument(path, *byContent);
}

} // namespace marklens::infrastructure
