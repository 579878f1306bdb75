/**
 * @file SourceDocument.hpp
 * @brief Immutable record of a user-selected input file and its resolved kind.
 */

#pragma once
#include <string>
#include <utility>
#include <chrono>
#include <variant>

namespace marklens::domain {

/**
 * @enum ImageFormat
 * @brief Raster formats accepted by the normalizer.
 */
enum class ImageFormat {
    Png,
    Jpeg,
    Gif,
    Bmp,
    Tiff,
    Webp
};

inline const char* ImageFormatToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "PNG";
        case ImageFormat::Jpeg: return "JPEG";
        case ImageFormat::Gif: return "GIF";
        case ImageFormat::Bmp: return "BMP";
        case ImageFormat::Tiff: return "TIFF";
        case ImageFormat::Webp: return "WEBP";
    }
    return "unknown";
}

struct PdfInput {};

struct ImageInput {
    ImageFormat format;
};

/** @brief Input kind resolved once at ingestion and carried through the pipeline. */
using InputKind = std::variant<PdfInput, ImageInput>;

/**
 * @class SourceDocument
 * @brief A file selected by the shell. Never modified after detection.
 */
class SourceDocument {
public:
    SourceDocument(std::string path, InputKind kind,
                   std::chrono::system_clock::time_point detectedAt = std::chrono::system_clock::now())
        : m_path(std::move(path)), m_kind(kind), m_detectedAt(detectedAt) {}

    const std::string& getPath() const { return m_path; }
    const InputKind& getKind() const { return m_kind; }
    std::chrono::system_clock::time_point getDetectedAt() const { return m_detectedAt; }

    bool isPdf() const { return std::holds_alternative<PdfInput>(m_kind); }

private:
    std::string m_path;
    InputKind m_kind;
    std::chrono::system_clock::time_point m_detectedAt;
};

} // namespace marklens::domain
