/**
 * @file DocumentNormalizer.cpp
 * @brief Implementation of DocumentNormalizer.
 */

#include "application/DocumentNormalizer.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/PdfWriter.hpp"
#include "infrastructure/RasterImageDecoder.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace marklens::application {

using domain::ErrorKind;
using domain::PipelineError;
using domain::PipelineStage;
using infrastructure::PdfWriter;
using infrastructure::RasterImageDecoder;

namespace {

std::string ReadAll(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize, "Could not open: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize, "Read failed: " + path);
    }
    return buffer.str();
}

} // namespace

domain::NormalizedDocument DocumentNormalizer::normalize(const domain::SourceDocument& source) const {
    try {
        return convert(source);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[DocumentNormalizer] " << source.getPath() << ": " << e.what() << std::endl;
        throw PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize,
                            "Cannot normalize " + source.getPath() + ": " + e.what());
    }
}

domain::NormalizedDocument DocumentNormalizer::convert(const domain::SourceDocument& source) const {
    domain::NormalizedDocument normalized;
    normalized.name = fs::path(source.getPath()).stem().string();

    std::string bytes = ReadAll(source.getPath());

    if (source.isPdf()) {
        normalized.pageCount = PdfWriter::CountPages(bytes);
        if (normalized.pageCount == 0) {
            throw PipelineError(ErrorKind::ConversionError, PipelineStage::Normalize,
                                "PDF has no pages: " + source.getPath());
        }
        normalized.pdfBytes = std::move(bytes);
        return normalized;
    }

    const auto format = std::get<domain::ImageInput>(source.getKind()).format;
    std::cout << "[DocumentNormalizer] Converting " << ImageFormatToString(format)
              << " image to PDF: " << source.getPath() << std::endl;

    // Full decode also validates JPEGs that are embedded without re-encoding.
    infrastructure::DecodedImage decoded = RasterImageDecoder::Decode(bytes, format);

    if (format == domain::ImageFormat::Jpeg) {
        if (auto header = RasterImageDecoder::ProbeJpeg(bytes)) {
            normalized.pdfBytes = PdfWriter::FromJpeg(bytes, *header);
        }
    }
    if (normalized.pdfBytes.empty()) {
        normalized.pdfBytes = PdfWriter::FromRaster(decoded);
    }
    normalized.pageCount = 1;
    return normalized;
}

} // namespace marklens::application
