/**
 * @file PdfWriter.hpp
 * @brief qpdf based helpers for inspecting PDFs and wrapping images into single-page PDFs.
 */

#pragma once
#include "infrastructure/RasterImageDecoder.hpp"
#include <string>
#include <cstddef>

namespace marklens::infrastructure {

class PdfWriter {
public:
    /** @brief Resolution assumed for raster inputs when sizing the page. */
    static constexpr double kDefaultDpi = 96.0;

    /**
     * @brief Parses a PDF and returns its page count.
     * @throws domain::PipelineError ConversionError when qpdf cannot read the document.
     */
    static std::size_t CountPages(const std::string& pdfBytes);

    /** @brief One page, Flate-compressed samples, page box equal to the image at kDefaultDpi. */
    static std::string FromRaster(const DecodedImage& image);

    /** @brief One page carrying the JPEG stream unchanged as a DCTDecode image. */
    static std::string FromJpeg(const std::string& jpegBytes, const JpegHeader& header);
};

} // namespace marklens::infrastructure
