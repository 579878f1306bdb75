/**
 * @file RasterImageDecoder.hpp
 * @brief Decodes supported raster formats into 8-bit samples ready for PDF embedding.
 */

#pragma once
#include "domain/SourceDocument.hpp"
#include <string>
#include <optional>

namespace marklens::infrastructure {

/**
 * @struct DecodedImage
 * @brief Interleaved 8-bit samples, 1 (gray) or 3 (RGB) components, alpha already flattened.
 */
struct DecodedImage {
    int width = 0;
    int height = 0;
    int components = 0;
    std::string samples;
};

/**
 * @struct JpegHeader
 * @brief Geometry of a JPEG stream that can be embedded without re-encoding.
 */
struct JpegHeader {
    int width = 0;
    int height = 0;
    int components = 0;
};

class RasterImageDecoder {
public:
    /**
     * @brief Decodes an encoded image.
     * @throws domain::PipelineError ConversionError on corrupt data or unsupported layouts.
     */
    static DecodedImage Decode(const std::string& encoded, domain::ImageFormat format);

    /**
     * @brief Reads JPEG geometry. Returns nullopt when the stream is not a
     *        gray or RGB baseline/progressive JPEG that PDF can carry as-is.
     */
    static std::optional<JpegHeader> ProbeJpeg(const std::string& encoded);
};

} // namespace marklens::infrastructure
