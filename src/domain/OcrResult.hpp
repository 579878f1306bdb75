/**
 * @file OcrResult.hpp
 * @brief Typed schema of a structured OCR response.
 */

#pragma once
#include <string>
#include <vector>

namespace marklens::domain {

/**
 * @struct ImageAnchor
 * @brief Bounding box of an embedded image on its page, in service pixels.
 */
struct ImageAnchor {
    int topLeftX = 0;
    int topLeftY = 0;
    int bottomRightX = 0;
    int bottomRightY = 0;
};

/**
 * @struct EmbeddedImage
 * @brief An image cut out of a page by the OCR service.
 */
struct EmbeddedImage {
    std::string id;        ///< Identifier used by the service inside the page text.
    std::string mimeType;  ///< e.g. "image/jpeg".
    std::string data;      ///< Decoded binary payload.
    ImageAnchor anchor;
};

/**
 * @struct Page
 * @brief Recognized content of one page.
 */
struct Page {
    int index = 0;                     ///< Zero-based page index as reported by the service.
    std::string text;                  ///< Markdown text with inline math markers.
    std::vector<EmbeddedImage> images; ///< In order of appearance.
};

/**
 * @struct OcrResult
 * @brief Ordered pages of one recognized document. Immutable after parsing.
 */
struct OcrResult {
    std::vector<Page> pages;
    std::string model; ///< Model that produced the result, if reported.
};

} // namespace marklens::domain
