/**
 * @file NormalizedDocument.hpp
 * @brief PDF payload handed to the OCR stage.
 */

#pragma once
#include <string>
#include <cstddef>

namespace marklens::domain {

/**
 * @struct NormalizedDocument
 * @brief A valid PDF byte stream and its page count.
 *
 * Owned by a single pipeline run and dropped once recognition returns.
 */
struct NormalizedDocument {
    std::string pdfBytes;
    std::size_t pageCount = 0;
    std::string name; ///< Stem of the source file, used as upload name.
};

} // namespace marklens::domain
