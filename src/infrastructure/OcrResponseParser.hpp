/**
 * @file OcrResponseParser.hpp
 * @brief Validating parser for the OCR service's JSON response.
 */

#pragma once
#include "domain/OcrResult.hpp"
#include <string>
#include <cstddef>

namespace marklens::infrastructure {

class OcrResponseParser {
public:
    /**
     * @brief Parses a response body into a typed OcrResult.
     * @param body Raw HTTP body.
     * @param expectedPages Page count of the submitted PDF.
     * @throws domain::PipelineError ServiceError on malformed JSON, schema mismatch,
     *         undecodable images or a page count that differs from expectedPages.
     */
    static domain::OcrResult Parse(const std::string& body, std::size_t expectedPages);
};

} // namespace marklens::infrastructure
