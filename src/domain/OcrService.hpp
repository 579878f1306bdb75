/**
 * @file OcrService.hpp
 * @brief Interface for remote document recognition.
 */

#pragma once
#include "domain/NormalizedDocument.hpp"
#include "domain/OcrResult.hpp"

namespace marklens::domain {

/**
 * @class OcrService
 * @brief Abstract interface for services that turn a PDF into structured pages.
 */
class OcrService {
public:
    virtual ~OcrService() = default;

    /**
     * @brief Recognizes every page of a normalized document.
     * @param document A valid PDF and its page count.
     * @return The full result; page count equals document.pageCount.
     * @throws PipelineError AuthError, TransportError, ServiceError or LimitExceeded.
     */
    virtual OcrResult recognize(const NormalizedDocument& document) = 0;
};

} // namespace marklens::domain
