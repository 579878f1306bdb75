/**
 * @file DocumentNormalizer.hpp
 * @brief Brings every supported input to a PDF the OCR stage accepts.
 */

#pragma once
#include "domain/NormalizedDocument.hpp"
#include "domain/SourceDocument.hpp"

namespace marklens::application {

/**
 * @class DocumentNormalizer
 * @brief PDFs pass through byte-for-byte; each raster image becomes its own one-page PDF.
 */
class DocumentNormalizer {
public:
    /**
     * @throws domain::PipelineError ConversionError when the file cannot be read,
     *         decoded or re-encoded.
     */
    domain::NormalizedDocument normalize(const domain::SourceDocument& source) const;

private:
    domain::NormalizedDocument convert(const domain::SourceDocument& source) const;
};

} // namespace marklens::application
