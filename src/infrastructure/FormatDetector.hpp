/**
 * @file FormatDetector.hpp
 * @brief Resolves the input kind of a file from its extension and magic bytes.
 */

#pragma once
#include "domain/SourceDocument.hpp"
#include <string>
#include <optional>

namespace marklens::infrastructure {

class FormatDetector {
public:
    /**
     * @brief Inspects a file on disk and builds its SourceDocument.
     * @throws domain::PipelineError UnsupportedFormat when the content is neither PDF
     *         nor a supported raster image, ConversionError when the file cannot be read.
     */
    static domain::SourceDocument Detect(const std::string& path);

    /** @brief Kind implied by a file extension (case-insensitive, with the dot). */
    static std::optional<domain::InputKind> KindFromExtension(const std::string& extension);

    /** @brief Kind implied by the leading bytes of a file. */
    static std::optional<domain::InputKind> KindFromContent(const std::string& header);

    /** @brief True for extensions listed as supported raster inputs. */
    static bool IsImageExtension(const std::string& extension);
};

} // namespace marklens::infrastructure
