/**
 * @file MarkdownAssembler.hpp
 * @brief Turns an OcrResult into a single Markdown document with named image assets.
 */

#pragma once
#include "domain/MarkdownDocument.hpp"
#include "domain/OcrResult.hpp"
#include <string>

namespace marklens::application {

/**
 * @class MarkdownAssembler
 * @brief Pure, deterministic concatenation of OCR pages.
 *
 * Each page contributes its text followed by a thematic break (`---`), so the
 * page count stays visible even for empty pages. Service image ids are
 * replaced with `images/page-{p}-img-{n}.{ext}`; images the text never
 * mentions are appended after the page text.
 */
class MarkdownAssembler {
public:
    static constexpr const char* kPageBreak = "---";

    static domain::MarkdownDocument Assemble(const domain::OcrResult& result);

    /**
     * @brief Rewrites `\(..\)` to `$..$` and line-leading `\[..\]` to `$$..$$`.
     *
     * Existing dollar delimiters, code spans and fenced blocks are left untouched.
     */
    static std::string NormalizeMath(const std::string& text);

    /** @brief Base name (no extension) of the n-th image on page p, both 1-based. */
    static std::string AssetStem(int pageNumber, int imageNumber);

    /** @brief File extension (without dot) for an image MIME type. */
    static std::string ExtensionForMime(const std::string& mimeType);
};

} // namespace marklens::application
