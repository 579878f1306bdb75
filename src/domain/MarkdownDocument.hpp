/**
 * @file MarkdownDocument.hpp
 * @brief Exportable Markdown artifact and its derived preview.
 */

#pragma once
#include <string>
#include <map>

namespace marklens::domain {

/** @brief Directory, relative to the Markdown file, holding image assets. */
inline constexpr const char* kAssetDirectory = "images";

/**
 * @struct MarkdownDocument
 * @brief Markdown text plus the image assets it references by name.
 *
 * Asset keys are file names; the text references them as
 * `images/<key>`. Every key is referenced at least once.
 */
struct MarkdownDocument {
    std::string text;
    std::map<std::string, std::string> assets; ///< name -> bytes
};

/**
 * @struct PreviewArtifact
 * @brief Standalone HTML rendering of a MarkdownDocument. Never persisted by the pipeline.
 */
struct PreviewArtifact {
    std::string html;
};

} // namespace marklens::domain
