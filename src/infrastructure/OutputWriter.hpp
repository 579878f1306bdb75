/**
 * @file OutputWriter.hpp
 * @brief Persists a MarkdownDocument and its assets into a per-document directory.
 */

#pragma once
#include "domain/MarkdownDocument.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace marklens::infrastructure {

/**
 * @struct ExportReceipt
 * @brief Locations written by a successful export.
 */
struct ExportReceipt {
    std::filesystem::path directory;
    std::filesystem::path markdownPath;
    std::vector<std::filesystem::path> assetPaths;
    std::filesystem::path originPath; ///< Copy of the input file; empty when none was given.
};

/**
 * @class OutputWriter
 * @brief Writes `<root>/<stem>/<stem>.md` plus `images/` atomically.
 *
 * When the source file is given, a copy is kept beside the Markdown as
 * `origin.<ext>` so the output records what it was produced from.
 *
 * Everything is staged in a hidden sibling directory and renamed into place
 * only when every file is written, so a failed export leaves no directory
 * that looks complete. An existing `<stem>` directory is never overwritten;
 * the new one gets a `-1`, `-2`, ... suffix.
 */
class OutputWriter {
public:
    explicit OutputWriter(std::filesystem::path outputRoot);

    /**
     * @brief Exports a document.
     * @param document Markdown text and assets.
     * @param sourceStem Stem of the source file; sanitized before use.
     * @param sourceFile Input file to copy as `origin.<ext>`; skipped when empty.
     * @throws domain::PipelineError WriteError on any filesystem failure.
     */
    ExportReceipt write(const domain::MarkdownDocument& document, const std::string& sourceStem,
                        const std::filesystem::path& sourceFile = {}) const;

    const std::filesystem::path& getOutputRoot() const { return m_outputRoot; }

private:
    std::filesystem::path resolveTargetDirectory(const std::string& stem) const;

    std::filesystem::path m_outputRoot;
};

} // namespace marklens::infrastructure
