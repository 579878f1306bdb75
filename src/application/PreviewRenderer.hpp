/**
 * @file PreviewRenderer.hpp
 * @brief Renders a MarkdownDocument into a standalone HTML preview page.
 */

#pragma once
#include "domain/MarkdownDocument.hpp"
#include <string>

namespace marklens::application {

/**
 * @class PreviewRenderer
 * @brief Fixed configuration: GitHub dialect (tables, strikethrough, task lists,
 *        autolinks) and LaTeX math spans matching MarkdownAssembler's `$`/`$$`.
 *
 * Assets are inlined as data URIs so the page depends only on the document.
 * Rendering never throws for any input text.
 */
class PreviewRenderer {
public:
    static domain::PreviewArtifact Render(const domain::MarkdownDocument& document,
                                          const std::string& title = "Markdown Preview");

    /** @brief Markdown body converted to an HTML fragment (no page template). */
    static std::string RenderBody(const std::string& markdown);

    /** @brief Replaces `images/<name>` destinations with data URIs of the asset bytes. */
    static std::string InlineAssets(const domain::MarkdownDocument& document);

    static std::string EscapeHtml(const std::string& text);
};

} // namespace marklens::application
