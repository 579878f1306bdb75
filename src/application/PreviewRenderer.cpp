/**
 * @file PreviewRenderer.cpp
 * @brief md4c-html backed implementation of PreviewRenderer.
 */

#include "application/PreviewRenderer.hpp"
#include "infrastructure/Base64.hpp"
#include <md4c-html.h>
#include <iostream>

namespace marklens::application {

namespace {

constexpr unsigned kParserFlags = MD_DIALECT_GITHUB | MD_FLAG_LATEXMATHSPANS;
constexpr unsigned kRendererFlags = MD_HTML_FLAG_SKIP_UTF8_BOM;

constexpr const char* kPageHead = R"HTML(<!DOCTYPE html>
<html>
<head>
    <meta charset="utf-8">
    <title>%TITLE%</title>
    <link rel="stylesheet" href="https://cdn.jsdelivr.net/npm/github-markdown-css/github-markdown.min.css">
    <style>
        body { box-sizing: border-box; max-width: 980px; margin: 0 auto; padding: 32px; }
        .markdown-body img { max-width: 100%; }
    </style>
    <script>
    document.addEventListener('DOMContentLoaded', function () {
        document.querySelectorAll('x-equation').forEach(function (el) {
            var display = el.getAttribute('type') === 'display';
            var tex = el.textContent;
            el.replaceWith(document.createTextNode(display ? '\\[' + tex + '\\]' : '\\(' + tex + '\\)'));
        });
        if (window.MathJax && MathJax.typesetPromise) {
            MathJax.typesetPromise();
        }
    });
    </script>
    <script id="MathJax-script" async src="https://cdn.jsdelivr.net/npm/mathjax@3/es5/tex-mml-chtml.js"></script>
</head>
<body>
    <div id="content" class="markdown-body">
)HTML";

constexpr const char* kPageTail = R"HTML(
    </div>
</body>
</html>
)HTML";

void AppendChunk(const MD_CHAR* data, MD_SIZE size, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size);
}

std::string MimeForAsset(const std::string& name) {
    std::size_t dot = name.find_last_of('.');
    std::string ext = (dot == std::string::npos) ? std::string() : name.substr(dot + 1);
    if (ext == "jpg") ext = "jpeg";
    if (ext.empty()) return "application/octet-stream";
    return "image/" + ext;
}

} // namespace

std::string PreviewRenderer::EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string PreviewRenderer::InlineAssets(const domain::MarkdownDocument& document) {
    std::string text = document.text;
    for (const auto& [name, bytes] : document.assets) {
        const std::string target = "](" + std::string(domain::kAssetDirectory) + "/" + name + ")";
        const std::string replacement = "](data:" + MimeForAsset(name) + ";base64,"
                                        + infrastructure::Base64::Encode(bytes) + ")";
        std::size_t pos = 0;
        while ((pos = text.find(target, pos)) != std::string::npos) {
            text.replace(pos, target.size(), replacement);
            pos += replacement.size();
        }
    }
    return text;
}

std::string PreviewRenderer::RenderBody(const std::string& markdown) {
    std::string html;
    html.reserve(markdown.size() + markdown.size() / 2);
    int rc = md_html(markdown.data(), static_cast<MD_SIZE>(markdown.size()), AppendChunk, &html,
                     kParserFlags, kRendererFlags);
    if (rc != 0) {
        std::cerr << "[PreviewRenderer] md4c failed (" << rc << "); showing escaped source." << std::endl;
        return "<pre>" + EscapeHtml(markdown) + "</pre>\n";
    }
    return html;
}

domain::PreviewArtifact PreviewRenderer::Render(const domain::MarkdownDocument& document, const std::string& title) {
    std::string head = kPageHead;
    const std::string placeholder = "%TITLE%";
    head.replace(head.find(placeholder), placeholder.size(), EscapeHtml(title));

    domain::PreviewArtifact artifact;
    artifact.html = head + RenderBody(InlineAssets(document)) + kPageTail;
    return artifact;
}

} // namespace marklens::application
