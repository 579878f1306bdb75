#undef NDEBUG
#include <cassert>
#include <iostream>
#include <random>

#include "application/PreviewRenderer.hpp"

using namespace marklens;
using application::PreviewRenderer;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestGithubDialect() {
    std::cout << "[Test] Tables, strikethrough and task lists..." << std::endl;
    const std::string body = PreviewRenderer::RenderBody(
        "| Item | Qty |\n|------|-----|\n| Pen  | 2   |\n\n~~old~~\n\n- [x] done\n");
    assert(Contains(body, "<table>"));
    assert(Contains(body, "<td>Pen</td>"));
    assert(Contains(body, "<del>old</del>"));
    assert(Contains(body, "type=\"checkbox\""));
}

void TestMathSpans() {
    std::cout << "[Test] Math spans..." << std::endl;
    const std::string body = PreviewRenderer::RenderBody("Inline $a+b$ here.\n\n$$E=mc^2$$\n");
    assert(Contains(body, "<x-equation>a+b</x-equation>"));
    assert(Contains(body, "<x-equation type=\"display\">E=mc^2</x-equation>"));
}

void TestPageTemplate() {
    std::cout << "[Test] Page template..." << std::endl;
    domain::MarkdownDocument doc;
    doc.text = "# Heading\n\n---\n";
    auto artifact = PreviewRenderer::Render(doc, "<Q1 & Q2>");
    assert(Contains(artifact.html, "<!DOCTYPE html>"));
    assert(Contains(artifact.html, "<title>&lt;Q1 &amp; Q2&gt;</title>"));
    assert(Contains(artifact.html, "<h1>Heading</h1>"));
    assert(Contains(artifact.html, "<hr"));
    assert(Contains(artifact.html, "MathJax"));
    assert(Contains(artifact.html, "</html>"));
}

void TestInlinedAssets() {
    std::cout << "[Test] Assets inlined as data URIs..." << std::endl;
    domain::MarkdownDocument doc;
    doc.text = "![page-1-img-1](images/page-1-img-1.png)\n\n---\n";
    doc.assets["page-1-img-1.png"] = "PNG";

    const std::string inlined = PreviewRenderer::InlineAssets(doc);
    assert(inlined == "![page-1-img-1](data:image/png;base64,UE5H)\n\n---\n");

    auto artifact = PreviewRenderer::Render(doc);
    assert(Contains(artifact.html, "src=\"data:image/png;base64,UE5H\""));
    assert(!Contains(artifact.html, "images/page-1-img-1.png"));
    // The document itself is not modified.
    assert(Contains(doc.text, "images/page-1-img-1.png"));
}

void TestEscaping() {
    assert(PreviewRenderer::EscapeHtml("a<b>&\"c\"") == "a&lt;b&gt;&amp;&quot;c&quot;");
}

void TestArbitraryInputNeverThrows() {
    std::cout << "[Test] Arbitrary input..." << std::endl;
    std::mt19937 rng(1234);
    const std::string alphabet = "ab \n\t#*_`~$\\[]()<>|-!&0123456789\x01\xFF\xC3";
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
    std::uniform_int_distribution<int> length(0, 400);
    for (int round = 0; round < 200; ++round) {
        domain::MarkdownDocument doc;
        const int n = length(rng);
        for (int i = 0; i < n; ++i) doc.text += alphabet[pick(rng)];
        auto artifact = PreviewRenderer::Render(doc);
        assert(Contains(artifact.html, "</html>"));
    }
}

} // namespace

int main() {
    std::cout << "[Test] Starting PreviewRenderer Test..." << std::endl;

    TestGithubDialect();
    TestMathSpans();
    TestPageTemplate();
    TestInlinedAssets();
    TestEscaping();
    TestArbitraryInputNeverThrows();

    std::cout << "[PASS] PreviewRenderer Test." << std::endl;
    return 0;
}
