/**
 * @file MarkdownAssembler.cpp
 * @brief Implementation of MarkdownAssembler.
 */

#include "application/MarkdownAssembler.hpp"
#include <map>
#include <set>
#include <sstream>
#include <vector>

namespace marklens::application {

namespace {

struct PageAsset {
    std::string stem;
    std::string fileName;
};

bool IsBlank(char c) {
    return c == ' ' || c == '\t';
}

std::string Trim(const std::string& value) {
    std::size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    std::size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string TrimTrailing(const std::string& value) {
    std::size_t end = value.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

// Fence opener/closer: up to three spaces, then three or more ` or ~.
bool ReadFence(const std::string& line, char& fenceChar, std::size_t& fenceLength) {
    std::size_t pos = 0;
    while (pos < line.size() && pos < 3 && line[pos] == ' ') ++pos;
    if (pos >= line.size() || (line[pos] != '`' && line[pos] != '~')) return false;
    char c = line[pos];
    std::size_t run = 0;
    while (pos + run < line.size() && line[pos + run] == c) ++run;
    if (run < 3) return false;
    fenceChar = c;
    fenceLength = run;
    return true;
}

// Closing `\]` of a display block opened at `from`. The search stops at the
// next blank line or fence opener so an unclosed block stays literal.
std::size_t FindDisplayClose(const std::string& text, std::size_t from) {
    std::size_t lineStart = from;
    bool openingLine = true;
    while (lineStart < text.size()) {
        std::size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string::npos) lineEnd = text.size();
        const std::string line = text.substr(lineStart, lineEnd - lineStart);

        char fenceChar = 0;
        std::size_t fenceLength = 0;
        if (!openingLine && (Trim(line).empty() || ReadFence(line, fenceChar, fenceLength))) {
            return std::string::npos;
        }
        std::size_t close = line.find("\\]");
        if (close != std::string::npos) return lineStart + close;

        openingLine = false;
        lineStart = lineEnd + 1;
    }
    return std::string::npos;
}

std::string ImageMarkdown(const PageAsset& asset) {
    return "![" + asset.stem + "](" + std::string(domain::kAssetDirectory) + "/" + asset.fileName + ")";
}

// Replaces `![alt](id)` references whose destination is a known service id.
std::string RewriteImageReferences(const std::string& text,
                                   const std::map<std::string, PageAsset>& byId,
                                   std::set<std::string>& referencedIds) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t open = text.find("![", i);
        if (open == std::string::npos) break;

        std::size_t closeAlt = text.find(']', open + 2);
        if (closeAlt == std::string::npos || closeAlt + 1 >= text.size() || text[closeAlt + 1] != '(') {
            out.append(text, i, open + 2 - i);
            i = open + 2;
            continue;
        }
        std::size_t closeDest = text.find(')', closeAlt + 2);
        if (closeDest == std::string::npos) {
            out.append(text, i, open + 2 - i);
            i = open + 2;
            continue;
        }

        std::string destination = Trim(text.substr(closeAlt + 2, closeDest - closeAlt - 2));
        auto it = byId.find(destination);
        if (it == byId.end()) {
            out.append(text, i, closeDest + 1 - i);
        } else {
            out.append(text, i, open - i);
            out += ImageMarkdown(it->second);
            referencedIds.insert(destination);
        }
        i = closeDest + 1;
    }
    if (i < text.size()) out.append(text, i, std::string::npos);
    return out;
}

} // namespace

std::string MarkdownAssembler::AssetStem(int pageNumber, int imageNumber) {
    return "page-" + std::to_string(pageNumber) + "-img-" + std::to_string(imageNumber);
}

std::string MarkdownAssembler::ExtensionForMime(const std::string& mimeType) {
    if (mimeType == "image/png") return "png";
    if (mimeType == "image/gif") return "gif";
    if (mimeType == "image/webp") return "webp";
    if (mimeType == "image/bmp") return "bmp";
    if (mimeType == "image/tiff") return "tiff";
    return "jpeg";
}

std::string MarkdownAssembler::NormalizeMath(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool inFence = false;
    char fenceChar = 0;
    std::size_t fenceLength = 0;

    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const bool lineStart = (i == 0 || text[i - 1] == '\n');
        if (lineStart) {
            std::size_t lineEnd = text.find('\n', i);
            lineEnd = (lineEnd == std::string::npos) ? n : lineEnd + 1;
            const std::string line = text.substr(i, lineEnd - i);

            char c = 0;
            std::size_t length = 0;
            if (ReadFence(line, c, length)) {
                if (!inFence) {
                    inFence = true;
                    fenceChar = c;
                    fenceLength = length;
                } else if (c == fenceChar && length >= fenceLength) {
                    inFence = false;
                }
                out += line;
                i = lineEnd;
                continue;
            }
            if (inFence) {
                out += line;
                i = lineEnd;
                continue;
            }

            std::size_t p = i;
            while (p < n && IsBlank(text[p])) ++p;
            if (text.compare(p, 2, "\\[") == 0) {
                std::size_t close = FindDisplayClose(text, p + 2);
                if (close != std::string::npos) {
                    out.append(text, i, p - i);
                    out += "$$" + Trim(text.substr(p + 2, close - p - 2)) + "$$";
                    i = close + 2;
                    continue;
                }
            }
        }

        const char c = text[i];
        if (c == '`') {
            std::size_t run = 0;
            while (i + run < n && text[i + run] == '`') ++run;
            const std::string ticks(run, '`');
            std::size_t paragraphEnd = text.find("\n\n", i);
            std::size_t close = text.find(ticks, i + run);
            while (close != std::string::npos && close + run < n && text[close + run] == '`') {
                close = text.find(ticks, close + run + 1);
            }
            if (close != std::string::npos && (paragraphEnd == std::string::npos || close < paragraphEnd)) {
                out.append(text, i, close + run - i);
                i = close + run;
            } else {
                out += ticks;
                i += run;
            }
            continue;
        }

        if (c == '\\' && i + 1 < n) {
            if (text[i + 1] == '(') {
                std::size_t close = text.find("\\)", i + 2);
                std::size_t paragraphEnd = text.find("\n\n", i);
                if (close != std::string::npos && (paragraphEnd == std::string::npos || close < paragraphEnd)) {
                    out += "$" + Trim(text.substr(i + 2, close - i - 2)) + "$";
                    i = close + 2;
                    continue;
                }
            }
            // Keep every other escape pair intact, e.g. \$ or \\.
            out += c;
            out += text[i + 1];
            i += 2;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

domain::MarkdownDocument MarkdownAssembler::Assemble(const domain::OcrResult& result) {
    domain::MarkdownDocument document;
    std::ostringstream body;

    for (std::size_t p = 0; p < result.pages.size(); ++p) {
        const domain::Page& page = result.pages[p];
        const int pageNumber = static_cast<int>(p) + 1;

        std::map<std::string, PageAsset> byId;
        std::vector<std::pair<std::string, PageAsset>> ordered;
        for (std::size_t j = 0; j < page.images.size(); ++j) {
            const domain::EmbeddedImage& image = page.images[j];
            PageAsset asset;
            asset.stem = AssetStem(pageNumber, static_cast<int>(j) + 1);
            asset.fileName = asset.stem + "." + ExtensionForMime(image.mimeType);
            document.assets[asset.fileName] = image.data;
            byId.emplace(image.id, asset);
            ordered.emplace_back(image.id, asset);
        }

        std::set<std::string> referenced;
        std::string text = RewriteImageReferences(NormalizeMath(page.text), byId, referenced);
        text = TrimTrailing(text);

        // Images the page text never mentions, or duplicates of an id already taken.
        for (const auto& [id, asset] : ordered) {
            bool firstForId = byId.at(id).fileName == asset.fileName;
            if (firstForId && referenced.count(id)) continue;
            if (!text.empty()) text += "\n\n";
            text += ImageMarkdown(asset);
        }

        if (p > 0) body << "\n";
        if (!text.empty()) body << text << "\n\n";
        body << kPageBreak << "\n";
    }

    document.text = body.str();
    return document;
}

} // namespace marklens::application
