/**
 * @file OcrResponseParser.cpp
 * @brief Implementation of OcrResponseParser.
 */

#include "infrastructure/OcrResponseParser.hpp"
#include "infrastructure/Base64.hpp"
#include "domain/PipelineError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace marklens::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

PipelineError SchemaError(const std::string& message, const std::string& body) {
    std::cerr << "[OcrResponseParser] " << message << std::endl;
    return PipelineError(ErrorKind::ServiceError, PipelineStage::Ocr,
                         "Malformed OCR response: " + message, std::nullopt, body);
}

int OptionalInt(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return 0;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("'") + key + "' is not a number");
    }
    return it->get<int>();
}

std::string MimeFromId(const std::string& id) {
    std::string lower = id;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".png") == 0) return "image/png";
    if (lower.size() >= 4 && lower.compare(lower.size() - 4, 4, ".gif") == 0) return "image/gif";
    if (lower.size() >= 5 && lower.compare(lower.size() - 5, 5, ".webp") == 0) return "image/webp";
    return "image/jpeg";
}

domain::EmbeddedImage ParseImage(const json& item, int pageIndex) {
    if (!item.is_object()) {
        throw std::invalid_argument("image entry on page " + std::to_string(pageIndex) + " is not an object");
    }
    if (!item.contains("id") || !item["id"].is_string()) {
        throw std::invalid_argument("image on page " + std::to_string(pageIndex) + " has no string 'id'");
    }

    domain::EmbeddedImage image;
    image.id = item["id"].get<std::string>();

    if (!item.contains("image_base64") || !item["image_base64"].is_string()) {
        throw std::invalid_argument("image '" + image.id + "' has no 'image_base64' payload");
    }
    auto payload = Base64::DecodeDataUri(item["image_base64"].get<std::string>());
    if (!payload) {
        throw std::invalid_argument("image '" + image.id + "' payload is not valid base64");
    }
    image.data = std::move(payload->data);
    image.mimeType = payload->mimeType.empty() ? MimeFromId(image.id) : payload->mimeType;

    image.anchor.topLeftX = OptionalInt(item, "top_left_x");
    image.anchor.topLeftY = OptionalInt(item, "top_left_y");
    image.anchor.bottomRightX = OptionalInt(item, "bottom_right_x");
    image.anchor.bottomRightY = OptionalInt(item, "bottom_right_y");
    return image;
}

domain::Page ParsePage(const json& item) {
    if (!item.is_object()) {
        throw std::invalid_argument("page entry is not an object");
    }
    if (!item.contains("index") || !item["index"].is_number_integer()) {
        throw std::invalid_argument("page has no integer 'index'");
    }
    domain::Page page;
    page.index = item["index"].get<int>();

    if (!item.contains("markdown") || !item["markdown"].is_string()) {
        throw std::invalid_argument("page " + std::to_string(page.index) + " has no string 'markdown'");
    }
    page.text = item["markdown"].get<std::string>();

    auto images = item.find("images");
    if (images != item.end() && !images->is_null()) {
        if (!images->is_array()) {
            throw std::invalid_argument("page " + std::to_string(page.index) + " 'images' is not an array");
        }
        for (const auto& image : *images) {
            page.images.push_back(ParseImage(image, page.index));
        }
    }
    return page;
}

} // namespace

domain::OcrResult OcrResponseParser::Parse(const std::string& body, std::size_t expectedPages) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::parse_error& e) {
        throw SchemaError(std::string("invalid JSON (") + e.what() + ")", body);
    }

    if (!root.is_object() || !root.contains("pages") || !root["pages"].is_array()) {
        throw SchemaError("missing 'pages' array", body);
    }

    domain::OcrResult result;
    try {
        for (const auto& item : root["pages"]) {
            result.pages.push_back(ParsePage(item));
        }
        if (root.contains("model") && root["model"].is_string()) {
            result.model = root["model"].get<std::string>();
        }
    } catch (const std::invalid_argument& e) {
        throw SchemaError(e.what(), body);
    } catch (const json::exception& e) {
        throw SchemaError(e.what(), body);
    }

    std::stable_sort(result.pages.begin(), result.pages.end(),
                     [](const domain::Page& a, const domain::Page& b) { return a.index < b.index; });
    for (std::size_t i = 0; i < result.pages.size(); ++i) {
        if (result.pages[i].index != static_cast<int>(i)) {
            throw SchemaError("page indices are not a contiguous 0-based sequence", body);
        }
    }

    if (result.pages.size() != expectedPages) {
        throw SchemaError("expected " + std::to_string(expectedPages) + " pages, got "
                          + std::to_string(result.pages.size()), body);
    }
    return result;
}

} // namespace marklens::infrastructure
