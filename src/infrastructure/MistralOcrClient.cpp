/**
 * @file MistralOcrClient.cpp
 * @brief Implementation of the MistralOcrClient class.
 */

#include "infrastructure/MistralOcrClient.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/OcrResponseParser.hpp"
#include "domain/PipelineError.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

using json = nlohmann::json;

namespace marklens::infrastructure {

using domain::ErrorKind;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

constexpr const char* kOcrPath = "/v1/ocr";

// Pulls a human readable message out of an error body; falls back to the raw text.
std::string ServiceMessage(const std::string& body) {
    try {
        auto parsed = json::parse(body);
        if (parsed.is_object()) {
            for (const char* key : {"message", "detail", "error"}) {
                if (parsed.contains(key)) {
                    const auto& value = parsed[key];
                    return value.is_string() ? value.get<std::string>() : value.dump();
                }
            }
        }
    } catch (const json::exception&) {
        // Not JSON; the raw body is reported below.
    }
    return body;
}

PipelineError StatusError(int status, const std::string& body) {
    std::string message = "HTTP " + std::to_string(status) + ": " + ServiceMessage(body);
    ErrorKind kind = ErrorKind::ServiceError;
    if (status == 401 || status == 403) {
        kind = ErrorKind::AuthError;
    } else if (status == 413 || status == 429) {
        kind = ErrorKind::LimitExceeded;
    }
    return PipelineError(kind, PipelineStage::Ocr, message, status, body);
}

} // namespace

MistralOcrClient::MistralOcrClient(domain::Credential credential, OcrClientSettings settings)
    : m_credential(std::move(credential)), m_settings(std::move(settings)) {}

std::string MistralOcrClient::buildRequestBody(const domain::NormalizedDocument& document) const {
    json requestData = {
        {"model", m_settings.model},
        {"document", {
            {"type", "document_url"},
            {"document_url", "data:application/pdf;base64," + Base64::Encode(document.pdfBytes)}
        }},
        {"include_image_base64", true}
    };
    if (!document.name.empty()) {
        requestData["document"]["document_name"] = document.name;
    }
    // File names are not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    return requestData.dump(-1, ' ', false, json::error_handler_t::replace);
}

domain::OcrResult MistralOcrClient::recognize(const domain::NormalizedDocument& document) {
    if (m_credential.empty()) {
        throw PipelineError(ErrorKind::AuthError, PipelineStage::Ocr,
                            "No API key configured; set MISTRAL_API_KEY or pass --api-key");
    }
    if (document.pdfBytes.size() > m_settings.maxDocumentBytes) {
        throw PipelineError(ErrorKind::LimitExceeded, PipelineStage::Ocr,
                            "Document is " + std::to_string(document.pdfBytes.size()) + " bytes; limit is "
                            + std::to_string(m_settings.maxDocumentBytes));
    }
    if (document.pageCount > m_settings.maxPages) {
        throw PipelineError(ErrorKind::LimitExceeded, PipelineStage::Ocr,
                            "Document has " + std::to_string(document.pageCount) + " pages; limit is "
                            + std::to_string(m_settings.maxPages));
    }

    try {
        return send(document);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[MistralOcrClient] Unexpected failure: " << e.what() << std::endl;
        throw PipelineError(ErrorKind::TransportError, PipelineStage::Ocr,
                            std::string("OCR request failed: ") + e.what());
    }
}

domain::OcrResult MistralOcrClient::send(const domain::NormalizedDocument& document) const {
    httplib::Client cli(m_settings.baseUrl);
    if (!cli.is_valid()) {
        throw PipelineError(ErrorKind::TransportError, PipelineStage::Ocr,
                            "Cannot create HTTP client for " + m_settings.baseUrl);
    }
    if (m_settings.timeout) {
        const auto seconds = static_cast<time_t>(m_settings.timeout->count());
        cli.set_connection_timeout(seconds, 0);
        cli.set_read_timeout(seconds, 0);
        cli.set_write_timeout(seconds, 0);
    }
    cli.set_bearer_token_auth(m_credential.value());

    std::cout << "[MistralOcrClient] Uploading " << document.pdfBytes.size() << " bytes ("
              << document.pageCount << " page(s)) to " << m_settings.baseUrl << kOcrPath << std::endl;

    auto res = cli.Post(kOcrPath, buildRequestBody(document), "application/json");
    if (!res) {
        std::string reason = httplib::to_string(res.error());
        std::cerr << "[MistralOcrClient] Connection failed: " << reason << std::endl;
        throw PipelineError(ErrorKind::TransportError, PipelineStage::Ocr,
                            "Request to " + m_settings.baseUrl + " failed: " + reason);
    }

    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[MistralOcrClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw StatusError(res->status, res->body);
    }

    return OcrResponseParser::Parse(res->body, document.pageCount);
}

} // namespace marklens::infrastructure
