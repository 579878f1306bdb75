/**
 * @file MistralOcrClient.hpp
 * @brief OcrService implementation backed by the Mistral OCR REST API.
 */

#pragma once
#include "domain/OcrService.hpp"
#include "domain/Credential.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace marklens::infrastructure {

/**
 * @struct OcrClientSettings
 * @brief Endpoint, model and limits for the OCR client.
 */
struct OcrClientSettings {
    std::string baseUrl = "https://api.mistral.ai";
    std::string model = "mistral-ocr-latest";
    std::optional<std::chrono::seconds> timeout; ///< Unset keeps the transport defaults.
    std::size_t maxDocumentBytes = 50u * 1024u * 1024u;
    std::size_t maxPages = 1000;
};

/**
 * @class MistralOcrClient
 * @brief Sends a PDF to /v1/ocr and returns the validated structured result.
 *
 * One outbound request per recognize() call, never retried.
 */
class MistralOcrClient : public domain::OcrService {
public:
    MistralOcrClient(domain::Credential credential, OcrClientSettings settings = {});

    /** @see domain::OcrService::recognize */
    domain::OcrResult recognize(const domain::NormalizedDocument& document) override;

    const OcrClientSettings& getSettings() const { return m_settings; }

private:
    std::string buildRequestBody(const domain::NormalizedDocument& document) const;
    domain::OcrResult send(const domain::NormalizedDocument& document) const;

    domain::Credential m_credential;
    OcrClientSettings m_settings;
};

} // namespace marklens::infrastructure
