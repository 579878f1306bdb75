/**
 * @file Base64.hpp
 * @brief Base64 and data URI helpers for the OCR wire format.
 */

#pragma once
#include <string>
#include <optional>

namespace marklens::infrastructure {

class Base64 {
public:
    static std::string Encode(const std::string& bytes);

    /** @brief Decodes standard base64, ignoring whitespace. Returns nullopt on malformed input. */
    static std::optional<std::string> Decode(const std::string& text);

    struct DataUri {
        std::string mimeType;
        std::string data;
    };

    /**
     * @brief Splits "data:<mime>;base64,<payload>" and decodes the payload.
     * A bare base64 string is accepted and reported with an empty MIME type.
     */
    static std::optional<DataUri> DecodeDataUri(const std::string& uri);
};

} // namespace marklens::infrastructure
