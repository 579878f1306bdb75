/**
 * @file Credential.hpp
 * @brief API key value injected into the OCR client.
 */

#pragma once
#include <string>
#include <utility>

namespace marklens::domain {

/**
 * @class Credential
 * @brief Read-only API key. Safe to share between runs.
 */
class Credential {
public:
    Credential() = default;
    explicit Credential(std::string apiKey) : m_apiKey(std::move(apiKey)) {}

    const std::string& value() const { return m_apiKey; }
    bool empty() const { return m_apiKey.empty(); }

private:
    std::string m_apiKey;
};

} // namespace marklens::domain
