/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace marklens::infrastructure {

namespace {

constexpr std::size_t kBytesPerMegabyte = 1024u * 1024u;

// Whole positive number, or nullopt for zero, negatives, fractions and non-numbers.
std::optional<long long> PositiveInteger(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto n = value.get<unsigned long long>();
        if (n == 0 || n > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) return std::nullopt;
        return static_cast<long long>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<long long>();
        return n > 0 ? std::optional<long long>(n) : std::nullopt;
    }
    return std::nullopt;
}

} // namespace

std::filesystem::path ConfigLoader::DefaultConfigPath() {
    return PathUtils::GetConfigHome() / "marklens" / "settings.json";
}

AppConfig ConfigLoader::Load(const std::filesystem::path& configPath) {
    AppConfig config;
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open " << configPath << "; using defaults." << std::endl;
        return config;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    Apply(buffer.str(), config);
    return config;
}

void ConfigLoader::Apply(const std::string& jsonText, AppConfig& config) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings.json is not an object; using defaults." << std::endl;
        return;
    }

    // Each key is applied independently so one bad value does not discard the rest.
    auto apply = [&j](const char* key, auto&& setter) {
        if (!j.contains(key) || j[key].is_null()) return;
        try {
            setter(j[key]);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
        }
    };

    apply("api_base_url", [&](const nlohmann::json& v) { config.ocr.baseUrl = v.get<std::string>(); });
    apply("model", [&](const nlohmann::json& v) { config.ocr.model = v.get<std::string>(); });
    auto applyPositive = [&apply](const char* key, auto&& setter) {
        apply(key, [&](const nlohmann::json& v) {
            auto n = PositiveInteger(v);
            if (!n) {
                std::cerr << "[ConfigLoader] Ignoring '" << key << "': expected a positive integer, got "
                          << v.dump() << std::endl;
                return;
            }
            setter(*n);
        });
    };

    applyPositive("timeout_seconds", [&](long long n) { config.ocr.timeout = std::chrono::seconds(n); });
    apply("output_root", [&](const nlohmann::json& v) { config.outputRoot = v.get<std::string>(); });
    applyPositive("max_document_mb", [&](long long n) {
        config.ocr.maxDocumentBytes = static_cast<std::size_t>(n) * kBytesPerMegabyte;
    });
    applyPositive("max_pages", [&](long long n) { config.ocr.maxPages = static_cast<std::size_t>(n); });
}

} // namespace marklens::infrastructure
