/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of settings out of the pipeline; the result is passed
 * into components at construction time.
 */

#pragma once

#include "infrastructure/MistralOcrClient.hpp"
#include <filesystem>
#include <string>

namespace marklens::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective configuration after file values are applied over defaults.
 */
struct AppConfig {
    OcrClientSettings ocr;
    std::filesystem::path outputRoot = "outputs";
};

class ConfigLoader {
public:
    /** @brief $XDG_CONFIG_HOME/marklens/settings.json (or the HOME fallback). */
    static std::filesystem::path DefaultConfigPath();

    /**
     * @brief Reads settings.json. A missing file yields defaults; a malformed file
     *        is reported on stderr and the readable keys are still applied.
     */
    static AppConfig Load(const std::filesystem::path& configPath);

    /** @brief Applies the keys present in a parsed JSON object over `config`. */
    static void Apply(const std::string& jsonText, AppConfig& config);
};

} // namespace marklens::infrastructure
