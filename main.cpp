#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/OcrPipelineService.hpp"
#include "domain/Credential.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/MistralOcrClient.hpp"
#include "infrastructure/OutputWriter.hpp"
#include "infrastructure/PathUtils.hpp"

namespace fs = std::filesystem;
using namespace marklens;

namespace {

struct CliOptions {
    std::string apiKey;
    std::string outputRoot;
    std::string model;
    std::string configPath;
    long timeoutSeconds = 0;
    bool preview = false;
    bool quiet = false;
    std::vector<std::string> files;
};

void WritePreview(const application::PipelineOutcome& outcome) {
    fs::path htmlPath = infrastructure::PathUtils::GetPreviewDir()
                        / (outcome.document->receipt.directory.filename().string() + ".html");
    std::ofstream out(htmlPath, std::ios::binary | std::ios::trunc);
    out << outcome.document->preview.html;
    out.flush();
    if (out.fail()) {
        std::cerr << "[Preview] Could not write " << htmlPath << std::endl;
        return;
    }
    std::cout << "Preview: " << htmlPath.string() << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"MarkLens - OCR PDFs and images into Markdown via the Mistral OCR API"};
    CliOptions options;

    app.set_version_flag("--version", "0.1.0");
    auto* apiKeyOpt = app.add_option("--api-key", options.apiKey,
                                     "Mistral API key (defaults to $MISTRAL_API_KEY).");
    auto* outputOpt = app.add_option("-o,--output", options.outputRoot,
                                     "Directory that receives one folder per processed document.");
    auto* modelOpt = app.add_option("--model", options.model, "OCR model name.");
    auto* timeoutOpt = app.add_option("--timeout", options.timeoutSeconds,
                                      "Network timeout in seconds for the OCR request.")
                           ->check(CLI::PositiveNumber);
    app.add_option("--config", options.configPath, "Path to settings.json.")
        ->check(CLI::ExistingFile);
    app.add_flag("--preview", options.preview, "Write an HTML preview of each result to the temp directory.");
    app.add_flag("-q,--quiet", options.quiet, "Only print results and failures.");
    // Missing files are reported per document so the rest of the batch still runs.
    app.add_option("files", options.files, "PDF or image files to process.")
        ->required();

    CLI11_PARSE(app, argc, argv);

    fs::path configPath = options.configPath.empty()
        ? infrastructure::ConfigLoader::DefaultConfigPath()
        : fs::path(options.configPath);
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configPath);

    if (*outputOpt) config.outputRoot = options.outputRoot;
    if (*modelOpt) config.ocr.model = options.model;
    if (*timeoutOpt) config.ocr.timeout = std::chrono::seconds(options.timeoutSeconds);

    std::string apiKey = options.apiKey;
    if (!*apiKeyOpt) {
        const char* envKey = std::getenv("MISTRAL_API_KEY");
        if (envKey) apiKey = envKey;
    }
    if (apiKey.empty()) {
        std::cerr << "No API key: set MISTRAL_API_KEY or pass --api-key." << std::endl;
        return 1;
    }

    auto ocrClient = std::make_shared<infrastructure::MistralOcrClient>(domain::Credential(apiKey), config.ocr);
    application::OcrPipelineService pipeline(ocrClient, infrastructure::OutputWriter(config.outputRoot));

    std::function<void(std::string)> status;
    if (!options.quiet) {
        status = [](const std::string& message) { std::cout << "[MarkLens] " << message << std::endl; };
    }

    int failures = 0;
    for (std::size_t i = 0; i < options.files.size(); ++i) {
        const std::string& file = options.files[i];
        std::cout << "Processing " << (i + 1) << "/" << options.files.size() << ": " << file << std::endl;

        application::PipelineOutcome outcome = pipeline.process(file, status);
        if (!outcome.succeeded()) {
            ++failures;
            std::cerr << "FAILED " << outcome.error->what() << std::endl;
            continue;
        }

        std::cout << "Done: " << outcome.document->receipt.markdownPath.string() << std::endl;
        if (options.preview) {
            WritePreview(outcome);
        }
    }

    if (options.files.size() > 1) {
        std::cout << (options.files.size() - static_cast<std::size_t>(failures)) << " succeeded, " << failures << " failed." << std::endl;
    }
    return failures == 0 ? 0 : 1;
}
