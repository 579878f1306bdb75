/**
 * @file OutputWriter.cpp
 * @brief Implementation of OutputWriter.
 */

#include "infrastructure/OutputWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/PipelineError.hpp"
#include <chrono>
#include <fstream>
#include <iostream>

namespace marklens::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::PipelineError;
using domain::PipelineStage;

namespace {

PipelineError WriteFailure(const std::string& message) {
    std::cerr << "[OutputWriter] " << message << std::endl;
    return PipelineError(ErrorKind::WriteError, PipelineStage::Export, message);
}

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw WriteFailure("Failed to open " + path.string() + " for writing");
    }
    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.flush();
    if (ofs.fail()) {
        throw WriteFailure("Write failed during output: " + path.string());
    }
}

// Removes the staging directory when the export does not complete.
class StagingGuard {
public:
    explicit StagingGuard(fs::path path) : m_path(std::move(path)) {}
    ~StagingGuard() {
        if (m_active) {
            std::error_code ec;
            fs::remove_all(m_path, ec);
            if (ec) {
                std::cerr << "[OutputWriter] Could not remove staging directory " << m_path
                          << ": " << ec.message() << std::endl;
            }
        }
    }
    void release() { m_active = false; }

private:
    fs::path m_path;
    bool m_active = true;
};

} // namespace

OutputWriter::OutputWriter(fs::path outputRoot) : m_outputRoot(std::move(outputRoot)) {}

fs::path OutputWriter::resolveTargetDirectory(const std::string& stem) const {
    std::error_code ec;
    fs::path candidate = m_outputRoot / stem;
    for (int counter = 1; fs::exists(candidate, ec); ++counter) {
        candidate = m_outputRoot / (stem + "-" + std::to_string(counter));
    }
    return candidate;
}

ExportReceipt OutputWriter::write(const domain::MarkdownDocument& document, const std::string& sourceStem,
                                  const fs::path& sourceFile) const {
    const std::string stem = PathUtils::SanitizeStem(sourceStem);

    std::error_code ec;
    fs::create_directories(m_outputRoot, ec);
    if (ec) {
        throw WriteFailure("Cannot create output root " + m_outputRoot.string() + ": " + ec.message());
    }

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path staging = m_outputRoot / ("." + stem + "." + std::to_string(timestamp) + ".partial");
    if (!fs::create_directory(staging, ec) || ec) {
        throw WriteFailure("Cannot create staging directory " + staging.string()
                           + (ec ? ": " + ec.message() : std::string(" (already exists)")));
    }
    StagingGuard guard(staging);

    const std::string markdownName = stem + ".md";
    WriteFile(staging / markdownName, document.text);

    std::vector<std::string> assetNames;
    if (!document.assets.empty()) {
        fs::path imagesDir = staging / domain::kAssetDirectory;
        fs::create_directory(imagesDir, ec);
        if (ec) {
            throw WriteFailure("Cannot create " + imagesDir.string() + ": " + ec.message());
        }
        for (const auto& [name, bytes] : document.assets) {
            WriteFile(imagesDir / name, bytes);
            assetNames.push_back(name);
        }
    }

    std::string originName;
    if (!sourceFile.empty()) {
        originName = "origin" + sourceFile.extension().string();
        fs::copy_file(sourceFile, staging / originName, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw WriteFailure("Cannot copy " + sourceFile.string() + " into output: " + ec.message());
        }
    }

    fs::path target = resolveTargetDirectory(stem);
    fs::rename(staging, target, ec);
    if (ec) {
        throw WriteFailure("Cannot move output into " + target.string() + ": " + ec.message());
    }
    guard.release();

    ExportReceipt receipt;
    receipt.directory = target;
    receipt.markdownPath = target / markdownName;
    for (const auto& name : assetNames) {
        receipt.assetPaths.push_back(target / domain::kAssetDirectory / name);
    }
    if (!originName.empty()) {
        receipt.originPath = target / originName;
    }
    std::cout << "[OutputWriter] Wrote " << receipt.markdownPath.string() << " and "
              << receipt.assetPaths.size() << " asset(s)" << std::endl;
    return receipt;
}

} // namespace marklens::infrastructure
