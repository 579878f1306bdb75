/**
 * @file OcrPipelineService.cpp
 * @brief Implementation of OcrPipelineService.
 */

#include "application/OcrPipelineService.hpp"
#include "application/MarkdownAssembler.hpp"
#include "application/PreviewRenderer.hpp"
#include "infrastructure/FormatDetector.hpp"
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace marklens::application {

namespace {

domain::ErrorKind KindForStage(domain::PipelineStage stage) {
    switch (stage) {
        case domain::PipelineStage::Ocr:
            return domain::ErrorKind::ServiceError;
        case domain::PipelineStage::Export:
            return domain::ErrorKind::WriteError;
        default:
            return domain::ErrorKind::ConversionError;
    }
}

} // namespace

OcrPipelineService::OcrPipelineService(std::shared_ptr<domain::OcrService> ocrService,
                                       infrastructure::OutputWriter writer)
    : m_ocrService(std::move(ocrService)), m_writer(std::move(writer)) {}

PipelineOutcome OcrPipelineService::process(const std::string& path, std::function<void(std::string)> statusCallback) {
    PipelineOutcome outcome;
    outcome.sourcePath = path;
    domain::PipelineStage stage = domain::PipelineStage::Ingest;

    try {
        if (statusCallback) statusCallback("Detecting format: " + path);
        domain::SourceDocument source = infrastructure::FormatDetector::Detect(path);

        domain::OcrResult ocrResult;
        {
            stage = domain::PipelineStage::Normalize;
            if (statusCallback) statusCallback("Normalizing: " + path);
            domain::NormalizedDocument normalized = m_normalizer.normalize(source);

            stage = domain::PipelineStage::Ocr;
            if (statusCallback) statusCallback("Running OCR (" + std::to_string(normalized.pageCount) + " page(s))");
            ocrResult = m_ocrService->recognize(normalized);
        } // The PDF payload is released here.

        stage = domain::PipelineStage::Assemble;
        if (statusCallback) statusCallback("Assembling Markdown");
        domain::MarkdownDocument markdown = MarkdownAssembler::Assemble(ocrResult);

        const std::string stem = fs::path(path).stem().string();
        stage = domain::PipelineStage::Render;
        domain::PreviewArtifact preview = PreviewRenderer::Render(markdown, stem);

        stage = domain::PipelineStage::Export;
        if (statusCallback) statusCallback("Writing output");
        infrastructure::ExportReceipt receipt = m_writer.write(markdown, stem, path);

        outcome.document = ProcessedDocument{std::move(receipt), std::move(markdown), std::move(preview)};
    } catch (const domain::PipelineError& e) {
        outcome.error = e.withDocument(path);
        std::cerr << "[OcrPipeline] Stage " << domain::PipelineStageToString(e.stage())
                  << " failed: " << outcome.error->what() << std::endl;
    } catch (const std::exception& e) {
        // Components map their own failures; anything else still ends only this document.
        outcome.error = domain::PipelineError(KindForStage(stage), stage, e.what()).withDocument(path);
        std::cerr << "[OcrPipeline] Stage " << domain::PipelineStageToString(stage)
                  << " failed unexpectedly: " << outcome.error->what() << std::endl;
    }
    return outcome;
}

std::vector<PipelineOutcome> OcrPipelineService::processBatch(const std::vector<std::string>& paths,
                                                              std::function<void(std::string)> statusCallback) {
    std::vector<PipelineOutcome> outcomes;
    outcomes.reserve(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (statusCallback) {
            statusCallback("Processing " + std::to_string(i + 1) + "/" + std::to_string(paths.size()) + ": " + paths[i]);
        }
        outcomes.push_back(process(paths[i], statusCallback));
    }
    return outcomes;
}

} // namespace marklens::application
