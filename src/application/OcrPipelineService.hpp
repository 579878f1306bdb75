/**
 * @file OcrPipelineService.hpp
 * @brief Orchestrates normalize -> recognize -> assemble -> render/export for each input file.
 */

#pragma once
#include "application/DocumentNormalizer.hpp"
#include "domain/MarkdownDocument.hpp"
#include "domain/OcrService.hpp"
#include "domain/PipelineError.hpp"
#include "infrastructure/OutputWriter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marklens::application {

/**
 * @struct ProcessedDocument
 * @brief Artifacts of one successful run.
 */
struct ProcessedDocument {
    infrastructure::ExportReceipt receipt;
    domain::MarkdownDocument markdown;
    domain::PreviewArtifact preview;
};

/**
 * @struct PipelineOutcome
 * @brief Either the processed document or the first failure, never both.
 */
struct PipelineOutcome {
    std::string sourcePath;
    std::optional<ProcessedDocument> document;
    std::optional<domain::PipelineError> error;

    bool succeeded() const { return document.has_value(); }
};

/**
 * @class OcrPipelineService
 * @brief Runs the stages of one document strictly in order.
 *
 * A failing stage ends that document's run before any later stage starts;
 * nothing is written unless every earlier stage succeeded. Batches run one
 * document after the other and a failure does not stop the batch.
 */
class OcrPipelineService {
public:
    OcrPipelineService(std::shared_ptr<domain::OcrService> ocrService,
                       infrastructure::OutputWriter writer);

    /**
     * @brief Processes a single file.
     * @param path Input path (PDF or supported image).
     * @param statusCallback Optional progress feedback.
     */
    PipelineOutcome process(const std::string& path, std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Processes files sequentially; one outcome per path, in order. */
    std::vector<PipelineOutcome> processBatch(const std::vector<std::string>& paths,
                                              std::function<void(std::string)> statusCallback = nullptr);

private:
    std::shared_ptr<domain::OcrService> m_ocrService;
    infrastructure::OutputWriter m_writer;
    DocumentNormalizer m_normalizer;
};

} // namespace marklens::application
