#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>

#include "application/OcrPipelineService.hpp"
#include "domain/PipelineError.hpp"
#include "TestSupport.hpp"

using namespace marklens;
namespace fs = std::filesystem;

namespace {

// Scripted OCR backend: one page of fixed text per input page, or a fixed failure.
class FakeOcrService : public domain::OcrService {
public:
    explicit FakeOcrService(std::string pageText) : m_pageText(std::move(pageText)) {}

    void failWith(domain::PipelineError error) { m_failure = std::move(error); }
    void crashWith(std::string message) { m_crash = std::move(message); }
    int calls() const { return m_calls; }
    std::size_t lastPageCount() const { return m_lastPageCount; }

    domain::OcrResult recognize(const domain::NormalizedDocument& document) override {
        ++m_calls;
        m_lastPageCount = document.pageCount;
        assert(document.pdfBytes.compare(0, 5, "%PDF-") == 0);
        if (m_failure) throw *m_failure;
        if (!m_crash.empty()) throw std::runtime_error(m_crash);

        domain::OcrResult result;
        for (std::size_t i = 0; i < document.pageCount; ++i) {
            domain::Page page;
            page.index = static_cast<int>(i);
            page.text = m_pageText;
            result.pages.push_back(page);
        }
        return result;
    }

private:
    std::string m_pageText;
    std::optional<domain::PipelineError> m_failure;
    std::string m_crash;
    int m_calls = 0;
    std::size_t m_lastPageCount = 0;
};

} // namespace

int main() {
    std::cout << "[Test] Starting Pipeline Scenario Test..." << std::endl;
    fs::path scratch = test::MakeScratchDir("marklens_pipeline");
    fs::path root = scratch / "outputs";

    fs::path invoice = scratch / "invoice.png";
    test::WriteBytes(invoice, test::MakePng(64, 32));
    fs::path truncated = scratch / "broken.png";
    test::WriteBytes(truncated, test::MakePng(64, 32).substr(0, 40));
    fs::path notes = scratch / "notes.txt";
    test::WriteBytes(notes, "just some plain text\n");

    // 1. Image in, Markdown directory out.
    std::cout << "[Test] Scenario: single image..." << std::endl;
    {
        auto ocr = std::make_shared<FakeOcrService>("Total: $42");
        application::OcrPipelineService pipeline(ocr, infrastructure::OutputWriter(root));

        std::vector<std::string> progress;
        auto outcome = pipeline.process(invoice.string(), [&](std::string msg) { progress.push_back(msg); });

        assert(outcome.succeeded());
        assert(!outcome.error);
        assert(ocr->calls() == 1);
        assert(ocr->lastPageCount() == 1);
        assert(!progress.empty());

        const auto& processed = *outcome.document;
        assert(processed.receipt.markdownPath == root / "invoice" / "invoice.md");
        assert(test::ReadBytes(processed.receipt.markdownPath) == "Total: $42\n\n---\n");
        assert(!fs::exists(root / "invoice" / "images"));
        assert(processed.receipt.originPath == root / "invoice" / "origin.png");
        assert(test::ReadBytes(processed.receipt.originPath) == test::ReadBytes(invoice));
        assert(processed.preview.html.find("<title>invoice</title>") != std::string::npos);
    }

    // 2. Authentication failure writes nothing.
    std::cout << "[Test] Scenario: rejected credential..." << std::endl;
    {
        auto ocr = std::make_shared<FakeOcrService>("unused");
        ocr->failWith(domain::PipelineError(domain::ErrorKind::AuthError, domain::PipelineStage::Ocr,
                                            "HTTP 401: Unauthorized", 401, R"({"message":"Unauthorized"})"));
        fs::path authRoot = scratch / "auth-outputs";
        application::OcrPipelineService pipeline(ocr, infrastructure::OutputWriter(authRoot));

        auto outcome = pipeline.process(invoice.string());
        assert(!outcome.succeeded());
        assert(outcome.error->kind() == domain::ErrorKind::AuthError);
        assert(outcome.error->document() == invoice.string());
        assert(outcome.error->httpStatus() == 401);
        assert(std::string(outcome.error->what()).find("Unauthorized") != std::string::npos);
        assert(!fs::exists(authRoot / "invoice"));
    }

    // 3. A failing file does not stop the batch.
    std::cout << "[Test] Scenario: batch with a corrupt file..." << std::endl;
    {
        auto ocr = std::make_shared<FakeOcrService>("Total: $42");
        fs::path batchRoot = scratch / "batch-outputs";
        application::OcrPipelineService pipeline(ocr, infrastructure::OutputWriter(batchRoot));

        fs::path missing = scratch / "missing.pdf";
        auto outcomes = pipeline.processBatch({truncated.string(), notes.string(), missing.string(), invoice.string()});
        assert(outcomes.size() == 4);

        assert(!outcomes[0].succeeded());
        assert(outcomes[0].error->kind() == domain::ErrorKind::ConversionError);
        assert(outcomes[0].error->stage() == domain::PipelineStage::Normalize);
        assert(outcomes[0].sourcePath == truncated.string());

        assert(!outcomes[1].succeeded());
        assert(outcomes[1].error->kind() == domain::ErrorKind::UnsupportedFormat);

        assert(!outcomes[2].succeeded());
        assert(outcomes[2].error->kind() == domain::ErrorKind::ConversionError);
        assert(outcomes[2].error->stage() == domain::PipelineStage::Ingest);

        assert(outcomes[3].succeeded());
        assert(test::ReadBytes(batchRoot / "invoice" / "invoice.md") == "Total: $42\n\n---\n");
        assert(!fs::exists(batchRoot / "broken"));

        // Only the valid document reached the OCR service.
        assert(ocr->calls() == 1);
    }

    // 4. An unexpected exception from a component fails only that document.
    std::cout << "[Test] Scenario: component throws a non-pipeline exception..." << std::endl;
    {
        auto ocr = std::make_shared<FakeOcrService>("unused");
        ocr->crashWith("socket exploded");
        fs::path crashRoot = scratch / "crash-outputs";
        application::OcrPipelineService pipeline(ocr, infrastructure::OutputWriter(crashRoot));

        auto outcomes = pipeline.processBatch({invoice.string(), invoice.string()});
        assert(outcomes.size() == 2);
        for (const auto& outcome : outcomes) {
            assert(!outcome.succeeded());
            assert(outcome.error->kind() == domain::ErrorKind::ServiceError);
            assert(outcome.error->stage() == domain::PipelineStage::Ocr);
            assert(outcome.error->message().find("socket exploded") != std::string::npos);
            assert(outcome.error->document() == invoice.string());
        }
        assert(ocr->calls() == 2);
        assert(!fs::exists(crashRoot / "invoice"));
    }

    fs::remove_all(scratch);
    std::cout << "[PASS] Pipeline Scenario Test." << std::endl;
    return 0;
}
