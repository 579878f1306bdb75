#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "TestSupport.hpp"

using namespace marklens::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    auto root = marklens::test::MakeScratchDir("marklens_config");

    // Missing file: defaults.
    AppConfig defaults = ConfigLoader::Load(root / "missing.json");
    assert(defaults.ocr.baseUrl == "https://api.mistral.ai");
    assert(defaults.ocr.model == "mistral-ocr-latest");
    assert(!defaults.ocr.timeout);
    assert(defaults.ocr.maxPages == 1000);
    assert(defaults.ocr.maxDocumentBytes == 50u * 1024u * 1024u);
    assert(defaults.outputRoot == "outputs");

    // Every key applied.
    marklens::test::WriteBytes(root / "settings.json", R"({
        "api_base_url": "http://127.0.0.1:9000",
        "model": "custom-ocr",
        "timeout_seconds": 30,
        "output_root": "/tmp/ocr-out",
        "max_document_mb": 5,
        "max_pages": 10
    })");
    AppConfig full = ConfigLoader::Load(root / "settings.json");
    assert(full.ocr.baseUrl == "http://127.0.0.1:9000");
    assert(full.ocr.model == "custom-ocr");
    assert(full.ocr.timeout && full.ocr.timeout->count() == 30);
    assert(full.outputRoot == "/tmp/ocr-out");
    assert(full.ocr.maxDocumentBytes == 5u * 1024u * 1024u);
    assert(full.ocr.maxPages == 10);

    // A wrongly typed key is skipped, the others still apply.
    AppConfig partial;
    ConfigLoader::Apply(R"({"model": 42, "max_pages": 3})", partial);
    assert(partial.ocr.model == "mistral-ocr-latest");
    assert(partial.ocr.maxPages == 3);

    // Limits and timeout must be positive whole numbers.
    AppConfig limits;
    ConfigLoader::Apply(R"({"timeout_seconds": 0, "max_document_mb": -5, "max_pages": 2.5})", limits);
    assert(!limits.ocr.timeout);
    assert(limits.ocr.maxDocumentBytes == 50u * 1024u * 1024u);
    assert(limits.ocr.maxPages == 1000);

    AppConfig negativeTimeout;
    ConfigLoader::Apply(R"({"timeout_seconds": -1, "max_pages": 7})", negativeTimeout);
    assert(!negativeTimeout.ocr.timeout);
    assert(negativeTimeout.ocr.maxPages == 7);

    // Malformed JSON keeps the defaults.
    AppConfig broken;
    ConfigLoader::Apply("{ not json", broken);
    assert(broken.ocr.model == "mistral-ocr-latest");

    std::filesystem::remove_all(root);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
