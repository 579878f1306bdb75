#undef NDEBUG
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "domain/PipelineError.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/MistralOcrClient.hpp"

using namespace marklens;
using infrastructure::MistralOcrClient;
using infrastructure::OcrClientSettings;
using json = nlohmann::json;

namespace {

// Loopback stand-in for the OCR endpoint. Each test installs its own handler.
class FakeOcrServer {
public:
    explicit FakeOcrServer(httplib::Server::Handler handler) {
        m_server.Post("/v1/ocr", [this, handler](const httplib::Request& req, httplib::Response& res) {
            ++m_requests;
            m_lastAuthorization = req.get_header_value("Authorization");
            m_lastBody = req.body;
            handler(req, res);
        });
        m_port = m_server.bind_to_any_port("127.0.0.1");
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        m_server.wait_until_ready();
    }

    ~FakeOcrServer() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(m_port); }
    int requests() const { return m_requests.load(); }
    const std::string& lastAuthorization() const { return m_lastAuthorization; }
    const std::string& lastBody() const { return m_lastBody; }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port = 0;
    std::atomic<int> m_requests{0};
    std::string m_lastAuthorization;
    std::string m_lastBody;
};

domain::NormalizedDocument SampleDocument(std::size_t pages = 1) {
    domain::NormalizedDocument doc;
    doc.pdfBytes = "%PDF-1.4\n%fake\n";
    doc.pageCount = pages;
    doc.name = "invoice";
    return doc;
}

OcrClientSettings SettingsFor(const FakeOcrServer& server) {
    OcrClientSettings settings;
    settings.baseUrl = server.baseUrl();
    settings.model = "mistral-ocr-test";
    settings.timeout = std::chrono::seconds(1);
    return settings;
}

domain::PipelineError ExpectFailure(MistralOcrClient& client, const domain::NormalizedDocument& doc) {
    try {
        client.recognize(doc);
    } catch (const domain::PipelineError& e) {
        assert(e.stage() == domain::PipelineStage::Ocr);
        return e;
    }
    assert(false && "recognize should have failed");
    return domain::PipelineError(domain::ErrorKind::ServiceError, domain::PipelineStage::Ocr, "unreachable");
}

void TestSuccessfulRequest() {
    std::cout << "[Test] Successful request..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        json body = {
            {"model", "mistral-ocr-test"},
            {"pages", {{{"index", 0}, {"markdown", "Total: $42"}, {"images", json::array()}}}}
        };
        res.set_content(body.dump(), "application/json");
    });

    MistralOcrClient client(domain::Credential("secret-key"), SettingsFor(server));
    domain::OcrResult result = client.recognize(SampleDocument());

    assert(result.pages.size() == 1);
    assert(result.pages[0].text == "Total: $42");
    assert(server.requests() == 1);
    assert(server.lastAuthorization() == "Bearer secret-key");

    auto sent = json::parse(server.lastBody());
    assert(sent["model"] == "mistral-ocr-test");
    assert(sent["include_image_base64"] == true);
    assert(sent["document"]["type"] == "document_url");
    assert(sent["document"]["document_name"] == "invoice");
    const std::string url = sent["document"]["document_url"];
    auto decoded = infrastructure::Base64::DecodeDataUri(url);
    assert(decoded);
    assert(decoded->mimeType == "application/pdf");
    assert(decoded->data == SampleDocument().pdfBytes);
}

void TestNonUtf8DocumentName() {
    std::cout << "[Test] Latin-1 file name..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        json body = {{"pages", {{{"index", 0}, {"markdown", "CV"}, {"images", json::array()}}}}};
        res.set_content(body.dump(), "application/json");
    });

    domain::NormalizedDocument doc = SampleDocument();
    doc.name = "r\xe9sum\xe9";
    MistralOcrClient client(domain::Credential("k"), SettingsFor(server));
    domain::OcrResult result = client.recognize(doc);

    assert(result.pages.size() == 1);
    assert(server.requests() == 1);
    auto sent = json::parse(server.lastBody());
    assert(sent["document"]["document_name"] == "r\xEF\xBF\xBDsum\xEF\xBF\xBD");
}

void TestEmptyCredentialMakesNoCall() {
    std::cout << "[Test] Empty credential..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("{}", "application/json");
    });
    MistralOcrClient client(domain::Credential(""), SettingsFor(server));
    auto error = ExpectFailure(client, SampleDocument());
    assert(error.kind() == domain::ErrorKind::AuthError);
    assert(server.requests() == 0);
}

void TestStatusMapping() {
    std::cout << "[Test] HTTP status mapping..." << std::endl;
    struct Case { int status; domain::ErrorKind kind; };
    for (const Case& c : {Case{401, domain::ErrorKind::AuthError},
                          Case{403, domain::ErrorKind::AuthError},
                          Case{413, domain::ErrorKind::LimitExceeded},
                          Case{429, domain::ErrorKind::LimitExceeded},
                          Case{500, domain::ErrorKind::ServiceError}}) {
        const std::string payload = R"({"message":"status )" + std::to_string(c.status) + R"("})";
        FakeOcrServer server([&](const httplib::Request&, httplib::Response& res) {
            res.status = c.status;
            res.set_content(payload, "application/json");
        });
        MistralOcrClient client(domain::Credential("k"), SettingsFor(server));
        auto error = ExpectFailure(client, SampleDocument());
        assert(error.kind() == c.kind);
        assert(error.httpStatus() && *error.httpStatus() == c.status);
        assert(error.responseBody() == payload);
        assert(error.message().find("status " + std::to_string(c.status)) != std::string::npos);
        assert(server.requests() == 1);
    }
}

void TestMalformedSuccessBody() {
    std::cout << "[Test] Malformed 200 body..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("not json at all", "text/plain");
    });
    MistralOcrClient client(domain::Credential("k"), SettingsFor(server));
    auto error = ExpectFailure(client, SampleDocument());
    assert(error.kind() == domain::ErrorKind::ServiceError);
    assert(error.responseBody() == "not json at all");
}

void TestTimeout() {
    std::cout << "[Test] Read timeout..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        res.set_content("{}", "application/json");
    });
    MistralOcrClient client(domain::Credential("k"), SettingsFor(server));
    auto error = ExpectFailure(client, SampleDocument());
    assert(error.kind() == domain::ErrorKind::TransportError);
    assert(!error.httpStatus());
}

void TestConnectionRefused() {
    std::cout << "[Test] Unreachable endpoint..." << std::endl;
    std::string deadUrl;
    {
        FakeOcrServer server([](const httplib::Request&, httplib::Response&) {});
        deadUrl = server.baseUrl();
    }
    OcrClientSettings settings;
    settings.baseUrl = deadUrl;
    settings.timeout = std::chrono::seconds(1);
    MistralOcrClient client(domain::Credential("k"), settings);
    auto error = ExpectFailure(client, SampleDocument());
    assert(error.kind() == domain::ErrorKind::TransportError);
}

void TestPreflightLimits() {
    std::cout << "[Test] Size and page limits..." << std::endl;
    FakeOcrServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("{}", "application/json");
    });

    OcrClientSettings settings = SettingsFor(server);
    settings.maxDocumentBytes = 4;
    MistralOcrClient tooLarge(domain::Credential("k"), settings);
    assert(ExpectFailure(tooLarge, SampleDocument()).kind() == domain::ErrorKind::LimitExceeded);

    settings = SettingsFor(server);
    settings.maxPages = 2;
    MistralOcrClient tooLong(domain::Credential("k"), settings);
    assert(ExpectFailure(tooLong, SampleDocument(3)).kind() == domain::ErrorKind::LimitExceeded);

    assert(server.requests() == 0);
}

} // namespace

int main() {
    std::cout << "[Test] Starting MistralOcrClient Test..." << std::endl;

    TestSuccessfulRequest();
    TestNonUtf8DocumentName();
    TestEmptyCredentialMakesNoCall();
    TestStatusMapping();
    TestMalformedSuccessBody();
    TestTimeout();
    TestConnectionRefused();
    TestPreflightLimits();

    std::cout << "[PASS] MistralOcrClient Test." << std::endl;
    return 0;
}
