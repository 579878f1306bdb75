/**
 * @file PipelineError.hpp
 * @brief Error taxonomy shared by every pipeline stage.
 */

#pragma once
#include <string>
#include <optional>
#include <stdexcept>

namespace marklens::domain {

/**
 * @enum ErrorKind
 * @brief Failure classes. All of them end the run of a single document.
 */
enum class ErrorKind {
    UnsupportedFormat,
    ConversionError,
    AuthError,
    TransportError,
    ServiceError,
    LimitExceeded,
    WriteError
};

/**
 * @enum PipelineStage
 * @brief Stage in which a failure was detected.
 */
enum class PipelineStage {
    Ingest,
    Normalize,
    Ocr,
    Assemble,
    Render,
    Export
};

std::string ErrorKindToString(ErrorKind kind);
std::string PipelineStageToString(PipelineStage stage);

/**
 * @class PipelineError
 * @brief Typed failure raised by a pipeline component.
 *
 * The message is kept verbatim, including raw service responses, so the
 * shell can display it unchanged.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, PipelineStage stage, const std::string& message,
                  std::optional<int> httpStatus = std::nullopt, std::string responseBody = {});

    ErrorKind kind() const { return m_kind; }
    PipelineStage stage() const { return m_stage; }
    const std::string& message() const { return m_message; }
    const std::string& document() const { return m_document; }
    std::optional<int> httpStatus() const { return m_httpStatus; }
    const std::string& responseBody() const { return m_responseBody; }

    /** @brief Copy of this error annotated with the document that produced it. */
    PipelineError withDocument(const std::string& documentPath) const;

    const char* what() const noexcept override { return m_formatted.c_str(); }

private:
    void format();

    ErrorKind m_kind;
    PipelineStage m_stage;
    std::string m_message;
    std::string m_document;
    std::optional<int> m_httpStatus;
    std::string m_responseBody;
    std::string m_formatted;
};

} // namespace marklens::domain
