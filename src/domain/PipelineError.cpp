/**
 * @file PipelineError.cpp
 * @brief Implementation of PipelineError.
 */

#include "domain/PipelineError.hpp"
#include <sstream>

namespace marklens::domain {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::ConversionError: return "ConversionError";
        case ErrorKind::AuthError: return "AuthError";
        case ErrorKind::TransportError: return "TransportError";
        case ErrorKind::ServiceError: return "ServiceError";
        case ErrorKind::LimitExceeded: return "LimitExceeded";
        case ErrorKind::WriteError: return "WriteError";
    }
    return "UnknownError";
}

std::string PipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Ingest: return "ingest";
        case PipelineStage::Normalize: return "normalize";
        case PipelineStage::Ocr: return "ocr";
        case PipelineStage::Assemble: return "assemble";
        case PipelineStage::Render: return "render";
        case PipelineStage::Export: return "export";
    }
    return "unknown";
}

PipelineError::PipelineError(ErrorKind kind, PipelineStage stage, const std::string& message,
                             std::optional<int> httpStatus, std::string responseBody)
    : std::runtime_error(message),
      m_kind(kind),
      m_stage(stage),
      m_message(message),
      m_httpStatus(httpStatus),
      m_responseBody(std::move(responseBody)) {
    format();
}

PipelineError PipelineError::withDocument(const std::string& documentPath) const {
    PipelineError copy(*this);
    copy.m_document = documentPath;
    copy.format();
    return copy;
}

void PipelineError::format() {
    std::ostringstream ss;
    ss << ErrorKindToString(m_kind) << " [" << PipelineStageToString(m_stage) << "]";
    if (!m_document.empty()) {
        ss << " " << m_document;
    }
    ss << ": " << m_message;
    m_formatted = ss.str();
}

} // namespace marklens::domain
