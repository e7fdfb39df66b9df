// src/FirebaseException.cpp
#include <FirebaseAdmin/FirebaseException.hpp>
#include <utility>

namespace FirebaseAdmin {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
        case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::CONFLICT: return "CONFLICT";
        case ErrorCode::ABORTED: return "ABORTED";
        case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case ErrorCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::DATA_LOSS: return "DATA_LOSS";
        case ErrorCode::UNKNOWN: return "UNKNOWN";
        case ErrorCode::INTERNAL: return "INTERNAL";
        case ErrorCode::UNAVAILABLE: return "UNAVAILABLE";
        case ErrorCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
    }
    return "UNKNOWN";
}

std::optional<ErrorCode> errorCodeFromString(const std::string& name) {
    if (name == "INVALID_ARGUMENT") return ErrorCode::INVALID_ARGUMENT;
    if (name == "FAILED_PRECONDITION") return ErrorCode::FAILED_PRECONDITION;
    if (name == "OUT_OF_RANGE") return ErrorCode::OUT_OF_RANGE;
    if (name == "UNAUTHENTICATED") return ErrorCode::UNAUTHENTICATED;
    if (name == "PERMISSION_DENIED") return ErrorCode::PERMISSION_DENIED;
    if (name == "NOT_FOUND") return ErrorCode::NOT_FOUND;
    if (name == "CONFLICT") return ErrorCode::CONFLICT;
    if (name == "ABORTED") return ErrorCode::ABORTED;
    if (name == "ALREADY_EXISTS") return ErrorCode::ALREADY_EXISTS;
    if (name == "RESOURCE_EXHAUSTED") return ErrorCode::RESOURCE_EXHAUSTED;
    if (name == "CANCELLED") return ErrorCode::CANCELLED;
    if (name == "DATA_LOSS") return ErrorCode::DATA_LOSS;
    if (name == "UNKNOWN") return ErrorCode::UNKNOWN;
    if (name == "INTERNAL") return ErrorCode::INTERNAL;
    if (name == "UNAVAILABLE") return ErrorCode::UNAVAILABLE;
    if (name == "DEADLINE_EXCEEDED") return ErrorCode::DEADLINE_EXCEEDED;
    return std::nullopt;
}

FirebaseException::FirebaseException(ErrorCode errorCode, const std::string& message,
                                     std::optional<Http::IncomingHttpResponse> httpResponse)
    : std::runtime_error(message), m_errorCode(errorCode), m_httpResponse(std::move(httpResponse)) {}

} // namespace FirebaseAdmin
