// src/Http/PlatformErrorHandler.cpp
#include <FirebaseAdmin/Http/PlatformErrorHandler.hpp>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::Http {

namespace {

struct PlatformError {
    std::optional<std::string> status;
    std::optional<std::string> message;
};

PlatformError parsePlatformError(const std::string& content) {
    PlatformError platformError;
    if (content.empty()) {
        return platformError;
    }

    // allow_exceptions = false: a non-JSON body yields a discarded value instead of throwing
    nlohmann::json body = nlohmann::json::parse(content, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("error") || !body.at("error").is_object()) {
        return platformError;
    }

    const nlohmann::json& error = body.at("error");
    if (error.contains("status") && error.at("status").is_string()) {
        platformError.status = error.at("status").get<std::string>();
    }
    if (error.contains("message") && error.at("message").is_string()) {
        platformError.message = error.at("message").get<std::string>();
    }
    return platformError;
}

} // namespace

ErrorCode AbstractPlatformErrorHandler::httpStatusToErrorCode(long statusCode) {
    switch (statusCode) {
        case 400: return ErrorCode::INVALID_ARGUMENT;
        case 401: return ErrorCode::UNAUTHENTICATED;
        case 403: return ErrorCode::PERMISSION_DENIED;
        case 404: return ErrorCode::NOT_FOUND;
        case 409: return ErrorCode::CONFLICT;
        case 412: return ErrorCode::FAILED_PRECONDITION;
        case 429: return ErrorCode::RESOURCE_EXHAUSTED;
        case 500: return ErrorCode::INTERNAL;
        case 503: return ErrorCode::UNAVAILABLE;
        default: return ErrorCode::UNKNOWN;
    }
}

void AbstractPlatformErrorHandler::handleIOException(const TransportException& error) const {
    ErrorCode code = error.getKind() == TransportException::Kind::TIMEOUT
        ? ErrorCode::DEADLINE_EXCEEDED
        : ErrorCode::UNKNOWN;
    raise(FirebaseException(code, error.what()));
}

void AbstractPlatformErrorHandler::handleHttpResponseException(const IncomingHttpResponse& response) const {
    PlatformError platformError = parsePlatformError(response.content);

    ErrorCode code = httpStatusToErrorCode(response.statusCode);
    if (platformError.status) {
        if (auto statusCode = errorCodeFromString(*platformError.status)) {
            code = *statusCode;
        }
    }

    std::string message;
    if (platformError.message && !platformError.message->empty()) {
        message = *platformError.message;
    } else {
        message = "Unexpected HTTP response with status: " + std::to_string(response.statusCode) + "\n" + response.content;
    }

    raise(FirebaseException(code, message, response));
}

void AbstractPlatformErrorHandler::raise(const FirebaseException& base) const {
    createException(base);
    throw base;
}

} // namespace FirebaseAdmin::Http
