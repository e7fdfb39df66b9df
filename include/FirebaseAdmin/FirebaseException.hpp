// include/FirebaseAdmin/FirebaseException.hpp
#ifndef FIREBASE_ADMIN_FIREBASE_EXCEPTION_HPP
#define FIREBASE_ADMIN_FIREBASE_EXCEPTION_HPP

#include <FirebaseAdmin/Http/IncomingHttpResponse.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace FirebaseAdmin {

    // Platform-wide error codes, named after the google.rpc.Code status strings.
    enum class ErrorCode {
        INVALID_ARGUMENT,
        FAILED_PRECONDITION,
        OUT_OF_RANGE,
        UNAUTHENTICATED,
        PERMISSION_DENIED,
        NOT_FOUND,
        CONFLICT,
        ABORTED,
        ALREADY_EXISTS,
        RESOURCE_EXHAUSTED,
        CANCELLED,
        DATA_LOSS,
        UNKNOWN,
        INTERNAL,
        UNAVAILABLE,
        DEADLINE_EXCEEDED,
    };

    std::string errorCodeToString(ErrorCode code);
    // Returns std::nullopt for names that are not an ErrorCode
    std::optional<ErrorCode> errorCodeFromString(const std::string& name);

    class FirebaseException : public std::runtime_error {
    public:
        FirebaseException(ErrorCode errorCode, const std::string& message,
                          std::optional<Http::IncomingHttpResponse> httpResponse = std::nullopt);

        ErrorCode getErrorCode() const noexcept { return m_errorCode; }

        // The response that caused this error; empty for transport and parse failures
        const std::optional<Http::IncomingHttpResponse>& getHttpResponse() const noexcept { return m_httpResponse; }

    private:
        ErrorCode m_errorCode;
        std::optional<Http::IncomingHttpResponse> m_httpResponse;
    };

} // namespace FirebaseAdmin

#endif // FIREBASE_ADMIN_FIREBASE_EXCEPTION_HPP
