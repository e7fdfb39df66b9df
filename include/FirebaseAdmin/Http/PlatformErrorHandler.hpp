// include/FirebaseAdmin/Http/PlatformErrorHandler.hpp
#ifndef FIREBASE_ADMIN_PLATFORM_ERROR_HANDLER_HPP
#define FIREBASE_ADMIN_PLATFORM_ERROR_HANDLER_HPP

#include <FirebaseAdmin/FirebaseException.hpp>
#include <FirebaseAdmin/Http/HttpTransport.hpp>
#include <FirebaseAdmin/Http/IncomingHttpResponse.hpp>

namespace FirebaseAdmin::Http {

    // Turns failed exchanges into exceptions. Both handlers always throw.
    class HttpErrorHandler {
    public:
        virtual ~HttpErrorHandler() = default;

        [[noreturn]] virtual void handleIOException(const TransportException& error) const = 0;
        [[noreturn]] virtual void handleHttpResponseException(const IncomingHttpResponse& response) const = 0;
    };

    /**
     * @brief Error handler for services that answer with the Google Cloud error envelope:
     * {"error": {"status": "...", "message": "...", "details": [...]}}.
     *
     * Builds a base FirebaseException (error code from error.status, falling back to the HTTP
     * status code) and passes it to createException(), where a service throws its own type.
     */
    class AbstractPlatformErrorHandler : public HttpErrorHandler {
    public:
        [[noreturn]] void handleIOException(const TransportException& error) const override;
        [[noreturn]] void handleHttpResponseException(const IncomingHttpResponse& response) const override;

        static ErrorCode httpStatusToErrorCode(long statusCode);

    protected:
        // Must throw. If it returns, the base exception is thrown as is.
        virtual void createException(const FirebaseException& base) const = 0;

    private:
        [[noreturn]] void raise(const FirebaseException& base) const;
    };

} // namespace FirebaseAdmin::Http

#endif // FIREBASE_ADMIN_PLATFORM_ERROR_HANDLER_HPP
