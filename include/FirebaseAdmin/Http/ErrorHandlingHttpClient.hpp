// include/FirebaseAdmin/Http/ErrorHandlingHttpClient.hpp
#ifndef FIREBASE_ADMIN_ERROR_HANDLING_HTTP_CLIENT_HPP
#define FIREBASE_ADMIN_ERROR_HANDLING_HTTP_CLIENT_HPP

#include <FirebaseAdmin/Http/HttpRequestInfo.hpp>
#include <FirebaseAdmin/Http/HttpTransport.hpp>
#include <FirebaseAdmin/Http/IncomingHttpResponse.hpp>
#include <FirebaseAdmin/Http/PlatformErrorHandler.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace FirebaseAdmin::Http {

    // Sends requests through a transport and routes every failure to an error handler,
    // so callers only ever see the handler's exception type for service errors.
    class ErrorHandlingHttpClient {
    public:
        ErrorHandlingHttpClient(std::shared_ptr<HttpTransport> transport,
                                std::shared_ptr<const HttpErrorHandler> errorHandler);

        // Returns only 2xx responses
        IncomingHttpResponse send(const HttpRequestInfo& request) const;

        // Throws FirebaseException(UNKNOWN) when the body is not valid JSON
        nlohmann::json parse(const IncomingHttpResponse& response) const;

    private:
        std::shared_ptr<HttpTransport> m_transport;
        std::shared_ptr<const HttpErrorHandler> m_errorHandler;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace FirebaseAdmin::Http

#endif // FIREBASE_ADMIN_ERROR_HANDLING_HTTP_CLIENT_HPP
