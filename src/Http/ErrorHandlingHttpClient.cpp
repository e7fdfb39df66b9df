// src/Http/ErrorHandlingHttpClient.cpp
#include <FirebaseAdmin/Http/ErrorHandlingHttpClient.hpp>
#include <FirebaseAdmin/FirebaseException.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <stdexcept>
#include <utility>

namespace FirebaseAdmin::Http {

ErrorHandlingHttpClient::ErrorHandlingHttpClient(std::shared_ptr<HttpTransport> transport,
                                                 std::shared_ptr<const HttpErrorHandler> errorHandler)
    : m_transport(std::move(transport)), m_errorHandler(std::move(errorHandler)) {
    if (!m_transport) {
        throw std::invalid_argument("ErrorHandlingHttpClient: transport must not be null");
    }
    if (!m_errorHandler) {
        throw std::invalid_argument("ErrorHandlingHttpClient: error handler must not be null");
    }
    m_logger = Utils::Logger::GetOrCreateLogger("ErrorHandlingHttpClient");
}

IncomingHttpResponse ErrorHandlingHttpClient::send(const HttpRequestInfo& request) const {
    IncomingHttpResponse response;
    try {
        response = m_transport->send(request);
    } catch (const TransportException& e) {
        m_logger->error("{} {} failed before a response was received: {}", request.getMethod(), request.getUrl(), e.what());
        m_errorHandler->handleIOException(e);
    }

    if (!response.isSuccess()) {
        m_logger->error("{} {} returned status {}", request.getMethod(), request.getUrl(), response.statusCode);
        m_logger->trace("Response body: {}", response.content);
        m_errorHandler->handleHttpResponseException(response);
    }
    return response;
}

nlohmann::json ErrorHandlingHttpClient::parse(const IncomingHttpResponse& response) const {
    try {
        return nlohmann::json::parse(response.content);
    } catch (const nlohmann::json::parse_error& e) {
        m_logger->error("Failed to parse response from {}: {}", response.url, e.what());
        throw FirebaseException(ErrorCode::UNKNOWN,
                                std::string("Error while parsing HTTP response: ") + e.what(), response);
    }
}

} // namespace FirebaseAdmin::Http
