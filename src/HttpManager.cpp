// src/HttpManager.cpp
#include <FirebaseAdmin/HttpManager.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <stdexcept>

namespace FirebaseAdmin {

HttpManager::HttpManager(const FirebaseOptions& options)
    : m_credentials(options.credentials),
      m_connectTimeout(options.connectTimeout),
      m_readTimeout(options.readTimeout) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");

    if (!options.caBundlePath.empty()) {
        m_logger->debug("Configuring SslOptions with CA bundle: {}", options.caBundlePath.string());
        m_globalSslOptions = cpr::Ssl(
            cpr::ssl::CaInfo{options.caBundlePath.string()},
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    } else {
        m_globalSslOptions = cpr::Ssl(
            cpr::ssl::VerifyHost{true},
            cpr::ssl::VerifyPeer{true}
        );
    }

    if (!m_credentials) {
        m_logger->warn("HttpManager created without credentials. Requests will not be authenticated.");
    }
    m_logger->trace("HttpManager initialized.");
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

// A new session per request keeps HttpManager free of per-call state.
void HttpManager::ConfigureSession(cpr::Session& session) const {
    session.SetSslOptions(m_globalSslOptions);
    if (m_connectTimeout.count() > 0) {
        session.SetConnectTimeout(cpr::ConnectTimeout{m_connectTimeout});
    }
    if (m_readTimeout.count() > 0) {
        session.SetTimeout(cpr::Timeout{m_readTimeout});
    }
}

cpr::Header HttpManager::prepareHeaders(const Http::HttpRequestInfo& request) const {
    cpr::Header header = request.getHeaders();
    if (m_credentials) {
        header["Authorization"] = "Bearer " + m_credentials->getAccessToken();
    }
    return header;
}

Http::IncomingHttpResponse HttpManager::send(const Http::HttpRequestInfo& request) {
    m_logger->trace("{}: {}", request.getMethod(), request.getUrl());
    if (request.getMethod() != "GET") {
        throw std::invalid_argument("HttpManager: unsupported HTTP method: " + request.getMethod());
    }

    cpr::Session session;
    ConfigureSession(session);
    session.SetUrl(cpr::Url{request.getUrl()});
    session.SetHeader(prepareHeaders(request));
    cpr::Response response = session.Get();

    if (response.error.code != cpr::ErrorCode::OK) {
        m_logger->error("{} {} failed. Error: \"{}\", CPR Error Code: {}",
            request.getMethod(), request.getUrl(), response.error.message, static_cast<int>(response.error.code));
        Http::TransportException::Kind kind = response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT
            ? Http::TransportException::Kind::TIMEOUT
            : Http::TransportException::Kind::NETWORK;
        throw Http::TransportException(kind, "Unknown error while making a remote service call: " + response.error.message);
    }

    m_logger->debug("{} {} -> {} ({} bytes)", request.getMethod(), request.getUrl(), response.status_code, response.text.size());
    return Http::IncomingHttpResponse::fromCpr(response, request);
}

} // namespace FirebaseAdmin
