// include/FirebaseAdmin/HttpManager.hpp
#ifndef FIREBASE_ADMIN_HTTP_MANAGER_HPP
#define FIREBASE_ADMIN_HTTP_MANAGER_HPP

#include <FirebaseAdmin/Auth/Credentials.hpp>
#include <FirebaseAdmin/Config.hpp>
#include <FirebaseAdmin/Http/HttpTransport.hpp>
#include <cpr/cpr.h>
#include <memory>
#include <spdlog/logger.h>

namespace FirebaseAdmin {

    // cpr-backed transport. Holds only immutable settings, each request gets its own
    // cpr::Session, so one instance can be shared by any number of threads.
    class HttpManager : public Http::HttpTransport {
    public:
        // Null credentials send requests without an Authorization header.
        explicit HttpManager(const FirebaseOptions& options);
        ~HttpManager() override;

        Http::IncomingHttpResponse send(const Http::HttpRequestInfo& request) override;

        // Request headers plus the bearer token, as they go on the wire
        cpr::Header prepareHeaders(const Http::HttpRequestInfo& request) const;

    private:
        std::shared_ptr<const Auth::Credentials> m_credentials;
        std::chrono::milliseconds m_connectTimeout;
        std::chrono::milliseconds m_readTimeout;
        cpr::SslOptions m_globalSslOptions;
        std::shared_ptr<spdlog::logger> m_logger;

        void ConfigureSession(cpr::Session& session) const;
    };

} // namespace FirebaseAdmin

#endif // FIREBASE_ADMIN_HTTP_MANAGER_HPP
