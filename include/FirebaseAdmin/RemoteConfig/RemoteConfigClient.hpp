// include/FirebaseAdmin/RemoteConfig/RemoteConfigClient.hpp
#ifndef FIREBASE_ADMIN_REMOTE_CONFIG_CLIENT_HPP
#define FIREBASE_ADMIN_REMOTE_CONFIG_CLIENT_HPP

#include <FirebaseAdmin/Config.hpp>
#include <FirebaseAdmin/Http/ErrorHandlingHttpClient.hpp>
#include <FirebaseAdmin/Http/HttpTransport.hpp>
#include <FirebaseAdmin/RemoteConfig/RemoteConfigException.hpp>
#include <FirebaseAdmin/RemoteConfig/RemoteConfigTemplate.hpp>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace FirebaseAdmin::RemoteConfig {

    struct RemoteConfigClientOptions {
        std::string projectId;
        std::shared_ptr<Http::HttpTransport> transport; // must add authentication itself
    };

    // Reads the Remote Config template of one project. All members are set at construction,
    // so getTemplate() may be called concurrently from several threads.
    class RemoteConfigClient {
    public:
        // Throws std::invalid_argument for an empty project ID or a null transport
        explicit RemoteConfigClient(const RemoteConfigClientOptions& options);

        // Uses an HttpManager built from the options. Also requires credentials.
        static RemoteConfigClient fromOptions(const FirebaseOptions& options);

        const std::string& getRcSendUrl() const { return m_rcSendUrl; }

        /**
         * @brief Fetches the current template.
         *
         * @return The parsed template with its ETag set from the "etag" response header.
         * @throws RemoteConfigException for transport failures, non-2xx responses and a missing ETag.
         * @throws FirebaseException (UNKNOWN) when a 2xx body is not a valid template. This is the
         *         base class of RemoteConfigException and carries the HTTP response; catch
         *         FirebaseException to handle every failure of this call.
         */
        RemoteConfigTemplate getTemplate() const;

    private:
        std::string m_rcSendUrl;
        Http::ErrorHandlingHttpClient m_httpClient;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace FirebaseAdmin::RemoteConfig

#endif // FIREBASE_ADMIN_REMOTE_CONFIG_CLIENT_HPP
