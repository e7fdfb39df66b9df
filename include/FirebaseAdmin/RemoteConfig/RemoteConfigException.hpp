// include/FirebaseAdmin/RemoteConfig/RemoteConfigException.hpp
#ifndef FIREBASE_ADMIN_REMOTE_CONFIG_EXCEPTION_HPP
#define FIREBASE_ADMIN_REMOTE_CONFIG_EXCEPTION_HPP

#include <FirebaseAdmin/FirebaseException.hpp>
#include <FirebaseAdmin/RemoteConfig/RemoteConfigErrorCode.hpp>
#include <optional>

namespace FirebaseAdmin::RemoteConfig {

    // Thrown by RemoteConfigClient for service, transport and ETag failures. An unparsable
    // 2xx body is reported as a plain FirebaseException instead.
    class RemoteConfigException : public FirebaseException {
    public:
        RemoteConfigException(ErrorCode errorCode, const std::string& message,
                              std::optional<RemoteConfigErrorCode> remoteConfigErrorCode = std::nullopt,
                              std::optional<Http::IncomingHttpResponse> httpResponse = std::nullopt);

        // Keeps the base exception's code, message and response
        static RemoteConfigException withRemoteConfigErrorCode(const FirebaseException& base,
                                                               std::optional<RemoteConfigErrorCode> remoteConfigErrorCode);

        // Empty when the response carried no recognised FcmError detail
        std::optional<RemoteConfigErrorCode> getRemoteConfigErrorCode() const noexcept { return m_remoteConfigErrorCode; }

    private:
        std::optional<RemoteConfigErrorCode> m_remoteConfigErrorCode;
    };

} // namespace FirebaseAdmin::RemoteConfig

#endif // FIREBASE_ADMIN_REMOTE_CONFIG_EXCEPTION_HPP
