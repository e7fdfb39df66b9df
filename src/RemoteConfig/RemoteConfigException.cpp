// src/RemoteConfig/RemoteConfigException.cpp
#include <FirebaseAdmin/RemoteConfig/RemoteConfigException.hpp>
#include <utility>

namespace FirebaseAdmin::RemoteConfig {

RemoteConfigException::RemoteConfigException(ErrorCode errorCode, const std::string& message,
                                             std::optional<RemoteConfigErrorCode> remoteConfigErrorCode,
                                             std::optional<Http::IncomingHttpResponse> httpResponse)
    : FirebaseException(errorCode, message, std::move(httpResponse)),
      m_remoteConfigErrorCode(remoteConfigErrorCode) {}

RemoteConfigException RemoteConfigException::withRemoteConfigErrorCode(const FirebaseException& base,
                                                                       std::optional<RemoteConfigErrorCode> remoteConfigErrorCode) {
    return RemoteConfigException(base.getErrorCode(), base.what(), remoteConfigErrorCode, base.getHttpResponse());
}

} // namespace FirebaseAdmin::RemoteConfig
