// include/FirebaseAdmin/RemoteConfig/RemoteConfigErrorCode.hpp
#ifndef FIREBASE_ADMIN_REMOTE_CONFIG_ERROR_CODE_HPP
#define FIREBASE_ADMIN_REMOTE_CONFIG_ERROR_CODE_HPP

#include <string>

namespace FirebaseAdmin::RemoteConfig {

    // Service-specific error codes reported in the FcmError detail of an error response.
    enum class RemoteConfigErrorCode {
        INTERNAL,
    };

    std::string remoteConfigErrorCodeToString(RemoteConfigErrorCode code);

} // namespace FirebaseAdmin::RemoteConfig

#endif // FIREBASE_ADMIN_REMOTE_CONFIG_ERROR_CODE_HPP
