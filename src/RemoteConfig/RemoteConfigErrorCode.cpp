// src/RemoteConfig/RemoteConfigErrorCode.cpp
#include <FirebaseAdmin/RemoteConfig/RemoteConfigErrorCode.hpp>

namespace FirebaseAdmin::RemoteConfig {

std::string remoteConfigErrorCodeToString(RemoteConfigErrorCode code) {
    switch (code) {
        case RemoteConfigErrorCode::INTERNAL: return "INTERNAL";
    }
    return "UNKNOWN";
}

} // namespace FirebaseAdmin::RemoteConfig
