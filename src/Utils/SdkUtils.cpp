// src/Utils/SdkUtils.cpp
#include <FirebaseAdmin/Utils/SdkUtils.hpp>

#ifndef FIREBASE_ADMIN_VERSION
#define FIREBASE_ADMIN_VERSION "0.1.0"
#endif

namespace FirebaseAdmin::Utils::SdkUtils {

    std::string getVersion() {
        return FIREBASE_ADMIN_VERSION;
    }

    std::string getClientHeaderValue() {
        return "fire-admin-cpp/" + getVersion();
    }

} // namespace FirebaseAdmin::Utils::SdkUtils
