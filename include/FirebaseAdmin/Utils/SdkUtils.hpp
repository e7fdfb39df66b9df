// include/FirebaseAdmin/Utils/SdkUtils.hpp
#ifndef FIREBASE_ADMIN_SDK_UTILS_HPP
#define FIREBASE_ADMIN_SDK_UTILS_HPP

#include <string>

namespace FirebaseAdmin::Utils {

    namespace SdkUtils {

        // Library version, set by the build
        std::string getVersion();

        // Value of the X-Firebase-Client header, e.g. "fire-admin-cpp/0.1.0"
        std::string getClientHeaderValue();

    } // namespace SdkUtils

} // namespace FirebaseAdmin::Utils

#endif // FIREBASE_ADMIN_SDK_UTILS_HPP
