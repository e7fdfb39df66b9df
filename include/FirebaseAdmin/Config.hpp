// include/FirebaseAdmin/Config.hpp
#ifndef FIREBASE_ADMIN_CONFIG_HPP
#define FIREBASE_ADMIN_CONFIG_HPP

#include <FirebaseAdmin/Auth/Credentials.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace FirebaseAdmin {

    struct FirebaseOptions {
        std::string projectId;
        std::shared_ptr<const Auth::Credentials> credentials;
        std::chrono::milliseconds connectTimeout{0}; // 0 = transport default
        std::chrono::milliseconds readTimeout{0};    // 0 = transport default
        std::filesystem::path caBundlePath;          // empty = system CA store

        /**
         * @brief Builds options from the process environment.
         *
         * Project ID: GOOGLE_CLOUD_PROJECT, then GCLOUD_PROJECT, then the "projectId" key of
         * FIREBASE_CONFIG (a JSON file path, or inline JSON when the value starts with '{').
         * Access token: FIREBASE_ACCESS_TOKEN, then GOOGLE_OAUTH_ACCESS_TOKEN.
         * Timeouts: FIREBASE_HTTP_CONNECT_TIMEOUT_MS, FIREBASE_HTTP_READ_TIMEOUT_MS.
         * CA bundle: FIREBASE_CA_BUNDLE.
         *
         * Missing values are left empty. Unreadable or malformed values throw std::invalid_argument.
         */
        static FirebaseOptions fromEnvironment();
    };

} // namespace FirebaseAdmin

#endif // FIREBASE_ADMIN_CONFIG_HPP
