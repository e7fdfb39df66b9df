// include/FirebaseAdmin/RemoteConfig/Types/Version.hpp
#ifndef FIREBASE_ADMIN_RC_VERSION_HPP
#define FIREBASE_ADMIN_RC_VERSION_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::RemoteConfig {
    using json = nlohmann::json;

    // Metadata of a published template. Every field is optional on the wire.
    struct Version {
        std::optional<std::string> versionNumber; // int64 sent as a string
        std::optional<std::string> updateTime;
        std::optional<std::string> updateOrigin;  // e.g. "CONSOLE", "REST_API", "ADMIN_SDK_NODE"
        std::optional<std::string> updateType;    // e.g. "INCREMENTAL_UPDATE", "FORCED_UPDATE", "ROLLBACK"
        std::optional<std::string> updateUserEmail;
        std::optional<std::string> description;
        std::optional<std::string> rollbackSource;
        bool isLegacy = false;

        static Version from_json(const json& j);
    };
}

#endif // FIREBASE_ADMIN_RC_VERSION_HPP
