// src/RemoteConfig/Version.cpp
#include <FirebaseAdmin/RemoteConfig/Types/Version.hpp>

namespace FirebaseAdmin::RemoteConfig {

namespace {

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (j.contains(key)) {
        return j.at(key).get<std::string>();
    }
    return std::nullopt;
}

} // namespace

Version Version::from_json(const json& j) {
    Version version;
    version.versionNumber = optionalString(j, "versionNumber");
    version.updateTime = optionalString(j, "updateTime");
    version.updateOrigin = optionalString(j, "updateOrigin");
    version.updateType = optionalString(j, "updateType");
    version.description = optionalString(j, "description");
    version.rollbackSource = optionalString(j, "rollbackSource");
    if (j.contains("updateUser")) {
        version.updateUserEmail = optionalString(j.at("updateUser"), "email");
    }
    version.isLegacy = j.value("isLegacy", false);
    return version;
}

} // namespace FirebaseAdmin::RemoteConfig
