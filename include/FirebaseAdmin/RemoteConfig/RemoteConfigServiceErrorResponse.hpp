// include/FirebaseAdmin/RemoteConfig/RemoteConfigServiceErrorResponse.hpp
#ifndef FIREBASE_ADMIN_REMOTE_CONFIG_SERVICE_ERROR_RESPONSE_HPP
#define FIREBASE_ADMIN_REMOTE_CONFIG_SERVICE_ERROR_RESPONSE_HPP

#include <FirebaseAdmin/RemoteConfig/RemoteConfigErrorCode.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace FirebaseAdmin::RemoteConfig {

    /**
     * @brief Error body returned by the Remote Config service.
     *
     * Every accessor degrades to std::nullopt when the field it reads is missing or has the
     * wrong JSON type, so a present-but-empty string stays distinguishable from a missing key.
     */
    class RemoteConfigServiceErrorResponse {
    public:
        RemoteConfigServiceErrorResponse() = default;

        // Never throws. Anything but a JSON object under "error" is ignored.
        static RemoteConfigServiceErrorResponse from_json(const nlohmann::json& j);

        // Empty, absent or non-JSON text yields a default instance.
        static RemoteConfigServiceErrorResponse safeParse(const std::optional<std::string>& response);

        std::optional<std::string> getStatus() const;
        std::optional<std::string> getErrorMessage() const;

        // First details entry typed as an FcmError decides; its errorCode goes through
        // the static lookup table and unknown codes give std::nullopt.
        std::optional<RemoteConfigErrorCode> getRemoteConfigErrorCode() const;

    private:
        nlohmann::json m_error; // null when the body had no "error" object

        std::optional<std::string> getErrorString(const char* key) const;
    };

} // namespace FirebaseAdmin::RemoteConfig

#endif // FIREBASE_ADMIN_REMOTE_CONFIG_SERVICE_ERROR_RESPONSE_HPP
