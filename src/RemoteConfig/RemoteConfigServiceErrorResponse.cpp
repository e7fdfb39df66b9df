// src/RemoteConfig/RemoteConfigServiceErrorResponse.cpp
#include <FirebaseAdmin/RemoteConfig/RemoteConfigServiceErrorResponse.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <map>

namespace FirebaseAdmin::RemoteConfig {

namespace {

const std::string RC_ERROR_TYPE = "type.googleapis.com/google.firebase.fcm.v1.FcmError";

const std::map<std::string, RemoteConfigErrorCode>& remoteConfigErrorCodes() {
    static const std::map<std::string, RemoteConfigErrorCode> codes = {
        {"INTERNAL", RemoteConfigErrorCode::INTERNAL},
    };
    return codes;
}

} // namespace

RemoteConfigServiceErrorResponse RemoteConfigServiceErrorResponse::from_json(const nlohmann::json& j) {
    RemoteConfigServiceErrorResponse response;
    if (j.is_object() && j.contains("error") && j.at("error").is_object()) {
        response.m_error = j.at("error");
    }
    return response;
}

RemoteConfigServiceErrorResponse RemoteConfigServiceErrorResponse::safeParse(const std::optional<std::string>& response) {
    if (!response || response->empty()) {
        return RemoteConfigServiceErrorResponse();
    }

    // The server may answer with a non-JSON payload (an HTML error page from a proxy, say)
    nlohmann::json parsed = nlohmann::json::parse(*response, nullptr, false);
    if (parsed.is_discarded()) {
        FIREBASE_LOG_TRACE("[RemoteConfig] Error response is not JSON, ignoring its body.");
        return RemoteConfigServiceErrorResponse();
    }
    return from_json(parsed);
}

std::optional<std::string> RemoteConfigServiceErrorResponse::getErrorString(const char* key) const {
    if (!m_error.is_object()) {
        return std::nullopt;
    }
    auto it = m_error.find(key);
    if (it == m_error.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::string> RemoteConfigServiceErrorResponse::getStatus() const {
    return getErrorString("status");
}

std::optional<std::string> RemoteConfigServiceErrorResponse::getErrorMessage() const {
    return getErrorString("message");
}

std::optional<RemoteConfigErrorCode> RemoteConfigServiceErrorResponse::getRemoteConfigErrorCode() const {
    if (!m_error.is_object()) {
        return std::nullopt;
    }

    auto details = m_error.find("details");
    if (details == m_error.end() || !details->is_array()) {
        return std::nullopt;
    }

    for (const auto& detail : *details) {
        if (!detail.is_object()) {
            continue;
        }
        auto type = detail.find("@type");
        if (type == detail.end() || !type->is_string() || type->get<std::string>() != RC_ERROR_TYPE) {
            continue;
        }

        auto errorCode = detail.find("errorCode");
        if (errorCode == detail.end() || !errorCode->is_string()) {
            return std::nullopt;
        }
        const auto& codes = remoteConfigErrorCodes();
        auto code = codes.find(errorCode->get<std::string>());
        if (code == codes.end()) {
            return std::nullopt;
        }
        return code->second;
    }
    return std::nullopt;
}

} // namespace FirebaseAdmin::RemoteConfig
