// src/Config.cpp
#include <FirebaseAdmin/Config.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>

#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace FirebaseAdmin {

namespace {

std::optional<std::string> getEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::chrono::milliseconds parseTimeout(const char* name, const std::string& value) {
    // std::stoll alone would accept leading whitespace and a sign
    if (!std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got: " + value);
    }
    long long ms = 0;
    size_t consumed = 0;
    try {
        ms = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got: " + value);
    }
    if (consumed != value.size() || ms < 0) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got: " + value);
    }
    return std::chrono::milliseconds{ms};
}

std::string projectIdFromFirebaseConfig(const std::string& config) {
    nlohmann::json configJson;
    try {
        if (config.front() == '{') {
            configJson = nlohmann::json::parse(config);
        } else {
            std::ifstream file(config);
            if (!file.is_open()) {
                throw std::invalid_argument("Failed to open FIREBASE_CONFIG file: " + config);
            }
            configJson = nlohmann::json::parse(file);
        }
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Failed to parse FIREBASE_CONFIG: ") + e.what());
    }

    if (!configJson.is_object()) {
        throw std::invalid_argument("FIREBASE_CONFIG must contain a JSON object");
    }
    if (configJson.contains("projectId") && configJson.at("projectId").is_string()) {
        return configJson.at("projectId").get<std::string>();
    }
    return "";
}

} // namespace

FirebaseOptions FirebaseOptions::fromEnvironment() {
    FirebaseOptions options;

    if (auto projectId = getEnv("GOOGLE_CLOUD_PROJECT")) {
        options.projectId = *projectId;
    } else if (auto gcloudProject = getEnv("GCLOUD_PROJECT")) {
        options.projectId = *gcloudProject;
    } else if (auto firebaseConfig = getEnv("FIREBASE_CONFIG")) {
        options.projectId = projectIdFromFirebaseConfig(*firebaseConfig);
    }

    if (auto token = getEnv("FIREBASE_ACCESS_TOKEN")) {
        options.credentials = std::make_shared<Auth::StaticCredentials>(*token);
    } else if (auto oauthToken = getEnv("GOOGLE_OAUTH_ACCESS_TOKEN")) {
        options.credentials = std::make_shared<Auth::StaticCredentials>(*oauthToken);
    }

    if (auto connectTimeout = getEnv("FIREBASE_HTTP_CONNECT_TIMEOUT_MS")) {
        options.connectTimeout = parseTimeout("FIREBASE_HTTP_CONNECT_TIMEOUT_MS", *connectTimeout);
    }
    if (auto readTimeout = getEnv("FIREBASE_HTTP_READ_TIMEOUT_MS")) {
        options.readTimeout = parseTimeout("FIREBASE_HTTP_READ_TIMEOUT_MS", *readTimeout);
    }
    if (auto caBundle = getEnv("FIREBASE_CA_BUNDLE")) {
        options.caBundlePath = *caBundle;
    }

    FIREBASE_LOG_TRACE("Resolved options from environment. Project ID: '{}', credentials: {}",
                       options.projectId, options.credentials ? "present" : "absent");
    return options;
}

} // namespace FirebaseAdmin
