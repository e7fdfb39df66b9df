// tools/main.cpp
#include <FirebaseAdmin/Config.hpp>
#include <FirebaseAdmin/RemoteConfig/RemoteConfigClient.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <FirebaseAdmin/Utils/SdkUtils.hpp>
#include <spdlog/spdlog.h> // For spdlog::shutdown()

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SERVICE_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

struct CommandLine {
    std::optional<std::string> projectId;
    std::optional<std::string> token;
    bool etagOnly = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--project <id>] [--token <access token>] [--etag-only] [--verbose]\n"
              << "\n"
              << "Fetches the Remote Config template of a Firebase project and prints it as JSON.\n"
              << "\n"
              << "  --project <id>   Project ID (default: GOOGLE_CLOUD_PROJECT, GCLOUD_PROJECT, FIREBASE_CONFIG)\n"
              << "  --token <token>  OAuth2 access token (default: FIREBASE_ACCESS_TOKEN, GOOGLE_OAUTH_ACCESS_TOKEN)\n"
              << "  --etag-only      Print only the template ETag\n"
              << "  --verbose        Trace logging to the console and to ./logs\n"
              << "  --help           Show this message\n";
}

// Returns std::nullopt after reporting a malformed command line
std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine commandLine;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--project" || arg == "--token") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            (arg == "--project" ? commandLine.projectId : commandLine.token) = argv[++i];
        } else if (arg == "--etag-only") {
            commandLine.etagOnly = true;
        } else if (arg == "--verbose") {
            commandLine.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            commandLine.help = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return commandLine;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<CommandLine> commandLine = parseCommandLine(argc, argv);
    if (!commandLine) {
        printUsage(argv[0]);
        return EXIT_USAGE_ERROR;
    }
    if (commandLine->help) {
        printUsage(argv[0]);
        return EXIT_OK;
    }

    if (commandLine->verbose) {
        FirebaseAdmin::Utils::Logger::Init("./logs", "firebase-rc-fetch.log", spdlog::level::trace, spdlog::level::trace);
    } else {
        FirebaseAdmin::Utils::Logger::Init("", "", spdlog::level::warn, spdlog::level::trace);
    }
    FIREBASE_LOG_INFO("firebase-rc-fetch (firebase_admin {}) starting...", FirebaseAdmin::Utils::SdkUtils::getVersion());

    std::optional<FirebaseAdmin::RemoteConfig::RemoteConfigClient> client;
    try {
        FirebaseAdmin::FirebaseOptions options = FirebaseAdmin::FirebaseOptions::fromEnvironment();
        if (commandLine->projectId) {
            options.projectId = *commandLine->projectId;
        }
        if (commandLine->token) {
            options.credentials = std::make_shared<FirebaseAdmin::Auth::StaticCredentials>(*commandLine->token);
        }
        client.emplace(FirebaseAdmin::RemoteConfig::RemoteConfigClient::fromOptions(options));
    } catch (const std::invalid_argument& e) {
        FIREBASE_LOG_CRITICAL("Configuration error: {}", e.what());
        spdlog::shutdown();
        return EXIT_USAGE_ERROR;
    }

    FIREBASE_LOG_INFO("Fetching Remote Config template from {}", client->getRcSendUrl());
    try {
        FirebaseAdmin::RemoteConfig::RemoteConfigTemplate rcTemplate = client->getTemplate();
        FIREBASE_LOG_INFO("Fetched template with {} parameters and {} conditions. ETag: {}",
                          rcTemplate.getParameters().size(), rcTemplate.getConditions().size(), rcTemplate.getETag());
        if (commandLine->etagOnly) {
            std::cout << rcTemplate.getETag() << std::endl;
        } else {
            std::cout << rcTemplate.toJsonString(2) << std::endl;
        }
    } catch (const FirebaseAdmin::RemoteConfig::RemoteConfigException& e) {
        std::optional<FirebaseAdmin::RemoteConfig::RemoteConfigErrorCode> rcCode = e.getRemoteConfigErrorCode();
        FIREBASE_LOG_CRITICAL("Remote Config request failed. Error code: {}, Remote Config error code: {}, Message: {}",
                              FirebaseAdmin::errorCodeToString(e.getErrorCode()),
                              rcCode ? FirebaseAdmin::RemoteConfig::remoteConfigErrorCodeToString(*rcCode) : "none",
                              e.what());
        if (e.getHttpResponse()) {
            FIREBASE_LOG_ERROR("HTTP status: {}", e.getHttpResponse()->statusCode);
        }
        spdlog::shutdown();
        return EXIT_SERVICE_ERROR;
    } catch (const FirebaseAdmin::FirebaseException& e) {
        FIREBASE_LOG_CRITICAL("Failed to read Remote Config template ({}): {}",
                              FirebaseAdmin::errorCodeToString(e.getErrorCode()), e.what());
        spdlog::shutdown();
        return EXIT_SERVICE_ERROR;
    }

    spdlog::shutdown();
    return EXIT_OK;
}
