// src/RemoteConfig/RemoteConfigClient.cpp
#include <FirebaseAdmin/RemoteConfig/RemoteConfigClient.hpp>
#include <FirebaseAdmin/HttpManager.hpp>
#include <FirebaseAdmin/Http/PlatformErrorHandler.hpp>
#include <FirebaseAdmin/RemoteConfig/RemoteConfigServiceErrorResponse.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <FirebaseAdmin/Utils/SdkUtils.hpp>

#include <map>
#include <stdexcept>

namespace FirebaseAdmin::RemoteConfig {

namespace {

const std::string RC_URL_PREFIX = "https://firebaseremoteconfig.googleapis.com/v1/projects/";
const std::string RC_URL_SUFFIX = "/remoteConfig";

const std::map<std::string, std::string>& commonHeaders() {
    static const std::map<std::string, std::string> headers = {
        {"X-Firebase-Client", Utils::SdkUtils::getClientHeaderValue()},
    };
    return headers;
}

class RemoteConfigErrorHandler : public Http::AbstractPlatformErrorHandler {
protected:
    void createException(const FirebaseException& base) const override {
        std::optional<std::string> response;
        if (base.getHttpResponse()) {
            response = base.getHttpResponse()->content;
        }
        RemoteConfigServiceErrorResponse parsed = RemoteConfigServiceErrorResponse::safeParse(response);
        throw RemoteConfigException::withRemoteConfigErrorCode(base, parsed.getRemoteConfigErrorCode());
    }
};

std::string buildRcSendUrl(const RemoteConfigClientOptions& options) {
    if (options.projectId.empty()) {
        throw std::invalid_argument("Project ID must not be empty");
    }
    return RC_URL_PREFIX + options.projectId + RC_URL_SUFFIX;
}

} // namespace

RemoteConfigClient::RemoteConfigClient(const RemoteConfigClientOptions& options)
    : m_rcSendUrl(buildRcSendUrl(options)),
      m_httpClient(options.transport, std::make_shared<RemoteConfigErrorHandler>()) {
    m_logger = Utils::Logger::GetOrCreateLogger("RemoteConfigClient");
    m_logger->trace("Remote Config client created for {}", m_rcSendUrl);
}

RemoteConfigClient RemoteConfigClient::fromOptions(const FirebaseOptions& options) {
    if (options.projectId.empty()) {
        throw std::invalid_argument(
            "Project ID is required to access Remote Config service. Set the project ID explicitly "
            "via FirebaseOptions. Alternatively you can also set the project ID via the "
            "GOOGLE_CLOUD_PROJECT environment variable.");
    }
    if (!options.credentials) {
        throw std::invalid_argument(
            "Credentials are required to access Remote Config service. Set them explicitly via "
            "FirebaseOptions or provide an access token in the FIREBASE_ACCESS_TOKEN environment variable.");
    }

    RemoteConfigClientOptions clientOptions;
    clientOptions.projectId = options.projectId;
    clientOptions.transport = std::make_shared<HttpManager>(options);
    return RemoteConfigClient(clientOptions);
}

RemoteConfigTemplate RemoteConfigClient::getTemplate() const {
    Http::HttpRequestInfo request = Http::HttpRequestInfo::buildGetRequest(m_rcSendUrl)
        .addAllHeaders(commonHeaders());

    Http::IncomingHttpResponse response = m_httpClient.send(request);
    json body = m_httpClient.parse(response);

    RemoteConfigTemplate parsed;
    try {
        parsed = RemoteConfigTemplate::from_json(body);
    } catch (const json::exception& e) {
        m_logger->error("Remote Config response is not a valid template: {}", e.what());
        throw FirebaseException(ErrorCode::UNKNOWN, std::string("Error while parsing HTTP response: ") + e.what(), response);
    } catch (const std::invalid_argument& e) {
        m_logger->error("Remote Config response is not a valid template: {}", e.what());
        throw FirebaseException(ErrorCode::UNKNOWN, std::string("Error while parsing HTTP response: ") + e.what(), response);
    }

    std::optional<std::string> etag = response.header("etag");
    if (!etag) {
        m_logger->error("Remote Config response from {} has no ETag header", m_rcSendUrl);
        throw RemoteConfigException(ErrorCode::UNKNOWN,
                                    "ETag header is not available in the Remote Config response",
                                    std::nullopt, response);
    }
    parsed.setETag(*etag);

    m_logger->debug("Fetched Remote Config template. ETag: {}", *etag);
    return parsed;
}

} // namespace FirebaseAdmin::RemoteConfig
