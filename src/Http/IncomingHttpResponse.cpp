// src/Http/IncomingHttpResponse.cpp
#include <FirebaseAdmin/Http/IncomingHttpResponse.hpp>

namespace FirebaseAdmin::Http {

std::optional<std::string> IncomingHttpResponse::header(const std::string& name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

IncomingHttpResponse IncomingHttpResponse::fromCpr(const cpr::Response& response, const HttpRequestInfo& request) {
    IncomingHttpResponse incoming;
    incoming.statusCode = response.status_code;
    incoming.headers = response.header;
    incoming.content = response.text;
    incoming.url = request.getUrl();
    incoming.method = request.getMethod();
    return incoming;
}

} // namespace FirebaseAdmin::Http
