// src/Http/HttpRequestInfo.cpp
#include <FirebaseAdmin/Http/HttpRequestInfo.hpp>
#include <stdexcept>
#include <utility>

namespace FirebaseAdmin::Http {

HttpRequestInfo::HttpRequestInfo(std::string method, std::string url)
    : m_method(std::move(method)), m_url(std::move(url)) {
    if (m_url.empty()) {
        throw std::invalid_argument("HttpRequestInfo: url must not be empty");
    }
}

HttpRequestInfo HttpRequestInfo::buildGetRequest(const std::string& url) {
    return HttpRequestInfo("GET", url);
}

HttpRequestInfo HttpRequestInfo::buildRequest(const std::string& method, const std::string& url) {
    if (method.empty()) {
        throw std::invalid_argument("HttpRequestInfo: method must not be empty");
    }
    return HttpRequestInfo(method, url);
}

HttpRequestInfo& HttpRequestInfo::addHeader(const std::string& name, const std::string& value) {
    m_headers[name] = value;
    return *this;
}

HttpRequestInfo& HttpRequestInfo::addAllHeaders(const std::map<std::string, std::string>& headers) {
    for (const auto& [name, value] : headers) {
        addHeader(name, value);
    }
    return *this;
}

} // namespace FirebaseAdmin::Http
