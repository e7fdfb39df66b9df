// include/FirebaseAdmin/Http/HttpRequestInfo.hpp
#ifndef FIREBASE_ADMIN_HTTP_REQUEST_INFO_HPP
#define FIREBASE_ADMIN_HTTP_REQUEST_INFO_HPP

#include <cpr/cpr.h>
#include <map>
#include <string>

namespace FirebaseAdmin::Http {

    // Describes one outbound request. Authentication headers are not part of it,
    // the transport adds them.
    class HttpRequestInfo {
    public:
        static HttpRequestInfo buildGetRequest(const std::string& url);
        // method is an upper-case HTTP verb
        static HttpRequestInfo buildRequest(const std::string& method, const std::string& url);

        HttpRequestInfo& addHeader(const std::string& name, const std::string& value);
        HttpRequestInfo& addAllHeaders(const std::map<std::string, std::string>& headers);

        const std::string& getMethod() const { return m_method; }
        const std::string& getUrl() const { return m_url; }
        const cpr::Header& getHeaders() const { return m_headers; }

    private:
        HttpRequestInfo(std::string method, std::string url);

        std::string m_method;
        std::string m_url;
        cpr::Header m_headers;
    };

} // namespace FirebaseAdmin::Http

#endif // FIREBASE_ADMIN_HTTP_REQUEST_INFO_HPP
