// include/FirebaseAdmin/Http/IncomingHttpResponse.hpp
#ifndef FIREBASE_ADMIN_INCOMING_HTTP_RESPONSE_HPP
#define FIREBASE_ADMIN_INCOMING_HTTP_RESPONSE_HPP

#include <FirebaseAdmin/Http/HttpRequestInfo.hpp>
#include <cpr/cpr.h>
#include <optional>
#include <string>

namespace FirebaseAdmin::Http {

    // A fully received HTTP response, whatever its status code.
    struct IncomingHttpResponse {
        long statusCode = 0;
        cpr::Header headers; // Case-insensitive keys
        std::string content;
        std::string url;
        std::string method;

        bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

        // Case-insensitive header lookup
        std::optional<std::string> header(const std::string& name) const;

        static IncomingHttpResponse fromCpr(const cpr::Response& response, const HttpRequestInfo& request);
    };

} // namespace FirebaseAdmin::Http

#endif // FIREBASE_ADMIN_INCOMING_HTTP_RESPONSE_HPP
