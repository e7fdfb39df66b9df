// include/FirebaseAdmin/Http/HttpTransport.hpp
#ifndef FIREBASE_ADMIN_HTTP_TRANSPORT_HPP
#define FIREBASE_ADMIN_HTTP_TRANSPORT_HPP

#include <FirebaseAdmin/Http/HttpRequestInfo.hpp>
#include <FirebaseAdmin/Http/IncomingHttpResponse.hpp>
#include <stdexcept>
#include <string>

namespace FirebaseAdmin::Http {

    // Raised when no HTTP response was received at all.
    class TransportException : public std::runtime_error {
    public:
        enum class Kind {
            TIMEOUT,
            NETWORK,
        };

        TransportException(Kind kind, const std::string& message) : std::runtime_error(message), m_kind(kind) {}

        Kind getKind() const noexcept { return m_kind; }

    private:
        Kind m_kind;
    };

    // Issues authenticated requests. Any status code counts as a response;
    // implementations throw TransportException only when the exchange itself failed.
    class HttpTransport {
    public:
        virtual ~HttpTransport() = default;
        virtual IncomingHttpResponse send(const HttpRequestInfo& request) = 0;
    };

} // namespace FirebaseAdmin::Http

#endif // FIREBASE_ADMIN_HTTP_TRANSPORT_HPP
