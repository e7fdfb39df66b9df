// include/FirebaseAdmin/Auth/Credentials.hpp
#ifndef FIREBASE_ADMIN_CREDENTIALS_HPP
#define FIREBASE_ADMIN_CREDENTIALS_HPP

#include <string>

namespace FirebaseAdmin::Auth {

    // Supplies the OAuth2 access token sent as "Authorization: Bearer <token>".
    class Credentials {
    public:
        virtual ~Credentials() = default;
        virtual std::string getAccessToken() const = 0;
    };

    // A token obtained outside this library (gcloud, a metadata server, a token broker).
    class StaticCredentials : public Credentials {
    public:
        explicit StaticCredentials(std::string accessToken);
        std::string getAccessToken() const override;

    private:
        std::string m_accessToken;
    };

} // namespace FirebaseAdmin::Auth

#endif // FIREBASE_ADMIN_CREDENTIALS_HPP
