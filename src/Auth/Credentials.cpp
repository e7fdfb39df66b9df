// src/Auth/Credentials.cpp
#include <FirebaseAdmin/Auth/Credentials.hpp>
#include <stdexcept>
#include <utility>

namespace FirebaseAdmin::Auth {

StaticCredentials::StaticCredentials(std::string accessToken) : m_accessToken(std::move(accessToken)) {
    if (m_accessToken.empty()) {
        throw std::invalid_argument("Access token must not be empty");
    }
}

std::string StaticCredentials::getAccessToken() const {
    return m_accessToken;
}

} // namespace FirebaseAdmin::Auth
