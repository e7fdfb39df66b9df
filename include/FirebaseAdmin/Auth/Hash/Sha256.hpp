// include/FirebaseAdmin/Auth/Hash/Sha256.hpp
#ifndef FIREBASE_ADMIN_SHA256_HPP
#define FIREBASE_ADMIN_SHA256_HPP

#include <string>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::Auth::Hash {

    /**
     * @brief SHA256 password hash settings for importing users whose passwords were hashed
     * with repeated SHA256 rounds. Nothing is hashed locally; the settings are sent to the
     * user import API.
     */
    class Sha256 {
    public:
        static constexpr const char* kAlgorithmName = "SHA256";
        static constexpr int kMinRounds = 1;
        static constexpr int kMaxRounds = 8192;

        // Throws std::invalid_argument unless kMinRounds <= rounds <= kMaxRounds
        static Sha256 create(int rounds);

        std::string algorithmName() const { return kAlgorithmName; }
        int rounds() const { return m_rounds; }

        // {"hashAlgorithm": "SHA256", "rounds": n}
        nlohmann::json getOptions() const;

    private:
        explicit Sha256(int rounds) : m_rounds(rounds) {}

        int m_rounds;
    };

} // namespace FirebaseAdmin::Auth::Hash

#endif // FIREBASE_ADMIN_SHA256_HPP
