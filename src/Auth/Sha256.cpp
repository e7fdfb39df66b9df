// src/Auth/Sha256.cpp
#include <FirebaseAdmin/Auth/Hash/Sha256.hpp>
#include <stdexcept>

namespace FirebaseAdmin::Auth::Hash {

Sha256 Sha256::create(int rounds) {
    if (rounds < kMinRounds || rounds > kMaxRounds) {
        throw std::invalid_argument("Rounds value must be between " + std::to_string(kMinRounds) +
                                    " and " + std::to_string(kMaxRounds) + " (inclusive), got " +
                                    std::to_string(rounds));
    }
    return Sha256(rounds);
}

nlohmann::json Sha256::getOptions() const {
    return {
        {"hashAlgorithm", kAlgorithmName},
        {"rounds", m_rounds},
    };
}

} // namespace FirebaseAdmin::Auth::Hash
