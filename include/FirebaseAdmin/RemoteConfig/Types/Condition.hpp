// include/FirebaseAdmin/RemoteConfig/Types/Condition.hpp
#ifndef FIREBASE_ADMIN_RC_CONDITION_HPP
#define FIREBASE_ADMIN_RC_CONDITION_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::RemoteConfig {
    using json = nlohmann::json;

    struct Condition {
        std::string name;
        std::string expression;
        std::optional<std::string> tagColor;

        static Condition from_json(const json& j);
    };
}

#endif // FIREBASE_ADMIN_RC_CONDITION_HPP
