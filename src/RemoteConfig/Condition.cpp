// src/RemoteConfig/Condition.cpp
#include <FirebaseAdmin/RemoteConfig/Types/Condition.hpp>

namespace FirebaseAdmin::RemoteConfig {

Condition Condition::from_json(const json& j) {
    Condition condition;
    condition.name = j.at("name").get<std::string>();
    condition.expression = j.at("expression").get<std::string>();
    if (j.contains("tagColor")) {
        condition.tagColor = j.at("tagColor").get<std::string>();
    }
    return condition;
}

} // namespace FirebaseAdmin::RemoteConfig
