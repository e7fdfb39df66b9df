// include/FirebaseAdmin/RemoteConfig/Types/Parameter.hpp
#ifndef FIREBASE_ADMIN_RC_PARAMETER_HPP
#define FIREBASE_ADMIN_RC_PARAMETER_HPP

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::RemoteConfig {
    using json = nlohmann::json;

    // Either an explicit value or "use the in-app default"
    struct ParameterValue {
        std::optional<std::string> value;
        bool useInAppDefault = false;

        static ParameterValue from_json(const json& j);
    };

    struct Parameter {
        std::optional<ParameterValue> defaultValue;
        std::map<std::string, ParameterValue> conditionalValues; // keyed by condition name
        std::string description;
        std::string valueType; // e.g. "STRING", "BOOLEAN", "NUMBER", "JSON"

        static Parameter from_json(const json& j);
    };
}

#endif // FIREBASE_ADMIN_RC_PARAMETER_HPP
