// src/RemoteConfig/Parameter.cpp
#include <FirebaseAdmin/RemoteConfig/Types/Parameter.hpp>

namespace FirebaseAdmin::RemoteConfig {

ParameterValue ParameterValue::from_json(const json& j) {
    ParameterValue parameterValue;
    if (j.contains("value")) {
        parameterValue.value = j.at("value").get<std::string>();
    }
    if (j.contains("useInAppDefault")) {
        parameterValue.useInAppDefault = j.at("useInAppDefault").get<bool>();
    }
    return parameterValue;
}

Parameter Parameter::from_json(const json& j) {
    Parameter parameter;
    if (j.contains("defaultValue")) {
        parameter.defaultValue = ParameterValue::from_json(j.at("defaultValue"));
    }
    if (j.contains("conditionalValues")) {
        for (auto& [conditionName, value_json] : j.at("conditionalValues").items()) {
            parameter.conditionalValues[conditionName] = ParameterValue::from_json(value_json);
        }
    }
    parameter.description = j.value("description", "");
    parameter.valueType = j.value("valueType", "");
    return parameter;
}

} // namespace FirebaseAdmin::RemoteConfig
