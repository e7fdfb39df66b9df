// src/RemoteConfig/RemoteConfigTemplate.cpp
#include <FirebaseAdmin/RemoteConfig/RemoteConfigTemplate.hpp>
#include <FirebaseAdmin/Utils/Logger.hpp>
#include <stdexcept>

namespace FirebaseAdmin::RemoteConfig {

RemoteConfigTemplate RemoteConfigTemplate::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Remote Config template must be a JSON object, got " + std::string(j.type_name()));
    }

    RemoteConfigTemplate rcTemplate;
    rcTemplate.m_document = j;

    if (j.contains("parameters")) {
        const json& parameters = j.at("parameters");
        if (!parameters.is_object()) {
            throw std::invalid_argument("\"parameters\" must be an object, got " + std::string(parameters.type_name()));
        }
        for (auto& [name, param_json] : parameters.items()) {
            rcTemplate.m_parameters[name] = Parameter::from_json(param_json);
        }
    }

    if (j.contains("conditions")) {
        const json& conditions = j.at("conditions");
        if (!conditions.is_array()) {
            throw std::invalid_argument("\"conditions\" must be an array, got " + std::string(conditions.type_name()));
        }
        for (const auto& condition_json : conditions) {
            rcTemplate.m_conditions.push_back(Condition::from_json(condition_json));
        }
    }

    if (j.contains("parameterGroups")) {
        rcTemplate.m_parameterGroups = j.at("parameterGroups");
    }

    if (j.contains("version")) {
        rcTemplate.m_version = Version::from_json(j.at("version"));
    }

    FIREBASE_LOG_TRACE("[RemoteConfig] Parsed template: {} parameters, {} conditions, version {}",
                       rcTemplate.m_parameters.size(), rcTemplate.m_conditions.size(),
                       rcTemplate.m_version && rcTemplate.m_version->versionNumber ? *rcTemplate.m_version->versionNumber : "none");
    return rcTemplate;
}

std::string RemoteConfigTemplate::toJsonString(int indent) const {
    json output = m_document;
    if (!m_etag.empty()) {
        output["etag"] = m_etag;
    }
    // ETags are copied from raw header bytes and need not be valid UTF-8
    return output.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace FirebaseAdmin::RemoteConfig
