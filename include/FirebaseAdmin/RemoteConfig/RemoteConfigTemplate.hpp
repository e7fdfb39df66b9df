// include/FirebaseAdmin/RemoteConfig/RemoteConfigTemplate.hpp
#ifndef FIREBASE_ADMIN_REMOTE_CONFIG_TEMPLATE_HPP
#define FIREBASE_ADMIN_REMOTE_CONFIG_TEMPLATE_HPP

#include <FirebaseAdmin/RemoteConfig/Types/Condition.hpp>
#include <FirebaseAdmin/RemoteConfig/Types/Parameter.hpp>
#include <FirebaseAdmin/RemoteConfig/Types/Version.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace FirebaseAdmin::RemoteConfig {
    using json = nlohmann::json;

    /**
     * @brief A project's Remote Config template.
     *
     * The document is kept verbatim (toJson()) so fields this library does not model survive;
     * parameters, conditions and version are typed read views over it. The ETag is set by the
     * client after a fetch and is needed for any later conditional update.
     */
    class RemoteConfigTemplate {
    public:
        RemoteConfigTemplate() = default;

        // Throws std::invalid_argument or a nlohmann::json exception when a known section has the wrong shape
        static RemoteConfigTemplate from_json(const json& j);

        const json& toJson() const { return m_document; }

        // The document with an "etag" member added when the ETag is set. Invalid UTF-8 in
        // the ETag or the document is written as U+FFFD.
        std::string toJsonString(int indent = -1) const;

        const std::map<std::string, Parameter>& getParameters() const { return m_parameters; }
        const std::vector<Condition>& getConditions() const { return m_conditions; }
        const json& getParameterGroups() const { return m_parameterGroups; }
        const std::optional<Version>& getVersion() const { return m_version; }

        const std::string& getETag() const { return m_etag; }
        void setETag(const std::string& etag) { m_etag = etag; }

    private:
        json m_document = json::object();
        std::map<std::string, Parameter> m_parameters;
        std::vector<Condition> m_conditions;
        json m_parameterGroups = json::object();
        std::optional<Version> m_version;
        std::string m_etag;
    };
}

#endif // FIREBASE_ADMIN_REMOTE_CONFIG_TEMPLATE_HPP
