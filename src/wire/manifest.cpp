#include "wire/manifest.hpp"
#include "wire/envelope.hpp"
#include "wire/errors.hpp"

#include <regex>

using json = nlohmann::json;

namespace asap::wire {

namespace {

bool is_semver(const std::string& v) {
    static const std::regex pattern(
        R"(^\d+\.\d+\.\d+(?:-[0-9A-Za-z.-]+)?(?:\+[0-9A-Za-z.-]+)?$)");
    return std::regex_match(v, pattern);
}

std::string read_string(const json& j, const std::string& path, const char* key,
                        std::vector<std::string>& errors, bool required = true) {
    if (!j.contains(key) || j[key].is_null()) {
        if (required) errors.push_back(path + key + ": is required");
        return "";
    }
    if (!j[key].is_string()) {
        errors.push_back(path + key + ": must be a string");
        return "";
    }
    return j[key].get<std::string>();
}

bool read_bool(const json& j, const std::string& path, const char* key, bool fallback,
               std::vector<std::string>& errors) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (!j[key].is_boolean()) {
        errors.push_back(path + key + ": must be a boolean");
        return fallback;
    }
    return j[key].get<bool>();
}

std::vector<std::string> read_string_list(const json& j, const std::string& path, const char* key,
                                          std::vector<std::string>& errors) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_array()) {
        errors.push_back(path + key + ": must be an array");
        return out;
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else {
            errors.push_back(path + key + ": entries must be strings");
        }
    }
    return out;
}

std::optional<json> read_object(const json& j, const std::string& path, const char* key,
                                std::vector<std::string>& errors) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_object()) {
        errors.push_back(path + key + ": must be an object");
        return std::nullopt;
    }
    return j[key];
}

} // namespace

Manifest Manifest::from_json(const json& j) {
    std::vector<std::string> errors;
    Manifest m;

    if (!j.is_object()) {
        throw ManifestValidationError({"manifest must be a JSON object"});
    }

    m.id = read_string(j, "", "id", errors);
    if (!m.id.empty() && !is_valid_agent_urn(m.id)) {
        errors.push_back("id: invalid agent URN format: " + m.id);
    }
    m.name = read_string(j, "", "name", errors);
    m.version = read_string(j, "", "version", errors);
    if (!m.version.empty() && !is_semver(m.version)) {
        errors.push_back("version: must be a semantic version, got " + m.version);
    }
    m.description = read_string(j, "", "description", errors);

    // Capabilities
    if (!j.contains("capabilities") || !j["capabilities"].is_object()) {
        errors.push_back("capabilities: is required and must be an object");
    } else {
        const json& caps = j["capabilities"];
        std::string v = read_string(caps, "capabilities.", "asap_version", errors, false);
        if (!v.empty()) m.capabilities.asap_version = v;
        m.capabilities.state_persistence =
            read_bool(caps, "capabilities.", "state_persistence", false, errors);
        m.capabilities.streaming = read_bool(caps, "capabilities.", "streaming", false, errors);
        m.capabilities.mcp_tools = read_string_list(caps, "capabilities.", "mcp_tools", errors);

        if (caps.contains("skills") && !caps["skills"].is_null()) {
            if (!caps["skills"].is_array()) {
                errors.push_back("capabilities.skills: must be an array");
            } else {
                size_t i = 0;
                for (const auto& sj : caps["skills"]) {
                    std::string path = "capabilities.skills[" + std::to_string(i++) + "].";
                    if (!sj.is_object()) {
                        errors.push_back(path.substr(0, path.size() - 1) + ": must be an object");
                        continue;
                    }
                    Skill skill;
                    skill.id = read_string(sj, path, "id", errors);
                    skill.description = read_string(sj, path, "description", errors);
                    skill.input_schema = read_object(sj, path, "input_schema", errors);
                    skill.output_schema = read_object(sj, path, "output_schema", errors);
                    m.capabilities.skills.push_back(std::move(skill));
                }
            }
        }
    }

    // Endpoints
    if (!j.contains("endpoints") || !j["endpoints"].is_object()) {
        errors.push_back("endpoints: is required and must be an object");
    } else {
        const json& ep = j["endpoints"];
        m.endpoints.asap = read_string(ep, "endpoints.", "asap", errors);
        std::string events = read_string(ep, "endpoints.", "events", errors, false);
        if (!events.empty()) m.endpoints.events = events;
    }

    if (auto auth = read_object(j, "", "auth", errors)) {
        AuthScheme scheme;
        if (!auth->contains("schemes")) {
            errors.push_back("auth.schemes: is required");
        }
        scheme.schemes = read_string_list(*auth, "auth.", "schemes", errors);
        scheme.oauth2 = read_object(*auth, "auth.", "oauth2", errors);
        m.auth = std::move(scheme);
    }

    std::string signature = read_string(j, "", "signature", errors, false);
    if (!signature.empty()) m.signature = signature;

    if (!errors.empty()) {
        throw ManifestValidationError(std::move(errors));
    }
    return m;
}

json Manifest::to_json() const {
    json skills = json::array();
    for (const auto& s : capabilities.skills) {
        json sj;
        sj["id"] = s.id;
        sj["description"] = s.description;
        if (s.input_schema) sj["input_schema"] = *s.input_schema;
        if (s.output_schema) sj["output_schema"] = *s.output_schema;
        skills.push_back(std::move(sj));
    }

    json j;
    j["id"] = id;
    j["name"] = name;
    j["version"] = version;
    j["description"] = description;
    j["capabilities"] = {
        {"asap_version", capabilities.asap_version},
        {"skills", skills},
        {"state_persistence", capabilities.state_persistence},
        {"streaming", capabilities.streaming},
        {"mcp_tools", capabilities.mcp_tools}
    };
    j["endpoints"] = {{"asap", endpoints.asap}};
    if (endpoints.events) {
        j["endpoints"]["events"] = *endpoints.events;
    }
    if (auth) {
        j["auth"] = {{"schemes", auth->schemes}};
        if (auth->oauth2) j["auth"]["oauth2"] = *auth->oauth2;
    }
    if (signature) {
        j["signature"] = *signature;
    }
    return j;
}

bool Manifest::has_skill(const std::string& skill_id) const {
    for (const auto& s : capabilities.skills) {
        if (s.id == skill_id) return true;
    }
    return false;
}

} // namespace asap::wire
