#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace asap::wire {

// A unit of work an agent advertises
struct Skill {
    std::string id;
    std::string description;
    std::optional<nlohmann::json> input_schema;
    std::optional<nlohmann::json> output_schema;
};

struct Capability {
    std::string asap_version = "0.1";
    std::vector<Skill> skills;
    bool state_persistence = false;
    bool streaming = false;
    std::vector<std::string> mcp_tools;
};

struct Endpoint {
    std::string asap;                  // HTTP endpoint for ASAP messages
    std::optional<std::string> events; // WebSocket endpoint, if streaming
};

// Carried opaquely; token validation happens outside the transport core
struct AuthScheme {
    std::vector<std::string> schemes;
    std::optional<nlohmann::json> oauth2;
};

// Peer self-description published at /.well-known/asap/manifest.json
struct Manifest {
    std::string id;          // agent URN
    std::string name;
    std::string version;     // semantic version
    std::string description;
    Capability capabilities;
    Endpoint endpoints;
    std::optional<AuthScheme> auth;
    std::optional<std::string> signature;

    // Throws ManifestValidationError listing every problem found
    static Manifest from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool has_skill(const std::string& skill_id) const;
};

} // namespace asap::wire
