#include "wire/envelope.hpp"
#include "wire/errors.hpp"
#include "util/ulid.hpp"

#include <regex>
#include <vector>

using json = nlohmann::json;

namespace asap::wire {

namespace {

const std::regex& agent_urn_pattern() {
    static const std::regex pattern("^urn:asap:agent:[a-z0-9-]+(?::[a-z0-9-]+)?$");
    return pattern;
}

void check_urn(const char* field, const std::string& value, std::vector<std::string>& reasons) {
    if (value.empty()) {
        reasons.push_back(std::string(field) + ": is required");
    } else if (value.size() > MAX_URN_LENGTH) {
        reasons.push_back(std::string(field) + ": agent URN must be at most " +
                          std::to_string(MAX_URN_LENGTH) + " characters, got " +
                          std::to_string(value.size()));
    } else if (!std::regex_match(value, agent_urn_pattern())) {
        reasons.push_back(std::string(field) + ": invalid agent URN format: " + value);
    }
}

// Optional string field; null and absent are the same
std::optional<std::string> optional_string(const json& j, const char* key,
                                           std::vector<std::string>& reasons) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        reasons.push_back(std::string(key) + ": must be a string");
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

std::string required_string(const json& j, const char* key, std::vector<std::string>& reasons) {
    if (!j.contains(key) || j[key].is_null()) {
        reasons.push_back(std::string(key) + ": is required");
        return "";
    }
    if (!j[key].is_string()) {
        reasons.push_back(std::string(key) + ": must be a string");
        return "";
    }
    return j[key].get<std::string>();
}

} // namespace

bool is_valid_agent_urn(const std::string& urn) {
    return !urn.empty() && urn.size() <= MAX_URN_LENGTH &&
           std::regex_match(urn, agent_urn_pattern());
}

// ============================================================================
// Construction
// ============================================================================

Envelope::Envelope(EnvelopeFields fields)
    : fields_(std::move(fields))
{
    std::vector<std::string> reasons;

    if (!fields_.id) {
        fields_.id = util::generate_ulid();
    } else if (fields_.id->empty()) {
        reasons.push_back("id: must not be empty");
    }

    if (!fields_.timestamp) {
        fields_.timestamp = std::chrono::system_clock::now();
    }
    fields_.timestamp = util::truncate_to_micros(*fields_.timestamp);

    if (fields_.asap_version.empty()) {
        reasons.push_back("asap_version: is required");
    }

    check_urn("sender", fields_.sender, reasons);
    check_urn("recipient", fields_.recipient, reasons);

    if (fields_.payload_type.empty()) {
        reasons.push_back("payload_type: is required");
    }

    if (!fields_.payload.is_object()) {
        reasons.push_back("payload: must be an object");
    }

    if (fields_.extensions && !fields_.extensions->is_object()) {
        reasons.push_back("extensions: must be an object");
    }

    if (!fields_.payload_type.empty() &&
        is_response_kind(payload_kind_from_string(fields_.payload_type)) &&
        (!fields_.correlation_id || fields_.correlation_id->empty())) {
        reasons.push_back(fields_.payload_type +
                          " must have correlation_id for request tracking");
    }

    if (!reasons.empty()) {
        throw ValidationError(std::move(reasons));
    }
}

// ============================================================================
// Serialization
// ============================================================================

Envelope Envelope::from_json(const json& j) {
    if (!j.is_object()) {
        throw MalformedEnvelopeError("envelope must be a JSON object");
    }

    static const char* known_fields[] = {
        "id", "asap_version", "timestamp", "sender", "recipient", "payload_type",
        "payload", "correlation_id", "trace_id", "requires_ack", "extensions"
    };

    std::vector<std::string> reasons;
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* f : known_fields) {
            if (it.key() == f) {
                known = true;
                break;
            }
        }
        if (!known) {
            reasons.push_back(it.key() + ": extra fields not permitted");
        }
    }

    EnvelopeFields fields;
    fields.id = optional_string(j, "id", reasons);
    fields.asap_version = required_string(j, "asap_version", reasons);
    fields.sender = required_string(j, "sender", reasons);
    fields.recipient = required_string(j, "recipient", reasons);
    fields.payload_type = required_string(j, "payload_type", reasons);
    fields.correlation_id = optional_string(j, "correlation_id", reasons);
    fields.trace_id = optional_string(j, "trace_id", reasons);

    if (auto ts = optional_string(j, "timestamp", reasons)) {
        try {
            fields.timestamp = util::parse_iso8601(*ts);
        } catch (const std::invalid_argument& e) {
            reasons.push_back(std::string("timestamp: ") + e.what());
        }
    }

    if (!j.contains("payload")) {
        reasons.push_back("payload: is required");
    } else {
        fields.payload = j["payload"];
    }

    if (j.contains("requires_ack") && !j["requires_ack"].is_null()) {
        if (j["requires_ack"].is_boolean()) {
            fields.requires_ack = j["requires_ack"].get<bool>();
        } else {
            reasons.push_back("requires_ack: must be a boolean");
        }
    }

    if (j.contains("extensions") && !j["extensions"].is_null()) {
        fields.extensions = j["extensions"];
    }

    if (!reasons.empty()) {
        throw ValidationError(std::move(reasons));
    }
    return Envelope(std::move(fields));
}

json Envelope::to_json() const {
    json j;
    j["id"] = id();
    j["asap_version"] = fields_.asap_version;
    j["timestamp"] = util::format_iso8601(timestamp());
    j["sender"] = fields_.sender;
    j["recipient"] = fields_.recipient;
    j["payload_type"] = fields_.payload_type;
    j["payload"] = fields_.payload;
    j["correlation_id"] = fields_.correlation_id ? json(*fields_.correlation_id) : json(nullptr);
    j["trace_id"] = fields_.trace_id ? json(*fields_.trace_id) : json(nullptr);
    j["requires_ack"] = fields_.requires_ack;
    j["extensions"] = fields_.extensions ? *fields_.extensions : json(nullptr);
    return j;
}

bool Envelope::operator==(const Envelope& other) const {
    return fields_.id == other.fields_.id &&
           fields_.asap_version == other.fields_.asap_version &&
           fields_.timestamp == other.fields_.timestamp &&
           fields_.sender == other.fields_.sender &&
           fields_.recipient == other.fields_.recipient &&
           fields_.payload_type == other.fields_.payload_type &&
           fields_.payload == other.fields_.payload &&
           fields_.correlation_id == other.fields_.correlation_id &&
           fields_.trace_id == other.fields_.trace_id &&
           fields_.requires_ack == other.fields_.requires_ack &&
           fields_.extensions == other.fields_.extensions;
}

} // namespace asap::wire
