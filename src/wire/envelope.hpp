/**
 * ASAP Envelope
 *
 * The protocol's message unit. An Envelope is validated once when it is
 * built and is immutable afterwards; id and timestamp are filled in when the
 * sender leaves them empty.
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "util/time_format.hpp"
#include "wire/payload_kind.hpp"

namespace asap::wire {

constexpr const char* ASAP_PROTOCOL_VERSION = "0.1";
constexpr size_t MAX_URN_LENGTH = 256;

// Raw field set an Envelope is built from
struct EnvelopeFields {
    std::optional<std::string> id;                 // ULID generated when empty
    std::string asap_version = ASAP_PROTOCOL_VERSION;
    std::optional<util::Timestamp> timestamp;      // now (UTC) when empty
    std::string sender;                            // urn:asap:agent:...
    std::string recipient;                         // urn:asap:agent:...
    std::string payload_type;                      // e.g. "task.request"
    nlohmann::json payload = nlohmann::json::object();
    std::optional<std::string> correlation_id;     // required for response kinds
    std::optional<std::string> trace_id;
    bool requires_ack = false;
    std::optional<nlohmann::json> extensions;
};

// "urn:asap:agent:<name>" or "urn:asap:agent:<name>:<sub>", lowercase, <= 256 chars
bool is_valid_agent_urn(const std::string& urn);

class Envelope {
public:
    // Throws ValidationError listing every rule the fields break
    explicit Envelope(EnvelopeFields fields);

    // Throws MalformedEnvelopeError if j is not an object, ValidationError otherwise
    static Envelope from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
    std::string dump() const { return to_json().dump(); }

    const std::string& id() const { return fields_.id.value(); }
    const std::string& asap_version() const { return fields_.asap_version; }
    util::Timestamp timestamp() const { return fields_.timestamp.value(); }
    const std::string& sender() const { return fields_.sender; }
    const std::string& recipient() const { return fields_.recipient; }
    const std::string& payload_type() const { return fields_.payload_type; }
    const nlohmann::json& payload() const { return fields_.payload; }
    const std::optional<std::string>& correlation_id() const { return fields_.correlation_id; }
    const std::optional<std::string>& trace_id() const { return fields_.trace_id; }
    bool requires_ack() const { return fields_.requires_ack; }
    const std::optional<nlohmann::json>& extensions() const { return fields_.extensions; }

    PayloadKind payload_kind() const { return payload_kind_from_string(fields_.payload_type); }
    bool is_response() const { return is_response_kind(payload_kind()); }

    // Copy of the fields, for building a derived envelope
    EnvelopeFields fields() const { return fields_; }

    bool operator==(const Envelope& other) const;
    bool operator!=(const Envelope& other) const { return !(*this == other); }

private:
    EnvelopeFields fields_;
};

} // namespace asap::wire
