#pragma once
#include <cctype>
#include <string>

namespace asap::wire {

// Payload discriminators known to the protocol. Anything else is CUSTOM and
// is routed by its exact string.
enum class PayloadKind {
    TASK_REQUEST,
    TASK_RESPONSE,
    TASK_UPDATE,
    TASK_CANCEL,
    MESSAGE_SEND,
    MESSAGE_ACK,
    STATE_QUERY,
    STATE_RESTORE,
    ARTIFACT_NOTIFY,
    MCP_TOOL_CALL,
    MCP_TOOL_RESULT,
    MCP_RESOURCE_FETCH,
    MCP_RESOURCE_DATA,
    CUSTOM
};

// "Task.Response", "task_response" and "TaskResponse" are all "taskresponse"
inline std::string normalize_payload_type(const std::string& payload_type) {
    std::string out;
    out.reserve(payload_type.size());
    for (unsigned char c : payload_type) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

inline std::string payload_kind_to_string(PayloadKind kind) {
    switch (kind) {
        case PayloadKind::TASK_REQUEST:       return "task.request";
        case PayloadKind::TASK_RESPONSE:      return "task.response";
        case PayloadKind::TASK_UPDATE:        return "task.update";
        case PayloadKind::TASK_CANCEL:        return "task.cancel";
        case PayloadKind::MESSAGE_SEND:       return "message.send";
        case PayloadKind::MESSAGE_ACK:        return "message.ack";
        case PayloadKind::STATE_QUERY:        return "state.query";
        case PayloadKind::STATE_RESTORE:      return "state.restore";
        case PayloadKind::ARTIFACT_NOTIFY:    return "artifact.notify";
        case PayloadKind::MCP_TOOL_CALL:      return "mcp.tool_call";
        case PayloadKind::MCP_TOOL_RESULT:    return "mcp.tool_result";
        case PayloadKind::MCP_RESOURCE_FETCH: return "mcp.resource_fetch";
        case PayloadKind::MCP_RESOURCE_DATA:  return "mcp.resource_data";
        default: return "custom";
    }
}

inline PayloadKind payload_kind_from_string(const std::string& payload_type) {
    std::string n = normalize_payload_type(payload_type);
    if (n == "taskrequest")      return PayloadKind::TASK_REQUEST;
    if (n == "taskresponse")     return PayloadKind::TASK_RESPONSE;
    if (n == "taskupdate")       return PayloadKind::TASK_UPDATE;
    if (n == "taskcancel")       return PayloadKind::TASK_CANCEL;
    if (n == "messagesend")      return PayloadKind::MESSAGE_SEND;
    if (n == "messageack")       return PayloadKind::MESSAGE_ACK;
    if (n == "statequery")       return PayloadKind::STATE_QUERY;
    if (n == "staterestore")     return PayloadKind::STATE_RESTORE;
    if (n == "artifactnotify")   return PayloadKind::ARTIFACT_NOTIFY;
    if (n == "mcptoolcall")      return PayloadKind::MCP_TOOL_CALL;
    if (n == "mcptoolresult")    return PayloadKind::MCP_TOOL_RESULT;
    if (n == "mcpresourcefetch") return PayloadKind::MCP_RESOURCE_FETCH;
    if (n == "mcpresourcedata")  return PayloadKind::MCP_RESOURCE_DATA;
    return PayloadKind::CUSTOM;
}

// Response kinds must carry a correlation_id
inline bool is_response_kind(PayloadKind kind) {
    return kind == PayloadKind::TASK_RESPONSE ||
           kind == PayloadKind::MCP_TOOL_RESULT ||
           kind == PayloadKind::MCP_RESOURCE_DATA;
}

} // namespace asap::wire
