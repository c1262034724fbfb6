#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace asap::wire {

enum class TaskStatus {
    SUBMITTED,
    WORKING,
    INPUT_REQUIRED,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::SUBMITTED:      return "submitted";
        case TaskStatus::WORKING:        return "working";
        case TaskStatus::INPUT_REQUIRED: return "input_required";
        case TaskStatus::COMPLETED:      return "completed";
        case TaskStatus::FAILED:         return "failed";
        case TaskStatus::CANCELLED:      return "cancelled";
        default: return "unknown";
    }
}

inline std::optional<TaskStatus> task_status_from_string(const std::string& str) {
    if (str == "submitted")      return TaskStatus::SUBMITTED;
    if (str == "working")        return TaskStatus::WORKING;
    if (str == "input_required") return TaskStatus::INPUT_REQUIRED;
    if (str == "completed")      return TaskStatus::COMPLETED;
    if (str == "failed")         return TaskStatus::FAILED;
    if (str == "cancelled")      return TaskStatus::CANCELLED;
    return std::nullopt;
}

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED ||
           status == TaskStatus::FAILED ||
           status == TaskStatus::CANCELLED;
}

// Payload of a task.request envelope
struct TaskRequest {
    std::string conversation_id;
    std::optional<std::string> parent_task_id;
    std::string skill_id;
    nlohmann::json input = nlohmann::json::object();
    std::optional<nlohmann::json> config;

    // Throws ValidationError
    static TaskRequest from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Payload of a task.response envelope
struct TaskResponse {
    std::string task_id;
    TaskStatus status = TaskStatus::COMPLETED;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> final_state;
    std::optional<nlohmann::json> metrics;

    // Throws ValidationError
    static TaskResponse from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace asap::wire
