#include "wire/task.hpp"
#include "wire/errors.hpp"
#include <vector>

using json = nlohmann::json;

namespace asap::wire {

namespace {

std::string want_string(const json& j, const char* key, std::vector<std::string>& errors) {
    if (!j.contains(key) || !j[key].is_string()) {
        errors.push_back(std::string(key) + ": is required and must be a string");
        return "";
    }
    return j[key].get<std::string>();
}

std::optional<json> maybe_object(const json& j, const char* key, std::vector<std::string>& errors) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_object()) {
        errors.push_back(std::string(key) + ": must be an object");
        return std::nullopt;
    }
    return j[key];
}

} // namespace

TaskRequest TaskRequest::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError({"task.request payload must be an object"});
    }
    std::vector<std::string> errors;
    TaskRequest req;
    req.conversation_id = want_string(j, "conversation_id", errors);
    req.skill_id = want_string(j, "skill_id", errors);
    if (j.contains("parent_task_id") && j["parent_task_id"].is_string()) {
        req.parent_task_id = j["parent_task_id"].get<std::string>();
    }
    if (!j.contains("input") || !j["input"].is_object()) {
        errors.push_back("input: is required and must be an object");
    } else {
        req.input = j["input"];
    }
    req.config = maybe_object(j, "config", errors);

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }
    return req;
}

json TaskRequest::to_json() const {
    json j;
    j["conversation_id"] = conversation_id;
    j["skill_id"] = skill_id;
    j["input"] = input;
    if (parent_task_id) j["parent_task_id"] = *parent_task_id;
    if (config) j["config"] = *config;
    return j;
}

TaskResponse TaskResponse::from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError({"task.response payload must be an object"});
    }
    std::vector<std::string> errors;
    TaskResponse resp;
    resp.task_id = want_string(j, "task_id", errors);
    std::string status = want_string(j, "status", errors);
    if (!status.empty()) {
        if (auto parsed = task_status_from_string(status)) {
            resp.status = *parsed;
        } else {
            errors.push_back("status: unknown task status " + status);
        }
    }
    resp.result = maybe_object(j, "result", errors);
    resp.final_state = maybe_object(j, "final_state", errors);
    resp.metrics = maybe_object(j, "metrics", errors);

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }
    return resp;
}

json TaskResponse::to_json() const {
    json j;
    j["task_id"] = task_id;
    j["status"] = task_status_to_string(status);
    j["result"] = result ? *result : json(nullptr);
    if (final_state) j["final_state"] = *final_state;
    if (metrics) j["metrics"] = *metrics;
    return j;
}

} // namespace asap::wire
