#pragma once

#include "tutorgate/gateway/core.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <algorithm>

namespace tutorgate {
namespace gateway {

// Conversion utilities between the gateway data model and its JSON wire form

class ResultConverter {
public:
    static std::string language_to_string(Language language) {
        switch (language) {
            case Language::python:
                return "python";
            case Language::javascript:
                return "javascript";
            case Language::bash:
                return "bash";
        }
        return "python";
    }

    // Accepts the short aliases clients commonly send ("py", "js", "node", "sh")
    static caf::expected<Language> string_to_language(const std::string& value) {
        if (value == "python" || value == "python3" || value == "py") {
            return Language::python;
        }
        if (value == "javascript" || value == "js" || value == "node") {
            return Language::javascript;
        }
        if (value == "bash" || value == "sh" || value == "shell") {
            return Language::bash;
        }
        return caf::make_error(caf::sec::invalid_argument, "unsupported language: " + value);
    }

    // Contract: "ok" | "policy_rejected" | "timeout" | "runtime_error" |
    //           "resource_exceeded" | "queue_timeout" | "internal_error"
    static std::string status_to_string(ExecutionStatus status) {
        switch (status) {
            case ExecutionStatus::ok:
                return "ok";
            case ExecutionStatus::policy_rejected:
                return "policy_rejected";
            case ExecutionStatus::timeout:
                return "timeout";
            case ExecutionStatus::runtime_error:
                return "runtime_error";
            case ExecutionStatus::resource_exceeded:
                return "resource_exceeded";
            case ExecutionStatus::queue_timeout:
                return "queue_timeout";
            case ExecutionStatus::internal_error:
                return "internal_error";
        }
        return "internal_error";
    }

    static std::string killed_reason_to_string(KilledReason reason) {
        switch (reason) {
            case KilledReason::none:
                return "none";
            case KilledReason::timeout:
                return "timeout";
            case KilledReason::cpu_limit:
                return "cpu_limit";
            case KilledReason::memory_limit:
                return "memory_limit";
            case KilledReason::file_size_limit:
                return "file_size_limit";
        }
        return "none";
    }

    // Convert ErrorCode to machine-readable string code
    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::missing_required_field:
                return "MISSING_REQUIRED_FIELD";
            case ErrorCode::invalid_format:
                return "INVALID_FORMAT";
            case ErrorCode::policy_violation:
                return "POLICY_VIOLATION";
            case ErrorCode::execution_failed:
                return "EXECUTION_FAILED";
            case ErrorCode::resource_exceeded:
                return "RESOURCE_EXCEEDED";
            case ErrorCode::quota_exceeded:
                return "QUOTA_EXCEEDED";
            case ErrorCode::queue_timeout:
                return "QUEUE_TIMEOUT";
            case ErrorCode::network_error:
                return "NETWORK_ERROR";
            case ErrorCode::connection_timeout:
                return "CONNECTION_TIMEOUT";
            case ErrorCode::http_error:
                return "HTTP_ERROR";
            case ErrorCode::backend_unavailable:
                return "BACKEND_UNAVAILABLE";
            case ErrorCode::internal_error:
                return "INTERNAL_ERROR";
            case ErrorCode::system_overload:
                return "SYSTEM_OVERLOAD";
            case ErrorCode::cancelled_by_user:
                return "CANCELLED_BY_USER";
            case ErrorCode::cancelled_by_timeout:
                return "CANCELLED_BY_TIMEOUT";
        }
        return "UNKNOWN_ERROR";
    }

    static std::string endpoint_to_string(EndpointClass endpoint) {
        switch (endpoint) {
            case EndpointClass::health:
                return "health";
            case EndpointClass::analytics_summary:
                return "analytics_summary";
            case EndpointClass::analytics:
                return "analytics";
            case EndpointClass::users:
                return "users";
            case EndpointClass::ask:
                return "ask";
            case EndpointClass::execute:
                return "execute";
            case EndpointClass::roadmaps:
                return "roadmaps";
            case EndpointClass::global:
                return "global";
        }
        return "global";
    }

    static caf::expected<EndpointClass> string_to_endpoint(const std::string& value) {
        static const std::map<std::string, EndpointClass> endpoints = {
            {"health", EndpointClass::health},
            {"analytics_summary", EndpointClass::analytics_summary},
            {"analytics", EndpointClass::analytics},
            {"users", EndpointClass::users},
            {"ask", EndpointClass::ask},
            {"execute", EndpointClass::execute},
            {"roadmaps", EndpointClass::roadmaps},
            {"global", EndpointClass::global}
        };
        auto it = endpoints.find(value);
        if (it == endpoints.end()) {
            return caf::make_error(caf::sec::invalid_argument, "unknown endpoint class: " + value);
        }
        return it->second;
    }

    static std::string mode_to_string(GenerationMode mode) {
        switch (mode) {
            case GenerationMode::guided:
                return "guided";
            case GenerationMode::debug_practice:
                return "debug_practice";
            case GenerationMode::perfect:
                return "perfect";
        }
        return "guided";
    }

    // Unknown modes fall back to guided
    static GenerationMode string_to_mode(const std::string& value) {
        if (value == "debug_practice") {
            return GenerationMode::debug_practice;
        }
        if (value == "perfect") {
            return GenerationMode::perfect;
        }
        return GenerationMode::guided;
    }

    static std::string stream_state_to_string(StreamState state) {
        switch (state) {
            case StreamState::opened:
                return "opened";
            case StreamState::streaming:
                return "streaming";
            case StreamState::completed:
                return "completed";
            case StreamState::cancelled:
                return "cancelled";
            case StreamState::failed:
                return "failed";
        }
        return "failed";
    }

    static nlohmann::json to_json(const ExecutionResult& result) {
        nlohmann::json out;
        out["request_id"] = result.request_id;
        out["status"] = status_to_string(result.status);
        out["stdout"] = result.stdout_text;
        out["stderr"] = result.stderr_text;
        out["exit_code"] = result.exit_code;
        out["elapsed_ms"] = result.elapsed.count();
        out["truncated"] = result.stdout_truncated || result.stderr_truncated;
        if (result.killed_reason != KilledReason::none) {
            out["killed_reason"] = killed_reason_to_string(result.killed_reason);
        }
        if (result.error_code != ErrorCode::none) {
            out["error_code"] = error_code_to_string(result.error_code);
            out["error"] = result.error_message;
        }
        if (!result.violations.empty()) {
            nlohmann::json violations = nlohmann::json::array();
            for (const auto& violation : result.violations) {
                violations.push_back({{"category", violation.category}, {"symbol", violation.symbol}});
            }
            out["violations"] = violations;
        }
        return out;
    }

    // Rate-limit headers attached to every admitted or rejected response
    static std::map<std::string, std::string> rate_limit_headers(const QuotaDecision& decision) {
        std::map<std::string, std::string> headers;
        headers["X-RateLimit-Limit"] = std::to_string(decision.limit);
        headers["X-RateLimit-Remaining"] = std::to_string(std::max<int64_t>(decision.remaining, 0));
        headers["X-RateLimit-Reset"] = std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(decision.reset_at.time_since_epoch()).count());
        if (!decision.allowed) {
            headers["Retry-After"] = std::to_string(decision.retry_after.count());
        }
        return headers;
    }

    static nlohmann::json to_json(const QuotaDecision& decision) {
        nlohmann::json out;
        out["allowed"] = decision.allowed;
        for (const auto& [name, value] : rate_limit_headers(decision)) {
            out["headers"][name] = value;
        }
        if (decision.degraded) {
            out["degraded"] = true;
        }
        return out;
    }

    // Validate ExecutionResult invariants before it leaves the gateway
    static bool validate_result(const ExecutionResult& result) {
        if (result.request_id.empty()) {
            return false;
        }
        if ((result.status == ExecutionStatus::ok) != (result.error_code == ErrorCode::none)) {
            return false;
        }
        if (result.status == ExecutionStatus::policy_rejected && result.violations.empty()) {
            return false;
        }
        if (result.status == ExecutionStatus::timeout && result.killed_reason != KilledReason::timeout) {
            return false;
        }
        return result.elapsed.count() >= 0;
    }
};

} // namespace gateway
} // namespace tutorgate
