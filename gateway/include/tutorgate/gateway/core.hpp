#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <cstdint>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/sec.hpp>

namespace tutorgate {
namespace gateway {

// Forward declarations
class Observability;
class RequestTracer;

enum class Language {
    python,
    javascript,
    bash
};

// Terminal outcome of one execution request
enum class ExecutionStatus {
    ok,
    policy_rejected,
    timeout,
    runtime_error,
    resource_exceeded,
    queue_timeout,
    internal_error
};

// Machine-readable error codes for programmatic error handling
enum class ErrorCode {
    none = 0,
    // Validation errors (1xxx)
    invalid_input = 1001,
    missing_required_field = 1002,
    invalid_format = 1003,
    policy_violation = 1004,
    // Execution errors (2xxx)
    execution_failed = 2001,
    resource_exceeded = 2002,
    quota_exceeded = 2004,
    queue_timeout = 2005,
    // Network errors (3xxx)
    network_error = 3001,
    connection_timeout = 3002,
    http_error = 3003,
    backend_unavailable = 3004,
    // System errors (4xxx)
    internal_error = 4001,
    system_overload = 4002,
    // Cancellation (5xxx)
    cancelled_by_user = 5001,
    cancelled_by_timeout = 5002
};

// Why the governor stopped a process, if it did
enum class KilledReason {
    none,
    timeout,
    cpu_limit,
    memory_limit,
    file_size_limit
};

// Request classes with distinct quota rules
enum class EndpointClass {
    health,
    analytics_summary,
    analytics,
    users,
    ask,
    execute,
    roadmaps,
    global
};

// Teaching modes forwarded to the generation service
enum class GenerationMode {
    guided,
    debug_practice,
    perfect
};

// Per-session state machine: opened -> streaming -> {completed | cancelled | failed}
enum class StreamState {
    opened,
    streaming,
    completed,
    cancelled,
    failed
};

// Correlation data attached at ingress and flushed at egress
struct TraceContext {
    std::string correlation_id;
    std::string client_id;
    std::string endpoint;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
    std::vector<std::string> breadcrumbs;

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at).count();
    }
};

struct PolicyViolation {
    std::string category;  // filesystem_escape | networking | process_control | not_allowed | too_large | empty_source
    std::string symbol;

    bool operator==(const PolicyViolation& other) const {
        return category == other.category && symbol == other.symbol;
    }
};

struct PolicyVerdict {
    bool allowed = true;
    std::vector<PolicyViolation> violations;

    bool has_symbol(const std::string& symbol) const {
        for (const auto& violation : violations) {
            if (violation.symbol == symbol) {
                return true;
            }
        }
        return false;
    }
};

// A code submission. Immutable once created.
class ExecutionRequest {
public:
    ExecutionRequest(std::string request_id,
                     Language language,
                     std::string source,
                     std::string caller_id,
                     std::chrono::system_clock::time_point submitted_at = std::chrono::system_clock::now())
        : request_id_(std::move(request_id)),
          language_(language),
          source_(std::move(source)),
          caller_id_(std::move(caller_id)),
          submitted_at_(submitted_at),
          received_at_(std::chrono::steady_clock::now()) {}

    const std::string& request_id() const { return request_id_; }
    Language language() const { return language_; }
    const std::string& source() const { return source_; }
    const std::string& caller_id() const { return caller_id_; }
    std::chrono::system_clock::time_point submitted_at() const { return submitted_at_; }

    // When the gateway accepted the request; queue waits are measured from here
    std::chrono::steady_clock::time_point received_at() const { return received_at_; }
    void set_received_at(std::chrono::steady_clock::time_point received_at) { received_at_ = received_at; }

private:
    std::string request_id_;
    Language language_;
    std::string source_;
    std::string caller_id_;
    std::chrono::system_clock::time_point submitted_at_;
    std::chrono::steady_clock::time_point received_at_;
};

// Result of one execution request, produced exactly once and owned by the caller
struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::ok;
    ErrorCode error_code = ErrorCode::none;
    std::string request_id;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    int exit_code = 0;
    KilledReason killed_reason = KilledReason::none;
    std::chrono::milliseconds elapsed{0};
    std::vector<PolicyViolation> violations;
    std::string error_message;  // Human-readable, never carries internal detail

    bool is_success() const { return status == ExecutionStatus::ok; }
    bool is_timeout() const { return status == ExecutionStatus::timeout; }
    bool is_policy_rejected() const { return status == ExecutionStatus::policy_rejected; }

    static ExecutionResult policy_rejected(const std::string& request_id,
                                           std::vector<PolicyViolation> violations) {
        ExecutionResult result;
        result.status = ExecutionStatus::policy_rejected;
        result.error_code = ErrorCode::policy_violation;
        result.request_id = request_id;
        result.violations = std::move(violations);
        result.error_message = "Submission rejected by execution policy";
        return result;
    }

    static ExecutionResult queue_timeout(const std::string& request_id,
                                         std::chrono::milliseconds waited) {
        ExecutionResult result;
        result.status = ExecutionStatus::queue_timeout;
        result.error_code = ErrorCode::queue_timeout;
        result.request_id = request_id;
        result.elapsed = waited;
        result.error_message = "Execution capacity exhausted, try again later";
        return result;
    }

    static ExecutionResult internal_error(const std::string& request_id) {
        ExecutionResult result;
        result.status = ExecutionStatus::internal_error;
        result.error_code = ErrorCode::internal_error;
        result.request_id = request_id;
        result.exit_code = -1;
        result.error_message = "Internal execution failure";
        return result;
    }
};

// Outcome of a single quota check. Never persisted.
struct QuotaDecision {
    bool allowed = true;
    int64_t limit = 0;
    int64_t remaining = 0;
    std::chrono::system_clock::time_point reset_at;
    std::chrono::seconds retry_after{0};
    bool degraded = false;  // answered by the local fallback
};

// Gateway configuration
struct GatewayConfig {
    // Sandbox
    int sandbox_max_concurrency = 4;
    int sandbox_max_queue_depth = 64;
    int64_t sandbox_queue_wait_ms = 2000;
    int64_t sandbox_wall_timeout_ms = 5000;
    int64_t sandbox_cpu_seconds = 5;
    int64_t sandbox_memory_mb = 256;
    int64_t sandbox_max_output_bytes = 64 * 1024;
    int64_t sandbox_grace_period_ms = 500;
    int64_t sandbox_max_processes = 256;
    std::string sandbox_temp_root = "/tmp";
    std::string policy_file;
    int64_t max_source_chars = 10000;

    // Quota store
    std::string redis_url;  // empty selects the in-process store only
    int64_t redis_timeout_ms = 200;
    int64_t quota_sweep_interval_ms = 60000;
    int64_t quota_probe_base_delay_ms = 1000;
    int64_t quota_probe_max_delay_ms = 30000;

    // Streaming
    int max_concurrent_streams = 32;
    int64_t stream_read_timeout_ms = 30000;
    int64_t stream_max_tokens = 4096;
    std::string generation_url = "http://127.0.0.1:11434";
    std::string generation_model = "mistral";

    // Persistence
    std::string history_db = "tutorgate_history.db";
    int history_turns = 5;

    // Ingress
    int request_pool_size = 8;
    std::string metrics_endpoint = "0.0.0.0:9090";
};

} // namespace gateway
} // namespace tutorgate
