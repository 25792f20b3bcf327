#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/generation_service.hpp"
#include "tutorgate/gateway/streaming_coordinator.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace tutorgate {
namespace gateway {

class RateLimiter;
class SandboxExecutor;
class HistoryStore;

struct ExecuteOutcome {
    std::string correlation_id;
    QuotaDecision quota;
    std::optional<ExecutionResult> result;  // empty when rate limited
};

struct AskRequest {
    std::string client_id;
    std::string question;
    GenerationMode mode = GenerationMode::guided;
    std::string correlation_id;  // optional incoming id
};

struct AskOutcome {
    std::string correlation_id;
    QuotaDecision quota;
    std::optional<StreamHandle> stream;
    ErrorCode error_code = ErrorCode::none;
    std::string error_message;
};

// Quota check on behalf of a companion service (analytics, users, roadmaps)
struct QuotaOutcome {
    std::string correlation_id;
    EndpointClass endpoint = EndpointClass::global;
    QuotaDecision quota;
};

struct HealthOutcome {
    std::string correlation_id;
    QuotaDecision quota;
    int active_executions = 0;
    int queued_executions = 0;
    size_t active_streams = 0;
};

/**
 * Gateway
 *
 * Composes the admission path every inbound request takes: the tracer
 * stamps a correlation id, the rate limiter admits or rejects, then code
 * goes to the sandbox executor and questions to the streaming coordinator.
 * The history store is optional; persistence failures are logged and never
 * fail the request.
 */
class Gateway {
public:
    static constexpr size_t kMinQuestionChars = 5;
    static constexpr size_t kMaxQuestionChars = 1000;
    static constexpr size_t kMaxStoredAnswerBytes = 64 * 1024;

    Gateway(std::shared_ptr<RequestTracer> tracer,
            std::shared_ptr<RateLimiter> limiter,
            std::shared_ptr<SandboxExecutor> executor,
            std::shared_ptr<StreamingCoordinator> coordinator,
            std::shared_ptr<HistoryStore> history,
            std::shared_ptr<Observability> observability,
            int history_turns = 5);

    // received_at marks when the request entered the gateway; time spent
    // queued before this call is charged to the sandbox queue wait
    ExecuteOutcome handle_execute(const std::string& client_id,
                                  Language language,
                                  const std::string& source,
                                  const std::string& incoming_correlation_id = "",
                                  std::chrono::steady_clock::time_point received_at =
                                      std::chrono::steady_clock::now());

    AskOutcome handle_ask(const AskRequest& request, std::shared_ptr<TokenSink> sink);

    HealthOutcome handle_health(const std::string& client_id,
                                const std::string& incoming_correlation_id = "");

    QuotaOutcome handle_quota(const std::string& client_id,
                              EndpointClass endpoint,
                              const std::string& incoming_correlation_id = "");

    caf::expected<void> cancel_stream(const std::string& session_id);

    // Trimmed question, or invalid_argument when outside 5..1000 characters
    static caf::expected<std::string> validate_question(const std::string& question);

    // Recent turns followed by the new question
    std::string build_prompt(const std::string& client_id, const std::string& question, const TraceContext& trace);

private:
    std::shared_ptr<RequestTracer> tracer_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<SandboxExecutor> executor_;
    std::shared_ptr<StreamingCoordinator> coordinator_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<Observability> observability_;
    int history_turns_;
};

} // namespace gateway
} // namespace tutorgate
