#include "tutorgate/gateway/gateway.hpp"
#include "tutorgate/gateway/history_store.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/rate_limiter.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include "tutorgate/gateway/sandbox_executor.hpp"
#include <caf/error.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace tutorgate {
namespace gateway {

namespace {

size_t count_code_points(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Forwards to the client sink while keeping the answer for the history store
class HistoryRecordingSink : public TokenSink {
public:
    HistoryRecordingSink(std::shared_ptr<TokenSink> inner,
                         std::shared_ptr<HistoryStore> history,
                         std::shared_ptr<RequestTracer> tracer,
                         std::shared_ptr<Observability> observability,
                         std::string client_id,
                         std::string mode)
        : inner_(std::move(inner)),
          history_(std::move(history)),
          tracer_(std::move(tracer)),
          observability_(std::move(observability)),
          client_id_(std::move(client_id)),
          mode_(std::move(mode)) {}

    caf::expected<void> write_token(const std::string& session_id, const std::string& token) override {
        auto written = inner_->write_token(session_id, token);
        if (written) {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t room = Gateway::kMaxStoredAnswerBytes - std::min(answer_.size(), Gateway::kMaxStoredAnswerBytes);
            answer_.append(token, 0, std::min(room, token.size()));
        }
        return written;
    }

    bool connected() const override { return inner_->connected(); }

    void finish(const StreamOutcome& outcome) override {
        inner_->finish(outcome);

        const std::string state = ResultConverter::stream_state_to_string(outcome.state);
        std::string answer;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            answer.swap(answer_);
        }
        if (history_ && !answer.empty()) {
            ConversationMessage message;
            message.client_id = client_id_;
            message.session_id = outcome.session_id;
            message.correlation_id = outcome.correlation_id;
            message.role = "assistant";
            message.content = std::move(answer);
            message.mode = mode_;
            message.state = state;
            auto saved = history_->save_message(message);
            if (!saved) {
                observability_->log_warn_with_trace("Failed to store answer", outcome.trace, {
                    {"session_id", outcome.session_id},
                    {"error", caf::to_string(saved.error())}
                });
            }
        }
        tracer_->finish(outcome.trace, state);
    }

private:
    std::shared_ptr<TokenSink> inner_;
    std::shared_ptr<HistoryStore> history_;
    std::shared_ptr<RequestTracer> tracer_;
    std::shared_ptr<Observability> observability_;
    std::string client_id_;
    std::string mode_;
    std::mutex mutex_;
    std::string answer_;
};

} // namespace

Gateway::Gateway(std::shared_ptr<RequestTracer> tracer,
                 std::shared_ptr<RateLimiter> limiter,
                 std::shared_ptr<SandboxExecutor> executor,
                 std::shared_ptr<StreamingCoordinator> coordinator,
                 std::shared_ptr<HistoryStore> history,
                 std::shared_ptr<Observability> observability,
                 int history_turns)
    : tracer_(std::move(tracer)),
      limiter_(std::move(limiter)),
      executor_(std::move(executor)),
      coordinator_(std::move(coordinator)),
      history_(std::move(history)),
      observability_(std::move(observability)),
      history_turns_(history_turns > 0 ? history_turns : 0) {}

caf::expected<std::string> Gateway::validate_question(const std::string& question) {
    size_t begin = 0;
    size_t end = question.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(question[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(question[end - 1]))) {
        --end;
    }
    std::string trimmed = question.substr(begin, end - begin);
    size_t length = count_code_points(trimmed);
    if (length < kMinQuestionChars) {
        return caf::make_error(caf::sec::invalid_argument, "question must be at least 5 characters");
    }
    if (length > kMaxQuestionChars) {
        return caf::make_error(caf::sec::invalid_argument, "question must be at most 1000 characters");
    }
    return trimmed;
}

std::string Gateway::build_prompt(const std::string& client_id,
                                  const std::string& question,
                                  const TraceContext& trace) {
    std::string prompt;
    if (history_ && history_turns_ > 0) {
        // One turn is a question and its answer
        auto recent = history_->recent_messages(client_id, static_cast<size_t>(history_turns_) * 2);
        if (recent) {
            for (const auto& message : *recent) {
                prompt += (message.role == "assistant" ? "Assistant: " : "User: ") + message.content + "\n";
            }
        } else {
            observability_->log_warn_with_trace("History unavailable, answering without context", trace, {
                {"error", caf::to_string(recent.error())}
            });
        }
    }
    prompt += "User: " + question + "\nAssistant:";
    return prompt;
}

ExecuteOutcome Gateway::handle_execute(const std::string& client_id,
                                       Language language,
                                       const std::string& source,
                                       const std::string& incoming_correlation_id,
                                       std::chrono::steady_clock::time_point received_at) {
    TraceContext trace = tracer_->begin(client_id, EndpointClass::execute, incoming_correlation_id);
    ExecuteOutcome outcome;
    outcome.correlation_id = trace.correlation_id;

    outcome.quota = limiter_->check(client_id, EndpointClass::execute, trace);
    if (!outcome.quota.allowed) {
        tracer_->finish(trace, "rate_limited");
        return outcome;
    }

    ExecutionRequest request(trace.correlation_id, language, source, client_id);
    request.set_received_at(received_at);
    ExecutionResult result = executor_->execute(request, trace);
    if (!ResultConverter::validate_result(result)) {
        observability_->log_error_with_trace("Execution result failed validation", trace, {
            {"request_id", result.request_id},
            {"status", ResultConverter::status_to_string(result.status)}
        });
        result = ExecutionResult::internal_error(trace.correlation_id);
    }

    if (history_) {
        ExecutionEvent event;
        event.request_id = result.request_id;
        event.client_id = client_id;
        event.language = ResultConverter::language_to_string(language);
        event.status = ResultConverter::status_to_string(result.status);
        event.exit_code = result.exit_code;
        event.elapsed_ms = result.elapsed.count();
        event.stdout_truncated = result.stdout_truncated;
        auto recorded = history_->record_execution(event);
        if (!recorded) {
            observability_->log_warn_with_trace("Failed to record execution", trace, {
                {"error", caf::to_string(recorded.error())}
            });
        }
    }

    tracer_->finish(trace, ResultConverter::status_to_string(result.status));
    outcome.result = std::move(result);
    return outcome;
}

AskOutcome Gateway::handle_ask(const AskRequest& request, std::shared_ptr<TokenSink> sink) {
    TraceContext trace = tracer_->begin(request.client_id, EndpointClass::ask, request.correlation_id);
    AskOutcome outcome;
    outcome.correlation_id = trace.correlation_id;

    outcome.quota = limiter_->check(request.client_id, EndpointClass::ask, trace);
    if (!outcome.quota.allowed) {
        outcome.error_code = ErrorCode::quota_exceeded;
        outcome.error_message = "Rate limit exceeded";
        tracer_->finish(trace, "rate_limited");
        return outcome;
    }

    auto question = validate_question(request.question);
    if (!question) {
        outcome.error_code = ErrorCode::invalid_input;
        outcome.error_message = "Question must be between 5 and 1000 characters";
        tracer_->finish(trace, "invalid_request");
        return outcome;
    }

    const std::string mode = ResultConverter::mode_to_string(request.mode);
    std::string prompt = build_prompt(request.client_id, *question, trace);

    if (history_) {
        ConversationMessage message;
        message.client_id = request.client_id;
        message.correlation_id = trace.correlation_id;
        message.role = "user";
        message.content = *question;
        message.mode = mode;
        auto saved = history_->save_message(message);
        if (!saved) {
            observability_->log_warn_with_trace("Failed to store question", trace, {
                {"error", caf::to_string(saved.error())}
            });
        }
    }

    auto recording = std::make_shared<HistoryRecordingSink>(
        std::move(sink), history_, tracer_, observability_, request.client_id, mode);
    auto handle = coordinator_->open(prompt, request.mode, recording, trace);
    if (!handle) {
        if (StreamingCoordinator::is_overload(handle.error())) {
            outcome.error_code = ErrorCode::system_overload;
            outcome.error_message = "Too many active streams, try again later";
            tracer_->finish(trace, "overloaded");
        } else {
            outcome.error_code = ErrorCode::backend_unavailable;
            outcome.error_message = "Generation service unavailable";
            tracer_->finish(trace, "failed");
        }
        return outcome;
    }
    outcome.stream = std::move(*handle);
    return outcome;
}

HealthOutcome Gateway::handle_health(const std::string& client_id, const std::string& incoming_correlation_id) {
    TraceContext trace = tracer_->begin(client_id, EndpointClass::health, incoming_correlation_id);
    HealthOutcome outcome;
    outcome.correlation_id = trace.correlation_id;
    outcome.quota = limiter_->check(client_id, EndpointClass::health, trace);
    if (outcome.quota.allowed) {
        outcome.active_executions = executor_->active_executions();
        outcome.queued_executions = executor_->queued_executions();
        outcome.active_streams = coordinator_->active_sessions();
    }
    tracer_->finish(trace, outcome.quota.allowed ? "ok" : "rate_limited");
    return outcome;
}

QuotaOutcome Gateway::handle_quota(const std::string& client_id,
                                   EndpointClass endpoint,
                                   const std::string& incoming_correlation_id) {
    TraceContext trace = tracer_->begin(client_id, endpoint, incoming_correlation_id);
    QuotaOutcome outcome;
    outcome.correlation_id = trace.correlation_id;
    outcome.endpoint = endpoint;
    outcome.quota = limiter_->check(client_id, endpoint, trace);
    tracer_->finish(trace, outcome.quota.allowed ? "allowed" : "rate_limited");
    return outcome;
}

caf::expected<void> Gateway::cancel_stream(const std::string& session_id) {
    return coordinator_->cancel(session_id);
}

} // namespace gateway
} // namespace tutorgate
