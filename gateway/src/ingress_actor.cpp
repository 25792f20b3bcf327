#include "tutorgate/gateway/ingress_actor.hpp"
#include "tutorgate/gateway/gateway.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include "runtime/task_pool.hpp"
#include <caf/error.hpp>

namespace tutorgate {
namespace gateway {

using json = nlohmann::json;

namespace {

std::string string_field(const json& request, const char* key) {
    auto it = request.find(key);
    if (it == request.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json error_line(ErrorCode code, const std::string& message, const std::string& correlation_id) {
    json line = {
        {"error", "invalid_request"},
        {"error_code", ResultConverter::error_code_to_string(code)},
        {"message", message}
    };
    if (!correlation_id.empty()) {
        line["correlation_id"] = correlation_id;
    }
    return line;
}

} // namespace

caf::expected<void> ResponseWriter::write(const json& line) {
    // Invalid UTF-8 in program output is replaced rather than failing the line
    std::string text = line.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << text << '\n';
    out_.flush();
    if (!out_) {
        return caf::make_error(caf::sec::runtime_error, "response stream closed");
    }
    return caf::unit;
}

bool ResponseWriter::healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(out_);
}

caf::expected<void> JsonLinesTokenSink::write_token(const std::string& session_id, const std::string& token) {
    auto written = writer_->write({{"session_id", session_id}, {"token", token}});
    if (!written) {
        failed_.store(true);
    }
    return written;
}

bool JsonLinesTokenSink::connected() const {
    return !failed_.load() && writer_->healthy();
}

json JsonLinesTokenSink::terminal_record(const StreamOutcome& outcome) {
    json line = {
        {"session_id", outcome.session_id},
        {"correlation_id", outcome.correlation_id},
        {"done", true},
        {"state", ResultConverter::stream_state_to_string(outcome.state)},
        {"tokens_streamed", outcome.tokens_delivered},
        {"estimated_tokens", outcome.estimated_tokens},
        {"elapsed_ms", outcome.elapsed.count()}
    };
    if (outcome.error_code != ErrorCode::none) {
        line["error_code"] = ResultConverter::error_code_to_string(outcome.error_code);
        line["error"] = outcome.error_message;
    }
    return line;
}

void JsonLinesTokenSink::finish(const StreamOutcome& outcome) {
    if (!writer_->write(terminal_record(outcome))) {
        failed_.store(true);
    }
}

IngressActorState::IngressActorState(std::shared_ptr<Gateway> gateway,
                                     std::shared_ptr<TaskPool> request_pool,
                                     std::shared_ptr<ResponseWriter> writer,
                                     std::shared_ptr<Observability> observability)
    : gateway_(std::move(gateway)),
      request_pool_(std::move(request_pool)),
      writer_(std::move(writer)),
      observability_(std::move(observability)) {}

caf::behavior IngressActorState::make_behavior() {
    return {
        [this](const std::string& line) -> std::string {
            return handle_line(line);
        }
    };
}

std::string IngressActorState::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "";
    }
    json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        reject(ErrorCode::invalid_format, "request is not a JSON object");
        return "invalid";
    }

    const std::string op = string_field(request, "op");
    if (op == "execute") {
        handle_execute(request);
    } else if (op == "ask") {
        handle_ask(request);
    } else if (op == "cancel") {
        handle_cancel(request);
    } else if (op == "health") {
        handle_health(request);
    } else if (op == "quota") {
        handle_quota(request);
    } else {
        if (op.empty()) {
            reject(ErrorCode::missing_required_field, "missing op", string_field(request, "correlation_id"));
        } else {
            reject(ErrorCode::invalid_input, "unknown op: " + op, string_field(request, "correlation_id"));
        }
        return "invalid";
    }
    return op;
}

void IngressActorState::reject(ErrorCode code, const std::string& message, const std::string& correlation_id) {
    observability_->log_warn("Rejected ingress line", correlation_id, "", {{"reason", message}});
    if (!writer_->write(error_line(code, message, correlation_id))) {
        observability_->log_error("Failed to write response", correlation_id);
    }
}

void IngressActorState::refuse_shutting_down(const std::string& correlation_id) {
    if (!writer_->write(error_line(ErrorCode::system_overload, "gateway is shutting down", correlation_id))) {
        observability_->log_error("Failed to write response", correlation_id);
    }
}

void IngressActorState::handle_execute(const json& request) {
    const std::string client_id = string_field(request, "client_id");
    const std::string correlation_id = string_field(request, "correlation_id");
    if (client_id.empty() || !request.contains("language") || !request.contains("source")) {
        reject(ErrorCode::missing_required_field, "execute requires client_id, language and source", correlation_id);
        return;
    }
    auto language = ResultConverter::string_to_language(string_field(request, "language"));
    if (!language) {
        reject(ErrorCode::invalid_input, caf::to_string(language.error()), correlation_id);
        return;
    }
    if (!request["source"].is_string()) {
        reject(ErrorCode::invalid_format, "source must be a string", correlation_id);
        return;
    }

    auto gateway = gateway_;
    auto writer = writer_;
    auto obs = observability_;
    Language lang = *language;
    std::string source = request["source"].get<std::string>();
    auto received_at = std::chrono::steady_clock::now();
    bool queued = request_pool_->submit([gateway, writer, obs, client_id, lang, source, correlation_id, received_at]() {
        ExecuteOutcome outcome = gateway->handle_execute(client_id, lang, source, correlation_id, received_at);
        json line = {
            {"op", "execute"},
            {"correlation_id", outcome.correlation_id},
            {"rate_limit", ResultConverter::to_json(outcome.quota)}
        };
        if (outcome.result) {
            line["result"] = ResultConverter::to_json(*outcome.result);
        } else {
            line["error"] = "rate_limited";
            line["error_code"] = ResultConverter::error_code_to_string(ErrorCode::quota_exceeded);
            line["retry_after"] = outcome.quota.retry_after.count();
        }
        if (!writer->write(line)) {
            obs->log_error("Failed to write response", outcome.correlation_id, client_id);
        }
    });
    if (!queued) {
        refuse_shutting_down(correlation_id);
    }
}

void IngressActorState::handle_ask(const json& request) {
    AskRequest ask;
    ask.client_id = string_field(request, "client_id");
    ask.question = string_field(request, "question");
    ask.mode = ResultConverter::string_to_mode(string_field(request, "mode"));
    ask.correlation_id = string_field(request, "correlation_id");
    if (ask.client_id.empty() || !request.contains("question")) {
        reject(ErrorCode::missing_required_field, "ask requires client_id and question", ask.correlation_id);
        return;
    }

    auto gateway = gateway_;
    auto writer = writer_;
    auto obs = observability_;
    bool queued = request_pool_->submit([gateway, writer, obs, ask]() {
        auto sink = std::make_shared<JsonLinesTokenSink>(writer);
        AskOutcome outcome = gateway->handle_ask(ask, sink);
        json line = {
            {"op", "ask"},
            {"correlation_id", outcome.correlation_id},
            {"rate_limit", ResultConverter::to_json(outcome.quota)}
        };
        if (outcome.stream) {
            line["session_id"] = outcome.stream->session_id;
        } else {
            line["error"] = outcome.error_code == ErrorCode::quota_exceeded ? "rate_limited" : "ask_failed";
            line["error_code"] = ResultConverter::error_code_to_string(outcome.error_code);
            line["message"] = outcome.error_message;
            if (!outcome.quota.allowed) {
                line["retry_after"] = outcome.quota.retry_after.count();
            }
        }
        if (!writer->write(line)) {
            obs->log_error("Failed to write response", outcome.correlation_id, ask.client_id);
        }
    });
    if (!queued) {
        refuse_shutting_down(ask.correlation_id);
    }
}

void IngressActorState::handle_cancel(const json& request) {
    const std::string session_id = string_field(request, "session_id");
    if (session_id.empty()) {
        reject(ErrorCode::missing_required_field, "cancel requires session_id");
        return;
    }
    auto cancelled = gateway_->cancel_stream(session_id);
    json line = {{"op", "cancel"}, {"session_id", session_id}, {"cancelled", static_cast<bool>(cancelled)}};
    if (!cancelled) {
        line["message"] = "unknown or finished session";
    }
    if (!writer_->write(line)) {
        observability_->log_error("Failed to write response");
    }
}

void IngressActorState::handle_health(const json& request) {
    std::string client_id = string_field(request, "client_id");
    if (client_id.empty()) {
        client_id = "anonymous";
    }
    HealthOutcome outcome = gateway_->handle_health(client_id, string_field(request, "correlation_id"));
    json line = {
        {"op", "health"},
        {"correlation_id", outcome.correlation_id},
        {"rate_limit", ResultConverter::to_json(outcome.quota)}
    };
    if (outcome.quota.allowed) {
        line["status"] = "ok";
        line["active_executions"] = outcome.active_executions;
        line["queued_executions"] = outcome.queued_executions;
        line["active_streams"] = outcome.active_streams;
    } else {
        line["error"] = "rate_limited";
        line["retry_after"] = outcome.quota.retry_after.count();
    }
    if (!writer_->write(line)) {
        observability_->log_error("Failed to write response", outcome.correlation_id, client_id);
    }
}

void IngressActorState::handle_quota(const json& request) {
    const std::string client_id = string_field(request, "client_id");
    const std::string correlation_id = string_field(request, "correlation_id");
    if (client_id.empty()) {
        reject(ErrorCode::missing_required_field, "quota requires client_id and endpoint", correlation_id);
        return;
    }
    auto endpoint = ResultConverter::string_to_endpoint(string_field(request, "endpoint"));
    if (!endpoint) {
        reject(ErrorCode::invalid_input, caf::to_string(endpoint.error()), correlation_id);
        return;
    }

    QuotaOutcome outcome = gateway_->handle_quota(client_id, *endpoint, correlation_id);
    json line = {
        {"op", "quota"},
        {"correlation_id", outcome.correlation_id},
        {"endpoint", ResultConverter::endpoint_to_string(outcome.endpoint)},
        {"rate_limit", ResultConverter::to_json(outcome.quota)}
    };
    if (!outcome.quota.allowed) {
        line["error"] = "rate_limited";
        line["error_code"] = ResultConverter::error_code_to_string(ErrorCode::quota_exceeded);
        line["retry_after"] = outcome.quota.retry_after.count();
    }
    if (!writer_->write(line)) {
        observability_->log_error("Failed to write response", outcome.correlation_id, client_id);
    }
}

} // namespace gateway
} // namespace tutorgate
