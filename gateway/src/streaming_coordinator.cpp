#include "tutorgate/gateway/streaming_coordinator.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include "runtime/task_pool.hpp"
#include <caf/error.hpp>
#include <cctype>
#include <exception>

namespace tutorgate {
namespace gateway {

namespace {

// Words are counted across token boundaries, so a word split over two tokens counts once
class WordCounter {
public:
    void feed(const std::string& text) {
        for (unsigned char c : text) {
            bool space = std::isspace(c) != 0;
            if (!space && !in_word_) {
                ++words_;
            }
            in_word_ = !space;
        }
    }

    int64_t words() const { return words_; }
    int64_t estimated_tokens() const { return static_cast<int64_t>(words_ * 1.3); }

private:
    int64_t words_ = 0;
    bool in_word_ = false;
};

} // namespace

bool StreamingCoordinator::StreamSession::request_cancel(CancelReason reason) {
    int expected = static_cast<int>(CancelReason::none);
    return cancel_reason.compare_exchange_strong(expected, static_cast<int>(reason));
}

StreamingCoordinator::StreamingCoordinator(StreamingConfig config,
                                           std::shared_ptr<GenerationService> generation,
                                           std::shared_ptr<RequestTracer> tracer,
                                           std::shared_ptr<Observability> observability)
    : config_(std::move(config)),
      generation_(std::move(generation)),
      tracer_(std::move(tracer)),
      observability_(std::move(observability)) {
    if (config_.max_concurrent_streams < 1) {
        config_.max_concurrent_streams = 1;
    }
    auto obs = observability_;
    drivers_ = std::make_unique<TaskPool>(config_.max_concurrent_streams, [obs](const std::string& error) {
        obs->log_error("Stream driver raised", "", "", {{"error", error}});
    });
}

StreamingCoordinator::~StreamingCoordinator() {
    shutdown();
}

bool StreamingCoordinator::is_overload(const caf::error& err) {
    return err.code() == static_cast<uint8_t>(caf::sec::unavailable_or_would_block);
}

caf::expected<StreamHandle> StreamingCoordinator::open(const std::string& prompt,
                                                       GenerationMode mode,
                                                       std::shared_ptr<TokenSink> sink,
                                                       TraceContext trace) {
    if (!sink) {
        return caf::make_error(caf::sec::invalid_argument, "stream requires a sink");
    }
    RequestTracer::breadcrumb(trace, "streaming");

    auto session = std::make_shared<StreamSession>();
    session->session_id = tracer_->generate_id();
    session->mode = mode;
    session->sink = std::move(sink);
    session->trace = std::move(trace);

    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (closing_) {
            return caf::make_error(caf::sec::runtime_error, "streaming coordinator is shutting down");
        }
        if (sessions_.size() >= static_cast<size_t>(config_.max_concurrent_streams)) {
            observability_->log_warn_with_trace("Stream capacity exhausted", session->trace, {
                {"max_concurrent_streams", std::to_string(config_.max_concurrent_streams)}
            });
            return caf::make_error(caf::sec::unavailable_or_would_block, "stream capacity exhausted");
        }
        // The slot is held from here so concurrent opens see it
        sessions_.emplace(session->session_id, session);
        active = sessions_.size();
    }
    observability_->set_active_streams(static_cast<int64_t>(active));

    auto stream = generation_->generate(prompt, mode);
    if (!stream) {
        observability_->log_error_with_trace("Generation service refused stream", session->trace, {
            {"session_id", session->session_id},
            {"error", caf::to_string(stream.error())}
        });
        remove_session(session->session_id);
        return std::move(stream.error());
    }
    session->stream = std::move(*stream);

    StreamHandle handle;
    handle.session_id = session->session_id;
    handle.outcome = session->promise.get_future().share();

    if (!drivers_->submit([this, session]() { drive(session); })) {
        session->stream->close();
        remove_session(session->session_id);
        return caf::make_error(caf::sec::runtime_error, "streaming coordinator is shutting down");
    }

    observability_->log_info_with_trace("Stream opened", session->trace, {
        {"session_id", session->session_id},
        {"mode", ResultConverter::mode_to_string(mode)}
    });
    return handle;
}

caf::expected<void> StreamingCoordinator::cancel(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "unknown or finished session: " + session_id);
    }
    it->second->request_cancel(CancelReason::user);
    return caf::unit;
}

caf::expected<StreamState> StreamingCoordinator::state(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return caf::make_error(caf::sec::invalid_argument, "unknown or finished session: " + session_id);
    }
    return it->second->state.load();
}

size_t StreamingCoordinator::active_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool StreamingCoordinator::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return sessions_.empty(); });
}

void StreamingCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        closing_ = true;
        for (auto& entry : sessions_) {
            entry.second->request_cancel(CancelReason::user);
        }
    }
    drivers_->shutdown();
}

void StreamingCoordinator::remove_session(const std::string& session_id) {
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(session_id);
        active = sessions_.size();
    }
    idle_cv_.notify_all();
    observability_->set_active_streams(static_cast<int64_t>(active));
}

void StreamingCoordinator::drive(const std::shared_ptr<StreamSession>& session) {
    auto started = std::chrono::steady_clock::now();
    StreamOutcome outcome;
    outcome.session_id = session->session_id;
    outcome.correlation_id = session->trace.correlation_id;

    WordCounter words;
    std::string tail;
    bool token_ceiling = false;
    StreamState final_state = StreamState::completed;

    session->state.store(StreamState::streaming);
    try {
        while (true) {
            if (session->cancelled() != CancelReason::none) {
                final_state = StreamState::cancelled;
                break;
            }
            if (!session->sink->connected()) {
                session->request_cancel(CancelReason::disconnect);
                final_state = StreamState::cancelled;
                break;
            }
            if (outcome.tokens_delivered >= config_.max_tokens) {
                token_ceiling = true;
                final_state = StreamState::completed;
                break;
            }

            auto next = session->stream->next(config_.read_timeout);
            if (!next) {
                final_state = StreamState::failed;
                const auto code = next.error().code();
                if (code == static_cast<uint8_t>(caf::sec::request_timeout)) {
                    outcome.error_code = ErrorCode::connection_timeout;
                    outcome.error_message = "Generation service stopped responding";
                } else if (code == static_cast<uint8_t>(caf::sec::unexpected_response)) {
                    outcome.error_code = ErrorCode::http_error;
                    outcome.error_message = "Generation service rejected the request";
                } else {
                    outcome.error_code = ErrorCode::backend_unavailable;
                    outcome.error_message = "Generation service failed";
                }
                observability_->log_error_with_trace("Generation stream failed", session->trace, {
                    {"session_id", session->session_id},
                    {"error", caf::to_string(next.error())}
                });
                break;
            }
            if (!next->has_value()) {
                final_state = StreamState::completed;
                break;
            }
            // A token read after cancel is dropped
            if (session->cancelled() != CancelReason::none) {
                final_state = StreamState::cancelled;
                break;
            }

            const std::string& token = **next;
            auto written = session->sink->write_token(session->session_id, token);
            if (!written) {
                if (!session->sink->connected()) {
                    session->request_cancel(CancelReason::disconnect);
                    final_state = StreamState::cancelled;
                } else {
                    final_state = StreamState::failed;
                    outcome.error_code = ErrorCode::network_error;
                    outcome.error_message = "Failed to deliver token to client";
                    observability_->log_error_with_trace("Token delivery failed", session->trace, {
                        {"session_id", session->session_id},
                        {"error", caf::to_string(written.error())}
                    });
                }
                break;
            }

            ++outcome.tokens_delivered;
            outcome.bytes_delivered += static_cast<int64_t>(token.size());
            words.feed(token);
            tail += token;
            if (tail.size() > config_.diagnostic_tail_bytes) {
                tail.erase(0, tail.size() - config_.diagnostic_tail_bytes);
            }
        }
    } catch (const std::exception& e) {
        final_state = StreamState::failed;
        outcome.error_code = ErrorCode::internal_error;
        outcome.error_message = "Internal streaming failure";
        observability_->log_error_with_trace("Stream driver raised", session->trace, {
            {"session_id", session->session_id},
            {"error", e.what()}
        });
    }

    session->stream->close();

    if (final_state == StreamState::cancelled) {
        outcome.error_code = ErrorCode::cancelled_by_user;
        outcome.error_message = session->cancelled() == CancelReason::disconnect
                                    ? "Client disconnected"
                                    : "Cancelled by client";
    }

    session->state.store(final_state);
    outcome.state = final_state;
    outcome.estimated_tokens = words.estimated_tokens();
    outcome.diagnostic_tail = tail;
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    outcome.trace = session->trace;

    try {
        session->sink->finish(outcome);
    } catch (const std::exception& e) {
        observability_->log_error_with_trace("Stream sink finish raised", session->trace, {
            {"session_id", session->session_id},
            {"error", e.what()}
        });
    }

    const std::string state_name = ResultConverter::stream_state_to_string(final_state);
    observability_->record_stream_outcome(state_name, outcome.tokens_delivered);
    std::unordered_map<std::string, std::string> context = {
        {"session_id", session->session_id},
        {"state", state_name},
        {"tokens_delivered", std::to_string(outcome.tokens_delivered)},
        {"estimated_tokens", std::to_string(outcome.estimated_tokens)},
        {"elapsed_ms", std::to_string(outcome.elapsed.count())}
    };
    if (token_ceiling) {
        context["token_ceiling"] = std::to_string(config_.max_tokens);
    }
    if (final_state == StreamState::failed) {
        context["tail"] = tail;
        observability_->log_warn_with_trace("Stream finished", session->trace, context);
    } else {
        observability_->log_info_with_trace("Stream finished", session->trace, context);
    }

    remove_session(session->session_id);
    session->promise.set_value(std::move(outcome));
}

} // namespace gateway
} // namespace tutorgate
