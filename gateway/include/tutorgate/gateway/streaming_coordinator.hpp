#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/generation_service.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tutorgate {
namespace gateway {

class TaskPool;

struct StreamingConfig {
    int max_concurrent_streams = 32;
    std::chrono::milliseconds read_timeout{30000};
    int64_t max_tokens = 4096;
    size_t diagnostic_tail_bytes = 256;
};

struct StreamHandle {
    std::string session_id;
    std::shared_future<StreamOutcome> outcome;
};

/**
 * Streaming Coordinator
 *
 * Relays a generation session to a client sink one token at a time.
 * Each session is driven by one task on a pool sized to the stream
 * capacity. Between deliveries the driver checks the cancellation flag
 * and the sink's connectivity; cancellation never interrupts a pending
 * read, so a token that arrives after cancel is dropped, never sent.
 *
 * Session states: opened -> streaming -> {completed | cancelled | failed}.
 */
class StreamingCoordinator {
public:
    StreamingCoordinator(StreamingConfig config,
                         std::shared_ptr<GenerationService> generation,
                         std::shared_ptr<RequestTracer> tracer,
                         std::shared_ptr<Observability> observability);
    ~StreamingCoordinator();

    StreamingCoordinator(const StreamingCoordinator&) = delete;
    StreamingCoordinator& operator=(const StreamingCoordinator&) = delete;

    // Refused with unavailable_or_would_block when every stream slot is taken
    caf::expected<StreamHandle> open(const std::string& prompt,
                                     GenerationMode mode,
                                     std::shared_ptr<TokenSink> sink,
                                     TraceContext trace);

    caf::expected<void> cancel(const std::string& session_id);

    caf::expected<StreamState> state(const std::string& session_id) const;

    size_t active_sessions() const;

    // Blocks until no session is active or the timeout passes
    bool wait_idle(std::chrono::milliseconds timeout);

    // Cancels every session and joins the drivers
    void shutdown();

    static bool is_overload(const caf::error& err);

private:
    enum class CancelReason : int {
        none = 0,
        user = 1,
        disconnect = 2
    };

    struct StreamSession {
        std::string session_id;
        GenerationMode mode = GenerationMode::guided;
        std::shared_ptr<TokenSink> sink;
        std::unique_ptr<TokenStream> stream;
        TraceContext trace;
        std::atomic<StreamState> state{StreamState::opened};
        std::atomic<int> cancel_reason{static_cast<int>(CancelReason::none)};
        std::promise<StreamOutcome> promise;

        // First reason wins
        bool request_cancel(CancelReason reason);
        CancelReason cancelled() const { return static_cast<CancelReason>(cancel_reason.load()); }
    };

    void drive(const std::shared_ptr<StreamSession>& session);
    void remove_session(const std::string& session_id);

    StreamingConfig config_;
    std::shared_ptr<GenerationService> generation_;
    std::shared_ptr<RequestTracer> tracer_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex sessions_mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, std::shared_ptr<StreamSession>> sessions_;
    bool closing_ = false;

    std::unique_ptr<TaskPool> drivers_;
};

} // namespace gateway
} // namespace tutorgate
