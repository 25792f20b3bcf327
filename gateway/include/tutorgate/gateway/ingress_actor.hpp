#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/generation_service.hpp"
#include <caf/actor_config.hpp>
#include <caf/behavior.hpp>
#include <caf/event_based_actor.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace tutorgate {
namespace gateway {

class Gateway;
class TaskPool;

// Serialises JSON lines onto the protocol stream
class ResponseWriter {
public:
    explicit ResponseWriter(std::ostream& out) : out_(out) {}

    caf::expected<void> write(const nlohmann::json& line);
    bool healthy() const;

private:
    mutable std::mutex mutex_;
    std::ostream& out_;
};

/**
 * Token sink for the JSON-lines protocol: one `{"session_id","token"}`
 * line per token, then one terminal line with `done: true`.
 */
class JsonLinesTokenSink : public TokenSink {
public:
    explicit JsonLinesTokenSink(std::shared_ptr<ResponseWriter> writer) : writer_(std::move(writer)) {}

    caf::expected<void> write_token(const std::string& session_id, const std::string& token) override;
    bool connected() const override;
    void finish(const StreamOutcome& outcome) override;

    static nlohmann::json terminal_record(const StreamOutcome& outcome);

private:
    std::shared_ptr<ResponseWriter> writer_;
    std::atomic<bool> failed_{false};
};

class IngressActorState {
public:
    IngressActorState(std::shared_ptr<Gateway> gateway,
                      std::shared_ptr<TaskPool> request_pool,
                      std::shared_ptr<ResponseWriter> writer,
                      std::shared_ptr<Observability> observability);

    caf::behavior make_behavior();

    // Parses and dispatches one request line; returns the operation name
    std::string handle_line(const std::string& line);

private:
    void handle_execute(const nlohmann::json& request);
    void handle_ask(const nlohmann::json& request);
    void handle_cancel(const nlohmann::json& request);
    void handle_health(const nlohmann::json& request);
    void handle_quota(const nlohmann::json& request);
    void reject(ErrorCode code, const std::string& message, const std::string& correlation_id = "");
    void refuse_shutting_down(const std::string& correlation_id);

    std::shared_ptr<Gateway> gateway_;
    std::shared_ptr<TaskPool> request_pool_;
    std::shared_ptr<ResponseWriter> writer_;
    std::shared_ptr<Observability> observability_;
};

class IngressActor : public caf::event_based_actor {
public:
    IngressActor(caf::actor_config& cfg,
                 std::shared_ptr<Gateway> gateway,
                 std::shared_ptr<TaskPool> request_pool,
                 std::shared_ptr<ResponseWriter> writer,
                 std::shared_ptr<Observability> observability)
        : caf::event_based_actor(cfg),
          state_(std::move(gateway), std::move(request_pool), std::move(writer), std::move(observability)) {}

    caf::behavior make_behavior() override {
        return state_.make_behavior();
    }

private:
    IngressActorState state_;
};

using ingress_actor = IngressActor;

} // namespace gateway
} // namespace tutorgate
