#include <iostream>
#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "tutorgate/gateway/gateway.hpp"
#include "tutorgate/gateway/history_store.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/rate_limiter.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/sandbox_executor.hpp"

using namespace tutorgate::gateway;

class EchoRunner : public ProcessRunner {
public:
    caf::expected<BoundedResult> run_bounded(const BoundedCommand& command, const ResourceLimits&) override {
        BoundedResult result;
        result.exit_code = 0;
        result.stdout_text = command.files.empty() ? "" : command.files[0].second;
        result.elapsed = std::chrono::milliseconds(3);
        return result;
    }
};

// Every session streams the same canned answer
class CannedTokenStream : public TokenStream {
public:
    explicit CannedTokenStream(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

    caf::expected<std::optional<std::string>> next(std::chrono::milliseconds) override {
        if (closed_ || index_ >= tokens_.size()) {
            return std::optional<std::string>();
        }
        return std::optional<std::string>(tokens_[index_++]);
    }
    void close() override { closed_ = true; }

private:
    std::vector<std::string> tokens_;
    size_t index_ = 0;
    bool closed_ = false;
};

class CannedGenerationService : public GenerationService {
public:
    caf::expected<std::unique_ptr<TokenStream>> generate(const std::string& prompt, GenerationMode mode) override {
        std::lock_guard<std::mutex> lock(mutex);
        prompts.push_back(prompt);
        modes.push_back(mode);
        return std::unique_ptr<TokenStream>(new CannedTokenStream(answer));
    }

    std::mutex mutex;
    std::vector<std::string> prompts;
    std::vector<GenerationMode> modes;
    std::vector<std::string> answer = {"A loop", " repeats."};
};

class CollectingSink : public TokenSink {
public:
    caf::expected<void> write_token(const std::string&, const std::string& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        text += token;
        return caf::unit;
    }
    bool connected() const override { return true; }
    void finish(const StreamOutcome& outcome) override {
        std::lock_guard<std::mutex> lock(mutex_);
        final_state = outcome.state;
        ++finish_calls;
    }

    std::string text;
    StreamState final_state = StreamState::opened;
    int finish_calls = 0;

private:
    std::mutex mutex_;
};

// Keeps every request of a test inside one window
class FrozenQuotaClock : public QuotaClock {
public:
    int64_t now_ms() const override { return 1000; }
};

struct Fixture {
    std::ostringstream logs;
    std::shared_ptr<Observability> observability = std::make_shared<Observability>("test_gateway");
    std::shared_ptr<RequestTracer> tracer;
    std::shared_ptr<LocalQuotaStore> store;
    std::shared_ptr<RateLimiter> limiter;
    std::shared_ptr<SandboxExecutor> executor;
    std::shared_ptr<CannedGenerationService> generation = std::make_shared<CannedGenerationService>();
    std::shared_ptr<StreamingCoordinator> coordinator;
    std::shared_ptr<SqliteHistoryStore> history;
    std::unique_ptr<Gateway> gateway;

    explicit Fixture(RateLimiter::Rules rules = RateLimiter::default_rules()) {
        observability->set_log_stream(&logs);
        tracer = std::make_shared<RequestTracer>(observability);
        store = std::make_shared<LocalQuotaStore>(std::make_shared<FrozenQuotaClock>(), std::chrono::milliseconds(0));
        limiter = std::make_shared<RateLimiter>(store, observability, rules);

        auto validator = std::make_shared<PolicyValidator>(std::make_shared<PolicyRuleSet>(PolicyRuleSet::defaults()));
        executor = std::make_shared<SandboxExecutor>(SandboxConfig(), validator, std::make_shared<EchoRunner>(), observability);

        coordinator = std::make_shared<StreamingCoordinator>(StreamingConfig(), generation, tracer, observability);

        auto opened = SqliteHistoryStore::open(":memory:");
        assert(opened);
        history = std::shared_ptr<SqliteHistoryStore>(std::move(*opened));

        gateway = std::make_unique<Gateway>(tracer, limiter, executor, coordinator, history, observability, 5);
    }
};

static StreamOutcome await_stream(const AskOutcome& outcome) {
    assert(outcome.stream);
    assert(outcome.stream->outcome.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    return outcome.stream->outcome.get();
}

void test_validate_question() {
    std::cout << "Testing question validation..." << std::endl;

    auto trimmed = Gateway::validate_question("   What is a loop?  \n");
    assert(trimmed);
    assert(*trimmed == "What is a loop?");

    assert(Gateway::validate_question("hello"));
    assert(!Gateway::validate_question("hi"));
    assert(!Gateway::validate_question("   hi    "));
    assert(!Gateway::validate_question(""));

    assert(Gateway::validate_question(std::string(1000, 'q')));
    auto too_long = Gateway::validate_question(std::string(1001, 'q'));
    assert(!too_long);
    assert(too_long.error().code() == static_cast<uint8_t>(caf::sec::invalid_argument));

    // Length is counted in characters, not bytes
    assert(Gateway::validate_question("h\xC3\xA9llo"));
    assert(!Gateway::validate_question("\xC3\xA9\xC3\xA9\xC3\xA9"));

    std::cout << "✓ Question validation test passed" << std::endl;
}

void test_execute_path() {
    std::cout << "Testing execute path..." << std::endl;

    Fixture fx;
    ExecuteOutcome outcome = fx.gateway->handle_execute("alice", Language::python, "print('hi')", "corr-exec-1");

    assert(outcome.correlation_id == "corr-exec-1");
    assert(outcome.quota.allowed);
    assert(outcome.quota.limit == 10);
    assert(outcome.quota.remaining == 9);
    assert(outcome.result);
    assert(outcome.result->is_success());
    assert(outcome.result->request_id == "corr-exec-1");
    assert(outcome.result->stdout_text == "print('hi')");

    auto count = fx.history->execution_count("alice");
    assert(count && *count == 1);

    std::string logs = fx.logs.str();
    assert(logs.find("Request completed") != std::string::npos);
    assert(logs.find("ingress>rate_limiter>policy>admission>sandbox") != std::string::npos);

    std::cout << "✓ Execute path test passed" << std::endl;
}

void test_execute_rate_limited() {
    std::cout << "Testing execute rate limiting..." << std::endl;

    RateLimiter::Rules rules = {
        {EndpointClass::execute, {2, std::chrono::seconds(300)}},
        {EndpointClass::global, {1000, std::chrono::seconds(3600)}},
    };
    Fixture fx(rules);

    assert(fx.gateway->handle_execute("bob", Language::bash, "echo 1").result);
    assert(fx.gateway->handle_execute("bob", Language::bash, "echo 2").result);

    ExecuteOutcome limited = fx.gateway->handle_execute("bob", Language::bash, "echo 3");
    assert(!limited.result);
    assert(!limited.quota.allowed);
    assert(limited.quota.retry_after.count() >= 1);

    // Rejected requests never reach the sandbox or the history
    auto count = fx.history->execution_count("bob");
    assert(count && *count == 2);
    assert(fx.logs.str().find("rate_limited") != std::string::npos);

    std::cout << "✓ Execute rate limiting test passed" << std::endl;
}

void test_policy_rejection_is_recorded() {
    std::cout << "Testing policy rejection through the gateway..." << std::endl;

    Fixture fx;
    ExecuteOutcome outcome = fx.gateway->handle_execute("carol", Language::javascript, "require('fs')");
    assert(outcome.result);
    assert(outcome.result->is_policy_rejected());
    assert(outcome.result->violations[0].symbol == "fs");

    auto count = fx.history->execution_count("carol");
    assert(count && *count == 1);

    std::cout << "✓ Policy rejection test passed" << std::endl;
}

void test_ask_streams_and_records_history() {
    std::cout << "Testing ask path with conversation history..." << std::endl;

    Fixture fx;
    AskRequest first;
    first.client_id = "dana";
    first.question = "  What is a loop?  ";
    first.mode = GenerationMode::debug_practice;

    auto sink = std::make_shared<CollectingSink>();
    AskOutcome outcome = fx.gateway->handle_ask(first, sink);
    assert(outcome.error_code == ErrorCode::none);
    assert(outcome.quota.allowed);
    assert(outcome.quota.limit == 20);

    StreamOutcome streamed = await_stream(outcome);
    assert(streamed.state == StreamState::completed);
    assert(sink->text == "A loop repeats.");
    assert(sink->finish_calls == 1);
    assert(fx.generation->prompts[0] == "User: What is a loop?\nAssistant:");
    assert(fx.generation->modes[0] == GenerationMode::debug_practice);

    auto stored = fx.history->recent_messages("dana", 10);
    assert(stored && stored->size() == 2);
    assert((*stored)[0].role == "user");
    assert((*stored)[0].content == "What is a loop?");
    assert((*stored)[1].role == "assistant");
    assert((*stored)[1].content == "A loop repeats.");
    assert((*stored)[1].state == "completed");
    assert((*stored)[1].mode == "debug_practice");

    AskRequest second;
    second.client_id = "dana";
    second.question = "And recursion?";
    AskOutcome follow_up = fx.gateway->handle_ask(second, std::make_shared<CollectingSink>());
    await_stream(follow_up);
    assert(fx.generation->prompts[1] ==
           "User: What is a loop?\nAssistant: A loop repeats.\nUser: And recursion?\nAssistant:");

    std::cout << "✓ Ask path test passed" << std::endl;
}

void test_ask_invalid_question() {
    std::cout << "Testing ask with an invalid question..." << std::endl;

    Fixture fx;
    AskRequest ask;
    ask.client_id = "erin";
    ask.question = "why";

    AskOutcome outcome = fx.gateway->handle_ask(ask, std::make_shared<CollectingSink>());
    assert(!outcome.stream);
    assert(outcome.error_code == ErrorCode::invalid_input);
    assert(fx.generation->prompts.empty());

    auto stored = fx.history->recent_messages("erin", 10);
    assert(stored && stored->empty());

    std::cout << "✓ Invalid question test passed" << std::endl;
}

void test_ask_rate_limited() {
    std::cout << "Testing ask rate limiting..." << std::endl;

    RateLimiter::Rules rules = {{EndpointClass::ask, {1, std::chrono::seconds(300)}}};
    Fixture fx(rules);

    AskRequest ask;
    ask.client_id = "frank";
    ask.question = "What is a variable?";

    await_stream(fx.gateway->handle_ask(ask, std::make_shared<CollectingSink>()));
    AskOutcome limited = fx.gateway->handle_ask(ask, std::make_shared<CollectingSink>());
    assert(!limited.stream);
    assert(limited.error_code == ErrorCode::quota_exceeded);
    assert(!limited.quota.allowed);
    assert(fx.generation->prompts.size() == 1);

    std::cout << "✓ Ask rate limiting test passed" << std::endl;
}

void test_health_and_cancel() {
    std::cout << "Testing health and cancel..." << std::endl;

    Fixture fx;
    HealthOutcome health = fx.gateway->handle_health("monitor", "corr-health");
    assert(health.correlation_id == "corr-health");
    assert(health.quota.allowed);
    assert(health.quota.limit == 100);
    assert(health.active_executions == 0);
    assert(health.active_streams == 0);

    auto cancelled = fx.gateway->cancel_stream("missing-session");
    assert(!cancelled);

    std::cout << "✓ Health and cancel test passed" << std::endl;
}

void test_companion_endpoint_quota() {
    std::cout << "Testing quota checks for companion endpoints..." << std::endl;

    Fixture fx;
    for (int i = 0; i < 5; ++i) {
        QuotaOutcome outcome = fx.gateway->handle_quota("gina", EndpointClass::users);
        assert(outcome.quota.allowed);
        assert(outcome.endpoint == EndpointClass::users);
    }
    QuotaOutcome limited = fx.gateway->handle_quota("gina", EndpointClass::users, "corr-users");
    assert(!limited.quota.allowed);
    assert(limited.correlation_id == "corr-users");
    assert(limited.quota.limit == 5);

    // Separate class, separate budget
    assert(fx.gateway->handle_quota("gina", EndpointClass::roadmaps).quota.allowed);

    std::cout << "✓ Companion endpoint quota test passed" << std::endl;
}

int main() {
    std::cout << "=== Gateway Tests ===" << std::endl;

    try {
        test_validate_question();
        test_execute_path();
        test_execute_rate_limited();
        test_policy_rejection_is_recorded();
        test_ask_streams_and_records_history();
        test_ask_invalid_question();
        test_ask_rate_limited();
        test_health_and_cancel();
        test_companion_endpoint_quota();

        std::cout << "\n=== All tests passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
