#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/resource_governor.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include "tutorgate/gateway/sandbox_executor.hpp"

using namespace tutorgate::gateway;

// Scripted runner: returns a canned result, optionally parking until released
class FakeRunner : public ProcessRunner {
public:
    caf::expected<BoundedResult> run_bounded(const BoundedCommand& command,
                                             const ResourceLimits& limits) override {
        ++calls;
        last_command = command;
        last_limits = limits;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++running_;
            cv_.notify_all();
            cv_.wait(lock, [this]() { return !hold_; });
            --running_;
        }
        if (throw_on_run) {
            throw std::runtime_error("runner exploded at /secret/path");
        }
        if (fail_with_error) {
            return caf::make_error(caf::sec::runtime_error, "fork failed: EAGAIN");
        }
        return next_result;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        hold_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_ = false;
        }
        cv_.notify_all();
    }

    void wait_running(int count) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this, count]() { return running_ >= count; });
    }

    std::atomic<int> calls{0};
    BoundedCommand last_command;
    ResourceLimits last_limits;
    BoundedResult next_result;
    bool fail_with_error = false;
    bool throw_on_run = false;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool hold_ = false;
    int running_ = 0;
};

struct Fixture {
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    std::ostringstream logs;
    std::shared_ptr<Observability> observability = std::make_shared<Observability>("test_sandbox");
    std::unique_ptr<SandboxExecutor> executor;

    explicit Fixture(SandboxConfig config = SandboxConfig()) {
        observability->set_log_stream(&logs);
        auto validator = std::make_shared<PolicyValidator>(std::make_shared<PolicyRuleSet>(PolicyRuleSet::defaults()));
        executor = std::make_unique<SandboxExecutor>(config, validator, runner, observability);
    }
};

void test_successful_execution() {
    std::cout << "Testing successful execution..." << std::endl;

    Fixture fx;
    fx.runner->next_result.exit_code = 0;
    fx.runner->next_result.stdout_text = "hi\n";
    fx.runner->next_result.elapsed = std::chrono::milliseconds(12);

    auto result = fx.executor->execute(ExecutionRequest("req_1", Language::python, "print('hi')", "student"));
    assert(result.is_success());
    assert(result.error_code == ErrorCode::none);
    assert(result.request_id == "req_1");
    assert(result.stdout_text == "hi\n");
    assert(result.elapsed.count() == 12);
    assert(fx.runner->calls == 1);
    assert(fx.runner->last_command.program == "python3");
    assert(fx.logs.str().find("Execution finished") != std::string::npos);

    std::cout << "✓ Successful execution test passed" << std::endl;
}

void test_policy_rejection_skips_runner() {
    std::cout << "Testing policy rejection never reaches the runner..." << std::endl;

    Fixture fx;
    auto result = fx.executor->execute(ExecutionRequest("req_2", Language::python, "import socket", "student"));

    assert(result.is_policy_rejected());
    assert(result.error_code == ErrorCode::policy_violation);
    assert(result.violations.size() == 1);
    assert(result.violations[0].symbol == "socket");
    assert(fx.runner->calls == 0);

    auto empty = fx.executor->execute(ExecutionRequest("req_3", Language::bash, "   ", "student"));
    assert(empty.is_policy_rejected());
    assert(fx.runner->calls == 0);

    std::cout << "✓ Policy rejection test passed" << std::endl;
}

void test_runtime_error() {
    std::cout << "Testing non-zero exit..." << std::endl;

    Fixture fx;
    fx.runner->next_result.exit_code = 2;
    fx.runner->next_result.stderr_text = "Traceback...\nZeroDivisionError\n";

    auto result = fx.executor->execute(ExecutionRequest("req_4", Language::python, "1/0", "student"));
    assert(result.status == ExecutionStatus::runtime_error);
    assert(result.error_code == ErrorCode::execution_failed);
    assert(result.exit_code == 2);
    assert(result.stderr_text.find("ZeroDivisionError") != std::string::npos);

    std::cout << "✓ Non-zero exit test passed" << std::endl;
}

void test_killed_reasons() {
    std::cout << "Testing killed reason translation..." << std::endl;

    SandboxConfig config;
    config.limits.wall_timeout = std::chrono::milliseconds(5000);
    Fixture fx(config);

    fx.runner->next_result.timed_out = true;
    fx.runner->next_result.killed_reason = KilledReason::timeout;
    fx.runner->next_result.exit_code = 143;
    auto timeout = fx.executor->execute(ExecutionRequest("req_5", Language::bash, "sleep 100", "student"));
    assert(timeout.is_timeout());
    assert(timeout.error_code == ErrorCode::cancelled_by_timeout);
    assert(timeout.killed_reason == KilledReason::timeout);
    assert(timeout.error_message.find("5000 ms") != std::string::npos);

    fx.runner->next_result = BoundedResult();
    fx.runner->next_result.killed_reason = KilledReason::memory_limit;
    fx.runner->next_result.exit_code = 1;
    auto memory = fx.executor->execute(ExecutionRequest("req_6", Language::python, "x = [0] * 10**10", "student"));
    assert(memory.status == ExecutionStatus::resource_exceeded);
    assert(memory.error_code == ErrorCode::resource_exceeded);
    assert(memory.error_message == "Memory limit exceeded");

    fx.runner->next_result.killed_reason = KilledReason::cpu_limit;
    auto cpu = fx.executor->execute(ExecutionRequest("req_7", Language::python, "while True: pass", "student"));
    assert(cpu.status == ExecutionStatus::resource_exceeded);
    assert(cpu.error_message == "CPU time limit exceeded");

    std::cout << "✓ Killed reason translation test passed" << std::endl;
}

void test_runner_failures_become_internal_error() {
    std::cout << "Testing runner failures are contained..." << std::endl;

    Fixture fx;
    fx.runner->fail_with_error = true;
    auto failed = fx.executor->execute(ExecutionRequest("req_8", Language::bash, "echo hi", "student"));
    assert(failed.status == ExecutionStatus::internal_error);
    assert(failed.error_code == ErrorCode::internal_error);
    // Internal detail goes to the log, never to the caller
    assert(failed.error_message.find("EAGAIN") == std::string::npos);
    assert(fx.logs.str().find("EAGAIN") != std::string::npos);

    fx.runner->fail_with_error = false;
    fx.runner->throw_on_run = true;
    auto raised = fx.executor->execute(ExecutionRequest("req_9", Language::bash, "echo hi", "student"));
    assert(raised.status == ExecutionStatus::internal_error);
    assert(raised.error_message.find("/secret/path") == std::string::npos);

    // The slot was released on both paths
    assert(fx.executor->active_executions() == 0);

    std::cout << "✓ Runner failure containment test passed" << std::endl;
}

void test_build_invocation() {
    std::cout << "Testing interpreter invocations..." << std::endl;

    ResourceLimits base;
    base.memory_bytes = 256LL * 1024 * 1024;

    ExecutionRequest python("req_py", Language::python, "print(1)", "student");
    auto py = SandboxExecutor::build_invocation(python, base);
    assert(py.program == "python3");
    assert(py.args.back() == "main.py");
    assert(py.files.size() == 1);
    assert(py.files[0].first == "main.py");
    assert(py.files[0].second == "print(1)");

    ExecutionRequest js("req_js", Language::javascript, "console.log(1)", "student");
    ResourceLimits js_limits = SandboxExecutor::limits_for(Language::javascript, base);
    assert(!js_limits.limit_address_space);
    auto node = SandboxExecutor::build_invocation(js, js_limits);
    assert(node.program == "node");
    assert(node.args[0] == "--max-old-space-size=256");
    assert(node.files[0].first == "main.js");

    assert(SandboxExecutor::limits_for(Language::python, base).limit_address_space);

    ExecutionRequest sh("req_sh", Language::bash, "echo 1", "student");
    auto bash = SandboxExecutor::build_invocation(sh, base);
    assert(bash.program == "bash");
    assert(bash.files[0].first == "main.sh");

    std::cout << "✓ Interpreter invocation test passed" << std::endl;
}

void test_queue_full_is_refused() {
    std::cout << "Testing admission with a full queue..." << std::endl;

    SandboxConfig config;
    config.max_concurrency = 1;
    config.max_queue_depth = 0;
    config.max_queue_wait = std::chrono::milliseconds(1000);
    Fixture fx(config);
    fx.runner->hold();

    std::thread first([&fx]() {
        auto result = fx.executor->execute(ExecutionRequest("req_a", Language::bash, "echo a", "student"));
        assert(result.is_success());
    });
    fx.runner->wait_running(1);
    assert(fx.executor->active_executions() == 1);

    auto started = std::chrono::steady_clock::now();
    auto refused = fx.executor->execute(ExecutionRequest("req_b", Language::bash, "echo b", "student"));
    auto waited = std::chrono::steady_clock::now() - started;
    assert(refused.status == ExecutionStatus::queue_timeout);
    assert(refused.error_code == ErrorCode::queue_timeout);
    // No queue slot, so no waiting either
    assert(waited < std::chrono::milliseconds(500));

    fx.runner->release();
    first.join();
    assert(fx.executor->active_executions() == 0);
    assert(fx.runner->calls == 1);

    std::cout << "✓ Full queue test passed" << std::endl;
}

void test_queue_wait_bound() {
    std::cout << "Testing bounded queue wait..." << std::endl;

    SandboxConfig config;
    config.max_concurrency = 1;
    config.max_queue_depth = 4;
    config.max_queue_wait = std::chrono::milliseconds(150);
    Fixture fx(config);
    fx.runner->hold();

    std::thread first([&fx]() {
        fx.executor->execute(ExecutionRequest("req_c", Language::bash, "echo c", "student"));
    });
    fx.runner->wait_running(1);

    auto waited_out = fx.executor->execute(ExecutionRequest("req_d", Language::bash, "echo d", "student"));
    assert(waited_out.status == ExecutionStatus::queue_timeout);
    assert(waited_out.elapsed >= std::chrono::milliseconds(150));

    // A waiter is admitted once the slot frees up
    std::thread second([&fx]() {
        auto result = fx.executor->execute(ExecutionRequest("req_e", Language::bash, "echo e", "student"));
        assert(result.is_success());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    fx.runner->release();
    first.join();
    second.join();
    assert(fx.runner->calls == 2);
    assert(fx.executor->queued_executions() == 0);

    std::cout << "✓ Bounded queue wait test passed" << std::endl;
}

void test_admission_gate() {
    std::cout << "Testing admission gate accounting..." << std::endl;

    AdmissionGate gate(2, 1);
    assert(gate.acquire(std::chrono::milliseconds(10)) == AdmissionGate::Admission::admitted);
    assert(gate.acquire(std::chrono::milliseconds(10)) == AdmissionGate::Admission::admitted);
    assert(gate.active() == 2);
    assert(gate.acquire(std::chrono::milliseconds(20)) == AdmissionGate::Admission::timed_out);
    assert(gate.waiting() == 0);

    gate.release();
    assert(gate.acquire(std::chrono::milliseconds(10)) == AdmissionGate::Admission::admitted);
    gate.release();
    gate.release();
    assert(gate.active() == 0);

    std::cout << "✓ Admission gate test passed" << std::endl;
}

void test_trace_breadcrumbs() {
    std::cout << "Testing trace breadcrumbs..." << std::endl;

    Fixture fx;
    TraceContext trace;
    trace.correlation_id = "corr_trace";
    trace.breadcrumbs = {"ingress"};

    fx.executor->execute(ExecutionRequest("req_t", Language::bash, "echo t", "student"), trace);
    assert(trace.breadcrumbs.size() == 4);
    assert(trace.breadcrumbs[1] == "policy");
    assert(trace.breadcrumbs[2] == "admission");
    assert(trace.breadcrumbs[3] == "sandbox");
    assert(fx.logs.str().find("corr_trace") != std::string::npos);

    std::cout << "✓ Trace breadcrumbs test passed" << std::endl;
}

void test_upstream_wait_counts_against_queue_wait() {
    std::cout << "Testing queue wait already spent before admission..." << std::endl;

    SandboxConfig config;
    config.max_queue_wait = std::chrono::milliseconds(100);
    Fixture fx(config);
    fx.runner->next_result.exit_code = 0;

    ExecutionRequest late("req_late", Language::bash, "echo late", "student");
    late.set_received_at(std::chrono::steady_clock::now() - std::chrono::milliseconds(250));
    auto refused = fx.executor->execute(late);
    assert(refused.status == ExecutionStatus::queue_timeout);
    assert(refused.error_code == ErrorCode::queue_timeout);
    assert(refused.elapsed >= std::chrono::milliseconds(250));
    assert(fx.runner->calls == 0);

    ExecutionRequest fresh("req_fresh", Language::bash, "echo fresh", "student");
    fresh.set_received_at(std::chrono::steady_clock::now() - std::chrono::milliseconds(20));
    auto admitted = fx.executor->execute(fresh);
    assert(admitted.status == ExecutionStatus::ok);
    assert(fx.runner->calls == 1);

    std::cout << "✓ Upstream queue wait test passed" << std::endl;
}

// Real interpreters under the real governor
void test_governed_execution() {
    std::cout << "Testing execution under the resource governor..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_sandbox_governed");
    observability->set_log_stream(&logs);
    auto validator = std::make_shared<PolicyValidator>(std::make_shared<PolicyRuleSet>(PolicyRuleSet::defaults()));
    auto governor = std::make_shared<ResourceGovernor>("/tmp", observability);

    SandboxConfig config;
    config.limits.wall_timeout = std::chrono::milliseconds(1000);
    config.limits.grace_period = std::chrono::milliseconds(200);
    SandboxExecutor executor(config, validator, governor, observability);

    auto sleeper = executor.execute(ExecutionRequest("req_sleep", Language::bash, "sleep 30", "student"));
    assert(sleeper.status == ExecutionStatus::timeout);
    assert(sleeper.killed_reason == KilledReason::timeout);
    assert(sleeper.error_message == "Execution exceeded the wall-clock limit of 1000 ms");
    assert(sleeper.elapsed >= std::chrono::milliseconds(1000));
    assert(sleeper.elapsed < std::chrono::milliseconds(3000));
    assert(ResultConverter::validate_result(sleeper));

    auto echoed = executor.execute(ExecutionRequest("req_echo", Language::bash, "echo $((6 * 7))", "student"));
    assert(echoed.status == ExecutionStatus::ok);
    assert(echoed.stdout_text == "42\n");

    if (ResourceGovernor::resolve_program("python3")) {
        auto python = executor.execute(ExecutionRequest("req_py", Language::python, "print(sum(range(10)))", "student"));
        assert(python.status == ExecutionStatus::ok);
        assert(python.stdout_text == "45\n");

        auto failing = executor.execute(ExecutionRequest("req_py_err", Language::python, "1/0", "student"));
        assert(failing.status == ExecutionStatus::runtime_error);
        assert(failing.stderr_text.find("ZeroDivisionError") != std::string::npos);
    } else {
        std::cout << "  python3 not installed, skipping" << std::endl;
    }

    if (ResourceGovernor::resolve_program("node")) {
        auto node = executor.execute(ExecutionRequest("req_js", Language::javascript, "console.log([1, 2, 3].length)", "student"));
        assert(node.status == ExecutionStatus::ok);
        assert(node.stdout_text == "3\n");
    } else {
        std::cout << "  node not installed, skipping" << std::endl;
    }

    std::cout << "✓ Governed execution test passed" << std::endl;
}

int main() {
    std::cout << "=== Sandbox Executor Tests ===" << std::endl;

    try {
        test_successful_execution();
        test_policy_rejection_skips_runner();
        test_runtime_error();
        test_killed_reasons();
        test_runner_failures_become_internal_error();
        test_build_invocation();
        test_queue_full_is_refused();
        test_queue_wait_bound();
        test_admission_gate();
        test_trace_breadcrumbs();
        test_upstream_wait_counts_against_queue_wait();
        test_governed_execution();

        std::cout << "\n=== All tests passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
