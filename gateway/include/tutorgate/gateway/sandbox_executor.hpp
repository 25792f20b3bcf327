#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/policy_validator.hpp"
#include "tutorgate/gateway/resource_governor.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace tutorgate {
namespace gateway {

struct SandboxConfig {
    int max_concurrency = 4;
    int max_queue_depth = 64;
    std::chrono::milliseconds max_queue_wait{2000};
    ResourceLimits limits;
};

// Counting gate that bounds concurrent executions and the queue in front of them
class AdmissionGate {
public:
    enum class Admission {
        admitted,
        queue_full,
        timed_out
    };

    AdmissionGate(int max_concurrency, int max_queue_depth);

    Admission acquire(std::chrono::milliseconds max_wait);
    void release();

    int active() const;
    int waiting() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int max_concurrency_;
    int max_queue_depth_;
    int active_ = 0;
    int waiting_ = 0;
};

/**
 * Sandbox Executor
 *
 * Runs one code submission end to end: policy screening, admission, the
 * bounded process run, and translation of the outcome into an
 * ExecutionResult. Every request gets exactly one result; failures inside
 * the governor become `internal_error` and never reach the caller as
 * exceptions.
 */
class SandboxExecutor {
public:
    SandboxExecutor(SandboxConfig config,
                    std::shared_ptr<const PolicyValidator> validator,
                    std::shared_ptr<ProcessRunner> runner,
                    std::shared_ptr<Observability> observability);

    ExecutionResult execute(const ExecutionRequest& request);
    ExecutionResult execute(const ExecutionRequest& request, TraceContext& trace);

    // Interpreter invocation for one request
    static BoundedCommand build_invocation(const ExecutionRequest& request, const ResourceLimits& limits);
    static ResourceLimits limits_for(Language language, const ResourceLimits& base);

    int active_executions() const { return gate_.active(); }
    int queued_executions() const { return gate_.waiting(); }

private:
    SandboxConfig config_;
    std::shared_ptr<const PolicyValidator> validator_;
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<Observability> observability_;
    AdmissionGate gate_;

    ExecutionResult translate(const ExecutionRequest& request, const BoundedResult& bounded) const;
};

} // namespace gateway
} // namespace tutorgate
