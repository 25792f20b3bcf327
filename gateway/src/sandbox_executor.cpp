#include "tutorgate/gateway/sandbox_executor.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include <caf/error.hpp>
#include <algorithm>
#include <exception>

namespace tutorgate {
namespace gateway {

namespace {

class SlotGuard {
public:
    explicit SlotGuard(AdmissionGate& gate) : gate_(gate) {}
    ~SlotGuard() { gate_.release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    AdmissionGate& gate_;
};

} // namespace

AdmissionGate::AdmissionGate(int max_concurrency, int max_queue_depth)
    : max_concurrency_(max_concurrency > 0 ? max_concurrency : 1),
      max_queue_depth_(max_queue_depth >= 0 ? max_queue_depth : 0) {}

AdmissionGate::Admission AdmissionGate::acquire(std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_ < max_concurrency_ && waiting_ == 0) {
        ++active_;
        return Admission::admitted;
    }
    if (waiting_ >= max_queue_depth_) {
        return Admission::queue_full;
    }

    ++waiting_;
    bool free_slot = cv_.wait_for(lock, max_wait, [this]() { return active_ < max_concurrency_; });
    --waiting_;
    if (!free_slot) {
        return Admission::timed_out;
    }
    ++active_;
    return Admission::admitted;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    cv_.notify_one();
}

int AdmissionGate::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

int AdmissionGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
}

SandboxExecutor::SandboxExecutor(SandboxConfig config,
                                 std::shared_ptr<const PolicyValidator> validator,
                                 std::shared_ptr<ProcessRunner> runner,
                                 std::shared_ptr<Observability> observability)
    : config_(std::move(config)),
      validator_(std::move(validator)),
      runner_(std::move(runner)),
      observability_(std::move(observability)),
      gate_(config_.max_concurrency, config_.max_queue_depth) {}

ResourceLimits SandboxExecutor::limits_for(Language language, const ResourceLimits& base) {
    ResourceLimits limits = base;
    if (language == Language::javascript) {
        // V8 reserves far more address space than it uses; its heap is capped by flag instead
        limits.limit_address_space = false;
    }
    return limits;
}

BoundedCommand SandboxExecutor::build_invocation(const ExecutionRequest& request, const ResourceLimits& limits) {
    BoundedCommand command;
    switch (request.language()) {
        case Language::python:
            command.program = "python3";
            command.args = {"-I", "-B", "-u", "main.py"};
            command.files = {{"main.py", request.source()}};
            command.memory_error_markers = {"MemoryError"};
            break;
        case Language::javascript: {
            int64_t heap_mb = std::max<int64_t>(16, limits.memory_bytes / (1024 * 1024));
            command.program = "node";
            command.args = {"--max-old-space-size=" + std::to_string(heap_mb),
                            "--disallow-code-generation-from-strings",
                            "main.js"};
            command.files = {{"main.js", request.source()}};
            command.memory_error_markers = {"heap out of memory", "Allocation failed"};
            break;
        }
        case Language::bash:
            command.program = "bash";
            command.args = {"--noprofile", "--norc", "main.sh"};
            command.files = {{"main.sh", request.source()}};
            command.memory_error_markers = {"Cannot allocate memory", "xmalloc"};
            break;
    }
    return command;
}

ExecutionResult SandboxExecutor::execute(const ExecutionRequest& request) {
    TraceContext trace;
    trace.correlation_id = request.request_id();
    trace.client_id = request.caller_id();
    trace.endpoint = "execute";
    return execute(request, trace);
}

ExecutionResult SandboxExecutor::execute(const ExecutionRequest& request, TraceContext& trace) {
    const std::string language = ResultConverter::language_to_string(request.language());

    RequestTracer::breadcrumb(trace, "policy");
    PolicyVerdict verdict = validator_->validate(request.language(), request.source());
    if (!verdict.allowed) {
        std::string symbols;
        for (const auto& violation : verdict.violations) {
            symbols += (symbols.empty() ? "" : ",") + violation.category + ":" + violation.symbol;
        }
        observability_->log_warn_with_trace("Submission rejected by policy", trace, {
            {"request_id", request.request_id()},
            {"language", language},
            {"violations", symbols}
        });
        observability_->record_execution(language, "policy_rejected", 0.0);
        return ExecutionResult::policy_rejected(request.request_id(), std::move(verdict.violations));
    }

    RequestTracer::breadcrumb(trace, "admission");
    // Time already spent upstream counts against the queue wait
    auto queued_at = std::chrono::steady_clock::now();
    auto upstream = std::chrono::duration_cast<std::chrono::milliseconds>(
        queued_at - std::min(request.received_at(), queued_at));
    AdmissionGate::Admission admission = AdmissionGate::Admission::timed_out;
    if (upstream < config_.max_queue_wait) {
        observability_->set_execution_queue_depth(gate_.waiting() + 1);
        admission = gate_.acquire(config_.max_queue_wait - upstream);
        observability_->set_execution_queue_depth(gate_.waiting());
    }
    auto waited = upstream + std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - queued_at);

    if (admission != AdmissionGate::Admission::admitted) {
        observability_->log_warn_with_trace("Execution refused at admission", trace, {
            {"request_id", request.request_id()},
            {"reason", admission == AdmissionGate::Admission::queue_full ? "queue_full" : "wait_exceeded"},
            {"waited_ms", std::to_string(waited.count())}
        });
        observability_->record_execution(language, "queue_timeout", 0.0);
        return ExecutionResult::queue_timeout(request.request_id(), waited);
    }

    SlotGuard slot(gate_);
    observability_->set_active_executions(gate_.active());

    RequestTracer::breadcrumb(trace, "sandbox");
    ResourceLimits limits = limits_for(request.language(), config_.limits);
    BoundedCommand command = build_invocation(request, limits);

    ExecutionResult result;
    try {
        auto bounded = runner_->run_bounded(command, limits);
        if (bounded) {
            result = translate(request, *bounded);
        } else {
            observability_->log_error_with_trace("Sandbox run failed", trace, {
                {"request_id", request.request_id()},
                {"language", language},
                {"error", caf::to_string(bounded.error())}
            });
            result = ExecutionResult::internal_error(request.request_id());
        }
    } catch (const std::exception& e) {
        observability_->log_error_with_trace("Sandbox run raised", trace, {
            {"request_id", request.request_id()},
            {"language", language},
            {"error", e.what()}
        });
        result = ExecutionResult::internal_error(request.request_id());
    }

    const std::string status = ResultConverter::status_to_string(result.status);
    observability_->record_execution(language, status, result.elapsed.count() / 1000.0);
    observability_->log_info_with_trace("Execution finished", trace, {
        {"request_id", request.request_id()},
        {"language", language},
        {"status", status},
        {"exit_code", std::to_string(result.exit_code)},
        {"elapsed_ms", std::to_string(result.elapsed.count())},
        {"queue_wait_ms", std::to_string(waited.count())}
    });
    return result;
}

ExecutionResult SandboxExecutor::translate(const ExecutionRequest& request, const BoundedResult& bounded) const {
    ExecutionResult result;
    result.request_id = request.request_id();
    result.stdout_text = bounded.stdout_text;
    result.stderr_text = bounded.stderr_text;
    result.stdout_truncated = bounded.stdout_truncated;
    result.stderr_truncated = bounded.stderr_truncated;
    result.exit_code = bounded.exit_code;
    result.killed_reason = bounded.killed_reason;
    result.elapsed = bounded.elapsed;

    switch (bounded.killed_reason) {
        case KilledReason::timeout:
            result.status = ExecutionStatus::timeout;
            result.error_code = ErrorCode::cancelled_by_timeout;
            result.error_message = "Execution exceeded the wall-clock limit of " +
                                   std::to_string(config_.limits.wall_timeout.count()) + " ms";
            return result;
        case KilledReason::cpu_limit:
            result.status = ExecutionStatus::resource_exceeded;
            result.error_code = ErrorCode::resource_exceeded;
            result.error_message = "CPU time limit exceeded";
            return result;
        case KilledReason::memory_limit:
            result.status = ExecutionStatus::resource_exceeded;
            result.error_code = ErrorCode::resource_exceeded;
            result.error_message = "Memory limit exceeded";
            return result;
        case KilledReason::file_size_limit:
            result.status = ExecutionStatus::resource_exceeded;
            result.error_code = ErrorCode::resource_exceeded;
            result.error_message = "File size limit exceeded";
            return result;
        case KilledReason::none:
            break;
    }

    if (bounded.exit_code != 0) {
        result.status = ExecutionStatus::runtime_error;
        result.error_code = ErrorCode::execution_failed;
        result.error_message = "Program exited with code " + std::to_string(bounded.exit_code);
        return result;
    }

    result.status = ExecutionStatus::ok;
    result.error_code = ErrorCode::none;
    return result;
}

} // namespace gateway
} // namespace tutorgate
