#pragma once

#include "tutorgate/gateway/core.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tutorgate {
namespace gateway {

struct ResourceLimits {
    int64_t cpu_seconds = 5;
    int64_t memory_bytes = 256LL * 1024 * 1024;  // 0 disables the address-space cap
    bool limit_address_space = true;             // false when the runtime caps its own heap
    std::chrono::milliseconds wall_timeout{5000};
    std::chrono::milliseconds grace_period{500};  // SIGTERM -> SIGKILL
    size_t max_output_bytes = 64 * 1024;          // per stream
    int64_t max_file_bytes = 1024 * 1024;
    int64_t max_open_files = 64;
    // RLIMIT_NPROC counts every process of the service user, not only this run;
    // 0 leaves it untouched
    int64_t max_processes = 256;
};

// One program invocation inside a fresh scratch directory
struct BoundedCommand {
    std::string program;                                  // resolved against PATH below
    std::vector<std::string> args;
    std::vector<std::pair<std::string, std::string>> files;  // written into the scratch dir first
    std::string stdin_data;
    std::vector<std::string> memory_error_markers;        // stderr text that means the heap cap was hit
};

struct BoundedResult {
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    bool timed_out = false;
    KilledReason killed_reason = KilledReason::none;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds cpu_time{0};
    int64_t peak_rss_bytes = 0;
    bool network_isolated = false;
};

// Seam between the executor and the operating system
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual caf::expected<BoundedResult> run_bounded(const BoundedCommand& command,
                                                     const ResourceLimits& limits) = 0;
};

/**
 * Resource Governor
 *
 * Runs one untrusted program under hard limits:
 * - own session and process group, so the whole tree is signalled together
 * - RLIMIT_CPU / AS / FSIZE / NOFILE / NPROC, core dumps off
 * - empty environment apart from PATH, HOME and LANG
 * - private network namespace when the kernel allows it
 * - wall-clock watchdog: SIGTERM at the deadline, SIGKILL after the grace period
 * - stdout/stderr capped per stream, excess discarded
 *
 * The scratch directory is removed on every exit path.
 */
class ResourceGovernor : public ProcessRunner {
public:
    ResourceGovernor(std::string temp_root,
                     std::shared_ptr<Observability> observability,
                     bool require_network_isolation = false);

    caf::expected<BoundedResult> run_bounded(const BoundedCommand& command,
                                             const ResourceLimits& limits) override;

    // Absolute path of an executable found on the sandbox PATH
    static caf::expected<std::string> resolve_program(const std::string& program);

    static constexpr const char* kSandboxPath = "/usr/local/bin:/usr/bin:/bin";

private:
    std::string temp_root_;
    std::shared_ptr<Observability> observability_;
    bool require_network_isolation_;
};

} // namespace gateway
} // namespace tutorgate
