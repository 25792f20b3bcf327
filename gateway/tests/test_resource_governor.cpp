#include <iostream>
#include <cassert>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/resource_governor.hpp"
#include "tutorgate/gateway/sandbox_executor.hpp"

using namespace tutorgate::gateway;

static std::shared_ptr<Observability> quiet_observability() {
    static std::ostringstream sink;
    auto observability = std::make_shared<Observability>("test_governor");
    observability->set_log_stream(&sink);
    return observability;
}

static BoundedCommand bash_script(const std::string& script) {
    BoundedCommand command;
    command.program = "bash";
    command.args = {"--noprofile", "--norc", "main.sh"};
    command.files = {{"main.sh", script}};
    return command;
}

static ResourceLimits test_limits() {
    ResourceLimits limits;
    limits.cpu_seconds = 5;
    limits.wall_timeout = std::chrono::milliseconds(5000);
    limits.grace_period = std::chrono::milliseconds(200);
    return limits;
}

void test_resolve_program() {
    std::cout << "Testing program resolution on the sandbox PATH..." << std::endl;

    auto bash = ResourceGovernor::resolve_program("bash");
    assert(bash);
    assert(bash->find("/bash") != std::string::npos);

    assert(!ResourceGovernor::resolve_program("tutorgate-no-such-program"));
    assert(!ResourceGovernor::resolve_program("/etc/passwd"));

    std::cout << "✓ Program resolution test passed" << std::endl;
}

void test_successful_run() {
    std::cout << "Testing successful bounded run..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    auto result = governor.run_bounded(bash_script("echo hello\necho oops >&2\n"), test_limits());

    assert(result);
    assert(result->exit_code == 0);
    assert(result->stdout_text == "hello\n");
    assert(result->stderr_text == "oops\n");
    assert(!result->timed_out);
    assert(result->killed_reason == KilledReason::none);
    assert(!result->stdout_truncated);

    std::cout << "✓ Successful run test passed" << std::endl;
}

void test_exit_code_and_stdin() {
    std::cout << "Testing exit code and stdin delivery..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    auto command = bash_script("read line\necho \"got $line\"\nexit 3\n");
    command.stdin_data = "input-line\n";

    auto result = governor.run_bounded(command, test_limits());
    assert(result);
    assert(result->exit_code == 3);
    assert(result->stdout_text == "got input-line\n");
    assert(result->killed_reason == KilledReason::none);

    std::cout << "✓ Exit code and stdin test passed" << std::endl;
}

void test_environment_is_scrubbed() {
    std::cout << "Testing child environment is scrubbed..." << std::endl;

    setenv("TUTORGATE_TEST_SECRET", "do-not-leak", 1);
    ResourceGovernor governor("/tmp", quiet_observability());
    auto result = governor.run_bounded(
        bash_script("echo \"${TUTORGATE_TEST_SECRET:-unset}\"\necho \"$PATH\"\n"), test_limits());
    unsetenv("TUTORGATE_TEST_SECRET");

    assert(result);
    assert(result->stdout_text == std::string("unset\n") + ResourceGovernor::kSandboxPath + "\n");

    std::cout << "✓ Environment scrub test passed" << std::endl;
}

void test_scratch_directory_removed() {
    std::cout << "Testing scratch directory lifecycle..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    auto result = governor.run_bounded(bash_script("pwd\necho data > notes.txt\n"), test_limits());

    assert(result);
    assert(result->exit_code == 0);
    std::string workdir = result->stdout_text.substr(0, result->stdout_text.find('\n'));
    assert(workdir.find("/tmp/tutorgate-") == 0);
    assert(!std::filesystem::exists(workdir));

    // Missing temp root fails before anything runs
    ResourceGovernor broken("/nonexistent/tutorgate-root", quiet_observability());
    assert(!broken.run_bounded(bash_script("echo hi\n"), test_limits()));

    std::cout << "✓ Scratch directory test passed" << std::endl;
}

void test_invalid_command() {
    std::cout << "Testing invalid commands are refused..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());

    BoundedCommand missing;
    missing.program = "tutorgate-no-such-program";
    assert(!governor.run_bounded(missing, test_limits()));

    BoundedCommand escaping = bash_script("echo hi\n");
    escaping.files = {{"../escape.sh", "echo hi\n"}};
    assert(!governor.run_bounded(escaping, test_limits()));

    std::cout << "✓ Invalid command test passed" << std::endl;
}

void test_output_cap() {
    std::cout << "Testing output cap..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.max_output_bytes = 100;

    auto result = governor.run_bounded(bash_script("printf '%*s' 5000 ''\necho done >&2\n"), limits);
    assert(result);
    assert(result->exit_code == 0);
    assert(result->stdout_text.size() == 100);
    assert(result->stdout_truncated);
    assert(result->stderr_text == "done\n");
    assert(!result->stderr_truncated);

    std::cout << "✓ Output cap test passed" << std::endl;
}

void test_wall_clock_timeout() {
    std::cout << "Testing wall-clock timeout..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.wall_timeout = std::chrono::milliseconds(300);

    auto result = governor.run_bounded(bash_script("echo started\nsleep 10\necho never\n"), limits);
    assert(result);
    assert(result->timed_out);
    assert(result->killed_reason == KilledReason::timeout);
    assert(result->stdout_text == "started\n");
    assert(result->elapsed >= std::chrono::milliseconds(300));
    assert(result->elapsed < std::chrono::milliseconds(3000));

    std::cout << "✓ Wall-clock timeout test passed" << std::endl;
}

void test_sigterm_ignored_escalates_to_sigkill() {
    std::cout << "Testing SIGTERM escalation to SIGKILL..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.cpu_seconds = 0;
    limits.wall_timeout = std::chrono::milliseconds(200);
    limits.grace_period = std::chrono::milliseconds(300);

    auto result = governor.run_bounded(bash_script("trap '' TERM\nwhile true; do :; done\n"), limits);
    assert(result);
    assert(result->timed_out);
    assert(result->killed_reason == KilledReason::timeout);
    assert(result->term_signal == SIGKILL);
    assert(result->elapsed >= std::chrono::milliseconds(500));
    assert(result->elapsed < std::chrono::milliseconds(3000));

    std::cout << "✓ SIGKILL escalation test passed" << std::endl;
}

void test_cpu_limit() {
    std::cout << "Testing CPU limit..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.cpu_seconds = 1;
    limits.wall_timeout = std::chrono::milliseconds(10000);

    auto result = governor.run_bounded(bash_script("while :; do :; done\n"), limits);
    assert(result);
    assert(!result->timed_out);
    assert(result->killed_reason == KilledReason::cpu_limit);
    assert(result->exit_code != 0);

    std::cout << "✓ CPU limit test passed" << std::endl;
}

void test_file_size_limit() {
    std::cout << "Testing file size limit..." << std::endl;

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.max_file_bytes = 1024;

    auto result = governor.run_bounded(bash_script("exec head -c 65536 /dev/zero > big.bin\n"), limits);
    assert(result);
    assert(result->term_signal == SIGXFSZ);
    assert(result->killed_reason == KilledReason::file_size_limit);

    std::cout << "✓ File size limit test passed" << std::endl;
}

// Gone, or a zombie waiting for init to reap it
static bool process_gone(const std::string& pid) {
    std::ifstream stat("/proc/" + pid + "/stat");
    if (!stat.is_open()) {
        return true;
    }
    std::string line;
    std::getline(stat, line);
    size_t close_paren = line.rfind(')');
    return close_paren != std::string::npos && close_paren + 2 < line.size() && line[close_paren + 2] == 'Z';
}

void test_fork_loop_is_contained() {
    std::cout << "Testing containment of forked processes..." << std::endl;

    assert(ResourceLimits().max_processes > 0);

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.wall_timeout = std::chrono::milliseconds(500);

    auto result = governor.run_bounded(
        bash_script("for i in $(seq 1 50); do sleep 30 & echo $!; done\nwait\n"), limits);
    assert(result);
    assert(result->timed_out);
    assert(result->elapsed < std::chrono::milliseconds(3000));

    std::vector<std::string> pids;
    std::istringstream out(result->stdout_text);
    std::string pid;
    while (std::getline(out, pid)) {
        if (!pid.empty()) pids.push_back(pid);
    }
    assert(!pids.empty());

    // Background children die with the process group
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    bool all_gone = false;
    while (!all_gone && std::chrono::steady_clock::now() < deadline) {
        all_gone = true;
        for (const auto& child : pids) {
            if (!process_gone(child)) {
                all_gone = false;
                break;
            }
        }
        if (!all_gone) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    assert(all_gone);

    // RLIMIT_NPROC does not apply to root
    if (geteuid() == 0 || !ResourceGovernor::resolve_program("python3")) {
        std::cout << "  running as root or without python3, skipping fork refusal" << std::endl;
        std::cout << "✓ Fork containment test passed" << std::endl;
        return;
    }

    limits = test_limits();
    limits.max_processes = 1;
    ExecutionRequest request("req_fork", Language::python,
                             "import os\n"
                             "try:\n"
                             "    pid = os.fork()\n"
                             "except OSError:\n"
                             "    print('fork refused')\n"
                             "else:\n"
                             "    if pid == 0:\n"
                             "        os._exit(0)\n"
                             "    os.waitpid(pid, 0)\n"
                             "    print('fork allowed')\n",
                             "student");
    ResourceLimits python_limits = SandboxExecutor::limits_for(Language::python, limits);
    auto refused = governor.run_bounded(SandboxExecutor::build_invocation(request, python_limits), python_limits);
    assert(refused);
    assert(refused->stdout_text == "fork refused\n");

    std::cout << "✓ Fork containment test passed" << std::endl;
}

void test_python_memory_limit() {
    std::cout << "Testing Python memory limit..." << std::endl;

    if (!ResourceGovernor::resolve_program("python3")) {
        std::cout << "  python3 not installed, skipping" << std::endl;
        return;
    }

    ResourceGovernor governor("/tmp", quiet_observability());
    ResourceLimits limits = test_limits();
    limits.memory_bytes = 256LL * 1024 * 1024;

    ExecutionRequest ok_request("req_py_1", Language::python, "print(sum(range(10)))\n", "student");
    auto ok = governor.run_bounded(SandboxExecutor::build_invocation(ok_request, limits), limits);
    assert(ok);
    assert(ok->exit_code == 0);
    assert(ok->stdout_text == "45\n");

    ExecutionRequest hog_request("req_py_2", Language::python, "x = bytearray(2 * 1024 * 1024 * 1024)\n", "student");
    auto hog = governor.run_bounded(SandboxExecutor::build_invocation(hog_request, limits), limits);
    assert(hog);
    assert(hog->exit_code != 0);
    assert(hog->stderr_text.find("MemoryError") != std::string::npos);
    assert(hog->killed_reason == KilledReason::memory_limit);

    std::cout << "✓ Python memory limit test passed" << std::endl;
}

int main() {
    std::cout << "=== Resource Governor Tests ===" << std::endl;

    try {
        test_resolve_program();
        test_successful_run();
        test_exit_code_and_stdin();
        test_environment_is_scrubbed();
        test_scratch_directory_removed();
        test_invalid_command();
        test_output_cap();
        test_wall_clock_timeout();
        test_sigterm_ignored_escalates_to_sigkill();
        test_cpu_limit();
        test_file_size_limit();
        test_fork_loop_is_contained();
        test_python_memory_limit();

        std::cout << "\n=== All tests passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
