#include <iostream>
#include <string>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include <caf/exit_reason.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/scoped_actor.hpp>
#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/feature_flags.hpp"
#include "tutorgate/gateway/gateway.hpp"
#include "tutorgate/gateway/history_store.hpp"
#include "tutorgate/gateway/ingress_actor.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/ollama_generation_service.hpp"
#include "tutorgate/gateway/policy_validator.hpp"
#include "tutorgate/gateway/quota_store.hpp"
#include "tutorgate/gateway/rate_limiter.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/resource_governor.hpp"
#include "tutorgate/gateway/sandbox_executor.hpp"
#include "tutorgate/gateway/streaming_coordinator.hpp"
#include "runtime/task_pool.hpp"

class TutorGateConfig : public caf::actor_system_config {
public:
    TutorGateConfig() {
        opt_group{custom_options_, "tutorgate"}
            .add(gateway_config.sandbox_max_concurrency, "sandbox-concurrency", "Concurrent sandbox executions")
            .add(gateway_config.sandbox_max_queue_depth, "sandbox-queue-depth", "Executions allowed to wait for a slot")
            .add(gateway_config.sandbox_queue_wait_ms, "sandbox-queue-wait-ms", "Max wait for an execution slot (ms)")
            .add(gateway_config.sandbox_wall_timeout_ms, "sandbox-timeout-ms", "Wall-clock budget per execution (ms)")
            .add(gateway_config.sandbox_cpu_seconds, "sandbox-cpu-seconds", "CPU seconds per execution")
            .add(gateway_config.sandbox_memory_mb, "sandbox-memory-mb", "Memory ceiling per execution (MB)")
            .add(gateway_config.sandbox_max_output_bytes, "sandbox-max-output", "Captured bytes per output stream")
            .add(gateway_config.sandbox_grace_period_ms, "sandbox-grace-ms", "SIGTERM to SIGKILL grace period (ms)")
            .add(gateway_config.sandbox_max_processes, "sandbox-max-processes", "Process limit for the service user (0: unlimited)")
            .add(gateway_config.sandbox_temp_root, "sandbox-temp-root", "Parent of per-run scratch directories")
            .add(gateway_config.policy_file, "policy-file", "JSON policy overriding the built-in rules")
            .add(gateway_config.max_source_chars, "max-source-chars", "Maximum submitted source length")
            .add(gateway_config.redis_url, "redis-url", "Redis URL for shared quotas (empty: in-process)")
            .add(gateway_config.redis_timeout_ms, "redis-timeout-ms", "Redis connect/socket timeout (ms)")
            .add(gateway_config.quota_sweep_interval_ms, "quota-sweep-ms", "Expired counter sweep interval (ms)")
            .add(gateway_config.quota_probe_base_delay_ms, "quota-probe-base-ms", "First Redis re-probe delay (ms)")
            .add(gateway_config.quota_probe_max_delay_ms, "quota-probe-max-ms", "Max Redis re-probe delay (ms)")
            .add(gateway_config.max_concurrent_streams, "max-streams", "Concurrent answer streams")
            .add(gateway_config.stream_read_timeout_ms, "stream-read-timeout-ms", "Max wait for the next token (ms)")
            .add(gateway_config.stream_max_tokens, "stream-max-tokens", "Token ceiling per stream")
            .add(gateway_config.generation_url, "generation-url", "Ollama-compatible generation endpoint")
            .add(gateway_config.generation_model, "generation-model", "Model name sent to the generation service")
            .add(gateway_config.history_db, "history-db", "SQLite history database (empty: disabled)")
            .add(gateway_config.history_turns, "history-turns", "Conversation turns included in prompts")
            .add(gateway_config.request_pool_size, "request-pool-size", "Threads serving execute/ask requests")
            .add(gateway_config.metrics_endpoint, "metrics-endpoint", "Metrics endpoint (address:port)");
    }

    tutorgate::gateway::GatewayConfig gateway_config;
};

namespace {

using namespace tutorgate::gateway;

std::shared_ptr<PolicyRuleSet> load_policy(const GatewayConfig& config, Observability& observability) {
    auto defaults = PolicyRuleSet::defaults(config.max_source_chars, FeatureFlags::is_strict_allowlist_enabled());
    if (config.policy_file.empty()) {
        return std::make_shared<PolicyRuleSet>(std::move(defaults));
    }
    auto loaded = PolicyRuleSet::load_file(config.policy_file, defaults);
    if (!loaded) {
        observability.log_error("Failed to load policy file, using built-in rules", "", "", {
            {"policy_file", config.policy_file},
            {"error", caf::to_string(loaded.error())}
        });
        return std::make_shared<PolicyRuleSet>(std::move(defaults));
    }
    observability.log_info("Policy file loaded", "", "", {{"policy_file", config.policy_file}});
    return std::make_shared<PolicyRuleSet>(std::move(*loaded));
}

SandboxConfig sandbox_config(const GatewayConfig& config) {
    SandboxConfig sandbox;
    sandbox.max_concurrency = config.sandbox_max_concurrency;
    sandbox.max_queue_depth = config.sandbox_max_queue_depth;
    sandbox.max_queue_wait = std::chrono::milliseconds(config.sandbox_queue_wait_ms);
    sandbox.limits.cpu_seconds = config.sandbox_cpu_seconds;
    sandbox.limits.memory_bytes = config.sandbox_memory_mb * 1024 * 1024;
    sandbox.limits.wall_timeout = std::chrono::milliseconds(config.sandbox_wall_timeout_ms);
    sandbox.limits.grace_period = std::chrono::milliseconds(config.sandbox_grace_period_ms);
    sandbox.limits.max_output_bytes = static_cast<size_t>(config.sandbox_max_output_bytes);
    sandbox.limits.max_processes = config.sandbox_max_processes;
    return sandbox;
}

std::shared_ptr<HistoryStore> open_history(const GatewayConfig& config, Observability& observability) {
    if (config.history_db.empty()) {
        return nullptr;
    }
    auto store = SqliteHistoryStore::open(config.history_db);
    if (!store) {
        observability.log_error("History store unavailable, continuing without history", "", "", {
            {"history_db", config.history_db},
            {"error", caf::to_string(store.error())}
        });
        return nullptr;
    }
    return std::shared_ptr<HistoryStore>(std::move(*store));
}

} // namespace

void caf_main(caf::actor_system& system, const TutorGateConfig& config) {
    const GatewayConfig& gw = config.gateway_config;
    auto observability = std::make_shared<Observability>("tutorgate");

    // Parse metrics_endpoint (format: "address:port"); health is served on the next port
    std::string address = "0.0.0.0";
    uint16_t metrics_port = 9090;
    size_t colon_pos = gw.metrics_endpoint.find(':');
    if (colon_pos != std::string::npos) {
        address = gw.metrics_endpoint.substr(0, colon_pos);
        try {
            metrics_port = static_cast<uint16_t>(std::stoi(gw.metrics_endpoint.substr(colon_pos + 1)));
        } catch (const std::exception& e) {
            observability->log_warn("Invalid metrics endpoint port, using 9090", "", "", {
                {"metrics_endpoint", gw.metrics_endpoint},
                {"error", e.what()}
            });
        }
    }
    observability->start_health_endpoint(address, static_cast<uint16_t>(metrics_port + 1));
    observability->start_metrics_endpoint(address, metrics_port);

    auto tracer = std::make_shared<RequestTracer>(observability);
    auto quota_store = make_quota_store(gw, observability);
    auto limiter = std::make_shared<RateLimiter>(quota_store, observability);

    auto validator = std::make_shared<PolicyValidator>(load_policy(gw, *observability));
    auto governor = std::make_shared<ResourceGovernor>(
        gw.sandbox_temp_root, observability, FeatureFlags::is_network_isolation_required());
    auto executor = std::make_shared<SandboxExecutor>(sandbox_config(gw), validator, governor, observability);

    OllamaConfig ollama;
    ollama.base_url = gw.generation_url;
    ollama.model = gw.generation_model;
    auto generation = std::make_shared<OllamaGenerationService>(ollama, observability);

    StreamingConfig streaming;
    streaming.max_concurrent_streams = gw.max_concurrent_streams;
    streaming.read_timeout = std::chrono::milliseconds(gw.stream_read_timeout_ms);
    streaming.max_tokens = gw.stream_max_tokens;
    auto coordinator = std::make_shared<StreamingCoordinator>(streaming, generation, tracer, observability);

    auto history = open_history(gw, *observability);
    auto gateway = std::make_shared<Gateway>(tracer, limiter, executor, coordinator, history,
                                             observability, gw.history_turns);

    auto request_pool = std::make_shared<TaskPool>(gw.request_pool_size, [observability](const std::string& error) {
        observability->log_error("Request task raised", "", "", {{"error", error}});
    });
    auto writer = std::make_shared<ResponseWriter>(std::cout);
    auto ingress = system.spawn<ingress_actor>(gateway, request_pool, writer, observability);

    observability->set_health_status("gateway", 1);
    observability->log_info("TutorGate started", "", "", {
        {"sandbox_concurrency", std::to_string(gw.sandbox_max_concurrency)},
        {"max_streams", std::to_string(gw.max_concurrent_streams)},
        {"quota_backend", quota_store->backend_name()},
        {"history", history ? gw.history_db : "disabled"}
    });

    // One request per stdin line; each line is dispatched before the next is read
    caf::scoped_actor self{system};
    std::string line;
    while (std::getline(std::cin, line)) {
        self->request(ingress, caf::infinite, line).receive(
            [](const std::string&) {},
            [&observability](caf::error& err) {
                observability->log_error("Ingress request failed", "", "", {{"error", caf::to_string(err)}});
            });
    }

    observability->log_info("Input closed, draining");
    request_pool->shutdown();
    if (!coordinator->wait_idle(std::chrono::milliseconds(gw.stream_read_timeout_ms))) {
        observability->log_warn("Cancelling streams still open at shutdown", "", "", {
            {"active_streams", std::to_string(coordinator->active_sessions())}
        });
    }
    coordinator->shutdown();
    self->send_exit(ingress, caf::exit_reason::user_shutdown);

    observability->set_health_status("gateway", 0);
    observability->stop_health_endpoint();
    observability->stop_metrics_endpoint();
    observability->log_info("TutorGate stopped");
}

int main(int argc, char** argv) {
    caf::core::init_global_meta_objects();
    TutorGateConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }

    // Run the actor system
    caf::actor_system system(config);
    caf_main(system, config);

    return 0;
}
