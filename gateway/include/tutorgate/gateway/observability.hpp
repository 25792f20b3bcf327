#pragma once

#include "tutorgate/gateway/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <functional>

namespace tutorgate {
namespace gateway {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

class Observability {
public:
    explicit Observability(const std::string& component_id);
    ~Observability();

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Log sink (stderr by default, stdout carries the ingress protocol)
    void set_log_stream(std::ostream* out);
    void set_min_level(LogLevel level);
    static LogLevel parse_level(const std::string& level);

    // Logging
    void log_info(const std::string& message,
                  const std::string& correlation_id = "",
                  const std::string& client_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& correlation_id = "",
                  const std::string& client_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& correlation_id = "",
                   const std::string& client_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const std::string& correlation_id = "",
                   const std::string& client_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    // Helpers that pull correlation fields from a TraceContext
    void log_info_with_trace(const std::string& message,
                             const TraceContext& trace,
                             const std::unordered_map<std::string, std::string>& context = {});

    void log_warn_with_trace(const std::string& message,
                             const TraceContext& trace,
                             const std::unordered_map<std::string, std::string>& context = {});

    void log_error_with_trace(const std::string& message,
                              const TraceContext& trace,
                              const std::unordered_map<std::string, std::string>& context = {});

    // Metrics (gated behind TUTORGATE_METRICS_ENABLED)
    bool metrics_enabled() const { return metrics_enabled_; }

    void record_quota_decision(const std::string& endpoint, bool allowed, bool degraded);
    void set_quota_backend_degraded(bool degraded);
    void record_execution(const std::string& language,
                          const std::string& status,
                          double duration_seconds);
    void set_execution_queue_depth(int64_t depth);
    void set_active_executions(int64_t count);
    void record_stream_outcome(const std::string& state, int64_t tokens);
    void set_active_streams(int64_t count);
    void set_health_status(const std::string& check, int64_t status); // 1 = healthy, 0 = unhealthy

    std::string get_health_response();  // body served at /_health
    std::string get_metrics_response(); // Prometheus text format
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // HTTP endpoints
    void start_health_endpoint(const std::string& address, uint16_t port);
    void stop_health_endpoint();
    void start_metrics_endpoint(const std::string& address, uint16_t port);
    void stop_metrics_endpoint();

private:
    std::string component_id_;
    bool metrics_enabled_ = false;
    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex log_mutex_;
    std::ostream* log_stream_;
    std::atomic<int> min_level_{static_cast<int>(LogLevel::info)};

    prometheus::Family<prometheus::Counter>* quota_decisions_total_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* quota_backend_degraded_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* executions_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* execution_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* execution_queue_depth_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* active_executions_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* streams_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* stream_tokens_total_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* active_streams_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* health_status_family_ = nullptr;

    // Health endpoint
    std::thread health_server_thread_;
    std::atomic<bool> health_server_running_{false};
    int health_server_socket_{-1};

    // Metrics endpoint
    std::thread metrics_server_thread_;
    std::atomic<bool> metrics_server_running_{false};
    int metrics_server_socket_{-1};

    void initialize_metrics();
    void write_log(LogLevel level, const std::string& line);
    int open_listen_socket(const std::string& address, uint16_t port, const std::string& endpoint_name);
    void http_server_loop(int socket_fd,
                          std::atomic<bool>& running,
                          const std::string& path,
                          const std::string& content_type,
                          const std::function<std::string()>& render);
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& correlation_id,
                                const std::string& client_id,
                                const std::unordered_map<std::string, std::string>& context);
};

} // namespace gateway
} // namespace tutorgate
