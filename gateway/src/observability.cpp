#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/feature_flags.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <sstream>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>

namespace tutorgate {
namespace gateway {

using json = nlohmann::json;

// PII/Secret fields to filter
static const std::vector<std::string> PII_FIELDS = {
    "password", "api_key", "secret", "access_token",
    "refresh_token", "authorization", "credit_card", "ssn",
    "email", "phone", "ip_address"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_pii_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& pii_field : PII_FIELDS) {
        if (lower_field == pii_field || lower_field.find(pii_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter PII from JSON object
static void filter_pii_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_pii_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_pii_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_pii_recursive(item);
            }
        }
    }
}

// Generate ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto duration = now.time_since_epoch();
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(duration) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warn: return "WARN";
        case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

Observability::Observability(const std::string& component_id)
    : component_id_(component_id),
      metrics_enabled_(FeatureFlags::is_metrics_enabled()),
      log_stream_(&std::cerr) {
    min_level_ = static_cast<int>(parse_level(FeatureFlags::log_level()));
    initialize_metrics();
}

Observability::~Observability() {
    stop_health_endpoint();
    stop_metrics_endpoint();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    quota_decisions_total_family_ = &prometheus::BuildCounter()
        .Name("tutorgate_quota_decisions_total")
        .Help("Quota decisions by endpoint class and outcome")
        .Register(*registry_);

    quota_backend_degraded_family_ = &prometheus::BuildGauge()
        .Name("tutorgate_quota_backend_degraded")
        .Help("1 while quota checks are answered by the local fallback")
        .Register(*registry_);

    executions_total_family_ = &prometheus::BuildCounter()
        .Name("tutorgate_executions_total")
        .Help("Total number of sandboxed executions by language and status")
        .Register(*registry_);

    execution_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("tutorgate_execution_duration_seconds")
        .Help("Sandboxed execution duration in seconds")
        .Register(*registry_);

    execution_queue_depth_family_ = &prometheus::BuildGauge()
        .Name("tutorgate_execution_queue_depth")
        .Help("Requests waiting for an execution slot")
        .Register(*registry_);

    active_executions_family_ = &prometheus::BuildGauge()
        .Name("tutorgate_active_executions")
        .Help("Executions currently holding a slot")
        .Register(*registry_);

    streams_total_family_ = &prometheus::BuildCounter()
        .Name("tutorgate_streams_total")
        .Help("Streaming sessions by terminal state")
        .Register(*registry_);

    stream_tokens_total_family_ = &prometheus::BuildCounter()
        .Name("tutorgate_stream_tokens_total")
        .Help("Tokens delivered to clients")
        .Register(*registry_);

    active_streams_family_ = &prometheus::BuildGauge()
        .Name("tutorgate_active_streams")
        .Help("Streaming sessions currently open")
        .Register(*registry_);

    health_status_family_ = &prometheus::BuildGauge()
        .Name("tutorgate_health_status")
        .Help("Health status (1 = healthy, 0 = unhealthy)")
        .Register(*registry_);
}

void Observability::record_quota_decision(const std::string& endpoint, bool allowed, bool degraded) {
    if (!metrics_enabled_) {
        return;
    }
    quota_decisions_total_family_->Add({
        {"endpoint", endpoint},
        {"decision", allowed ? "allowed" : "rejected"},
        {"backend", degraded ? "local" : "primary"}
    }).Increment();
}

void Observability::set_quota_backend_degraded(bool degraded) {
    if (!metrics_enabled_) {
        return;
    }
    quota_backend_degraded_family_->Add({}).Set(degraded ? 1.0 : 0.0);
}

void Observability::record_execution(const std::string& language,
                                     const std::string& status,
                                     double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }

    executions_total_family_->Add({
        {"language", language},
        {"status", status}
    }).Increment();

    execution_duration_seconds_family_->Add(
        {{"language", language}},
        prometheus::Histogram::BucketBoundaries{0.01, 0.05, 0.1, 0.5, 1.0, 2.0, 5.0, 10.0}
    ).Observe(duration_seconds);
}

void Observability::set_execution_queue_depth(int64_t depth) {
    if (!metrics_enabled_) {
        return;
    }
    execution_queue_depth_family_->Add({}).Set(static_cast<double>(depth));
}

void Observability::set_active_executions(int64_t count) {
    if (!metrics_enabled_) {
        return;
    }
    active_executions_family_->Add({}).Set(static_cast<double>(count));
}

void Observability::record_stream_outcome(const std::string& state, int64_t tokens) {
    if (!metrics_enabled_) {
        return;
    }
    streams_total_family_->Add({{"state", state}}).Increment();
    stream_tokens_total_family_->Add({}).Increment(static_cast<double>(tokens));
}

void Observability::set_active_streams(int64_t count) {
    if (!metrics_enabled_) {
        return;
    }
    active_streams_family_->Add({}).Set(static_cast<double>(count));
}

void Observability::set_health_status(const std::string& check, int64_t status) {
    if (!metrics_enabled_) {
        return;
    }
    health_status_family_->Add({{"check", check}}).Set(static_cast<double>(status));
}

void Observability::set_log_stream(std::ostream* out) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_stream_ = out != nullptr ? out : &std::cerr;
}

void Observability::set_min_level(LogLevel level) {
    min_level_ = static_cast<int>(level);
}

LogLevel Observability::parse_level(const std::string& level) {
    if (level == "debug") return LogLevel::debug;
    if (level == "warn" || level == "warning") return LogLevel::warn;
    if (level == "error") return LogLevel::error;
    return LogLevel::info;
}

void Observability::write_log(LogLevel level, const std::string& line) {
    if (static_cast<int>(level) < min_level_.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex_);
    (*log_stream_) << line << std::endl;
}

void Observability::log_info(const std::string& message,
                             const std::string& correlation_id,
                             const std::string& client_id,
                             const std::unordered_map<std::string, std::string>& context) {
    if (static_cast<int>(LogLevel::info) < min_level_.load()) {
        return;
    }
    write_log(LogLevel::info, format_json_log(level_name(LogLevel::info), message, correlation_id, client_id, context));
}

void Observability::log_warn(const std::string& message,
                             const std::string& correlation_id,
                             const std::string& client_id,
                             const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::warn, format_json_log(level_name(LogLevel::warn), message, correlation_id, client_id, context));
}

void Observability::log_error(const std::string& message,
                              const std::string& correlation_id,
                              const std::string& client_id,
                              const std::unordered_map<std::string, std::string>& context) {
    write_log(LogLevel::error, format_json_log(level_name(LogLevel::error), message, correlation_id, client_id, context));
}

void Observability::log_debug(const std::string& message,
                              const std::string& correlation_id,
                              const std::string& client_id,
                              const std::unordered_map<std::string, std::string>& context) {
    if (static_cast<int>(LogLevel::debug) < min_level_.load()) {
        return;
    }
    write_log(LogLevel::debug, format_json_log(level_name(LogLevel::debug), message, correlation_id, client_id, context));
}

void Observability::log_info_with_trace(const std::string& message,
                                        const TraceContext& trace,
                                        const std::unordered_map<std::string, std::string>& context) {
    log_info(message, trace.correlation_id, trace.client_id, context);
}

void Observability::log_warn_with_trace(const std::string& message,
                                        const TraceContext& trace,
                                        const std::unordered_map<std::string, std::string>& context) {
    log_warn(message, trace.correlation_id, trace.client_id, context);
}

void Observability::log_error_with_trace(const std::string& message,
                                         const TraceContext& trace,
                                         const std::unordered_map<std::string, std::string>& context) {
    log_error(message, trace.correlation_id, trace.client_id, context);
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& correlation_id,
                                           const std::string& client_id,
                                           const std::unordered_map<std::string, std::string>& context) {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = component_id_;
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!correlation_id.empty()) {
        log_entry["correlation_id"] = correlation_id;
    }
    if (!client_id.empty()) {
        log_entry["client_id"] = client_id;
    }

    // Context object (technical details)
    json context_obj = json::object();
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }

    filter_pii_recursive(context_obj);

    if (!context_obj.empty()) {
        log_entry["context"] = context_obj;
    }

    return log_entry.dump();
}

std::string Observability::get_health_response() {
    json health_response;
    health_response["status"] = "healthy";
    health_response["component"] = component_id_;
    health_response["timestamp"] = get_iso8601_timestamp();
    return health_response.dump();
}

std::string Observability::get_metrics_response() {
    if (!metrics_enabled_) {
        return "";
    }

    std::ostringstream oss;
    prometheus::TextSerializer serializer;
    serializer.Serialize(oss, registry_->Collect());
    return oss.str();
}

int Observability::open_listen_socket(const std::string& address, uint16_t port, const std::string& endpoint_name) {
    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) != 1) {
        log_error("Invalid " + endpoint_name + " endpoint address", "", "", {
            {"address", address}
        });
        return -1;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        log_error("Failed to create " + endpoint_name + " endpoint socket", "", "", {
            {"error", std::strerror(errno)}
        });
        return -1;
    }

    int opt = 1;
    setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        log_error("Failed to bind " + endpoint_name + " endpoint socket", "", "", {
            {"error", std::strerror(errno)},
            {"address", address},
            {"port", std::to_string(port)}
        });
        close(socket_fd);
        return -1;
    }

    if (listen(socket_fd, 16) < 0) {
        log_error("Failed to listen on " + endpoint_name + " endpoint socket", "", "", {
            {"error", std::strerror(errno)}
        });
        close(socket_fd);
        return -1;
    }

    return socket_fd;
}

void Observability::http_server_loop(int socket_fd,
                                     std::atomic<bool>& running,
                                     const std::string& path,
                                     const std::string& content_type,
                                     const std::function<std::string()>& render) {
    char buffer[4096];
    const std::string request_line = "GET " + path;

    while (running) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running) {
                continue;
            }
            break;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (bytes_read > 0) {
            buffer[bytes_read] = '\0';

            std::string request(buffer);
            std::string response;
            if (request.compare(0, request_line.size(), request_line) == 0) {
                std::string response_body = render();
                response =
                    "HTTP/1.1 200 OK\r\n"
                    "Content-Type: " + content_type + "\r\n"
                    "Content-Length: " + std::to_string(response_body.length()) + "\r\n"
                    "Connection: close\r\n"
                    "\r\n" + response_body;
            } else {
                response =
                    "HTTP/1.1 404 Not Found\r\n"
                    "Content-Type: text/plain\r\n"
                    "Content-Length: 13\r\n"
                    "Connection: close\r\n"
                    "\r\n"
                    "404 Not Found";
            }
            send(client_fd, response.c_str(), response.length(), MSG_NOSIGNAL);
        }

        close(client_fd);
    }
}

void Observability::start_health_endpoint(const std::string& address, uint16_t port) {
    if (health_server_running_) {
        return; // Already running
    }

    int socket_fd = open_listen_socket(address, port, "health");
    if (socket_fd < 0) {
        return;
    }

    health_server_socket_ = socket_fd;
    health_server_running_ = true;
    health_server_thread_ = std::thread([this, socket_fd]() {
        http_server_loop(socket_fd, health_server_running_, "/_health", "application/json",
                         [this]() { return get_health_response(); });
    });

    log_info("Health endpoint started", "", "", {
        {"address", address},
        {"port", std::to_string(port)}
    });
}

void Observability::stop_health_endpoint() {
    if (!health_server_running_) {
        return;
    }

    health_server_running_ = false;

    // Shut the socket down to wake up accept()
    if (health_server_socket_ >= 0) {
        shutdown(health_server_socket_, SHUT_RDWR);
        close(health_server_socket_);
        health_server_socket_ = -1;
    }

    if (health_server_thread_.joinable()) {
        health_server_thread_.join();
    }

    log_info("Health endpoint stopped");
}

void Observability::start_metrics_endpoint(const std::string& address, uint16_t port) {
    if (!metrics_enabled_) {
        return; // Don't start if feature flag disabled
    }

    if (metrics_server_running_) {
        return; // Already running
    }

    int socket_fd = open_listen_socket(address, port, "metrics");
    if (socket_fd < 0) {
        return;
    }

    metrics_server_socket_ = socket_fd;
    metrics_server_running_ = true;
    metrics_server_thread_ = std::thread([this, socket_fd]() {
        http_server_loop(socket_fd, metrics_server_running_, "/metrics", "text/plain; version=0.0.4",
                         [this]() { return get_metrics_response(); });
    });

    log_info("Metrics endpoint started", "", "", {
        {"address", address},
        {"port", std::to_string(port)}
    });
}

void Observability::stop_metrics_endpoint() {
    if (!metrics_server_running_) {
        return;
    }

    metrics_server_running_ = false;

    if (metrics_server_socket_ >= 0) {
        shutdown(metrics_server_socket_, SHUT_RDWR);
        close(metrics_server_socket_);
        metrics_server_socket_ = -1;
    }

    if (metrics_server_thread_.joinable()) {
        metrics_server_thread_.join();
    }

    log_info("Metrics endpoint stopped");
}

} // namespace gateway
} // namespace tutorgate
