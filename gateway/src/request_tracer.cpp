#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include <cctype>
#include <cstdio>

namespace tutorgate {
namespace gateway {

RequestTracer::RequestTracer(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)),
      rng_(std::random_device{}()) {}

TraceContext RequestTracer::begin(const std::string& client_id,
                                  EndpointClass endpoint,
                                  const std::string& incoming_id) {
    TraceContext trace;
    trace.correlation_id = is_valid_correlation_id(incoming_id) ? incoming_id : generate_id();
    trace.client_id = client_id;
    trace.endpoint = ResultConverter::endpoint_to_string(endpoint);
    trace.started_at = std::chrono::steady_clock::now();
    trace.breadcrumbs.push_back("ingress");

    if (!incoming_id.empty() && trace.correlation_id != incoming_id) {
        observability_->log_debug("Replaced malformed incoming correlation id",
                                  trace.correlation_id, client_id);
    }
    return trace;
}

void RequestTracer::breadcrumb(TraceContext& trace, const std::string& component) {
    if (trace.breadcrumbs.empty() || trace.breadcrumbs.back() != component) {
        trace.breadcrumbs.push_back(component);
    }
}

void RequestTracer::finish(const TraceContext& trace, const std::string& outcome) {
    std::string path;
    for (const auto& crumb : trace.breadcrumbs) {
        if (!path.empty()) {
            path += ">";
        }
        path += crumb;
    }

    observability_->log_info_with_trace("Request completed", trace, {
        {"endpoint", trace.endpoint},
        {"outcome", outcome},
        {"duration_ms", std::to_string(trace.elapsed_ms())},
        {"path", path}
    });
}

bool RequestTracer::is_valid_correlation_id(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

std::string RequestTracer::generate_id() {
    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        high = rng_();
        low = rng_();
    }
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(high),
                  static_cast<unsigned long long>(low));
    return std::string(buf, 32);
}

} // namespace gateway
} // namespace tutorgate
