#pragma once

#include "tutorgate/gateway/core.hpp"
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace tutorgate {
namespace gateway {

/**
 * Request Tracer
 *
 * Attaches a correlation id to every request at ingress, collects component
 * breadcrumbs while the request moves through the gateway, and emits one
 * summary log line at egress.
 *
 * A well-formed incoming id ([A-Za-z0-9_-]{1,64}) is adopted so the id
 * chosen by an upstream proxy survives; anything else is replaced.
 */
class RequestTracer {
public:
    explicit RequestTracer(std::shared_ptr<Observability> observability);

    TraceContext begin(const std::string& client_id,
                       EndpointClass endpoint,
                       const std::string& incoming_id = "");

    static void breadcrumb(TraceContext& trace, const std::string& component);

    // Egress flush: one log line with duration, outcome and breadcrumbs
    void finish(const TraceContext& trace, const std::string& outcome);

    static bool is_valid_correlation_id(const std::string& id);

    // 32 lowercase hex characters
    std::string generate_id();

private:
    std::shared_ptr<Observability> observability_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace gateway
} // namespace tutorgate
