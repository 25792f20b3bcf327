#include "tutorgate/gateway/rate_limiter.hpp"
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/request_tracer.hpp"
#include "tutorgate/gateway/result_converter.hpp"
#include <openssl/evp.h>
#include <caf/error.hpp>
#include <cstdio>

namespace tutorgate {
namespace gateway {

RateLimiter::RateLimiter(std::shared_ptr<QuotaStore> store,
                         std::shared_ptr<Observability> observability,
                         Rules rules)
    : store_(std::move(store)),
      observability_(std::move(observability)),
      rules_(std::move(rules)) {}

RateLimiter::Rules RateLimiter::default_rules() {
    using std::chrono::seconds;
    return {
        {EndpointClass::health, {100, seconds(60)}},
        {EndpointClass::analytics_summary, {30, seconds(60)}},
        {EndpointClass::analytics, {10, seconds(60)}},
        {EndpointClass::users, {5, seconds(60)}},
        {EndpointClass::ask, {20, seconds(300)}},
        {EndpointClass::execute, {10, seconds(300)}},
        {EndpointClass::roadmaps, {3, seconds(300)}},
        {EndpointClass::global, {1000, seconds(3600)}},
    };
}

std::string RateLimiter::hash_client(const std::string& client_id) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(client_id.data(), client_id.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        // Digest failure leaves nothing to key on; collapse to one shared bucket
        return "0000000000000000";
    }
    std::string hex;
    hex.reserve(16);
    char buf[3];
    for (unsigned int i = 0; i < 8 && i < digest_len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

std::string RateLimiter::make_key(const std::string& client_id, EndpointClass endpoint) {
    return "rate_limit:" + ResultConverter::endpoint_to_string(endpoint) + ":" + hash_client(client_id);
}

caf::expected<QuotaDecision> RateLimiter::check_rule(const std::string& client_id, EndpointClass endpoint) {
    auto it = rules_.find(endpoint);
    if (it == rules_.end()) {
        return caf::make_error(caf::sec::invalid_argument,
                               "no rate limit rule for " + ResultConverter::endpoint_to_string(endpoint));
    }
    return store_->increment_and_check(make_key(client_id, endpoint), it->second.limit, it->second.window);
}

QuotaDecision RateLimiter::check(const std::string& client_id, EndpointClass endpoint) {
    TraceContext trace;
    trace.client_id = client_id;
    trace.endpoint = ResultConverter::endpoint_to_string(endpoint);
    return check(client_id, endpoint, trace);
}

QuotaDecision RateLimiter::check(const std::string& client_id, EndpointClass endpoint, TraceContext& trace) {
    RequestTracer::breadcrumb(trace, "rate_limiter");
    const std::string endpoint_name = ResultConverter::endpoint_to_string(endpoint);

    auto fail_open = [&](const caf::error& err) {
        observability_->log_error_with_trace("Rate limit check failed, admitting request", trace, {
            {"endpoint", endpoint_name},
            {"backend", store_->backend_name()},
            {"error", caf::to_string(err)}
        });
        QuotaDecision decision;
        decision.allowed = true;
        decision.degraded = true;
        decision.reset_at = std::chrono::system_clock::now();
        observability_->record_quota_decision(endpoint_name, true, true);
        return decision;
    };

    bool check_global = endpoint != EndpointClass::health && endpoint != EndpointClass::global &&
                        rules_.count(EndpointClass::global) > 0;

    QuotaDecision global;
    if (check_global) {
        auto global_result = check_rule(client_id, EndpointClass::global);
        if (!global_result) {
            return fail_open(global_result.error());
        }
        global = *global_result;
        if (!global.allowed) {
            observability_->log_warn_with_trace("Global rate limit exceeded", trace, {
                {"endpoint", endpoint_name},
                {"limit", std::to_string(global.limit)},
                {"retry_after_s", std::to_string(global.retry_after.count())}
            });
            observability_->record_quota_decision("global", false, global.degraded);
            return global;
        }
    }

    auto specific_result = check_rule(client_id, endpoint);
    if (!specific_result) {
        return fail_open(specific_result.error());
    }
    QuotaDecision decision = *specific_result;
    observability_->record_quota_decision(endpoint_name, decision.allowed, decision.degraded);

    if (!decision.allowed) {
        observability_->log_warn_with_trace("Rate limit exceeded", trace, {
            {"endpoint", endpoint_name},
            {"limit", std::to_string(decision.limit)},
            {"retry_after_s", std::to_string(decision.retry_after.count())}
        });
        return decision;
    }

    // Report whichever budget runs out first
    if (check_global && global.remaining < decision.remaining) {
        global.degraded = global.degraded || decision.degraded;
        return global;
    }
    decision.degraded = decision.degraded || global.degraded;
    return decision;
}

} // namespace gateway
} // namespace tutorgate
