#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/quota_store.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace tutorgate {
namespace gateway {

struct RateLimitRule {
    int64_t limit = 0;
    std::chrono::seconds window{0};
};

/**
 * Rate Limiter
 *
 * Per-client fixed-window limits for each endpoint class, plus a global
 * budget every class except health counts against. The global rule is
 * checked first, so a request refused globally does not spend its
 * endpoint quota.
 *
 * Client identities never reach the store in clear text: keys carry the
 * first 16 hex digits of SHA-256(client_id).
 */
class RateLimiter {
public:
    using Rules = std::map<EndpointClass, RateLimitRule>;

    RateLimiter(std::shared_ptr<QuotaStore> store,
                std::shared_ptr<Observability> observability,
                Rules rules = default_rules());

    QuotaDecision check(const std::string& client_id, EndpointClass endpoint);
    QuotaDecision check(const std::string& client_id, EndpointClass endpoint, TraceContext& trace);

    static Rules default_rules();
    static std::string make_key(const std::string& client_id, EndpointClass endpoint);
    static std::string hash_client(const std::string& client_id);

    const Rules& rules() const { return rules_; }

private:
    caf::expected<QuotaDecision> check_rule(const std::string& client_id, EndpointClass endpoint);

    std::shared_ptr<QuotaStore> store_;
    std::shared_ptr<Observability> observability_;
    Rules rules_;
};

} // namespace gateway
} // namespace tutorgate
