#include "tutorgate/gateway/quota_store.hpp"
#include <sw/redis++/redis++.h>
#include <caf/error.hpp>
#include <algorithm>
#include <iterator>

namespace tutorgate {
namespace gateway {

namespace {

// KEYS[1] = window key, ARGV[1] = limit, ARGV[2] = ttl in ms.
// Returns the new count, or -1 when the limit was already reached.
constexpr const char* kIncrementScript = R"lua(
local current = tonumber(redis.call('GET', KEYS[1]) or '0')
if current >= tonumber(ARGV[1]) then
  return -1
end
current = redis.call('INCR', KEYS[1])
if current == 1 then
  redis.call('PEXPIRE', KEYS[1], ARGV[2])
end
return current
)lua";

caf::error backend_error(const std::string& operation, const sw::redis::Error& e) {
    return caf::make_error(caf::sec::runtime_error, "redis " + operation + " failed: " + e.what());
}

} // namespace

caf::expected<std::unique_ptr<RedisQuotaStore>> RedisQuotaStore::connect(
    RedisQuotaConfig config,
    std::shared_ptr<const QuotaClock> clock) {
    try {
        sw::redis::ConnectionOptions options(config.url);
        options.connect_timeout = config.connect_timeout;
        options.socket_timeout = config.socket_timeout;

        sw::redis::ConnectionPoolOptions pool_options;
        pool_options.size = std::max<size_t>(1, config.pool_size);
        pool_options.wait_timeout = config.socket_timeout;

        auto redis = std::make_unique<sw::redis::Redis>(options, pool_options);
        return std::unique_ptr<RedisQuotaStore>(
            new RedisQuotaStore(std::move(config), std::move(clock), std::move(redis)));
    } catch (const sw::redis::Error& e) {
        return caf::make_error(caf::sec::invalid_argument,
                               std::string("invalid redis url: ") + e.what());
    }
}

RedisQuotaStore::RedisQuotaStore(RedisQuotaConfig config,
                                 std::shared_ptr<const QuotaClock> clock,
                                 std::unique_ptr<sw::redis::Redis> redis)
    : config_(std::move(config)),
      clock_(std::move(clock)),
      redis_(std::move(redis)) {}

RedisQuotaStore::~RedisQuotaStore() = default;

std::string RedisQuotaStore::window_key(const std::string& key, int64_t window_start_ms) const {
    return config_.key_prefix + ":" + key + ":" + std::to_string(window_start_ms / 1000);
}

caf::expected<QuotaDecision> RedisQuotaStore::increment_and_check(const std::string& key,
                                                                  int64_t limit,
                                                                  std::chrono::seconds window) {
    if (window.count() <= 0) {
        return caf::make_error(caf::sec::invalid_argument, "quota window must be positive");
    }
    const int64_t window_ms = window.count() * 1000;
    const int64_t now = clock_->now_ms();
    const int64_t window_start = now / window_ms * window_ms;
    const int64_t window_end = window_start + window_ms;
    const int64_t ttl_ms = std::max<int64_t>(1, window_end - now);

    try {
        long long count = redis_->eval<long long>(
            kIncrementScript,
            {window_key(key, window_start)},
            {std::to_string(limit), std::to_string(ttl_ms)});
        if (count < 0) {
            return make_quota_decision(false, limit, limit, window_end, now);
        }
        return make_quota_decision(true, limit, count, window_end, now);
    } catch (const sw::redis::Error& e) {
        return backend_error("increment", e);
    }
}

caf::expected<void> RedisQuotaStore::reset(const std::string& key) {
    // Window keys carry the window start, so every window of the key is removed
    const std::string pattern = config_.key_prefix + ":" + key + ":*";
    try {
        std::vector<std::string> keys;
        long long cursor = 0;
        do {
            cursor = redis_->scan(cursor, pattern, 100, std::back_inserter(keys));
        } while (cursor != 0);
        if (!keys.empty()) {
            redis_->del(keys.begin(), keys.end());
        }
        return caf::unit;
    } catch (const sw::redis::Error& e) {
        return backend_error("reset", e);
    }
}

caf::expected<void> RedisQuotaStore::ping() {
    try {
        redis_->ping();
        return caf::unit;
    } catch (const sw::redis::Error& e) {
        return backend_error("ping", e);
    }
}

} // namespace gateway
} // namespace tutorgate
