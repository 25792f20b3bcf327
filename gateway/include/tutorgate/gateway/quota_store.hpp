#pragma once

#include "tutorgate/gateway/core.hpp"
#include "tutorgate/gateway/retry_policy.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace tutorgate {
namespace gateway {

// Millisecond time source used to align fixed windows
class QuotaClock {
public:
    virtual ~QuotaClock() = default;
    virtual int64_t now_ms() const = 0;
};

// Wall clock; shared between gateway instances talking to one backend
class SystemQuotaClock : public QuotaClock {
public:
    int64_t now_ms() const override;
};

// Monotonic clock for the in-process store
class SteadyQuotaClock : public QuotaClock {
public:
    int64_t now_ms() const override;
};

/**
 * Quota Store
 *
 * Atomic increment-and-check of a per-key counter inside a fixed window.
 * Windows are aligned to multiples of their length. A rejected attempt
 * does not increment, so a counter never exceeds its limit.
 */
class QuotaStore {
public:
    virtual ~QuotaStore() = default;

    virtual caf::expected<QuotaDecision> increment_and_check(const std::string& key,
                                                             int64_t limit,
                                                             std::chrono::seconds window) = 0;

    virtual caf::expected<void> reset(const std::string& key) = 0;

    virtual std::string backend_name() const = 0;
};

// Builds a decision for a counter value inside the window ending at window_end_ms
QuotaDecision make_quota_decision(bool allowed, int64_t limit, int64_t count,
                                  int64_t window_end_ms, int64_t now_ms);

/**
 * In-process fixed-window counters, sharded by key hash. Expired windows
 * are evicted by a background sweeper so the map stays bounded by the
 * number of clients active in the current window.
 */
class LocalQuotaStore : public QuotaStore {
public:
    explicit LocalQuotaStore(std::shared_ptr<const QuotaClock> clock = std::make_shared<SteadyQuotaClock>(),
                             std::chrono::milliseconds sweep_interval = std::chrono::milliseconds(60000),
                             size_t shard_count = 64);
    ~LocalQuotaStore() override;

    caf::expected<QuotaDecision> increment_and_check(const std::string& key,
                                                     int64_t limit,
                                                     std::chrono::seconds window) override;
    caf::expected<void> reset(const std::string& key) override;
    std::string backend_name() const override { return "local"; }

    // Evicts counters whose window has ended; returns how many were removed
    size_t sweep();
    size_t tracked_keys() const;

private:
    struct Counter {
        int64_t count = 0;
        int64_t window_start_ms = 0;
        int64_t window_ms = 0;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Counter> counters;
    };

    Shard& shard_for(const std::string& key);
    void sweeper_loop(std::chrono::milliseconds interval);

    std::shared_ptr<const QuotaClock> clock_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stopping_ = false;
};

struct RedisQuotaConfig {
    std::string url = "redis://127.0.0.1:6379";
    std::chrono::milliseconds connect_timeout{200};
    std::chrono::milliseconds socket_timeout{200};
    size_t pool_size = 4;
    std::string key_prefix = "tutorgate";
};

/**
 * Shared counters in Redis. The check and the increment run in one Lua
 * script so concurrent gateways never admit past the limit.
 */
class RedisQuotaStore : public QuotaStore {
public:
    // Fails only on a malformed URL; the connection itself is opened lazily
    static caf::expected<std::unique_ptr<RedisQuotaStore>> connect(
        RedisQuotaConfig config,
        std::shared_ptr<const QuotaClock> clock = std::make_shared<SystemQuotaClock>());

    ~RedisQuotaStore() override;

    caf::expected<QuotaDecision> increment_and_check(const std::string& key,
                                                     int64_t limit,
                                                     std::chrono::seconds window) override;
    caf::expected<void> reset(const std::string& key) override;
    std::string backend_name() const override { return "redis"; }

    caf::expected<void> ping();

private:
    RedisQuotaStore(RedisQuotaConfig config,
                    std::shared_ptr<const QuotaClock> clock,
                    std::unique_ptr<sw::redis::Redis> redis);

    std::string window_key(const std::string& key, int64_t window_start_ms) const;

    RedisQuotaConfig config_;
    std::shared_ptr<const QuotaClock> clock_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

/**
 * Primary store with a local fallback.
 *
 * A primary failure is retried per the retry policy, then the request is
 * answered by the fallback with `degraded = true`. While degraded, the
 * primary is probed again after an exponentially growing delay. Entering
 * and leaving degraded mode is logged once per outage.
 */
class FailoverQuotaStore : public QuotaStore {
public:
    FailoverQuotaStore(std::unique_ptr<QuotaStore> primary,
                       std::unique_ptr<QuotaStore> fallback,
                       RetryPolicy retry_policy,
                       std::shared_ptr<Observability> observability);

    caf::expected<QuotaDecision> increment_and_check(const std::string& key,
                                                     int64_t limit,
                                                     std::chrono::seconds window) override;
    caf::expected<void> reset(const std::string& key) override;
    std::string backend_name() const override;

    bool degraded() const { return degraded_.load(); }

    // Starts in degraded mode; used when the primary is unreachable at startup
    void mark_unavailable(const std::string& reason);

private:
    bool should_try_primary();
    void on_primary_success();
    void on_primary_failure(const std::string& reason);

    std::unique_ptr<QuotaStore> primary_;
    std::unique_ptr<QuotaStore> fallback_;
    RetryPolicy retry_policy_;
    std::shared_ptr<Observability> observability_;

    std::mutex state_mutex_;
    std::atomic<bool> degraded_{false};
    bool probe_in_flight_ = false;
    int32_t failed_probes_ = 0;
    std::chrono::steady_clock::time_point next_probe_;
    std::chrono::steady_clock::time_point outage_started_;
};

// In-process store alone, or the Redis store behind a failover when a URL is configured
std::shared_ptr<QuotaStore> make_quota_store(const GatewayConfig& config,
                                             std::shared_ptr<Observability> observability);

} // namespace gateway
} // namespace tutorgate
