#include "tutorgate/gateway/quota_store.hpp"
#include "tutorgate/gateway/observability.hpp"
#include <caf/error.hpp>
#include <algorithm>
#include <functional>

namespace tutorgate {
namespace gateway {

int64_t SystemQuotaClock::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t SteadyQuotaClock::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

QuotaDecision make_quota_decision(bool allowed, int64_t limit, int64_t count,
                                  int64_t window_end_ms, int64_t now_ms) {
    QuotaDecision decision;
    decision.allowed = allowed;
    decision.limit = limit;
    decision.remaining = allowed ? std::max<int64_t>(0, limit - count) : 0;

    int64_t until_reset_ms = std::max<int64_t>(0, window_end_ms - now_ms);
    decision.reset_at = std::chrono::system_clock::now() + std::chrono::milliseconds(until_reset_ms);
    if (!allowed) {
        // Round up so a client that waits the hint lands in the next window
        int64_t seconds = (until_reset_ms + 999) / 1000;
        decision.retry_after = std::chrono::seconds(std::max<int64_t>(1, seconds));
    }
    return decision;
}

LocalQuotaStore::LocalQuotaStore(std::shared_ptr<const QuotaClock> clock,
                                 std::chrono::milliseconds sweep_interval,
                                 size_t shard_count)
    : clock_(std::move(clock)) {
    shard_count = std::max<size_t>(1, shard_count);
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
    if (sweep_interval.count() > 0) {
        sweeper_ = std::thread([this, sweep_interval]() { sweeper_loop(sweep_interval); });
    }
}

LocalQuotaStore::~LocalQuotaStore() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stopping_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

LocalQuotaStore::Shard& LocalQuotaStore::shard_for(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

caf::expected<QuotaDecision> LocalQuotaStore::increment_and_check(const std::string& key,
                                                                  int64_t limit,
                                                                  std::chrono::seconds window) {
    if (window.count() <= 0) {
        return caf::make_error(caf::sec::invalid_argument, "quota window must be positive");
    }
    const int64_t window_ms = window.count() * 1000;
    const int64_t now = clock_->now_ms();
    const int64_t window_start = now / window_ms * window_ms;
    const int64_t window_end = window_start + window_ms;

    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    Counter& counter = shard.counters[key];
    if (counter.window_start_ms != window_start || counter.window_ms != window_ms) {
        counter.count = 0;
        counter.window_start_ms = window_start;
        counter.window_ms = window_ms;
    }

    if (counter.count >= limit) {
        return make_quota_decision(false, limit, counter.count, window_end, now);
    }
    ++counter.count;
    return make_quota_decision(true, limit, counter.count, window_end, now);
}

caf::expected<void> LocalQuotaStore::reset(const std::string& key) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.counters.erase(key);
    return caf::unit;
}

size_t LocalQuotaStore::sweep() {
    const int64_t now = clock_->now_ms();
    size_t evicted = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->counters.begin(); it != shard->counters.end();) {
            if (it->second.window_start_ms + it->second.window_ms <= now) {
                it = shard->counters.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
    }
    return evicted;
}

size_t LocalQuotaStore::tracked_keys() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->counters.size();
    }
    return total;
}

void LocalQuotaStore::sweeper_loop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stopping_) {
        if (sweeper_cv_.wait_for(lock, interval, [this]() { return stopping_; })) {
            return;
        }
        lock.unlock();
        sweep();
        lock.lock();
    }
}

FailoverQuotaStore::FailoverQuotaStore(std::unique_ptr<QuotaStore> primary,
                                       std::unique_ptr<QuotaStore> fallback,
                                       RetryPolicy retry_policy,
                                       std::shared_ptr<Observability> observability)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      retry_policy_(retry_policy),
      observability_(std::move(observability)) {}

bool FailoverQuotaStore::should_try_primary() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!degraded_.load()) {
        return true;
    }
    // One probe at a time; everyone else keeps using the fallback
    if (probe_in_flight_ || std::chrono::steady_clock::now() < next_probe_) {
        return false;
    }
    probe_in_flight_ = true;
    return true;
}

void FailoverQuotaStore::on_primary_success() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    probe_in_flight_ = false;
    if (!degraded_.load()) {
        return;
    }
    degraded_.store(false);
    auto outage = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - outage_started_);
    observability_->log_info("Quota backend recovered", "", "", {
        {"backend", primary_->backend_name()},
        {"outage_ms", std::to_string(outage.count())},
        {"failed_probes", std::to_string(failed_probes_)}
    });
    observability_->set_quota_backend_degraded(false);
    failed_probes_ = 0;
}

void FailoverQuotaStore::on_primary_failure(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    probe_in_flight_ = false;
    auto now = std::chrono::steady_clock::now();
    if (!degraded_.load()) {
        degraded_.store(true);
        outage_started_ = now;
        failed_probes_ = 0;
        observability_->log_warn("Quota backend unavailable, using local fallback", "", "", {
            {"backend", primary_->backend_name()},
            {"fallback", fallback_->backend_name()},
            {"error", reason}
        });
        observability_->set_quota_backend_degraded(true);
    } else {
        ++failed_probes_;
        observability_->log_debug("Quota backend probe failed", "", "", {
            {"backend", primary_->backend_name()},
            {"attempt", std::to_string(failed_probes_)},
            {"error", reason}
        });
    }
    next_probe_ = now + retry_policy_.backoff(failed_probes_);
}

void FailoverQuotaStore::mark_unavailable(const std::string& reason) {
    on_primary_failure(reason);
}

caf::expected<QuotaDecision> FailoverQuotaStore::increment_and_check(const std::string& key,
                                                                     int64_t limit,
                                                                     std::chrono::seconds window) {
    if (window.count() <= 0) {
        return caf::make_error(caf::sec::invalid_argument, "quota window must be positive");
    }
    if (should_try_primary()) {
        std::string last_error;
        for (int32_t attempt = 0; attempt <= retry_policy_.max_retries(); ++attempt) {
            auto decision = primary_->increment_and_check(key, limit, window);
            if (decision) {
                on_primary_success();
                return decision;
            }
            last_error = caf::to_string(decision.error());
        }
        on_primary_failure(last_error);
    }

    auto decision = fallback_->increment_and_check(key, limit, window);
    if (decision) {
        decision->degraded = true;
    }
    return decision;
}

caf::expected<void> FailoverQuotaStore::reset(const std::string& key) {
    auto local = fallback_->reset(key);
    if (!degraded_.load()) {
        auto remote = primary_->reset(key);
        if (!remote) {
            on_primary_failure(caf::to_string(remote.error()));
        }
    }
    return local;
}

std::string FailoverQuotaStore::backend_name() const {
    if (degraded_.load()) {
        return primary_->backend_name() + "+" + fallback_->backend_name();
    }
    return primary_->backend_name();
}

std::shared_ptr<QuotaStore> make_quota_store(const GatewayConfig& config,
                                             std::shared_ptr<Observability> observability) {
    auto sweep_interval = std::chrono::milliseconds(config.quota_sweep_interval_ms);
    if (config.redis_url.empty()) {
        observability->log_info("Quota store: in-process counters", "", "", {
            {"sweep_interval_ms", std::to_string(config.quota_sweep_interval_ms)}
        });
        return std::make_shared<LocalQuotaStore>(std::make_shared<SteadyQuotaClock>(), sweep_interval);
    }

    RedisQuotaConfig redis_config;
    redis_config.url = config.redis_url;
    redis_config.connect_timeout = std::chrono::milliseconds(config.redis_timeout_ms);
    redis_config.socket_timeout = std::chrono::milliseconds(config.redis_timeout_ms);

    auto redis = RedisQuotaStore::connect(redis_config);
    if (!redis) {
        observability->log_error("Invalid Redis URL, using in-process counters only", "", "", {
            {"error", caf::to_string(redis.error())}
        });
        return std::make_shared<LocalQuotaStore>(std::make_shared<SteadyQuotaClock>(), sweep_interval);
    }

    RedisQuotaStore* redis_ptr = redis->get();
    auto startup_ping = redis_ptr->ping();

    RetryPolicy::Config retry_config;
    retry_config.base_delay_ms = config.quota_probe_base_delay_ms;
    retry_config.max_delay_ms = config.quota_probe_max_delay_ms;
    retry_config.max_retries = 1;

    auto store = std::make_shared<FailoverQuotaStore>(
        std::move(*redis),
        std::make_unique<LocalQuotaStore>(std::make_shared<SteadyQuotaClock>(), sweep_interval),
        RetryPolicy(retry_config),
        observability);

    if (!startup_ping) {
        store->mark_unavailable(caf::to_string(startup_ping.error()));
    } else {
        observability->log_info("Quota store: redis with local fallback");
    }
    return store;
}

} // namespace gateway
} // namespace tutorgate
