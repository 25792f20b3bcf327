#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "tutorgate/gateway/observability.hpp"
#include "tutorgate/gateway/quota_store.hpp"

using namespace tutorgate::gateway;

class ManualQuotaClock : public QuotaClock {
public:
    explicit ManualQuotaClock(int64_t start_ms) : now_(start_ms) {}
    int64_t now_ms() const override { return now_.load(); }
    void set(int64_t ms) { now_.store(ms); }

private:
    std::atomic<int64_t> now_;
};

// Primary that can be switched between healthy and failing
class FlakyQuotaStore : public QuotaStore {
public:
    caf::expected<QuotaDecision> increment_and_check(const std::string&, int64_t limit,
                                                     std::chrono::seconds) override {
        ++calls;
        if (failing.load()) {
            return caf::make_error(caf::sec::runtime_error, "connection refused");
        }
        return make_quota_decision(true, limit, 1, 1000, 0);
    }
    caf::expected<void> reset(const std::string&) override { return caf::unit; }
    std::string backend_name() const override { return "flaky"; }

    std::atomic<bool> failing{false};
    std::atomic<int> calls{0};
};

static size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

void test_fixed_window_limit() {
    std::cout << "Testing fixed window limit..." << std::endl;

    auto clock = std::make_shared<ManualQuotaClock>(120000);
    LocalQuotaStore store(clock, std::chrono::milliseconds(0));

    for (int64_t i = 1; i <= 3; ++i) {
        auto decision = store.increment_and_check("client-a", 3, std::chrono::seconds(60));
        assert(decision);
        assert(decision->allowed);
        assert(decision->limit == 3);
        assert(decision->remaining == 3 - i);
        assert(!decision->degraded);
    }

    auto rejected = store.increment_and_check("client-a", 3, std::chrono::seconds(60));
    assert(rejected);
    assert(!rejected->allowed);
    assert(rejected->remaining == 0);
    assert(rejected->retry_after.count() == 60);

    // Other keys have their own counters
    auto other = store.increment_and_check("client-b", 3, std::chrono::seconds(60));
    assert(other && other->allowed && other->remaining == 2);

    std::cout << "✓ Fixed window limit test passed" << std::endl;
}

void test_window_boundary() {
    std::cout << "Testing window boundary alignment..." << std::endl;

    auto clock = std::make_shared<ManualQuotaClock>(59000);
    LocalQuotaStore store(clock, std::chrono::milliseconds(0));

    assert(store.increment_and_check("k", 1, std::chrono::seconds(60))->allowed);
    auto rejected = store.increment_and_check("k", 1, std::chrono::seconds(60));
    assert(!rejected->allowed);
    assert(rejected->retry_after.count() == 1);

    // One millisecond before the boundary still rounds up to a full second
    clock->set(59999);
    rejected = store.increment_and_check("k", 1, std::chrono::seconds(60));
    assert(!rejected->allowed);
    assert(rejected->retry_after.count() == 1);

    // Windows are aligned, so 60000 starts a fresh one
    clock->set(60000);
    auto fresh = store.increment_and_check("k", 1, std::chrono::seconds(60));
    assert(fresh->allowed);
    assert(fresh->remaining == 0);

    std::cout << "✓ Window boundary test passed" << std::endl;
}

void test_rejection_does_not_increment() {
    std::cout << "Testing rejections do not consume quota..." << std::endl;

    auto clock = std::make_shared<ManualQuotaClock>(0);
    LocalQuotaStore store(clock, std::chrono::milliseconds(0));

    assert(store.increment_and_check("k", 2, std::chrono::seconds(10))->allowed);
    assert(store.increment_and_check("k", 2, std::chrono::seconds(10))->allowed);
    for (int i = 0; i < 5; ++i) {
        assert(!store.increment_and_check("k", 2, std::chrono::seconds(10))->allowed);
    }

    assert(store.reset("k"));
    auto after_reset = store.increment_and_check("k", 2, std::chrono::seconds(10));
    assert(after_reset->allowed);
    assert(after_reset->remaining == 1);

    std::cout << "✓ Rejection accounting test passed" << std::endl;
}

void test_invalid_window() {
    std::cout << "Testing invalid window..." << std::endl;

    LocalQuotaStore store(std::make_shared<SteadyQuotaClock>(), std::chrono::milliseconds(0));
    auto decision = store.increment_and_check("k", 5, std::chrono::seconds(0));
    assert(!decision);
    assert(decision.error().code() == static_cast<uint8_t>(caf::sec::invalid_argument));

    std::cout << "✓ Invalid window test passed" << std::endl;
}

void test_concurrent_admission_is_exact() {
    std::cout << "Testing concurrent increments admit exactly the limit..." << std::endl;

    LocalQuotaStore store(std::make_shared<ManualQuotaClock>(1000), std::chrono::milliseconds(0), 4);
    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &allowed]() {
            for (int i = 0; i < 50; ++i) {
                auto decision = store.increment_and_check("shared", 100, std::chrono::seconds(60));
                if (decision && decision->allowed) {
                    ++allowed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(allowed.load() == 100);

    std::cout << "✓ Concurrent admission test passed" << std::endl;
}

void test_sweep_evicts_expired_windows() {
    std::cout << "Testing sweep of expired counters..." << std::endl;

    auto clock = std::make_shared<ManualQuotaClock>(0);
    LocalQuotaStore store(clock, std::chrono::milliseconds(0));

    store.increment_and_check("short", 1, std::chrono::seconds(10));
    store.increment_and_check("long", 1, std::chrono::seconds(300));
    assert(store.tracked_keys() == 2);

    clock->set(15000);
    assert(store.sweep() == 1);
    assert(store.tracked_keys() == 1);

    clock->set(300000);
    assert(store.sweep() == 1);
    assert(store.tracked_keys() == 0);

    std::cout << "✓ Sweep test passed" << std::endl;
}

void test_failover_to_local() {
    std::cout << "Testing failover to local counters..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_quota");
    observability->set_log_stream(&logs);

    auto primary = std::make_unique<FlakyQuotaStore>();
    FlakyQuotaStore* flaky = primary.get();

    RetryPolicy::Config retry_config;
    retry_config.base_delay_ms = 50;
    retry_config.max_delay_ms = 200;
    retry_config.max_retries = 1;

    FailoverQuotaStore store(std::move(primary),
                             std::make_unique<LocalQuotaStore>(std::make_shared<SteadyQuotaClock>(),
                                                               std::chrono::milliseconds(0)),
                             RetryPolicy(retry_config),
                             observability);

    auto healthy = store.increment_and_check("k", 10, std::chrono::seconds(60));
    assert(healthy && healthy->allowed && !healthy->degraded);
    assert(store.backend_name() == "flaky");
    assert(flaky->calls == 1);

    flaky->failing = true;
    auto degraded = store.increment_and_check("k", 10, std::chrono::seconds(60));
    assert(degraded);
    assert(degraded->allowed);
    assert(degraded->degraded);
    assert(store.degraded());
    assert(store.backend_name() == "flaky+local");
    // First attempt plus one immediate retry
    assert(flaky->calls == 3);

    // Inside the backoff window the primary is left alone
    auto still_degraded = store.increment_and_check("k", 10, std::chrono::seconds(60));
    assert(still_degraded->degraded);
    assert(flaky->calls == 3);
    assert(count_occurrences(logs.str(), "Quota backend unavailable") == 1);

    flaky->failing = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    auto recovered = store.increment_and_check("k", 10, std::chrono::seconds(60));
    assert(recovered && !recovered->degraded);
    assert(!store.degraded());
    assert(store.backend_name() == "flaky");
    assert(logs.str().find("Quota backend recovered") != std::string::npos);

    std::cout << "✓ Failover test passed" << std::endl;
}

void test_make_quota_store_without_redis() {
    std::cout << "Testing store selection without Redis..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_quota");
    observability->set_log_stream(&logs);

    GatewayConfig config;
    config.redis_url = "";
    auto store = make_quota_store(config, observability);
    assert(store->backend_name() == "local");

    std::cout << "✓ Store selection test passed" << std::endl;
}

void test_unreachable_redis_starts_degraded() {
    std::cout << "Testing unreachable Redis starts degraded..." << std::endl;

    std::ostringstream logs;
    auto observability = std::make_shared<Observability>("test_quota");
    observability->set_log_stream(&logs);

    GatewayConfig config;
    config.redis_url = "tcp://127.0.0.1:1";
    config.redis_timeout_ms = 100;
    auto store = make_quota_store(config, observability);
    assert(store->backend_name() == "redis+local");

    auto decision = store->increment_and_check("k", 2, std::chrono::seconds(60));
    assert(decision);
    assert(decision->allowed);
    assert(decision->degraded);
    assert(logs.str().find("Quota backend unavailable") != std::string::npos);

    std::cout << "✓ Unreachable Redis test passed" << std::endl;
}

int main() {
    std::cout << "=== Quota Store Tests ===" << std::endl;

    try {
        test_fixed_window_limit();
        test_window_boundary();
        test_rejection_does_not_increment();
        test_invalid_window();
        test_concurrent_admission_is_exact();
        test_sweep_evicts_expired_windows();
        test_failover_to_local();
        test_make_quota_store_without_redis();
        test_unreachable_redis_starts_degraded();

        std::cout << "\n=== All tests passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "✗ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
