#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace tutorgate {
namespace gateway {

/**
 * Feature Flags
 *
 * Operational switches read from the environment. All flags default to
 * `false` so an unconfigured deployment keeps the baseline behavior.
 *
 * - TUTORGATE_METRICS_ENABLED
 * - TUTORGATE_REQUIRE_NETWORK_ISOLATION
 * - TUTORGATE_STRICT_ALLOWLIST
 * - TUTORGATE_LOG_LEVEL (debug | info | warn | error, default info)
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics are collected and served
     *
     * Gates:
     * - `/metrics` endpoint
     * - All gateway counters, gauges and histograms
     */
    static bool is_metrics_enabled() {
        return get_env_bool("TUTORGATE_METRICS_ENABLED", false);
    }

    /**
     * Check if sandboxed processes must run in a private network namespace
     *
     * When disabled, namespace creation is still attempted and a failure is
     * tolerated. When enabled, a failure aborts the execution.
     */
    static bool is_network_isolation_required() {
        return get_env_bool("TUTORGATE_REQUIRE_NETWORK_ISOLATION", false);
    }

    /**
     * Check if the built-in command allowlists are enforced on top of the
     * denylists (Bash only ships an allowlist)
     */
    static bool is_strict_allowlist_enabled() {
        return get_env_bool("TUTORGATE_STRICT_ALLOWLIST", false);
    }

    static std::string log_level() {
        const char* value = std::getenv("TUTORGATE_LOG_LEVEL");
        if (value == nullptr) {
            return "info";
        }
        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);
        return str_value;
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `default_value` if environment variable is not set or has other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace gateway
} // namespace tutorgate
