#pragma once

#include "event_bus.hpp"
#include "integrity.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace ari
{

    enum class HealthStatus
    {
        Healthy,
        Degraded,
        Unhealthy,
        Unknown
    };

    std::string health_status_to_string(HealthStatus status);

    struct HealthReport
    {
        HealthStatus status{HealthStatus::Unknown};
        std::string reason;
        std::optional<IntegrityReport> integrity;
        std::uint64_t handler_error_delta{0};
        std::uint64_t unavailable_signals{0};
        // Malformed audit:log requests; a caller fault, reported but not degrading
        std::uint64_t rejected_requests{0};

        nlohmann::json to_json() const;
    };

    /**
     * Audit-facing health check for an external monitor.
     *
     * - store unreadable or corrupt: unknown
     * - broken chain or checkpoint mismatch: unhealthy
     * - handler errors since the previous check above the threshold: unhealthy
     * - some handler errors, or audit storage unavailable since the previous check: degraded
     * - otherwise healthy (an absent store is a fresh install)
     */
    class AuditHealthProbe
    {
    public:
        AuditHealthProbe(Dispatcher &dispatcher, const IntegrityVerifier &verifier,
                         std::uint64_t error_threshold = 10);
        ~AuditHealthProbe();

        AuditHealthProbe(const AuditHealthProbe &) = delete;
        AuditHealthProbe &operator=(const AuditHealthProbe &) = delete;

        /** Start counting audit:unavailable signals */
        Result<void> start();

        void stop();

        /** Evaluate and reset the per-check counters */
        HealthReport check();

    private:
        Dispatcher &dispatcher_;
        const IntegrityVerifier &verifier_;
        std::uint64_t error_threshold_;
        std::optional<Subscription> subscription_;
        std::atomic<std::uint64_t> unavailable_seen_{0};
        std::atomic<std::uint64_t> rejected_seen_{0};
        std::uint64_t last_error_count_{0};
    };

} // namespace ari
