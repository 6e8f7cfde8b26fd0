#pragma once

#include "audit.hpp"
#include "event_bus.hpp"
#include "events.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace ari
{

    struct RetryPolicy
    {
        static constexpr std::uint32_t kMaxAttempts = 100;

        std::uint32_t max_attempts{3};
        std::chrono::milliseconds initial_backoff{50};
        double multiplier{2.0};
        std::chrono::milliseconds max_backoff{30000};

        /** Delay before attempt number `attempt` (1-based, attempt >= 2), never above max_backoff */
        std::chrono::milliseconds backoff_before(std::uint32_t attempt) const;
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * The single subscriber on audit:log. Turns each request into an audit
     * entry, retrying storage failures with exponential backoff. Success is
     * announced on audit:logged; a request that cannot be recorded is
     * announced on audit:unavailable. Nothing is ever thrown back into the
     * dispatcher.
     */
    class AuditBridge
    {
    public:
        AuditBridge(Dispatcher &dispatcher, AuditChain &chain,
                    RetryPolicy policy = RetryPolicy{}, Sleeper sleeper = Sleeper{});
        ~AuditBridge();

        AuditBridge(const AuditBridge &) = delete;
        AuditBridge &operator=(const AuditBridge &) = delete;

        /** Subscribe to audit:log. Fails if already started. */
        Result<void> start();

        void stop();

        bool running() const { return subscription_.has_value(); }

        std::uint64_t appended_count() const { return appended_.load(); }
        std::uint64_t unavailable_count() const { return unavailable_.load(); }

    private:
        void on_request(const AuditLogRequest &request);
        Result<AuditDraft> to_draft(const AuditLogRequest &request) const;
        void report_unavailable(const AuditLogRequest &request, std::uint32_t attempts, const std::string &error);

        Dispatcher &dispatcher_;
        AuditChain &chain_;
        RetryPolicy policy_;
        Sleeper sleeper_;
        std::optional<Subscription> subscription_;
        std::atomic<std::uint64_t> appended_{0};
        std::atomic<std::uint64_t> unavailable_{0};
    };

} // namespace ari
