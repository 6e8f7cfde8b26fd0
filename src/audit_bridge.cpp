#include "ari/audit_bridge.hpp"
#include "ari/json_canonicalization.hpp"
#include "ari/logging.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <thread>

namespace ari
{

    std::chrono::milliseconds RetryPolicy::backoff_before(std::uint32_t attempt) const
    {
        if (attempt <= 1)
            return std::chrono::milliseconds(0);
        double factor = std::pow(multiplier, static_cast<double>(attempt - 2));
        double delay = static_cast<double>(initial_backoff.count()) * factor;
        auto cap = static_cast<double>(max_backoff.count());
        if (!(delay < cap))
            return max_backoff;
        return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
    }

    AuditBridge::AuditBridge(Dispatcher &dispatcher, AuditChain &chain, RetryPolicy policy, Sleeper sleeper)
        : dispatcher_(dispatcher),
          chain_(chain),
          policy_(policy),
          sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }))
    {
        policy_.max_attempts = std::clamp(policy_.max_attempts, std::uint32_t{1}, RetryPolicy::kMaxAttempts);
    }

    AuditBridge::~AuditBridge()
    {
        stop();
    }

    Result<void> AuditBridge::start()
    {
        if (subscription_)
            return std::unexpected(AriError::invalid_input("Audit bridge is already running"));

        auto sub = dispatcher_.subscribe(kAuditLog, [this](const AuditLogRequest &request)
                                         { on_request(request); });
        if (!sub)
            return std::unexpected(sub.error());

        subscription_ = *sub;
        logging::get("bridge")->debug("Audit bridge subscribed to '{}'", kAuditLog.name);
        return {};
    }

    void AuditBridge::stop()
    {
        if (subscription_)
        {
            subscription_->unsubscribe();
            subscription_.reset();
        }
    }

    Result<AuditDraft> AuditBridge::to_draft(const AuditLogRequest &request) const
    {
        if (request.action.empty())
            return std::unexpected(AriError::validation("Audit request has no action"));
        if (request.actor.empty())
            return std::unexpected(AriError::validation("Audit request has no actor"));
        if (!request.details.is_null() && !request.details.is_object())
            return std::unexpected(AriError::validation("Audit request details must be a JSON object"));
        if (!json::RFC8785Canonicalizer::is_valid_utf8(request.action) ||
            !json::RFC8785Canonicalizer::is_valid_utf8(request.actor) ||
            !json::RFC8785Canonicalizer::is_valid_utf8(request.trust_level))
            return std::unexpected(AriError::validation("Audit request contains invalid UTF-8"));
        if (request.details.is_object())
        {
            if (auto canonical = json::RFC8785Canonicalizer::canonicalize(request.details); !canonical)
                return std::unexpected(AriError::validation(
                    std::format("Audit request details are not representable: {}", canonical.error().what())));
        }

        auto trust = trust_level_from_string(request.trust_level);
        if (!trust)
            return std::unexpected(AriError::validation(trust.error().what()));

        AuditDraft draft;
        draft.action = request.action;
        draft.actor = request.actor;
        draft.trust_level = *trust;
        draft.details = request.details.is_null() ? nlohmann::json::object() : request.details;
        draft.recorded_at = now_iso8601();
        return draft;
    }

    void AuditBridge::on_request(const AuditLogRequest &request)
    {
        auto log = logging::get("bridge");

        auto draft = to_draft(request);
        if (!draft)
        {
            log->warn("Rejected audit request '{}' from '{}': {}", request.action, request.actor, draft.error().what());
            report_unavailable(request, 0, draft.error().what());
            return;
        }

        std::string last_error;
        for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt)
        {
            if (attempt > 1)
                sleeper_(policy_.backoff_before(attempt));

            auto entry = chain_.append(*draft);
            if (entry)
            {
                appended_.fetch_add(1);
                dispatcher_.publish(kAuditLogged, *entry);
                return;
            }

            last_error = entry.error().what();
            log->warn("Audit append attempt {}/{} for '{}' failed: {}",
                      attempt, policy_.max_attempts, request.action, last_error);
        }

        report_unavailable(request, policy_.max_attempts, last_error);
    }

    void AuditBridge::report_unavailable(const AuditLogRequest &request, std::uint32_t attempts, const std::string &error)
    {
        unavailable_.fetch_add(1);
        logging::get("bridge")->error("Audit unavailable: dropped '{}' from '{}' after {} attempt(s): {}",
                                      request.action, request.actor, attempts, error);
        dispatcher_.publish(kAuditUnavailable, AuditUnavailableEvent{
                                                   request.action,
                                                   request.actor,
                                                   attempts,
                                                   error,
                                                   now_iso8601()});
    }

} // namespace ari
