#include "ari/health.hpp"
#include "ari/events.hpp"
#include "ari/logging.hpp"
#include <format>

namespace ari
{

    std::string health_status_to_string(HealthStatus status)
    {
        switch (status)
        {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
        case HealthStatus::Unknown:
            return "unknown";
        }
        return "unknown";
    }

    nlohmann::json HealthReport::to_json() const
    {
        nlohmann::json j{{"status", health_status_to_string(status)},
                         {"reason", reason},
                         {"handlerErrorDelta", handler_error_delta},
                         {"unavailableSignals", unavailable_signals},
                         {"rejectedRequests", rejected_requests}};
        j["integrity"] = integrity ? integrity->to_json() : nlohmann::json(nullptr);
        return j;
    }

    AuditHealthProbe::AuditHealthProbe(Dispatcher &dispatcher, const IntegrityVerifier &verifier,
                                       std::uint64_t error_threshold)
        : dispatcher_(dispatcher),
          verifier_(verifier),
          error_threshold_(error_threshold),
          last_error_count_(dispatcher.handler_error_count())
    {
    }

    AuditHealthProbe::~AuditHealthProbe()
    {
        stop();
    }

    Result<void> AuditHealthProbe::start()
    {
        if (subscription_)
            return {};

        // Zero attempts means the request was rejected before reaching storage
        auto sub = dispatcher_.subscribe(kAuditUnavailable, [this](const AuditUnavailableEvent &event)
                                         {
            if (event.attempts == 0)
                rejected_seen_.fetch_add(1);
            else
                unavailable_seen_.fetch_add(1); });
        if (!sub)
            return std::unexpected(sub.error());
        subscription_ = *sub;
        return {};
    }

    void AuditHealthProbe::stop()
    {
        if (subscription_)
        {
            subscription_->unsubscribe();
            subscription_.reset();
        }
    }

    HealthReport AuditHealthProbe::check()
    {
        HealthReport report;

        // The counter is reset by clear(); treat a drop as a fresh baseline.
        std::uint64_t errors = dispatcher_.handler_error_count();
        report.handler_error_delta = errors >= last_error_count_ ? errors - last_error_count_ : errors;
        last_error_count_ = errors;
        report.unavailable_signals = unavailable_seen_.exchange(0);
        report.rejected_requests = rejected_seen_.exchange(0);

        auto integrity = verifier_.verify_all();
        if (!integrity)
        {
            report.status = HealthStatus::Unknown;
            report.reason = std::format("Audit integrity unknown: {}", integrity.error().what());
            logging::get("verifier")->error("{}", report.reason);
            return report;
        }
        report.integrity = *integrity;

        if (!integrity->chain.valid)
        {
            report.status = HealthStatus::Unhealthy;
            report.reason = std::format("Audit chain broken: {}", integrity->chain.details);
        }
        else if (!integrity->checkpoints.valid)
        {
            report.status = HealthStatus::Unhealthy;
            report.reason = "Audit checkpoints disagree with the chain";
        }
        else if (report.handler_error_delta > error_threshold_)
        {
            report.status = HealthStatus::Unhealthy;
            report.reason = std::format("{} handler errors since last check", report.handler_error_delta);
        }
        else if (report.handler_error_delta > 0)
        {
            report.status = HealthStatus::Degraded;
            report.reason = std::format("{} handler errors since last check", report.handler_error_delta);
        }
        else if (report.unavailable_signals > 0)
        {
            report.status = HealthStatus::Degraded;
            report.reason = "Audit logging was unavailable since last check";
        }
        else
        {
            report.status = HealthStatus::Healthy;
            report.reason = integrity->entry_count == 0 ? "No audit entries yet" : "Audit chain verified";
        }
        return report;
    }

} // namespace ari
