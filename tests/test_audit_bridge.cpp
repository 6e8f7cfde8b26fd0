#include <catch2/catch_test_macros.hpp>
#include "ari/audit_bridge.hpp"
#include "ari/events.hpp"
#include "test_support.hpp"
#include <mutex>
#include <vector>

using namespace ari;
using namespace std::chrono_literals;
using ari::testing::InMemoryLineStore;

namespace
{
    struct Harness
    {
        Dispatcher dispatcher;
        std::shared_ptr<InMemoryLineStore> store = std::make_shared<InMemoryLineStore>();
        AuditChain chain{store};

        std::mutex mutex;
        std::vector<std::chrono::milliseconds> sleeps;
        std::vector<AuditUnavailableEvent> unavailable;
        std::vector<AuditEntry> logged;

        std::unique_ptr<AuditBridge> bridge;

        explicit Harness(RetryPolicy policy = RetryPolicy{})
        {
            bridge = std::make_unique<AuditBridge>(dispatcher, chain, policy, [this](std::chrono::milliseconds d)
                                                   {
                std::lock_guard lock(mutex);
                sleeps.push_back(d); });
            REQUIRE(bridge->start().has_value());

            REQUIRE(dispatcher.subscribe(kAuditUnavailable, [this](const AuditUnavailableEvent &e)
                                         {
                std::lock_guard lock(mutex);
                unavailable.push_back(e); })
                        .has_value());
            REQUIRE(dispatcher.subscribe(kAuditLogged, [this](const AuditEntry &e)
                                         {
                std::lock_guard lock(mutex);
                logged.push_back(e); })
                        .has_value());
        }

        ~Harness()
        {
            dispatcher.shutdown();
        }

        void log(AuditLogRequest request)
        {
            dispatcher.publish(kAuditLog, std::move(request));
            dispatcher.drain().get();
            dispatcher.drain().get();
        }
    };

    AuditLogRequest request(const std::string &trust = "standard")
    {
        return AuditLogRequest{"login", "alice", trust, nlohmann::json{{"method", "password"}}};
    }
}

TEST_CASE("Bridge appends requests and announces them", "[bridge]")
{
    Harness h;
    h.log(request("verified"));

    REQUIRE(h.chain.size() == 1);
    auto entry = h.chain.last_entry().value();
    REQUIRE(entry.trust_level == TrustLevel::Verified);
    REQUIRE(entry.details["method"] == "password");
    REQUIRE_FALSE(entry.recorded_at.empty());

    std::lock_guard lock(h.mutex);
    REQUIRE(h.logged.size() == 1);
    REQUIRE(h.logged[0].hash == entry.hash);
    REQUIRE(h.unavailable.empty());
    REQUIRE(h.bridge->appended_count() == 1);
}

TEST_CASE("Transient storage failures are retried with backoff", "[bridge][retry]")
{
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_backoff = 10ms;
    Harness h(policy);

    h.store->fail_next(2);
    h.log(request());

    REQUIRE(h.chain.size() == 1);
    REQUIRE(h.store->failed_appends() == 2);

    std::lock_guard lock(h.mutex);
    REQUIRE(h.sleeps == std::vector<std::chrono::milliseconds>{10ms, 20ms});
    REQUIRE(h.unavailable.empty());
    REQUIRE(h.logged.size() == 1);
}

TEST_CASE("Persistent storage failure raises audit:unavailable", "[bridge][retry]")
{
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_backoff = 5ms;
    Harness h(policy);

    h.store->fail_next(10);
    auto errors_before = h.dispatcher.handler_error_count();
    h.log(request());

    REQUIRE(h.chain.size() == 0);
    REQUIRE(h.store->failed_appends() == 3);
    // The failure is reported, never thrown into the dispatcher
    REQUIRE(h.dispatcher.handler_error_count() == errors_before);
    REQUIRE(h.bridge->unavailable_count() == 1);

    std::lock_guard lock(h.mutex);
    REQUIRE(h.unavailable.size() == 1);
    const auto &e = h.unavailable[0];
    REQUIRE(e.action == "login");
    REQUIRE(e.actor == "alice");
    REQUIRE(e.attempts == 3);
    REQUIRE(e.error.find("simulated storage failure") != std::string::npos);
    REQUIRE(e.to_json()["attempts"] == 3);
    REQUIRE(h.sleeps.size() == 2);
}

TEST_CASE("Invalid requests are rejected without retrying", "[bridge][validation]")
{
    Harness h;

    SECTION("Unknown trust level")
    {
        h.log(request("root"));
    }

    SECTION("Missing actor")
    {
        auto r = request();
        r.actor.clear();
        h.log(r);
    }

    SECTION("Details that are not an object")
    {
        auto r = request();
        r.details = nlohmann::json::array({"a"});
        h.log(r);
    }

    REQUIRE(h.chain.size() == 0);
    REQUIRE(h.store->failed_appends() == 0);

    std::lock_guard lock(h.mutex);
    REQUIRE(h.unavailable.size() == 1);
    REQUIRE(h.unavailable[0].attempts == 0);
    REQUIRE(h.sleeps.empty());
}

TEST_CASE("Requests with invalid UTF-8 are rejected as invalid", "[bridge][validation]")
{
    Harness h;
    auto errors_before = h.dispatcher.handler_error_count();

    SECTION("In the actor")
    {
        auto r = request();
        r.actor = "al\xffice";
        h.log(r);
    }

    SECTION("In a details value")
    {
        auto r = request();
        r.details = nlohmann::json{{"method", "pass\xc3"}};
        h.log(r);
    }

    SECTION("In a details key")
    {
        auto r = request();
        r.details = nlohmann::json{{"\xed\xa0\x80", "surrogate"}};
        h.log(r);
    }

    REQUIRE(h.chain.size() == 0);
    REQUIRE(h.store->lines().empty());
    REQUIRE(h.dispatcher.handler_error_count() == errors_before);

    // The chain still accepts well-formed requests afterwards
    h.log(request());
    REQUIRE(h.chain.size() == 1);

    std::lock_guard lock(h.mutex);
    REQUIRE(h.unavailable.size() == 1);
    REQUIRE(h.unavailable[0].attempts == 0);
    REQUIRE(h.unavailable[0].error.find("UTF-8") != std::string::npos);
    REQUIRE(h.logged.size() == 1);
}

TEST_CASE("Null details are recorded as an empty object", "[bridge][validation]")
{
    Harness h;
    auto r = request();
    r.details = nullptr;
    h.log(r);

    REQUIRE(h.chain.size() == 1);
    REQUIRE(h.chain.last_entry()->details == nlohmann::json::object());
}

TEST_CASE("Bridge lifecycle", "[bridge]")
{
    Harness h;
    REQUIRE(h.bridge->running());
    REQUIRE(h.dispatcher.listener_count(kAuditLog) == 1);

    auto again = h.bridge->start();
    REQUIRE_FALSE(again.has_value());

    h.bridge->stop();
    REQUIRE_FALSE(h.bridge->running());
    REQUIRE(h.dispatcher.listener_count(kAuditLog) == 0);

    h.log(request());
    REQUIRE(h.chain.size() == 0);
}

TEST_CASE("Backoff grows geometrically", "[bridge][retry]")
{
    RetryPolicy policy;
    policy.initial_backoff = 50ms;
    REQUIRE(policy.backoff_before(1) == 0ms);
    REQUIRE(policy.backoff_before(2) == 50ms);
    REQUIRE(policy.backoff_before(3) == 100ms);
    REQUIRE(policy.backoff_before(4) == 200ms);
}

TEST_CASE("Backoff is capped for long retry sequences", "[bridge][retry]")
{
    RetryPolicy policy;
    policy.initial_backoff = 50ms;
    policy.max_backoff = 1000ms;
    REQUIRE(policy.backoff_before(6) == 800ms);
    REQUIRE(policy.backoff_before(7) == 1000ms);
    REQUIRE(policy.backoff_before(200) == 1000ms);
    REQUIRE(policy.backoff_before(4000000000u) == 1000ms);

    policy.multiplier = 10.0;
    REQUIRE(policy.backoff_before(400) == 1000ms);
}

TEST_CASE("Retry attempts are bounded", "[bridge][retry]")
{
    RetryPolicy policy;
    policy.max_attempts = 1000000;
    policy.initial_backoff = 0ms;
    Harness h(policy);

    h.store->fail_next(1000000);
    h.log(request());

    REQUIRE(h.chain.size() == 0);
    REQUIRE(h.store->failed_appends() == static_cast<int>(RetryPolicy::kMaxAttempts));

    std::lock_guard lock(h.mutex);
    REQUIRE(h.unavailable.size() == 1);
    REQUIRE(h.unavailable[0].attempts == RetryPolicy::kMaxAttempts);
}
