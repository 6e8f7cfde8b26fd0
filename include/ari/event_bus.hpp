#pragma once

#include "types.hpp"
#include "logging.hpp"
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ari
{

    using SubscriptionId = std::uint64_t;

    /**
     * In-memory message handed to subscribers. Shared read-only by every
     * handler of one publish.
     */
    struct Event
    {
        std::string name;
        std::any payload;
        std::chrono::system_clock::time_point emitted_at;
    };

    using Handler = std::function<void(const Event &)>;

    /**
     * An event name bound to its payload type. Declare one per event:
     *
     *   inline constexpr Topic<MyPayload> kMyEvent{"my:event"};
     *
     * The typed subscribe/publish overloads only accept matching payloads.
     */
    template <typename Payload>
    struct Topic
    {
        using payload_type = Payload;
        std::string_view name;
    };

    /** Published when a handler throws or overruns the handler timeout */
    struct HandlerErrorEvent
    {
        std::string event;
        std::string error;
        SubscriptionId subscription{0};
        bool timed_out{false};
        std::string timestamp;
    };

    inline constexpr Topic<HandlerErrorEvent> kHandlerErrorTopic{"system:handler_error"};

    namespace detail
    {
        struct Registry;
    }

    /**
     * Deregistration handle returned by subscribe. Invoking it removes exactly
     * the registration it came from; further calls are no-ops, as are calls
     * made after the dispatcher was destroyed.
     */
    class Subscription
    {
    public:
        Subscription() = default;

        SubscriptionId id() const { return id_; }
        const std::string &event_name() const { return event_name_; }

        void unsubscribe() const;
        void operator()() const { unsubscribe(); }

    private:
        friend class Dispatcher;

        Subscription(std::weak_ptr<detail::Registry> registry, std::string event_name, SubscriptionId id)
            : registry_(std::move(registry)), event_name_(std::move(event_name)), id_(id) {}

        std::weak_ptr<detail::Registry> registry_;
        std::string event_name_;
        SubscriptionId id_{0};
    };

    struct DispatcherConfig
    {
        std::size_t worker_threads{4};
        std::chrono::milliseconds handler_timeout{30000}; // 0 disables
    };

    /**
     * Publish/subscribe dispatcher.
     *
     * publish() snapshots the subscriber list for the event name and schedules
     * one invocation per handler on a worker pool, then returns. Invocations for
     * one event name run on a single strand, so each handler sees events in
     * publish order and handlers of one publish run in registration order.
     * Different event names are delivered independently.
     *
     * A handler that throws is counted, logged and reported on
     * system:handler_error; delivery to the remaining handlers is unaffected.
     * A handler running longer than the timeout is counted as failed but is
     * never interrupted.
     */
    class Dispatcher
    {
    public:
        explicit Dispatcher(const DispatcherConfig &cfg = DispatcherConfig{});
        ~Dispatcher();

        Dispatcher(const Dispatcher &) = delete;
        Dispatcher &operator=(const Dispatcher &) = delete;

        Subscription subscribe(const std::string &event_name, Handler handler);

        /** Like subscribe, but the registration is consumed by the first publish that reaches it. */
        Subscription subscribe_once(const std::string &event_name, Handler handler);

        template <typename Payload, typename Fn>
        Result<Subscription> subscribe(const Topic<Payload> &topic, Fn &&fn)
        {
            return subscribe_typed<Payload>(topic, std::forward<Fn>(fn), false);
        }

        template <typename Payload, typename Fn>
        Result<Subscription> subscribe_once(const Topic<Payload> &topic, Fn &&fn)
        {
            return subscribe_typed<Payload>(topic, std::forward<Fn>(fn), true);
        }

        /** Remove one registration; no-op if it is not present */
        void unsubscribe(const std::string &event_name, SubscriptionId id);

        /** Never throws. Payloads of a typed event name must carry its registered type. */
        void publish(const std::string &event_name, std::any payload) noexcept;

        template <typename Payload>
        void publish(const Topic<Payload> &topic, std::type_identity_t<Payload> payload) noexcept
        {
            publish(std::string(topic.name), std::any(std::move(payload)));
        }

        /**
         * Future that becomes ready once every invocation scheduled by publish
         * calls made before this call has finished, successfully or not.
         * Waiting on it from inside a handler deadlocks.
         */
        std::future<void> drain();

        std::size_t listener_count(const std::string &event_name) const;

        template <typename Payload>
        std::size_t listener_count(const Topic<Payload> &topic) const
        {
            return listener_count(std::string(topic.name));
        }

        /** Remove every subscription and reset the handler error counter */
        void clear();

        /**
         * Drop the delivery strand of every event name that has no subscribers
         * and nothing in flight. The watchdog does this periodically; a name
         * that is used again simply gets a fresh strand. Returns the number of
         * names released.
         */
        std::size_t release_idle_names();

        /** Event names currently holding a delivery strand */
        std::size_t tracked_name_count() const;

        std::uint64_t handler_error_count() const { return handler_errors_.load(); }

        void reset_handler_error_count() { handler_errors_.store(0); }

        void set_handler_timeout(std::chrono::milliseconds timeout);

        std::chrono::milliseconds handler_timeout() const;

        /**
         * Stop accepting events, wait up to grace for outstanding invocations,
         * then join the workers. Idempotent.
         */
        void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    private:
        using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

        struct InFlight
        {
            std::string event;
            SubscriptionId subscription{0};
            std::chrono::steady_clock::time_point started{};
            bool running{false};
            bool timed_out{false};
        };

        struct DrainWaiter
        {
            std::uint64_t mark;
            std::promise<void> done;
        };

        template <typename Payload, typename Fn>
        Result<Subscription> subscribe_typed(const Topic<Payload> &topic, Fn &&fn, bool once)
        {
            Handler handler = [fn = std::forward<Fn>(fn)](const Event &event)
            {
                fn(std::any_cast<const Payload &>(event.payload));
            };
            return add_typed(std::string(topic.name), typeid(Payload), std::move(handler), once);
        }

        Subscription add(const std::string &event_name, Handler handler, bool once);
        Result<Subscription> add_typed(const std::string &event_name, std::type_index type, Handler handler, bool once);
        Subscription add_locked(const std::string &event_name, Handler handler, bool once);
        // Caller holds strands_mutex_
        Strand strand_for_locked(const std::string &event_name);

        void invoke(std::uint64_t ticket, const std::shared_ptr<const Event> &event,
                    SubscriptionId subscription, const Handler &handler);
        void record_fault(const std::string &event_name, SubscriptionId subscription,
                          const std::string &error, bool timed_out);
        void finish(std::uint64_t ticket);
        void release_waiters_locked();
        void watchdog_loop();

        std::shared_ptr<detail::Registry> registry_;

        boost::asio::thread_pool pool_;
        // Lock order: strands_mutex_, then registry or pending_mutex_
        mutable std::mutex strands_mutex_;
        std::unordered_map<std::string, Strand> strands_;

        mutable std::mutex pending_mutex_;
        std::condition_variable watchdog_cv_;
        std::map<std::uint64_t, InFlight> pending_;
        std::uint64_t next_ticket_{0};
        std::vector<DrainWaiter> drain_waiters_;
        std::chrono::milliseconds handler_timeout_;

        std::shared_ptr<spdlog::logger> log_;
        std::atomic<std::uint64_t> handler_errors_{0};
        std::atomic<bool> stopped_{false};
        bool watchdog_stop_{false};
        std::thread watchdog_;
    };

} // namespace ari
