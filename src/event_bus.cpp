#include "ari/event_bus.hpp"
#include "ari/logging.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <format>
#include <unordered_set>
#include <format>

namespace ari
{

    namespace detail
    {
        struct Entry
        {
            SubscriptionId id;
            Handler handler;
            bool once;
        };

        using HandlerList = std::vector<Entry>;

        /**
         * Subscriber registry. Handler lists are copy-on-write: mutations build
         * a new list, so a snapshot taken by publish never changes under it.
         */
        struct Registry
        {
            std::mutex mutex;
            std::unordered_map<std::string, std::shared_ptr<const HandlerList>> handlers;
            std::unordered_map<std::string, std::type_index> payload_types;
            SubscriptionId next_id{1};

            // Caller holds mutex
            void remove_locked(const std::string &event_name, SubscriptionId id)
            {
                auto it = handlers.find(event_name);
                if (it == handlers.end())
                    return;

                const auto &current = *it->second;
                auto pos = std::find_if(current.begin(), current.end(),
                                        [id](const Entry &e) { return e.id == id; });
                if (pos == current.end())
                    return;

                if (current.size() == 1)
                {
                    // The type binding lives as long as the name has subscribers
                    handlers.erase(it);
                    payload_types.erase(event_name);
                    return;
                }

                auto next = std::make_shared<HandlerList>();
                next->reserve(current.size() - 1);
                for (const auto &e : current)
                {
                    if (e.id != id)
                        next->push_back(e);
                }
                it->second = std::move(next);
            }

            void remove(const std::string &event_name, SubscriptionId id)
            {
                std::lock_guard lock(mutex);
                remove_locked(event_name, id);
            }
        };
    } // namespace detail

    namespace
    {
        std::chrono::milliseconds watchdog_period(std::chrono::milliseconds timeout)
        {
            using namespace std::chrono_literals;
            if (timeout.count() <= 0)
                return 250ms;
            return std::clamp(timeout / 4, std::chrono::milliseconds(1), std::chrono::milliseconds(250));
        }
    } // namespace

    void Subscription::unsubscribe() const
    {
        if (auto registry = registry_.lock())
        {
            registry->remove(event_name_, id_);
        }
    }

    Dispatcher::Dispatcher(const DispatcherConfig &cfg)
        : registry_(std::make_shared<detail::Registry>()),
          pool_(std::max<std::size_t>(cfg.worker_threads, 1)),
          handler_timeout_(cfg.handler_timeout),
          log_(logging::get("dispatcher"))
    {
        watchdog_ = std::thread([this] { watchdog_loop(); });
    }

    Dispatcher::~Dispatcher()
    {
        shutdown();
    }

    Subscription Dispatcher::subscribe(const std::string &event_name, Handler handler)
    {
        return add(event_name, std::move(handler), false);
    }

    Subscription Dispatcher::subscribe_once(const std::string &event_name, Handler handler)
    {
        return add(event_name, std::move(handler), true);
    }

    Result<Subscription> Dispatcher::add_typed(const std::string &event_name, std::type_index type,
                                               Handler handler, bool once)
    {
        std::lock_guard lock(registry_->mutex);
        auto [it, inserted] = registry_->payload_types.try_emplace(event_name, type);
        if (!inserted && it->second != type)
        {
            return std::unexpected(AriError::invalid_input(
                std::format("Event '{}' is already bound to a different payload type", event_name)));
        }
        return add_locked(event_name, std::move(handler), once);
    }

    Subscription Dispatcher::add(const std::string &event_name, Handler handler, bool once)
    {
        std::lock_guard lock(registry_->mutex);
        return add_locked(event_name, std::move(handler), once);
    }

    Subscription Dispatcher::add_locked(const std::string &event_name, Handler handler, bool once)
    {
        SubscriptionId id = registry_->next_id++;

        auto next = std::make_shared<detail::HandlerList>();
        if (auto it = registry_->handlers.find(event_name); it != registry_->handlers.end())
        {
            *next = *it->second;
        }
        next->push_back(detail::Entry{id, std::move(handler), once});
        registry_->handlers[event_name] = std::move(next);

        return Subscription(registry_, event_name, id);
    }

    void Dispatcher::unsubscribe(const std::string &event_name, SubscriptionId id)
    {
        registry_->remove(event_name, id);
    }

    std::size_t Dispatcher::listener_count(const std::string &event_name) const
    {
        std::lock_guard lock(registry_->mutex);
        auto it = registry_->handlers.find(event_name);
        return it == registry_->handlers.end() ? 0 : it->second->size();
    }

    void Dispatcher::clear()
    {
        {
            std::lock_guard lock(registry_->mutex);
            registry_->handlers.clear();
            registry_->payload_types.clear();
        }
        handler_errors_.store(0);
    }

    std::size_t Dispatcher::release_idle_names()
    {
        std::lock_guard strands_lock(strands_mutex_);
        if (strands_.empty())
            return 0;

        // publish needs strands_mutex_ to pick up a strand, so nothing new can
        // be scheduled between these checks and the erase
        std::unordered_set<std::string> busy;
        {
            std::lock_guard lock(registry_->mutex);
            for (const auto &[name, list] : registry_->handlers)
                busy.insert(name);
        }
        {
            std::lock_guard lock(pending_mutex_);
            for (const auto &[ticket, flight] : pending_)
                busy.insert(flight.event);
        }

        auto released = std::erase_if(strands_, [&busy](const auto &item)
                                      { return !busy.contains(item.first); });
        if (released > 0)
            log_->debug("Released delivery state for {} idle event name(s)", released);
        return released;
    }

    std::size_t Dispatcher::tracked_name_count() const
    {
        std::lock_guard lock(strands_mutex_);
        return strands_.size();
    }

    void Dispatcher::set_handler_timeout(std::chrono::milliseconds timeout)
    {
        {
            std::lock_guard lock(pending_mutex_);
            handler_timeout_ = timeout;
        }
        watchdog_cv_.notify_all();
    }

    std::chrono::milliseconds Dispatcher::handler_timeout() const
    {
        std::lock_guard lock(pending_mutex_);
        return handler_timeout_;
    }

    Dispatcher::Strand Dispatcher::strand_for_locked(const std::string &event_name)
    {
        auto it = strands_.find(event_name);
        if (it == strands_.end())
        {
            it = strands_.emplace(event_name, boost::asio::make_strand(pool_)).first;
        }
        return it->second;
    }

    void Dispatcher::publish(const std::string &event_name, std::any payload) noexcept
    {
        auto &log = log_;
        try
        {
            if (stopped_.load())
            {
                log->warn("Dropping event '{}' published after shutdown", event_name);
                return;
            }

            detail::HandlerList snapshot;
            {
                std::lock_guard lock(registry_->mutex);
                if (auto bound = registry_->payload_types.find(event_name);
                    bound != registry_->payload_types.end() && payload.has_value() &&
                    std::type_index(payload.type()) != bound->second)
                {
                    log->error("Dropping event '{}': payload type does not match the registered topic", event_name);
                    return;
                }

                auto it = registry_->handlers.find(event_name);
                if (it == registry_->handlers.end())
                    return;

                auto current = it->second;
                snapshot = *current;

                // Once-registrations are claimed by this publish
                for (const auto &entry : *current)
                {
                    if (entry.once)
                        registry_->remove_locked(event_name, entry.id);
                }
            }

            auto event = std::make_shared<const Event>(Event{
                event_name,
                std::move(payload),
                std::chrono::system_clock::now()});

            std::lock_guard strands_lock(strands_mutex_);
            auto strand = strand_for_locked(event_name);
            for (auto &entry : snapshot)
            {
                std::uint64_t ticket;
                {
                    std::lock_guard lock(pending_mutex_);
                    ticket = next_ticket_++;
                    pending_.emplace(ticket, InFlight{event_name, entry.id});
                }

                boost::asio::post(strand,
                                  [this, ticket, event, id = entry.id, handler = std::move(entry.handler)]()
                                  {
                                      invoke(ticket, event, id, handler);
                                  });
            }
        }
        catch (const std::exception &e)
        {
            log->error("Failed to publish '{}': {}", event_name, e.what());
        }
        catch (...)
        {
            log->error("Failed to publish '{}': non-standard exception", event_name);
        }
    }

    void Dispatcher::invoke(std::uint64_t ticket, const std::shared_ptr<const Event> &event,
                            SubscriptionId subscription, const Handler &handler)
    {
        {
            std::lock_guard lock(pending_mutex_);
            auto it = pending_.find(ticket);
            if (it != pending_.end())
            {
                it->second.running = true;
                it->second.started = std::chrono::steady_clock::now();
            }
        }

        std::optional<std::string> failure;
        try
        {
            handler(*event);
        }
        catch (const std::bad_any_cast &)
        {
            failure = "payload type does not match the subscribed topic";
        }
        catch (const std::exception &e)
        {
            failure = e.what();
        }
        catch (...)
        {
            failure = "non-standard exception";
        }

        if (failure)
        {
            bool already_counted = false;
            {
                std::lock_guard lock(pending_mutex_);
                auto it = pending_.find(ticket);
                already_counted = it != pending_.end() && it->second.timed_out;
            }
            if (!already_counted)
            {
                handler_errors_.fetch_add(1);
                record_fault(event->name, subscription, *failure, false);
            }
        }

        finish(ticket);
    }

    void Dispatcher::record_fault(const std::string &event_name, SubscriptionId subscription,
                                  const std::string &error, bool timed_out)
    {
        auto &log = log_;
        if (timed_out)
            log->warn("Handler {} for '{}' exceeded the handler timeout", subscription, event_name);
        else
            log->error("Error in handler {} for '{}': {}", subscription, event_name, error);

        // Faults in these handlers are not re-published, or one broken
        // listener would feed itself.
        if (event_name == kHandlerErrorTopic.name || event_name == "audit:log")
            return;

        publish(kHandlerErrorTopic, HandlerErrorEvent{
                                        event_name,
                                        error,
                                        subscription,
                                        timed_out,
                                        now_iso8601()});
    }

    void Dispatcher::finish(std::uint64_t ticket)
    {
        std::lock_guard lock(pending_mutex_);
        pending_.erase(ticket);
        release_waiters_locked();
    }

    void Dispatcher::release_waiters_locked()
    {
        // Timed-out invocations have settled as far as drain is concerned
        std::uint64_t oldest = next_ticket_;
        for (const auto &[ticket, flight] : pending_)
        {
            if (!flight.timed_out)
            {
                oldest = ticket;
                break;
            }
        }
        auto ready = std::partition(drain_waiters_.begin(), drain_waiters_.end(),
                                    [oldest](const DrainWaiter &w) { return w.mark > oldest; });
        for (auto it = ready; it != drain_waiters_.end(); ++it)
        {
            it->done.set_value();
        }
        drain_waiters_.erase(ready, drain_waiters_.end());
    }

    std::future<void> Dispatcher::drain()
    {
        std::lock_guard lock(pending_mutex_);
        DrainWaiter waiter{next_ticket_, {}};
        auto future = waiter.done.get_future();
        drain_waiters_.push_back(std::move(waiter));
        release_waiters_locked();
        return future;
    }

    void Dispatcher::watchdog_loop()
    {
        std::unique_lock lock(pending_mutex_);
        while (!watchdog_stop_)
        {
            watchdog_cv_.wait_for(lock, watchdog_period(handler_timeout_));
            if (watchdog_stop_)
                break;

            lock.unlock();
            release_idle_names();
            lock.lock();
            if (watchdog_stop_)
                break;
            if (handler_timeout_.count() <= 0)
                continue;

            auto now = std::chrono::steady_clock::now();
            std::vector<std::pair<std::string, SubscriptionId>> overdue;
            for (auto &[ticket, flight] : pending_)
            {
                if (flight.running && !flight.timed_out && now - flight.started >= handler_timeout_)
                {
                    flight.timed_out = true;
                    handler_errors_.fetch_add(1);
                    overdue.emplace_back(flight.event, flight.subscription);
                }
            }

            if (overdue.empty())
                continue;
            release_waiters_locked();

            lock.unlock();
            for (const auto &[event_name, subscription] : overdue)
            {
                record_fault(event_name, subscription, "handler timeout exceeded", true);
            }
            lock.lock();
        }
    }

    void Dispatcher::shutdown(std::chrono::milliseconds grace)
    {
        if (stopped_.exchange(true))
            return;

        auto pending = drain();
        if (pending.wait_for(grace) != std::future_status::ready)
        {
            log_->warn("Shutting down with handler invocations still outstanding");
        }

        {
            std::lock_guard lock(pending_mutex_);
            watchdog_stop_ = true;
        }
        watchdog_cv_.notify_all();
        if (watchdog_.joinable())
            watchdog_.join();

        pool_.stop();
        pool_.join();
    }

} // namespace ari
