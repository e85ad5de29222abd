#pragma once
#include "backend.hpp"
#include "event_handler.hpp"
#include "lldp_errors.hpp"
#include "logger.hpp"
#include "record_decoder.hpp"
#include "session.hpp"
#include "watcher_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>
namespace NSNAME
{
// After a reconnect every known neighbour is delivered again as onAdd().
class Watcher : private ChangeListener
{
  public:
    enum class State
    {
        stopped,
        running,
        stopping
    };

    Watcher(Backend& backend, EventHandler& handler,
            RetryPolicy retry = RetryPolicy{}) :
        backend_(backend), handler_(handler), decoder_(backend), retry_(retry)
    {}
    // Must not run on the watcher thread: a handler may call stop(), but
    // destroying the Watcher from inside a handler self-joins and terminates.
    ~Watcher()
    {
        stop();
        join();
    }
    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;
    Watcher(Watcher&&) = delete;
    Watcher& operator=(Watcher&&) = delete;

    Watcher& withRetryPolicy(RetryPolicy retry)
    {
        retry_ = retry;
        return *this;
    }

    void start()
    {
        if (thread_.joinable())
        {
            if (state_ != State::stopped)
            {
                LOG_WARNING("Watcher already started");
                return;
            }
            thread_.join();
        }
        state_ = State::running;
        thread_ = std::jthread([this](std::stop_token token) { run(token); });
    }

    // Only requests the stop, so it is safe to call from a handler.
    void stop()
    {
        auto expected = State::running;
        state_.compare_exchange_strong(expected, State::stopping);
        thread_.request_stop();
    }

    void join()
    {
        if (thread_.joinable() &&
            thread_.get_id() != std::this_thread::get_id())
        {
            thread_.join();
        }
    }

    State state() const
    {
        return state_;
    }
    bool running() const
    {
        return state_ == State::running;
    }

  private:
    void run(std::stop_token token)
    {
        LOG_INFO("LLDP watcher started");
        token_ = token;
        Backoff backoff(retry_);
        while (!token.stop_requested())
        {
            try
            {
                Session session(backend_, *this);
                load(session, token);
                if (watch(session, token))
                {
                    backoff.reset();
                }
            }
            catch (const ConnectionError& e)
            {
                LOG_ERROR("{}", e.what());
            }
            if (token.stop_requested())
            {
                break;
            }
            auto delay = backoff.next();
            LOG_INFO("Reconnecting to lldpd in {} ms", delay.count());
            sleepFor(delay, token);
        }
        state_ = State::stopped;
        LOG_INFO("LLDP watcher stopped");
    }

    // Replays the current neighbour table as additions.
    void load(Session& session, const std::stop_token& token)
    {
        for (const auto& interface : decoder_.interfaces(session.connection()))
        {
            for (const auto& neighbor : interface.neighbors())
            {
                if (token.stop_requested())
                {
                    return;
                }
                dispatch(ChangeKind::added, interface, neighbor);
            }
        }
    }

    // Returns whether at least one change came through before the wait
    // ended.
    bool watch(Session& session, const std::stop_token& token)
    {
        std::stop_callback interrupt(token, [&session] { session.unblock(); });
        bool delivered = false;
        while (!token.stop_requested())
        {
            auto ec = session.wait();
            if (ec)
            {
                if (token.stop_requested())
                {
                    LOG_DEBUG("Watch interrupted: {}", ec.message());
                    break;
                }
                LOG_ERROR("Failed to watch lldpd: {}", ec.message());
                break;
            }
            delivered = true;
        }
        return delivered;
    }

    void onChange(ChangeKind kind, AtomHandle local, AtomHandle remote) override
    {
        if (token_.stop_requested())
        {
            return;
        }
        auto localRecord = decoder_.interface(local, false);
        auto remoteRecord = decoder_.decode(remote, RecordKind::port);
        dispatch(kind, localRecord, remoteRecord);
    }

    void dispatch(ChangeKind kind, const Interface& local, const Record& remote)
    {
        LOG_DEBUG("Neighbor {} {} on {}", remote.text("chassis_name").value_or("?"),
                  toString(kind), local.name().value_or("?"));
        try
        {
            switch (kind)
            {
                case ChangeKind::added:
                    handler_.onAdd(local, remote);
                    break;
                case ChangeKind::deleted:
                    handler_.onDelete(local, remote);
                    break;
                case ChangeKind::updated:
                    handler_.onUpdate(local, remote);
                    break;
            }
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Exception in {} handler: {}", toString(kind), e.what());
        }
    }

    void sleepFor(std::chrono::milliseconds delay, const std::stop_token& token)
    {
        std::unique_lock lock(sleepMutex_);
        sleepCondition_.wait_for(lock, token, delay, [] { return false; });
    }

    Backend& backend_;
    EventHandler& handler_;
    RecordDecoder decoder_;
    RetryPolicy retry_;
    std::atomic<State> state_{State::stopped};
    std::stop_token token_;
    std::mutex sleepMutex_;
    std::condition_variable_any sleepCondition_;
    std::jthread thread_;
};
} // namespace NSNAME
