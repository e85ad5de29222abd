#pragma once
#include "backend.hpp"
#include "lldp_errors.hpp"
#include "logger.hpp"

#include <exception>
namespace NSNAME
{
// Severities follow syslog numbering.
inline void logFromBackend(int severity, const char* message) noexcept
{
    if (message == nullptr)
    {
        return;
    }
    try
    {
        if (severity < 4)
        {
            LOG_ERROR("{}", message);
        }
        else if (severity == 4)
        {
            LOG_WARNING("{}", message);
        }
        else if (severity == 5)
        {
            LOG_INFO("{}", message);
        }
        else
        {
            LOG_DEBUG("{}", message);
        }
    }
    catch (const std::exception&)
    {
        // a broken sink must not abort discovery
    }
}

class Session
{
  public:
    enum class State
    {
        uninitialized,
        connected,
        released
    };

    Session(Backend& backend, ChangeListener& listener) : backend_(backend)
    {
        backend_.setLogCallback(&logFromBackend);
        conn_ = backend_.connect();
        if (conn_ == nullptr)
        {
            throw ConnectionError(make_error_code(Errc::no_connection),
                                  "failed to create lldpctl connection");
        }
        if (backend_.watchCallback(conn_, listener) != 0)
        {
            auto ec = backend_.makeErrorCode(backend_.lastError(conn_));
            releaseConnection();
            throw ConnectionError(ec, "failed to register change callback");
        }
        state_ = State::connected;
        LOG_DEBUG("Connected to lldpd");
    }
    ~Session()
    {
        releaseConnection();
    }
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    ConnHandle connection() const
    {
        return conn_;
    }
    State state() const
    {
        return state_;
    }

    // Blocks until one change was processed by the listener.
    boost::system::error_code wait()
    {
        return backend_.makeErrorCode(backend_.watch(conn_));
    }

    // Safe to call from another thread while wait() is blocked.
    void unblock()
    {
        if (backend_.unblock(conn_) != 0)
        {
            LOG_WARNING("Failed to unblock lldpd watch: {}",
                        backend_.makeErrorCode(backend_.lastError(conn_))
                            .message());
        }
    }

  private:
    void releaseConnection()
    {
        if (conn_ != nullptr)
        {
            backend_.release(conn_);
            conn_ = nullptr;
            state_ = State::released;
            LOG_DEBUG("Released lldpd connection");
        }
    }

    Backend& backend_;
    ConnHandle conn_{nullptr};
    State state_{State::uninitialized};
};
} // namespace NSNAME
