#pragma once
#include "record.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <functional>
#include <utility>
namespace NSNAME
{
namespace net = boost::asio;

struct EventHandler
{
    virtual ~EventHandler() = default;
    virtual void onAdd(const Interface& /*local*/, const Record& /*remote*/) {}
    virtual void onDelete(const Interface& /*local*/, const Record& /*remote*/)
    {}
    virtual void onUpdate(const Interface& /*local*/, const Record& /*remote*/)
    {}
};

struct CallbackHandler : EventHandler
{
    using Callback = std::function<void(const Interface&, const Record&)>;

    Callback added;
    Callback deleted;
    Callback updated;

    CallbackHandler& withOnAdd(Callback cb)
    {
        added = std::move(cb);
        return *this;
    }
    CallbackHandler& withOnDelete(Callback cb)
    {
        deleted = std::move(cb);
        return *this;
    }
    CallbackHandler& withOnUpdate(Callback cb)
    {
        updated = std::move(cb);
        return *this;
    }
    void onAdd(const Interface& local, const Record& remote) override
    {
        if (added)
        {
            added(local, remote);
        }
    }
    void onDelete(const Interface& local, const Record& remote) override
    {
        if (deleted)
        {
            deleted(local, remote);
        }
    }
    void onUpdate(const Interface& local, const Record& remote) override
    {
        if (updated)
        {
            updated(local, remote);
        }
    }
};

// Copies the records; the target must outlive every posted event.
class ExecutorHandler : public EventHandler
{
  public:
    ExecutorHandler(net::any_io_executor executor, EventHandler& target) :
        executor_(std::move(executor)), target_(target)
    {}
    void onAdd(const Interface& local, const Record& remote) override
    {
        post(&EventHandler::onAdd, local, remote);
    }
    void onDelete(const Interface& local, const Record& remote) override
    {
        post(&EventHandler::onDelete, local, remote);
    }
    void onUpdate(const Interface& local, const Record& remote) override
    {
        post(&EventHandler::onUpdate, local, remote);
    }

  private:
    using Method = void (EventHandler::*)(const Interface&, const Record&);
    void post(Method method, Interface local, Record remote)
    {
        net::post(executor_, [&target = target_, method,
                              local = std::move(local),
                              remote = std::move(remote)]() {
            (target.*method)(local, remote);
        });
    }

    net::any_io_executor executor_;
    EventHandler& target_;
};
} // namespace NSNAME
