#pragma once
#include "name_space.hpp"

#include <boost/system/error_code.hpp>

#include <span>
#include <string_view>
namespace NSNAME
{
// Opaque handles owned by the backend. Atoms are reference counted.
struct Atom;
struct Connection;
struct Cursor;
using AtomHandle = Atom*;
using ConnHandle = Connection*;
using CursorHandle = Cursor*;
using Key = int;

enum class ChangeKind
{
    added,
    deleted,
    updated
};

inline const char* toString(ChangeKind kind)
{
    switch (kind)
    {
        case ChangeKind::added:
            return "added";
        case ChangeKind::deleted:
            return "deleted";
        case ChangeKind::updated:
            return "updated";
    }
    return "unknown";
}

struct KeySpec
{
    std::string_view name;
    Key key;
};

// Called from inside Backend::watch(); the handles die with the call.
struct ChangeListener
{
    virtual ~ChangeListener() = default;
    virtual void onChange(ChangeKind kind, AtomHandle local,
                          AtomHandle remote) = 0;
};

using LogCallback = void (*)(int severity, const char* message);

// AtomHandles returned here are new references, given back with decRef().
class Backend
{
  public:
    virtual ~Backend() = default;

    virtual ConnHandle connect() = 0;
    virtual void release(ConnHandle conn) = 0;
    virtual int lastError(ConnHandle conn) = 0;

    virtual AtomHandle interfaces(ConnHandle conn) = 0;
    virtual AtomHandle port(AtomHandle interface) = 0;

    virtual const char* getString(AtomHandle atom, Key key) = 0;
    virtual AtomHandle getAtom(AtomHandle atom, Key key) = 0;

    virtual CursorHandle iter(AtomHandle list) = 0;
    virtual CursorHandle iterNext(AtomHandle list, CursorHandle cursor) = 0;
    virtual AtomHandle iterValue(AtomHandle list, CursorHandle cursor) = 0;
    virtual void decRef(AtomHandle atom) = 0;

    virtual int watchCallback(ConnHandle conn, ChangeListener& listener) = 0;
    virtual int watch(ConnHandle conn) = 0;
    virtual int unblock(ConnHandle conn) = 0;

    virtual void setLogCallback(LogCallback callback) = 0;

    virtual const boost::system::error_category& category() const = 0;
    virtual std::span<const KeySpec> keys() const = 0;

    boost::system::error_code makeErrorCode(int code) const
    {
        return boost::system::error_code(code, category());
    }
};
} // namespace NSNAME
