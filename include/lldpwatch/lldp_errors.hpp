#pragma once
#include "backend.hpp"

#include <boost/system/system_error.hpp>

#include <string>
namespace NSNAME
{
struct ConnectionError : boost::system::system_error
{
    ConnectionError(boost::system::error_code ec, const std::string& what) :
        boost::system::system_error(ec, "Connection Error:" + what)
    {}
};

// Generic codes for failures the backend does not describe itself.
enum class Errc
{
    no_connection = 1,
};

class LldpWatchCategory : public boost::system::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "lldpwatch";
    }
    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev))
        {
            case Errc::no_connection:
                return "backend returned no connection";
        }
        return "unknown lldpwatch error";
    }
};

inline const boost::system::error_category& lldpWatchCategory()
{
    static LldpWatchCategory category;
    return category;
}

inline boost::system::error_code make_error_code(Errc e)
{
    return boost::system::error_code(static_cast<int>(e), lldpWatchCategory());
}
} // namespace NSNAME
