#pragma once
#include "name_space.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
namespace NSNAME
{
// Fields the backend had no value for are absent.
class Record
{
  public:
    using List = std::vector<Record>;
    using Nested = std::shared_ptr<const Record>;
    using Value = std::variant<std::string, List, Nested>;
    using Fields = std::map<std::string, Value, std::less<>>;

    static constexpr std::uint32_t REPEATER = 0x02;
    static constexpr std::uint32_t BRIDGE = 0x04;
    static constexpr std::uint32_t WLAN = 0x08;
    static constexpr std::uint32_t ROUTER = 0x10;

    void set(std::string name, std::string text)
    {
        fields_.insert_or_assign(std::move(name), Value(std::move(text)));
    }
    void set(std::string name, List list)
    {
        fields_.insert_or_assign(std::move(name), Value(std::move(list)));
    }
    void set(std::string name, Record record)
    {
        fields_.insert_or_assign(
            std::move(name),
            Value(std::make_shared<const Record>(std::move(record))));
    }
    bool contains(std::string_view name) const
    {
        return fields_.find(name) != fields_.end();
    }
    std::optional<std::string> text(std::string_view name) const
    {
        auto it = fields_.find(name);
        if (it == fields_.end())
        {
            return std::nullopt;
        }
        if (const auto* value = std::get_if<std::string>(&it->second))
        {
            return *value;
        }
        return std::nullopt;
    }
    const List& list(std::string_view name) const
    {
        static const List empty;
        auto it = fields_.find(name);
        if (it == fields_.end())
        {
            return empty;
        }
        if (const auto* value = std::get_if<List>(&it->second))
        {
            return *value;
        }
        return empty;
    }
    const Record& nested(std::string_view name) const
    {
        static const Record empty;
        auto it = fields_.find(name);
        if (it == fields_.end())
        {
            return empty;
        }
        if (const auto* value = std::get_if<Nested>(&it->second))
        {
            return **value;
        }
        return empty;
    }
    const Fields& fields() const
    {
        return fields_;
    }
    std::size_t size() const
    {
        return fields_.size();
    }
    bool empty() const
    {
        return fields_.empty();
    }

    // Bitmask of chassis_cap_enabled, 0 when absent or not a number.
    std::uint32_t capabilities() const
    {
        auto value = text("chassis_cap_enabled");
        if (!value || value->empty())
        {
            return 0;
        }
        char* end = nullptr;
        auto mask = std::strtoul(value->c_str(), &end, 0);
        if (end == nullptr || *end != '\0')
        {
            return 0;
        }
        return static_cast<std::uint32_t>(mask);
    }
    bool repeaterEnabled() const
    {
        return enabled(REPEATER);
    }
    bool bridgeEnabled() const
    {
        return enabled(BRIDGE);
    }
    bool wlanEnabled() const
    {
        return enabled(WLAN);
    }
    bool routerEnabled() const
    {
        return enabled(ROUTER);
    }

    nlohmann::json toJson() const
    {
        nlohmann::json js = nlohmann::json::object();
        for (const auto& [name, value] : fields_)
        {
            if (const auto* text = std::get_if<std::string>(&value))
            {
                js[name] = *text;
                continue;
            }
            if (const auto* record = std::get_if<Nested>(&value))
            {
                js[name] = (*record)->toJson();
                continue;
            }
            auto array = nlohmann::json::array();
            for (const auto& item : std::get<List>(value))
            {
                array.push_back(item.toJson());
            }
            js[name] = std::move(array);
        }
        return js;
    }
    std::string toString() const
    {
        return toJson().dump();
    }

  private:
    bool enabled(std::uint32_t flag) const
    {
        return (capabilities() & flag) != 0;
    }

    Fields fields_;
};

// Interface attributes plus the nested "port" record, which carries the
// neighbour list.
class Interface : public Record
{
  public:
    Interface() = default;
    explicit Interface(Record attributes, Record port = {}) :
        Record(std::move(attributes))
    {
        if (!port.empty())
        {
            set("port", std::move(port));
        }
    }
    const Record& port() const
    {
        return nested("port");
    }
    const List& neighbors() const
    {
        return port().list("port_neighbors");
    }
    std::optional<std::string> name() const
    {
        return text("interface_name");
    }
};
} // namespace NSNAME
