#pragma once
#include "atom_range.hpp"
#include "backend.hpp"
#include "logger.hpp"
#include "record.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
namespace NSNAME
{
enum class RecordKind
{
    atom,
    port,
    ports,
    interface
};

struct SubType
{
    RecordKind owner;
    std::string_view key;
    RecordKind nested;
};

inline constexpr std::array<SubType, 2> SUB_TYPES{{
    {RecordKind::port, "chassis_mgmt", RecordKind::atom},
    {RecordKind::ports, "port_neighbors", RecordKind::port},
}};

// decode() borrows its handle and releases everything it acquires itself.
class RecordDecoder
{
    struct Field
    {
        std::string name;
        Key key;
        std::optional<RecordKind> nested;
    };
    using Schema = std::vector<Field>;

  public:
    explicit RecordDecoder(Backend& backend) : backend_(backend)
    {
        auto keys = backend_.keys();
        for (const auto& subType : SUB_TYPES)
        {
            auto found =
                std::any_of(keys.begin(), keys.end(), [&](const KeySpec& k) {
                    return k.name == subType.key;
                });
            if (!found)
            {
                throw std::invalid_argument(
                    "Backend key table lacks list key " +
                    std::string(subType.key));
            }
        }
        for (std::size_t kind = 0; kind < schemas_.size(); ++kind)
        {
            for (const auto& spec : keys)
            {
                schemas_[kind].push_back(
                    Field{std::string(spec.name), spec.key,
                          nestedKind(static_cast<RecordKind>(kind), spec.name)});
            }
        }
    }
    RecordDecoder(const RecordDecoder&) = delete;
    RecordDecoder& operator=(const RecordDecoder&) = delete;

    Record decode(AtomHandle atom, RecordKind kind) const
    {
        Record record;
        for (const auto& field : schema(kind))
        {
            if (field.nested)
            {
                record.set(field.name, decodeList(atom, field.key, *field.nested));
                continue;
            }
            const char* text = backend_.getString(atom, field.key);
            if (text != nullptr)
            {
                record.set(field.name, std::string(text));
            }
        }
        return record;
    }

    // withPort is false while the connection is busy watching, where the
    // backend cannot serve the extra port request.
    Interface interface(AtomHandle atom, bool withPort = true) const
    {
        auto attributes = decode(atom, RecordKind::interface);
        if (!withPort)
        {
            return Interface(std::move(attributes));
        }
        AtomRef port(backend_, backend_.port(atom));
        if (!port)
        {
            LOG_DEBUG("No port for interface {}",
                      attributes.text("interface_name").value_or("?"));
            return Interface(std::move(attributes));
        }
        return Interface(std::move(attributes),
                         decode(port.get(), RecordKind::ports));
    }

    std::vector<Interface> interfaces(ConnHandle conn) const
    {
        std::vector<Interface> result;
        AtomRef list(backend_, backend_.interfaces(conn));
        if (!list)
        {
            auto ec = backend_.makeErrorCode(backend_.lastError(conn));
            if (ec)
            {
                LOG_WARNING("Failed to get interfaces: {}", ec.message());
            }
            return result;
        }
        for (AtomHandle item : AtomRange(backend_, list.get()))
        {
            result.push_back(interface(item));
        }
        return result;
    }

  private:
    static std::optional<RecordKind> nestedKind(RecordKind owner,
                                                std::string_view key)
    {
        for (const auto& subType : SUB_TYPES)
        {
            if (subType.owner == owner && subType.key == key)
            {
                return subType.nested;
            }
        }
        return std::nullopt;
    }
    const Schema& schema(RecordKind kind) const
    {
        return schemas_[static_cast<std::size_t>(kind)];
    }
    Record::List decodeList(AtomHandle atom, Key key, RecordKind kind) const
    {
        Record::List items;
        AtomRef list(backend_, backend_.getAtom(atom, key));
        if (!list)
        {
            return items;
        }
        for (AtomHandle item : AtomRange(backend_, list.get()))
        {
            items.push_back(decode(item, kind));
        }
        return items;
    }

    Backend& backend_;
    std::array<Schema, 4> schemas_;
};
} // namespace NSNAME
