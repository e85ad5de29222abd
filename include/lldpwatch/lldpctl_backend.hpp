#pragma once
#include "backend.hpp"
#include "logger.hpp"

#include <lldpctl.h>

#include <array>
#include <exception>
#include <span>
#include <string>
#include <utility>
namespace NSNAME
{
class LldpctlErrorCategory : public boost::system::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "lldpctl";
    }
    std::string message(int ev) const override
    {
        return ::lldpctl_strerror(static_cast<lldpctl_error_t>(ev));
    }
};

// Stringifies the suffix so the field name always matches the constant.
#define LLDPWATCH_KEY(name)                                                    \
    KeySpec                                                                    \
    {                                                                          \
        #name, lldpctl_k_##name                                                \
    }

// Every lldpctl_k_ constant except lldpctl_k_config_*, which only apply to
// the daemon configuration atom and read null on interfaces, ports and
// chassis.
inline std::span<const KeySpec> lldpctlKeys()
{
    static const std::array keys{
        LLDPWATCH_KEY(interface_name),

        LLDPWATCH_KEY(port_name),
        LLDPWATCH_KEY(port_index),
        LLDPWATCH_KEY(port_protocol),
        LLDPWATCH_KEY(port_age),
        LLDPWATCH_KEY(port_id_subtype),
        LLDPWATCH_KEY(port_id),
        LLDPWATCH_KEY(port_descr),
        LLDPWATCH_KEY(port_hidden),
        LLDPWATCH_KEY(port_status),
        LLDPWATCH_KEY(port_chassis),
        LLDPWATCH_KEY(port_ttl),
        LLDPWATCH_KEY(port_neighbors),

        LLDPWATCH_KEY(port_dot3_mfs),
        LLDPWATCH_KEY(port_dot3_aggregid),
        LLDPWATCH_KEY(port_dot3_autoneg_support),
        LLDPWATCH_KEY(port_dot3_autoneg_enabled),
        LLDPWATCH_KEY(port_dot3_autoneg_advertised),
        LLDPWATCH_KEY(port_dot3_mautype),

        LLDPWATCH_KEY(port_dot3_power),
        LLDPWATCH_KEY(dot3_power_devicetype),
        LLDPWATCH_KEY(dot3_power_supported),
        LLDPWATCH_KEY(dot3_power_enabled),
        LLDPWATCH_KEY(dot3_power_paircontrol),
        LLDPWATCH_KEY(dot3_power_pairs),
        LLDPWATCH_KEY(dot3_power_class),
        LLDPWATCH_KEY(dot3_power_type),
        LLDPWATCH_KEY(dot3_power_source),
        LLDPWATCH_KEY(dot3_power_priority),
        LLDPWATCH_KEY(dot3_power_allocated),
        LLDPWATCH_KEY(dot3_power_requested),

        LLDPWATCH_KEY(port_vlan_pvid),
        LLDPWATCH_KEY(port_vlans),
        LLDPWATCH_KEY(vlan_id),
        LLDPWATCH_KEY(vlan_name),

        LLDPWATCH_KEY(port_ppvids),
        LLDPWATCH_KEY(ppvid_status),
        LLDPWATCH_KEY(ppvid_id),

        LLDPWATCH_KEY(port_pis),
        LLDPWATCH_KEY(pi_id),

        LLDPWATCH_KEY(chassis_index),
        LLDPWATCH_KEY(chassis_id_subtype),
        LLDPWATCH_KEY(chassis_id),
        LLDPWATCH_KEY(chassis_name),
        LLDPWATCH_KEY(chassis_descr),
        LLDPWATCH_KEY(chassis_cap_available),
        LLDPWATCH_KEY(chassis_cap_enabled),
        LLDPWATCH_KEY(chassis_mgmt),

        LLDPWATCH_KEY(chassis_med_type),
        LLDPWATCH_KEY(chassis_med_cap),
        LLDPWATCH_KEY(chassis_med_inventory_hw),
        LLDPWATCH_KEY(chassis_med_inventory_sw),
        LLDPWATCH_KEY(chassis_med_inventory_fw),
        LLDPWATCH_KEY(chassis_med_inventory_sn),
        LLDPWATCH_KEY(chassis_med_inventory_manuf),
        LLDPWATCH_KEY(chassis_med_inventory_model),
        LLDPWATCH_KEY(chassis_med_inventory_asset),

        LLDPWATCH_KEY(port_med_policies),
        LLDPWATCH_KEY(med_policy_type),
        LLDPWATCH_KEY(med_policy_unknown),
        LLDPWATCH_KEY(med_policy_tagged),
        LLDPWATCH_KEY(med_policy_vid),
        LLDPWATCH_KEY(med_policy_priority),
        LLDPWATCH_KEY(med_policy_dscp),

        LLDPWATCH_KEY(port_med_locations),
        LLDPWATCH_KEY(med_location_format),
        LLDPWATCH_KEY(med_location_geoid),
        LLDPWATCH_KEY(med_location_latitude),
        LLDPWATCH_KEY(med_location_longitude),
        LLDPWATCH_KEY(med_location_altitude),
        LLDPWATCH_KEY(med_location_altitude_unit),
        LLDPWATCH_KEY(med_location_country),
        LLDPWATCH_KEY(med_civicaddress_type),
        LLDPWATCH_KEY(med_civicaddress_value),
        LLDPWATCH_KEY(med_location_elin),
        LLDPWATCH_KEY(med_location_ca_elements),

        LLDPWATCH_KEY(port_med_power),
        LLDPWATCH_KEY(med_power_type),
        LLDPWATCH_KEY(med_power_source),
        LLDPWATCH_KEY(med_power_priority),
        LLDPWATCH_KEY(med_power_val),

        LLDPWATCH_KEY(mgmt_ip),
        LLDPWATCH_KEY(mgmt_iface_index),

        LLDPWATCH_KEY(tx_cnt),
        LLDPWATCH_KEY(rx_cnt),
        LLDPWATCH_KEY(rx_discarded_cnt),
        LLDPWATCH_KEY(rx_unrecognized_cnt),
        LLDPWATCH_KEY(ageout_cnt),
        LLDPWATCH_KEY(insert_cnt),
        LLDPWATCH_KEY(delete_cnt),

        LLDPWATCH_KEY(custom_tlvs),
        LLDPWATCH_KEY(custom_tlv),
        LLDPWATCH_KEY(custom_tlv_oui),
        LLDPWATCH_KEY(custom_tlv_oui_subtype),
        LLDPWATCH_KEY(custom_tlv_oui_info_string),
        LLDPWATCH_KEY(custom_tlv_op),
    };
    return keys;
}

#undef LLDPWATCH_KEY

class LldpctlBackend : public Backend
{
  public:
    LldpctlBackend() = default;
    explicit LldpctlBackend(std::string socket) : socket_(std::move(socket)) {}

    ConnHandle connect() override
    {
        lldpctl_conn_t* conn =
            socket_.empty()
                ? ::lldpctl_new(nullptr, nullptr, nullptr)
                : ::lldpctl_new_name(socket_.c_str(), nullptr, nullptr, nullptr);
        return reinterpret_cast<ConnHandle>(conn);
    }
    void release(ConnHandle conn) override
    {
        ::lldpctl_release(native(conn));
    }
    int lastError(ConnHandle conn) override
    {
        return ::lldpctl_last_error(native(conn));
    }
    AtomHandle interfaces(ConnHandle conn) override
    {
        return wrap(::lldpctl_get_interfaces(native(conn)));
    }
    AtomHandle port(AtomHandle interface) override
    {
        return wrap(::lldpctl_get_port(native(interface)));
    }
    const char* getString(AtomHandle atom, Key key) override
    {
        return ::lldpctl_atom_get_str(native(atom),
                                      static_cast<lldpctl_key_t>(key));
    }
    AtomHandle getAtom(AtomHandle atom, Key key) override
    {
        return wrap(
            ::lldpctl_atom_get(native(atom), static_cast<lldpctl_key_t>(key)));
    }
    CursorHandle iter(AtomHandle list) override
    {
        return reinterpret_cast<CursorHandle>(::lldpctl_atom_iter(native(list)));
    }
    CursorHandle iterNext(AtomHandle list, CursorHandle cursor) override
    {
        return reinterpret_cast<CursorHandle>(
            ::lldpctl_atom_iter_next(native(list), native(cursor)));
    }
    AtomHandle iterValue(AtomHandle list, CursorHandle cursor) override
    {
        return wrap(::lldpctl_atom_iter_value(native(list), native(cursor)));
    }
    void decRef(AtomHandle atom) override
    {
        ::lldpctl_atom_dec_ref(native(atom));
    }
    int watchCallback(ConnHandle conn, ChangeListener& listener) override
    {
        return ::lldpctl_watch_callback(native(conn), &onLldpChange, &listener);
    }
    int watch(ConnHandle conn) override
    {
        return ::lldpctl_watch(native(conn));
    }
    int unblock(ConnHandle conn) override
    {
        return ::lldpctl_watch_sync_unblock(native(conn));
    }
    void setLogCallback(LogCallback callback) override
    {
        ::lldpctl_log_callback(callback);
    }
    const boost::system::error_category& category() const override
    {
        static LldpctlErrorCategory instance;
        return instance;
    }
    std::span<const KeySpec> keys() const override
    {
        return lldpctlKeys();
    }

  private:
    static lldpctl_conn_t* native(ConnHandle conn)
    {
        return reinterpret_cast<lldpctl_conn_t*>(conn);
    }
    static lldpctl_atom_t* native(AtomHandle atom)
    {
        return reinterpret_cast<lldpctl_atom_t*>(atom);
    }
    static lldpctl_atom_iter_t* native(CursorHandle cursor)
    {
        return reinterpret_cast<lldpctl_atom_iter_t*>(cursor);
    }
    static AtomHandle wrap(lldpctl_atom_t* atom)
    {
        return reinterpret_cast<AtomHandle>(atom);
    }
    static void onLldpChange(lldpctl_conn_t*, lldpctl_change_t type,
                             lldpctl_atom_t* interface,
                             lldpctl_atom_t* neighbor, void* data)
    {
        auto* listener = static_cast<ChangeListener*>(data);
        try
        {
            switch (type)
            {
                case lldpctl_c_added:
                    listener->onChange(ChangeKind::added, wrap(interface),
                                       wrap(neighbor));
                    break;
                case lldpctl_c_deleted:
                    listener->onChange(ChangeKind::deleted, wrap(interface),
                                       wrap(neighbor));
                    break;
                case lldpctl_c_updated:
                    listener->onChange(ChangeKind::updated, wrap(interface),
                                       wrap(neighbor));
                    break;
            }
        }
        catch (const std::exception& e)
        {
            LOG_ERROR("Failed to process lldpd change: {}", e.what());
        }
    }

    std::string socket_;
};
} // namespace NSNAME
