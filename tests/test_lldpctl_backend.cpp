#include <lldpwatch/lldpctl_backend.hpp>
#include <lldpwatch/record_decoder.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string_view>

using namespace lldpwatch;

namespace
{
bool hasKey(std::span<const KeySpec> keys, std::string_view name)
{
    return std::any_of(keys.begin(), keys.end(),
                       [name](const KeySpec& k) { return k.name == name; });
}
} // namespace

TEST(LldpctlBackendTest, KeyTableCoversNestedLists)
{
    LldpctlBackend backend;
    auto keys = backend.keys();
    EXPECT_TRUE(hasKey(keys, "interface_name"));
    EXPECT_TRUE(hasKey(keys, "port_neighbors"));
    EXPECT_TRUE(hasKey(keys, "chassis_mgmt"));
    EXPECT_TRUE(hasKey(keys, "chassis_cap_enabled"));
    EXPECT_NO_THROW(RecordDecoder{backend});
}

TEST(LldpctlBackendTest, KeyTableCoversEveryAttributeGroup)
{
    LldpctlBackend backend;
    auto keys = backend.keys();
    for (std::string_view name :
         {"port_status", "port_ttl", "port_dot3_mfs",
          "port_dot3_autoneg_support", "port_dot3_autoneg_enabled",
          "port_dot3_mautype", "dot3_power_class", "port_vlan_pvid",
          "vlan_name", "ppvid_id", "pi_id", "chassis_med_type",
          "chassis_med_cap", "chassis_med_inventory_sw", "med_policy_vid",
          "med_location_country", "med_power_val", "mgmt_iface_index",
          "tx_cnt", "rx_cnt", "ageout_cnt", "custom_tlvs",
          "custom_tlv_oui_info_string"})
    {
        EXPECT_TRUE(hasKey(keys, name)) << name;
    }
}

TEST(LldpctlBackendTest, KeyTableHasUniqueAttributeKeysOnly)
{
    LldpctlBackend backend;
    std::set<std::string_view> names;
    std::set<Key> values;
    for (const auto& spec : backend.keys())
    {
        EXPECT_TRUE(names.insert(spec.name).second) << spec.name;
        EXPECT_TRUE(values.insert(spec.key).second) << spec.name;
        EXPECT_FALSE(spec.name.starts_with("config_")) << spec.name;
    }
}

TEST(LldpctlBackendTest, ErrorsUseLldpctlMessages)
{
    LldpctlBackend backend;
    EXPECT_STREQ(backend.category().name(), "lldpctl");
    EXPECT_FALSE(backend.makeErrorCode(0));
    auto ec = backend.makeErrorCode(LLDPCTL_ERR_CANNOT_CONNECT);
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec.message(), lldpctl_strerror(LLDPCTL_ERR_CANNOT_CONNECT));
}
