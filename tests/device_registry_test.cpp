#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <chrono>

#include "device_registry.hpp"
#include "event_bus.hpp"

using namespace std::chrono_literals;

static upnp::device make_device(const std::string& id, upnp::clock::time_point updated, const std::string& room = "Kitchen")
{
    upnp::device dev;
    dev.id = id;
    dev.info_url = "http://192.168.1.20:1400/xml/device_description.xml#" + id;
    dev.room_name = room;
    dev.last_updated = updated;
    return dev;
}

class device_registry_test : public ::testing::Test
{
protected:

    void SetUp() override
    {
        m_bus.subscribe(events::topic::devices_changed, [this](const nlohmann::json& roster) {
            m_rosters.push_back(roster);
        });
    }

    const upnp::clock::time_point m_t0 {std::chrono::hours {24}};

    events::event_bus m_bus;

    upnp::device_registry m_registry {m_bus, std::chrono::minutes {5}};

    std::vector<nlohmann::json> m_rosters;
};

TEST_F(device_registry_test, new_device_is_published)
{
    EXPECT_TRUE(m_registry.upsert(make_device("A", m_t0)));

    ASSERT_EQ(m_rosters.size(), 1u);
    ASSERT_EQ(m_rosters.back().size(), 1u);
    EXPECT_EQ(m_rosters.back()[0]["id"], "A");
    EXPECT_EQ(m_rosters.back()[0]["roomName"], "Kitchen");
    EXPECT_TRUE(m_registry.contains("A"));
    EXPECT_EQ(m_registry.size(), 1u);
}

TEST_F(device_registry_test, known_device_is_replaced_silently)
{
    m_registry.upsert(make_device("A", m_t0, "Kitchen"));
    EXPECT_FALSE(m_registry.upsert(make_device("A", m_t0 + 1s, "Office")));

    EXPECT_EQ(m_rosters.size(), 1u);
    EXPECT_EQ(m_registry.size(), 1u);
    EXPECT_EQ(m_registry.find("A")->room_name, "Office");
}

TEST_F(device_registry_test, last_write_wins_in_either_order)
{
    upnp::device_registry other {m_bus};

    m_registry.upsert(make_device("A", m_t0, "old"));
    m_registry.upsert(make_device("A", m_t0 + 1s, "new"));

    other.upsert(make_device("A", m_t0 + 1s, "new"));
    other.upsert(make_device("A", m_t0, "old"));

    EXPECT_EQ(m_registry.find("A")->room_name, "new");
    EXPECT_EQ(other.find("A")->room_name, "new");
    EXPECT_EQ(m_registry.find("A")->last_updated, other.find("A")->last_updated);
}

TEST_F(device_registry_test, snapshot_keeps_insertion_order)
{
    m_registry.upsert(make_device("C", m_t0));
    m_registry.upsert(make_device("A", m_t0));
    m_registry.upsert(make_device("B", m_t0));
    m_registry.upsert(make_device("A", m_t0 + 1s));

    std::vector<upnp::device> devices = m_registry.snapshot();
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].id, "C");
    EXPECT_EQ(devices[1].id, "A");
    EXPECT_EQ(devices[2].id, "B");
}

TEST_F(device_registry_test, remove_publishes_only_on_change)
{
    m_registry.upsert(make_device("A", m_t0));
    m_rosters.clear();

    EXPECT_FALSE(m_registry.remove("unknown"));
    EXPECT_TRUE(m_rosters.empty());

    EXPECT_TRUE(m_registry.remove("A"));
    ASSERT_EQ(m_rosters.size(), 1u);
    EXPECT_TRUE(m_rosters.back().empty());
    EXPECT_FALSE(m_registry.find("A"));
}

TEST_F(device_registry_test, sweep_removes_at_exactly_max_lifetime)
{
    m_registry.upsert(make_device("A", m_t0));
    m_rosters.clear();

    std::vector<upnp::decayed_device> decayed = m_registry.sweep_decayed(m_t0 + 5min);

    ASSERT_EQ(decayed.size(), 1u);
    EXPECT_EQ(decayed[0].id, "A");
    EXPECT_EQ(decayed[0].info_url, make_device("A", m_t0).info_url);
    EXPECT_EQ(m_registry.size(), 0u);
    EXPECT_EQ(m_rosters.size(), 1u);
}

TEST_F(device_registry_test, sweep_keeps_device_one_millisecond_younger)
{
    m_registry.upsert(make_device("A", m_t0));
    m_rosters.clear();

    EXPECT_TRUE(m_registry.sweep_decayed(m_t0 + 5min - 1ms).empty());
    EXPECT_TRUE(m_registry.contains("A"));
    EXPECT_TRUE(m_rosters.empty());
}

TEST_F(device_registry_test, sweep_publishes_once_for_many_devices)
{
    m_registry.upsert(make_device("A", m_t0));
    m_registry.upsert(make_device("B", m_t0 + 1s));
    m_registry.upsert(make_device("C", m_t0 + 10min));
    m_rosters.clear();

    std::vector<upnp::decayed_device> decayed = m_registry.sweep_decayed(m_t0 + 6min);

    ASSERT_EQ(decayed.size(), 2u);
    EXPECT_EQ(decayed[0].id, "A");
    EXPECT_EQ(decayed[1].id, "B");
    ASSERT_EQ(m_rosters.size(), 1u);
    ASSERT_EQ(m_rosters.back().size(), 1u);
    EXPECT_EQ(m_rosters.back()[0]["id"], "C");
}

TEST_F(device_registry_test, default_lifetime_is_five_minutes)
{
    upnp::device_registry registry {m_bus};

    EXPECT_EQ(registry.max_lifetime(), std::chrono::minutes {5});
}

TEST_F(device_registry_test, publish_roster_sends_current_state)
{
    m_registry.upsert(make_device("A", m_t0));
    m_rosters.clear();

    m_registry.publish_roster();

    ASSERT_EQ(m_rosters.size(), 1u);
    EXPECT_EQ(m_rosters.back()[0]["infoUrl"], make_device("A", m_t0).info_url);
}
