#include <gtest/gtest.h>

#include "Manager/DiscoveryManager.hpp"
#include "FakeServiceBrowser.hpp"
#include "MemoryHistoryStore.hpp"

#include <atomic>
#include <string>

namespace {

DiscoveryEvent resolved(const std::string &name, service_type type, const std::string &host, uint16_t port)
{
    return FakeServiceBrowser::resolved(name, type, host, port);
}

DiscoveryEvent removed(const std::string &name, service_type type)
{
    return FakeServiceBrowser::removed(name, type);
}

} // namespace

TEST(DiscoveryManagerTest, ResolvedServicesShowUpAfterSync)
{
    FakeServiceBrowser browser;
    MemoryHistoryStore history;
    DiscoveryManager discovery(&browser, &history);
    std::atomic<int> changes{ 0 };
    discovery.set_change_callback([&] { changes++; });

    discovery.start_scanning();
    auto sink = browser.sink();
    ASSERT_TRUE(sink);
    sink(resolved("adb-R58", SERVICE_TLS_CONNECT, "192.168.1.5", 41234));
    sink(resolved("adb-R58", SERVICE_TLS_PAIRING, "192.168.1.5", 37000));
    discovery.sync();

    EXPECT_TRUE(discovery.is_scanning());
    EXPECT_EQ(discovery.scan_error(), "");
    auto devices = discovery.devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].services.size(), 2u);
    EXPECT_GE(changes.load(), 3);

    DiscoveredDevice found;
    EXPECT_TRUE(discovery.device_for_host("192.168.1.5", found));
    EXPECT_EQ(found.pairingAddress(), "192.168.1.5:37000");
    EXPECT_FALSE(discovery.device_for_host("192.168.1.6", found));

    sink(removed("adb-R58", SERVICE_TLS_PAIRING));
    discovery.sync();
    ASSERT_TRUE(discovery.device_for_host("192.168.1.5", found));
    EXPECT_FALSE(found.canPair());
}

TEST(DiscoveryManagerTest, LateEventsAfterStopAreIgnored)
{
    FakeServiceBrowser browser;
    DiscoveryManager discovery(&browser, nullptr);

    discovery.start_scanning();
    auto sink = browser.sink();
    sink(resolved("adb-R58", SERVICE_LEGACY, "192.168.1.5", 5555));
    discovery.sync();

    discovery.stop_scanning();
    sink(resolved("adb-late", SERVICE_LEGACY, "192.168.1.77", 5555));
    discovery.sync();

    EXPECT_FALSE(discovery.is_scanning());
    EXPECT_EQ(browser.stops.load(), 1);
    auto devices = discovery.devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].host, "192.168.1.5");
}

TEST(DiscoveryManagerTest, RestartClearsAndIgnoresThePreviousSession)
{
    FakeServiceBrowser browser;
    DiscoveryManager discovery(&browser, nullptr);

    discovery.start_scanning();
    auto oldSink = browser.sink();
    oldSink(resolved("adb-old", SERVICE_LEGACY, "192.168.1.5", 5555));
    discovery.sync();
    ASSERT_EQ(discovery.devices().size(), 1u);

    discovery.start_scanning();
    EXPECT_EQ(browser.starts.load(), 2);
    EXPECT_EQ(browser.stops.load(), 1);
    oldSink(resolved("adb-old", SERVICE_LEGACY, "192.168.1.6", 5555));
    browser.sink()(resolved("adb-new", SERVICE_LEGACY, "192.168.1.7", 5555));
    discovery.sync();

    auto devices = discovery.devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].host, "192.168.1.7");
}

TEST(DiscoveryManagerTest, BrowseFailureIsReported)
{
    FakeServiceBrowser browser;
    browser.failStart = true;
    DiscoveryManager discovery(&browser, nullptr);

    EXPECT_NO_THROW(discovery.start_scanning());
    discovery.sync();

    EXPECT_EQ(discovery.scan_error(), "Discovery failed: daemon not running");

    browser.failStart = false;
    discovery.start_scanning();
    discovery.sync();
    EXPECT_EQ(discovery.scan_error(), "");
}

TEST(DiscoveryManagerTest, FailureEventFromBrowser)
{
    FakeServiceBrowser browser;
    DiscoveryManager discovery(&browser, nullptr);

    discovery.start_scanning();
    DiscoveryEvent ev(DiscoveryEvent::BROWSE_FAILED);
    ev.message = "client disconnected";
    browser.sink()(ev);
    discovery.sync();

    EXPECT_EQ(discovery.scan_error(), "Discovery failed: client disconnected");
}

TEST(DiscoveryManagerTest, OverlaysApplyThroughTheQueue)
{
    FakeServiceBrowser browser;
    DiscoveryManager discovery(&browser, nullptr);
    DiscoveredDevice found;

    discovery.start_scanning();
    browser.sink()(resolved("adb-R58", SERVICE_TLS_PAIRING, "192.168.1.5", 37000));
    discovery.set_connecting("192.168.1.5", true);
    discovery.mark_paired("192.168.1.5");
    discovery.sync();

    ASSERT_TRUE(discovery.device_for_host("192.168.1.5", found));
    EXPECT_TRUE(found.isConnecting);
    EXPECT_TRUE(found.isPaired);

    discovery.set_connecting("192.168.1.5", false);
    discovery.sync();
    ASSERT_TRUE(discovery.device_for_host("192.168.1.5", found));
    EXPECT_FALSE(found.isConnecting);
}

TEST(DiscoveryManagerTest, StopKeepsTheLastResults)
{
    FakeServiceBrowser browser;
    DiscoveryManager discovery(&browser, nullptr);

    discovery.stop_scanning();
    EXPECT_EQ(browser.stops.load(), 0);

    discovery.start_scanning();
    browser.sink()(resolved("adb-R58", SERVICE_LEGACY, "192.168.1.5", 5555));
    discovery.sync();
    discovery.stop_scanning();
    discovery.sync();

    EXPECT_FALSE(discovery.is_scanning());
    EXPECT_EQ(discovery.devices().size(), 1u);
}
