#include <gtest/gtest.h>

#include "Devices/Device.hpp"
#include "Devices/DiscoveredDevice.hpp"

#include <libgeneral/exception.hpp>

#include <string>

namespace {

DeviceConnection connection(const std::string &address, transport_kind kind, device_state state)
{
    DeviceConnection c;
    c.transportAddress = address;
    c.kind = kind;
    c.state = state;
    return c;
}

} // namespace

TEST(DeviceTest, StateIsTheMostUsableConnection)
{
    Device d;
    d.persistentIdentity = "R58";
    d.connections.push_back(connection("R58", TRANSPORT_USB, DEVICE_STATE_OFFLINE));
    d.connections.push_back(connection("192.168.1.5:5555", TRANSPORT_WIFI, DEVICE_STATE_DEVICE));

    EXPECT_EQ(d.state(), DEVICE_STATE_DEVICE);
    EXPECT_EQ(d.transportAddress(), "192.168.1.5:5555");
    EXPECT_EQ(d.transportKind(), TRANSPORT_WIFI);
    EXPECT_FALSE(d.isUSBOnly());
}

TEST(DeviceTest, PrimaryFallsBackToFirstConnection)
{
    Device d;
    d.connections.push_back(connection("R58", TRANSPORT_USB, DEVICE_STATE_UNAUTHORIZED));
    EXPECT_EQ(d.state(), DEVICE_STATE_UNAUTHORIZED);
    EXPECT_EQ(d.transportAddress(), "R58");
    EXPECT_TRUE(d.isUSBOnly());
}

TEST(DeviceTest, NoConnectionHasNoPrimary)
{
    Device d;
    d.persistentIdentity = "gone";
    EXPECT_EQ(d.state(), DEVICE_STATE_UNKNOWN);
    EXPECT_THROW(d.primaryConnection(), tihmstar::exception);
}

TEST(DeviceTest, SortConnectionsIsStableByKind)
{
    Device d;
    d.connections.push_back(connection("adb-R58-x._adb-tls-connect._tcp", TRANSPORT_WIRELESS_DEBUG, DEVICE_STATE_DEVICE));
    d.connections.push_back(connection("192.168.1.5:5555", TRANSPORT_WIFI, DEVICE_STATE_DEVICE));
    d.connections.push_back(connection("192.168.1.5:5556", TRANSPORT_WIFI, DEVICE_STATE_DEVICE));
    d.connections.push_back(connection("R58", TRANSPORT_USB, DEVICE_STATE_DEVICE));

    d.sortConnections();

    ASSERT_EQ(d.connections.size(), 4u);
    EXPECT_EQ(d.connections[0].transportAddress, "R58");
    EXPECT_EQ(d.connections[1].transportAddress, "192.168.1.5:5555");
    EXPECT_EQ(d.connections[2].transportAddress, "192.168.1.5:5556");
    EXPECT_EQ(d.connections[3].kind, TRANSPORT_WIRELESS_DEBUG);

    EXPECT_EQ(d.connectionOfKind(TRANSPORT_WIFI)->transportAddress, "192.168.1.5:5555");
    EXPECT_EQ(d.networkConnection()->transportAddress, "192.168.1.5:5555");
    EXPECT_TRUE(d.hasConnection("192.168.1.5:5556"));
    EXPECT_FALSE(d.hasConnection("192.168.1.5:5557"));
}

TEST(DeviceTest, DisplayNamePrecedence)
{
    Device d;
    d.persistentIdentity = "google-Pixel 5-usb";
    EXPECT_EQ(d.displayName(), "google-Pixel 5-usb");
    d.model = "Pixel 5";
    EXPECT_EQ(d.displayName(), "Pixel 5");
    d.customName = "Test phone";
    EXPECT_EQ(d.displayName(), "Test phone");
}

TEST(DiscoveredDeviceTest, ServiceTypeNames)
{
    service_type t = SERVICE_LEGACY;
    EXPECT_STREQ(service_type_dnssd_name(SERVICE_TLS_PAIRING), "_adb-tls-pairing._tcp");
    EXPECT_TRUE(service_type_from_dnssd_name("_adb-tls-connect._tcp.local.", t));
    EXPECT_EQ(t, SERVICE_TLS_CONNECT);
    EXPECT_TRUE(service_type_from_dnssd_name("_adb._tcp", t));
    EXPECT_EQ(t, SERVICE_LEGACY);
    EXPECT_FALSE(service_type_from_dnssd_name("_http._tcp", t));
}

TEST(DiscoveredDeviceTest, ConnectPrefersTlsOverLegacy)
{
    DiscoveredDevice d;
    d.host = "192.168.1.5";
    d.services.push_back({ SERVICE_TLS_CONNECT, 41234 });
    d.services.push_back({ SERVICE_LEGACY, 5555 });

    EXPECT_TRUE(d.canConnect());
    EXPECT_FALSE(d.canPair());
    EXPECT_EQ(d.connectAddress(), "192.168.1.5:41234");
    EXPECT_EQ(d.pairingAddress(), "");
    EXPECT_EQ(d.statusText(), "Ready to connect");
    EXPECT_EQ(d.serviceTypesDisplay(), "Wireless Debug • Legacy ADB");
}

TEST(DiscoveredDeviceTest, PairingOnlyHost)
{
    DiscoveredDevice d;
    d.host = "192.168.1.7";
    d.services.push_back({ SERVICE_TLS_PAIRING, 37000 });

    EXPECT_FALSE(d.canConnect());
    EXPECT_TRUE(d.canPair());
    EXPECT_EQ(d.connectAddress(), "");
    EXPECT_EQ(d.pairingAddress(), "192.168.1.7:37000");
    EXPECT_EQ(d.displayAddress(), "192.168.1.7:37000");
    EXPECT_EQ(d.statusText(), "Ready to pair");
}

TEST(DiscoveredDeviceTest, EqualityCoversOverlays)
{
    DiscoveredDevice a;
    a.host = "192.168.1.5";
    a.services.push_back({ SERVICE_LEGACY, 5555 });
    DiscoveredDevice b = a;
    EXPECT_TRUE(a == b);
    b.isConnecting = true;
    EXPECT_FALSE(a == b);
    b = a;
    b.services[0].port = 5556;
    EXPECT_FALSE(a == b);
}
