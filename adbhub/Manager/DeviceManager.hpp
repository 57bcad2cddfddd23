//
//  DeviceManager.hpp
//  adbhub
//
//  Created on 24.05.25.
//

#ifndef DeviceManager_hpp
#define DeviceManager_hpp

#include "DeviceIdentifier.hpp"
#include "DiscoveryManager.hpp"
#include "../Bridge/BridgeClient.hpp"
#include "../Devices/Device.hpp"
#include "../sysconf/HistoryStore.hpp"
#include "../sysconf/sysconf.hpp"

#include <libgeneral/Manager.hpp>
#include <libgeneral/GuardAccess.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#define PAIR_CONNECT_GRACE_MS   500
#define TCPIP_RECONNECT_WAIT_MS 500

enum tcpip_outcome{
    TCPIP_USB_ONLY = 0,     //device can be unplugged and connected manually
    TCPIP_RECONNECTED,      //network session was moved to the new port
    TCPIP_PORT_CHANGED      //no known network address to reconnect to
};

const char *tcpip_outcome_description(tcpip_outcome outcome) noexcept;

/*
 Polls the bridge every refresh interval once startLoop() was called.
 The first poll happens one interval after start, call refresh() for an immediate one.
 */
class DeviceManager : public tihmstar::Manager{
    BridgeClient *_bridge; //not owned
    HistoryStore *_history; //not owned, may be null
    DeviceIdentifier _identifier;
    std::atomic<uint32_t> _refreshIntervalMs;
    uint32_t _missedPollsBeforeRemoval;
    uint16_t _defaultTcpipPort;

    std::mutex _wakeLck;
    int _wakePipe[2];

    std::mutex _refreshLck;
    std::map<std::string, uint32_t> _missedPolls; //identity -> consecutive polls without a transport
    std::string _lastPollError;

    mutable tihmstar::GuardAccess _devicesGuard;
    std::vector<Device> _devices;

    std::mutex _callbackLck;
    std::function<void()> _onChange;

    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

    bool reconcile(const std::vector<DeviceConnection> &connections);
    void remember_address(const Device &dev) noexcept;
    void notify_change();

public:
    DeviceManager(BridgeClient *bridge, HistoryStore *history, const Config &config);
    virtual ~DeviceManager() override;

    /*
     Queries the device list once and reconciles it.
     Never runs concurrently with another refresh.
     Returns true if the device set changed.
     */
    bool refresh();

    std::vector<Device> devices() const;
    bool device_for(const std::string &identityOrAddress, Device &out) const;

    void connect(const std::string &address);
    void disconnect(const std::string &identity);

    /*
     Pairs with the pairing service of a discovered host, then connects to it.
     Returns the address that was connected to.
     */
    std::string pair_and_connect(DiscoveryManager *discovery, const std::string &host, const std::string &code);
    std::string pair_and_connect(const std::string &pairingAddress, const std::string &code);
    std::string connect_discovered(DiscoveryManager *discovery, const std::string &host);

    tcpip_outcome enable_tcpip(const std::string &identity, uint16_t port = 0);

    void set_custom_name(const std::string &identity, const std::string &name);
    void set_refresh_interval(uint32_t intervalMs);
    uint32_t refresh_interval() const noexcept {return _refreshIntervalMs;}

    /*
     Tries every last known ip:port from history, failures are logged and skipped.
     Returns the number of successful connects.
     */
    size_t reconnect_last_devices();

    void set_change_callback(std::function<void()> cb);
};

#endif /* DeviceManager_hpp */
