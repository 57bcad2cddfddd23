//
//  DeviceManager.cpp
//  adbhub
//
//  Created on 24.05.25.
//

#include "DeviceManager.hpp"
#include "../Bridge/OutputParser.hpp"
#include "../ADBException.hpp"

#include <errno.h>
#include <poll.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <set>
#include <thread>

#include <libgeneral/macros.h>

static bool same_connections(const std::vector<DeviceConnection> &a, const std::vector<DeviceConnection> &b) noexcept{
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].transportAddress != b[i].transportAddress
            || a[i].kind != b[i].kind
            || a[i].state != b[i].state
            || a[i].transportId != b[i].transportId
            || a[i].model != b[i].model
            || a[i].product != b[i].product) return false;
    }
    return true;
}

static bool same_device(const Device &a, const Device &b) noexcept{
    return a.persistentIdentity == b.persistentIdentity
        && a.customName == b.customName
        && a.model == b.model
        && a.product == b.product
        && same_connections(a.connections, b.connections);
}

const char *tcpip_outcome_description(tcpip_outcome outcome) noexcept{
    switch (outcome) {
        case TCPIP_USB_ONLY:        return "You can now disconnect USB";
        case TCPIP_RECONNECTED:     return "Reconnected on the new port";
        case TCPIP_PORT_CHANGED:    return "Port changed";
    }
    return "unknown";
}

#pragma mark DeviceManager
DeviceManager::DeviceManager(BridgeClient *bridge, HistoryStore *history, const Config &config)
: _bridge(bridge), _history(history), _identifier(bridge)
, _refreshIntervalMs(config.refreshIntervalMs)
, _missedPollsBeforeRemoval(config.missedPollsBeforeRemoval ? config.missedPollsBeforeRemoval : 1)
, _defaultTcpipPort(config.defaultTcpipPort)
, _wakePipe{-1,-1}
{
    retassure(!pipe(_wakePipe), "failed to create wake pipe: %s",strerror(errno));
}

DeviceManager::~DeviceManager(){
    info("[destroying] DeviceManager");
    stopLoop();
    std::unique_lock<std::mutex> ul(_wakeLck);
    safeClose(_wakePipe[0]);
    safeClose(_wakePipe[1]);
}

#pragma mark poll loop

bool DeviceManager::loopEvent(){
    struct pollfd pfd = {
        .fd = _wakePipe[0],
        .events = POLLIN
    };
    int pret = 0;

    pret = poll(&pfd, 1, (int)_refreshIntervalMs.load());
    if (pret < 0) {
        retassure(errno == EINTR, "poll failed: %s",strerror(errno));
        return true;
    }
    if (pfd.revents & POLLHUP) {
        debug("[DeviceManager] graceful kill requested");
        return false;
    }
    if (pfd.revents & POLLIN) {
        char c = 0;
        ssize_t didRead = read(_wakePipe[0], &c, 1);
        if (didRead == 0) return false;
        debug("[DeviceManager] woken up early");
    }

    try {
        refresh();
        _lastPollError.clear();
    } catch (tihmstar::exception &e) {
        //only log when the failure changes, the loop retries every interval
        std::string msg = e.what();
        if (msg != _lastPollError) {
            warning("[DeviceManager] device poll failed with error=%d (%s)",e.code(),e.what());
            _lastPollError = msg;
        }
    }
    return true;
}

void DeviceManager::stopAction() noexcept{
    std::unique_lock<std::mutex> ul(_wakeLck);
    safeClose(_wakePipe[1]);
}

#pragma mark reconciliation

bool DeviceManager::refresh(){
    std::unique_lock<std::mutex> ul(_refreshLck);
    std::vector<DeviceConnection> connections = _bridge->list_devices();
    bool changed = reconcile(connections);
    ul.unlock();
    if (changed) notify_change();
    return changed;
}

bool DeviceManager::reconcile(const std::vector<DeviceConnection> &connections){
    std::vector<std::string> order; //identities in first-seen order of this poll
    std::map<std::string, Device> seen;
    std::set<std::string> liveAddresses;
    std::vector<Device> oldDevices;
    std::vector<Device> newDevices;
    bool changed = false;

    {
        guardRead(_devicesGuard);
        oldDevices = _devices;
    }

    for (auto &conn : connections) {
        std::string identity;
        //a transport that stops answering stays with the device it belonged to
        for (auto &old : oldDevices) {
            if (conn.state == DEVICE_STATE_DEVICE) break;
            if (old.hasConnection(conn.transportAddress)) {
                identity = old.persistentIdentity;
                break;
            }
        }
        if (identity.empty()) identity = _identifier.identify(conn);
        liveAddresses.insert(conn.transportAddress);
        auto it = seen.find(identity);
        if (it == seen.end()) {
            order.push_back(identity);
            it = seen.emplace(identity, Device()).first;
            it->second.persistentIdentity = identity;
        }
        Device &dev = it->second;
        dev.connections.push_back(conn);
        if (dev.model.empty() && conn.model.size()) dev.model = conn.model;
        if (dev.product.empty() && conn.product.size()) dev.product = conn.product;
    }

    //existing devices keep their position and are updated in place
    for (auto &old : oldDevices) {
        auto it = seen.find(old.persistentIdentity);
        if (it == seen.end()) {
            uint32_t missed = ++_missedPolls[old.persistentIdentity];
            if (missed >= _missedPollsBeforeRemoval) {
                info("[DeviceManager] removing device '%s' after %u missed poll(s)",old.persistentIdentity.c_str(),missed);
                _missedPolls.erase(old.persistentIdentity);
                changed = true;
                continue;
            }
            newDevices.push_back(old);
            continue;
        }
        _missedPolls.erase(old.persistentIdentity);
        Device dev = old;
        dev.connections = it->second.connections;
        if (it->second.model.size()) dev.model = it->second.model;
        if (it->second.product.size()) dev.product = it->second.product;
        dev.sortConnections();
        newDevices.push_back(dev);
        seen.erase(it);
    }

    for (auto &identity : order) {
        auto it = seen.find(identity);
        if (it == seen.end()) continue;
        Device dev = it->second;
        dev.sortConnections();
        info("[DeviceManager] adding device '%s' (%s)",identity.c_str(),dev.transportAddress().c_str());
        newDevices.push_back(dev);
    }

    for (auto &dev : newDevices) {
        if (_history) {
            try {
                dev.customName = _history->custom_name(dev.persistentIdentity);
            } catch (tihmstar::exception &e) {
                warning("[DeviceManager] failed to read custom name of '%s' with error=%d",dev.persistentIdentity.c_str(),e.code());
            }
        }
        remember_address(dev);
    }

    if (!changed) {
        if (newDevices.size() != oldDevices.size()) {
            changed = true;
        } else {
            for (size_t i = 0; i < newDevices.size(); i++) {
                if (!same_device(newDevices[i], oldDevices[i])) {
                    changed = true;
                    break;
                }
            }
        }
    }

    {
        guardWrite(_devicesGuard);
        _devices = newDevices;
    }

    //cached identities only live as long as their transport address
    {
        std::set<std::string> known;
        for (auto &dev : oldDevices) {
            for (auto &c : dev.connections) known.insert(c.transportAddress);
        }
        for (auto &addr : known) {
            if (liveAddresses.find(addr) == liveAddresses.end()) _identifier.forget(addr);
        }
    }

    return changed;
}

void DeviceManager::remember_address(const Device &dev) noexcept{
    if (!_history) return;
    for (auto &c : dev.connections) {
        if (c.kind != TRANSPORT_WIFI || c.state != DEVICE_STATE_DEVICE) continue;
        try {
            std::string addr = c.ip + ":" + std::to_string(c.port);
            if (_history->last_known_address(dev.persistentIdentity) != addr) {
                _history->set_last_known_address(dev.persistentIdentity, addr);
            }
        } catch (tihmstar::exception &e) {
            warning("[DeviceManager] failed to store address of '%s' with error=%d (%s)",dev.persistentIdentity.c_str(),e.code(),e.what());
        }
        return;
    }
}

void DeviceManager::notify_change(){
    std::function<void()> cb;
    {
        std::unique_lock<std::mutex> ul(_callbackLck);
        cb = _onChange;
    }
    if (cb) cb();
}

#pragma mark accessors

std::vector<Device> DeviceManager::devices() const{
    guardRead(_devicesGuard);
    return _devices;
}

bool DeviceManager::device_for(const std::string &identityOrAddress, Device &out) const{
    guardRead(_devicesGuard);
    for (auto &d : _devices) {
        if (d.persistentIdentity == identityOrAddress || d.hasConnection(identityOrAddress)) {
            out = d;
            return true;
        }
    }
    return false;
}

#pragma mark orchestration

void DeviceManager::connect(const std::string &address){
    info("[DeviceManager] connecting to '%s'",address.c_str());
    _bridge->connect(address);
    refresh();
}

void DeviceManager::disconnect(const std::string &identity){
    Device dev;
    size_t disconnected = 0;
    if (!device_for(identity, dev)) {
        retcustomerror(ADBException_deviceNotFound, "%s",identity.c_str());
    }
    for (auto &c : dev.connections) {
        if (!c.isNetwork()) continue;
        _bridge->disconnect(c.transportAddress);
        disconnected++;
    }
    if (!disconnected) {
        warning("[DeviceManager] '%s' has no network connection to disconnect",identity.c_str());
        return;
    }
    refresh();
}

std::string DeviceManager::connect_discovered(DiscoveryManager *discovery, const std::string &host){
    DiscoveredDevice dd;
    std::string address;

    retassure(discovery, "connect_discovered needs a DiscoveryManager");
    if (!discovery->device_for_host(host, dd) || !dd.canConnect()) {
        retcustomerror(ADBException_connectionFailed, "No connection address available for %s",host.c_str());
    }
    address = dd.connectAddress();

    discovery->set_connecting(host, true);
    cleanup([&]{
        try {
            discovery->set_connecting(host, false);
        } catch (tihmstar::exception &e) {
            error("failed to clear connecting state of %s with error=%d",host.c_str(),e.code());
        }
    });
    connect(address);
    return address;
}

std::string DeviceManager::pair_and_connect(DiscoveryManager *discovery, const std::string &host, const std::string &code){
    DiscoveredDevice dd;
    std::string address;

    retassure(discovery, "pair_and_connect needs a DiscoveryManager");
    if (!discovery->device_for_host(host, dd) || !dd.canPair()) {
        retcustomerror(ADBException_pairingFailed, "No pairing service advertised by %s",host.c_str());
    }

    _bridge->pair(dd.pairingAddress(), code);
    discovery->mark_paired(host);
    try {
        refresh();
    } catch (tihmstar::exception &e) {
        warning("[DeviceManager] refresh after pairing failed with error=%d (%s)",e.code(),e.what());
    }

    //the device needs a moment before it accepts connections after pairing
    std::this_thread::sleep_for(std::chrono::milliseconds(PAIR_CONNECT_GRACE_MS));

    discovery->sync();
    if (discovery->device_for_host(host, dd) && dd.canConnect()) {
        address = dd.connectAddress();
    } else {
        address = host + ":" + std::to_string(_defaultTcpipPort);
    }

    discovery->set_connecting(host, true);
    cleanup([&]{
        try {
            discovery->set_connecting(host, false);
        } catch (tihmstar::exception &e) {
            error("failed to clear connecting state of %s with error=%d",host.c_str(),e.code());
        }
    });
    connect(address);
    return address;
}

std::string DeviceManager::pair_and_connect(const std::string &pairingAddress, const std::string &code){
    std::string host = pairingAddress;
    std::string address;
    size_t colon = host.rfind(':');
    if (colon != std::string::npos) host = host.substr(0, colon);
    if (!adb_is_ipv4_address(host)) {
        retcustomerror(ADBException_pairingFailed, "'%s' is not an ipv4 pairing address",pairingAddress.c_str());
    }

    _bridge->pair(pairingAddress, code);
    try {
        refresh();
    } catch (tihmstar::exception &e) {
        warning("[DeviceManager] refresh after pairing failed with error=%d (%s)",e.code(),e.what());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(PAIR_CONNECT_GRACE_MS));

    address = host + ":" + std::to_string(_defaultTcpipPort);
    connect(address);
    return address;
}

tcpip_outcome DeviceManager::enable_tcpip(const std::string &identity, uint16_t port){
    Device dev;
    std::string ip;
    if (!port) port = _defaultTcpipPort;
    if (!device_for(identity, dev)) {
        retcustomerror(ADBException_deviceNotFound, "%s",identity.c_str());
    }

    for (auto &c : dev.connections) {
        if (c.kind == TRANSPORT_WIFI && c.ip.size()) {
            ip = c.ip;
            break;
        }
    }

    _bridge->enable_tcpip(dev.transportAddress(), port);
    info("[DeviceManager] enabled tcpip on port %u for '%s'",port,dev.persistentIdentity.c_str());

    if (dev.isUSBOnly()) return TCPIP_USB_ONLY;
    if (ip.empty()) return TCPIP_PORT_CHANGED;

    //the old network session goes stale once the device listens on the new port
    disconnect(dev.persistentIdentity);
    std::this_thread::sleep_for(std::chrono::milliseconds(TCPIP_RECONNECT_WAIT_MS));
    connect(ip + ":" + std::to_string(port));
    return TCPIP_RECONNECTED;
}

void DeviceManager::set_custom_name(const std::string &identity, const std::string &name){
    retassure(_history, "no history store to save custom names");
    _history->set_custom_name(identity, name);
    {
        guardWrite(_devicesGuard);
        for (auto &d : _devices) {
            if (d.persistentIdentity == identity) d.customName = name;
        }
    }
    notify_change();
}

void DeviceManager::set_refresh_interval(uint32_t intervalMs){
    retassure(intervalMs > 0, "refresh interval must not be zero");
    _refreshIntervalMs = intervalMs;
    std::unique_lock<std::mutex> ul(_wakeLck);
    if (_wakePipe[1] != -1) {
        char c = 0;
        if (write(_wakePipe[1], &c, 1) != 1) {
            debug("[DeviceManager] failed to wake poll loop: %s",strerror(errno));
        }
    }
}

size_t DeviceManager::reconnect_last_devices(){
    std::map<std::string,std::string> addrs;
    size_t connected = 0;
    if (!_history) return 0;

    addrs = _history->last_known_addresses();
    for (auto &e : addrs) {
        std::string host = e.second;
        size_t colon = host.rfind(':');
        if (colon == std::string::npos) continue;
        host = host.substr(0, colon);
        if (!adb_is_ipv4_address(host)) continue;
        try {
            _bridge->connect(e.second);
            connected++;
            info("[DeviceManager] reconnected '%s' at %s",e.first.c_str(),e.second.c_str());
        } catch (tihmstar::ADBException &ex) {
            warning("[DeviceManager] failed to reconnect '%s' at %s: %s",e.first.c_str(),e.second.c_str(),adb_error_description(ex).c_str());
        }
    }
    if (connected) {
        try {
            refresh();
        } catch (tihmstar::exception &ex) {
            warning("[DeviceManager] refresh after reconnect failed with error=%d (%s)",ex.code(),ex.what());
        }
    }
    return connected;
}

void DeviceManager::set_change_callback(std::function<void()> cb){
    std::unique_lock<std::mutex> ul(_callbackLck);
    _onChange = cb;
}
