//
//  DeviceIdentifier.cpp
//  adbhub
//
//  Created on 24.05.25.
//

#include "DeviceIdentifier.hpp"
#include "../ADBException.hpp"

#include <libgeneral/macros.h>

DeviceIdentifier::DeviceIdentifier(BridgeClient *bridge)
: _bridge(bridge)
{
    retassure(_bridge, "DeviceIdentifier needs a BridgeClient");
}

std::string DeviceIdentifier::provisional_identity(const DeviceConnection &conn){
    const std::string &addr = conn.transportAddress;
    switch (conn.kind) {
        case TRANSPORT_WIFI:
            return "net:" + conn.ip;

        case TRANSPORT_WIRELESS_DEBUG:
            //adb-<serial>-<suffix>._adb-tls-connect._tcp
            if (addr.rfind("adb-", 0) == 0) {
                size_t end = addr.find('-', 4);
                if (end == std::string::npos) end = addr.find('.', 4);
                if (end != std::string::npos && end > 4) return addr.substr(4, end-4);
            }
            return addr;

        default:
            return addr;
    }
}

std::string DeviceIdentifier::composite_identity(const std::string &brand, const std::string &model, const DeviceConnection &conn){
    if (brand.empty() && model.empty()) return provisional_identity(conn);
    return brand + "-" + model + "-" + (conn.isNetwork() ? "net" : "usb");
}

std::string DeviceIdentifier::identify(const DeviceConnection &conn){
    std::map<std::string,std::string> props;
    std::string identity;

    //a known transport keeps its identity while it is offline or unauthorized
    {
        std::unique_lock<std::mutex> ul(_cacheLck);
        auto it = _cache.find(conn.transportAddress);
        if (it != _cache.end()) return it->second;
    }

    if (conn.state != DEVICE_STATE_DEVICE) {
        return provisional_identity(conn);
    }

    try {
        props = _bridge->get_properties(conn.transportAddress, {PROP_SERIALNO, PROP_MODEL, PROP_BRAND});
    } catch (tihmstar::ADBException &e) {
        warning("[DeviceIdentifier] failed to query '%s' with error=%d (%s), using provisional identity",
                conn.transportAddress.c_str(), e.code(), e.what());
        return provisional_identity(conn);
    }

    identity = props[PROP_SERIALNO];
    if (identity.empty()) {
        identity = composite_identity(props[PROP_BRAND], props[PROP_MODEL], conn);
    }
    debug("[DeviceIdentifier] '%s' is '%s'",conn.transportAddress.c_str(),identity.c_str());

    {
        std::unique_lock<std::mutex> ul(_cacheLck);
        _cache[conn.transportAddress] = identity;
    }
    return identity;
}

bool DeviceIdentifier::is_cached(const std::string &transportAddress){
    std::unique_lock<std::mutex> ul(_cacheLck);
    return _cache.find(transportAddress) != _cache.end();
}

void DeviceIdentifier::forget(const std::string &transportAddress){
    std::unique_lock<std::mutex> ul(_cacheLck);
    _cache.erase(transportAddress);
}

void DeviceIdentifier::forget_all(){
    std::unique_lock<std::mutex> ul(_cacheLck);
    _cache.clear();
}
