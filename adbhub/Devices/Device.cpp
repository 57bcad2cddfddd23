//
//  Device.cpp
//  adbhub
//
//  Created on 18.05.25.
//

#include "Device.hpp"

#include <algorithm>

#include <libgeneral/macros.h>

device_state Device::state() const noexcept{
    device_state best = DEVICE_STATE_UNKNOWN;
    for (auto &c : connections) {
        if (c.state < best) best = c.state; //enum is ordered from most to least usable
    }
    return best;
}

const DeviceConnection &Device::primaryConnection() const{
    retassure(connections.size(), "device '%s' has no active connection",persistentIdentity.c_str());
    for (auto &c : connections) {
        if (c.state == DEVICE_STATE_DEVICE) return c;
    }
    return connections.front();
}

const std::string &Device::transportAddress() const{
    return primaryConnection().transportAddress;
}

transport_kind Device::transportKind() const{
    return primaryConnection().kind;
}

const DeviceConnection *Device::connectionOfKind(transport_kind kind) const noexcept{
    for (auto &c : connections) {
        if (c.kind == kind) return &c;
    }
    return nullptr;
}

const DeviceConnection *Device::networkConnection() const noexcept{
    for (auto &c : connections) {
        if (c.isNetwork()) return &c;
    }
    return nullptr;
}

bool Device::hasConnection(const std::string &transportAddress) const noexcept{
    for (auto &c : connections) {
        if (c.transportAddress == transportAddress) return true;
    }
    return false;
}

bool Device::isUSBOnly() const noexcept{
    return connections.size() == 1 && connections.front().kind == TRANSPORT_USB;
}

std::string Device::displayName() const{
    if (customName.size()) return customName;
    if (model.size()) return model;
    return persistentIdentity;
}

void Device::sortConnections() noexcept{
    std::stable_sort(connections.begin(), connections.end(), [](const DeviceConnection &a, const DeviceConnection &b){
        return a.kind < b.kind;
    });
}
