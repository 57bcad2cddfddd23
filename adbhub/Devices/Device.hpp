//
//  Device.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef Device_hpp
#define Device_hpp

#include "Transport.hpp"

#include <string>
#include <vector>

/*
 One physical device, however many transports it is currently reachable through.
 persistentIdentity is assigned once and never changes.
 */
struct Device{
    std::string persistentIdentity;
    std::vector<DeviceConnection> connections; //usb first, then wifi, then wireless-debug
    std::string customName;
    std::string model;
    std::string product;

    device_state state() const noexcept;
    const DeviceConnection &primaryConnection() const;
    const std::string &transportAddress() const;
    transport_kind transportKind() const;

    const DeviceConnection *connectionOfKind(transport_kind kind) const noexcept;
    const DeviceConnection *networkConnection() const noexcept;
    bool hasConnection(const std::string &transportAddress) const noexcept;
    bool isUSBOnly() const noexcept;

    std::string displayName() const;
    void sortConnections() noexcept;
};

#endif /* Device_hpp */
