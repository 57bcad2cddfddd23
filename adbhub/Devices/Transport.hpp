//
//  Transport.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef Transport_hpp
#define Transport_hpp

#include <stdint.h>
#include <string>

enum transport_kind{
    TRANSPORT_USB = 0,
    TRANSPORT_WIFI,
    TRANSPORT_WIRELESS_DEBUG
};

enum device_state{
    DEVICE_STATE_DEVICE = 0,
    DEVICE_STATE_UNAUTHORIZED,
    DEVICE_STATE_OFFLINE,
    DEVICE_STATE_UNKNOWN
};

/*
 One line of `adb devices -l`.
 The same physical device shows up once per transport it is reachable through.
 */
struct DeviceConnection{
    std::string transportAddress;
    transport_kind kind;
    device_state state;
    std::string ip;         //wifi only
    uint16_t port;          //wifi only
    std::string transportId;
    std::string model;
    std::string product;

    DeviceConnection() : kind(TRANSPORT_USB), state(DEVICE_STATE_UNKNOWN), port(0) {}

    bool isNetwork() const noexcept {return kind != TRANSPORT_USB;}
};

const char *transport_kind_name(transport_kind kind) noexcept;
const char *device_state_name(device_state state) noexcept;
device_state device_state_from_string(const std::string &str) noexcept;

#endif /* Transport_hpp */
