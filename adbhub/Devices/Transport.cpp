//
//  Transport.cpp
//  adbhub
//
//  Created on 18.05.25.
//

#include "Transport.hpp"

const char *transport_kind_name(transport_kind kind) noexcept{
    switch (kind) {
        case TRANSPORT_USB:             return "usb";
        case TRANSPORT_WIFI:            return "wifi";
        case TRANSPORT_WIRELESS_DEBUG:  return "wireless-debug";
    }
    return "unknown";
}

const char *device_state_name(device_state state) noexcept{
    switch (state) {
        case DEVICE_STATE_DEVICE:       return "device";
        case DEVICE_STATE_UNAUTHORIZED: return "unauthorized";
        case DEVICE_STATE_OFFLINE:      return "offline";
        default:                        return "unknown";
    }
}

device_state device_state_from_string(const std::string &str) noexcept{
    if (str == "device") return DEVICE_STATE_DEVICE;
    if (str == "unauthorized") return DEVICE_STATE_UNAUTHORIZED;
    if (str == "offline") return DEVICE_STATE_OFFLINE;
    return DEVICE_STATE_UNKNOWN;
}
