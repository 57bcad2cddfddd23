//
//  ADBException.cpp
//  adbhub
//
//  Created on 17.05.25.
//

#include "ADBException.hpp"

std::string adb_error_description(const tihmstar::ADBException &e){
    std::string detail = e.what();
    switch (e.kind()) {
        case ADB_ERR_TOOL_NOT_FOUND:
            return "ADB executable not found. Please install Android platform-tools or set a custom path.";
        case ADB_ERR_DEVICE_NOT_FOUND:
            return "Device '" + detail + "' not found. Please check the connection.";
        case ADB_ERR_UNAUTHORIZED:
            return "Device '" + detail + "' is unauthorized. Please accept the debugging prompt on the device.";
        case ADB_ERR_OFFLINE:
            return "Device '" + detail + "' is offline. Try reconnecting it.";
        case ADB_ERR_CONNECTION_FAILED:
            return "Connection failed: " + detail;
        case ADB_ERR_PAIRING_FAILED:
            return "Pairing failed: " + detail;
        case ADB_ERR_TIMEOUT:
            return "Operation timed out";
        case ADB_ERR_PARSE_ERROR:
            return "Failed to parse output: " + detail;
        case ADB_ERR_INSTALL_FAILED:
            return "Installation failed: " + detail;
        case ADB_ERR_UNINSTALL_FAILED:
            return "Uninstall failed: " + detail;
        case ADB_ERR_APP_NOT_FOUND:
            return "App '" + detail + "' not found";
        case ADB_ERR_COMMAND_FAILED:
        case ADB_ERR_APP_ACTION_FAILED:
        default:
            return detail;
    }
}

const char *adb_error_kind_name(adb_error_kind kind) noexcept{
    switch (kind) {
        case ADB_ERR_TOOL_NOT_FOUND:    return "toolNotFound";
        case ADB_ERR_DEVICE_NOT_FOUND:  return "deviceNotFound";
        case ADB_ERR_UNAUTHORIZED:      return "unauthorized";
        case ADB_ERR_OFFLINE:           return "offline";
        case ADB_ERR_CONNECTION_FAILED: return "connectionFailed";
        case ADB_ERR_PAIRING_FAILED:    return "pairingFailed";
        case ADB_ERR_COMMAND_FAILED:    return "commandFailed";
        case ADB_ERR_TIMEOUT:           return "timeout";
        case ADB_ERR_PARSE_ERROR:       return "parseError";
        case ADB_ERR_INSTALL_FAILED:    return "installFailed";
        case ADB_ERR_UNINSTALL_FAILED:  return "uninstallFailed";
        case ADB_ERR_APP_ACTION_FAILED: return "appActionFailed";
        case ADB_ERR_APP_NOT_FOUND:     return "appNotFound";
    }
    return "unknown";
}
