//
//  ADBException.hpp
//  adbhub
//
//  Created on 17.05.25.
//

#ifndef ADBException_hpp
#define ADBException_hpp

#include <libgeneral/exception.hpp>
#include <string>

enum adb_error_kind{
    ADB_ERR_TOOL_NOT_FOUND = 1,
    ADB_ERR_DEVICE_NOT_FOUND,
    ADB_ERR_UNAUTHORIZED,
    ADB_ERR_OFFLINE,
    ADB_ERR_CONNECTION_FAILED,
    ADB_ERR_PAIRING_FAILED,
    ADB_ERR_COMMAND_FAILED,
    ADB_ERR_TIMEOUT,
    ADB_ERR_PARSE_ERROR,
    ADB_ERR_INSTALL_FAILED,
    ADB_ERR_UNINSTALL_FAILED,
    ADB_ERR_APP_ACTION_FAILED,
    ADB_ERR_APP_NOT_FOUND
};

namespace tihmstar {

class ADBException : public tihmstar::exception {
public:
    using tihmstar::exception::exception;
    virtual adb_error_kind kind() const noexcept = 0;
};

#pragma mark custom catch exceptions
class ADBException_toolNotFound : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_TOOL_NOT_FOUND;}
};

class ADBException_deviceNotFound : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_DEVICE_NOT_FOUND;}
};

class ADBException_unauthorized : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_UNAUTHORIZED;}
};

class ADBException_offline : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_OFFLINE;}
};

class ADBException_connectionFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_CONNECTION_FAILED;}
};

class ADBException_pairingFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_PAIRING_FAILED;}
};

class ADBException_commandFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_COMMAND_FAILED;}
};

class ADBException_timeout : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_TIMEOUT;}
};

class ADBException_parseError : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_PARSE_ERROR;}
};

class ADBException_installFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_INSTALL_FAILED;}
};

class ADBException_uninstallFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_UNINSTALL_FAILED;}
};

class ADBException_appActionFailed : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_APP_ACTION_FAILED;}
};

class ADBException_appNotFound : public ADBException{
public:
    using ADBException::ADBException;
    virtual adb_error_kind kind() const noexcept override {return ADB_ERR_APP_NOT_FOUND;}
};

};

/*
 The exception message carries the detail (device address, diagnostic text, package name).
 This renders the sentence shown to a user.
 */
std::string adb_error_description(const tihmstar::ADBException &e);
const char *adb_error_kind_name(adb_error_kind kind) noexcept;

#endif /* ADBException_hpp */
