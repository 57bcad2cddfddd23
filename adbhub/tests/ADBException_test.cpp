#include <gtest/gtest.h>

#include "ADBException.hpp"

#include <functional>
#include <string>

#include <libgeneral/macros.h>

namespace {

struct Rendered {
    adb_error_kind kind;
    std::string description;
};

Rendered render(const std::function<void()> &thrower)
{
    try {
        thrower();
    }
    catch (tihmstar::ADBException &e) {
        return { e.kind(), adb_error_description(e) };
    }
    ADD_FAILURE() << "nothing was thrown";
    return {};
}

} // namespace

TEST(ADBExceptionTest, DescriptionsCarryTheDetail)
{
    Rendered r;

    r = render([] { retcustomerror(ADBException_toolNotFound, "/opt/adb"); });
    EXPECT_EQ(r.kind, ADB_ERR_TOOL_NOT_FOUND);
    EXPECT_EQ(r.description, "ADB executable not found. Please install Android platform-tools or set a custom path.");

    r = render([] { retcustomerror(ADBException_deviceNotFound, "R58M123ABC"); });
    EXPECT_EQ(r.kind, ADB_ERR_DEVICE_NOT_FOUND);
    EXPECT_EQ(r.description, "Device 'R58M123ABC' not found. Please check the connection.");

    r = render([] { retcustomerror(ADBException_unauthorized, "R58M123ABC"); });
    EXPECT_EQ(r.description, "Device 'R58M123ABC' is unauthorized. Please accept the debugging prompt on the device.");

    r = render([] { retcustomerror(ADBException_offline, "192.168.1.5:5555"); });
    EXPECT_EQ(r.description, "Device '192.168.1.5:5555' is offline. Try reconnecting it.");

    r = render([] { retcustomerror(ADBException_connectionFailed, "refused"); });
    EXPECT_EQ(r.description, "Connection failed: refused");

    r = render([] { retcustomerror(ADBException_timeout, "adb devices -l"); });
    EXPECT_EQ(r.kind, ADB_ERR_TIMEOUT);
    EXPECT_EQ(r.description, "Operation timed out");

    r = render([] { retcustomerror(ADBException_parseError, "garbage"); });
    EXPECT_EQ(r.description, "Failed to parse output: garbage");

    r = render([] { retcustomerror(ADBException_installFailed, "Invalid APK file"); });
    EXPECT_EQ(r.description, "Installation failed: Invalid APK file");

    r = render([] { retcustomerror(ADBException_appNotFound, "com.example.gone"); });
    EXPECT_EQ(r.description, "App 'com.example.gone' not found");
}

TEST(ADBExceptionTest, CommandAndActionFailuresAreShownVerbatim)
{
    Rendered r;

    r = render([] { retcustomerror(ADBException_commandFailed, "Command 'shell ls' failed with exit code 1"); });
    EXPECT_EQ(r.kind, ADB_ERR_COMMAND_FAILED);
    EXPECT_EQ(r.description, "Command 'shell ls' failed with exit code 1");

    r = render([] { retcustomerror(ADBException_appActionFailed, "Launch failed: No launchable activity found for com.x.y"); });
    EXPECT_EQ(r.kind, ADB_ERR_APP_ACTION_FAILED);
    EXPECT_EQ(r.description, "Launch failed: No launchable activity found for com.x.y");
}

TEST(ADBExceptionTest, KindsAreCatchableAsLibraryExceptions)
{
    bool caught = false;
    try {
        retcustomerror(ADBException_offline, "SER");
    }
    catch (tihmstar::exception &e) {
        caught = true;
        EXPECT_STREQ(e.what(), "SER");
    }
    EXPECT_TRUE(caught);
}

TEST(ADBExceptionTest, KindNames)
{
    EXPECT_STREQ(adb_error_kind_name(ADB_ERR_PAIRING_FAILED), "pairingFailed");
    EXPECT_STREQ(adb_error_kind_name(ADB_ERR_APP_NOT_FOUND), "appNotFound");
    EXPECT_STREQ(adb_error_kind_name((adb_error_kind)0), "unknown");
}

TEST(ADBExceptionTest, EveryClassReportsItsOwnKind)
{
    EXPECT_EQ(render([] { retcustomerror(ADBException_toolNotFound, "x"); }).kind, ADB_ERR_TOOL_NOT_FOUND);
    EXPECT_EQ(render([] { retcustomerror(ADBException_deviceNotFound, "x"); }).kind, ADB_ERR_DEVICE_NOT_FOUND);
    EXPECT_EQ(render([] { retcustomerror(ADBException_unauthorized, "x"); }).kind, ADB_ERR_UNAUTHORIZED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_offline, "x"); }).kind, ADB_ERR_OFFLINE);
    EXPECT_EQ(render([] { retcustomerror(ADBException_connectionFailed, "x"); }).kind, ADB_ERR_CONNECTION_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_pairingFailed, "x"); }).kind, ADB_ERR_PAIRING_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_commandFailed, "x"); }).kind, ADB_ERR_COMMAND_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_timeout, "x"); }).kind, ADB_ERR_TIMEOUT);
    EXPECT_EQ(render([] { retcustomerror(ADBException_parseError, "x"); }).kind, ADB_ERR_PARSE_ERROR);
    EXPECT_EQ(render([] { retcustomerror(ADBException_installFailed, "x"); }).kind, ADB_ERR_INSTALL_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_uninstallFailed, "x"); }).kind, ADB_ERR_UNINSTALL_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_appActionFailed, "x"); }).kind, ADB_ERR_APP_ACTION_FAILED);
    EXPECT_EQ(render([] { retcustomerror(ADBException_appNotFound, "x"); }).kind, ADB_ERR_APP_NOT_FOUND);
}
