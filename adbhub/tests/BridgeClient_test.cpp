#include <gtest/gtest.h>

#include "ADBException.hpp"
#include "Bridge/BridgeClient.hpp"
#include "FakeBridgeTool.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace {

// Process state letter from /proc/<pid>/stat, 0 once the pid is gone.
char procState(const std::string &pid)
{
    std::ifstream stat("/proc/" + pid + "/stat");
    std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
    size_t paren = content.rfind(')');
    if (paren == std::string::npos || paren + 2 >= content.size()) return 0;
    return content[paren + 2];
}

class BridgeClientTest : public ::testing::Test {
protected:
    BridgeClientTest()
        : tool("exit 0"), runner(std::vector<std::string>{}), locator(&runner, { tool.path() }), bridge(&runner, &locator)
    {}

    void script(const std::string &body) { tool.setBody(body); }

    // Runs f, expects exception E and returns its message.
    template <class E>
    std::string failureOf(const std::function<void()> &f)
    {
        try {
            f();
        }
        catch (E &e) {
            return e.what();
        }
        catch (tihmstar::exception &e) {
            ADD_FAILURE() << "unexpected exception: " << e.what();
            return {};
        }
        ADD_FAILURE() << "no exception thrown";
        return {};
    }

    std::string makeApk(const std::string &name)
    {
        std::string p = tool.file(name);
        std::ofstream(p) << "PK";
        return p;
    }

    FakeBridgeTool tool;
    ProcessRunner runner;
    ToolLocator locator;
    BridgeClient bridge;
};

} // namespace

#pragma mark tool

TEST_F(BridgeClientTest, VersionAndAvailability)
{
    script("echo 'Android Debug Bridge version 1.0.41'; echo 'Version 35.0.1'");
    EXPECT_TRUE(bridge.is_available());
    EXPECT_EQ(bridge.version(), "Android Debug Bridge version 1.0.41");
}

TEST_F(BridgeClientTest, MissingToolIsNotAvailable)
{
    locator.setCustomPath(tool.file("missing-adb"));
    EXPECT_FALSE(bridge.is_available());
    EXPECT_THROW(bridge.list_devices(), tihmstar::ADBException_toolNotFound);
}

#pragma mark devices

TEST_F(BridgeClientTest, ListDevices)
{
    script("echo 'List of devices attached'; echo '192.168.1.5:5555 device product:redfin model:Pixel_5 transport_id:3'");

    auto devices = bridge.list_devices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].kind, TRANSPORT_WIFI);
    EXPECT_EQ(devices[0].model, "Pixel 5");
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "devices -l" });
}

TEST_F(BridgeClientTest, ConnectSuccessVocabulary)
{
    script("echo 'connected to 192.168.1.5:5555'");
    EXPECT_NO_THROW(bridge.connect("192.168.1.5:5555"));

    script("echo 'already connected to 192.168.1.5:5555'");
    EXPECT_NO_THROW(bridge.connect("192.168.1.5:5555"));

    EXPECT_EQ(tool.countCalls("connect 192.168.1.5:5555"), 2u);
}

TEST_F(BridgeClientTest, ConnectFailureIsTextBasedEvenWithZeroExit)
{
    script("echo 'failed to connect to 192.168.1.5:5555: Connection refused'; exit 0");
    std::string msg = failureOf<tihmstar::ADBException_connectionFailed>([&] { bridge.connect("192.168.1.5:5555"); });
    EXPECT_EQ(msg, "failed to connect to 192.168.1.5:5555: Connection refused");

    script("echo 'unable to connect to 192.168.1.5:5555'; exit 0");
    EXPECT_THROW(bridge.connect("192.168.1.5:5555"), tihmstar::ADBException_connectionFailed);

    script("echo 'something else' >&2; exit 1");
    EXPECT_THROW(bridge.connect("192.168.1.5:5555"), tihmstar::ADBException_connectionFailed);
}

TEST_F(BridgeClientTest, PairSuccessAndCleanExit)
{
    script("echo 'Successfully paired to 192.168.1.5:37123 [guid=adb-R58-abc]'");
    EXPECT_NO_THROW(bridge.pair("192.168.1.5:37123", "123456"));
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "pair 192.168.1.5:37123 123456" });

    script("echo 'Enter pairing code:'; exit 0");
    EXPECT_NO_THROW(bridge.pair("192.168.1.5:37123", "123456"));
}

TEST_F(BridgeClientTest, PairWrongPasswordGivesSpecificMessage)
{
    script("echo 'Failed: Unable to start pairing client.' ; echo 'error: wrong password' >&2; exit 1");

    try {
        bridge.pair("192.168.1.5:37123", "000000");
        FAIL() << "pair must fail";
    }
    catch (tihmstar::ADBException_pairingFailed &e) {
        EXPECT_STREQ(e.what(), "Incorrect pairing code. Please check the code and try again.");
        EXPECT_EQ(e.kind(), ADB_ERR_PAIRING_FAILED);
        EXPECT_EQ(adb_error_description(e), "Pairing failed: Incorrect pairing code. Please check the code and try again.");
    }
}

TEST_F(BridgeClientTest, PairKnownFailures)
{
    script("echo 'error: protocol fault (couldn'\"'\"'t read status message)'; exit 1");
    EXPECT_EQ(failureOf<tihmstar::ADBException_pairingFailed>([&] { bridge.pair("10.0.0.2:4000", "1"); }),
        "Pairing code expired or connection interrupted. Please generate a new code on your device and try again.");

    script("echo 'Failed: Connection refused'; exit 1");
    EXPECT_EQ(failureOf<tihmstar::ADBException_pairingFailed>([&] { bridge.pair("10.0.0.2:4000", "1"); }),
        "Connection refused. Ensure Wireless Debugging is enabled and the device is in pairing mode.");

    script("echo 'Failed: No route to host'; exit 1");
    EXPECT_EQ(failureOf<tihmstar::ADBException_pairingFailed>([&] { bridge.pair("10.0.0.2:4000", "1"); }),
        "Cannot reach device. Ensure both devices are on the same network.");

    script("echo 'Failed: something new'; exit 0");
    EXPECT_EQ(failureOf<tihmstar::ADBException_pairingFailed>([&] { bridge.pair("10.0.0.2:4000", "1"); }),
        "Failed: something new");
}

TEST_F(BridgeClientTest, EnableTcpipArguments)
{
    bridge.enable_tcpip("R58M123ABC", 5556);
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "-s R58M123ABC tcpip 5556" });
}

#pragma mark shell

TEST_F(BridgeClientTest, DeviceStateErrorsAreClassified)
{
    script("echo \"error: device 'XYZ' not found\" >&2; exit 1");
    EXPECT_THROW(bridge.shell("XYZ", "ls"), tihmstar::ADBException_deviceNotFound);

    script("echo 'error: device unauthorized.' >&2; exit 1");
    EXPECT_THROW(bridge.shell("XYZ", "ls"), tihmstar::ADBException_unauthorized);

    script("echo 'error: device offline' >&2; exit 1");
    EXPECT_THROW(bridge.shell("XYZ", "ls"), tihmstar::ADBException_offline);

    script("echo 'ls: /nope: No such file or directory' >&2; exit 1");
    EXPECT_EQ(failureOf<tihmstar::ADBException_commandFailed>([&] { bridge.shell("XYZ", "ls /nope"); }),
        "Command 'shell ls /nope' failed with exit code 1");
}

TEST_F(BridgeClientTest, ShellPassesCommandAsSingleArgument)
{
    script("echo \"$#\"");
    EXPECT_EQ(bridge.shell("SER", "ls -la /sdcard"), "4");
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "-s SER shell ls -la /sdcard" });
}

TEST_F(BridgeClientTest, PropertiesAreFetchedTogether)
{
    script("case \"$5\" in ro.serialno) echo R58;; ro.product.model) echo 'Pixel 5';; ro.product.brand) echo google;; esac");

    auto props = bridge.get_properties("SER", { "ro.serialno", "ro.product.model", "ro.product.brand" });

    EXPECT_EQ(props["ro.serialno"], "R58");
    EXPECT_EQ(props["ro.product.model"], "Pixel 5");
    EXPECT_EQ(props["ro.product.brand"], "google");
    EXPECT_EQ(tool.countCalls("-s SER shell getprop "), 3u);
}

TEST_F(BridgeClientTest, OneFailingPropertyFailsTheWholeFetch)
{
    script("case \"$5\" in ro.product.brand) echo boom >&2; exit 1;; *) echo ok;; esac");
    EXPECT_THROW(bridge.get_properties("SER", { "ro.serialno", "ro.product.model", "ro.product.brand" }),
        tihmstar::ADBException_commandFailed);
    EXPECT_EQ(tool.countCalls("-s SER shell getprop "), 3u);
}

TEST_F(BridgeClientTest, ScreencapReturnsPng)
{
    script("printf '\\211PNG\\r\\n\\032\\nDATA\\n\\n'");
    auto png = bridge.screencap("SER");
    ASSERT_EQ(png.size(), 14u);
    EXPECT_EQ(png[0], 0x89);
    EXPECT_EQ(png[13], '\n');
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "-s SER exec-out screencap -p" });

    script("echo 'not an image'");
    EXPECT_THROW(bridge.screencap("SER"), tihmstar::ADBException_parseError);

    script("exit 0");
    EXPECT_THROW(bridge.screencap("SER"), tihmstar::ADBException_commandFailed);
}

TEST_F(BridgeClientTest, TextInputEscaping)
{
    EXPECT_EQ(BridgeClient::escape_input_text("hello world"), "hello%sworld");
    EXPECT_EQ(BridgeClient::escape_input_text("a'b\"c&d<e>f;g(h)"), "a\\'b\\\"c\\&d\\<e\\>f\\;g\\(h\\)");
    EXPECT_EQ(BridgeClient::escape_input_text("plain"), "plain");

    bridge.input_text("SER", "hi there");
    bridge.input_keyevent("SER", KEYCODE_HOME);
    EXPECT_EQ(tool.calls(), (std::vector<std::string>{ "-s SER shell input text hi%sthere", "-s SER shell input keyevent 3" }));
}

TEST_F(BridgeClientTest, KeyCodeNames)
{
    int code = 0;
    EXPECT_TRUE(android_key_code_from_name("back", code));
    EXPECT_EQ(code, 4);
    EXPECT_TRUE(android_key_code_from_name("Volume-Up", code));
    EXPECT_EQ(code, 24);
    EXPECT_TRUE(android_key_code_from_name("delete", code));
    EXPECT_EQ(code, 67);
    EXPECT_FALSE(android_key_code_from_name("jump", code));
}

#pragma mark port forwards

TEST_F(BridgeClientTest, ReverseForwardArguments)
{
    script("if [ \"$3\" = reverse ] && [ \"$4\" = --list ]; then echo 'SER tcp:8081 tcp:9091'; fi");

    bridge.create_reverse_forward("SER", 8081, 9091);
    auto list = bridge.list_reverse_forwards("SER");
    bridge.remove_reverse_forward("SER", 8081);
    bridge.remove_all_reverse_forwards("SER");

    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].localPort, 8081);
    EXPECT_EQ(list[0].remotePort, 9091);
    EXPECT_EQ(tool.calls(), (std::vector<std::string>{
        "-s SER reverse tcp:8081 tcp:9091",
        "-s SER reverse --list",
        "-s SER reverse --remove tcp:8081",
        "-s SER reverse --remove-all",
    }));
}

TEST_F(BridgeClientTest, EmptyFailingReverseListIsEmpty)
{
    script("exit 1");
    std::vector<PortForward> list;
    EXPECT_NO_THROW(list = bridge.list_reverse_forwards("SER"));
    EXPECT_TRUE(list.empty());

    script("echo 'error: more than one device/emulator'; exit 1");
    EXPECT_THROW(bridge.list_reverse_forwards("SER"), tihmstar::ADBException);
}

TEST_F(BridgeClientTest, ForwardListIsFilteredBySerial)
{
    script("echo 'SER tcp:6100 tcp:7100'; echo 'OTHER tcp:6200 tcp:7200'");
    auto list = bridge.list_forwards("SER");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].localPort, 6100);
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "forward --list" });
}

#pragma mark packages

TEST_F(BridgeClientTest, PackageNameValidation)
{
    EXPECT_TRUE(BridgeClient::is_valid_package_name("com.example.app"));
    EXPECT_TRUE(BridgeClient::is_valid_package_name("a.b"));
    EXPECT_TRUE(BridgeClient::is_valid_package_name("org.my_app.v2"));

    EXPECT_FALSE(BridgeClient::is_valid_package_name("single"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("1com.example"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("com.1example"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("com.example."));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("com..example"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("com.example;reboot"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("com.exa mple"));
    EXPECT_FALSE(BridgeClient::is_valid_package_name(""));
    EXPECT_FALSE(BridgeClient::is_valid_package_name("a." + std::string(254, 'b')));
}

TEST_F(BridgeClientTest, InvalidPackageNameNeverReachesTheTool)
{
    EXPECT_THROW(bridge.launch_app("SER", "com.example;reboot"), tihmstar::ADBException_appNotFound);
    EXPECT_THROW(bridge.uninstall_app("SER", "$(reboot).x"), tihmstar::ADBException_appNotFound);
    EXPECT_THROW(bridge.disable_app("SER", "x"), tihmstar::ADBException_appNotFound);
    EXPECT_TRUE(tool.calls().empty());
}

TEST_F(BridgeClientTest, PackageListFilters)
{
    script("echo 'package:com.example.app'");
    bridge.list_packages("SER");
    bridge.list_packages("SER", APP_LIST_THIRD_PARTY);
    bridge.list_packages("SER", APP_LIST_SYSTEM);
    bridge.list_packages("SER", APP_LIST_DISABLED);
    EXPECT_EQ(tool.calls(), (std::vector<std::string>{
        "-s SER shell pm list packages",
        "-s SER shell pm list packages -3",
        "-s SER shell pm list packages -s",
        "-s SER shell pm list packages -d",
    }));
}

TEST_F(BridgeClientTest, ListAppsAndLoadDetails)
{
    script(
        "case \"$*\" in\n"
        "  *'list packages -3') echo 'package:com.example.app';;\n"
        "  *'list packages -d') echo 'package:com.android.disabled';;\n"
        "  *'list packages') printf 'package:com.example.app\\npackage:com.android.disabled\\npackage:com.android.phone\\n';;\n"
        "  *'dumpsys package com.example.app') printf 'versionName=2.0\\nversionCode=20 minSdk=21\\n';;\n"
        "  *'dumpsys package com.android.phone') echo boom >&2; exit 1;;\n"
        "  *'dumpsys package com.android.disabled') echo 'versionName=1.0';;\n"
        "esac");

    auto apps = bridge.list_apps("SER");
    ASSERT_EQ(apps.size(), 3u);
    EXPECT_EQ(apps[0].packageName, "com.android.disabled");
    EXPECT_TRUE(apps[0].isSystemApp);
    EXPECT_FALSE(apps[0].isEnabled);
    EXPECT_EQ(apps[1].packageName, "com.android.phone");
    EXPECT_EQ(apps[2].packageName, "com.example.app");
    EXPECT_FALSE(apps[2].isSystemApp);
    EXPECT_TRUE(apps[2].isEnabled);

    bridge.load_app_details("SER", apps);

    EXPECT_TRUE(apps[0].detailsLoaded);
    EXPECT_FALSE(apps[0].isEnabled);
    EXPECT_FALSE(apps[1].detailsLoaded);
    EXPECT_EQ(apps[1].versionName, "");
    EXPECT_TRUE(apps[2].detailsLoaded);
    EXPECT_EQ(apps[2].versionName, "2.0");
    EXPECT_EQ(apps[2].versionCode, 20);
}

TEST_F(BridgeClientTest, UnknownPackageDetails)
{
    script("echo 'Unable to find package: com.example.gone'");
    EXPECT_THROW(bridge.get_package_details("SER", "com.example.gone"), tihmstar::ADBException_appNotFound);
}

TEST_F(BridgeClientTest, AppActionArguments)
{
    script("case \"$*\" in *'pm disable-user'*) echo 'Package com.example.app new state: disabled-user';; *'pm enable'*) echo 'Package com.example.app new state: enabled';; *) echo 'Events injected: 1';; esac");

    bridge.launch_app("SER", "com.example.app");
    bridge.force_stop_app("SER", "com.example.app");
    bridge.disable_app("SER", "com.example.app");
    bridge.enable_app("SER", "com.example.app");
    bridge.open_app_settings("SER", "com.example.app");

    EXPECT_EQ(tool.calls(), (std::vector<std::string>{
        "-s SER shell monkey -p com.example.app -c android.intent.category.LAUNCHER 1",
        "-s SER shell am force-stop com.example.app",
        "-s SER shell pm disable-user --user 0 com.example.app",
        "-s SER shell pm enable com.example.app",
        "-s SER shell am start -a android.settings.APPLICATION_DETAILS_SETTINGS -d package:com.example.app",
    }));
}

TEST_F(BridgeClientTest, LaunchWithoutActivity)
{
    script("echo '** No activities found to run, monkey aborted.'");
    EXPECT_EQ(failureOf<tihmstar::ADBException_appActionFailed>([&] { bridge.launch_app("SER", "com.example.app"); }),
        "Launch failed: No launchable activity found for com.example.app");
}

TEST_F(BridgeClientTest, DisableFailureIsTextBased)
{
    script("echo 'Error: java.lang.SecurityException: Cannot disable a protected package'; exit 0");
    EXPECT_THROW(bridge.disable_app("SER", "com.android.phone"), tihmstar::ADBException_appActionFailed);
}

TEST_F(BridgeClientTest, UninstallSystemAppMessage)
{
    script("echo 'Failure [DELETE_FAILED_INTERNAL_ERROR]'; exit 0");

    try {
        bridge.uninstall_app("SER", "com.android.phone");
        FAIL() << "uninstall must fail";
    }
    catch (tihmstar::ADBException_uninstallFailed &e) {
        EXPECT_STREQ(e.what(), "Cannot uninstall system app");
        EXPECT_EQ(adb_error_description(e), "Uninstall failed: Cannot uninstall system app");
    }
}

TEST_F(BridgeClientTest, UninstallArguments)
{
    script("echo Success");
    bridge.uninstall_app("SER", "com.example.app");
    bridge.uninstall_app("SER", "com.example.app", true);
    EXPECT_EQ(tool.calls(), (std::vector<std::string>{
        "-s SER uninstall com.example.app",
        "-s SER uninstall -k com.example.app",
    }));

    script("echo 'Failure [DELETE_FAILED_DEVICE_POLICY_MANAGER]'");
    EXPECT_EQ(failureOf<tihmstar::ADBException_uninstallFailed>([&] { bridge.uninstall_app("SER", "com.example.app"); }),
        "Failure [DELETE_FAILED_DEVICE_POLICY_MANAGER]");
}

#pragma mark install

TEST_F(BridgeClientTest, InstallErrorTable)
{
    EXPECT_EQ(BridgeClient::install_error_message("Failure [INSTALL_FAILED_ALREADY_EXISTS: x]", ""), "App already installed with different signature");
    EXPECT_EQ(BridgeClient::install_error_message("", "adb: failed to install: Failure [INSTALL_FAILED_INSUFFICIENT_STORAGE]"), "Insufficient storage on device");
    EXPECT_EQ(BridgeClient::install_error_message("Failure [INSTALL_FAILED_NO_MATCHING_ABIS: ...]", ""), "APK not compatible with device architecture");
    EXPECT_EQ(BridgeClient::install_error_message("Failure [INSTALL_FAILED_TEST_ONLY]", ""), "Failure [INSTALL_FAILED_TEST_ONLY]");
    EXPECT_EQ(BridgeClient::install_error_message("out", "err"), "err");
    EXPECT_EQ(BridgeClient::install_error_message("out", ""), "out");
    EXPECT_EQ(BridgeClient::install_error_message("", ""), "Unknown installation error");
}

TEST_F(BridgeClientTest, InstallReportsProgressAndSucceeds)
{
    std::string apk = makeApk("app.APK");
    std::vector<std::string> lines;
    script("echo 'Performing Streamed Install'; echo Success");

    auto handle = bridge.install_package("SER", apk, [&](const std::string &line) { lines.push_back(line); });

    EXPECT_EQ(handle->wait(), INSTALL_SUCCEEDED);
    EXPECT_EQ(lines, (std::vector<std::string>{ "Performing Streamed Install", "Success" }));
    EXPECT_EQ(tool.calls(), std::vector<std::string>{ "-s SER install -r " + apk });
}

TEST_F(BridgeClientTest, InstallFailureUsesKnownCode)
{
    std::string apk = makeApk("app.apk");
    script("echo 'Performing Streamed Install'; echo 'adb: failed to install app.apk: Failure [INSTALL_FAILED_VERSION_DOWNGRADE]' >&2; exit 1");

    auto handle = bridge.install_package("SER", apk);
    EXPECT_EQ(failureOf<tihmstar::ADBException_installFailed>([&] { handle->wait(); }), "Cannot downgrade app version");
}

TEST_F(BridgeClientTest, InstallFailureMarkerWithZeroExit)
{
    std::string apk = makeApk("app.apk");
    script("echo 'Failure [INSTALL_FAILED_INVALID_APK]'; exit 0");

    auto handle = bridge.install_package("SER", apk);
    EXPECT_EQ(failureOf<tihmstar::ADBException_installFailed>([&] { handle->wait(); }), "Invalid APK file");
}

TEST_F(BridgeClientTest, InstallValidatesPathBeforeLaunching)
{
    std::string notApk = makeApk("app.zip");
    EXPECT_THROW(bridge.install_package("SER", notApk), tihmstar::ADBException_installFailed);
    EXPECT_THROW(bridge.install_package("SER", tool.file("missing.apk")), tihmstar::ADBException_installFailed);
    ASSERT_EQ(mkdir(tool.file("dir.apk").c_str(), 0755), 0);
    EXPECT_THROW(bridge.install_package("SER", tool.file("dir.apk")), tihmstar::ADBException_installFailed);
    EXPECT_TRUE(tool.calls().empty());
}

TEST_F(BridgeClientTest, InstallCanBeCancelled)
{
    std::string apk = makeApk("app.apk");
    script("echo 'Performing Streamed Install'; exec sleep 10");

    auto handle = bridge.install_package("SER", apk);
    handle->cancel();
    EXPECT_EQ(handle->wait(), INSTALL_CANCELLED);
}

TEST_F(BridgeClientTest, CancelWhileFinishedInstallIsUnreapedStaysSucceeded)
{
    std::string apk = makeApk("app.apk");
    script("echo $$ > \"$DIR/install.pid\"; echo Success");

    for (int i = 0; i < 3; i++) {
        auto handle = bridge.install_package("SER", apk);

        std::string pid;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline) {
            if (pid.empty()) std::ifstream(tool.file("install.pid")) >> pid;
            if (pid.empty()) {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                continue;
            }
            char st = procState(pid);
            if (st == 'Z' || st == 0) break;
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }

        handle->cancel();
        EXPECT_EQ(handle->wait(), INSTALL_SUCCEEDED);
        unlink(tool.file("install.pid").c_str());
    }
}

TEST_F(BridgeClientTest, CancelAfterSuccessfulInstallStaysSucceeded)
{
    std::string apk = makeApk("app.apk");
    script("echo Success");

    auto handle = bridge.install_package("SER", apk);
    EXPECT_EQ(handle->wait(), INSTALL_SUCCEEDED);
    handle->cancel();
    EXPECT_EQ(handle->wait(), INSTALL_SUCCEEDED);
}
