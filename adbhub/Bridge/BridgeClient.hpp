//
//  BridgeClient.hpp
//  adbhub
//
//  Created on 19.05.25.
//

#ifndef BridgeClient_hpp
#define BridgeClient_hpp

#include "InstallHandle.hpp"
#include "ToolLocator.hpp"
#include "../Process/ProcessRunner.hpp"
#include "../Devices/Transport.hpp"
#include "../Devices/PortForward.hpp"
#include "../Devices/InstalledApp.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

#define ADB_TIMEOUT_QUERY_MS        10000
#define ADB_TIMEOUT_DEFAULT_MS      30000
#define ADB_TIMEOUT_CONNECT_MS      10000
#define ADB_TIMEOUT_PAIR_MS         30000
#define ADB_TIMEOUT_UNINSTALL_MS    60000
#define ADB_TIMEOUT_INSTALL_MS      300000

#define ADB_MAX_PACKAGE_NAME_LEN    255

enum android_key_code{
    KEYCODE_HOME = 3,
    KEYCODE_BACK = 4,
    KEYCODE_VOLUME_UP = 24,
    KEYCODE_VOLUME_DOWN = 25,
    KEYCODE_POWER = 26,
    KEYCODE_TAB = 61,
    KEYCODE_ENTER = 66,
    KEYCODE_DEL = 67,
    KEYCODE_MENU = 82
};

bool android_key_code_from_name(const std::string &name, int &code) noexcept;

/*
 Typed operations on top of the bridge tool.
 This is the only place where tool output is interpreted for meaning.
 */
class BridgeClient{
    const ProcessRunner *_runner; //not owned
    ToolLocator *_locator; //not owned

    ProcessResult exec(const std::vector<std::string> &args, uint64_t timeoutMs);
    ProcessResult exec_device(const std::string &address, const std::vector<std::string> &args, uint64_t timeoutMs);
    void check_device_state(const std::string &address, const ProcessResult &res);
    void throw_command_failed(const std::string &address, const std::string &command, const ProcessResult &res);
    void assure_package_name(const std::string &packageName);

public:
    BridgeClient(const ProcessRunner *runner, ToolLocator *locator);

#pragma mark helpers
    static bool is_valid_package_name(const std::string &packageName) noexcept;
    static std::string escape_input_text(const std::string &text);
    static std::string install_error_message(const std::string &output, const std::string &errorOutput);

#pragma mark tool
    bool is_available() noexcept;
    std::string version();

#pragma mark devices
    std::vector<DeviceConnection> list_devices();
    void connect(const std::string &address);
    void disconnect(const std::string &address);
    void pair(const std::string &address, const std::string &code);
    void enable_tcpip(const std::string &address, uint16_t port);

#pragma mark shell
    std::string get_property(const std::string &address, const std::string &property);
    std::map<std::string,std::string> get_properties(const std::string &address, const std::vector<std::string> &properties);
    std::string shell(const std::string &address, const std::string &command);
    std::vector<uint8_t> screencap(const std::string &address);
    void input_text(const std::string &address, const std::string &text);
    void input_keyevent(const std::string &address, int keyCode);

#pragma mark port forwards
    std::vector<PortForward> list_reverse_forwards(const std::string &address);
    void create_reverse_forward(const std::string &address, uint16_t localPort, uint16_t remotePort);
    void remove_reverse_forward(const std::string &address, uint16_t localPort);
    void remove_all_reverse_forwards(const std::string &address);
    std::vector<PortForward> list_forwards(const std::string &address);

#pragma mark packages
    std::vector<std::string> list_packages(const std::string &address, app_list_filter filter = APP_LIST_ALL);
    InstalledApp get_package_details(const std::string &address, const std::string &packageName);
    std::vector<InstalledApp> list_apps(const std::string &address);
    void load_app_details(const std::string &address, std::vector<InstalledApp> &apps) noexcept;
    void launch_app(const std::string &address, const std::string &packageName);
    void force_stop_app(const std::string &address, const std::string &packageName);
    void uninstall_app(const std::string &address, const std::string &packageName, bool keepData = false);
    void disable_app(const std::string &address, const std::string &packageName);
    void enable_app(const std::string &address, const std::string &packageName);
    void open_app_settings(const std::string &address, const std::string &packageName);

    /*
     Starts `install -r` and returns immediately.
     The path must exist, be readable and end in .apk.
     */
    std::shared_ptr<InstallHandle> install_package(const std::string &address, const std::string &apkPath,
                                                   StreamingProcess::line_callback progress = nullptr);
};

#endif /* BridgeClient_hpp */
