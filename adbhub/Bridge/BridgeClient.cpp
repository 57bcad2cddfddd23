//
//  BridgeClient.cpp
//  adbhub
//
//  Created on 19.05.25.
//

#include "BridgeClient.hpp"
#include "OutputParser.hpp"
#include "../ADBException.hpp"

#include <ctype.h>
#include <string.h>
#include <strings.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <exception>
#include <future>
#include <set>

#include <libgeneral/macros.h>

static bool contains(const std::string &haystack, const char *needle) noexcept{
    return haystack.find(needle) != std::string::npos;
}

static std::string join_args(const std::vector<std::string> &args){
    std::string ret;
    for (auto &a : args) {
        if (ret.size()) ret += ' ';
        ret += a;
    }
    return ret;
}

bool android_key_code_from_name(const std::string &name, int &code) noexcept{
    static const struct {
        const char *name;
        int code;
    } keys[] = {
        {"home",        KEYCODE_HOME},
        {"back",        KEYCODE_BACK},
        {"volume-up",   KEYCODE_VOLUME_UP},
        {"volume-down", KEYCODE_VOLUME_DOWN},
        {"power",       KEYCODE_POWER},
        {"tab",         KEYCODE_TAB},
        {"enter",       KEYCODE_ENTER},
        {"delete",      KEYCODE_DEL},
        {"menu",        KEYCODE_MENU},
    };
    for (auto &k : keys) {
        if (strcasecmp(k.name, name.c_str()) == 0) {
            code = k.code;
            return true;
        }
    }
    return false;
}

#pragma mark BridgeClient
BridgeClient::BridgeClient(const ProcessRunner *runner, ToolLocator *locator)
: _runner(runner), _locator(locator)
{
    //
}

ProcessResult BridgeClient::exec(const std::vector<std::string> &args, uint64_t timeoutMs){
    std::string tool = _locator->resolve();
    try {
        return _runner->run(tool, args, timeoutMs);
    } catch (tihmstar::ADBException &) {
        throw;
    } catch (tihmstar::exception &e) {
        error("[BridgeClient] failed to launch '%s' with error=%d (%s)",tool.c_str(),e.code(),e.what());
        _locator->invalidate();
        retcustomerror(ADBException_toolNotFound, "%s",tool.c_str());
    }
}

ProcessResult BridgeClient::exec_device(const std::string &address, const std::vector<std::string> &args, uint64_t timeoutMs){
    std::vector<std::string> fullArgs{"-s", address};
    fullArgs.insert(fullArgs.end(), args.begin(), args.end());
    return exec(fullArgs, timeoutMs);
}

void BridgeClient::check_device_state(const std::string &address, const ProcessResult &res){
    std::string out = res.combinedOutput();
    if (contains(out, "device '") && contains(out, "not found")) {
        retcustomerror(ADBException_deviceNotFound, "%s",address.c_str());
    }
    if (contains(out, "device not found") || contains(out, "no devices/emulators found")) {
        retcustomerror(ADBException_deviceNotFound, "%s",address.c_str());
    }
    if (contains(out, "device unauthorized") || contains(out, "unauthorized")) {
        retcustomerror(ADBException_unauthorized, "%s",address.c_str());
    }
    if (contains(out, "device offline")) {
        retcustomerror(ADBException_offline, "%s",address.c_str());
    }
}

void BridgeClient::throw_command_failed(const std::string &address, const std::string &command, const ProcessResult &res){
    if (address.size()) check_device_state(address, res);
    debug("[BridgeClient] '%s' failed: %s",command.c_str(),res.combinedOutput().c_str());
    retcustomerror(ADBException_commandFailed, "Command '%s' failed with exit code %d",command.c_str(),res.exitCode);
}

void BridgeClient::assure_package_name(const std::string &packageName){
    if (!is_valid_package_name(packageName)) {
        retcustomerror(ADBException_appNotFound, "%s",packageName.c_str());
    }
}

#pragma mark helpers
bool BridgeClient::is_valid_package_name(const std::string &packageName) noexcept{
    //[a-zA-Z][a-zA-Z0-9_]*(\.[a-zA-Z][a-zA-Z0-9_]*)+
    int segments = 0;
    bool segmentStart = true;
    if (packageName.empty() || packageName.size() > ADB_MAX_PACKAGE_NAME_LEN) return false;
    for (char c : packageName) {
        if (segmentStart) {
            if (!isalpha((unsigned char)c) || !isascii(c)) return false;
            segmentStart = false;
            segments++;
        } else if (c == '.') {
            segmentStart = true;
        } else if (!(isascii(c) && (isalnum((unsigned char)c) || c == '_'))) {
            return false;
        }
    }
    return !segmentStart && segments >= 2;
}

std::string BridgeClient::escape_input_text(const std::string &text){
    std::string ret;
    for (char c : text) {
        switch (c) {
            case ' ':
                ret += "%s";
                break;
            case '\'':
            case '"':
            case '&':
            case '<':
            case '>':
            case ';':
            case '(':
            case ')':
                ret += '\\';
                ret += c;
                break;
            default:
                ret += c;
                break;
        }
    }
    return ret;
}

std::string BridgeClient::install_error_message(const std::string &output, const std::string &errorOutput){
    static const struct {
        const char *code;
        const char *message;
    } knownErrors[] = {
        {"INSTALL_FAILED_ALREADY_EXISTS",           "App already installed with different signature"},
        {"INSTALL_FAILED_INVALID_APK",              "Invalid APK file"},
        {"INSTALL_FAILED_INSUFFICIENT_STORAGE",     "Insufficient storage on device"},
        {"INSTALL_FAILED_VERSION_DOWNGRADE",        "Cannot downgrade app version"},
        {"INSTALL_PARSE_FAILED_NO_CERTIFICATES",    "APK is not signed"},
        {"INSTALL_FAILED_UPDATE_INCOMPATIBLE",      "Update incompatible with existing app"},
        {"INSTALL_FAILED_NO_MATCHING_ABIS",         "APK not compatible with device architecture"},
    };
    std::string combined = output + errorOutput;

    for (auto &e : knownErrors) {
        if (contains(combined, e.code)) return e.message;
    }

    {
        size_t start = 0;
        while ((start = combined.find("Failure [", start)) != std::string::npos) {
            size_t end = combined.find(']', start+9);
            if (end == std::string::npos) break;
            if (end > start+9) return combined.substr(start, end-start+1);
            start = end;
        }
    }

    if (errorOutput.size()) return errorOutput;
    if (output.size()) return output;
    return "Unknown installation error";
}

#pragma mark tool
bool BridgeClient::is_available() noexcept{
    try {
        return exec({"version"}, ADB_TIMEOUT_QUERY_MS).isSuccess();
    } catch (tihmstar::exception &e) {
        debug("[BridgeClient] tool not available error=%d (%s)",e.code(),e.what());
        return false;
    }
}

std::string BridgeClient::version(){
    ProcessResult res = exec({"version"}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed({}, "version", res);
    std::vector<std::string> lines = adb_split_lines(res.output);
    return lines.size() ? trim_whitespace(lines.front()) : std::string();
}

#pragma mark devices
std::vector<DeviceConnection> BridgeClient::list_devices(){
    ProcessResult res = exec({"devices", "-l"}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed({}, "devices -l", res);
    return adb_parse_device_list(res.output);
}

void BridgeClient::connect(const std::string &address){
    ProcessResult res = exec({"connect", address}, ADB_TIMEOUT_CONNECT_MS);

    if (contains(res.output, "connected to") || contains(res.output, "already connected")) {
        info("[BridgeClient] connected to %s",address.c_str());
        return;
    }
    if (contains(res.output, "failed") || contains(res.output, "unable")) {
        retcustomerror(ADBException_connectionFailed, "%s",res.output.c_str());
    }
    if (!res.isSuccess()) {
        retcustomerror(ADBException_connectionFailed, "%s",res.combinedOutput().c_str());
    }
}

void BridgeClient::disconnect(const std::string &address){
    ProcessResult res = exec({"disconnect", address}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess() && !contains(res.output, "disconnected")) {
        throw_command_failed({}, "disconnect", res);
    }
}

void BridgeClient::pair(const std::string &address, const std::string &code){
    ProcessResult res = exec({"pair", address, code}, ADB_TIMEOUT_PAIR_MS);
    std::string out = res.combinedOutput();

    if (contains(out, "Successfully paired")) {
        info("[BridgeClient] paired with %s",address.c_str());
        return;
    }
    if (contains(out, "protocol fault") || contains(out, "couldn't read status")) {
        retcustomerror(ADBException_pairingFailed, "Pairing code expired or connection interrupted. Please generate a new code on your device and try again.");
    }
    if (contains(out, "wrong password") || contains(out, "incorrect")) {
        retcustomerror(ADBException_pairingFailed, "Incorrect pairing code. Please check the code and try again.");
    }
    if (contains(out, "Connection refused")) {
        retcustomerror(ADBException_pairingFailed, "Connection refused. Ensure Wireless Debugging is enabled and the device is in pairing mode.");
    }
    if (contains(out, "No route to host") || contains(out, "Network is unreachable")) {
        retcustomerror(ADBException_pairingFailed, "Cannot reach device. Ensure both devices are on the same network.");
    }
    if (contains(out, "Failed") || contains(out, "failed") || contains(out, "error")) {
        retcustomerror(ADBException_pairingFailed, "%s",out.c_str());
    }
    if (!res.isSuccess()) {
        retcustomerror(ADBException_pairingFailed, "%s",out.c_str());
    }
}

void BridgeClient::enable_tcpip(const std::string &address, uint16_t port){
    std::string portStr = std::to_string(port);
    ProcessResult res = exec_device(address, {"tcpip", portStr}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "tcpip " + portStr, res);
}

#pragma mark shell
std::string BridgeClient::get_property(const std::string &address, const std::string &property){
    ProcessResult res = exec_device(address, {"shell", "getprop", property}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed(address, "getprop " + property, res);
    return res.output;
}

std::map<std::string,std::string> BridgeClient::get_properties(const std::string &address, const std::vector<std::string> &properties){
    std::map<std::string,std::string> ret;
    std::vector<std::future<std::string>> pending;
    std::exception_ptr firstError = nullptr;

    for (auto &p : properties) {
        pending.push_back(std::async(std::launch::async, [this, address, p]{
            return get_property(address, p);
        }));
    }

    //join everything before reporting, no sub-call may outlive this call
    for (size_t i = 0; i < pending.size(); i++) {
        try {
            ret[properties[i]] = pending[i].get();
        } catch (tihmstar::exception &e) {
            if (!firstError) firstError = std::current_exception();
        }
    }
    if (firstError) std::rethrow_exception(firstError);
    return ret;
}

std::string BridgeClient::shell(const std::string &address, const std::string &command){
    ProcessResult res = exec_device(address, {"shell", command}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "shell " + command, res);
    return res.output;
}

std::vector<uint8_t> BridgeClient::screencap(const std::string &address){
    static const uint8_t pngMagic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    ProcessResult res = exec_device(address, {"exec-out", "screencap", "-p"}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "screencap", res);
    if (res.rawOutput.empty()) {
        retcustomerror(ADBException_commandFailed, "Command 'screencap' failed with exit code %d",-1);
    }
    if (res.rawOutput.size() < sizeof(pngMagic) || memcmp(res.rawOutput.data(), pngMagic, sizeof(pngMagic)) != 0) {
        retcustomerror(ADBException_parseError, "screen capture of '%s' is not a PNG image",address.c_str());
    }
    return {res.rawOutput.begin(), res.rawOutput.end()};
}

void BridgeClient::input_text(const std::string &address, const std::string &text){
    ProcessResult res = exec_device(address, {"shell", "input", "text", escape_input_text(text)}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "input text", res);
}

void BridgeClient::input_keyevent(const std::string &address, int keyCode){
    std::string codeStr = std::to_string(keyCode);
    ProcessResult res = exec_device(address, {"shell", "input", "keyevent", codeStr}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "input keyevent " + codeStr, res);
}

#pragma mark port forwards
std::vector<PortForward> BridgeClient::list_reverse_forwards(const std::string &address){
    ProcessResult res = exec_device(address, {"reverse", "--list"}, ADB_TIMEOUT_QUERY_MS);
    //some tools exit nonzero with nothing to list
    if (!res.isSuccess() && res.output.size()) throw_command_failed(address, "reverse --list", res);
    return adb_parse_reverse_list(res.output);
}

void BridgeClient::create_reverse_forward(const std::string &address, uint16_t localPort, uint16_t remotePort){
    std::string local = "tcp:" + std::to_string(localPort);
    std::string remote = "tcp:" + std::to_string(remotePort);
    ProcessResult res = exec_device(address, {"reverse", local, remote}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "reverse " + local + " " + remote, res);
}

void BridgeClient::remove_reverse_forward(const std::string &address, uint16_t localPort){
    std::string local = "tcp:" + std::to_string(localPort);
    ProcessResult res = exec_device(address, {"reverse", "--remove", local}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "reverse --remove " + local, res);
}

void BridgeClient::remove_all_reverse_forwards(const std::string &address){
    ProcessResult res = exec_device(address, {"reverse", "--remove-all"}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) throw_command_failed(address, "reverse --remove-all", res);
}

std::vector<PortForward> BridgeClient::list_forwards(const std::string &address){
    std::vector<PortForward> ret;
    ProcessResult res = exec({"forward", "--list"}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed({}, "forward --list", res);
    for (auto &f : adb_parse_forward_list(res.output)) {
        if (address.empty() || f.transportAddress == address) ret.push_back(f);
    }
    return ret;
}

#pragma mark packages
std::vector<std::string> BridgeClient::list_packages(const std::string &address, app_list_filter filter){
    std::vector<std::string> args{"shell", "pm", "list", "packages"};
    switch (filter) {
        case APP_LIST_THIRD_PARTY:
            args.push_back("-3");
            break;
        case APP_LIST_SYSTEM:
            args.push_back("-s");
            break;
        case APP_LIST_DISABLED:
            args.push_back("-d");
            break;
        default:
            break;
    }
    ProcessResult res = exec_device(address, args, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed(address, "pm list packages", res);
    return adb_parse_package_list(res.output);
}

InstalledApp BridgeClient::get_package_details(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "dumpsys", "package", packageName}, ADB_TIMEOUT_QUERY_MS);
    if (!res.isSuccess()) throw_command_failed(address, "dumpsys package " + packageName, res);
    if (contains(res.output, "Unable to find package:")) {
        retcustomerror(ADBException_appNotFound, "%s",packageName.c_str());
    }
    return adb_parse_package_details(packageName, res.output);
}

std::vector<InstalledApp> BridgeClient::list_apps(const std::string &address){
    std::vector<InstalledApp> ret;
    std::vector<std::string> all = list_packages(address, APP_LIST_ALL);
    std::vector<std::string> thirdParty = list_packages(address, APP_LIST_THIRD_PARTY);
    std::vector<std::string> disabled = list_packages(address, APP_LIST_DISABLED);
    std::set<std::string> thirdPartySet(thirdParty.begin(), thirdParty.end());
    std::set<std::string> disabledSet(disabled.begin(), disabled.end());

    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());

    for (auto &pkg : all) {
        InstalledApp app;
        app.packageName = pkg;
        app.isSystemApp = thirdPartySet.find(pkg) == thirdPartySet.end();
        app.isEnabled = disabledSet.find(pkg) == disabledSet.end();
        ret.push_back(app);
    }
    return ret;
}

void BridgeClient::load_app_details(const std::string &address, std::vector<InstalledApp> &apps) noexcept{
    for (auto &app : apps) {
        try {
            InstalledApp details = get_package_details(address, app.packageName);
            app.versionName = details.versionName;
            app.versionCode = details.versionCode;
            app.firstInstallTime = details.firstInstallTime;
            app.lastUpdateTime = details.lastUpdateTime;
            app.isSystemApp = app.isSystemApp || details.isSystemApp;
            app.isEnabled = app.isEnabled && details.isEnabled;
            app.detailsLoaded = true;
        } catch (tihmstar::exception &e) {
            //a list degrades to sparse data instead of failing
            debug("[BridgeClient] skipping details of '%s' error=%d (%s)",app.packageName.c_str(),e.code(),e.what());
        }
    }
}

void BridgeClient::launch_app(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "monkey", "-p", packageName, "-c", "android.intent.category.LAUNCHER", "1"}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess() || contains(res.output, "No activities found")) {
        if (!res.isSuccess()) check_device_state(address, res);
        retcustomerror(ADBException_appActionFailed, "Launch failed: No launchable activity found for %s",packageName.c_str());
    }
}

void BridgeClient::force_stop_app(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "am", "force-stop", packageName}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) {
        check_device_state(address, res);
        retcustomerror(ADBException_appActionFailed, "Force Stop failed: %s",res.combinedOutput().c_str());
    }
}

void BridgeClient::uninstall_app(const std::string &address, const std::string &packageName, bool keepData){
    std::vector<std::string> args{"uninstall"};
    assure_package_name(packageName);
    if (keepData) args.push_back("-k");
    args.push_back(packageName);

    ProcessResult res = exec_device(address, args, ADB_TIMEOUT_UNINSTALL_MS);

    if (contains(res.output, "Success")) {
        info("[BridgeClient] uninstalled %s",packageName.c_str());
        return;
    }
    if (contains(res.output, "Failure") || contains(res.errorOutput, "Failure")) {
        if (contains(res.combinedOutput(), "[DELETE_FAILED_INTERNAL_ERROR]")) {
            retcustomerror(ADBException_uninstallFailed, "Cannot uninstall system app");
        }
        retcustomerror(ADBException_uninstallFailed, "%s",res.combinedOutput().c_str());
    }
    if (!res.isSuccess()) {
        check_device_state(address, res);
        retcustomerror(ADBException_uninstallFailed, "%s",res.combinedOutput().c_str());
    }
}

void BridgeClient::disable_app(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "pm", "disable-user", "--user", "0", packageName}, ADB_TIMEOUT_DEFAULT_MS);

    if (contains(res.output, "disabled")) return;
    if (contains(res.output, "Error") || contains(res.output, "Exception")) {
        retcustomerror(ADBException_appActionFailed, "Disable failed: %s",res.output.c_str());
    }
    if (!res.isSuccess()) {
        check_device_state(address, res);
        retcustomerror(ADBException_appActionFailed, "Disable failed: %s",res.combinedOutput().c_str());
    }
}

void BridgeClient::enable_app(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "pm", "enable", packageName}, ADB_TIMEOUT_DEFAULT_MS);

    if (contains(res.output, "enabled")) return;
    if (contains(res.output, "Error") || contains(res.output, "Exception")) {
        retcustomerror(ADBException_appActionFailed, "Enable failed: %s",res.output.c_str());
    }
    if (!res.isSuccess()) {
        check_device_state(address, res);
        retcustomerror(ADBException_appActionFailed, "Enable failed: %s",res.combinedOutput().c_str());
    }
}

void BridgeClient::open_app_settings(const std::string &address, const std::string &packageName){
    assure_package_name(packageName);
    ProcessResult res = exec_device(address, {"shell", "am", "start", "-a", "android.settings.APPLICATION_DETAILS_SETTINGS", "-d", "package:" + packageName}, ADB_TIMEOUT_DEFAULT_MS);
    if (!res.isSuccess()) {
        check_device_state(address, res);
        retcustomerror(ADBException_appActionFailed, "Open Settings failed: %s",res.combinedOutput().c_str());
    }
}

std::shared_ptr<InstallHandle> BridgeClient::install_package(const std::string &address, const std::string &apkPath, StreamingProcess::line_callback progress){
    struct stat st = {};
    std::shared_ptr<StreamingProcess> proc = nullptr;

    if (apkPath.size() < 4 || strcasecmp(apkPath.c_str() + apkPath.size() - 4, ".apk") != 0) {
        retcustomerror(ADBException_installFailed, "'%s' is not an APK file",apkPath.c_str());
    }
    if (stat(apkPath.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        retcustomerror(ADBException_installFailed, "File not found: %s",apkPath.c_str());
    }
    if (access(apkPath.c_str(), R_OK) != 0) {
        retcustomerror(ADBException_installFailed, "File is not readable: %s",apkPath.c_str());
    }

    {
        std::string tool = _locator->resolve();
        try {
            proc = _runner->runStreaming(tool, {"-s", address, "install", "-r", apkPath}, ADB_TIMEOUT_INSTALL_MS, progress);
        } catch (tihmstar::exception &e) {
            error("[BridgeClient] failed to launch install with error=%d (%s)",e.code(),e.what());
            retcustomerror(ADBException_commandFailed, "Command 'install' failed with exit code %d",-1);
        }
    }
    info("[BridgeClient] installing '%s' on %s",apkPath.c_str(),address.c_str());
    return std::make_shared<InstallHandle>(proc, apkPath);
}
