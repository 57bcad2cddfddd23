//
//  main.cpp
//  adbhub
//
//  Created on 25.05.25.
//

#include "ADBException.hpp"
#include "Bridge/BridgeClient.hpp"
#include "Bridge/OutputParser.hpp"
#include "Manager/DeviceManager.hpp"
#include "Manager/DiscoveryManager.hpp"
#include "Manager/ServiceBrowser-avahi.hpp"
#include "sysconf/sysconf.hpp"
#include "sysconf/PlistHistoryStore.hpp"

#include <libgeneral/macros.h>

#include <atomic>
#include <thread>

#include <signal.h>
#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>
#include <getopt.h>
#include <string.h>
#include <stdio.h>
#include <time.h>

#undef error //errors will be printed as fatal for this file
#define error(a ...) adbhub_log(LL_FATAL,a)

static std::atomic<bool> terminated{false};
static Config *gConfig = nullptr;

static int verbose = 0;

//only async-signal-safe work in here, the main thread polls the flag
static void handle_signal(int sig) noexcept{
    static std::atomic<int> ctrlcCounter{0};
    if (ctrlcCounter++ == 5){
        _exit(2);
    }
    terminated = true;
}

static void set_signal_handlers(void){
    assure(signal(SIGINT, handle_signal)  != SIG_ERR);
    assure(signal(SIGQUIT, handle_signal) != SIG_ERR);
    assure(signal(SIGTERM, handle_signal) != SIG_ERR);

    assure(signal(SIGPIPE, SIG_IGN) != SIG_ERR);
}

static void usage(){
    printf("Usage: %s [OPTIONS] COMMAND [ARGS]\n", PACKAGE_NAME);
    printf("Manage Android debug connections over USB and the local network.\n\n");
    printf("Options:\n");
    printf("  -h, --help\t\t\tPrint this message.\n");
    printf("  -V, --version\t\t\tPrint version information and exit.\n");
    printf("  -v, --verbose\t\t\tBe verbose (use twice or more to increase).\n");
    printf("  -s, --serial ADDR\t\tUse the device with this identity or transport address.\n");
    printf("  -a, --adb PATH\t\tUse this adb executable.\n");
    printf("  -c, --config-dir DIR\t\tRead Config.plist and DeviceHistory.plist from DIR.\n");
    printf("  -l, --logfile=LOGFILE\t\tLog (append) to LOGFILE instead of stderr.\n");
    printf("  -t, --timeout SECS\t\tHow long 'discover' and 'pair' browse the network.\n");
    printf("      --syslog\t\t\tLog to syslog.\n");
    printf("      --debug\t\t\tEnable debug logging\n");
    printf("\n");
    printf("Commands:\n");
    printf("  version\t\t\tPrint the adb version.\n");
    printf("  devices\t\t\tList devices.\n");
    printf("  watch\t\t\t\tKeep polling and print the device list whenever it changes.\n");
    printf("  discover\t\t\tBrowse the local network for wireless debugging services.\n");
    printf("  connect ADDR|HOST\t\tConnect to ip:port, or to a discovered host.\n");
    printf("  disconnect\t\t\tDisconnect all network transports of the device.\n");
    printf("  pair HOST CODE\t\tPair with a discovered host, then connect.\n");
    printf("  pair-address ADDR CODE\tPair with ip:port, then connect on the default port.\n");
    printf("  tcpip [PORT]\t\t\tSwitch the device to network debugging.\n");
    printf("  rename NAME\t\t\tSet the custom name of the device (empty removes it).\n");
    printf("  shell CMD...\t\t\tRun a shell command on the device.\n");
    printf("  text TEXT\t\t\tType text on the device.\n");
    printf("  key NAME|CODE\t\t\tSend a key event (home, back, menu, power, ...).\n");
    printf("  screencap\t\t\tWrite a PNG screenshot to stdout.\n");
    printf("  reverse LOCAL REMOTE\t\tAdd a reverse port forward.\n");
    printf("  reverse-list\t\t\tList reverse port forwards.\n");
    printf("  reverse-remove LOCAL\t\tRemove a reverse port forward.\n");
    printf("  reverse-remove-all\t\tRemove all reverse port forwards.\n");
    printf("  forwards\t\t\tList port forwards of the device.\n");
    printf("  apps [all|third-party|system|disabled]\n");
    printf("  \t\t\t\tList installed apps.\n");
    printf("  app-info PKG\t\t\tShow package details.\n");
    printf("  launch|stop|enable|disable|settings PKG\n");
    printf("  uninstall PKG [--keep-data]\n");
    printf("  install APK\t\t\tInstall (or replace) an APK.\n");
    printf("\n");
}

static void parse_opts(int argc, const char **argv){
    static struct option longopts[] = {
        {"help",        no_argument,        NULL, 'h'},
        {"version",     no_argument,        NULL, 'V'},
        {"verbose",     no_argument,        NULL, 'v'},
        {"serial",      required_argument,  NULL, 's'},
        {"adb",         required_argument,  NULL, 'a'},
        {"config-dir",  required_argument,  NULL, 'c'},
        {"logfile",     required_argument,  NULL, 'l'},
        {"timeout",     required_argument,  NULL, 't'},

        {"syslog",      no_argument,        NULL,  0 },
        {"debug",       no_argument,        NULL,  0 },
        {NULL,          0,                  NULL,  0 }
    };
    int optindex = 0;
    int opt = 0;

    //stop at the first command word
    while ((opt = getopt_long(argc, (char* const *)argv, "+hVvs:a:c:l:t:", longopts, &optindex)) >= 0) {
        switch (opt) {
            case 0: //long opts
            {
                std::string curopt = longopts[optindex].name;

                if (curopt == "syslog") {
                    gConfig->useSyslog = true;
                }else if (curopt == "debug") {
                    gConfig->debugLevel++;
                }
            }
                break;
            case 'h':
                usage();
                exit(0);
                break;
            case 'V':
                printf("%s\n", VERSION_STRING);
                exit(0);
            case 'v':
                ++verbose;
                break;
            case 's':
                gConfig->serial = optarg;
                break;
            case 'a':
                gConfig->toolPathOverride = optarg;
                break;
            case 'c':
                sysconf_set_config_dir(optarg);
                break;
            case 'l':
                if (!*optarg) {
                    fatal("ERROR: --logfile requires a non-empty filename");
                    usage();
                    exit(2);
                }
                if (gConfig->useLogfile) {
                    fatal("ERROR: --logfile cannot be used multiple times");
                    exit(2);
                }
                if (!freopen(optarg, "a", stderr)) {
                    fatal("ERROR: freopen: %s", strerror(errno));
                } else {
                    gConfig->useLogfile = true;
                }
                break;
            case 't':
            {
                int secs = atoi(optarg);
                if (secs <= 0) {
                    fatal("ERROR: --timeout requires a positive number of seconds");
                    exit(2);
                }
                gConfig->discoveryTimeoutSec = (uint32_t)secs;
                break;
            }
            default:
                usage();
                exit(2);
        }
    }
}

#pragma mark printing

static void print_devices(const std::vector<Device> &devices){
    if (devices.empty()) {
        printf("No devices\n");
        return;
    }
    for (auto &d : devices) {
        printf("%s\t%s\t%s\n", d.displayName().c_str(), device_state_name(d.state()), d.persistentIdentity.c_str());
        for (auto &c : d.connections) {
            printf("    %-14s %-40s %s\n", transport_kind_name(c.kind), c.transportAddress.c_str(), device_state_name(c.state));
        }
    }
}

static void print_discovered(const std::vector<DiscoveredDevice> &devices){
    if (devices.empty()) {
        printf("No devices found on the local network\n");
        return;
    }
    for (auto &d : devices) {
        printf("%-16s %-32s %-16s %s%s\n", d.displayAddress().c_str(), d.name.c_str(), d.statusText().c_str(),
               d.serviceTypesDisplay().c_str(), d.isPaired ? " (paired before)" : "");
    }
}

static std::string format_time(time_t t){
    char buf[32] = {};
    struct tm tm = {};
    if (!t) return "-";
    localtime_r(&t, &tm);
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static void print_app(const InstalledApp &app){
    printf("%s\n", app.packageName.c_str());
    printf("  version:      %s (%lld)\n", app.versionName.size() ? app.versionName.c_str() : "-", (long long)app.versionCode);
    printf("  installed:    %s\n", format_time(app.firstInstallTime).c_str());
    printf("  updated:      %s\n", format_time(app.lastUpdateTime).c_str());
    printf("  system:       %s\n", app.isSystemApp ? "yes" : "no");
    printf("  enabled:      %s\n", app.isEnabled ? "yes" : "no");
}

#pragma mark helpers

static bool wait_for_termination(uint32_t timeoutSec = UINT32_MAX){
    uint64_t deadline = (uint64_t)time(NULL) + timeoutSec;
    while (!terminated && (uint64_t)time(NULL) < deadline) {
        usleep(100*1000);
    }
    return terminated;
}

static std::string select_device(DeviceManager &mgr){
    std::vector<Device> devices;
    Device dev;
    if (gConfig->serial.size()) {
        if (mgr.device_for(gConfig->serial, dev)) return dev.transportAddress();
        //not known to the device list, let adb decide
        return gConfig->serial;
    }
    devices = mgr.devices();
    if (devices.empty()) {
        retcustomerror(ADBException_deviceNotFound, "no device");
    }
    if (devices.size() > 1) {
        retcustomerror(ADBException_deviceNotFound, "more than one device, use -s");
    }
    return devices.front().transportAddress();
}

static std::string select_identity(DeviceManager &mgr){
    std::string addr = select_device(mgr);
    Device dev;
    if (!mgr.device_for(addr, dev)) {
        retcustomerror(ADBException_deviceNotFound, "%s",addr.c_str());
    }
    return dev.persistentIdentity;
}

static void discover_for(DiscoveryManager &discovery, uint32_t timeoutSec){
    discovery.start_scanning();
    info("browsing for %u seconds",timeoutSec);
    wait_for_termination(timeoutSec);
    discovery.stop_scanning();
    discovery.sync();
    if (discovery.scan_error().size()) {
        fatal("%s", discovery.scan_error().c_str());
    }
}

static app_list_filter app_filter_from_name(const std::string &name){
    if (name == "all") return APP_LIST_ALL;
    if (name == "third-party") return APP_LIST_THIRD_PARTY;
    if (name == "system") return APP_LIST_SYSTEM;
    if (name == "disabled") return APP_LIST_DISABLED;
    reterror("unknown app filter '%s'",name.c_str());
}

static uint16_t parse_port(const std::string &str){
    int port = atoi(str.c_str());
    retassure(port > 0 && port <= 0xffff, "invalid port '%s'",str.c_str());
    return (uint16_t)port;
}

#define NEED_ARGS(n) retassure(args.size() >= (n), "'%s' needs %d argument(s)",cmd.c_str(),(int)(n)-1)

static int run_command(std::vector<std::string> args, BridgeClient &bridge, DeviceManager &mgr, HistoryStore &history){
    std::string cmd = args.front();

    if (cmd == "version") {
        printf("%s\n", bridge.version().c_str());
        return 0;
    }

    if (cmd == "watch") {
        mgr.set_change_callback([&mgr]{
            printf("---\n");
            print_devices(mgr.devices());
            fflush(stdout);
        });
        if (gConfig->autoConnectLastDevices) mgr.reconnect_last_devices();
        mgr.refresh();
        print_devices(mgr.devices());
        fflush(stdout);
        mgr.startLoop();
        wait_for_termination();
        info("terminating");
        mgr.stopLoop();
        return 0;
    }

    if (cmd == "discover" || cmd == "pair" || (cmd == "connect" && args.size() >= 2 && adb_is_ipv4_address(args[1]))) {
        AvahiDiscoveryBrowser browser;
        DiscoveryManager discovery(&browser, &history);

        if (cmd == "discover") {
            discover_for(discovery, gConfig->discoveryTimeoutSec);
            print_discovered(discovery.devices());
            return 0;
        }
        NEED_ARGS(cmd == "pair" ? 3 : 2);
        discover_for(discovery, gConfig->discoveryTimeoutSec);
        if (cmd == "pair") {
            printf("Connected to %s\n", mgr.pair_and_connect(&discovery, args[1], args[2]).c_str());
        } else {
            printf("Connected to %s\n", mgr.connect_discovered(&discovery, args[1]).c_str());
        }
        return 0;
    }

    mgr.refresh();

    if (cmd == "devices") {
        if (gConfig->autoConnectLastDevices && mgr.reconnect_last_devices()) {
            debug("reconnected last devices");
        }
        print_devices(mgr.devices());
        return 0;
    }
    if (cmd == "connect") {
        NEED_ARGS(2);
        mgr.connect(args[1]);
        printf("Connected to %s\n", args[1].c_str());
        return 0;
    }
    if (cmd == "pair-address") {
        NEED_ARGS(3);
        printf("Connected to %s\n", mgr.pair_and_connect(args[1], args[2]).c_str());
        return 0;
    }
    if (cmd == "disconnect") {
        Device dev;
        if (args.size() >= 2 && !mgr.device_for(args[1], dev)) {
            //not in the device list, adb may still hold a stale session
            bridge.disconnect(args[1]);
            return 0;
        }
        mgr.disconnect(args.size() >= 2 ? dev.persistentIdentity : select_identity(mgr));
        return 0;
    }
    if (cmd == "tcpip") {
        uint16_t port = args.size() >= 2 ? parse_port(args[1]) : 0;
        tcpip_outcome res = mgr.enable_tcpip(select_identity(mgr), port);
        printf("TCP/IP enabled on port %u. %s\n", port ? port : gConfig->defaultTcpipPort, tcpip_outcome_description(res));
        return 0;
    }
    if (cmd == "rename") {
        NEED_ARGS(2);
        mgr.set_custom_name(select_identity(mgr), args[1]);
        return 0;
    }

    std::string addr = select_device(mgr);

    if (cmd == "shell") {
        std::string command;
        NEED_ARGS(2);
        for (size_t i = 1; i < args.size(); i++) {
            if (command.size()) command += ' ';
            command += args[i];
        }
        printf("%s\n", bridge.shell(addr, command).c_str());
    } else if (cmd == "text") {
        NEED_ARGS(2);
        bridge.input_text(addr, args[1]);
    } else if (cmd == "key") {
        int code = 0;
        NEED_ARGS(2);
        if (!android_key_code_from_name(args[1], code)) {
            code = atoi(args[1].c_str());
            retassure(code > 0, "unknown key '%s'",args[1].c_str());
        }
        bridge.input_keyevent(addr, code);
    } else if (cmd == "screencap") {
        std::vector<uint8_t> png;
        retassure(isatty(STDOUT_FILENO) == 0, "refusing to write binary data to a terminal");
        png = bridge.screencap(addr);
        retassure(fwrite(png.data(), 1, png.size(), stdout) == png.size(), "failed to write screenshot");
    } else if (cmd == "reverse") {
        NEED_ARGS(3);
        bridge.create_reverse_forward(addr, parse_port(args[1]), parse_port(args[2]));
    } else if (cmd == "reverse-list") {
        for (auto &f : bridge.list_reverse_forwards(addr)) {
            printf("device tcp:%u -> host tcp:%u\n", f.localPort, f.remotePort);
        }
    } else if (cmd == "reverse-remove") {
        NEED_ARGS(2);
        bridge.remove_reverse_forward(addr, parse_port(args[1]));
    } else if (cmd == "reverse-remove-all") {
        bridge.remove_all_reverse_forwards(addr);
    } else if (cmd == "forwards") {
        for (auto &f : bridge.list_forwards(addr)) {
            printf("host tcp:%u -> device tcp:%u\n", f.localPort, f.remotePort);
        }
    } else if (cmd == "apps") {
        app_list_filter filter = args.size() >= 2 ? app_filter_from_name(args[1]) : APP_LIST_ALL;
        std::vector<InstalledApp> apps = bridge.list_apps(addr);
        for (auto &app : apps) {
            if (filter == APP_LIST_THIRD_PARTY && app.isSystemApp) continue;
            if (filter == APP_LIST_SYSTEM && !app.isSystemApp) continue;
            if (filter == APP_LIST_DISABLED && app.isEnabled) continue;
            printf("%s%s%s\n", app.packageName.c_str(), app.isSystemApp ? " [system]" : "", app.isEnabled ? "" : " [disabled]");
        }
    } else if (cmd == "app-info") {
        NEED_ARGS(2);
        print_app(bridge.get_package_details(addr, args[1]));
    } else if (cmd == "launch") {
        NEED_ARGS(2);
        bridge.launch_app(addr, args[1]);
    } else if (cmd == "stop") {
        NEED_ARGS(2);
        bridge.force_stop_app(addr, args[1]);
    } else if (cmd == "enable") {
        NEED_ARGS(2);
        bridge.enable_app(addr, args[1]);
    } else if (cmd == "disable") {
        NEED_ARGS(2);
        bridge.disable_app(addr, args[1]);
    } else if (cmd == "settings") {
        NEED_ARGS(2);
        bridge.open_app_settings(addr, args[1]);
    } else if (cmd == "uninstall") {
        NEED_ARGS(2);
        bridge.uninstall_app(addr, args[1], args.size() >= 3 && args[2] == "--keep-data");
    } else if (cmd == "install") {
        std::shared_ptr<InstallHandle> handle;
        std::atomic<bool> finished{false};
        std::thread canceller;
        install_result res = INSTALL_SUCCEEDED;
        NEED_ARGS(2);

        handle = bridge.install_package(addr, args[1], [](const std::string &line){
            printf("%s\n", line.c_str());
            fflush(stdout);
        });
        canceller = std::thread([&]{
            while (!finished && !terminated) usleep(50*1000);
            if (terminated) handle->cancel();
        });
        cleanup([&]{
            finished = true;
            canceller.join();
        });
        res = handle->wait();
        if (res == INSTALL_CANCELLED) {
            printf("Installation cancelled\n");
            return 1;
        }
        printf("Installed %s\n", args[1].c_str());
    } else {
        fatal("unknown command '%s'", cmd.c_str());
        usage();
        return 2;
    }
    return 0;
}

int main(int argc, const char * argv[]) {
    int err = 0;
    std::vector<std::string> args;

    gConfig = new Config();
    parse_opts(argc,argv);

    if (gConfig->useSyslog) {
        verbose += LL_INFO;
        log_enable_syslog();
    } else {
        verbose += LL_WARNING;
    }
    if (gConfig->debugLevel) verbose = LL_DEBUG;

    // set log level to specified verbosity
    log_level = verbose;
    info("starting %s with log level %s", VERSION_STRING, log_level_name((enum loglevel)(verbose > LL_DEBUG ? LL_DEBUG : verbose)));

    try{
        gConfig->load();
    }catch(tihmstar::exception &e){
        fatal("Could not load config with error=%d (%s)",e.code(),e.what());
        creterror("failed to load config!");
    }

    for (int i = optind; i < argc; i++) args.push_back(argv[i]);
    if (args.empty()) {
        usage();
        err = 2;
        goto error;
    }

    try {
        set_signal_handlers();
    } catch (tihmstar::exception &e) {
        creterror("failed to set signal handlers with error=%d (%s)",e.code(),e.what());
    }

    try {
        ProcessRunner runner;
        ToolLocator locator(&runner);
        BridgeClient bridge(&runner, &locator);
        PlistHistoryStore history(PlistHistoryStore::defaultPath());
        DeviceManager mgr(&bridge, &history, *gConfig);

        if (gConfig->effectiveToolPath().size()) {
            locator.setCustomPath(gConfig->effectiveToolPath());
        }
        err = run_command(args, bridge, mgr, history);
    } catch (tihmstar::ADBException &e) {
        fprintf(stderr, "%s\n", adb_error_description(e).c_str());
        debug("error=%d kind=%s (%s)",e.code(),adb_error_kind_name(e.kind()),e.what());
        err = 1;
    } catch (tihmstar::exception &e) {
        fprintf(stderr, "%s\n", e.what());
        debug("error=%d",e.code());
        err = 1;
    }

error:
    if (gConfig){
        Config *cfg = gConfig; gConfig = nullptr;
        delete cfg;
    }
    return err;
}
