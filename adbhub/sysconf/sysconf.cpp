//
//  sysconf.cpp
//  adbhub
//
//  Created on 21.05.25.
//

#include "sysconf.hpp"

#include <errno.h>
#include <fcntl.h>
#include <libgen.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <mutex>

#include <libgeneral/macros.h>

#define CONFIG_DIR_NAME "adbhub"
#define CONFIG_FILE "Config.plist"

static std::string gConfigDir;
static std::mutex gConfigLck;

void sysconf_set_config_dir(const std::string &dir){
    std::unique_lock<std::mutex> ul(gConfigLck);
    gConfigDir = dir;
}

std::string sysconf_get_config_dir(){
    {
        std::unique_lock<std::mutex> ul(gConfigLck);
        if (gConfigDir.size()) return gConfigDir;
    }
    if (const char *dir = getenv("ADBHUB_CONFIG_DIR")) {
        if (*dir) return dir;
    }
    if (const char *xdg = getenv("XDG_CONFIG_HOME")) {
        if (*xdg) return std::string(xdg) + "/" CONFIG_DIR_NAME;
    }
    const char *home = getenv("HOME");
    retassure(home && *home, "Neither XDG_CONFIG_HOME nor HOME is set, can't find config dir");
    return std::string(home) + "/.config/" CONFIG_DIR_NAME;
}

static void mkdir_with_parents(const char *dir, int mode){
    char *parent = NULL;
    cleanup([&]{
        safeFree(parent);
    });
    char* parentdir = NULL; //not allocated

    if (mkdir(dir, mode) == 0 || errno == EEXIST) {
        return;
    }
    retassure(errno == ENOENT, "mkdir(%s) failed: %s",dir,strerror(errno));

    assure(parent = strdup(dir));
    assure(parentdir = dirname(parent));
    mkdir_with_parents(parentdir, mode);
    retassure(mkdir(dir, mode) == 0 || errno == EEXIST, "mkdir(%s) failed: %s",dir,strerror(errno));
}

std::string sysconf_get_config_path(const char *filename){
    std::string dir = sysconf_get_config_dir();
    struct stat st{};

    if (stat(dir.c_str(), &st) != 0) {
        mkdir_with_parents(dir.c_str(), 0755);
    }
    return dir + "/" + filename;
}

plist_t sysconf_read_plist(const std::string &path){
    int fd = -1;
    char *fbuf = NULL;
    cleanup([&]{
        safeFree(fbuf);
        safeClose(fd);
    });
    struct stat finfo = {};

    retassure((fd = open(path.c_str(), O_RDONLY))>0, "Failed to read plist at path '%s'",path.c_str());
    assure(!fstat(fd, &finfo));
    retassure(finfo.st_size > 0, "plist at path '%s' is empty",path.c_str());

    assure(fbuf = (char*)malloc(finfo.st_size));

    assure(read(fd, fbuf, finfo.st_size) == finfo.st_size);

    {
        plist_t pl = NULL;
        plist_from_memory(fbuf, (uint32_t)finfo.st_size, &pl, NULL);
        retassure(pl, "failed to parse plist at path '%s'",path.c_str());
        return pl;
    }
}

void sysconf_write_plist(plist_t plist, const std::string &path){
    char *buf = NULL;
    FILE * saveFile = NULL;
    cleanup([&]{
        safeFree(buf);
        safeFreeCustom(saveFile, fclose);
    });
    uint32_t bufLen = 0;
    plist_to_xml(plist, &buf, &bufLen);
    retassure(buf, "Failed to serialize plist for '%s'",path.c_str());

    retassure(saveFile = fopen(path.c_str(), "w"), "Failed to write plist file to=%s",path.c_str());
    assure(fwrite(buf, 1, bufLen, saveFile) == bufLen);
}

plist_t sysconf_get_value(const std::string &key){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });
    plist_t p_val = NULL;

    p_config = sysconf_read_plist(sysconf_get_config_path(CONFIG_FILE));

    retassure(p_val = plist_dict_get_item(p_config, key.c_str()), "Failed to get value for key '%s'",key.c_str());

    return plist_copy(p_val);
}

void sysconf_set_value(const std::string &key, plist_t val){
    plist_t p_config = NULL;
    cleanup([&]{
        safeFreeCustom(p_config, plist_free);
    });
    std::string filepath = sysconf_get_config_path(CONFIG_FILE);

    try {
        p_config = sysconf_read_plist(filepath);
    } catch (tihmstar::exception &e) {
        warning("%s: Reading %s failed! Regenerating!",__func__,CONFIG_FILE);
        p_config = plist_new_dict();
    }

    plist_dict_set_item(p_config, key.c_str(), plist_copy(val));
    sysconf_write_plist(p_config, filepath);
}

#pragma mark config
bool sysconf_try_getconfig_bool(const std::string &key, bool defaultValue){
    plist_t p_boolVal = NULL;
    cleanup([&]{
        safeFreeCustom(p_boolVal, plist_free);
    });
    try {
        p_boolVal = sysconf_get_value(key);
        assure(plist_get_node_type(p_boolVal) == PLIST_BOOLEAN);
        return plist_bool_val_is_true(p_boolVal);
    } catch (tihmstar::exception &e) {
        warning("Failed to get %s! setting it to default val",key.c_str());
        safeFreeCustom(p_boolVal, plist_free);
        p_boolVal = plist_new_bool(defaultValue);
        sysconf_set_value(key, p_boolVal);
        return defaultValue;
    }
}

uint64_t sysconf_try_getconfig_uint(const std::string &key, uint64_t defaultValue){
    plist_t p_uintVal = NULL;
    cleanup([&]{
        safeFreeCustom(p_uintVal, plist_free);
    });
    try {
        uint64_t val = 0;
        p_uintVal = sysconf_get_value(key);
        assure(plist_get_node_type(p_uintVal) == PLIST_UINT);
        plist_get_uint_val(p_uintVal, &val);
        return val;
    } catch (tihmstar::exception &e) {
        warning("Failed to get %s! setting it to default val",key.c_str());
        safeFreeCustom(p_uintVal, plist_free);
        p_uintVal = plist_new_uint(defaultValue);
        sysconf_set_value(key, p_uintVal);
        return defaultValue;
    }
}

std::string sysconf_try_getconfig_string(const std::string &key, const std::string &defaultValue){
    plist_t p_strVal = NULL;
    cleanup([&]{
        safeFreeCustom(p_strVal, plist_free);
    });
    try {
        const char *str = NULL;
        uint64_t str_len = 0;
        p_strVal = sysconf_get_value(key);
        assure(plist_get_node_type(p_strVal) == PLIST_STRING);
        retassure(str = plist_get_string_ptr(p_strVal, &str_len), "Failed to get str ptr for '%s'",key.c_str());
        return std::string(str,str_len);
    } catch (tihmstar::exception &e) {
        warning("Failed to get %s! setting it to default val",key.c_str());
        safeFreeCustom(p_strVal, plist_free);
        p_strVal = plist_new_string(defaultValue.c_str());
        sysconf_set_value(key, p_strVal);
        return defaultValue;
    }
}

Config::Config() :
//config
useCustomToolPath(false),
defaultTcpipPort(DEFAULT_TCPIP_PORT),
refreshIntervalMs(DEFAULT_REFRESH_INTERVAL_MS),
missedPollsBeforeRemoval(1),
autoConnectLastDevices(false),
//commandline
debugLevel(0),
useLogfile(false),
useSyslog(false),
discoveryTimeoutSec(5)
{
    //empty
}

void Config::load(){
    uint64_t port = 0;
    uint64_t interval = 0;
    uint64_t missed = 0;

    //config
    useCustomToolPath = sysconf_try_getconfig_bool("useCustomToolPath", false);
    customToolPath = sysconf_try_getconfig_string("customToolPath", "");
    port = sysconf_try_getconfig_uint("defaultTcpipPort", DEFAULT_TCPIP_PORT);
    interval = sysconf_try_getconfig_uint("refreshInterval", DEFAULT_REFRESH_INTERVAL_MS);
    missed = sysconf_try_getconfig_uint("missedPollsBeforeRemoval", 1);
    autoConnectLastDevices = sysconf_try_getconfig_bool("autoConnectLastDevices", false);

    if (port == 0 || port > 0xffff) {
        warning("defaultTcpipPort=%llu is invalid, using %d",(unsigned long long)port,DEFAULT_TCPIP_PORT);
        port = DEFAULT_TCPIP_PORT;
    }
    if (interval < 250) {
        warning("refreshInterval=%llu ms is too short, using 250 ms",(unsigned long long)interval);
        interval = 250;
    }
    if (missed == 0) missed = 1;

    defaultTcpipPort = (uint16_t)port;
    refreshIntervalMs = (uint32_t)interval;
    missedPollsBeforeRemoval = (uint32_t)missed;
    info("Loaded config");
}

void Config::save(){
    plist_t p_val = NULL;
    cleanup([&]{
        safeFreeCustom(p_val, plist_free);
    });

    p_val = plist_new_bool(useCustomToolPath);
    sysconf_set_value("useCustomToolPath", p_val);
    plist_free(p_val); p_val = plist_new_string(customToolPath.c_str());
    sysconf_set_value("customToolPath", p_val);
    plist_free(p_val); p_val = plist_new_uint(defaultTcpipPort);
    sysconf_set_value("defaultTcpipPort", p_val);
    plist_free(p_val); p_val = plist_new_uint(refreshIntervalMs);
    sysconf_set_value("refreshInterval", p_val);
    plist_free(p_val); p_val = plist_new_uint(missedPollsBeforeRemoval);
    sysconf_set_value("missedPollsBeforeRemoval", p_val);
    plist_free(p_val); p_val = plist_new_bool(autoConnectLastDevices);
    sysconf_set_value("autoConnectLastDevices", p_val);
    info("Saved config");
}

std::string Config::effectiveToolPath() const{
    if (toolPathOverride.size()) return toolPathOverride;
    if (useCustomToolPath) return customToolPath;
    return {};
}
