//
//  sysconf.hpp
//  adbhub
//
//  Created on 21.05.25.
//

#ifndef sysconf_hpp
#define sysconf_hpp

#include <plist/plist.h>
#include <stdint.h>
#include <string>

#define DEFAULT_TCPIP_PORT 5555
#define DEFAULT_REFRESH_INTERVAL_MS 2000

/*
 Config directory: explicit override > $ADBHUB_CONFIG_DIR > $XDG_CONFIG_HOME/adbhub > ~/.config/adbhub
 */
void sysconf_set_config_dir(const std::string &dir);
std::string sysconf_get_config_dir();
std::string sysconf_get_config_path(const char *filename);

plist_t sysconf_read_plist(const std::string &path);
void sysconf_write_plist(plist_t plist, const std::string &path);

plist_t sysconf_get_value(const std::string &key);
void sysconf_set_value(const std::string &key, plist_t val);

bool sysconf_try_getconfig_bool(const std::string &key, bool defaultValue);
uint64_t sysconf_try_getconfig_uint(const std::string &key, uint64_t defaultValue);
std::string sysconf_try_getconfig_string(const std::string &key, const std::string &defaultValue);

class Config{
public:
    //config
    bool useCustomToolPath;
    std::string customToolPath;
    uint16_t defaultTcpipPort;
    uint32_t refreshIntervalMs;
    uint32_t missedPollsBeforeRemoval;
    bool autoConnectLastDevices;

    //commandline
    int debugLevel;
    bool useLogfile;
    bool useSyslog;
    std::string serial;
    std::string toolPathOverride;
    uint32_t discoveryTimeoutSec;

    Config();
    void load();
    void save();

    std::string effectiveToolPath() const;
};

#endif /* sysconf_hpp */
