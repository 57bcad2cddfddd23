//
//  OutputParser.cpp
//  adbhub
//
//  Created on 18.05.25.
//

#include "OutputParser.hpp"
#include "../Process/ProcessRunner.hpp"

#include <ctype.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define MAX_VERSION_NAME_LEN 100 //characters, not bytes

static bool has_prefix(const std::string &str, const char *prefix) noexcept{
    return strncmp(str.c_str(), prefix, strlen(prefix)) == 0;
}

static bool parse_uint(const std::string &str, uint64_t maxVal, uint64_t &out) noexcept{
    uint64_t val = 0;
    if (str.empty() || str.size() > 19) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
        val = val*10 + (c - '0');
    }
    if (val > maxVal) return false;
    out = val;
    return true;
}

/*
 First maxChars UTF-8 characters of str.
 Never cuts inside a multibyte sequence.
 */
static std::string utf8_prefix(const std::string &str, size_t maxChars) noexcept{
    size_t chars = 0;
    for (size_t i = 0; i < str.size(); i++) {
        if (((uint8_t)str[i] & 0xC0) == 0x80) continue; //continuation byte
        if (chars++ == maxChars) return str.substr(0, i);
    }
    return str;
}

static bool parse_tcp_port(const std::string &str, uint16_t &port) noexcept{
    uint64_t val = 0;
    if (!has_prefix(str, "tcp:")) return false;
    if (!parse_uint(str.substr(4), 0xffff, val)) return false;
    port = (uint16_t)val;
    return true;
}

std::vector<std::string> adb_split_lines(const std::string &output){
    std::vector<std::string> ret;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();
        ret.push_back(output.substr(start, end-start));
        start = end+1;
    }
    return ret;
}

std::vector<std::string> adb_split_whitespace(const std::string &line){
    std::vector<std::string> ret;
    size_t pos = 0;
    while ((pos = line.find_first_not_of(" \t\r", pos)) != std::string::npos) {
        size_t end = line.find_first_of(" \t\r", pos);
        if (end == std::string::npos) end = line.size();
        ret.push_back(line.substr(pos, end-pos));
        pos = end;
    }
    return ret;
}

#pragma mark devices
bool adb_is_ipv4_address(const std::string &str) noexcept{
    int parts = 0;
    size_t start = 0;
    while (true) {
        uint64_t octet = 0;
        size_t end = str.find('.', start);
        std::string part = str.substr(start, end == std::string::npos ? std::string::npos : end-start);
        if (part.size() > 3 || !parse_uint(part, 255, octet)) return false;
        parts++;
        if (end == std::string::npos) break;
        start = end+1;
    }
    return parts == 4;
}

transport_kind adb_classify_transport(const std::string &transportAddress, std::string *ip, uint16_t *port){
    if (transportAddress.find("._adb-tls-connect._tcp") != std::string::npos
        || (has_prefix(transportAddress, "adb-") && transportAddress.find("._tcp") != std::string::npos)) {
        return TRANSPORT_WIRELESS_DEBUG;
    }

    size_t colon = transportAddress.rfind(':');
    if (colon != std::string::npos) {
        std::string host = transportAddress.substr(0, colon);
        uint64_t portVal = 0;
        if (adb_is_ipv4_address(host) && parse_uint(transportAddress.substr(colon+1), 0xffff, portVal)) {
            if (ip) *ip = host;
            if (port) *port = (uint16_t)portVal;
            return TRANSPORT_WIFI;
        }
    }

    return TRANSPORT_USB;
}

bool adb_parse_device_line(const std::string &line, DeviceConnection &conn){
    std::vector<std::string> tokens = adb_split_whitespace(line);
    if (tokens.size() < 2) return false;

    conn = {};
    conn.transportAddress = tokens[0];
    conn.state = device_state_from_string(tokens[1]);

    for (size_t i = 2; i < tokens.size(); i++) {
        const std::string &t = tokens[i];
        if (has_prefix(t, "model:")) {
            conn.model = t.substr(6);
            for (auto &c : conn.model) {
                if (c == '_') c = ' ';
            }
        } else if (has_prefix(t, "product:")) {
            conn.product = t.substr(8);
        } else if (has_prefix(t, "transport_id:")) {
            conn.transportId = t.substr(13);
        }
    }

    conn.kind = adb_classify_transport(conn.transportAddress, &conn.ip, &conn.port);
    return true;
}

std::vector<DeviceConnection> adb_parse_device_list(const std::string &output){
    std::vector<DeviceConnection> ret;
    for (auto &rawLine : adb_split_lines(output)) {
        std::string line = trim_whitespace(rawLine);
        if (line.empty() || has_prefix(line, "List of devices") || has_prefix(line, "*")) continue;
        DeviceConnection conn;
        if (adb_parse_device_line(line, conn)) {
            ret.push_back(conn);
        }
    }
    return ret;
}

#pragma mark port forwards
static std::vector<PortForward> parse_forward_lines(const std::string &output, bool isReverse){
    std::vector<PortForward> ret;
    for (auto &line : adb_split_lines(output)) {
        std::vector<std::string> tokens = adb_split_whitespace(line);
        PortForward fwd;
        if (tokens.size() != 3) continue;
        if (!parse_tcp_port(tokens[1], fwd.localPort)) continue;
        if (!parse_tcp_port(tokens[2], fwd.remotePort)) continue;
        fwd.transportAddress = tokens[0];
        fwd.isReverse = isReverse;
        ret.push_back(fwd);
    }
    return ret;
}

std::vector<PortForward> adb_parse_reverse_list(const std::string &output){
    //<transport> tcp:<device port> tcp:<host port>
    return parse_forward_lines(output, true);
}

std::vector<PortForward> adb_parse_forward_list(const std::string &output){
    //<serial> tcp:<host port> tcp:<device port>
    return parse_forward_lines(output, false);
}

#pragma mark packages
std::vector<std::string> adb_parse_package_list(const std::string &output){
    std::vector<std::string> ret;
    for (auto &rawLine : adb_split_lines(output)) {
        std::string line = trim_whitespace(rawLine);
        if (!has_prefix(line, "package:")) continue;
        std::string name = line.substr(8);
        if (name.size()) ret.push_back(name);
    }
    return ret;
}

bool adb_parse_date(const std::string &str, time_t &out) noexcept{
    struct tm tm = {};
    int consumed = 0;
    if (str.size() != 19) return false;
    if (sscanf(str.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
               &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6 || consumed != 19) {
        return false;
    }
    if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31
        || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return false;
    }
    int wantDay = tm.tm_mday;
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    tm.tm_isdst = -1;
    time_t t = mktime(&tm);
    if (t == (time_t)-1 || tm.tm_mday != wantDay) return false; //e.g. Feb 30 got normalized
    out = t;
    return true;
}

InstalledApp adb_parse_package_details(const std::string &packageName, const std::string &dump){
    InstalledApp app;
    app.packageName = packageName;
    app.detailsLoaded = true;

    for (auto &rawLine : adb_split_lines(dump)) {
        std::string line = trim_whitespace(rawLine);

        if (has_prefix(line, "versionName=")) {
            app.versionName = utf8_prefix(line.substr(12), MAX_VERSION_NAME_LEN);
        } else if (has_prefix(line, "versionCode=")) {
            std::string code = line.substr(12);
            uint64_t val = 0;
            code = code.substr(0, code.find(' '));
            if (parse_uint(code, INT64_MAX, val)) app.versionCode = (int64_t)val;
        } else if (has_prefix(line, "firstInstallTime=")) {
            time_t t = 0;
            if (adb_parse_date(line.substr(17), t)) app.firstInstallTime = t;
        } else if (has_prefix(line, "lastUpdateTime=")) {
            time_t t = 0;
            if (adb_parse_date(line.substr(15), t)) app.lastUpdateTime = t;
        } else if (line.find("pkgFlags=") != std::string::npos && line.find("SYSTEM") != std::string::npos) {
            app.isSystemApp = true;
        } else if (has_prefix(line, "enabled=")) {
            std::string val = trim_whitespace(line.substr(8));
            for (auto &c : val) c = tolower(c);
            if (val == "0" || val == "false") app.isEnabled = false;
        }
    }

    //explicit disabled markers win wherever they appear
    if (dump.find("packageFlags=[ HIDDEN ]") != std::string::npos
        || dump.find("DISABLED") != std::string::npos
        || dump.find("enabledState=COMPONENT_ENABLED_STATE_DISABLED") != std::string::npos) {
        app.isEnabled = false;
    }

    return app;
}
