//
//  OutputParser.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef OutputParser_hpp
#define OutputParser_hpp

#include "../Devices/Transport.hpp"
#include "../Devices/PortForward.hpp"
#include "../Devices/InstalledApp.hpp"

#include <string>
#include <vector>

/*
 Stateless parsers for the textual output of the bridge tool.
 Lines that don't have the expected shape are skipped, never fatal.
 */

std::vector<DeviceConnection> adb_parse_device_list(const std::string &output);
bool adb_parse_device_line(const std::string &line, DeviceConnection &conn);
transport_kind adb_classify_transport(const std::string &transportAddress, std::string *ip = nullptr, uint16_t *port = nullptr);
bool adb_is_ipv4_address(const std::string &str) noexcept;

std::vector<PortForward> adb_parse_reverse_list(const std::string &output);
std::vector<PortForward> adb_parse_forward_list(const std::string &output);

std::vector<std::string> adb_parse_package_list(const std::string &output);
InstalledApp adb_parse_package_details(const std::string &packageName, const std::string &dump);

/*
 "yyyy-MM-dd HH:mm:ss" in local time.
 Returns false for anything else.
 */
bool adb_parse_date(const std::string &str, time_t &out) noexcept;

std::vector<std::string> adb_split_lines(const std::string &output);
std::vector<std::string> adb_split_whitespace(const std::string &line);

#endif /* OutputParser_hpp */
