//
//  DiscoveredDevice.cpp
//  adbhub
//
//  Created on 20.05.25.
//

#include "DiscoveredDevice.hpp"


static const char *gServiceTypeNames[SERVICE_TYPE_COUNT] = {
    "_adb-tls-connect._tcp",
    "_adb-tls-pairing._tcp",
    "_adb._tcp"
};

const char *service_type_dnssd_name(service_type type) noexcept{
    if (type < 0 || type >= SERVICE_TYPE_COUNT) return "";
    return gServiceTypeNames[type];
}

const char *service_type_display_name(service_type type) noexcept{
    switch (type) {
        case SERVICE_TLS_CONNECT:   return "Wireless Debug";
        case SERVICE_TLS_PAIRING:   return "Pairing Mode";
        case SERVICE_LEGACY:        return "Legacy ADB";
        default:                    return "Unknown";
    }
}

bool service_type_from_dnssd_name(const std::string &name, service_type &type) noexcept{
    std::string n = name;
    if (n.size() && n.back() == '.') n.pop_back();
    if (n.size() > 6 && n.compare(n.size()-6, 6, ".local") == 0) n.resize(n.size()-6);
    for (int i = 0; i < SERVICE_TYPE_COUNT; i++) {
        if (n == gServiceTypeNames[i]) {
            type = (service_type)i;
            return true;
        }
    }
    return false;
}

#pragma mark DiscoveredDevice
const ServiceInfo *DiscoveredDevice::service(service_type type) const noexcept{
    for (auto &s : services) {
        if (s.type == type) return &s;
    }
    return nullptr;
}

const ServiceInfo *DiscoveredDevice::connectService() const noexcept{
    if (const ServiceInfo *s = service(SERVICE_TLS_CONNECT)) return s;
    return service(SERVICE_LEGACY);
}

const ServiceInfo *DiscoveredDevice::pairingService() const noexcept{
    return service(SERVICE_TLS_PAIRING);
}

std::string DiscoveredDevice::connectAddress() const{
    const ServiceInfo *s = connectService();
    if (!s) return {};
    return host + ":" + std::to_string(s->port);
}

std::string DiscoveredDevice::pairingAddress() const{
    const ServiceInfo *s = pairingService();
    if (!s) return {};
    return host + ":" + std::to_string(s->port);
}

std::string DiscoveredDevice::displayAddress() const{
    if (const ServiceInfo *s = connectService()) return host + ":" + std::to_string(s->port);
    if (const ServiceInfo *s = pairingService()) return host + ":" + std::to_string(s->port);
    return host;
}

std::string DiscoveredDevice::statusText() const{
    if (canPair() && !canConnect()) return "Ready to pair";
    if (canConnect()) return "Ready to connect";
    return "Available";
}

std::string DiscoveredDevice::serviceTypesDisplay() const{
    std::string ret;
    for (auto &s : services) {
        if (ret.size()) ret += " • ";
        ret += service_type_display_name(s.type);
    }
    return ret;
}

bool DiscoveredDevice::operator==(const DiscoveredDevice &o) const{
    if (host != o.host || name != o.name || isPaired != o.isPaired || isConnecting != o.isConnecting) return false;
    if (services.size() != o.services.size()) return false;
    for (size_t i = 0; i < services.size(); i++) {
        if (services[i].type != o.services[i].type || services[i].port != o.services[i].port) return false;
    }
    return true;
}
