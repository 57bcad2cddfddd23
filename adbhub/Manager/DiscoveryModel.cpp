//
//  DiscoveryModel.cpp
//  adbhub
//
//  Created on 22.05.25.
//

#include "DiscoveryModel.hpp"

#include <arpa/inet.h>

#include <algorithm>

#include <libgeneral/macros.h>

static uint32_t ipv4_value(const std::string &host) noexcept{
    struct in_addr addr = {};
    if (inet_pton(AF_INET, host.c_str(), &addr) != 1) return 0;
    return ntohl(addr.s_addr);
}

DiscoveryModel::DiscoveryModel(HistoryStore *history)
: _history(history)
{
    //
}

std::string DiscoveryModel::service_key(const std::string &name, service_type type){
    return name + "-" + service_type_dnssd_name(type);
}

bool DiscoveryModel::is_admissible(const std::string &host, uint16_t port) noexcept{
    struct in_addr addr = {};
    if (port == 0) return false;
    return inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

bool DiscoveryModel::add_service(const AdvertisedService &svc){
    if (!is_admissible(svc.host, svc.port)) {
        debug("[DiscoveryModel] rejecting '%s' at '%s':%u",svc.name.c_str(),svc.host.c_str(),svc.port);
        return false;
    }
    _services[service_key(svc.name, svc.type)] = svc;
    rebuild();
    return true;
}

bool DiscoveryModel::remove_service(const std::string &name, service_type type){
    if (!_services.erase(service_key(name, type))) return false;
    rebuild();
    return true;
}

void DiscoveryModel::set_connecting(const std::string &host, bool connecting){
    if (connecting) {
        _connectingHosts.insert(host);
    } else {
        _connectingHosts.erase(host);
    }
    rebuild();
}

void DiscoveryModel::mark_paired(const std::string &host){
    _pairedHosts.insert(host);
    rebuild();
}

void DiscoveryModel::reset(){
    _services.clear();
    _devices.clear();
}

void DiscoveryModel::rebuild(){
    std::map<std::string, DiscoveredDevice> byHost;

    //map order makes the result independent of event order
    for (auto &e : _services) {
        const AdvertisedService &svc = e.second;
        DiscoveredDevice &dev = byHost[svc.host];
        if (dev.host.empty()) {
            dev.host = svc.host;
            dev.name = svc.name;
        } else if (svc.name.size() < dev.name.size() || (svc.name.size() == dev.name.size() && svc.name < dev.name)) {
            dev.name = svc.name;
        }
        if (!dev.service(svc.type)) {
            dev.services.push_back({svc.type, svc.port});
        }
    }

    _devices.clear();
    for (auto &e : byHost) {
        DiscoveredDevice &dev = e.second;
        std::sort(dev.services.begin(), dev.services.end(), [](const ServiceInfo &a, const ServiceInfo &b){
            return a.type < b.type;
        });
        dev.isPaired = _pairedHosts.count(dev.host) || (_history && _history->has_address(dev.host));
        dev.isConnecting = _connectingHosts.count(dev.host) != 0;
        _devices.push_back(dev);
    }

    std::sort(_devices.begin(), _devices.end(), [](const DiscoveredDevice &a, const DiscoveredDevice &b){
        return ipv4_value(a.host) < ipv4_value(b.host);
    });
}
