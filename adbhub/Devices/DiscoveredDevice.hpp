//
//  DiscoveredDevice.hpp
//  adbhub
//
//  Created on 20.05.25.
//

#ifndef DiscoveredDevice_hpp
#define DiscoveredDevice_hpp

#include <stdint.h>
#include <string>
#include <vector>

//order is display priority
enum service_type{
    SERVICE_TLS_CONNECT = 0,
    SERVICE_TLS_PAIRING,
    SERVICE_LEGACY,
    SERVICE_TYPE_COUNT
};

const char *service_type_dnssd_name(service_type type) noexcept; //"_adb-tls-connect._tcp"
const char *service_type_display_name(service_type type) noexcept;
bool service_type_from_dnssd_name(const std::string &name, service_type &type) noexcept;

struct ServiceInfo{
    service_type type;
    uint16_t port;
};

/*
 Derived view: one record per resolved IPv4 host.
 Rebuilt from the advertisement map on every change, never patched in place.
 */
struct DiscoveredDevice{
    std::string host;
    std::string name;
    std::vector<ServiceInfo> services; //sorted by type priority, one per type
    bool isPaired;
    bool isConnecting;

    DiscoveredDevice() : isPaired(false), isConnecting(false) {}

    const ServiceInfo *service(service_type type) const noexcept;
    const ServiceInfo *connectService() const noexcept;
    const ServiceInfo *pairingService() const noexcept;
    bool canConnect() const noexcept {return connectService() != nullptr;}
    bool canPair() const noexcept {return pairingService() != nullptr;}

    std::string connectAddress() const;    //empty if not connectable
    std::string pairingAddress() const;    //empty if not pairable
    std::string displayAddress() const;
    std::string statusText() const;
    std::string serviceTypesDisplay() const;

    bool operator==(const DiscoveredDevice &o) const;
};

#endif /* DiscoveredDevice_hpp */
