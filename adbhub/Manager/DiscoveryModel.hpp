//
//  DiscoveryModel.hpp
//  adbhub
//
//  Created on 22.05.25.
//

#ifndef DiscoveryModel_hpp
#define DiscoveryModel_hpp

#include "../Devices/DiscoveredDevice.hpp"
#include "../sysconf/HistoryStore.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

struct AdvertisedService{
    std::string name;
    service_type type;
    std::string host;
    uint16_t port;
};

/*
 The raw advertisement map is the source of truth.
 The DiscoveredDevice list is rebuilt from it on every change,
 connecting/paired flags live in per-host overlays.
 Not thread safe, owned by a single reconciler.
 */
class DiscoveryModel{
    HistoryStore *_history; //not owned, may be null
    std::map<std::string, AdvertisedService> _services;
    std::set<std::string> _pairedHosts;
    std::set<std::string> _connectingHosts;
    std::vector<DiscoveredDevice> _devices;

public:
    DiscoveryModel(HistoryStore *history);

    static std::string service_key(const std::string &name, service_type type);
    static bool is_admissible(const std::string &host, uint16_t port) noexcept;

    /*
     Return true if the derived view was rebuilt.
     */
    bool add_service(const AdvertisedService &svc);
    bool remove_service(const std::string &name, service_type type);
    void set_connecting(const std::string &host, bool connecting);
    void mark_paired(const std::string &host);

    void reset();
    void rebuild();

    const std::vector<DiscoveredDevice> &devices() const noexcept {return _devices;}
    size_t serviceCount() const noexcept {return _services.size();}
};

#endif /* DiscoveryModel_hpp */
