//
//  DeviceIdentifier.hpp
//  adbhub
//
//  Created on 24.05.25.
//

#ifndef DeviceIdentifier_hpp
#define DeviceIdentifier_hpp

#include "../Bridge/BridgeClient.hpp"
#include "../Devices/Transport.hpp"

#include <map>
#include <mutex>
#include <string>

#define PROP_SERIALNO   "ro.serialno"
#define PROP_MODEL      "ro.product.model"
#define PROP_BRAND      "ro.product.brand"

/*
 Maps a transport address to the persistent identity of the device behind it.
 Only devices in state "device" can be queried, their identity is cached
 until the transport address disappears.
 */
class DeviceIdentifier{
    BridgeClient *_bridge; //not owned
    std::mutex _cacheLck;
    std::map<std::string, std::string> _cache; //transport address -> identity

public:
    DeviceIdentifier(BridgeClient *bridge);

    static std::string provisional_identity(const DeviceConnection &conn);
    static std::string composite_identity(const std::string &brand, const std::string &model, const DeviceConnection &conn);

    std::string identify(const DeviceConnection &conn);
    bool is_cached(const std::string &transportAddress);
    void forget(const std::string &transportAddress);
    void forget_all();
};

#endif /* DeviceIdentifier_hpp */
