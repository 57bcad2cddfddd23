//
//  ServiceBrowser.hpp
//  adbhub
//
//  Created on 22.05.25.
//

#ifndef ServiceBrowser_hpp
#define ServiceBrowser_hpp

#include "../Devices/DiscoveredDevice.hpp"

#include <stdint.h>
#include <functional>
#include <string>

struct DiscoveryEvent{
    enum kind_t{
        SESSION_STARTED = 0,
        SESSION_STOPPED,
        SERVICE_RESOLVED,
        SERVICE_REMOVED,
        BROWSE_FAILED,
        OVERLAY_CONNECTING,
        OVERLAY_PAIRED,
        BARRIER
    };
    kind_t kind;
    uint64_t session;
    std::string name;
    service_type type;
    std::string host;
    uint16_t port;
    bool flag;
    std::string message;

    DiscoveryEvent() : kind(BARRIER), session(0), type(SERVICE_TLS_CONNECT), port(0), flag(false) {}
    DiscoveryEvent(kind_t k) : kind(k), session(0), type(SERVICE_TLS_CONNECT), port(0), flag(false) {}
};

/*
 Abstract class
 Browses the three adb service types and resolves every advertisement.
 Events may be emitted from any thread.
 */
class ServiceBrowser{
public:
    typedef std::function<void(DiscoveryEvent ev)> event_sink;

    virtual ~ServiceBrowser() {}

    virtual void start(event_sink sink) = 0;

    /*
     Cancels browsing and all in-flight resolves.
     The sink is not called anymore once this returns.
     */
    virtual void stop() noexcept = 0;
};

#endif /* ServiceBrowser_hpp */
