//
//  ServiceBrowser-avahi.hpp
//  adbhub
//
//  Created on 22.05.25.
//

#ifndef ServiceBrowser_avahi_hpp
#define ServiceBrowser_avahi_hpp

#include "ServiceBrowser.hpp"

#include <libgeneral/Manager.hpp>

#include <avahi-common/simple-watch.h>
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>

#include <map>
#include <mutex>

#define AVAHI_RESOLVE_TIMEOUT_MS 10000
#define AVAHI_POLL_SLICE_MS 250

/*
 One browse session: its own poll loop, client, browsers and resolvers.
 A tihmstar::Manager only runs once, so every start() gets a fresh session.
 */
class AvahiBrowseSession : public tihmstar::Manager{
    ServiceBrowser::event_sink _sink;
    AvahiSimplePoll *_simple_poll;
    AvahiClient *_avahi_client;
    AvahiServiceBrowser *_avahi_sb[SERVICE_TYPE_COUNT];
    std::map<AvahiServiceResolver *, uint64_t> _resolvers; //resolver -> start time, loop thread only

    virtual bool loopEvent() override;
    virtual void stopAction() noexcept override;

    void emit(DiscoveryEvent ev) noexcept;
    void sweep_resolvers() noexcept;
public:
    AvahiBrowseSession(ServiceBrowser::event_sink sink);
    virtual ~AvahiBrowseSession() override;

    friend void avahi_client_callback(AvahiClient *c, AvahiClientState state, void* userdata) noexcept;
    friend void avahi_browse_callback(AvahiServiceBrowser *b, AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event,
        const char *name, const char *type, const char *domain, AvahiLookupResultFlags flags, void* userdata) noexcept;
    friend void avahi_resolve_callback(AvahiServiceResolver *r, AvahiIfIndex interface, AvahiProtocol protocol,
        AvahiResolverEvent event, const char *name, const char *type, const char *domain, const char *host_name,
        const AvahiAddress *address, uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags flags, void* userdata) noexcept;
};

class AvahiDiscoveryBrowser : public ServiceBrowser{
    AvahiBrowseSession *_session;
    std::mutex _sessionLck;
public:
    AvahiDiscoveryBrowser();
    virtual ~AvahiDiscoveryBrowser() override;

    virtual void start(event_sink sink) override;
    virtual void stop() noexcept override;
};

#endif /* ServiceBrowser_avahi_hpp */
