//
//  ServiceBrowser-avahi.cpp
//  adbhub
//
//  Created on 22.05.25.
//

#include "ServiceBrowser-avahi.hpp"

#include <avahi-common/error.h>
#include <avahi-common/address.h>

#include <string.h>
#include <time.h>

#include <libgeneral/macros.h>

#define DNSSD_DOMAIN "local"

#pragma mark avahi_callback definitions
void avahi_client_callback(AvahiClient *c, AvahiClientState state, void* userdata) noexcept;
void avahi_browse_callback(AvahiServiceBrowser *b, AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event,
       const char *name, const char *type, const char *domain, AvahiLookupResultFlags flags, void* userdata) noexcept;
void avahi_resolve_callback(AvahiServiceResolver *r, AvahiIfIndex interface, AvahiProtocol protocol,
       AvahiResolverEvent event, const char *name, const char *type, const char *domain, const char *host_name,
       const AvahiAddress *address, uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags flags, void* userdata) noexcept;

static uint64_t now_ms(){
    struct timespec ts = {};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec*1000 + ts.tv_nsec/1000000;
}

#pragma mark AvahiBrowseSession
AvahiBrowseSession::AvahiBrowseSession(ServiceBrowser::event_sink sink)
: _sink(sink), _simple_poll(NULL), _avahi_client(NULL), _avahi_sb{}
{
    int err = 0;
    cleanup([&]{
        if (err) {
            //constructor failed, destructor won't run
            for (int i = 0; i < SERVICE_TYPE_COUNT; i++) safeFreeCustom(_avahi_sb[i],avahi_service_browser_free);
            safeFreeCustom(_avahi_client,avahi_client_free);
            safeFreeCustom(_simple_poll,avahi_simple_poll_free);
        }
    });
    err = -1;
    debug("AvahiBrowseSession avahi-client");

    assure(_simple_poll = avahi_simple_poll_new());

    retassure(_avahi_client = avahi_client_new(avahi_simple_poll_get(_simple_poll), (AvahiClientFlags)0, avahi_client_callback, this, &err),
        "Failed to start avahi_client with error=%d (%s). Is the daemon running?",err,avahi_strerror(err));
    err = -1;

    for (int i = 0; i < SERVICE_TYPE_COUNT; i++) {
        const char *type = service_type_dnssd_name((service_type)i);
        retassure(_avahi_sb[i] = avahi_service_browser_new(_avahi_client, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, type, DNSSD_DOMAIN, (AvahiLookupFlags)0, avahi_browse_callback, this),
                  "Failed to browse for '%s': %s",type,avahi_strerror(avahi_client_errno(_avahi_client)));
    }
    debug("AvahiBrowseSession created avahi service_browsers");
    err = 0;
}

AvahiBrowseSession::~AvahiBrowseSession(){
    stopLoop();

    for (auto &r : _resolvers) {
        avahi_service_resolver_free(r.first);
    }
    _resolvers.clear();
    for (int i = 0; i < SERVICE_TYPE_COUNT; i++) {
        safeFreeCustom(_avahi_sb[i],avahi_service_browser_free);
    }
    safeFreeCustom(_avahi_client,avahi_client_free);
    safeFreeCustom(_simple_poll,avahi_simple_poll_free);
}

bool AvahiBrowseSession::loopEvent(){
    int err = avahi_simple_poll_iterate(_simple_poll, AVAHI_POLL_SLICE_MS);
    if (err != 0) {
        debug("AvahiBrowseSession avahi main loop finished (%d)",err);
        return false;
    }
    sweep_resolvers();
    return true;
}

void AvahiBrowseSession::stopAction() noexcept{
    avahi_simple_poll_quit(_simple_poll);
}

void AvahiBrowseSession::emit(DiscoveryEvent ev) noexcept{
    try {
        _sink(ev);
    } catch (tihmstar::exception &e) {
        error("failed to deliver discovery event with error=%d (%s)",e.code(),e.what());
    }
}

void AvahiBrowseSession::sweep_resolvers() noexcept{
    uint64_t now = now_ms();
    for (auto it = _resolvers.begin(); it != _resolvers.end();) {
        if (now - it->second >= AVAHI_RESOLVE_TIMEOUT_MS) {
            debug("(Resolver) giving up after %d ms",AVAHI_RESOLVE_TIMEOUT_MS);
            avahi_service_resolver_free(it->first);
            it = _resolvers.erase(it);
        } else {
            ++it;
        }
    }
}

#pragma mark AvahiDiscoveryBrowser
AvahiDiscoveryBrowser::AvahiDiscoveryBrowser()
: _session(nullptr)
{
    //
}

AvahiDiscoveryBrowser::~AvahiDiscoveryBrowser(){
    stop();
}

void AvahiDiscoveryBrowser::start(event_sink sink){
    std::unique_lock<std::mutex> ul(_sessionLck);
    safeDelete(_session);
    _session = new AvahiBrowseSession(sink);
    try {
        _session->startLoop();
    } catch (tihmstar::exception &e) {
        safeDelete(_session);
        throw;
    }
}

void AvahiDiscoveryBrowser::stop() noexcept{
    std::unique_lock<std::mutex> ul(_sessionLck);
    safeDelete(_session);
}

#pragma mark avahi_callback implementations

void avahi_client_callback(AvahiClient *c, AvahiClientState state, void *userdata) noexcept{
    AvahiBrowseSession *session = (AvahiBrowseSession*)userdata;
    /* Called whenever the client or server state changes */
    if (state == AVAHI_CLIENT_FAILURE) {
        DiscoveryEvent ev(DiscoveryEvent::BROWSE_FAILED);
        ev.message = avahi_strerror(avahi_client_errno(c));
        error("Server connection failure: %s", ev.message.c_str());
        session->emit(ev);
        avahi_simple_poll_quit(session->_simple_poll);
    }
}

void avahi_browse_callback(AvahiServiceBrowser *b, AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event,
       const char *name, const char *type, const char *domain, AvahiLookupResultFlags flags, void* userdata) noexcept{
    AvahiBrowseSession *session = (AvahiBrowseSession*)userdata;
    service_type stype = SERVICE_TLS_CONNECT;

    switch (event) {
    case AVAHI_BROWSER_FAILURE:
    {
        DiscoveryEvent ev(DiscoveryEvent::BROWSE_FAILED);
        ev.message = avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(b)));
        error("(Browser) %s", ev.message.c_str());
        session->emit(ev);
        return;
    }
    case AVAHI_BROWSER_NEW:
    {
        AvahiServiceResolver *r = NULL;
        debug("(Browser) NEW: service '%s' of type '%s' in domain '%s'", name, type, domain);
        /* The resolver is freed in the callback, or by the sweep once it took too long */
        if (!(r = avahi_service_resolver_new(session->_avahi_client, interface, protocol, name, type, domain, AVAHI_PROTO_INET, (AvahiLookupFlags)0, avahi_resolve_callback, userdata))) {
            debug("Failed to resolve service '%s': %s", name, avahi_strerror(avahi_client_errno(session->_avahi_client)));
            break;
        }
        session->_resolvers[r] = now_ms();
        break;
    }
    case AVAHI_BROWSER_REMOVE:
    {
        debug("(Browser) REMOVE: service '%s' of type '%s' in domain '%s'", name, type, domain);
        if (!service_type_from_dnssd_name(type, stype)) break;
        DiscoveryEvent ev(DiscoveryEvent::SERVICE_REMOVED);
        ev.name = name;
        ev.type = stype;
        session->emit(ev);
        break;
    }
    case AVAHI_BROWSER_ALL_FOR_NOW:
    case AVAHI_BROWSER_CACHE_EXHAUSTED:
        debug("(Browser) %s", event == AVAHI_BROWSER_CACHE_EXHAUSTED ? "CACHE_EXHAUSTED" : "ALL_FOR_NOW");
        break;
    }
}

void avahi_resolve_callback(AvahiServiceResolver *r, AvahiIfIndex interface, AvahiProtocol protocol,
        AvahiResolverEvent event, const char *name, const char *type, const char *domain, const char *host_name,
        const AvahiAddress *address, uint16_t port, AvahiStringList *txt, AvahiLookupResultFlags flags, void* userdata) noexcept{
    char addr[AVAHI_ADDRESS_STR_MAX] = {};
    AvahiBrowseSession *session = (AvahiBrowseSession*)userdata;
    service_type stype = SERVICE_TLS_CONNECT;

    /* Called whenever a service has been resolved successfully or timed out */
    switch (event) {
        case AVAHI_RESOLVER_FAILURE:
            debug("(Resolver) Failed to resolve service '%s' of type '%s' in domain '%s': %s", name, type, domain, avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r))));
            break;
        case AVAHI_RESOLVER_FOUND:
        {
            if (!service_type_from_dnssd_name(type, stype)) {
                debug("(Resolver) ignoring unexpected type '%s'",type);
                break;
            }
            if (!address || address->proto != AVAHI_PROTO_INET || !port) {
                debug("(Resolver) '%s' has no usable IPv4 address",name);
                break;
            }
            avahi_address_snprint(addr, sizeof(addr), address);
            debug("Service '%s' of type '%s' resolved to %s:%u", name, type, addr, port);
            {
                DiscoveryEvent ev(DiscoveryEvent::SERVICE_RESOLVED);
                ev.name = name;
                ev.type = stype;
                ev.host = addr;
                ev.port = port;
                session->emit(ev);
            }
            break;
        }
        default:
            error("unknown event=%d",event);
            break;
    }

    session->_resolvers.erase(r);
    avahi_service_resolver_free(r);
}
