//
//  DiscoveryManager.hpp
//  adbhub
//
//  Created on 23.05.25.
//

#ifndef DiscoveryManager_hpp
#define DiscoveryManager_hpp

#include "ServiceBrowser.hpp"
#include "DiscoveryModel.hpp"

#include <libgeneral/DeliveryEvent.hpp>
#include <libgeneral/Event.hpp>
#include <libgeneral/GuardAccess.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/*
 Every browser callback and every overlay change is posted onto one queue.
 A single reconciler thread applies them to the DiscoveryModel and
 publishes a snapshot of the derived view.
 */
class DiscoveryManager{
    ServiceBrowser *_browser; //not owned
    DiscoveryModel _model; //reconciler thread only
    tihmstar::DeliveryEvent<DiscoveryEvent> _events;
    std::thread _reconcilerThread;

    std::mutex _sessionLck;
    std::atomic<uint64_t> _session; //0 while not scanning
    uint64_t _nextSession;
    uint64_t _activeSession; //reconciler thread only

    mutable tihmstar::GuardAccess _stateGuard;
    std::vector<DiscoveredDevice> _devices;
    bool _isScanning;
    std::string _scanError;

    std::mutex _syncLck;
    tihmstar::Event _barrierEvent;

    std::mutex _callbackLck;
    std::function<void()> _onChange;

    void reconciler_runloop() noexcept;
    bool apply(const DiscoveryEvent &ev);
    void publish();
    void post_event(const DiscoveryEvent &ev);

public:
    DiscoveryManager(ServiceBrowser *browser, HistoryStore *history);
    DiscoveryManager(const DiscoveryManager&) = delete;
    ~DiscoveryManager();

    /*
     Tears down a running session first, then starts browsing
     with an empty discovered set.
     */
    void start_scanning();
    void stop_scanning() noexcept;

    bool is_scanning() const;
    std::string scan_error() const;
    std::vector<DiscoveredDevice> devices() const;
    bool device_for_host(const std::string &host, DiscoveredDevice &out) const;

    void set_connecting(const std::string &host, bool connecting);
    void mark_paired(const std::string &host);

    /*
     Returns once every event posted before the call has been applied.
     */
    void sync();

    void set_change_callback(std::function<void()> cb);
};

#endif /* DiscoveryManager_hpp */
