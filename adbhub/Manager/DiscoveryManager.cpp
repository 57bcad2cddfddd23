//
//  DiscoveryManager.cpp
//  adbhub
//
//  Created on 23.05.25.
//

#include "DiscoveryManager.hpp"

#include <libgeneral/macros.h>

DiscoveryManager::DiscoveryManager(ServiceBrowser *browser, HistoryStore *history)
: _browser(browser), _model(history)
, _session(0), _nextSession(0), _activeSession(0)
, _isScanning(false)
{
    retassure(_browser, "DiscoveryManager needs a ServiceBrowser");
    _reconcilerThread = std::thread([this]{
        reconciler_runloop();
    });
}

DiscoveryManager::~DiscoveryManager(){
    stop_scanning();
    _events.kill();
    _reconcilerThread.join();
}

#pragma mark session control

void DiscoveryManager::start_scanning(){
    std::unique_lock<std::mutex> ul(_sessionLck);
    uint64_t session = 0;

    if (_session.load()) {
        debug("[DiscoveryManager] restarting scan session %llu",(unsigned long long)_session.load());
        _session = 0;
        _browser->stop();
    }

    session = ++_nextSession;
    {
        DiscoveryEvent ev(DiscoveryEvent::SESSION_STARTED);
        ev.session = session;
        _session = session;
        _events.post(ev);
    }

    try {
        _browser->start([this,session](DiscoveryEvent ev){
            //anything from an older session is inert
            if (_session.load() != session) return;
            ev.session = session;
            _events.post(ev);
        });
    } catch (tihmstar::exception &e) {
        DiscoveryEvent ev(DiscoveryEvent::BROWSE_FAILED);
        ev.session = session;
        ev.message = e.what();
        _events.post(ev);
        error("[DiscoveryManager] failed to start browsing with error=%d (%s)",e.code(),e.what());
    }
    info("[DiscoveryManager] scan session %llu started",(unsigned long long)session);
}

void DiscoveryManager::stop_scanning() noexcept{
    std::unique_lock<std::mutex> ul(_sessionLck);
    uint64_t session = _session.exchange(0);
    if (!session) return;
    _browser->stop();
    DiscoveryEvent ev(DiscoveryEvent::SESSION_STOPPED);
    ev.session = session;
    try {
        _events.post(ev);
    } catch (tihmstar::exception &e) {
        error("[DiscoveryManager] failed to post stop of session %llu with error=%d (%s)",(unsigned long long)session,e.code(),e.what());
    }
    info("[DiscoveryManager] scan session %llu stopped",(unsigned long long)session);
}

void DiscoveryManager::post_event(const DiscoveryEvent &ev){
    _events.post(ev);
}

#pragma mark reconciler

void DiscoveryManager::reconciler_runloop() noexcept{
    while (true) {
        DiscoveryEvent ev;
        try {
            ev = _events.wait();
        } catch (tihmstar::exception &e) {
            debug("[DiscoveryManager] event queue closed");
            break;
        }
        if (ev.kind == DiscoveryEvent::BARRIER) {
            _barrierEvent.notifyAll();
            continue;
        }
        try {
            if (apply(ev)) publish();
        } catch (tihmstar::exception &e) {
            error("[DiscoveryManager] failed to apply event %d with error=%d (%s)",ev.kind,e.code(),e.what());
        }
    }
}

bool DiscoveryManager::apply(const DiscoveryEvent &ev){
    switch (ev.kind) {
        case DiscoveryEvent::SESSION_STARTED:
            _activeSession = ev.session;
            _model.reset();
            {
                guardWrite(_stateGuard);
                _isScanning = true;
                _scanError.clear();
            }
            return true;

        case DiscoveryEvent::SESSION_STOPPED:
            if (ev.session != _activeSession) return false;
            _activeSession = 0;
            {
                guardWrite(_stateGuard);
                _isScanning = false;
            }
            return true;

        case DiscoveryEvent::SERVICE_RESOLVED:
        case DiscoveryEvent::SERVICE_REMOVED:
        case DiscoveryEvent::BROWSE_FAILED:
            if (!ev.session || ev.session != _activeSession || ev.session != _session.load()) {
                debug("[DiscoveryManager] dropping stale event %d of session %llu",ev.kind,(unsigned long long)ev.session);
                return false;
            }
            if (ev.kind == DiscoveryEvent::SERVICE_RESOLVED) {
                AdvertisedService svc;
                svc.name = ev.name;
                svc.type = ev.type;
                svc.host = ev.host;
                svc.port = ev.port;
                return _model.add_service(svc);
            } else if (ev.kind == DiscoveryEvent::SERVICE_REMOVED) {
                return _model.remove_service(ev.name, ev.type);
            }
            {
                guardWrite(_stateGuard);
                _scanError = "Discovery failed: " + ev.message;
            }
            return true;

        case DiscoveryEvent::OVERLAY_CONNECTING:
            _model.set_connecting(ev.host, ev.flag);
            return true;

        case DiscoveryEvent::OVERLAY_PAIRED:
            _model.mark_paired(ev.host);
            return true;

        default:
            reterror("unexpected discovery event %d",ev.kind);
    }
}

void DiscoveryManager::publish(){
    std::function<void()> cb;
    {
        guardWrite(_stateGuard);
        _devices = _model.devices();
    }
    {
        std::unique_lock<std::mutex> ul(_callbackLck);
        cb = _onChange;
    }
    if (cb) cb();
}

#pragma mark accessors

bool DiscoveryManager::is_scanning() const{
    guardRead(_stateGuard);
    return _isScanning;
}

std::string DiscoveryManager::scan_error() const{
    guardRead(_stateGuard);
    return _scanError;
}

std::vector<DiscoveredDevice> DiscoveryManager::devices() const{
    guardRead(_stateGuard);
    return _devices;
}

bool DiscoveryManager::device_for_host(const std::string &host, DiscoveredDevice &out) const{
    guardRead(_stateGuard);
    for (auto &d : _devices) {
        if (d.host == host) {
            out = d;
            return true;
        }
    }
    return false;
}

void DiscoveryManager::set_connecting(const std::string &host, bool connecting){
    DiscoveryEvent ev(DiscoveryEvent::OVERLAY_CONNECTING);
    ev.host = host;
    ev.flag = connecting;
    post_event(ev);
}

void DiscoveryManager::mark_paired(const std::string &host){
    DiscoveryEvent ev(DiscoveryEvent::OVERLAY_PAIRED);
    ev.host = host;
    post_event(ev);
}

void DiscoveryManager::sync(){
    std::unique_lock<std::mutex> ul(_syncLck);
    uint64_t wevent = _barrierEvent.getNextEvent();
    post_event(DiscoveryEvent(DiscoveryEvent::BARRIER));
    _barrierEvent.waitForEvent(wevent);
}

void DiscoveryManager::set_change_callback(std::function<void()> cb){
    std::unique_lock<std::mutex> ul(_callbackLck);
    _onChange = cb;
}
