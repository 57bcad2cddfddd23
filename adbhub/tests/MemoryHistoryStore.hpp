//
//  MemoryHistoryStore.hpp
//  adbhub
//
//  Created on 26.05.25.
//

#ifndef MemoryHistoryStore_hpp
#define MemoryHistoryStore_hpp

#include "sysconf/HistoryStore.hpp"

#include <map>
#include <mutex>
#include <string>

class MemoryHistoryStore : public HistoryStore{
    std::map<std::string,std::string> _names;
    std::map<std::string,std::string> _addresses;
    std::mutex _lck;
public:
    size_t addressWrites = 0;

    virtual std::string custom_name(const std::string &identity) override{
        std::unique_lock<std::mutex> ul(_lck);
        auto it = _names.find(identity);
        return it == _names.end() ? std::string() : it->second;
    }
    virtual void set_custom_name(const std::string &identity, const std::string &name) override{
        std::unique_lock<std::mutex> ul(_lck);
        if (name.empty()) {
            _names.erase(identity);
        } else {
            _names[identity] = name;
        }
    }
    virtual std::string last_known_address(const std::string &identity) override{
        std::unique_lock<std::mutex> ul(_lck);
        auto it = _addresses.find(identity);
        return it == _addresses.end() ? std::string() : it->second;
    }
    virtual void set_last_known_address(const std::string &identity, const std::string &address) override{
        std::unique_lock<std::mutex> ul(_lck);
        addressWrites++;
        _addresses[identity] = address;
    }
    virtual std::map<std::string,std::string> last_known_addresses() override{
        std::unique_lock<std::mutex> ul(_lck);
        return _addresses;
    }
    virtual bool has_address(const std::string &ip) override{
        std::unique_lock<std::mutex> ul(_lck);
        for (auto &a : _addresses) {
            if (a.second.substr(0, a.second.find(':')) == ip) return true;
        }
        return false;
    }
};

#endif /* MemoryHistoryStore_hpp */
