//
//  PlistHistoryStore.hpp
//  adbhub
//
//  Created on 21.05.25.
//

#ifndef PlistHistoryStore_hpp
#define PlistHistoryStore_hpp

#include "HistoryStore.hpp"

#include <plist/plist.h>

#include <mutex>

class PlistHistoryStore : public HistoryStore{
    std::string _path;
    plist_t _history; //identity -> {CustomName, LastKnownAddress}
    std::mutex _lck;

    std::string get_string(const std::string &identity, const char *field);
    void set_string(const std::string &identity, const char *field, const std::string &value);
    void save();
public:
    PlistHistoryStore(const PlistHistoryStore&) = delete;
    PlistHistoryStore(std::string path);
    virtual ~PlistHistoryStore() override;

    static std::string defaultPath();

    virtual std::string custom_name(const std::string &identity) override;
    virtual void set_custom_name(const std::string &identity, const std::string &name) override;

    virtual std::string last_known_address(const std::string &identity) override;
    virtual void set_last_known_address(const std::string &identity, const std::string &address) override;

    virtual std::map<std::string,std::string> last_known_addresses() override;
    virtual bool has_address(const std::string &ip) override;
};

#endif /* PlistHistoryStore_hpp */
