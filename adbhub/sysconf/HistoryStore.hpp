//
//  HistoryStore.hpp
//  adbhub
//
//  Created on 21.05.25.
//

#ifndef HistoryStore_hpp
#define HistoryStore_hpp

#include <map>
#include <string>

/*
 Abstract class
 Per persistent identity: custom name and last known network address ("ip:port").
 */
class HistoryStore{
public:
    virtual ~HistoryStore() {}

    virtual std::string custom_name(const std::string &identity) = 0;
    virtual void set_custom_name(const std::string &identity, const std::string &name) = 0; //empty name removes it

    virtual std::string last_known_address(const std::string &identity) = 0;
    virtual void set_last_known_address(const std::string &identity, const std::string &address) = 0;

    virtual std::map<std::string,std::string> last_known_addresses() = 0; //identity -> address

    /*
     True if any last known address is on this host.
     */
    virtual bool has_address(const std::string &ip) = 0;
};

#endif /* HistoryStore_hpp */
