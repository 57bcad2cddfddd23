//
//  PlistHistoryStore.cpp
//  adbhub
//
//  Created on 21.05.25.
//

#include "PlistHistoryStore.hpp"
#include "sysconf.hpp"

#include <stdlib.h>

#include <libgeneral/macros.h>

#define HISTORY_FILE "DeviceHistory.plist"
#define KEY_CUSTOM_NAME "CustomName"
#define KEY_LAST_KNOWN_ADDRESS "LastKnownAddress"

static std::string host_of_address(const std::string &address){
    size_t colon = address.rfind(':');
    if (colon == std::string::npos) return address;
    return address.substr(0, colon);
}

static std::string plist_string(plist_t node){
    const char *str = NULL;
    uint64_t str_len = 0;
    if (!node || plist_get_node_type(node) != PLIST_STRING) return {};
    if (!(str = plist_get_string_ptr(node, &str_len))) return {};
    return std::string(str,str_len);
}

PlistHistoryStore::PlistHistoryStore(std::string path)
: _path(path), _history(NULL)
{
    try {
        _history = sysconf_read_plist(_path);
        if (plist_get_node_type(_history) != PLIST_DICT) {
            warning("%s is not a dictionary, starting with an empty history",_path.c_str());
            safeFreeCustom(_history, plist_free);
        }
    } catch (tihmstar::exception &e) {
        debug("No device history at '%s' error=%d (%s)",_path.c_str(),e.code(),e.what());
    }
    if (!_history) _history = plist_new_dict();
}

PlistHistoryStore::~PlistHistoryStore(){
    safeFreeCustom(_history, plist_free);
}

std::string PlistHistoryStore::defaultPath(){
    return sysconf_get_config_path(HISTORY_FILE);
}

void PlistHistoryStore::save(){
    sysconf_write_plist(_history, _path);
}

std::string PlistHistoryStore::get_string(const std::string &identity, const char *field){
    std::unique_lock<std::mutex> ul(_lck);
    plist_t p_entry = plist_dict_get_item(_history, identity.c_str());
    if (!p_entry || plist_get_node_type(p_entry) != PLIST_DICT) return {};
    return plist_string(plist_dict_get_item(p_entry, field));
}

void PlistHistoryStore::set_string(const std::string &identity, const char *field, const std::string &value){
    std::unique_lock<std::mutex> ul(_lck);
    plist_t p_entry = plist_dict_get_item(_history, identity.c_str());
    if (!p_entry || plist_get_node_type(p_entry) != PLIST_DICT) {
        if (value.empty()) return;
        p_entry = plist_new_dict();
        plist_dict_set_item(_history, identity.c_str(), p_entry); //owned by _history now
    }
    if (value.size()) {
        plist_dict_set_item(p_entry, field, plist_new_string(value.c_str()));
    } else if (plist_dict_get_item(p_entry, field)) {
        plist_dict_remove_item(p_entry, field);
    }
    if (!plist_dict_get_size(p_entry)) {
        plist_dict_remove_item(_history, identity.c_str());
    }
    save();
}

std::string PlistHistoryStore::custom_name(const std::string &identity){
    return get_string(identity, KEY_CUSTOM_NAME);
}

void PlistHistoryStore::set_custom_name(const std::string &identity, const std::string &name){
    set_string(identity, KEY_CUSTOM_NAME, name);
}

std::string PlistHistoryStore::last_known_address(const std::string &identity){
    return get_string(identity, KEY_LAST_KNOWN_ADDRESS);
}

void PlistHistoryStore::set_last_known_address(const std::string &identity, const std::string &address){
    if (last_known_address(identity) == address) return;
    set_string(identity, KEY_LAST_KNOWN_ADDRESS, address);
}

std::map<std::string,std::string> PlistHistoryStore::last_known_addresses(){
    std::map<std::string,std::string> ret;
    std::unique_lock<std::mutex> ul(_lck);
    plist_dict_iter iter = NULL;
    cleanup([&]{
        safeFree(iter);
    });
    char *key = NULL;
    plist_t p_entry = NULL;

    plist_dict_new_iter(_history, &iter);
    while (true) {
        plist_dict_next_item(_history, iter, &key, &p_entry);
        if (!key) break;
        std::string identity = key;
        safeFree(key);
        if (!p_entry || plist_get_node_type(p_entry) != PLIST_DICT) continue;
        std::string address = plist_string(plist_dict_get_item(p_entry, KEY_LAST_KNOWN_ADDRESS));
        if (address.size()) ret[identity] = address;
    }
    return ret;
}

bool PlistHistoryStore::has_address(const std::string &ip){
    for (auto &e : last_known_addresses()) {
        if (host_of_address(e.second) == ip) return true;
    }
    return false;
}
