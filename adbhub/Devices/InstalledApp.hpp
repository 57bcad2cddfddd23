//
//  InstalledApp.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef InstalledApp_hpp
#define InstalledApp_hpp

#include <stdint.h>
#include <time.h>
#include <string>

enum app_list_filter{
    APP_LIST_ALL = 0,
    APP_LIST_THIRD_PARTY,
    APP_LIST_SYSTEM,
    APP_LIST_DISABLED
};

struct InstalledApp{
    std::string packageName;
    std::string versionName;    //empty if unknown
    int64_t versionCode;        //-1 if unknown
    time_t firstInstallTime;    //0 if unknown
    time_t lastUpdateTime;      //0 if unknown
    bool isSystemApp;
    bool isEnabled;
    bool detailsLoaded;

    InstalledApp()
    : versionCode(-1), firstInstallTime(0), lastUpdateTime(0)
    , isSystemApp(false), isEnabled(true), detailsLoaded(false)
    {}
};

#endif /* InstalledApp_hpp */
