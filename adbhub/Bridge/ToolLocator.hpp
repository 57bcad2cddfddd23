//
//  ToolLocator.hpp
//  adbhub
//
//  Created on 19.05.25.
//

#ifndef ToolLocator_hpp
#define ToolLocator_hpp

#include "../Process/ProcessRunner.hpp"

#include <mutex>
#include <string>
#include <vector>

/*
 Finds the bridge tool executable.
 Order: custom path > cached path > known install locations > PATH
 */
class ToolLocator{
    const ProcessRunner *_runner; //not owned
    std::vector<std::string> _probeLocations;
    std::string _toolName;
    std::string _customPath;
    std::string _cachedPath;
    std::mutex _lck;

public:
    ToolLocator(const ProcessRunner *runner, std::vector<std::string> probeLocations = defaultProbeLocations(), std::string toolName = "adb");

    static std::vector<std::string> defaultProbeLocations();
    static bool isExecutableFile(const std::string &path) noexcept;

    /*
     Takes precedence over everything else while set.
     An empty path clears the override.
     */
    void setCustomPath(const std::string &path);
    std::string customPath();

    std::string cachedPath();
    void invalidate() noexcept;

    /*
     Throws ADBException_toolNotFound if nothing usable was found.
     */
    std::string resolve();
    std::string reprobe();
};

#endif /* ToolLocator_hpp */
