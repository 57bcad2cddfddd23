//
//  ToolLocator.cpp
//  adbhub
//
//  Created on 19.05.25.
//

#include "ToolLocator.hpp"
#include "../ADBException.hpp"

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <libgeneral/macros.h>

ToolLocator::ToolLocator(const ProcessRunner *runner, std::vector<std::string> probeLocations, std::string toolName)
: _runner(runner), _probeLocations(probeLocations), _toolName(toolName)
{
    //
}

std::vector<std::string> ToolLocator::defaultProbeLocations(){
    std::vector<std::string> ret;
    if (const char *sdk = getenv("ANDROID_HOME")) {
        ret.push_back(std::string(sdk) + "/platform-tools/adb");
    }
    ret.push_back("/usr/local/bin/adb");
    ret.push_back("/opt/homebrew/bin/adb");
    if (const char *home = getenv("HOME")) {
        ret.push_back(std::string(home) + "/Library/Android/sdk/platform-tools/adb");
        ret.push_back(std::string(home) + "/Android/Sdk/platform-tools/adb");
    }
    ret.push_back("/usr/bin/adb");
    return ret;
}

bool ToolLocator::isExecutableFile(const std::string &path) noexcept{
    struct stat st = {};
    if (path.empty()) return false;
    if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    return access(path.c_str(), X_OK) == 0;
}

void ToolLocator::setCustomPath(const std::string &path){
    std::unique_lock<std::mutex> ul(_lck);
    if (path.size()) {
        info("[ToolLocator] using custom tool path '%s'",path.c_str());
    }
    _customPath = path;
}

std::string ToolLocator::customPath(){
    std::unique_lock<std::mutex> ul(_lck);
    return _customPath;
}

std::string ToolLocator::cachedPath(){
    std::unique_lock<std::mutex> ul(_lck);
    return _cachedPath;
}

void ToolLocator::invalidate() noexcept{
    std::unique_lock<std::mutex> ul(_lck);
    debug("[ToolLocator] dropping cached path '%s'",_cachedPath.c_str());
    _cachedPath.clear();
}

std::string ToolLocator::resolve(){
    std::unique_lock<std::mutex> ul(_lck);

    if (_customPath.size()) {
        if (!isExecutableFile(_customPath)) {
            retcustomerror(ADBException_toolNotFound, "custom tool path '%s' is not an executable file",_customPath.c_str());
        }
        return _customPath;
    }

    if (_cachedPath.size()) {
        if (isExecutableFile(_cachedPath)) return _cachedPath;
        warning("[ToolLocator] cached tool '%s' disappeared, probing again",_cachedPath.c_str());
        _cachedPath.clear();
    }

    for (auto &p : _probeLocations) {
        if (isExecutableFile(p)) {
            info("[ToolLocator] found %s at '%s'",_toolName.c_str(),p.c_str());
            return _cachedPath = p;
        }
    }

    if (_runner) {
        std::string p = _runner->findExecutable(_toolName);
        if (p.size()) {
            info("[ToolLocator] found %s in PATH at '%s'",_toolName.c_str(),p.c_str());
            return _cachedPath = p;
        }
    }

    retcustomerror(ADBException_toolNotFound, "%s",_toolName.c_str());
}

std::string ToolLocator::reprobe(){
    invalidate();
    return resolve();
}
