//
//  InstallHandle.hpp
//  adbhub
//
//  Created on 19.05.25.
//

#ifndef InstallHandle_hpp
#define InstallHandle_hpp

#include "../Process/ProcessRunner.hpp"

#include <memory>
#include <string>

enum install_result{
    INSTALL_SUCCEEDED = 0,
    INSTALL_CANCELLED
};

/*
 A package install in flight.
 Progress lines are delivered to the callback given to BridgeClient::install_package.
 */
class InstallHandle{
    std::shared_ptr<StreamingProcess> _proc;
    std::string _apkPath;
public:
    InstallHandle(std::shared_ptr<StreamingProcess> proc, std::string apkPath);

    void cancel() noexcept;

    /*
     Throws ADBException_installFailed or ADBException_timeout.
     */
    install_result wait();

    const std::string &apkPath() const noexcept {return _apkPath;}
};

#endif /* InstallHandle_hpp */
