//
//  InstallHandle.cpp
//  adbhub
//
//  Created on 19.05.25.
//

#include "InstallHandle.hpp"
#include "BridgeClient.hpp"
#include "../ADBException.hpp"

#include <libgeneral/macros.h>

InstallHandle::InstallHandle(std::shared_ptr<StreamingProcess> proc, std::string apkPath)
: _proc(proc), _apkPath(apkPath)
{
    //
}

void InstallHandle::cancel() noexcept{
    _proc->cancel();
}

install_result InstallHandle::wait(){
    const ProcessResult &res = _proc->wait();

    if (res.termSignal) {
        info("[InstallHandle] install of '%s' was cancelled",_apkPath.c_str());
        return INSTALL_CANCELLED;
    }

    if (!res.isSuccess()
        || res.output.find("Failure") != std::string::npos
        || res.errorOutput.find("Failure") != std::string::npos) {
        std::string msg = BridgeClient::install_error_message(res.output, res.errorOutput);
        retcustomerror(ADBException_installFailed, "%s",msg.c_str());
    }

    info("[InstallHandle] installed '%s'",_apkPath.c_str());
    return INSTALL_SUCCEEDED;
}
