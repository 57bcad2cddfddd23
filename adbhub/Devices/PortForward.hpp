//
//  PortForward.hpp
//  adbhub
//
//  Created on 18.05.25.
//

#ifndef PortForward_hpp
#define PortForward_hpp

#include <stdint.h>
#include <string>

struct PortForward{
    std::string transportAddress;
    uint16_t localPort;
    uint16_t remotePort;
    bool isReverse;

    PortForward() : localPort(0), remotePort(0), isReverse(false) {}
};

#endif /* PortForward_hpp */
