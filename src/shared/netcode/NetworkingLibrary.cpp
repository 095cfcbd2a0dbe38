// [NETWORK_AGENT] Reference-counted GameNetworkingSockets init/kill

#include "netcode/NetworkingLibrary.hpp"

#include <steam/steamnetworkingsockets.h>

#include <iostream>
#include <mutex>

namespace Colonnade {

static std::mutex g_libraryMutex;
static int g_libraryRefs = 0;

bool acquireNetworkingLibrary() {
    std::lock_guard<std::mutex> lock(g_libraryMutex);
    if (g_libraryRefs == 0) {
        SteamDatagramErrMsg errMsg;
        if (!GameNetworkingSockets_Init(nullptr, errMsg)) {
            std::cerr << "[NET] GameNetworkingSockets_Init failed: " << errMsg << std::endl;
            return false;
        }
    }
    g_libraryRefs++;
    return true;
}

void releaseNetworkingLibrary() {
    std::lock_guard<std::mutex> lock(g_libraryMutex);
    if (g_libraryRefs == 0) {
        return;
    }
    if (--g_libraryRefs == 0) {
        GameNetworkingSockets_Kill();
    }
}

} // namespace Colonnade
