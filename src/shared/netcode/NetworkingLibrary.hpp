#pragma once

// [NETWORK_AGENT] Process-wide GameNetworkingSockets lifetime
// GameNetworkingSockets_Init/Kill manage global state and are not counted.
// The relay transport and the client connection both hold a reference, so a
// relay and its clients can share one process (the bot, transport tests).

namespace Colonnade {

// Initialize the library on the first call; false if initialization failed
bool acquireNetworkingLibrary();

// Drop one reference; the last release shuts the library down
void releaseNetworkingLibrary();

} // namespace Colonnade
