#pragma once

#include <atomic>

namespace platform {

// Process-wide stop request, set from SIGINT/SIGTERM.
std::atomic<bool>& shutdown_flag();

// Install SIGINT/SIGTERM handlers that only set shutdown_flag().
void install_shutdown_handlers();

// Put back the handlers that were active before install_shutdown_handlers().
void remove_shutdown_handlers();

} // namespace platform
