#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
