#pragma once

#include <string>

// Per-user data directory for an application, e.g. ~/.local/share/<appName> on Linux.
std::string UserDataDir(const std::string& appName);
