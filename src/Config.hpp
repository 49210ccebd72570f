#pragma once

#include "Tracing.hpp"

#include <chrono>
#include <string>

struct ClientTimeouts {
    std::chrono::milliseconds connect{500};
    std::chrono::milliseconds request{2000};
};

struct InstanceOptions {
    std::string name;
    // Empty means "pick an ephemeral port on 127.0.0.1 at start".
    std::string address;
    // Empty means UserDataDir(name).
    std::string appDir;
    bool debug = false;
    ClientTimeouts timeouts;

    // Overlays ONLYONE_ADDRESS, ONLYONE_APP_DIR, ONLYONE_DEBUG,
    // ONLYONE_CONNECT_TIMEOUT_MS and ONLYONE_REQUEST_TIMEOUT_MS.
    static InstanceOptions FromEnvironment(const std::string& name);
};

TraceConfig TraceConfigFromEnvironment();

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
long long GetEnvInt(const char* name, long long defaultValue);
