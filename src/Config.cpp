#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

long long GetEnvInt(const char* name, long long defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    try {
        size_t index = 0;
        const std::string text(value);
        const long long parsed = std::stoll(text, &index);
        if (index == text.size() && parsed >= 0) {
            return parsed;
        }
    } catch (const std::exception&) {
    }

    std::cerr << "[Config] Ignoring invalid integer in " << name << ": " << value << std::endl;
    return defaultValue;
}

InstanceOptions InstanceOptions::FromEnvironment(const std::string& name) {
    InstanceOptions options;
    options.name = name;
    options.address = GetEnvOrDefault("ONLYONE_ADDRESS", "");
    options.appDir = GetEnvOrDefault("ONLYONE_APP_DIR", "");
    options.debug = GetEnvBool("ONLYONE_DEBUG", false);
    options.timeouts.connect = std::chrono::milliseconds(
        GetEnvInt("ONLYONE_CONNECT_TIMEOUT_MS", options.timeouts.connect.count()));
    options.timeouts.request = std::chrono::milliseconds(
        GetEnvInt("ONLYONE_REQUEST_TIMEOUT_MS", options.timeouts.request.count()));
    return options;
}

TraceConfig TraceConfigFromEnvironment() {
    TraceConfig config;
    config.enabled = GetEnvBool("ONLYONE_OTEL_ENABLED", false);
    config.endpoint = GetEnvOrDefault("ONLYONE_OTEL_ENDPOINT", "");
    config.serviceName = GetEnvOrDefault("ONLYONE_SERVICE_NAME", "onlyone");
    return config;
}
