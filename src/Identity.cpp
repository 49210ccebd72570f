#include "Identity.hpp"

#include <exception>
#include <string>

namespace {
constexpr const char* kScheme = "http://";

std::string StripScheme(const std::string& address) {
    const auto schemePos = address.find("://");
    if (schemePos == std::string::npos) {
        return address;
    }
    return address.substr(schemePos + 3);
}

bool ParsePort(const std::string& text, int& outPort) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }

    const int port = std::stoi(text);
    if (port <= 0 || port > 65535) {
        return false;
    }
    outPort = port;
    return true;
}

int ParsePid(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        try {
            size_t index = 0;
            const std::string text = value.get<std::string>();
            const int pid = std::stoi(text, &index);
            if (index == text.size()) {
                return pid;
            }
        } catch (const std::exception&) {
        }
    }
    return 0;
}
} // namespace

std::string NormalizeAddress(const std::string& address) {
    if (address.empty()) {
        return {};
    }

    std::string hostPort = StripScheme(address);
    while (!hostPort.empty() && hostPort.back() == '/') {
        hostPort.pop_back();
    }
    return kScheme + hostPort;
}

std::string NormalizeAppDir(const std::string& appDir) {
    std::string normalized = appDir;
    for (auto& ch : normalized) {
        if (ch == '\\') {
            ch = '/';
        }
    }
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool ParseEndpoint(const std::string& address, Endpoint& outEndpoint) {
    std::string hostPort = StripScheme(address);
    const auto pathPos = hostPort.find('/');
    if (pathPos != std::string::npos) {
        hostPort = hostPort.substr(0, pathPos);
    }

    const auto colonPos = hostPort.find_last_of(':');
    if (colonPos == std::string::npos || colonPos == 0) {
        return false;
    }

    std::string host = hostPort.substr(0, colonPos);
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    int port = 0;
    if (!ParsePort(hostPort.substr(colonPos + 1), port)) {
        return false;
    }

    outEndpoint.host = host;
    outEndpoint.port = port;
    return true;
}

std::string JoinRoute(const std::string& address, const std::string& route) {
    std::string base = address;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    size_t start = 0;
    while (start < route.size() && route[start] == '/') {
        ++start;
    }
    return base + "/" + route.substr(start);
}

nlohmann::json IdentityToJson(const Identity& identity) {
    return {
        {"success", true},
        {"name", identity.name},
        {"pid", identity.pid},
        {"app_dir", identity.appDir},
        {"address", identity.address}
    };
}

bool IdentityFromJson(const nlohmann::json& json, Identity& outIdentity) {
    if (!json.is_object() || !json.contains("name") || !json.contains("pid") || !json.contains("address")) {
        return false;
    }
    if (!json["name"].is_string() || !json["address"].is_string()) {
        return false;
    }

    const int pid = ParsePid(json["pid"]);
    if (pid <= 0) {
        return false;
    }

    outIdentity.name = json.value("name", "");
    outIdentity.pid = pid;
    outIdentity.address = NormalizeAddress(json.value("address", ""));
    if (json.contains("app_dir") && json["app_dir"].is_string()) {
        outIdentity.appDir = NormalizeAppDir(json.value("app_dir", ""));
    }
    return true;
}
