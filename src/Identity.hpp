#pragma once

#include <nlohmann/json.hpp>

#include <string>

struct Identity {
    std::string name;
    std::string address;
    std::string appDir;
    int pid = 0;
};

struct Endpoint {
    std::string host;
    int port = 0;
};

// "127.0.0.1:9876" and "http://127.0.0.1:9876/" both become "http://127.0.0.1:9876".
std::string NormalizeAddress(const std::string& address);

// Forward slashes, no trailing slash.
std::string NormalizeAppDir(const std::string& appDir);

// Returns false when the address has no usable host or port.
bool ParseEndpoint(const std::string& address, Endpoint& outEndpoint);

std::string JoinRoute(const std::string& address, const std::string& route);

nlohmann::json IdentityToJson(const Identity& identity);

// Fills outIdentity from a GET / response. The response must carry name, pid and address.
bool IdentityFromJson(const nlohmann::json& json, Identity& outIdentity);
