#pragma once

#include "Config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

// JSON over plain HTTP to a control-plane server.
class NetworkClient {
public:
    explicit NetworkClient(ClientTimeouts timeouts = {});

    // Both throw TransportError when the server cannot be reached or answers
    // with something other than JSON. Error statuses with a JSON body are returned.
    nlohmann::json Get(const std::string& url) const;
    nlohmann::json Post(const std::string& url, const nlohmann::json& payload) const;

    // GET that never throws: nullopt on transport failure, HTTP error or non-JSON body.
    std::optional<nlohmann::json> Probe(const std::string& url) const;

    const ClientTimeouts& Timeouts() const { return timeouts_; }

private:
    ClientTimeouts timeouts_;
};
