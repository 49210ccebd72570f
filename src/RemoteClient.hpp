#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

class NetworkClient;

// Talks to the live instance of an identity. Every call first confirms liveness
// and throws ProcessDoesNotExist when nothing answers; transport failures on the
// call itself surface as TransportError. No retries.
class RemoteClient {
public:
    // Refreshes the identity and returns whether an instance is live.
    using LivenessProbe = std::function<bool()>;
    // Returns the live instance's address after a successful probe.
    using AddressProvider = std::function<std::string()>;

    RemoteClient(LivenessProbe isRunning, AddressProvider address, const NetworkClient& client);

    nlohmann::json Get(const std::string& route = "/") const;
    nlohmann::json Send(const std::string& route, const nlohmann::json& payload = nlohmann::json::object()) const;
    nlohmann::json SendEvent(const std::string& name, const nlohmann::json& payload = nlohmann::json::object()) const;

private:
    std::string RequireLiveAddress() const;

    LivenessProbe isRunning_;
    AddressProvider address_;
    const NetworkClient& client_;
};
