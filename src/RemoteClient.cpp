#include "RemoteClient.hpp"

#include "Errors.hpp"
#include "EventDispatcher.hpp"
#include "Identity.hpp"
#include "NetworkClient.hpp"

#include <utility>

RemoteClient::RemoteClient(LivenessProbe isRunning, AddressProvider address, const NetworkClient& client)
    : isRunning_(std::move(isRunning)),
      address_(std::move(address)),
      client_(client) {}

nlohmann::json RemoteClient::Get(const std::string& route) const {
    return client_.Get(JoinRoute(RequireLiveAddress(), route));
}

nlohmann::json RemoteClient::Send(const std::string& route, const nlohmann::json& payload) const {
    const nlohmann::json body = payload.is_null() ? nlohmann::json::object() : payload;
    return client_.Post(JoinRoute(RequireLiveAddress(), route), body);
}

nlohmann::json RemoteClient::SendEvent(const std::string& name, const nlohmann::json& payload) const {
    Event event;
    event.name = name;
    if (payload.is_object()) {
        event.payload = payload;
    }
    return Send("event", event.ToBody());
}

std::string RemoteClient::RequireLiveAddress() const {
    if (!isRunning_()) {
        throw ProcessDoesNotExist("Can not find process.");
    }
    return address_();
}
