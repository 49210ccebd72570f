#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>

class Logger;

struct Event {
    std::string name;
    nlohmann::json payload = nlohmann::json::object();

    // Splits a POST /event body into name and payload. The body must carry "name".
    static Event FromBody(const nlohmann::json& body);
    nlohmann::json ToBody() const;
};

class EventDispatcher {
public:
    // The returned object is merged into the {"success": true} response.
    using Handler = std::function<nlohmann::json(const Event&)>;

    explicit EventDispatcher(Logger& logger);

    // Last registration for a name wins.
    void Register(const std::string& name, Handler handler);
    void Unregister(const std::string& name);
    bool HasHandler(const std::string& name) const;

    // Never throws for handler failures; they become {"success": false, "message": ...}.
    nlohmann::json Dispatch(const Event& event);

private:
    static nlohmann::json MergeResult(const nlohmann::json& result);
    nlohmann::json ReportFailure(const Event& event, const std::string& type, const std::string& what);

    Logger& logger_;
    std::map<std::string, Handler> handlers_;
    mutable std::mutex mutex_;
};
