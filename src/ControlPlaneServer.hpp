#pragma once

#include "Identity.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

class EventDispatcher;
class Logger;

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH
};

// Embedded HTTP endpoint of a running instance. Built-in routes:
//   GET  /         identity snapshot
//   POST /event    forwards {"name": ..., ...payload} to the dispatcher
//   POST /stop     stops the accept loop after answering
//   POST /restart  stops, then runs the restart runner once the loop has drained
class ControlPlaneServer {
public:
    // Maps the request's JSON body (an empty object for GET) to the JSON response.
    using RouteHandler = std::function<nlohmann::json(const nlohmann::json& body)>;
    using IdentityProvider = std::function<Identity()>;
    using RestartRunner = std::function<void()>;

    ControlPlaneServer(
        IdentityProvider identity,
        EventDispatcher& dispatcher,
        Logger& logger,
        RestartRunner restartRunner = RestartRunner());
    ~ControlPlaneServer();

    ControlPlaneServer(const ControlPlaneServer&) = delete;
    ControlPlaneServer& operator=(const ControlPlaneServer&) = delete;

    // Only valid before Bind(). Throws std::logic_error afterwards.
    void AddRoute(HttpMethod method, const std::string& path, RouteHandler handler);

    // Port 0 binds an ephemeral port. Returns the bound port, or -1 on failure.
    int Bind(const std::string& host, int port);

    // Runs the accept loop on a dedicated thread. onFinished runs on that thread
    // after the loop and all in-flight requests have finished.
    void Start(std::function<void()> onFinished = std::function<void()>());

    void RequestStop();
    void RequestRestart();
    void Join();

    bool IsBound() const { return bound_; }
    bool IsServing() const { return serving_; }
    int Port() const { return port_; }

private:
    void RegisterBuiltinRoutes();
    void Run();

    nlohmann::json HandleEvent(const nlohmann::json& body);

    IdentityProvider identity_;
    EventDispatcher& dispatcher_;
    Logger& logger_;
    RestartRunner restartRunner_;
    std::unique_ptr<httplib::Server> server_;
    std::function<void()> onFinished_;
    std::thread worker_;
    std::mutex workerMutex_;
    std::atomic<bool> bound_{false};
    std::atomic<bool> serving_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> restartRequested_{false};
    int port_ = -1;
};
