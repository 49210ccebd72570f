#pragma once

#include "Config.hpp"
#include "ControlPlaneServer.hpp"
#include "EventDispatcher.hpp"
#include "Identity.hpp"
#include "LivenessChecker.hpp"
#include "LockStore.hpp"
#include "Logger.hpp"
#include "NetworkClient.hpp"
#include "RemoteClient.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

enum class InstanceState {
    STOPPED,
    STARTING,
    RUNNING,
    STOPPING,
    RESTARTING
};

const char* InstanceStateName(InstanceState state);

// Keeps a single running instance per name on this machine.
//
// Start() either becomes the instance (binds the control-plane server, writes
// <appDir>/.pid) or throws ProcessExists, after which Get(), Send() and
// SendEvent() talk to the instance that is already running. Applications
// customize behaviour by overriding the protected hooks.
class LifecycleController {
public:
    using RestartRunner = std::function<void()>;

    explicit LifecycleController(InstanceOptions options);
    LifecycleController(
        const std::string& name,
        const std::string& address = std::string(),
        const std::string& appDir = std::string(),
        bool debug = false);
    // Stops an owned server without running OnStop(); call Stop() for a full teardown.
    virtual ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Throws ProcessExists, StartError or LockStoreError.
    void Start();
    // Throws ProcessDoesNotExist. Returns the /stop response.
    nlohmann::json Stop();
    // Asks the live instance to re-execute itself. Throws ProcessDoesNotExist.
    nlohmann::json Restart();
    // Start(), then block until the server is stopped by a signal, Stop() or a remote request.
    void RunForever();

    bool IsRunning();

    nlohmann::json Get(const std::string& route = "/");
    nlohmann::json Send(const std::string& route, const nlohmann::json& payload = nlohmann::json::object());
    nlohmann::json SendEvent(const std::string& name, const nlohmann::json& payload = nlohmann::json::object());

    void RegisterEventHandler(const std::string& event, EventDispatcher::Handler handler);
    void UnregisterEventHandler(const std::string& event);

    // Defaults to ProcessImage::ReExec.
    void SetRestartRunner(RestartRunner runner);

    std::string Name() const;
    std::string Address() const;
    std::string AppDir() const;
    int Pid() const;
    std::string PidFile() const { return lockStore_.Path(); }
    InstanceState State() const { return state_; }
    Identity Snapshot() const;

    std::string ToString() const;
    std::string Describe() const;

    Logger& Log() { return logger_; }

protected:
    virtual void ConfigureLogging(Logger& logger);
    virtual void ConfigureRoutes(ControlPlaneServer& server);
    virtual void OnStart();
    virtual void OnStop();

private:
    void EnsureLoggingConfigured();
    void StartServing();
    nlohmann::json StopLocked();
    void StopFromShutdownHook();
    void ReapFinishedServer();
    void TearDownServer();
    void RunOnStop();
    void HandleServerFinished();
    void HandleRestart();

    InstanceOptions options_;
    bool explicitAddress_ = false;
    Logger logger_;
    LockStore lockStore_;
    NetworkClient client_;
    LivenessChecker liveness_;
    EventDispatcher dispatcher_;
    RemoteClient remote_;

    mutable std::mutex identityMutex_;
    Identity identity_;

    std::mutex lifecycleMutex_;
    std::unique_ptr<ControlPlaneServer> server_;
    std::atomic<bool> serving_{false};
    std::atomic<InstanceState> state_{InstanceState::STOPPED};
    int shutdownCallbackId_ = 0;

    std::mutex finishedMutex_;
    std::condition_variable finishedCv_;
    bool serverFinished_ = false;

    std::mutex restartMutex_;
    RestartRunner restartRunner_;

    std::once_flag loggingConfigured_;
};
