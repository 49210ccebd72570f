#include "LifecycleController.hpp"

#include "AppDirs.hpp"
#include "Errors.hpp"
#include "ProcessImage.hpp"
#include "SignalDispatcher.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace {
constexpr const char* kLoopbackHost = "127.0.0.1";

std::string ResolveAppDir(const InstanceOptions& options) {
    return options.appDir.empty() ? UserDataDir(options.name) : options.appDir;
}

InstanceOptions MakeOptions(const std::string& name, const std::string& address, const std::string& appDir, bool debug) {
    InstanceOptions options;
    options.name = name;
    options.address = address;
    options.appDir = appDir;
    options.debug = debug;
    return options;
}
} // namespace

const char* InstanceStateName(InstanceState state) {
    switch (state) {
    case InstanceState::STOPPED:
        return "STOPPED";
    case InstanceState::STARTING:
        return "STARTING";
    case InstanceState::RUNNING:
        return "RUNNING";
    case InstanceState::STOPPING:
        return "STOPPING";
    case InstanceState::RESTARTING:
        return "RESTARTING";
    }
    return "STOPPED";
}

LifecycleController::LifecycleController(InstanceOptions options)
    : options_(std::move(options)),
      explicitAddress_(!options_.address.empty()),
      logger_(options_.name, options_.debug ? LogLevel::DEBUG : LogLevel::WARN),
      lockStore_(ResolveAppDir(options_), logger_),
      client_(options_.timeouts),
      liveness_(lockStore_, client_, logger_, options_.address),
      dispatcher_(logger_),
      remote_([this] { return IsRunning(); }, [this] { return Address(); }, client_) {
    if (options_.name.empty()) {
        throw std::invalid_argument("An instance needs a non-empty name");
    }

    identity_.name = options_.name;
    identity_.address = NormalizeAddress(options_.address);
    identity_.appDir = lockStore_.AppDir();
}

LifecycleController::LifecycleController(
    const std::string& name,
    const std::string& address,
    const std::string& appDir,
    bool debug)
    : LifecycleController(MakeOptions(name, address, appDir, debug)) {}

LifecycleController::~LifecycleController() {
    int callbackId = 0;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        callbackId = shutdownCallbackId_;
        TearDownServer();
    }
    // A shutdown hook already running on the dispatch thread still uses this object.
    if (callbackId != 0) {
        SignalDispatcher::Instance().Remove(callbackId);
    }
}

void LifecycleController::EnsureLoggingConfigured() {
    std::call_once(loggingConfigured_, [this] {
        ConfigureLogging(logger_);
    });
}

void LifecycleController::Start() {
    EnsureLoggingConfigured();

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    ReapFinishedServer();
    if (server_) {
        throw ProcessExists(Name() + " is already running.");
    }

    StartupLock startupLock(lockStore_.AppDir(), logger_);
    if (IsRunning()) {
        throw ProcessExists(Name() + " is already running.");
    }

    state_ = InstanceState::STARTING;
    try {
        StartServing();
    } catch (const std::exception& ex) {
        logger_.Error("Start failed: " + std::string(ex.what()));
        TearDownServer();
        throw;
    }
    state_ = InstanceState::RUNNING;
}

void LifecycleController::StartServing() {
    const int pid = ProcessImage::CurrentPid();

    Endpoint endpoint;
    endpoint.host = kLoopbackHost;
    if (explicitAddress_ && !ParseEndpoint(options_.address, endpoint)) {
        throw StartError("Invalid address \"" + options_.address + "\", expected host:port");
    }

    auto server = std::make_unique<ControlPlaneServer>(
        [this] { return Snapshot(); },
        dispatcher_,
        logger_,
        [this] { HandleRestart(); });
    ConfigureRoutes(*server);

    const int port = server->Bind(endpoint.host, endpoint.port);
    if (port < 0) {
        throw StartError("Unable to bind " + endpoint.host + ":" + std::to_string(endpoint.port));
    }

    const std::string address = explicitAddress_
        ? NormalizeAddress(options_.address)
        : NormalizeAddress(endpoint.host + ":" + std::to_string(port));
    {
        std::lock_guard<std::mutex> lock(identityMutex_);
        identity_.name = options_.name;
        identity_.pid = pid;
        identity_.address = address;
        identity_.appDir = lockStore_.AppDir();
    }

    OnStart();

    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        serverFinished_ = false;
    }
    serving_ = true;
    server->Start([this] { HandleServerFinished(); });
    server_ = std::move(server);
    logger_.Info("Serving process " + std::to_string(pid) + " at " + address);

    shutdownCallbackId_ = SignalDispatcher::Instance().Add(ToString(), [this] { StopFromShutdownHook(); });

    lockStore_.Write(pid, address);
}

nlohmann::json LifecycleController::Stop() {
    EnsureLoggingConfigured();
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return StopLocked();
}

nlohmann::json LifecycleController::StopLocked() {
    ReapFinishedServer();
    if (!IsRunning()) {
        throw ProcessDoesNotExist("Can not find process.");
    }

    const bool owner = server_ != nullptr;
    if (owner) {
        state_ = InstanceState::STOPPING;
        RunOnStop();
    }

    nlohmann::json response;
    try {
        response = client_.Post(JoinRoute(Address(), "stop"), nlohmann::json::object());
    } catch (const TransportError& ex) {
        logger_.Error("Control-plane server already shut down: " + std::string(ex.what()));
        response = {{"success", true}, {"message", "Control-plane server already shut down."}};
    }

    if (owner) {
        logger_.Debug("Waiting for the control-plane server to finish...");
        TearDownServer();
        logger_.Debug("Control-plane server successfully shut down.");
    }
    return response;
}

void LifecycleController::StopFromShutdownHook() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!server_) {
        return;
    }
    StopLocked();
}

nlohmann::json LifecycleController::Restart() {
    EnsureLoggingConfigured();
    return remote_.Send("restart");
}

void LifecycleController::RunForever() {
    Start();

    {
        std::unique_lock<std::mutex> lock(finishedMutex_);
        finishedCv_.wait(lock, [this] { return serverFinished_; });
    }

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    ReapFinishedServer();
}

bool LifecycleController::IsRunning() {
    EnsureLoggingConfigured();
    if (serving_) {
        return true;
    }

    Identity identity = Snapshot();
    const bool running = liveness_.IsRunning(identity, false);
    {
        std::lock_guard<std::mutex> lock(identityMutex_);
        identity_ = identity;
    }
    return running;
}

nlohmann::json LifecycleController::Get(const std::string& route) {
    return remote_.Get(route);
}

nlohmann::json LifecycleController::Send(const std::string& route, const nlohmann::json& payload) {
    return remote_.Send(route, payload);
}

nlohmann::json LifecycleController::SendEvent(const std::string& name, const nlohmann::json& payload) {
    return remote_.SendEvent(name, payload);
}

void LifecycleController::RegisterEventHandler(const std::string& event, EventDispatcher::Handler handler) {
    dispatcher_.Register(event, std::move(handler));
}

void LifecycleController::UnregisterEventHandler(const std::string& event) {
    dispatcher_.Unregister(event);
}

void LifecycleController::SetRestartRunner(RestartRunner runner) {
    std::lock_guard<std::mutex> lock(restartMutex_);
    restartRunner_ = std::move(runner);
}

std::string LifecycleController::Name() const {
    std::lock_guard<std::mutex> lock(identityMutex_);
    return identity_.name;
}

std::string LifecycleController::Address() const {
    std::lock_guard<std::mutex> lock(identityMutex_);
    return identity_.address;
}

std::string LifecycleController::AppDir() const {
    std::lock_guard<std::mutex> lock(identityMutex_);
    return identity_.appDir;
}

int LifecycleController::Pid() const {
    std::lock_guard<std::mutex> lock(identityMutex_);
    return identity_.pid;
}

Identity LifecycleController::Snapshot() const {
    std::lock_guard<std::mutex> lock(identityMutex_);
    return identity_;
}

std::string LifecycleController::ToString() const {
    return "<LifecycleController>(\"" + Name() + "\")";
}

std::string LifecycleController::Describe() const {
    const Identity identity = Snapshot();
    return "<LifecycleController>(name=\"" + identity.name + "\", address=\"" + identity.address
        + "\", app_dir=\"" + identity.appDir + "\")";
}

void LifecycleController::ConfigureLogging(Logger&) {}

void LifecycleController::ConfigureRoutes(ControlPlaneServer&) {}

void LifecycleController::OnStart() {}

void LifecycleController::OnStop() {}

void LifecycleController::ReapFinishedServer() {
    if (!server_ || server_->IsServing()) {
        return;
    }

    if (state_ == InstanceState::RUNNING) {
        logger_.Info("Control-plane server was stopped remotely");
        state_ = InstanceState::STOPPING;
        RunOnStop();
    }
    TearDownServer();
}

void LifecycleController::TearDownServer() {
    if (server_) {
        server_->RequestStop();
        server_->Join();
        server_.reset();
    }
    serving_ = false;

    if (shutdownCallbackId_ != 0) {
        SignalDispatcher::Instance().Detach(shutdownCallbackId_);
        shutdownCallbackId_ = 0;
    }
    state_ = InstanceState::STOPPED;
}

void LifecycleController::RunOnStop() {
    try {
        OnStop();
    } catch (const std::exception& ex) {
        logger_.Error("OnStop failed: " + std::string(ex.what()));
    }
}

void LifecycleController::HandleServerFinished() {
    serving_ = false;
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        serverFinished_ = true;
    }
    finishedCv_.notify_all();
}

void LifecycleController::HandleRestart() {
    state_ = InstanceState::RESTARTING;
    logger_.Info("Restarting " + Describe());
    RunOnStop();

    RestartRunner runner;
    {
        std::lock_guard<std::mutex> lock(restartMutex_);
        runner = restartRunner_;
    }

    if (runner) {
        runner();
    } else {
        ProcessImage::ReExec(logger_);
    }
}
