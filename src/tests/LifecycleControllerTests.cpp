#include "ControlPlaneServer.hpp"
#include "Errors.hpp"
#include "LifecycleController.hpp"
#include "LockStore.hpp"
#include "ProcessImage.hpp"
#include "SignalDispatcher.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

namespace {
constexpr const char* kName = "lifecycle-test";

volatile std::sig_atomic_t g_previousTermHandled = 0;

void RecordTerm(int) {
    g_previousTermHandled = 1;
}

int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

std::string MakeTempDir(const std::string& label) {
    const auto dir = std::filesystem::temp_directory_path()
        / ("onlyone-" + label + "-" + std::to_string(ProcessImage::CurrentPid()));
    std::filesystem::remove_all(dir);
    return dir.generic_string();
}

template <typename Predicate>
bool WaitFor(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

void Quiet(Logger& logger) {
    logger.SetSink([](LogLevel, const std::string&) {});
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Exception&) {
        return true;
    }
    return false;
}

class CountingApp : public LifecycleController {
public:
    CountingApp(const std::string& appDir, const std::string& address = std::string())
        : LifecycleController(kName, address, appDir) {
        RegisterEventHandler("increment", [this](const Event& event) {
            count += event.payload.value("value", 1);
            return nlohmann::json{{"value", count.load()}};
        });
    }

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> count{0};
    bool failOnStart = false;

protected:
    void ConfigureLogging(Logger& logger) override {
        Quiet(logger);
    }

    void ConfigureRoutes(ControlPlaneServer& server) override {
        server.AddRoute(HttpMethod::GET, "/count", [this](const nlohmann::json&) {
            return nlohmann::json{{"success", true}, {"value", count.load()}};
        });
    }

    void OnStart() override {
        ++starts;
        if (failOnStart) {
            throw std::runtime_error("refusing to start");
        }
    }

    void OnStop() override {
        ++stops;
    }
};

int TestStopWithoutInstance() {
    CountingApp app(MakeTempDir("lifecycle-idle"));
    if (app.IsRunning()) {
        return Fail("Nothing should be running yet.");
    }
    if (!Throws<ProcessDoesNotExist>([&] { app.Stop(); })) {
        return Fail("Stop without an instance should raise ProcessDoesNotExist.");
    }
    if (!Throws<ProcessDoesNotExist>([&] { app.Get(); })) {
        return Fail("Get without an instance should raise ProcessDoesNotExist.");
    }
    if (!Throws<ProcessDoesNotExist>([&] { app.SendEvent("increment"); })) {
        return Fail("SendEvent without an instance should raise ProcessDoesNotExist.");
    }
    if (app.ToString() != "<LifecycleController>(\"lifecycle-test\")") {
        return Fail("Unexpected ToString: " + app.ToString());
    }
    if (!Throws<std::invalid_argument>([] { LifecycleController unnamed(""); })) {
        return Fail("An empty name should be rejected.");
    }
    return 0;
}

int TestStartServeAndStop() {
    const std::string appDir = MakeTempDir("lifecycle-basic");
    CountingApp app(appDir);
    app.Start();

    if (app.State() != InstanceState::RUNNING || !app.IsRunning()) {
        return Fail("Start did not leave the instance running.");
    }
    if (app.starts != 1) {
        return Fail("OnStart should run once per start.");
    }
    if (SignalDispatcher::Instance().Size() != 1) {
        return Fail("Start should register one shutdown callback.");
    }

    Logger logger("lifecycle-test-reader", LogLevel::ERROR);
    Quiet(logger);
    const LockRecord record = LockStore(appDir, logger).Read();
    if (record.pid != ProcessImage::CurrentPid() || record.address != app.Address()) {
        return Fail("Lock file does not match the running instance.");
    }
    if (app.PidFile() != appDir + "/.pid") {
        return Fail("Unexpected pid file path: " + app.PidFile());
    }

    nlohmann::json identity = app.Get("/");
    if (identity["name"] != kName || identity["pid"] != app.Pid() || identity["address"] != app.Address()
        || identity["app_dir"] != appDir) {
        return Fail("GET / does not match the lock file: " + identity.dump());
    }

    CountingApp client(appDir);
    if (!Throws<ProcessExists>([&] { client.Start(); })) {
        return Fail("A second start should raise ProcessExists.");
    }
    if (client.starts != 0) {
        return Fail("OnStart ran for an instance that never started.");
    }
    if (client.Address() != app.Address() || client.Pid() != app.Pid()) {
        return Fail("The client identity was not refreshed from the live instance.");
    }

    nlohmann::json response = client.SendEvent("increment", {{"value", 2}});
    if (response["success"] != true || response["value"] != 2) {
        return Fail("First increment returned " + response.dump());
    }
    response = client.SendEvent("increment", {{"value", 2}});
    if (response["value"] != 4) {
        return Fail("Second increment returned " + response.dump());
    }
    if (client.Get("count")["value"] != 4) {
        return Fail("Custom route did not see the increments.");
    }
    response = client.SendEvent("Null");
    if (response["message"] != "Event received. no handler found for Null") {
        return Fail("Unexpected unhandled event response: " + response.dump());
    }

    response = app.Stop();
    if (response != nlohmann::json{{"success", true}, {"message", "Shutting down..."}}) {
        return Fail("Unexpected stop response: " + response.dump());
    }
    if (app.stops != 1 || app.State() != InstanceState::STOPPED) {
        return Fail("Stop did not run OnStop or reset the state.");
    }
    if (app.IsRunning() || client.IsRunning()) {
        return Fail("Instance still reported running after Stop.");
    }
    if (SignalDispatcher::Instance().Size() != 0) {
        return Fail("Stop should remove the shutdown callback.");
    }
    if (!std::filesystem::exists(appDir + "/.pid")) {
        return Fail("Stop must not remove the lock file.");
    }

    app.Start();
    if (!app.IsRunning() || app.starts != 2) {
        return Fail("The same controller could not start again.");
    }
    app.Stop();

    std::filesystem::remove_all(appDir);
    return 0;
}

int TestExplicitAddress() {
    int port = 0;
    {
        Logger logger("port-picker", LogLevel::ERROR);
        Quiet(logger);
        EventDispatcher dispatcher(logger);
        ControlPlaneServer picker([] { return Identity(); }, dispatcher, logger);
        port = picker.Bind("127.0.0.1", 0);
    }
    if (port <= 0) {
        return Fail("Unable to find a free port.");
    }

    const std::string address = "127.0.0.1:" + std::to_string(port);
    CountingApp app(MakeTempDir("lifecycle-explicit"), address);
    app.Start();
    if (app.Address() != "http://" + address) {
        return Fail("Explicit address was not kept: " + app.Address());
    }

    CountingApp elsewhere(MakeTempDir("lifecycle-explicit-other"), address);
    if (!Throws<ProcessExists>([&] { elsewhere.Start(); })) {
        return Fail("An instance answering at the configured address should be found.");
    }
    const nlohmann::json identity = elsewhere.Get("/");
    if (identity["success"] != true || identity["name"] != kName || identity["pid"] != ProcessImage::CurrentPid()
        || identity["address"] != "http://" + address) {
        return Fail("Unexpected identity at the configured address: " + identity.dump());
    }
    app.Stop();

    CountingApp invalid(MakeTempDir("lifecycle-invalid"), "127.0.0.1:notaport");
    if (!Throws<StartError>([&] { invalid.Start(); })) {
        return Fail("An invalid address should raise StartError.");
    }
    if (invalid.State() != InstanceState::STOPPED) {
        return Fail("A failed start should leave the controller stopped.");
    }
    return 0;
}

int TestFailingOnStart() {
    const std::string appDir = MakeTempDir("lifecycle-onstart");
    CountingApp app(appDir);
    app.failOnStart = true;
    if (!Throws<std::runtime_error>([&] { app.Start(); })) {
        return Fail("An OnStart failure should propagate from Start.");
    }
    if (app.IsRunning() || std::filesystem::exists(appDir + "/.pid")) {
        return Fail("A failed start should neither serve nor write the lock file.");
    }
    if (SignalDispatcher::Instance().Size() != 0) {
        return Fail("A failed start should not leave a shutdown callback.");
    }

    app.failOnStart = false;
    app.Start();
    if (!app.IsRunning()) {
        return Fail("Start after a failed attempt did not work.");
    }
    app.Stop();
    return 0;
}

int TestConcurrentStarts() {
    const std::string appDir = MakeTempDir("lifecycle-race");
    std::vector<std::unique_ptr<CountingApp>> apps;
    for (int i = 0; i < 4; ++i) {
        apps.push_back(std::make_unique<CountingApp>(appDir));
    }

    std::atomic<int> started{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (auto& app : apps) {
        threads.emplace_back([&app, &started, &refused] {
            try {
                app->Start();
                ++started;
            } catch (const ProcessExists&) {
                ++refused;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (started != 1 || refused != 3) {
        return Fail("Expected exactly one concurrent start to win, got " + std::to_string(started.load()));
    }

    for (auto& app : apps) {
        if (app->State() == InstanceState::RUNNING) {
            app->Stop();
        }
    }
    std::filesystem::remove_all(appDir);
    return 0;
}

int TestRemoteStopEndsRunForever() {
    const std::string appDir = MakeTempDir("lifecycle-forever");
    CountingApp app(appDir);
    std::thread runner([&app] { app.RunForever(); });

    CountingApp client(appDir);
    if (!WaitFor([&] { return client.IsRunning(); })) {
        runner.detach();
        return Fail("RunForever never came up.");
    }

    const nlohmann::json response = client.Stop();
    if (response["message"] != "Shutting down...") {
        runner.detach();
        return Fail("Unexpected remote stop response: " + response.dump());
    }
    runner.join();

    if (app.stops != 1 || app.State() != InstanceState::STOPPED) {
        return Fail("RunForever did not run OnStop after a remote stop.");
    }
    if (SignalDispatcher::Instance().Size() != 0) {
        return Fail("RunForever left a shutdown callback behind.");
    }
    std::filesystem::remove_all(appDir);
    return 0;
}

int TestRestartUsesRunner() {
    const std::string appDir = MakeTempDir("lifecycle-restart");
    CountingApp app(appDir);
    std::atomic<bool> restarted{false};
    std::atomic<InstanceState> stateDuringRestart{InstanceState::STOPPED};
    app.SetRestartRunner([&app, &restarted, &stateDuringRestart] {
        stateDuringRestart = app.State();
        restarted = true;
    });
    app.Start();

    CountingApp client(appDir);
    const nlohmann::json response = client.Restart();
    if (response != nlohmann::json{{"success", true}, {"message", "Restarting..."}}) {
        return Fail("Unexpected restart response: " + response.dump());
    }
    if (!WaitFor([&] { return restarted.load(); })) {
        return Fail("Restart runner was not invoked.");
    }
    if (app.stops != 1) {
        return Fail("OnStop should run before the image is replaced.");
    }
    if (stateDuringRestart != InstanceState::RESTARTING) {
        return Fail(std::string("Restart runner saw state ") + InstanceStateName(stateDuringRestart));
    }
    if (!WaitFor([&] { return !app.IsRunning(); })) {
        return Fail("Server still serving after restart.");
    }
    if (!Throws<ProcessDoesNotExist>([&] { app.Stop(); })) {
        return Fail("Stop after a restart hand-off should find no instance.");
    }
    if (app.stops != 1) {
        return Fail("OnStop ran twice for one restart.");
    }
    std::filesystem::remove_all(appDir);
    return 0;
}
int TestSignalStopsRunForever() {
#ifndef _WIN32
    const std::string appDir = MakeTempDir("lifecycle-signal");
    CountingApp app(appDir);
    std::atomic<bool> returned{false};
    std::thread runner([&app, &returned] {
        app.RunForever();
        returned = true;
    });

    if (!WaitFor([&] { return app.State() == InstanceState::RUNNING; })) {
        runner.detach();
        return Fail("RunForever never came up.");
    }
    std::raise(SIGTERM);
    runner.join();

    if (!returned) {
        return Fail("RunForever did not return after SIGTERM.");
    }
    if (app.stops != 1 || app.State() != InstanceState::STOPPED) {
        return Fail(std::string("SIGTERM should stop once, state is ") + InstanceStateName(app.State()));
    }
    if (SignalDispatcher::Instance().Size() != 0) {
        return Fail("SIGTERM left a shutdown callback behind.");
    }
    if (app.IsRunning()) {
        return Fail("Instance still reported running after SIGTERM.");
    }
    std::filesystem::remove_all(appDir);
#endif
    return 0;
}

int TestSignalChainsPreviousHandler() {
#ifndef _WIN32
    struct sigaction custom = {};
    custom.sa_handler = &RecordTerm;
    sigemptyset(&custom.sa_mask);
    struct sigaction original = {};
    sigaction(SIGTERM, &custom, &original);
    g_previousTermHandled = 0;

    const std::string appDir = MakeTempDir("lifecycle-chain");
    CountingApp app(appDir);
    app.Start();
    std::raise(SIGTERM);
    const bool chained = WaitFor([&] {
        return g_previousTermHandled != 0 && app.State() == InstanceState::STOPPED;
    });

    struct sigaction restored = {};
    sigaction(SIGTERM, &original, &restored);
    if (!chained) {
        return Fail("The previously installed SIGTERM handler was not chained.");
    }
    if (app.stops != 1) {
        return Fail("OnStop should run once before chaining.");
    }
    if (restored.sa_handler != &RecordTerm) {
        return Fail("The previous SIGTERM handler was not restored after stopping.");
    }
    std::filesystem::remove_all(appDir);
#endif
    return 0;
}
} // namespace

int main() {
    if (int result = TestStopWithoutInstance()) {
        return result;
    }
    if (int result = TestStartServeAndStop()) {
        return result;
    }
    if (int result = TestExplicitAddress()) {
        return result;
    }
    if (int result = TestFailingOnStart()) {
        return result;
    }
    if (int result = TestConcurrentStarts()) {
        return result;
    }
    if (int result = TestRemoteStopEndsRunForever()) {
        return result;
    }
    if (int result = TestRestartUsesRunner()) {
        return result;
    }
    if (int result = TestSignalStopsRunForever()) {
        return result;
    }
    if (int result = TestSignalChainsPreviousHandler()) {
        return result;
    }
    return 0;
}
