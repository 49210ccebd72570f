#include "Config.hpp"
#include "ControlPlaneServer.hpp"
#include "Errors.hpp"
#include "LifecycleController.hpp"
#include "ProcessImage.hpp"
#include "Tracing.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
constexpr const char* kDefaultName = "counter";

long long ReadDelta(const nlohmann::json& body) {
    if (body.is_object() && body.contains("value") && body["value"].is_number_integer()) {
        return body["value"].get<long long>();
    }
    return 1;
}

// A counter that survives restarts by persisting itself to <appDir>/count.
class CounterApp : public LifecycleController {
public:
    explicit CounterApp(InstanceOptions options)
        : LifecycleController(std::move(options)) {
        RegisterEventHandler("ack", [](const Event&) {
            return nlohmann::json{{"message", "Hello there!"}};
        });
        RegisterEventHandler("increment", [this](const Event& event) {
            return nlohmann::json{{"value", Adjust(ReadDelta(event.payload))}};
        });
        RegisterEventHandler("decrement", [this](const Event& event) {
            return nlohmann::json{{"value", Adjust(-ReadDelta(event.payload))}};
        });
    }

protected:
    void ConfigureLogging(Logger& logger) override {
        if (logger.Level() > LogLevel::INFO) {
            logger.SetLevel(LogLevel::INFO);
        }
    }

    void ConfigureRoutes(ControlPlaneServer& server) override {
        server.AddRoute(HttpMethod::GET, "/count", [this](const nlohmann::json&) {
            Log().Info("Client requested count.");
            return nlohmann::json{{"success", true}, {"value", count_.load()}};
        });
        server.AddRoute(HttpMethod::POST, "/increment", [this](const nlohmann::json& body) {
            const long long value = Adjust(ReadDelta(body));
            Log().Info("Client incremented count to " + std::to_string(value) + ".");
            return nlohmann::json{{"success", true}, {"value", value}};
        });
        server.AddRoute(HttpMethod::POST, "/decrement", [this](const nlohmann::json& body) {
            const long long value = Adjust(-ReadDelta(body));
            Log().Info("Client decremented count to " + std::to_string(value) + ".");
            return nlohmann::json{{"success", true}, {"value", value}};
        });
    }

    void OnStart() override {
        std::filesystem::create_directories(AppDir());

        std::ifstream input(CountPath());
        long long stored = 0;
        if (input && input >> stored) {
            Log().Info("Loaded count from " + CountPath() + ".");
            count_ = stored;
        }
        Log().Info("Count is " + std::to_string(count_.load()) + ".");
    }

    void OnStop() override {
        Log().Info("Persisting count to " + CountPath() + ".");
        std::ofstream output(CountPath(), std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Unable to write " + CountPath());
        }
        output << count_.load();
    }

private:
    long long Adjust(long long delta) {
        return count_ += delta;
    }

    std::string CountPath() const {
        return AppDir() + "/count";
    }

    std::atomic<long long> count_{0};
};

struct CommandLine {
    InstanceOptions options;
    std::vector<std::string> command;
    bool valid = true;
};

void PrintUsage() {
    std::cerr << "usage: onlyone-demo [--name NAME] [--address HOST:PORT] [--app-dir DIR] [--debug] [COMMAND]\n"
              << "commands (sent to the running instance):\n"
              << "  status | count | increment [n] | decrement [n] | event NAME [JSON] | stop | restart"
              << std::endl;
}

CommandLine ParseCommandLine(int argc, char** argv) {
    std::string name = kDefaultName;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "--name") {
            name = args[i + 1];
        }
    }

    CommandLine parsed;
    parsed.options = InstanceOptions::FromEnvironment(name);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const bool hasValue = i + 1 < args.size();
        if (arg == "--name" && hasValue) {
            ++i;
        } else if (arg == "--address" && hasValue) {
            parsed.options.address = args[++i];
        } else if (arg == "--app-dir" && hasValue) {
            parsed.options.appDir = args[++i];
        } else if (arg == "--debug") {
            parsed.options.debug = true;
        } else if (arg == "--help" || arg == "-h" || arg.rfind("--", 0) == 0) {
            parsed.valid = false;
        } else {
            parsed.command.push_back(arg);
        }
    }
    return parsed;
}

nlohmann::json ValuePayload(const std::vector<std::string>& command) {
    if (command.size() < 2) {
        return nlohmann::json::object();
    }
    return nlohmann::json{{"value", std::stoll(command[1])}};
}

int RunClientCommand(CounterApp& app, const std::vector<std::string>& command) {
    const std::string verb = command.empty() ? "status" : command.front();

    nlohmann::json response;
    if (verb == "status") {
        response = app.Get("/");
    } else if (verb == "count") {
        response = app.Get("count");
    } else if (verb == "increment" || verb == "decrement") {
        response = app.Send(verb, ValuePayload(command));
    } else if (verb == "event" && command.size() >= 2) {
        const nlohmann::json payload = command.size() >= 3
            ? nlohmann::json::parse(command[2])
            : nlohmann::json::object();
        response = app.SendEvent(command[1], payload);
    } else if (verb == "stop") {
        response = app.Stop();
    } else if (verb == "restart") {
        response = app.Restart();
    } else {
        PrintUsage();
        return 2;
    }

    std::cout << response.dump(2) << std::endl;
    return response.value("success", false) ? 0 : 1;
}
} // namespace

int main(int argc, char** argv) {
    ProcessImage::Remember(argc, argv);

    CommandLine commandLine = ParseCommandLine(argc, argv);
    if (!commandLine.valid) {
        PrintUsage();
        return 2;
    }

    Tracer::Instance().Configure(TraceConfigFromEnvironment());

    int exitCode = 0;
    try {
        CounterApp app(commandLine.options);
        try {
            app.RunForever();
        } catch (const ProcessExists&) {
            std::cout << "[Demo] " << app.Name() << " running at " << app.Address() << std::endl;
            exitCode = RunClientCommand(app, commandLine.command);
        }
    } catch (const InstanceError& ex) {
        std::cerr << "[Demo] " << ex.what() << std::endl;
        exitCode = 1;
    } catch (const std::exception& ex) {
        std::cerr << "[Demo] Command failed: " << ex.what() << std::endl;
        exitCode = 1;
    }

    Tracer::Instance().Shutdown();
    return exitCode;
}
