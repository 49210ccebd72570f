#include "AppDirs.hpp"
#include "Config.hpp"
#include "Identity.hpp"
#include "Logger.hpp"
#include "NetworkClient.hpp"
#include "Tracing.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value ? value : "");
#else
    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
#endif
}
} // namespace

int main() {
    if (NormalizeAddress("127.0.0.1:9876") != "http://127.0.0.1:9876") {
        return Fail("Bare host:port was not prefixed with http://");
    }
    if (NormalizeAddress("http://127.0.0.1:9876/") != "http://127.0.0.1:9876") {
        return Fail("Scheme was doubled or trailing slash kept.");
    }
    if (!NormalizeAddress("").empty()) {
        return Fail("Empty address should stay empty.");
    }
    if (NormalizeAppDir("C:\\Users\\me\\app\\") != "C:/Users/me/app") {
        return Fail("App dir separators were not normalized.");
    }

    Endpoint endpoint;
    if (!ParseEndpoint("http://127.0.0.1:9876", endpoint) || endpoint.host != "127.0.0.1" || endpoint.port != 9876) {
        return Fail("ParseEndpoint failed for a full address.");
    }
    if (!ParseEndpoint("[::1]:8080", endpoint) || endpoint.host != "::1" || endpoint.port != 8080) {
        return Fail("ParseEndpoint failed for a bracketed IPv6 address.");
    }
    const std::vector<std::string> badAddresses = {"127.0.0.1", "127.0.0.1:", ":80", "host:99999", "host:http"};
    for (const auto& bad : badAddresses) {
        if (ParseEndpoint(bad, endpoint)) {
            return Fail("ParseEndpoint accepted " + bad);
        }
    }

    if (JoinRoute("http://127.0.0.1:1/", "/count") != "http://127.0.0.1:1/count") {
        return Fail("JoinRoute doubled a slash.");
    }
    if (JoinRoute("http://127.0.0.1:1", "") != "http://127.0.0.1:1/") {
        return Fail("JoinRoute lost the root route.");
    }

    Identity identity{"demo", "http://127.0.0.1:1", "/tmp/demo", 77};
    const nlohmann::json json = IdentityToJson(identity);
    if (!json["success"].get<bool>() || json["pid"] != 77 || json["app_dir"] != "/tmp/demo") {
        return Fail("Unexpected identity JSON: " + json.dump());
    }

    Identity parsed;
    if (!IdentityFromJson({{"name", "demo"}, {"pid", "77"}, {"address", "127.0.0.1:1"}}, parsed)
        || parsed.pid != 77 || parsed.address != "http://127.0.0.1:1") {
        return Fail("IdentityFromJson rejected a string pid.");
    }
    if (IdentityFromJson({{"name", "demo"}, {"pid", 0}, {"address", "127.0.0.1:1"}}, parsed)) {
        return Fail("IdentityFromJson accepted pid 0.");
    }
    if (IdentityFromJson({{"name", "demo"}, {"pid", 5}}, parsed)) {
        return Fail("IdentityFromJson accepted a response without an address.");
    }

    SetEnv("ONLYONE_TEST_BOOL", "Yes");
    if (!GetEnvBool("ONLYONE_TEST_BOOL", false)) {
        return Fail("GetEnvBool did not accept Yes.");
    }
    SetEnv("ONLYONE_TEST_BOOL", "maybe");
    if (!GetEnvBool("ONLYONE_TEST_BOOL", true) || GetEnvBool("ONLYONE_TEST_BOOL", false)) {
        return Fail("GetEnvBool should fall back to the default for unknown values.");
    }
    SetEnv("ONLYONE_TEST_BOOL", nullptr);

    SetEnv("ONLYONE_ADDRESS", "127.0.0.1:7000");
    SetEnv("ONLYONE_APP_DIR", "/tmp/onlyone-config-test");
    SetEnv("ONLYONE_DEBUG", "1");
    SetEnv("ONLYONE_CONNECT_TIMEOUT_MS", "250");
    SetEnv("ONLYONE_REQUEST_TIMEOUT_MS", "not-a-number");
    const InstanceOptions options = InstanceOptions::FromEnvironment("configured");
    if (options.name != "configured" || options.address != "127.0.0.1:7000"
        || options.appDir != "/tmp/onlyone-config-test" || !options.debug) {
        return Fail("FromEnvironment did not pick up the environment.");
    }
    if (options.timeouts.connect.count() != 250 || options.timeouts.request.count() != 2000) {
        return Fail("FromEnvironment parsed unexpected timeouts.");
    }
    const NetworkClient configuredClient(options.timeouts);
    if (configuredClient.Timeouts().connect.count() != 250 || configuredClient.Timeouts().request.count() != 2000) {
        return Fail("NetworkClient did not keep the configured timeouts.");
    }
    SetEnv("ONLYONE_ADDRESS", nullptr);
    SetEnv("ONLYONE_APP_DIR", nullptr);
    SetEnv("ONLYONE_DEBUG", nullptr);
    SetEnv("ONLYONE_CONNECT_TIMEOUT_MS", nullptr);
    SetEnv("ONLYONE_REQUEST_TIMEOUT_MS", nullptr);

#if !defined(_WIN32) && !defined(__APPLE__)
    SetEnv("XDG_DATA_HOME", "/tmp/onlyone-xdg");
    if (UserDataDir("demo") != "/tmp/onlyone-xdg/demo") {
        return Fail("UserDataDir ignored XDG_DATA_HOME: " + UserDataDir("demo"));
    }
    SetEnv("XDG_DATA_HOME", nullptr);
    SetEnv("HOME", "/tmp/onlyone-home");
    if (UserDataDir("demo") != "/tmp/onlyone-home/.local/share/demo") {
        return Fail("Unexpected default data dir: " + UserDataDir("demo"));
    }
#endif

    const TraceContext generated = TraceContext::Generate();
    TraceContext parsedTrace;
    if (!generated.Valid() || !TraceContext::Parse(generated.ToHeader(), parsedTrace)
        || parsedTrace.traceId != generated.traceId || !parsedTrace.sampled) {
        return Fail("Generated traceparent did not parse back: " + generated.ToHeader());
    }
    if (!TraceContext::Parse("00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00", parsedTrace)
        || parsedTrace.spanId != "00f067aa0ba902b7" || parsedTrace.sampled) {
        return Fail("A valid unsampled traceparent was rejected.");
    }
    const std::vector<std::string> badTraceparents = {
        "",
        "00-00000000000000000000000000000000-00f067aa0ba902b7-01",
        "00-4bf92f3577b34da6a3ce929d0e0e4736-0000000000000000-01",
        "ff-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01",
        "00-4BF92F3577B34DA6A3CE929D0E0E4736-00f067aa0ba902b7-01",
    };
    for (const auto& bad : badTraceparents) {
        if (TraceContext::Parse(bad, parsedTrace)) {
            return Fail("Malformed traceparent accepted: " + bad);
        }
    }

    Logger logger("demo");
    std::ostringstream captured;
    logger.SetStream(captured);
    logger.Info("hidden");
    logger.Warn("shown");
    logger.SetLevel(LogLevel::DEBUG);
    logger.Debug("details");
    if (captured.str() != "[demo] WARN shown\n[demo] DEBUG details\n") {
        return Fail("Unexpected log output: " + captured.str());
    }

    return 0;
}
