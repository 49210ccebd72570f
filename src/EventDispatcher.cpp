#include "EventDispatcher.hpp"

#include "Logger.hpp"

#include <cstdlib>
#include <exception>
#include <memory>
#include <typeinfo>
#include <utility>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace {
std::string Demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(name, nullptr, nullptr, &status),
        std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return name;
}
} // namespace

Event Event::FromBody(const nlohmann::json& body) {
    Event event;
    event.name = body.value("name", "");
    for (auto it = body.begin(); it != body.end(); ++it) {
        if (it.key() != "name") {
            event.payload[it.key()] = it.value();
        }
    }
    return event;
}

nlohmann::json Event::ToBody() const {
    nlohmann::json body = payload.is_object() ? payload : nlohmann::json::object();
    body["name"] = name;
    return body;
}

EventDispatcher::EventDispatcher(Logger& logger)
    : logger_(logger) {}

void EventDispatcher::Register(const std::string& name, Handler handler) {
    logger_.Debug("Handler registered for all \"" + name + "\" events");
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[name] = std::move(handler);
}

void EventDispatcher::Unregister(const std::string& name) {
    logger_.Debug("Removing handler for \"" + name + "\"");
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(name);
}

bool EventDispatcher::HasHandler(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(name) > 0;
}

nlohmann::json EventDispatcher::Dispatch(const Event& event) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = handlers_.find(event.name);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        return {
            {"success", true},
            {"message", "Event received. no handler found for " + event.name}
        };
    }

    try {
        return MergeResult(handler(event));
    } catch (const std::exception& ex) {
        return ReportFailure(event, Demangle(typeid(ex).name()), ex.what());
    } catch (...) {
        return ReportFailure(event, "unknown exception", "non-standard exception thrown");
    }
}

nlohmann::json EventDispatcher::MergeResult(const nlohmann::json& result) {
    nlohmann::json response = nlohmann::json::object();
    if (result.is_object()) {
        response = result;
    } else if (!result.is_null()) {
        response["result"] = result;
    }
    response["success"] = true;
    return response;
}

nlohmann::json EventDispatcher::ReportFailure(const Event& event, const std::string& type, const std::string& what) {
    const std::string detail = "Event handler for \"" + event.name + "\" raised " + type + ": " + what;
    logger_.Error(detail + " (payload: " + event.payload.dump() + ")");
    return {
        {"success", false},
        {"message", detail}
    };
}
