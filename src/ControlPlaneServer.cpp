#include "ControlPlaneServer.hpp"

#include "Errors.hpp"
#include "EventDispatcher.hpp"
#include "Logger.hpp"
#include "Tracing.hpp"

#include <httplib.h>

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternalError = 500;

void WriteJson(httplib::Response& res, const nlohmann::json& body, int status = kStatusOk) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

nlohmann::json ParseRequestBody(const httplib::Request& req) {
    if (req.body.empty()) {
        return nlohmann::json::object();
    }

    auto json = nlohmann::json::parse(req.body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw RouteError(kStatusBadRequest, "Request body must be a JSON object.");
    }
    return json;
}

std::string DescribeStatus(int status) {
    switch (status) {
    case kStatusNotFound:
        return "404 Not Found";
    case kStatusMethodNotAllowed:
        return "405 Method Not Allowed";
    default:
        return "HTTP " + std::to_string(status);
    }
}
} // namespace

ControlPlaneServer::ControlPlaneServer(
    IdentityProvider identity,
    EventDispatcher& dispatcher,
    Logger& logger,
    RestartRunner restartRunner)
    : identity_(std::move(identity)),
      dispatcher_(dispatcher),
      logger_(logger),
      restartRunner_(std::move(restartRunner)),
      server_(std::make_unique<httplib::Server>()) {
    RegisterBuiltinRoutes();
}

ControlPlaneServer::~ControlPlaneServer() {
    // A bound socket is only released by the accept loop.
    if (bound_ && !started_) {
        Start();
    }
    RequestStop();
    Join();
}

void ControlPlaneServer::AddRoute(HttpMethod method, const std::string& path, RouteHandler handler) {
    if (bound_) {
        throw std::logic_error("Routes must be added before the control-plane server binds: " + path);
    }

    auto wrapped = [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
        const nlohmann::json body = req.method == "GET" ? nlohmann::json::object() : ParseRequestBody(req);
        WriteJson(res, handler(body));
    };

    switch (method) {
    case HttpMethod::GET:
        server_->Get(path, wrapped);
        break;
    case HttpMethod::POST:
        server_->Post(path, wrapped);
        break;
    case HttpMethod::PUT:
        server_->Put(path, wrapped);
        break;
    case HttpMethod::PATCH:
        server_->Patch(path, wrapped);
        break;
    }
}

void ControlPlaneServer::RegisterBuiltinRoutes() {
    AddRoute(HttpMethod::GET, "/", [this](const nlohmann::json&) {
        return IdentityToJson(identity_());
    });

    AddRoute(HttpMethod::POST, "/event", [this](const nlohmann::json& body) {
        return HandleEvent(body);
    });

    AddRoute(HttpMethod::POST, "/stop", [this](const nlohmann::json&) {
        logger_.Info("Stop requested over the control plane");
        RequestStop();
        return nlohmann::json{{"success", true}, {"message", "Shutting down..."}};
    });

    AddRoute(HttpMethod::POST, "/restart", [this](const nlohmann::json&) {
        logger_.Info("Restart requested over the control plane");
        RequestRestart();
        return nlohmann::json{{"success", true}, {"message", "Restarting..."}};
    });

    server_->set_exception_handler(
        [this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            int status = kStatusInternalError;
            std::string message;
            try {
                std::rethrow_exception(ep);
            } catch (const RouteError& ex) {
                status = ex.Status();
                message = ex.what();
            } catch (const std::exception& ex) {
                message = ex.what();
            } catch (...) {
                message = "Unknown error";
            }

            logger_.Error(req.method + " " + req.path + " failed: " + message);
            WriteJson(res, {{"success", false}, {"message", message}}, status);
        });

    httplib::Server::HandlerWithResponse errorHandler =
        [this](const httplib::Request& req, httplib::Response& res) {
            if (!res.body.empty()) {
                return httplib::Server::HandlerResponse::Unhandled;
            }

            const std::string message = DescribeStatus(res.status) + ": " + req.method + " " + req.path;
            logger_.Error(message);
            WriteJson(res, {{"success", false}, {"message", message}}, res.status);
            return httplib::Server::HandlerResponse::Handled;
        };
    server_->set_error_handler(errorHandler);

    server_->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        if (!logger_.Enabled(LogLevel::DEBUG)) {
            return;
        }
        std::string line = req.method + " " + req.path + " -> " + std::to_string(res.status);
        TraceContext trace;
        if (TraceContext::Parse(req.get_header_value("traceparent"), trace)) {
            line += " trace=" + trace.traceId;
        }
        logger_.Debug(line);
    });
}

nlohmann::json ControlPlaneServer::HandleEvent(const nlohmann::json& body) {
    if (!body.contains("name")) {
        return {
            {"success", false},
            {"message", "Event missing required field \"name\"."}
        };
    }

    if (!body["name"].is_string() || body["name"].get<std::string>().empty()) {
        return {
            {"success", false},
            {"message", "Event field \"name\" must be a non-empty string."}
        };
    }

    return dispatcher_.Dispatch(Event::FromBody(body));
}

int ControlPlaneServer::Bind(const std::string& host, int port) {
    if (bound_) {
        throw std::logic_error("Control-plane server is already bound");
    }

    if (port == 0) {
        port_ = server_->bind_to_any_port(host);
    } else {
        port_ = server_->bind_to_port(host, port) ? port : -1;
    }

    if (port_ <= 0) {
        port_ = -1;
        logger_.Error("Unable to bind control-plane server to " + host + ":" + std::to_string(port));
        return -1;
    }

    bound_ = true;
    return port_;
}

void ControlPlaneServer::Start(std::function<void()> onFinished) {
    if (!bound_) {
        throw std::logic_error("Control-plane server must be bound before it starts");
    }

    std::lock_guard<std::mutex> lock(workerMutex_);
    if (started_.exchange(true)) {
        return;
    }

    onFinished_ = std::move(onFinished);
    serving_ = true;
    worker_ = std::thread(&ControlPlaneServer::Run, this);

    // The socket already listens; wait until the accept loop owns it so that
    // RequestStop() cannot race ahead of it.
    while (serving_ && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void ControlPlaneServer::Run() {
    if (!server_->listen_after_bind()) {
        logger_.Error("Control-plane accept loop ended with an error");
    }
    logger_.Debug("Control-plane accept loop finished");

    // Reported as serving until the restart runner returns; the owner must not
    // reap a restart hand-off as a remote stop.
    if (restartRequested_ && restartRunner_) {
        try {
            restartRunner_();
        } catch (const std::exception& ex) {
            logger_.Error(std::string("Restart failed: ") + ex.what());
        }
    }
    serving_ = false;

    if (onFinished_) {
        onFinished_();
    }
}

void ControlPlaneServer::RequestStop() {
    if (server_->is_running()) {
        server_->stop();
    }
}

void ControlPlaneServer::RequestRestart() {
    restartRequested_ = true;
    RequestStop();
}

void ControlPlaneServer::Join() {
    std::lock_guard<std::mutex> lock(workerMutex_);
    if (!worker_.joinable()) {
        return;
    }

    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
}
