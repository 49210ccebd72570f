#include "SignalDispatcher.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <thread>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace {
#ifndef _WIN32
int g_signalPipe[2] = {-1, -1};

bool IsCustomHandler(const struct sigaction& action) {
    if (action.sa_flags & SA_SIGINFO) {
        return action.sa_sigaction != nullptr;
    }
    return action.sa_handler != SIG_DFL && action.sa_handler != SIG_IGN && action.sa_handler != nullptr;
}
#endif
} // namespace

SignalDispatcher& SignalDispatcher::Instance() {
    // Never destroyed: the dispatch thread may still be parked on the pipe at exit.
    static SignalDispatcher* instance = new SignalDispatcher();
    return *instance;
}

SignalDispatcher::SignalDispatcher()
    : logger_("shutdown") {}

int SignalDispatcher::Add(const std::string& label, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int id = nextId_++;
    entries_.push_back(Entry{id, label, std::move(callback)});
    logger_.Debug("Registered shutdown callback " + label);

    if (!exitHookRegistered_) {
        if (std::atexit(&SignalDispatcher::OnExit) != 0) {
            logger_.Warn("Unable to register exit hook");
        } else {
            exitHookRegistered_ = true;
        }
    }

    if (!installed_) {
        Install();
    }
    return id;
}

void SignalDispatcher::Remove(int id) {
    std::unique_lock<std::mutex> lock(mutex_);
    EraseLocked(id);
    runningDone_.wait(lock, [this, id] { return !IsRunningElsewhereLocked(id); });
}

void SignalDispatcher::Detach(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    EraseLocked(id);
}

void SignalDispatcher::EraseLocked(int id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->id == id) {
            logger_.Debug("Removed shutdown callback " + it->label);
            entries_.erase(it);
            break;
        }
    }

    if (entries_.empty() && installed_) {
        Restore();
    }
}

bool SignalDispatcher::IsRegisteredLocked(int id) const {
    return std::any_of(entries_.begin(), entries_.end(), [id](const Entry& entry) { return entry.id == id; });
}

bool SignalDispatcher::IsRunningElsewhereLocked(int id) const {
    const std::thread::id self = std::this_thread::get_id();
    return std::any_of(running_.begin(), running_.end(), [id, self](const std::pair<int, std::thread::id>& run) {
        return run.first == id && run.second != self;
    });
}

size_t SignalDispatcher::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

int SignalDispatcher::Dispatch(const std::string& reason) {
    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries = entries_;
    }

    int failures = 0;
    for (const auto& entry : entries) {
        const std::pair<int, std::thread::id> run(entry.id, std::this_thread::get_id());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Removed since the copy was taken: its owner may already be gone.
            if (!IsRegisteredLocked(entry.id)) {
                continue;
            }
            running_.push_back(run);
        }

        try {
            entry.callback();
            logger_.Debug("Shutdown callback " + entry.label + " completed (" + reason + ")");
        } catch (const std::exception& ex) {
            ++failures;
            logger_.Error("Shutdown callback " + entry.label + " failed (" + reason + "): " + ex.what());
        } catch (...) {
            ++failures;
            logger_.Error("Shutdown callback " + entry.label + " failed (" + reason + ") with an unknown exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = std::find(running_.begin(), running_.end(), run);
            if (it != running_.end()) {
                running_.erase(it);
            }
        }
        runningDone_.notify_all();
    }
    return failures;
}

void SignalDispatcher::Install() {
#ifndef _WIN32
    if (g_signalPipe[0] == -1) {
        if (pipe(g_signalPipe) != 0) {
            logger_.Error(std::string("Unable to create signal pipe: ") + std::strerror(errno));
            return;
        }
        fcntl(g_signalPipe[0], F_SETFD, FD_CLOEXEC);
        fcntl(g_signalPipe[1], F_SETFD, FD_CLOEXEC);
        fcntl(g_signalPipe[1], F_SETFL, O_NONBLOCK);
    }

    if (!dispatchThreadStarted_) {
        std::thread(&SignalDispatcher::RunDispatchLoop, this).detach();
        dispatchThreadStarted_ = true;
    }

    struct sigaction action = {};
    action.sa_handler = &SignalDispatcher::OnSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    sigaction(SIGINT, &action, &previousInt_);
    sigaction(SIGTERM, &action, &previousTerm_);
#endif
    installed_ = true;
}

void SignalDispatcher::Restore() {
#ifndef _WIN32
    sigaction(SIGINT, &previousInt_, nullptr);
    sigaction(SIGTERM, &previousTerm_, nullptr);
#endif
    installed_ = false;
}

void SignalDispatcher::RunDispatchLoop() {
#ifndef _WIN32
    while (true) {
        unsigned char signum = 0;
        const ssize_t count = read(g_signalPipe[0], &signum, 1);
        if (count < 0 && errno == EINTR) {
            continue;
        }
        if (count <= 0) {
            logger_.Error("Signal pipe closed, shutdown callbacks will no longer run on signals");
            return;
        }

        logger_.Info("Received signal " + std::to_string(signum));
        Dispatch("signal " + std::to_string(signum));
        ChainPrevious(signum);
    }
#endif
}

void SignalDispatcher::ChainPrevious(int signum) {
#ifndef _WIN32
    struct sigaction previous = {};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = signum == SIGINT ? previousInt_ : previousTerm_;
    }

    if (!IsCustomHandler(previous)) {
        return;
    }

    if (previous.sa_flags & SA_SIGINFO) {
        siginfo_t info = {};
        info.si_signo = signum;
        previous.sa_sigaction(signum, &info, nullptr);
    } else {
        previous.sa_handler(signum);
    }
#else
    (void)signum;
#endif
}

void SignalDispatcher::OnSignal(int signum) {
#ifndef _WIN32
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signum);
    if (g_signalPipe[1] != -1) {
        const ssize_t ignored = write(g_signalPipe[1], &byte, 1);
        (void)ignored;
    }
    errno = savedErrno;
#else
    (void)signum;
#endif
}

void SignalDispatcher::OnExit() {
    Instance().Dispatch("process exit");
}
