#pragma once

#include "Logger.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#endif

// Process-wide, ordered list of shutdown callbacks run on SIGINT, SIGTERM and at exit.
// The signal handler only writes to a self-pipe; callbacks run on a dispatch thread,
// each one guarded and logged on its own. Afterwards a previously installed custom
// handler is chained; default and ignored dispositions are not re-raised.
class SignalDispatcher {
public:
    using Callback = std::function<void()>;

    static SignalDispatcher& Instance();

    // Installs the signal handlers and the exit hook when the first callback is added.
    int Add(const std::string& label, Callback callback);
    // Restores the previous handlers when the last callback is removed. Blocks
    // until a run of this callback already in progress on another thread returns.
    void Remove(int id);
    // Same as Remove() without the wait. For callers holding a lock the callback takes.
    void Detach(int id);

    // Runs every callback in registration order. Returns the number that failed.
    int Dispatch(const std::string& reason);

    size_t Size() const;

    SignalDispatcher(const SignalDispatcher&) = delete;
    SignalDispatcher& operator=(const SignalDispatcher&) = delete;

private:
    struct Entry {
        int id = 0;
        std::string label;
        Callback callback;
    };

    SignalDispatcher();

    void EraseLocked(int id);
    bool IsRegisteredLocked(int id) const;
    bool IsRunningElsewhereLocked(int id) const;

    void Install();
    void Restore();
    void RunDispatchLoop();
    void ChainPrevious(int signum);

    static void OnSignal(int signum);
    static void OnExit();

    std::vector<Entry> entries_;
    // Callbacks currently executing, with the thread running them.
    std::vector<std::pair<int, std::thread::id>> running_;
    std::condition_variable runningDone_;
    int nextId_ = 1;
    bool installed_ = false;
    bool exitHookRegistered_ = false;
    bool dispatchThreadStarted_ = false;
    Logger logger_;
    mutable std::mutex mutex_;

#ifndef _WIN32
    struct sigaction previousInt_ = {};
    struct sigaction previousTerm_ = {};
#endif
};
