#pragma once

#include <string>

class Logger;

struct LockRecord {
    int pid = 0;
    std::string address;
};

// Persists the running instance's pid and address as "<appDir>/.pid".
class LockStore {
public:
    LockStore(std::string appDir, Logger& logger);

    // Creates appDir if needed and atomically replaces the lock file. Throws LockStoreError.
    void Write(int pid, const std::string& address) const;

    // Throws CorruptLockFile when the file is missing or not exactly "<pid>\n<address>".
    LockRecord Read() const;

    bool Exists() const;
    const std::string& Path() const { return path_; }
    const std::string& AppDir() const { return appDir_; }

    void SetAppDir(const std::string& appDir);

    static LockRecord Parse(const std::string& contents);

private:
    std::string appDir_;
    std::string path_;
    Logger& logger_;
};

// Exclusive advisory lock on "<appDir>/.pid.lock", held for the probe/bind/persist
// part of Start() so that concurrent starters of one identity are serialized.
class StartupLock {
public:
    StartupLock(const std::string& appDir, Logger& logger);
    ~StartupLock();

    StartupLock(const StartupLock&) = delete;
    StartupLock& operator=(const StartupLock&) = delete;

    bool Held() const { return held_; }

private:
    std::string lockPath_;
    Logger& logger_;
#ifdef _WIN32
    void* handle_ = nullptr;
#else
    int lockFd_ = -1;
#endif
    bool held_ = false;
};
