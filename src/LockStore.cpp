#include "LockStore.hpp"

#include "Errors.hpp"
#include "Identity.hpp"
#include "Logger.hpp"
#include "ProcessImage.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace {
constexpr const char* kLockFileName = ".pid";
constexpr const char* kStartupLockFileName = ".pid.lock";

std::vector<std::string> SplitLines(const std::string& contents) {
    std::vector<std::string> lines;
    std::istringstream stream(contents);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

bool ParsePositiveInt(const std::string& text, int& outValue) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }

    const long long value = std::stoll(text);
    if (value <= 0 || value > 0x7fffffffLL) {
        return false;
    }
    outValue = static_cast<int>(value);
    return true;
}

void EnsureDirectory(const std::string& dir, Logger& logger) {
    std::error_code error;
    if (std::filesystem::exists(dir, error)) {
        return;
    }

    logger.Debug("Creating " + dir);
    std::filesystem::create_directories(dir, error);
    if (error) {
        throw LockStoreError("Unable to create " + dir + ": " + error.message());
    }
}
} // namespace

LockStore::LockStore(std::string appDir, Logger& logger)
    : logger_(logger) {
    SetAppDir(appDir);
}

void LockStore::SetAppDir(const std::string& appDir) {
    appDir_ = NormalizeAppDir(appDir);
    path_ = appDir_ + "/" + kLockFileName;
}

void LockStore::Write(int pid, const std::string& address) const {
    EnsureDirectory(appDir_, logger_);

    const std::string tempPath = path_ + "." + std::to_string(ProcessImage::CurrentPid()) + ".tmp";
    logger_.Debug("Writing " + path_);
    {
        std::ofstream output(tempPath, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw LockStoreError("Unable to write " + tempPath);
        }

        output << pid << '\n' << address << '\n';
        output.flush();
        if (!output.good()) {
            throw LockStoreError("Unable to write " + tempPath);
        }
    }

    std::error_code error;
    std::filesystem::rename(tempPath, path_, error);
    if (error) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        throw LockStoreError("Unable to replace " + path_ + ": " + error.message());
    }
}

LockRecord LockStore::Read() const {
    logger_.Debug("Reading " + path_);

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        throw CorruptLockFile("Unable to open " + path_);
    }

    std::ostringstream contents;
    contents << input.rdbuf();
    return Parse(contents.str());
}

bool LockStore::Exists() const {
    std::error_code error;
    return std::filesystem::is_regular_file(path_, error);
}

LockRecord LockStore::Parse(const std::string& contents) {
    const std::vector<std::string> lines = SplitLines(contents);
    if (lines.size() != 2) {
        throw CorruptLockFile("Expected 2 lines in lock file, found " + std::to_string(lines.size()));
    }

    LockRecord record;
    if (!ParsePositiveInt(lines[0], record.pid)) {
        throw CorruptLockFile("Invalid pid in lock file: \"" + lines[0] + "\"");
    }

    if (lines[1].empty()) {
        throw CorruptLockFile("Empty address in lock file");
    }
    record.address = NormalizeAddress(lines[1]);
    return record;
}

StartupLock::StartupLock(const std::string& appDir, Logger& logger)
    : lockPath_(NormalizeAppDir(appDir) + "/" + kStartupLockFileName),
      logger_(logger) {
    EnsureDirectory(NormalizeAppDir(appDir), logger_);

#ifdef _WIN32
    HANDLE handle = CreateFileA(
        lockPath_.c_str(),
        GENERIC_READ | GENERIC_WRITE,
        FILE_SHARE_READ | FILE_SHARE_WRITE,
        nullptr,
        OPEN_ALWAYS,
        FILE_ATTRIBUTE_NORMAL,
        nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        logger_.Warn("Unable to open startup lock " + lockPath_);
        return;
    }

    OVERLAPPED overlapped = {};
    if (!LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK, 0, MAXDWORD, MAXDWORD, &overlapped)) {
        logger_.Warn("Unable to lock " + lockPath_);
        CloseHandle(handle);
        return;
    }
    handle_ = handle;
    held_ = true;
#else
    lockFd_ = open(lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
    if (lockFd_ == -1) {
        logger_.Warn("Unable to open startup lock " + lockPath_ + " (" + std::strerror(errno) + ")");
        return;
    }

    int result = 0;
    do {
        result = flock(lockFd_, LOCK_EX);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        logger_.Warn("Unable to lock " + lockPath_ + " (" + std::strerror(errno) + ")");
        close(lockFd_);
        lockFd_ = -1;
        return;
    }
    held_ = true;
#endif
    logger_.Debug("Acquired " + lockPath_);
}

StartupLock::~StartupLock() {
#ifdef _WIN32
    if (handle_ != nullptr) {
        OVERLAPPED overlapped = {};
        UnlockFileEx(static_cast<HANDLE>(handle_), 0, MAXDWORD, MAXDWORD, &overlapped);
        CloseHandle(static_cast<HANDLE>(handle_));
        handle_ = nullptr;
    }
#else
    if (lockFd_ != -1) {
        flock(lockFd_, LOCK_UN);
        close(lockFd_);
        lockFd_ = -1;
    }
#endif
}
