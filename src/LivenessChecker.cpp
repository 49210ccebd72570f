#include "LivenessChecker.hpp"

#include "Errors.hpp"
#include "LockStore.hpp"
#include "Logger.hpp"
#include "NetworkClient.hpp"

#include <cerrno>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#endif

LivenessChecker::LivenessChecker(const LockStore& lockStore,
                                 const NetworkClient& client,
                                 Logger& logger,
                                 std::string explicitAddress)
    : lockStore_(lockStore),
      client_(client),
      logger_(logger),
      explicitAddress_(NormalizeAddress(explicitAddress)) {}

bool LivenessChecker::IsRunning(Identity& identity, bool serving) const {
    if (serving) {
        return true;
    }

    if (!explicitAddress_.empty()) {
        Identity remote = identity;
        if (ProbeAddress(explicitAddress_, remote) && MatchesName(remote, identity, explicitAddress_)) {
            identity = remote;
            return true;
        }
        logger_.Debug("No matching instance answered at " + explicitAddress_);
    }

    if (!lockStore_.Exists()) {
        logger_.Debug("Process is not running. No .pid file found.");
        return false;
    }

    logger_.Debug("Found " + lockStore_.Path());
    LockRecord record;
    try {
        record = lockStore_.Read();
    } catch (const CorruptLockFile& ex) {
        logger_.Error("Invalid .pid file " + lockStore_.Path() + ": " + ex.what());
        return false;
    }

    identity.pid = record.pid;
    identity.address = record.address;

    if (!IsProcessAlive(record.pid)) {
        logger_.Debug("Process " + std::to_string(record.pid) + " not found.");
        return false;
    }

    logger_.Debug("Found process " + std::to_string(record.pid) + ", checking " + record.address);
    Identity remote = identity;
    if (!ProbeAddress(record.address, remote)) {
        logger_.Debug("Got no response from control-plane server.");
        return false;
    }

    // The pid may have been reused by another program listening on a recycled port.
    if (!MatchesName(remote, identity, record.address)) {
        return false;
    }

    identity = remote;
    logger_.Debug("Control-plane server is running, process is accepting events.");
    return true;
}

bool LivenessChecker::ProbeAddress(const std::string& address, Identity& outIdentity) const {
    const auto response = client_.Probe(JoinRoute(address, "/"));
    if (!response) {
        return false;
    }

    Identity remote;
    if (!IdentityFromJson(*response, remote)) {
        logger_.Warn("Unexpected identity response from " + address);
        return false;
    }

    if (remote.appDir.empty()) {
        remote.appDir = outIdentity.appDir;
    }
    outIdentity = remote;
    return true;
}

bool LivenessChecker::MatchesName(const Identity& remote, const Identity& expected, const std::string& address) const {
    if (remote.name == expected.name) {
        return true;
    }
    logger_.Warn("Instance at " + address + " is \"" + remote.name + "\", expected \"" + expected.name + "\"");
    return false;
}

bool LivenessChecker::IsProcessAlive(int pid) {
    if (pid <= 0) {
        return false;
    }

#ifdef _WIN32
    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == nullptr) {
        return false;
    }

    DWORD exitCode = 0;
    const bool alive = GetExitCodeProcess(process, &exitCode) && exitCode == STILL_ACTIVE;
    CloseHandle(process);
    return alive;
#else
    if (kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
#endif
}
