#pragma once

#include "Identity.hpp"

#include <string>

class LockStore;
class Logger;
class NetworkClient;

// Decides whether an identity belongs to a live, responsive instance.
class LivenessChecker {
public:
    // `explicitAddress` is the address the instance was configured with, probed
    // before the lock file is consulted. Empty means lock file only.
    LivenessChecker(const LockStore& lockStore,
                    const NetworkClient& client,
                    Logger& logger,
                    std::string explicitAddress = std::string());

    // Refreshes identity from the live instance on success. `serving` is true when
    // the caller itself owns the running control-plane server.
    bool IsRunning(Identity& identity, bool serving) const;

    // kill(pid, 0) style existence check.
    static bool IsProcessAlive(int pid);

private:
    bool ProbeAddress(const std::string& address, Identity& outIdentity) const;
    bool MatchesName(const Identity& remote, const Identity& expected, const std::string& address) const;

    const LockStore& lockStore_;
    const NetworkClient& client_;
    Logger& logger_;
    std::string explicitAddress_;
};
