#pragma once

#include <stdexcept>
#include <string>

class InstanceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by Start() when a live instance already answers for the identity.
class ProcessExists : public InstanceError {
public:
    using InstanceError::InstanceError;
};

// Raised by Stop(), Get() and Send() when no live instance can be found.
class ProcessDoesNotExist : public InstanceError {
public:
    using InstanceError::InstanceError;
};

class CorruptLockFile : public InstanceError {
public:
    using InstanceError::InstanceError;
};

class LockStoreError : public InstanceError {
public:
    using InstanceError::InstanceError;
};

class StartError : public InstanceError {
public:
    using InstanceError::InstanceError;
};

class TransportError : public InstanceError {
public:
    using InstanceError::InstanceError;
};

// Thrown from a route handler to answer with a specific HTTP status.
class RouteError : public InstanceError {
public:
    RouteError(int status, const std::string& message)
        : InstanceError(message),
          status_(status) {}

    int Status() const { return status_; }

private:
    int status_;
};
