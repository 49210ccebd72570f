#pragma once

#include <string>
#include <vector>

class Logger;

// The running program image: its pid, executable and command line.
class ProcessImage {
public:
    // Records argv so that ReExec() can replay it. Optional on Linux.
    static void Remember(int argc, char** argv);

    static int CurrentPid();
    static std::string ExecutablePath();
    static std::vector<std::string> Arguments();

    // Replaces the current process with a new execution of the same program and
    // arguments. Only returns when the exec failed.
    static void ReExec(Logger& logger);
};
