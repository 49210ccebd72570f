#include "ProcessImage.hpp"

#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <process.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
std::mutex& ArgumentsMutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<std::string>& RememberedArguments() {
    static std::vector<std::string> arguments;
    return arguments;
}

std::vector<std::string> ReadProcCmdline() {
    std::vector<std::string> arguments;
    std::ifstream input("/proc/self/cmdline", std::ios::binary);
    if (!input) {
        return arguments;
    }

    std::string argument;
    while (std::getline(input, argument, '\0')) {
        arguments.push_back(argument);
    }
    return arguments;
}
} // namespace

void ProcessImage::Remember(int argc, char** argv) {
    std::lock_guard<std::mutex> lock(ArgumentsMutex());
    auto& arguments = RememberedArguments();
    arguments.clear();
    for (int i = 0; i < argc; ++i) {
        arguments.emplace_back(argv[i] ? argv[i] : "");
    }
}

int ProcessImage::CurrentPid() {
#ifdef _WIN32
    return static_cast<int>(GetCurrentProcessId());
#else
    return static_cast<int>(getpid());
#endif
}

std::string ProcessImage::ExecutablePath() {
    std::error_code error;
    const auto procPath = std::filesystem::canonical("/proc/self/exe", error);
    if (!error) {
        return procPath.string();
    }

    const auto arguments = Arguments();
    if (arguments.empty()) {
        return {};
    }

    std::filesystem::path candidate(arguments.front());
    if (!candidate.is_absolute() && candidate.has_parent_path()) {
        candidate = std::filesystem::absolute(candidate, error);
    }
    return candidate.string();
}

std::vector<std::string> ProcessImage::Arguments() {
    {
        std::lock_guard<std::mutex> lock(ArgumentsMutex());
        if (!RememberedArguments().empty()) {
            return RememberedArguments();
        }
    }
    return ReadProcCmdline();
}

void ProcessImage::ReExec(Logger& logger) {
    std::vector<std::string> arguments = Arguments();
    const std::string executable = ExecutablePath();
    if (executable.empty() || arguments.empty()) {
        logger.Error("Unable to restart: program image unknown (call ProcessImage::Remember from main)");
        return;
    }

    std::vector<char*> argvPtrs;
    argvPtrs.reserve(arguments.size() + 1);
    for (auto& argument : arguments) {
        argvPtrs.push_back(argument.data());
    }
    argvPtrs.push_back(nullptr);

    logger.Info("Re-executing " + executable);
    std::cout.flush();
    std::cerr.flush();

#ifdef _WIN32
    _execv(executable.c_str(), argvPtrs.data());
#else
    // A bare program name is looked up on PATH, as the shell did for the first run.
    if (executable.find('/') == std::string::npos) {
        execvp(executable.c_str(), argvPtrs.data());
    } else {
        execv(executable.c_str(), argvPtrs.data());
    }
#endif
    logger.Error("Unable to restart " + executable + ": " + std::strerror(errno));
}
