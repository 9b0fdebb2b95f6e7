#pragma once
#include <unistd.h>

#include <boost/stacktrace/stacktrace.hpp>
#include <csignal>
#include <iostream>

#include "Global/Misc/Singleton.hpp"

// Prints a stacktrace for fatal signals raised inside the runtimes.
class CrashHandler : public Singleton<CrashHandler>
{
public:
    void Init(std::string_view program)
    {
        programName = program;
        auto HandleLambda = [](int sig)
        { CrashHandler::Get().HandleSignal(sig); };
        std::signal(SIGSEGV, HandleLambda);
        std::signal(SIGABRT, HandleLambda);
        std::signal(SIGFPE, HandleLambda);
        std::signal(SIGILL, HandleLambda);
    }

private:
    std::string programName;

    void HandleSignal(int sig)
    {
        std::cerr << "\n\n*** " << programName << " crashed (signal " << sig << ") ***\n";
        std::cerr << boost::stacktrace::stacktrace();
        _exit(1); // exit immediately
    }
};
