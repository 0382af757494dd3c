#include <csignal>
#include <atomic>
#include <iostream>
#include <signal.h>

#include "ControlFlow.hpp"
#include "ConfigGlobal.hpp"

namespace
{
    std::atomic<bool>* CancelRequested = nullptr;

    void HandleInterrupt(int)
    {
        if (CancelRequested != nullptr)
        {
            CancelRequested->store(true);
        }
    }
}

int main(int argc, char* argv[])
{
    ConfigGlobal::InitializeDefaults();

    ControlFlow Flow;
    CancelRequested = Flow.GetCancelFlag().get();

    struct sigaction Action {};
    Action.sa_handler = HandleInterrupt;
    sigemptyset(&Action.sa_mask);
    if (sigaction(SIGINT, &Action, nullptr) != 0 || sigaction(SIGTERM, &Action, nullptr) != 0)
    {
        std::cerr << "Could not install interrupt handler, Ctrl+C will terminate immediately\n";
    }

    return Flow.Run(argc, argv);
}
