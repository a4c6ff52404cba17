#pragma once
#include <atomic>
#include <csignal>
#include <cstdlib>
#include "logging.hpp"

namespace signals
{

    // Set once a shutdown signal arrived; polled by the main loop
    inline std::atomic<bool> shutdownRequested{false};

    // Number of the signal that requested the shutdown
    inline std::atomic<int> receivedSignal{0};

    // Async-signal-safe: only atomics and _Exit
    inline void signalHandler(int signal)
    {
        if (shutdownRequested.exchange(true))
        {
            // Second signal: give up on a clean shutdown
            _Exit(signal);
        }

        receivedSignal = signal;
    }

    // Register signal handlers
    inline void setupSignalHandlers()
    {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

    inline bool stopRequested()
    {
        return shutdownRequested;
    }

    inline int lastSignal()
    {
        return receivedSignal;
    }

} // namespace signals
