#include <catch2/catch.hpp>
#include <csignal>
#include "utils/signals.hpp"

TEST_CASE("Signals - The handler only records the request", "[Signals]")
{
    REQUIRE_FALSE(signals::stopRequested());
    REQUIRE(signals::lastSignal() == 0);

    // Holding the log mutex: a handler that logged would deadlock here
    {
        std::lock_guard<std::mutex> lock(logging::logMutex);
        signals::signalHandler(SIGTERM);
    }

    REQUIRE(signals::stopRequested());
    REQUIRE(signals::lastSignal() == SIGTERM);
}
