#include <catch2/catch.hpp>
#include <set>
#include "test_helpers.hpp"

static Rotation makeRotation(const std::vector<std::string> &abilities, bool repeat, bool adaptive = false)
{
    Rotation rotation;
    rotation.name = "Basic";
    rotation.abilities = abilities;
    rotation.repeat = repeat;
    rotation.adaptive = adaptive;
    return rotation;
}

static bool alwaysReady(const std::string &)
{
    return true;
}

TEST_CASE("Rotation - Repeating rotations cycle", "[Rotation]")
{
    Rotation rotation = makeRotation({"Slash", "Charge", "Rend", "Execute"}, true);
    const size_t n = rotation.abilities.size();

    std::string start = rotation.next(alwaysReady);
    REQUIRE(start == "Slash");

    for (int cycle = 0; cycle < 3; cycle++)
    {
        for (size_t i = 1; i < n; i++)
            REQUIRE(rotation.next(alwaysReady) != start);
        REQUIRE(rotation.next(alwaysReady) == start);
    }

    REQUIRE(rotation.enabled);
    REQUIRE(rotation.dispatched == static_cast<int>(1 + 3 * n));
}

TEST_CASE("Rotation - Non-repeating rotations freeze on the last entry", "[Rotation]")
{
    Rotation rotation = makeRotation({"Slash", "Charge", "Rend"}, false);

    REQUIRE(rotation.next(alwaysReady) == "Slash");
    REQUIRE(rotation.enabled);
    REQUIRE(rotation.next(alwaysReady) == "Charge");
    REQUIRE(rotation.enabled);
    REQUIRE(rotation.next(alwaysReady) == "Rend");
    REQUIRE_FALSE(rotation.enabled);

    size_t frozen_index = rotation.current_index;
    int dispatched = rotation.dispatched;
    for (int i = 0; i < 5; i++)
    {
        REQUIRE(rotation.next(alwaysReady) == "Rend");
        REQUIRE(rotation.current_index == frozen_index);
    }
    REQUIRE(rotation.dispatched == dispatched);

    SECTION("Reset starts it over")
    {
        rotation.reset();
        REQUIRE(rotation.enabled);
        REQUIRE(rotation.next(alwaysReady) == "Slash");
    }
}

TEST_CASE("Rotation - Adaptive rotations skip abilities that are not ready", "[Rotation]")
{
    Rotation rotation = makeRotation({"Slash", "Charge", "Rend"}, true, true);
    std::set<std::string> ready = {"Rend"};
    int checks = 0;
    auto isReady = [&](const std::string &name)
    {
        checks++;
        return ready.count(name) > 0;
    };

    SECTION("Finds the next ready entry")
    {
        REQUIRE(rotation.next(isReady) == "Rend");
        REQUIRE(rotation.current_index == 0);
    }

    SECTION("Gives up after one full pass")
    {
        ready.clear();
        REQUIRE(rotation.next(isReady) == "");
        REQUIRE(checks == 3);
        REQUIRE(rotation.current_index == 0);
    }

    SECTION("Empty rotations return nothing")
    {
        Rotation empty = makeRotation({}, true, true);
        REQUIRE(empty.next(isReady) == "");
    }
}
