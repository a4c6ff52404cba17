#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "communication/status_service.hpp"

namespace
{
    ClassProfile archerProfile()
    {
        ClassProfile profile;
        profile.class_name = "archer";
        profile.abilities = {makeAbility("Aimed Shot", "1", 0.0, 4), makeAbility("Volley", "2", 0.0, 2)};

        Rotation basic;
        basic.name = "Basic";
        basic.abilities = {"Aimed Shot", "Volley"};
        profile.rotations = {basic};

        profile.bar_region = cv::Rect(0, 0, 200, 20);
        profile.slot_count = 10;
        profile.execution = testSettings(0.02);
        return profile;
    }

    // Retries until the listener is up
    httplib::Result getWhenReady(httplib::Client &client, const std::string &path)
    {
        httplib::Result result = client.Get(path.c_str());
        for (int attempt = 0; attempt < 100 && !result; attempt++)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            result = client.Get(path.c_str());
        }
        return result;
    }
}

TEST_CASE("StatusService - Stopping right after starting returns", "[StatusService]")
{
    SkillSystem system(std::make_shared<FakeCapture>(), std::make_shared<RecordingTransport>());
    StatusService service(system, 13591);

    for (int i = 0; i < 5; i++)
    {
        service.start();
        REQUIRE(service.isRunning());
        service.stop();
        REQUIRE_FALSE(service.isRunning());
    }
}

TEST_CASE("StatusService - Serves the running system", "[StatusService]")
{
    auto transport = std::make_shared<RecordingTransport>();
    SkillSystem system(std::make_shared<FakeCapture>(), transport);
    system.addProfile(archerProfile());
    REQUIRE(system.initialize("archer"));
    REQUIRE(system.start());

    StatusService service(system, 13592);
    service.start();

    httplib::Client client("127.0.0.1", 13592);

    SECTION("Health")
    {
        auto res = getWhenReady(client, "/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");

        auto body = nlohmann::json::parse(res->body);
        REQUIRE(body["status"] == "ok");
        REQUIRE(body["state"] == "running");
    }

    SECTION("Rotations and executions")
    {
        REQUIRE(getWhenReady(client, "/health"));

        auto missing = client.Post("/rotation/Cleave", "", "application/json");
        REQUIRE(missing);
        REQUIRE(missing->status == 404);

        auto executed = client.Post("/execute/Volley", R"({"verify": false})", "application/json");
        REQUIRE(executed);
        REQUIRE(executed->status == 202);
        REQUIRE(waitUntil([&]
                          { return transport->count() == 1; }));

        auto bad = client.Post("/execute/Volley", "{ mode: ", "application/json");
        REQUIRE(bad);
        REQUIRE(bad->status == 400);

        // The completion event reaches the history ring
        REQUIRE(waitUntil([&]
                          {
            auto events = client.Get("/events?since=0");
            if (!events)
                return false;
            for (const auto &event : nlohmann::json::parse(events->body)["events"])
            {
                if (event["type"] == "execution_completed")
                    return true;
            }
            return false; }));

        auto invalid = client.Get("/events?since=soon");
        REQUIRE(invalid);
        REQUIRE(invalid->status == 400);
    }

    service.stop();
    system.stop();
}
