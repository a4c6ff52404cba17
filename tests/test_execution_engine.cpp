#include <catch2/catch.hpp>
#include <atomic>
#include <random>
#include "test_helpers.hpp"
#include "execution/execution_engine.hpp"

namespace
{
    // Every consecutive pair of presses is at least `gap` seconds apart
    void requireSpacing(const std::vector<RecordingTransport::Press> &presses, double gap)
    {
        for (size_t i = 1; i < presses.size(); i++)
        {
            double spacing = secondsBetween(presses[i - 1].at, presses[i].at);
            INFO("presses " << i - 1 << " and " << i << " were " << spacing << " s apart");
            REQUIRE(spacing >= gap - 1e-6);
        }
    }
}

TEST_CASE("ExecutionEngine - Warrior priority scenario", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("A", "1", 1.0, 1), makeAbility("B", "2", 3.0, 9), makeAbility("Filler", "f", 0.0, 5)});

    auto transport = std::make_shared<RecordingTransport>();
    const double gcd = 0.2;
    ExecutionEngine engine(model, transport, nullptr, testSettings(gcd));
    REQUIRE(engine.start());

    // The filler closes the global cooldown, so both requests below meet a closed gate
    REQUIRE(engine.execute("Filler", ExecutionMode::IMMEDIATE));
    REQUIRE(waitUntil([&]
                      { return transport->count() == 1; }));

    std::atomic<bool> go{false};
    std::atomic<int> accepted{0};
    auto submit = [&](const std::string &name)
    {
        while (!go)
            std::this_thread::yield();
        if (engine.execute(name, ExecutionMode::IMMEDIATE))
            accepted++;
    };
    std::thread first(submit, "A");
    std::thread second(submit, "B");
    go = true;
    first.join();
    second.join();

    REQUIRE(accepted == 2);
    REQUIRE(waitUntil([&]
                      { return transport->count() == 3; }));

    REQUIRE(transport->keys() == std::vector<std::string>{"f", "2", "1"});
    requireSpacing(transport->presses(), gcd);

    engine.stop();
}

TEST_CASE("ExecutionEngine - An open gate runs the first arrival", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("A", "1", 1.0, 1), makeAbility("B", "2", 3.0, 9)});

    auto transport = std::make_shared<RecordingTransport>();
    const double gcd = 0.2;
    ExecutionEngine engine(model, transport, nullptr, testSettings(gcd));
    REQUIRE(engine.start());

    // Nothing pressed yet: the low priority request goes first because it came first
    REQUIRE(engine.execute("A", ExecutionMode::IMMEDIATE));
    REQUIRE(waitUntil([&]
                      { return transport->count() == 1; }));

    REQUIRE(engine.execute("B", ExecutionMode::IMMEDIATE));
    REQUIRE(waitUntil([&]
                      { return transport->count() == 2; }));

    REQUIRE(transport->keys() == std::vector<std::string>{"1", "2"});
    requireSpacing(transport->presses(), gcd);

    engine.stop();
}

TEST_CASE("ExecutionEngine - Global cooldown holds under concurrent submitters", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1", 0.0, 3), makeAbility("Charge", "2", 0.0, 5), makeAbility("Rend", "3", 0.0, 7),
                 makeAbility("Shout", "4", 0.0, 1)});

    auto transport = std::make_shared<RecordingTransport>();
    const double gcd = 0.05;
    ExecutionEngine engine(model, transport, nullptr, testSettings(gcd));
    REQUIRE(engine.start());

    const std::vector<std::string> names = {"Slash", "Charge", "Rend", "Shout"};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; t++)
    {
        submitters.emplace_back([&, t]
                                {
            for (int i = 0; i < 3; i++)
            {
                ExecutionMode mode = (t + i) % 2 == 0 ? ExecutionMode::IMMEDIATE : ExecutionMode::QUEUED;
                engine.execute(names[(t + i) % names.size()], mode, 0, false);
            } });
    }
    for (auto &submitter : submitters)
        submitter.join();

    REQUIRE(waitUntil([&]
                      { return transport->count() == 12; }));
    requireSpacing(transport->presses(), gcd);

    ExecutionStats stats = engine.stats();
    REQUIRE(stats.total == 12);
    REQUIRE(stats.successful == 12);
    REQUIRE(stats.success_rate == Approx(1.0));

    engine.stop();
}

TEST_CASE("ExecutionEngine - Expired requests never run", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1")});

    auto transport = std::make_shared<RecordingTransport>();
    const double gcd = 0.1;
    ExecutionEngine engine(model, transport, nullptr, testSettings(gcd));
    REQUIRE(engine.start());

    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> timeouts(0.05, 0.4);

    const int per_round = 6;
    uint64_t handled = 0;
    for (int round = 0; round < 4; round++)
    {
        ExecutionSettings settings = testSettings(gcd);
        settings.request_timeout = timeouts(rng);
        engine.setSettings(settings);

        // Let the previous round's global cooldown pass
        std::this_thread::sleep_for(secondsToDuration(gcd));

        size_t before = transport->count();
        TimePoint submitted = Clock::now();
        for (int i = 0; i < per_round; i++)
            REQUIRE(engine.execute("Slash", ExecutionMode::QUEUED, 0, false));

        handled += per_round;
        REQUIRE(waitUntil([&]
                          {
            ExecutionStats stats = engine.stats();
            return stats.total + stats.dropped == handled; }));

        auto presses = transport->presses();
        REQUIRE(presses.size() > before);
        for (size_t i = before; i < presses.size(); i++)
        {
            INFO("timeout " << settings.request_timeout);
            REQUIRE(secondsBetween(submitted, presses[i].at) <= settings.request_timeout + 0.02);
        }
    }

    ExecutionStats stats = engine.stats();
    REQUIRE(stats.dropped > 0);
    REQUIRE(stats.total + stats.dropped == handled);

    engine.stop();
}

TEST_CASE("ExecutionEngine - Demoted immediate requests run exactly once", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1"), makeAbility("Charge", "2")});

    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, nullptr, testSettings(0.2));
    REQUIRE(engine.start());

    REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE));
    REQUIRE(transport->count() == 1);

    // Gate closed: this one goes through the queue
    REQUIRE(engine.execute("Charge", ExecutionMode::IMMEDIATE));
    REQUIRE(transport->count() == 1);

    REQUIRE(waitUntil([&]
                      { return transport->count() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(400));

    REQUIRE(transport->keys() == std::vector<std::string>{"1", "2"});
    REQUIRE(engine.stats().total == 2);
    REQUIRE(engine.queueSize() == 0);

    engine.stop();
}

TEST_CASE("ExecutionEngine - Queue ordering", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Filler", "f"), makeAbility("Low", "1"), makeAbility("High", "2"), makeAbility("Urgent", "3")});

    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, nullptr, testSettings(0.15));
    REQUIRE(engine.start());

    REQUIRE(engine.execute("Filler", ExecutionMode::IMMEDIATE));

    SECTION("Priority mode goes first, then by priority")
    {
        REQUIRE(engine.execute("Low", ExecutionMode::QUEUED, 1));
        REQUIRE(engine.execute("High", ExecutionMode::QUEUED, 5));
        REQUIRE(engine.execute("Urgent", ExecutionMode::PRIORITY));

        REQUIRE(waitUntil([&]
                          { return transport->count() == 4; }));
        REQUIRE(transport->keys() == std::vector<std::string>{"f", "3", "2", "1"});
    }

    SECTION("Equal priorities leave in arrival order")
    {
        REQUIRE(engine.execute("High", ExecutionMode::QUEUED, 4));
        REQUIRE(engine.execute("Low", ExecutionMode::QUEUED, 4));
        REQUIRE(engine.execute("Urgent", ExecutionMode::QUEUED, 4));

        REQUIRE(waitUntil([&]
                          { return transport->count() == 4; }));
        REQUIRE(transport->keys() == std::vector<std::string>{"f", "2", "1", "3"});
    }

    engine.stop();
}

TEST_CASE("ExecutionEngine - Readiness gate and retries", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slam", "1", 10.0), makeAbility("Slash", "2")});
    model.markUsed("Slam", Clock::now());

    auto transport = std::make_shared<RecordingTransport>();

    SECTION("Not ready requests retry and then fail")
    {
        ExecutionSettings settings = testSettings(0.02);
        settings.max_retries = 2;
        ExecutionEngine engine(model, transport, nullptr, settings);
        REQUIRE(engine.start());

        REQUIRE(engine.execute("Slam", ExecutionMode::IMMEDIATE));
        REQUIRE(waitUntil([&]
                          { return engine.stats().failed == 1; }));

        ExecutionStats stats = engine.stats();
        REQUIRE(stats.retries == 2);
        REQUIRE(stats.total == 1);
        REQUIRE(transport->count() == 0);
        REQUIRE(engine.history(1).front().error_message == "Ability not ready");
        engine.stop();
    }

    SECTION("Without retries an immediate request is rejected")
    {
        ExecutionSettings settings = testSettings(0.02);
        settings.auto_retry = false;
        ExecutionEngine engine(model, transport, nullptr, settings);
        REQUIRE(engine.start());

        REQUIRE_FALSE(engine.execute("Slam", ExecutionMode::IMMEDIATE));
        REQUIRE(engine.stats().failed == 1);
        engine.stop();
    }

    SECTION("Transport failures are recorded and retried")
    {
        ExecutionEngine engine(model, transport, nullptr, testSettings(0.02));
        REQUIRE(engine.start());

        transport->failNext(1);
        REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE));
        REQUIRE(waitUntil([&]
                          { return engine.stats().successful == 1; }));

        ExecutionStats stats = engine.stats();
        REQUIRE(stats.failed == 1);
        REQUIRE(stats.retries == 1);
        REQUIRE(stats.total == 2);
        REQUIRE(transport->attempts() == 2);
        REQUIRE(transport->count() == 1);
        REQUIRE(engine.history().back().retry_count == 1);
        engine.stop();
    }

    SECTION("Unknown abilities are rejected")
    {
        ExecutionEngine engine(model, transport, nullptr, testSettings(0.02));
        REQUIRE(engine.start());
        REQUIRE_FALSE(engine.execute("Whirlwind"));
        engine.stop();
    }
}

TEST_CASE("ExecutionEngine - Visual verification", "[ExecutionEngine]")
{
    cv::Mat icon = noiseIcon(21);
    auto capture = std::make_shared<FakeCapture>(icon);
    auto classifier = std::make_shared<SkillClassifier>(capture);

    Ability slash = makeIconAbility("Slash", "1", icon, 5.0);
    slash.position.slot_index = 0;
    slash.position.region = cv::Rect(0, 0, icon.cols, icon.rows);

    ReadinessModel model;
    model.reset({slash});
    model.updateState("Slash", AbilityState::READY, 1.0f, Clock::now());

    ExecutionSettings settings = testSettings(0.02);
    settings.visual_verification = true;
    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, classifier, settings);
    REQUIRE(engine.start());

    SECTION("A mismatch keeps the execution")
    {
        // The capture still shows a bright icon after the press
        REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE));

        ExecutionResult result = engine.history(1).front();
        REQUIRE(result.success);
        REQUIRE_FALSE(result.verification_passed);
        REQUIRE(result.verification_delay > 0.0);

        Ability after;
        REQUIRE(model.get("Slash", after));
        REQUIRE(after.wasUsed());
        REQUIRE(after.remainingCooldown(Clock::now()) > 4.0);
        REQUIRE(engine.stats().verified == 0);
        REQUIRE(transport->count() == 1);
    }

    SECTION("A cooldown overlay confirms the press")
    {
        capture->setFrame(darkened(icon, 0.5));
        REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE));

        REQUIRE(engine.history(1).front().verification_passed);
        REQUIRE(engine.stats().verified == 1);
        REQUIRE(engine.stats().verification_rate == Approx(1.0));

        Ability after;
        REQUIRE(model.get("Slash", after));
        REQUIRE(after.state == AbilityState::COOLDOWN);
    }

    SECTION("Verification can be skipped per request")
    {
        REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE, 0, false));
        REQUIRE(engine.history(1).front().verification_delay == 0.0);
    }

    engine.stop();
}

TEST_CASE("ExecutionEngine - Combos send every step", "[ExecutionEngine]")
{
    Ability combo = makeAbility("Opener", "q");
    combo.type = AbilityType::COMBO;
    combo.combo_sequence = {"Slash", "Charge"};

    ReadinessModel model;
    model.reset({combo, makeAbility("Slash", "1"), makeAbility("Charge", "2")});

    ExecutionSettings settings = testSettings(0.02);
    settings.combo_step_delay = 0.01;
    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, nullptr, settings);
    REQUIRE(engine.start());

    REQUIRE(engine.execute("Opener", ExecutionMode::IMMEDIATE));
    REQUIRE(transport->keys() == std::vector<std::string>{"q", "1", "2"});

    engine.stop();
}

TEST_CASE("ExecutionEngine - Stop discards queued work", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1"), makeAbility("Charge", "2")});

    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, nullptr, testSettings(1.0));
    REQUIRE(engine.start());

    REQUIRE(engine.execute("Slash", ExecutionMode::IMMEDIATE));
    for (int i = 0; i < 3; i++)
        REQUIRE(engine.execute("Charge", ExecutionMode::QUEUED));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    engine.stop();

    REQUIRE_FALSE(engine.isRunning());
    REQUIRE(engine.queueSize() == 0);
    REQUIRE(transport->count() == 1);
    REQUIRE_FALSE(engine.execute("Charge"));
}

TEST_CASE("ExecutionEngine - Adaptive tuning stays in bounds", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1")});
    auto transport = std::make_shared<RecordingTransport>();

    auto runBatch = [&](ExecutionEngine &engine, uint64_t expected_total)
    {
        for (int i = 0; i < 10; i++)
            REQUIRE(engine.execute("Slash", ExecutionMode::QUEUED, 0, false));
        REQUIRE(waitUntil([&]
                          { return engine.stats().total == expected_total; }));
    };

    SECTION("Fast executions lower the global cooldown to its floor")
    {
        ExecutionSettings settings = testSettings(0.02);
        settings.min_global_cooldown = 0.015;
        settings.fast_execution = 0.05;
        ExecutionEngine engine(model, transport, nullptr, settings);
        REQUIRE(engine.start());

        REQUIRE_FALSE(engine.optimizePerformance()); // Not enough history

        runBatch(engine, 10);
        REQUIRE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() == Approx(0.018));

        // Same history, same answer
        REQUIRE_FALSE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() == Approx(0.018));

        runBatch(engine, 20);
        REQUIRE(engine.optimizePerformance());
        runBatch(engine, 30);
        REQUIRE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() == Approx(0.015));

        runBatch(engine, 40);
        REQUIRE_FALSE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() >= settings.min_global_cooldown);
        engine.stop();
    }

    SECTION("Slow executions raise the global cooldown to its ceiling")
    {
        ExecutionSettings settings = testSettings(0.02);
        settings.max_global_cooldown = 0.021;
        settings.slow_execution = 0.01;
        transport->setDelay(0.03);
        ExecutionEngine engine(model, transport, nullptr, settings);
        REQUIRE(engine.start());

        runBatch(engine, 10);
        REQUIRE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() == Approx(0.021));

        runBatch(engine, 20);
        REQUIRE_FALSE(engine.optimizePerformance());
        REQUIRE(engine.globalCooldown() <= settings.max_global_cooldown);
        engine.stop();
    }
}

TEST_CASE("ExecutionEngine - Completion and idle events", "[ExecutionEngine]")
{
    ReadinessModel model;
    model.reset({makeAbility("Slash", "1")});

    auto channel = std::make_shared<EventChannel>();
    auto subscription = channel->subscribe();

    auto transport = std::make_shared<RecordingTransport>();
    ExecutionEngine engine(model, transport, nullptr, testSettings(0.02));
    engine.setEventChannel(channel);
    REQUIRE(engine.start());

    REQUIRE(engine.execute("Slash", ExecutionMode::QUEUED));

    bool completed = false;
    bool idle = false;
    REQUIRE(waitUntil([&]
                      {
        SystemEvent event;
        while (subscription->pop(event, 0))
        {
            if (event.type == EventType::EXECUTION_COMPLETED)
            {
                completed = event.execution.ability == "Slash" && event.execution.success;
            }
            if (event.type == EventType::QUEUE_IDLE)
                idle = completed;
        }
        return completed && idle; }));

    engine.stop();
    channel->unsubscribe(subscription);
}
