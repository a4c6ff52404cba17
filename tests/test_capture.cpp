#include <catch2/catch.hpp>
#include "test_helpers.hpp"
#include "capture/cached_screen_capture.hpp"
#include "capture/frame_grabbers.hpp"
#include "detector/classifier/skill_classifier.hpp"
#include "detector/readiness_model.hpp"

namespace
{
    const cv::Rect SLOT(10, 10, 40, 40);

    cv::Mat screenWith(const cv::Mat &icon)
    {
        cv::Mat screen(100, 120, CV_8UC3);
        cv::RNG rng(77);
        rng.fill(screen, cv::RNG::UNIFORM, 0, 256);
        icon.copyTo(screen(cv::Rect(SLOT.x + 4, SLOT.y + 4, icon.cols, icon.rows)));
        return screen;
    }
}

TEST_CASE("CachedScreenCapture - Reused frames keep their grab time", "[Capture]")
{
    cv::Mat screen = screenWith(noiseIcon(1));
    auto grabber = std::make_shared<ImageFrameGrabber>(screen);
    REQUIRE(grabber->initialize());
    CachedScreenCapture capture(grabber, std::chrono::seconds(10));

    cv::Mat first;
    TimePoint first_at;
    TimePoint before = Clock::now();
    REQUIRE(capture.captureWithTime(SLOT, first, first_at));
    REQUIRE(first_at >= before);
    REQUIRE(first.size() == SLOT.size());

    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    cv::Mat second;
    TimePoint second_at;
    REQUIRE(capture.captureWithTime(SLOT, second, second_at));
    REQUIRE(second_at == first_at);
    REQUIRE(capture.grabCount() == 1);
    REQUIRE(capture.cacheHits() == 1);

    SECTION("A new grab gets a new time")
    {
        capture.invalidate();
        REQUIRE(capture.captureWithTime(SLOT, second, second_at));
        REQUIRE(second_at > first_at);
        REQUIRE(capture.grabCount() == 2);
    }

    SECTION("Rects outside the frame fail")
    {
        REQUIRE_FALSE(capture.capture(cv::Rect(500, 500, 10, 10), second));
        REQUIRE(capture.failures() == 1);
    }
}

TEST_CASE("CachedScreenCapture - A frame older than a press cannot clear its cooldown", "[Capture]")
{
    cv::Mat icon = noiseIcon(1);
    cv::Mat screen = screenWith(icon);
    auto grabber = std::make_shared<ImageFrameGrabber>(screen);
    REQUIRE(grabber->initialize());
    auto capture = std::make_shared<CachedScreenCapture>(grabber, std::chrono::seconds(10));
    SkillClassifier classifier(capture);

    Ability slash = makeIconAbility("Slash", "1", icon, 5.0, 5);
    ReadinessModel model;
    model.reset({slash});
    DetectionConfig config;

    DetectionResult ready = classifier.classify(slash, SLOT, config);
    REQUIRE(ready.state == AbilityState::READY);
    REQUIRE(model.updateState("Slash", ready.state, ready.confidence, ready.observed_at).applied);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(model.markUsed("Slash", Clock::now()));

    // The game now shows the cooldown, but the cache still serves the earlier frame
    grabber->setFrame(darkened(screen, 0.5));
    DetectionResult stale = classifier.classify(slash, SLOT, config);
    REQUIRE(stale.state == AbilityState::READY);
    REQUIRE(stale.observed_at == ready.observed_at);
    REQUIRE_FALSE(model.updateState("Slash", stale.state, stale.confidence, stale.observed_at).applied);

    capture->invalidate();
    DetectionResult fresh = classifier.classify(slash, SLOT, config);
    REQUIRE(fresh.state == AbilityState::COOLDOWN);
    REQUIRE(fresh.observed_at > ready.observed_at);
    REQUIRE(model.updateState("Slash", fresh.state, fresh.confidence, fresh.observed_at).changed);

    Ability info;
    REQUIRE(model.get("Slash", info));
    REQUIRE(info.state == AbilityState::COOLDOWN);
}
