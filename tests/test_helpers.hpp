#pragma once

#include <opencv2/opencv.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <stdexcept>
#include <vector>
#include "capture/capture_source.hpp"
#include "detector/classifier/skill_classifier.hpp"
#include "execution/input_transport.hpp"
#include "detector/skill_types.hpp"

// Serves crops of an in-memory frame
class FakeCapture : public CaptureSource
{
public:
    explicit FakeCapture(const cv::Mat &frame = cv::Mat()) : frame_(frame.clone()) {}

    bool capture(const cv::Rect &rect, cv::Mat &out) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        captures_++;
        if (fail_ || frame_.empty())
            return false;

        cv::Rect bounded = rect & cv::Rect(0, 0, frame_.cols, frame_.rows);
        if (bounded != rect || bounded.area() <= 0)
            return false;

        out = frame_(rect).clone();
        return true;
    }

    void setFrame(const cv::Mat &frame)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = frame.clone();
    }

    void setFailing(bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    int captures() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return captures_;
    }

private:
    mutable std::mutex mutex_;
    cv::Mat frame_;
    bool fail_ = false;
    int captures_ = 0;
};

// Classifier that can be told to fail at each stage
class FaultyClassifier : public SkillClassifier
{
public:
    explicit FaultyClassifier(std::shared_ptr<CaptureSource> capture) : SkillClassifier(capture) {}

    DetectionResult classify(const Ability &ability, const cv::Rect &region, const DetectionConfig &config) override
    {
        if (classify_fails)
            throw std::runtime_error("capture device lost");
        return SkillClassifier::classify(ability, region, config);
    }

    DetectionResult classifyImage(const Ability &ability, const cv::Mat &image, const DetectionConfig &config,
                                  const std::vector<DetectionMethod> &methods) override
    {
        if (image_fails)
            CV_Error(cv::Error::StsBadArg, "unsupported slot image");
        return SkillClassifier::classifyImage(ability, image, config, methods);
    }

    bool ensureTemplate(const Ability &ability, cv::Mat &icon) override
    {
        if (templates_fail)
            throw std::runtime_error("template cache corrupted");
        return SkillClassifier::ensureTemplate(ability, icon);
    }

    std::atomic<bool> classify_fails{false};
    std::atomic<bool> image_fails{false};
    std::atomic<bool> templates_fail{false};
};

// Remembers every key press and when it happened
class RecordingTransport : public InputTransport
{
public:
    struct Press
    {
        std::string key;
        TimePoint at;
    };

    bool sendKey(const std::string &key) override
    {
        if (delay_ > 0.0)
            std::this_thread::sleep_for(secondsToDuration(delay_));

        std::lock_guard<std::mutex> lock(mutex_);
        attempts_++;
        if (failures_left_ > 0)
        {
            failures_left_--;
            return false;
        }
        presses_.push_back({key, Clock::now()});
        return true;
    }

    std::string describe() const override { return "recording"; }

    std::vector<Press> presses() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return presses_;
    }

    std::vector<std::string> keys() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto &press : presses_)
            result.push_back(press.key);
        return result;
    }

    size_t count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return presses_.size();
    }

    int attempts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    // The next `count` presses report failure
    void failNext(int count)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_left_ = count;
    }

    void setDelay(double seconds) { delay_ = seconds; }

private:
    mutable std::mutex mutex_;
    std::vector<Press> presses_;
    int attempts_ = 0;
    int failures_left_ = 0;
    double delay_ = 0.0;
};

// Deterministic random-noise icon; distinct seeds give uncorrelated icons
inline cv::Mat noiseIcon(uint64_t seed, int size = 32)
{
    cv::Mat icon(size, size, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(icon, cv::RNG::UNIFORM, 0, 256);
    return icon;
}

inline cv::Mat darkened(const cv::Mat &image, double factor = 0.5)
{
    cv::Mat result;
    image.convertTo(result, -1, factor, 0);
    return result;
}

inline Ability makeAbility(const std::string &name, const std::string &key, double cooldown = 0.0, int priority = 1)
{
    Ability ability;
    ability.name = name;
    ability.key = key;
    ability.cooldown = cooldown;
    ability.priority = priority;
    return ability;
}

inline Ability makeIconAbility(const std::string &name, const std::string &key, const cv::Mat &icon,
                               double cooldown = 0.0, int priority = 1)
{
    Ability ability = makeAbility(name, key, cooldown, priority);
    ability.icon_template = icon.clone();
    return ability;
}

// Poll `condition` until it holds or `timeout_s` passes
inline bool waitUntil(const std::function<bool()> &condition, double timeout_s = 3.0)
{
    TimePoint deadline = Clock::now() + secondsToDuration(timeout_s);
    while (Clock::now() < deadline)
    {
        if (condition())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// Settings that keep engine timing predictable in tests
inline ExecutionSettings testSettings(double global_cooldown = 0.05)
{
    ExecutionSettings settings;
    settings.global_cooldown = global_cooldown;
    settings.min_global_cooldown = 0.0;
    settings.max_global_cooldown = 1.0;
    settings.adaptive_timing = false;
    settings.visual_verification = false;
    settings.retry_delay = 0.02;
    settings.verification_delay = 0.01;
    return settings;
}
