#pragma once

#include <opencv2/opencv.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

using Clock = chrono::steady_clock;
using TimePoint = Clock::time_point;

// Seconds elapsed from `from` to `to` (negative if `to` is earlier)
inline double secondsBetween(TimePoint from, TimePoint to)
{
    return chrono::duration<double>(to - from).count();
}

inline Clock::duration secondsToDuration(double seconds)
{
    return chrono::duration_cast<Clock::duration>(chrono::duration<double>(seconds));
}

// Raised when a profile cannot be accepted; the message names the offending field
class ConfigError : public runtime_error
{
public:
    explicit ConfigError(const string &message) : runtime_error(message) {}
};

enum class AbilityType
{
    INSTANT, // Icon on the bar, cooldown shown visually
    TIMED,   // Buff with a duration, optionally prevented from recasting
    MANUAL,  // No icon, driven purely by its timer
    COMBO    // Sends a sequence of keys
};

enum class AbilityState
{
    READY,
    COOLDOWN,
    CASTING,
    UNAVAILABLE,
    NOT_LEARNED,
    UNKNOWN
};

enum class DetectionMethod
{
    TEMPLATE_MATCH,
    COOLDOWN_OVERLAY,
    COLOR_ANALYSIS
};

enum class ExecutionMode
{
    IMMEDIATE, // Run on the caller if the global cooldown allows, else queue
    QUEUED,    // Always go through the worker
    PRIORITY   // Queued at the top tier
};

constexpr int PRIORITY_MIN = 1;
constexpr int PRIORITY_MAX = 10;

string toString(AbilityType type);
string toString(AbilityState state);
string toString(DetectionMethod method);
string toString(ExecutionMode mode);

// Throw ConfigError on unknown names
AbilityType abilityTypeFromString(const string &name);
AbilityState abilityStateFromString(const string &name);
DetectionMethod detectionMethodFromString(const string &name);
ExecutionMode executionModeFromString(const string &name);

// "trigger only when health below 40"
struct Precondition
{
    enum class Comparison
    {
        BELOW,
        ABOVE
    };

    string resource;
    Comparison comparison = Comparison::BELOW;
    double threshold = 0.0;

    // A resource that has never been reported does not satisfy the clause
    bool isSatisfied(const map<string, double> &resources) const;
};

struct SlotPosition
{
    int slot_index = -1;
    cv::Rect region;

    bool isValid() const { return slot_index >= 0 && region.area() > 0; }
};

struct DetectionConfig
{
    float template_threshold = 0.85f;           // Identity threshold for a template hit
    float cooldown_threshold = 0.7f;            // Caps overlay confidence at this + 0.2
    double scan_interval = 0.1;                 // Monitoring poll interval (seconds)
    double rescan_interval = 30.0;              // Bar re-scan interval (seconds)
    bool auto_rescan = false;
    bool use_multi_scale = true;
    float scale_min = 0.8f;
    float scale_max = 1.2f;
    vector<DetectionMethod> methods = {DetectionMethod::TEMPLATE_MATCH, DetectionMethod::COOLDOWN_OVERLAY};

    // Empirical values for the default visual theme
    float cooldown_brightness_ratio = 0.7f;  // Matched / template brightness below this -> COOLDOWN
    float ready_brightness_ratio = 0.9f;     // Above this -> READY
    int dark_pixel_level = 100;              // Grey levels [0, dark_pixel_level) count as dark
    float dark_concentration = 0.6f;         // Fraction of dark pixels that means COOLDOWN
    int saturation_limit = 100;              // HSV S and V both below their limits -> COOLDOWN
    int brightness_limit = 100;
    float monitor_min_confidence = 0.5f;     // Monitoring ignores weaker observations
};

struct ExecutionSettings
{
    double global_cooldown = 0.15;
    double min_global_cooldown = 0.05;
    double max_global_cooldown = 0.30;
    bool auto_retry = true;
    int max_retries = 3;
    double request_timeout = 5.0;
    double retry_delay = 0.1;
    double verification_delay = 0.05;
    bool visual_verification = true;
    bool adaptive_timing = true;
    double slow_execution = 0.2;
    double fast_execution = 0.05;
    double combo_step_delay = 0.05;
};

struct Ability
{
    // Identity
    string name;
    string key;
    AbilityType type = AbilityType::INSTANT;
    string description;

    // Visual identity
    string icon_path;
    cv::Mat icon_template; // BGR
    SlotPosition position;

    // Timing (seconds)
    double cooldown = 0.0;
    double cast_time = 0.0;
    TimePoint last_used{};

    // Detection identity
    AbilityState state = AbilityState::UNKNOWN;
    float confidence = 0.0f;
    TimePoint last_detection{};

    // Policy
    bool enabled = true;
    int priority = 1;
    int resource_cost = 0;
    vector<Precondition> conditions;

    // Combo and buff handling
    vector<string> combo_sequence;
    double buff_duration = 0.0;
    bool recast_prevention = false;

    bool hasIcon() const { return !icon_path.empty() || !icon_template.empty(); }
    bool hasPosition() const { return position.isValid(); }
    bool wasUsed() const { return last_used != TimePoint{}; }

    // max(0, cooldown - (now - last_used)); 0 if never used
    double remainingCooldown(TimePoint now) const;

    bool isReady(TimePoint now, const map<string, double> &resources = {}) const;
};

struct SkillBarMapping
{
    cv::Rect bar_region;
    vector<cv::Rect> slot_regions;
    map<int, string> detected; // slot index -> ability name
    TimePoint last_scan{};
    double rescan_interval = 1.0;

    bool needsRescan(TimePoint now) const;
    void updateScanTime(TimePoint now) { last_scan = now; }
};

// Split a bar into `slots` equal-width regions
SkillBarMapping createBarMapping(const cv::Rect &bar_region, int slots);

struct Rotation
{
    string name;
    vector<string> abilities;
    size_t current_index = 0;
    bool repeat = true;
    bool enabled = true;
    bool adaptive = true;
    int dispatched = 0;
    TimePoint last_dispatch{};

    // Next ability name, or "" when none qualifies.
    // Adaptive rotations skip not-ready entries, at most once around the list.
    // A finished non-repeating rotation keeps returning its last entry without advancing.
    string next(const function<bool(const string &)> &is_ready, TimePoint now = Clock::now());

    void reset();

private:
    void advance();
};

struct DetectionResult
{
    string ability;      // Empty when nothing was detected
    int slot_index = -1;
    cv::Rect region;
    AbilityState state = AbilityState::UNKNOWN;
    float confidence = 0.0f;
    float match_confidence = 0.0f; // Template identity score
    DetectionMethod method = DetectionMethod::TEMPLATE_MATCH;
    double detection_time_ms = 0.0;
    TimePoint observed_at{}; // When the classified pixels were captured

    bool isValid() const { return confidence > 0.5f && !ability.empty(); }
};

struct ExecutionRequest
{
    string ability;
    ExecutionMode mode = ExecutionMode::QUEUED;
    int priority = PRIORITY_MIN;
    bool verify = true;
    int retry_count = 0;
    int max_retries = 3;
    TimePoint created{};
    double timeout = 5.0;
    uint64_t sequence = 0;  // Arrival order, assigned by the queue
    TimePoint not_before{}; // Retry delay

    bool isExpired(TimePoint now) const { return secondsBetween(created, now) > timeout; }
};

struct ExecutionResult
{
    string ability;
    bool success = false;
    double execution_time = 0.0; // Seconds, request start to result
    string error_message;
    bool verification_passed = false;
    double input_delay = 0.0;
    double verification_delay = 0.0;
    int retry_count = 0;
};

struct ClassProfile
{
    string class_name;
    string display_name;
    string resource_path;
    vector<Ability> abilities;
    vector<Rotation> rotations;
    string active_rotation;
    DetectionConfig detection;
    ExecutionSettings execution;

    // Optional bar geometry from the profile file
    cv::Rect bar_region;
    int slot_count = 10;

    const Ability *findAbility(const string &name) const;
    const Ability *findAbilityByKey(const string &key) const;
    const Rotation *findRotation(const string &name) const;
};

// Throws ConfigError describing the first problem found
void validateProfile(const ClassProfile &profile);
