#pragma once
#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <opencv2/opencv.hpp>
#include "detector/readiness_model.hpp"
#include "detector/bar_scanner.hpp"
#include "detector/classifier/skill_classifier.hpp"
#include "execution/execution_engine.hpp"
#include "communication/event_channel.hpp"

using namespace std;

enum class SystemState
{
    STOPPED,
    RUNNING,
    ERROR
};

string toString(SystemState state);

struct SystemStats
{
    uint64_t scans = 0;
    uint64_t abilities_detected = 0;
    uint64_t detection_errors = 0;
    uint64_t monitor_iterations = 0;
    uint64_t monitor_errors = 0;
    uint64_t state_changes = 0;
    double last_scan_ms = 0.0;
    double total_scan_ms = 0.0;
    ClassifierStats detector;
    ExecutionStats execution;
};

// Owns the active class profile and wires the scanner, the monitoring loop and
// the execution engine around one readiness model.
class SkillSystem
{
public:
    SkillSystem(shared_ptr<CaptureSource> capture, shared_ptr<InputTransport> transport, bool debug = false);
    SkillSystem(shared_ptr<CaptureSource> capture, shared_ptr<InputTransport> transport,
                shared_ptr<SkillClassifier> classifier);
    ~SkillSystem();

    // Throws ConfigError when the profile does not validate
    void addProfile(const ClassProfile &profile);
    vector<string> profileIds() const;

    // Switch to `profile_id`, dropping all scan state of the previous profile
    bool initialize(const string &profile_id, const vector<cv::Rect> &slot_regions);
    bool initialize(const string &profile_id, const cv::Rect &bar_region, int slots);
    bool initialize(const string &profile_id); // Bar geometry from the profile, if any

    map<int, DetectionResult> autoDetect();
    map<int, DetectionResult> autoDetect(const cv::Rect &bar_region, int slots = 10);

    // Bind a known slot -> ability layout without scanning
    bool applyLayout(const map<int, string> &layout);

    bool getNextFromRotation(string &ability, const string &rotation = "");
    bool setActiveRotation(const string &name);
    string activeRotation() const;

    // A priority below 1 uses the ability's own priority
    bool executeAbility(const string &name, ExecutionMode mode = ExecutionMode::IMMEDIATE, int priority = 0,
                        bool verify = true);
    bool executeRotation(const string &rotation = "");

    bool start();
    void stop();
    void reset();

    bool startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const { return monitoring_; }

    void setResource(const string &resource, double value);

    bool getAbilityInfo(const string &name, Ability &ability) const;
    vector<Ability> abilities() const;
    vector<Rotation> rotations() const;
    SkillBarMapping barMapping() const;
    SystemStats stats() const;
    shared_ptr<EventChannel> events() const { return events_; }
    SystemState state() const;
    string activeProfile() const;
    DetectionConfig detectionConfig() const;

    ExecutionEngine &engine() { return *engine_; }
    SkillClassifier &classifier() { return *classifier_; }

private:
    bool activate(const string &profile_id, SkillBarMapping mapping);
    Rotation *findRotation(const string &name);
    void monitorLoop();
    void monitorOnce();
    bool sleepFor(double seconds);

    shared_ptr<CaptureSource> capture_;
    shared_ptr<EventChannel> events_;
    shared_ptr<SkillClassifier> classifier_;
    ReadinessModel model_;
    BarScanner scanner_;
    unique_ptr<ExecutionEngine> engine_;

    // Profiles, the active profile copy (live rotation cursors) and the bar mapping
    mutable mutex mutex_;
    map<string, ClassProfile> profiles_;
    string active_id_;
    ClassProfile active_;
    SkillBarMapping mapping_;

    mutex scan_mutex_; // One scan at a time
    atomic<bool> running_{false};
    atomic<bool> monitoring_{false};
    atomic<bool> error_{false};
    thread monitor_thread_;
    mutex wake_mutex_;
    condition_variable wake_;

    mutable mutex stats_mutex_;
    SystemStats stats_;
};
