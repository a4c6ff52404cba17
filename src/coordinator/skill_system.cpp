#include "skill_system.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>

using namespace std;
using namespace cv;

string toString(SystemState state)
{
    switch (state)
    {
    case SystemState::STOPPED:
        return "stopped";
    case SystemState::RUNNING:
        return "running";
    case SystemState::ERROR:
        return "error";
    }
    return "stopped";
}

SkillSystem::SkillSystem(shared_ptr<CaptureSource> capture, shared_ptr<InputTransport> transport, bool debug)
    : capture_(capture),
      events_(make_shared<EventChannel>()),
      classifier_(make_shared<SkillClassifier>(capture, debug)),
      scanner_(classifier_, debug)
{
    engine_ = make_unique<ExecutionEngine>(model_, transport, classifier_);
    engine_->setEventChannel(events_);
}

SkillSystem::SkillSystem(shared_ptr<CaptureSource> capture, shared_ptr<InputTransport> transport,
                         shared_ptr<SkillClassifier> classifier)
    : capture_(move(capture)),
      events_(make_shared<EventChannel>()),
      classifier_(move(classifier)),
      scanner_(classifier_)
{
    engine_ = make_unique<ExecutionEngine>(model_, transport, classifier_);
    engine_->setEventChannel(events_);
}

SkillSystem::~SkillSystem()
{
    stop();
}

void SkillSystem::addProfile(const ClassProfile &profile)
{
    validateProfile(profile);

    lock_guard<mutex> lock(mutex_);
    bool replaced = profiles_.count(profile.class_name) > 0;
    profiles_[profile.class_name] = profile;
    log_info(string(replaced ? "Replaced" : "Added") + " profile " + log_string_src(profile.class_name) + " with " +
             log_string(profile.abilities.size()) + " abilities and " + log_string(profile.rotations.size()) + " rotations");
}

vector<string> SkillSystem::profileIds() const
{
    lock_guard<mutex> lock(mutex_);
    vector<string> ids;
    for (const auto &entry : profiles_)
        ids.push_back(entry.first);
    return ids;
}

bool SkillSystem::initialize(const string &profile_id, const vector<Rect> &slot_regions)
{
    SkillBarMapping mapping;
    mapping.slot_regions = slot_regions;
    for (const auto &region : slot_regions)
        mapping.bar_region = mapping.bar_region.area() > 0 ? (mapping.bar_region | region) : region;

    return activate(profile_id, mapping);
}

bool SkillSystem::initialize(const string &profile_id, const Rect &bar_region, int slots)
{
    return activate(profile_id, createBarMapping(bar_region, slots));
}

bool SkillSystem::initialize(const string &profile_id)
{
    SkillBarMapping mapping;
    {
        lock_guard<mutex> lock(mutex_);
        auto it = profiles_.find(profile_id);
        if (it != profiles_.end() && it->second.bar_region.area() > 0)
            mapping = createBarMapping(it->second.bar_region, it->second.slot_count);
    }
    return activate(profile_id, mapping);
}

bool SkillSystem::activate(const string &profile_id, SkillBarMapping mapping)
{
    ClassProfile profile;
    {
        lock_guard<mutex> lock(mutex_);
        auto it = profiles_.find(profile_id);
        if (it == profiles_.end())
        {
            log_error("Unknown profile " + log_string_src(profile_id));
            return false;
        }
        profile = it->second;
    }

    // Nothing queued for the old profile may run against the new one
    bool was_monitoring = monitoring_;
    stopMonitoring();
    engine_->clearQueue();

    for (auto &rotation : profile.rotations)
        rotation.reset();

    mapping.rescan_interval = profile.detection.rescan_interval;
    model_.reset(profile.abilities);

    // Best effort: abilities without a loadable icon stay timer-driven or unknown
    int with_icon = 0;
    int loaded = 0;
    for (const auto &ability : profile.abilities)
    {
        if (!ability.hasIcon())
            continue;

        with_icon++;
        Mat icon;
        if (classifier_->ensureTemplate(ability, icon) && model_.setIconTemplate(ability.name, icon))
            loaded++;
    }
    log_info("Loaded " + log_string(loaded) + "/" + to_string(with_icon) + " icon templates for " +
             log_string_src(profile_id));

    {
        lock_guard<mutex> lock(mutex_);
        active_id_ = profile_id;
        active_ = profile;
        mapping_ = mapping;
    }

    engine_->setSettings(profile.execution);
    engine_->setDetectionConfig(profile.detection);

    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_ = SystemStats();
    }

    log_info("Profile " + log_string_src(profile_id) + " active with " + log_string(mapping.slot_regions.size()) + " slots");
    events_->publish(SystemEvent::profileChanged(profile_id));

    if (was_monitoring)
        startMonitoring();
    return true;
}

map<int, DetectionResult> SkillSystem::autoDetect(const Rect &bar_region, int slots)
{
    SkillBarMapping mapping = createBarMapping(bar_region, slots);
    {
        lock_guard<mutex> lock(mutex_);
        if (active_id_.empty())
        {
            log_warning("No active profile, cannot scan");
            return {};
        }
        mapping.rescan_interval = active_.detection.rescan_interval;
        mapping_ = mapping;
    }

    // Old positions belong to the old geometry
    for (const auto &name : model_.names())
        model_.clearPosition(name);

    return autoDetect();
}

map<int, DetectionResult> SkillSystem::autoDetect()
{
    lock_guard<mutex> scan_lock(scan_mutex_);

    string profile_id;
    SkillBarMapping mapping;
    DetectionConfig config;
    {
        lock_guard<mutex> lock(mutex_);
        profile_id = active_id_;
        mapping = mapping_;
        config = active_.detection;
    }

    if (profile_id.empty())
    {
        log_warning("No active profile, cannot scan");
        return {};
    }
    if (mapping.slot_regions.empty())
    {
        log_warning("No bar geometry for " + log_string_src(profile_id) + ", cannot scan");
        return {};
    }

    map<int, string> before = mapping.detected;
    map<int, DetectionResult> results;
    auto start = chrono::steady_clock::now();

    try
    {
        results = scanner_.scan(mapping, model_, config);
    }
    catch (const cv::Exception &e)
    {
        {
            lock_guard<mutex> lock(stats_mutex_);
            stats_.detection_errors++;
        }
        log_error("Bar scan failed: " + string(e.what()));
        events_->publish(SystemEvent::error("Bar scan failed: " + string(e.what())));
        return {};
    }
    catch (const exception &e)
    {
        {
            lock_guard<mutex> lock(stats_mutex_);
            stats_.detection_errors++;
        }
        log_error("Bar scan failed: " + string(e.what()));
        events_->publish(SystemEvent::error("Bar scan failed: " + string(e.what())));
        return {};
    }

    double elapsed_ms = chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();

    {
        lock_guard<mutex> lock(mutex_);
        // The profile was switched while scanning; these results are stale
        if (active_id_ != profile_id)
            return {};
        mapping_ = mapping;
    }

    for (const auto &entry : results)
    {
        int slot = entry.first;
        const DetectionResult &result = entry.second;

        auto bound = mapping.detected.find(slot);
        auto previous = before.find(slot);
        bool newly_bound = bound != mapping.detected.end() && bound->second == result.ability &&
                           (previous == before.end() || previous->second != result.ability);
        if (newly_bound)
        {
            log_info("Detected " + log_string_src(result.ability) + " in slot " + to_string(slot));
            events_->publish(SystemEvent::abilityDetected(slot, result));
        }
    }

    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_.scans++;
        stats_.abilities_detected += results.size();
        stats_.last_scan_ms = elapsed_ms;
        stats_.total_scan_ms += elapsed_ms;
    }

    return results;
}

bool SkillSystem::applyLayout(const map<int, string> &layout)
{
    lock_guard<mutex> lock(mutex_);
    if (active_id_.empty())
        return false;

    int applied = 0;
    for (const auto &entry : layout)
    {
        int slot = entry.first;
        if (slot < 0 || slot >= (int)mapping_.slot_regions.size() || !model_.contains(entry.second))
        {
            log_warning("Ignoring cached slot " + to_string(slot) + " -> " + entry.second);
            continue;
        }

        SlotPosition position;
        position.slot_index = slot;
        position.region = mapping_.slot_regions[slot];
        model_.setPosition(entry.second, position);
        mapping_.detected[slot] = entry.second;
        applied++;
    }

    if (applied > 0)
        mapping_.updateScanTime(Clock::now());

    log_info("Restored " + log_string(applied) + " cached slot bindings");
    return applied > 0;
}

Rotation *SkillSystem::findRotation(const string &name)
{
    auto byName = [this](const string &wanted) -> Rotation *
    {
        for (auto &rotation : active_.rotations)
        {
            if (rotation.name == wanted)
                return &rotation;
        }
        return nullptr;
    };

    if (!name.empty())
        return byName(name);

    if (!active_.active_rotation.empty())
    {
        Rotation *active = byName(active_.active_rotation);
        if (active)
            return active;
    }

    return active_.rotations.empty() ? nullptr : &active_.rotations.front();
}

bool SkillSystem::getNextFromRotation(string &ability, const string &rotation_name)
{
    lock_guard<mutex> lock(mutex_);
    Rotation *rotation = findRotation(rotation_name);
    if (!rotation)
    {
        log_debug("No rotation " + log_string_src(rotation_name));
        return false;
    }

    if (!rotation->enabled)
    {
        log_debug("Rotation " + log_string_src(rotation->name) + " finished");
        return false;
    }

    TimePoint now = Clock::now();
    auto ready = [this, now](const string &name)
    { return model_.isReady(name, now); };

    string next = rotation->next(ready, now);
    if (next.empty() || !ready(next))
        return false;

    ability = next;
    return true;
}

bool SkillSystem::setActiveRotation(const string &name)
{
    {
        lock_guard<mutex> lock(mutex_);
        auto it = find_if(active_.rotations.begin(), active_.rotations.end(), [&name](const Rotation &rotation)
                          { return rotation.name == name; });
        if (it == active_.rotations.end())
        {
            log_warning("Unknown rotation " + log_string_src(name));
            return false;
        }

        it->reset();
        active_.active_rotation = name;
    }

    log_info("Active rotation set to " + log_string_src(name));
    events_->publish(SystemEvent::rotationChanged(name));
    return true;
}

string SkillSystem::activeRotation() const
{
    lock_guard<mutex> lock(mutex_);
    return active_.active_rotation;
}

bool SkillSystem::executeAbility(const string &name, ExecutionMode mode, int priority, bool verify)
{
    return engine_->execute(name, mode, priority, verify);
}

bool SkillSystem::executeRotation(const string &rotation)
{
    string ability;
    if (!getNextFromRotation(ability, rotation))
        return false;

    return engine_->execute(ability, ExecutionMode::IMMEDIATE);
}

bool SkillSystem::start()
{
    if (activeProfile().empty())
    {
        log_error("Cannot start without an active profile");
        return false;
    }

    // Cleared before the monitor thread can report its first error
    error_ = false;

    if (!engine_->start())
    {
        error_ = true;
        return false;
    }

    if (!startMonitoring())
    {
        engine_->stop();
        error_ = true;
        return false;
    }

    running_ = true;
    log_info("Skill system running");
    return true;
}

void SkillSystem::stop()
{
    // Monitoring first so nothing reacts to a half-stopped engine
    stopMonitoring();
    engine_->stop();

    if (running_)
    {
        running_ = false;
        log_info("Skill system stopped");
    }
}

void SkillSystem::reset()
{
    stop();
    classifier_->clearCache();
    model_.clear();

    {
        lock_guard<mutex> lock(mutex_);
        active_id_.clear();
        active_ = ClassProfile();
        mapping_ = SkillBarMapping();
    }
    {
        lock_guard<mutex> lock(stats_mutex_);
        stats_ = SystemStats();
    }

    error_ = false;
    log_info("Skill system reset");
}

bool SkillSystem::startMonitoring()
{
    if (monitoring_)
        return true;

    if (activeProfile().empty())
    {
        log_warning("No active profile to monitor");
        return false;
    }

    monitoring_ = true;
    monitor_thread_ = thread(&SkillSystem::monitorLoop, this);
    log_info("Monitoring started");
    return true;
}

void SkillSystem::stopMonitoring()
{
    monitoring_ = false;
    wake_.notify_all();

    if (monitor_thread_.joinable())
    {
        monitor_thread_.join();
        log_info("Monitoring stopped");
    }
}

void SkillSystem::monitorLoop()
{
    while (monitoring_)
    {
        double interval;
        try
        {
            monitorOnce();
            error_ = false;
            interval = detectionConfig().scan_interval;
        }
        catch (const cv::Exception &e)
        {
            {
                lock_guard<mutex> lock(stats_mutex_);
                stats_.monitor_errors++;
            }
            error_ = true;
            log_error("Monitoring error: " + string(e.what()));
            events_->publish(SystemEvent::error("Monitoring error: " + string(e.what())));
            interval = 1.0;
        }
        catch (const exception &e)
        {
            {
                lock_guard<mutex> lock(stats_mutex_);
                stats_.monitor_errors++;
            }
            error_ = true;
            log_error("Monitoring error: " + string(e.what()));
            events_->publish(SystemEvent::error("Monitoring error: " + string(e.what())));
            interval = 1.0;
        }
        catch (...)
        {
            {
                lock_guard<mutex> lock(stats_mutex_);
                stats_.monitor_errors++;
            }
            error_ = true;
            log_error("Monitoring error: unknown exception");
            events_->publish(SystemEvent::error("Monitoring error: unknown exception"));
            interval = 1.0;
        }

        sleepFor(interval);
    }
}

void SkillSystem::monitorOnce()
{
    DetectionConfig config;
    bool rescan;
    {
        lock_guard<mutex> lock(mutex_);
        config = active_.detection;
        rescan = config.auto_rescan && !mapping_.slot_regions.empty() && mapping_.needsRescan(Clock::now());
    }

    if (rescan)
        autoDetect();

    for (const auto &ability : model_.positioned())
    {
        if (!monitoring_)
            break;
        if (!ability.hasIcon())
            continue;

        DetectionResult result = classifier_->classify(ability, ability.position.region, config);
        if (result.confidence < config.monitor_min_confidence)
            continue;

        // Stamped with the frame time, so a frame older than a press cannot report READY over it
        StateUpdate update = model_.updateState(ability.name, result.state, result.confidence, result.observed_at);
        if (update.changed)
        {
            {
                lock_guard<mutex> lock(stats_mutex_);
                stats_.state_changes++;
            }
            log_debug(log_string_src(ability.name) + ": " + toString(update.old_state) + " -> " + toString(update.new_state));
            events_->publish(SystemEvent::stateChanged(ability.name, update.old_state, update.new_state));
        }
    }

    lock_guard<mutex> lock(stats_mutex_);
    stats_.monitor_iterations++;
}

bool SkillSystem::sleepFor(double seconds)
{
    unique_lock<mutex> lock(wake_mutex_);
    wake_.wait_for(lock, secondsToDuration(seconds), [this]
                   { return !monitoring_; });
    return monitoring_;
}

void SkillSystem::setResource(const string &resource, double value)
{
    model_.setResource(resource, value);
}

bool SkillSystem::getAbilityInfo(const string &name, Ability &ability) const
{
    return model_.get(name, ability);
}

vector<Ability> SkillSystem::abilities() const
{
    return model_.snapshot();
}

vector<Rotation> SkillSystem::rotations() const
{
    lock_guard<mutex> lock(mutex_);
    return active_.rotations;
}

SkillBarMapping SkillSystem::barMapping() const
{
    lock_guard<mutex> lock(mutex_);
    return mapping_;
}

SystemStats SkillSystem::stats() const
{
    SystemStats copy;
    {
        lock_guard<mutex> lock(stats_mutex_);
        copy = stats_;
    }
    copy.detection_errors += scanner_.slotErrors();
    copy.detector = classifier_->stats();
    copy.execution = engine_->stats();
    return copy;
}

SystemState SkillSystem::state() const
{
    if (error_)
        return SystemState::ERROR;
    return running_ ? SystemState::RUNNING : SystemState::STOPPED;
}

string SkillSystem::activeProfile() const
{
    lock_guard<mutex> lock(mutex_);
    return active_id_;
}

DetectionConfig SkillSystem::detectionConfig() const
{
    lock_guard<mutex> lock(mutex_);
    return active_.detection;
}
