#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "skill_types.hpp"

// Outcome of feeding one observation into the model
struct StateUpdate
{
    bool applied = false; // Observation accepted (not stale)
    bool changed = false; // State differs from the previous one
    AbilityState old_state = AbilityState::UNKNOWN;
    AbilityState new_state = AbilityState::UNKNOWN;
};

// Owns every ability of the active profile. The monitoring loop and the
// execution engine both write here, so all access goes through copies.
class ReadinessModel
{
public:
    ReadinessModel() = default;

    void reset(const vector<Ability> &abilities);
    void clear();

    bool contains(const string &name) const;
    size_t size() const;

    bool get(const string &name, Ability &out) const;
    vector<Ability> snapshot() const;
    vector<Ability> positioned() const;
    vector<string> names() const;

    // Last writer wins by observation time. A READY frame captured before the
    // ability was last used is ignored so it cannot undo a fresh execution.
    StateUpdate updateState(const string &name, AbilityState state, float confidence, TimePoint observed_at);

    bool markUsed(const string &name, TimePoint at);
    bool setPosition(const string &name, const SlotPosition &position);
    bool clearPosition(const string &name);
    bool setIconTemplate(const string &name, const cv::Mat &icon);

    void setResource(const string &resource, double value);
    map<string, double> resources() const;

    bool isReady(const string &name, TimePoint now = Clock::now()) const;
    double remainingCooldown(const string &name, TimePoint now = Clock::now()) const;

private:
    mutable mutex mutex_;
    map<string, Ability> abilities_;
    vector<string> order_; // Profile order, for stable snapshots
    map<string, double> resources_;
};
