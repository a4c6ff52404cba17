#include "readiness_model.hpp"

using namespace std;

void ReadinessModel::reset(const vector<Ability> &abilities)
{
    lock_guard<mutex> lock(mutex_);
    abilities_.clear();
    order_.clear();

    for (const auto &ability : abilities)
    {
        if (abilities_.emplace(ability.name, ability).second)
            order_.push_back(ability.name);
    }
}

void ReadinessModel::clear()
{
    lock_guard<mutex> lock(mutex_);
    abilities_.clear();
    order_.clear();
    resources_.clear();
}

bool ReadinessModel::contains(const string &name) const
{
    lock_guard<mutex> lock(mutex_);
    return abilities_.count(name) > 0;
}

size_t ReadinessModel::size() const
{
    lock_guard<mutex> lock(mutex_);
    return abilities_.size();
}

bool ReadinessModel::get(const string &name, Ability &out) const
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return false;

    out = it->second;
    return true;
}

vector<Ability> ReadinessModel::snapshot() const
{
    lock_guard<mutex> lock(mutex_);
    vector<Ability> result;
    result.reserve(order_.size());
    for (const auto &name : order_)
        result.push_back(abilities_.at(name));
    return result;
}

vector<Ability> ReadinessModel::positioned() const
{
    lock_guard<mutex> lock(mutex_);
    vector<Ability> result;
    for (const auto &name : order_)
    {
        const Ability &ability = abilities_.at(name);
        if (ability.enabled && ability.hasPosition())
            result.push_back(ability);
    }
    return result;
}

vector<string> ReadinessModel::names() const
{
    lock_guard<mutex> lock(mutex_);
    return order_;
}

StateUpdate ReadinessModel::updateState(const string &name, AbilityState state, float confidence, TimePoint observed_at)
{
    StateUpdate update;
    update.new_state = state;

    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return update;

    Ability &ability = it->second;
    update.old_state = ability.state;

    if (observed_at < ability.last_detection)
        return update;

    if (state == AbilityState::READY && ability.wasUsed() && observed_at < ability.last_used)
        return update;

    ability.state = state;
    ability.confidence = confidence;
    ability.last_detection = observed_at;

    update.applied = true;
    update.changed = update.old_state != state;
    return update;
}

bool ReadinessModel::markUsed(const string &name, TimePoint at)
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return false;

    it->second.last_used = at;
    if (it->second.cast_time > 0.0)
        it->second.state = AbilityState::CASTING;
    return true;
}

bool ReadinessModel::setPosition(const string &name, const SlotPosition &position)
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return false;

    it->second.position = position;
    return true;
}

bool ReadinessModel::clearPosition(const string &name)
{
    return setPosition(name, SlotPosition());
}

bool ReadinessModel::setIconTemplate(const string &name, const cv::Mat &icon)
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return false;

    it->second.icon_template = icon;
    return true;
}

void ReadinessModel::setResource(const string &resource, double value)
{
    lock_guard<mutex> lock(mutex_);
    resources_[resource] = value;
}

map<string, double> ReadinessModel::resources() const
{
    lock_guard<mutex> lock(mutex_);
    return resources_;
}

bool ReadinessModel::isReady(const string &name, TimePoint now) const
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return false;

    return it->second.isReady(now, resources_);
}

double ReadinessModel::remainingCooldown(const string &name, TimePoint now) const
{
    lock_guard<mutex> lock(mutex_);
    auto it = abilities_.find(name);
    if (it == abilities_.end())
        return 0.0;

    return it->second.remainingCooldown(now);
}
