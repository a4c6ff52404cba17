#include "skill_types.hpp"
#include <algorithm>
#include <cctype>
#include <set>

using namespace std;

string toString(AbilityType type)
{
    switch (type)
    {
    case AbilityType::INSTANT:
        return "instant";
    case AbilityType::TIMED:
        return "timed";
    case AbilityType::MANUAL:
        return "manual";
    case AbilityType::COMBO:
        return "combo";
    }
    return "instant";
}

string toString(AbilityState state)
{
    switch (state)
    {
    case AbilityState::READY:
        return "ready";
    case AbilityState::COOLDOWN:
        return "cooldown";
    case AbilityState::CASTING:
        return "casting";
    case AbilityState::UNAVAILABLE:
        return "unavailable";
    case AbilityState::NOT_LEARNED:
        return "not_learned";
    case AbilityState::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

string toString(DetectionMethod method)
{
    switch (method)
    {
    case DetectionMethod::TEMPLATE_MATCH:
        return "template_match";
    case DetectionMethod::COOLDOWN_OVERLAY:
        return "cooldown_overlay";
    case DetectionMethod::COLOR_ANALYSIS:
        return "color_analysis";
    }
    return "template_match";
}

string toString(ExecutionMode mode)
{
    switch (mode)
    {
    case ExecutionMode::IMMEDIATE:
        return "immediate";
    case ExecutionMode::QUEUED:
        return "queued";
    case ExecutionMode::PRIORITY:
        return "priority";
    }
    return "queued";
}

static string lowercase(string value)
{
    transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
              { return static_cast<char>(tolower(c)); });
    return value;
}

AbilityType abilityTypeFromString(const string &name)
{
    string lower = lowercase(name);
    if (lower == "instant" || lower == "visual")
        return AbilityType::INSTANT;
    if (lower == "timed")
        return AbilityType::TIMED;
    if (lower == "manual")
        return AbilityType::MANUAL;
    if (lower == "combo")
        return AbilityType::COMBO;
    throw ConfigError("Unknown ability type '" + name + "'");
}

AbilityState abilityStateFromString(const string &name)
{
    string lower = lowercase(name);
    for (AbilityState state : {AbilityState::READY, AbilityState::COOLDOWN, AbilityState::CASTING,
                               AbilityState::UNAVAILABLE, AbilityState::NOT_LEARNED, AbilityState::UNKNOWN})
    {
        if (toString(state) == lower)
            return state;
    }
    throw ConfigError("Unknown ability state '" + name + "'");
}

DetectionMethod detectionMethodFromString(const string &name)
{
    string lower = lowercase(name);
    if (lower == "template_match")
        return DetectionMethod::TEMPLATE_MATCH;
    if (lower == "cooldown_overlay")
        return DetectionMethod::COOLDOWN_OVERLAY;
    if (lower == "color_analysis")
        return DetectionMethod::COLOR_ANALYSIS;
    throw ConfigError("Unknown detection method '" + name + "'");
}

ExecutionMode executionModeFromString(const string &name)
{
    string lower = lowercase(name);
    if (lower == "immediate")
        return ExecutionMode::IMMEDIATE;
    if (lower == "queued")
        return ExecutionMode::QUEUED;
    if (lower == "priority")
        return ExecutionMode::PRIORITY;
    throw ConfigError("Unknown execution mode '" + name + "'");
}

bool Precondition::isSatisfied(const map<string, double> &resources) const
{
    auto it = resources.find(resource);
    if (it == resources.end())
        return false;

    if (comparison == Comparison::BELOW)
        return it->second < threshold;
    return it->second > threshold;
}

double Ability::remainingCooldown(TimePoint now) const
{
    if (!wasUsed())
        return 0.0;

    double elapsed = secondsBetween(last_used, now);
    return std::max(0.0, cooldown - elapsed);
}

bool Ability::isReady(TimePoint now, const map<string, double> &resources) const
{
    if (!enabled)
        return false;

    if (remainingCooldown(now) > 0.0)
        return false;

    if (type == AbilityType::TIMED && recast_prevention && wasUsed() &&
        secondsBetween(last_used, now) < buff_duration)
        return false;

    for (const auto &condition : conditions)
    {
        if (!condition.isSatisfied(resources))
            return false;
    }

    // Abilities without an icon are timer-driven only
    if (!hasIcon() || type == AbilityType::MANUAL)
        return true;

    return state == AbilityState::READY;
}

bool SkillBarMapping::needsRescan(TimePoint now) const
{
    if (last_scan == TimePoint{})
        return true;
    return secondsBetween(last_scan, now) > rescan_interval;
}

SkillBarMapping createBarMapping(const cv::Rect &bar_region, int slots)
{
    SkillBarMapping mapping;
    mapping.bar_region = bar_region;

    if (slots <= 0)
        return mapping;

    int slot_width = bar_region.width / slots;
    for (int i = 0; i < slots; i++)
    {
        mapping.slot_regions.emplace_back(bar_region.x + i * slot_width, bar_region.y, slot_width, bar_region.height);
    }

    return mapping;
}

string Rotation::next(const function<bool(const string &)> &is_ready, TimePoint now)
{
    if (abilities.empty())
        return "";

    // Finished: frozen on the last entry
    if (!enabled)
        return abilities[current_index];

    if (!adaptive)
    {
        string name = abilities[current_index];
        advance();
        dispatched++;
        last_dispatch = now;
        return name;
    }

    for (size_t attempts = 0; attempts < abilities.size(); attempts++)
    {
        string name = abilities[current_index];
        bool ready = is_ready && is_ready(name);
        advance();

        if (ready)
        {
            dispatched++;
            last_dispatch = now;
            return name;
        }

        if (!enabled)
            break;
    }

    return "";
}

void Rotation::advance()
{
    current_index++;
    if (current_index >= abilities.size())
    {
        if (repeat)
        {
            current_index = 0;
        }
        else
        {
            enabled = false;
            current_index = abilities.empty() ? 0 : abilities.size() - 1;
        }
    }
}

void Rotation::reset()
{
    current_index = 0;
    enabled = true;
    dispatched = 0;
    last_dispatch = TimePoint{};
}

const Ability *ClassProfile::findAbility(const string &name) const
{
    for (const auto &ability : abilities)
    {
        if (ability.name == name)
            return &ability;
    }
    return nullptr;
}

const Ability *ClassProfile::findAbilityByKey(const string &key) const
{
    string wanted = lowercase(key);
    for (const auto &ability : abilities)
    {
        if (lowercase(ability.key) == wanted)
            return &ability;
    }
    return nullptr;
}

const Rotation *ClassProfile::findRotation(const string &name) const
{
    for (const auto &rotation : rotations)
    {
        if (rotation.name == name)
            return &rotation;
    }
    return nullptr;
}

static void checkUnitInterval(const string &profile, const string &field, double value)
{
    if (value < 0.0 || value > 1.0)
        throw ConfigError("Profile '" + profile + "': " + field + " must be within [0, 1], got " + to_string(value));
}

void validateProfile(const ClassProfile &profile)
{
    const string &id = profile.class_name;
    if (id.empty())
        throw ConfigError("Profile has no class_name");
    // Names cache files, so it must stay a plain file name
    if (id == "." || id == ".." || id.find_first_of("/\\") != string::npos)
        throw ConfigError("Profile '" + id + "': class_name must not contain path separators");

    set<string> names;
    for (const auto &ability : profile.abilities)
    {
        if (ability.name.empty())
            throw ConfigError("Profile '" + id + "': ability with empty name");
        if (!names.insert(ability.name).second)
            throw ConfigError("Profile '" + id + "': duplicate ability '" + ability.name + "'");
        if (ability.key.empty())
            throw ConfigError("Profile '" + id + "': ability '" + ability.name + "' has no key");
        if (ability.priority < PRIORITY_MIN || ability.priority > PRIORITY_MAX)
            throw ConfigError("Profile '" + id + "': ability '" + ability.name + "' priority " +
                              to_string(ability.priority) + " outside 1-10");
        if (ability.cooldown < 0.0 || ability.cast_time < 0.0 || ability.buff_duration < 0.0)
            throw ConfigError("Profile '" + id + "': ability '" + ability.name + "' has a negative duration");
    }

    for (const auto &ability : profile.abilities)
    {
        for (const auto &step : ability.combo_sequence)
        {
            if (!names.count(step))
                throw ConfigError("Profile '" + id + "': combo '" + ability.name + "' references unknown ability '" + step + "'");
        }
    }

    set<string> rotation_names;
    for (const auto &rotation : profile.rotations)
    {
        if (!rotation_names.insert(rotation.name).second)
            throw ConfigError("Profile '" + id + "': duplicate rotation '" + rotation.name + "'");
        if (rotation.abilities.empty())
            throw ConfigError("Profile '" + id + "': rotation '" + rotation.name + "' is empty");
        for (const auto &name : rotation.abilities)
        {
            if (!names.count(name))
                throw ConfigError("Profile '" + id + "': rotation '" + rotation.name + "' references unknown ability '" + name + "'");
        }
    }

    if (!profile.active_rotation.empty() && !rotation_names.count(profile.active_rotation))
        throw ConfigError("Profile '" + id + "': active rotation '" + profile.active_rotation + "' does not exist");

    const DetectionConfig &detection = profile.detection;
    checkUnitInterval(id, "template_threshold", detection.template_threshold);
    checkUnitInterval(id, "cooldown_threshold", detection.cooldown_threshold);
    checkUnitInterval(id, "dark_concentration", detection.dark_concentration);
    checkUnitInterval(id, "monitor_min_confidence", detection.monitor_min_confidence);

    if (detection.scale_min <= 0.0f || detection.scale_min > detection.scale_max)
        throw ConfigError("Profile '" + id + "': invalid scale range [" + to_string(detection.scale_min) + ", " +
                          to_string(detection.scale_max) + "]");
    if (detection.scan_interval <= 0.0)
        throw ConfigError("Profile '" + id + "': scan_interval must be positive");
    if (detection.cooldown_brightness_ratio > detection.ready_brightness_ratio)
        throw ConfigError("Profile '" + id + "': cooldown brightness ratio exceeds ready ratio");
    if (profile.slot_count <= 0)
        throw ConfigError("Profile '" + id + "': slot count must be positive");

    const ExecutionSettings &execution = profile.execution;
    if (execution.min_global_cooldown < 0.0 || execution.min_global_cooldown > execution.max_global_cooldown)
        throw ConfigError("Profile '" + id + "': invalid global cooldown bounds");
    if (execution.max_retries < 0)
        throw ConfigError("Profile '" + id + "': max_retries must not be negative");
    if (execution.request_timeout <= 0.0)
        throw ConfigError("Profile '" + id + "': request_timeout must be positive");
}
