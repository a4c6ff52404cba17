#include "profile_loader.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace profile_loader
{
    // Optional field with a fallback; a value of the wrong type is a configuration error
    template <typename T>
    static T field(const json &object, const string &key, const T &fallback, const string &context)
    {
        auto it = object.find(key);
        if (it == object.end() || it->is_null())
            return fallback;

        try
        {
            return it->get<T>();
        }
        catch (const json::exception &)
        {
            throw ConfigError(context + ": field '" + key + "' has the wrong type (" + string(it->type_name()) + ")");
        }
    }

    static const json &objectField(const json &object, const string &key, const string &context)
    {
        static const json empty = json::object();
        auto it = object.find(key);
        if (it == object.end() || it->is_null())
            return empty;
        if (!it->is_object())
            throw ConfigError(context + ": '" + key + "' must be an object");
        return *it;
    }

    static cv::Rect parseRect(const json &value, const string &context)
    {
        if (!value.is_array() || value.size() != 4)
            throw ConfigError(context + ": region must be [x, y, width, height]");

        try
        {
            return cv::Rect(value[0].get<int>(), value[1].get<int>(), value[2].get<int>(), value[3].get<int>());
        }
        catch (const json::exception &)
        {
            throw ConfigError(context + ": region values must be integers");
        }
    }

    static string resolvePath(const string &icon, const string &resource_path, const string &base_dir)
    {
        if (icon.empty())
            return icon;

        fs::path icon_path(icon);
        if (icon_path.is_absolute())
            return icon;

        fs::path root(base_dir);
        if (!resource_path.empty())
        {
            fs::path resource(resource_path);
            root = resource.is_absolute() ? resource : root / resource;
        }

        return (root / icon_path).lexically_normal().string();
    }

    static Precondition parseCondition(const json &value, const string &context)
    {
        if (!value.is_object())
            throw ConfigError(context + ": condition must be an object");

        Precondition condition;
        condition.resource = field<string>(value, "resource", "", context);
        if (condition.resource.empty())
            throw ConfigError(context + ": condition without a resource");

        string comparison = field<string>(value, "comparison", "below", context);
        if (comparison == "below")
            condition.comparison = Precondition::Comparison::BELOW;
        else if (comparison == "above")
            condition.comparison = Precondition::Comparison::ABOVE;
        else
            throw ConfigError(context + ": unknown comparison '" + comparison + "'");

        if (!value.contains("threshold"))
            throw ConfigError(context + ": condition on " + condition.resource + " has no threshold");
        condition.threshold = field<double>(value, "threshold", 0.0, context);
        return condition;
    }

    static Ability parseAbility(const string &key_name, const json &value, const string &resource_path,
                                const string &base_dir, const string &profile)
    {
        string context = "Profile '" + profile + "', skill '" + key_name + "'";
        if (!value.is_object())
            throw ConfigError(context + ": must be an object");

        Ability ability;
        ability.name = field<string>(value, "name", key_name, context);
        ability.key = field<string>(value, "key", "", context);
        ability.type = abilityTypeFromString(field<string>(value, "type", "instant", context));
        ability.description = field<string>(value, "description", "", context);
        ability.icon_path = resolvePath(field<string>(value, "icon_path", "", context), resource_path, base_dir);
        ability.cooldown = field<double>(value, "cooldown", 2.0, context);
        ability.cast_time = field<double>(value, "cast_time", 0.0, context);
        ability.priority = field<int>(value, "priority", 3, context);
        ability.resource_cost = field<int>(value, "resource_cost", field<int>(value, "mana_cost", 0, context), context);
        ability.enabled = field<bool>(value, "enabled", true, context);
        ability.buff_duration = field<double>(value, "buff_duration", 0.0, context);
        ability.recast_prevention = field<bool>(value, "recast_prevention", false, context);
        ability.combo_sequence = field<vector<string>>(value, "combo", {}, context);

        // Abilities without a cooldown overlay are driven by their timer alone
        if (!field<bool>(value, "has_visual_cooldown", true, context) && ability.type == AbilityType::INSTANT)
            ability.type = AbilityType::MANUAL;

        auto conditions = value.find("conditions");
        if (conditions != value.end() && !conditions->is_null())
        {
            if (!conditions->is_array())
                throw ConfigError(context + ": conditions must be an array");
            for (const auto &condition : *conditions)
                ability.conditions.push_back(parseCondition(condition, context));
        }

        return ability;
    }

    static Rotation parseRotation(const string &key_name, const json &value, const string &profile)
    {
        string context = "Profile '" + profile + "', rotation '" + key_name + "'";
        if (!value.is_object())
            throw ConfigError(context + ": must be an object");

        Rotation rotation;
        rotation.name = field<string>(value, "name", key_name, context);
        rotation.abilities = field<vector<string>>(value, "skills", {}, context);
        rotation.repeat = field<bool>(value, "repeat", true, context);
        rotation.adaptive = field<bool>(value, "adaptive", true, context);
        rotation.enabled = field<bool>(value, "enabled", true, context);
        return rotation;
    }

    static DetectionConfig parseDetection(const json &value, const string &context)
    {
        DetectionConfig config;
        config.template_threshold = field<float>(value, "template_threshold", config.template_threshold, context);
        config.cooldown_threshold = field<float>(value, "cooldown_threshold", config.cooldown_threshold, context);
        config.scan_interval = field<double>(value, "scan_interval", config.scan_interval, context);
        config.rescan_interval = field<double>(value, "rescan_interval", config.rescan_interval, context);
        config.auto_rescan = field<bool>(value, "auto_rescan", config.auto_rescan, context);
        config.use_multi_scale = field<bool>(value, "use_multi_scale", config.use_multi_scale, context);

        auto scale_range = value.find("scale_range");
        if (scale_range != value.end())
        {
            if (!scale_range->is_array() || scale_range->size() != 2 || !(*scale_range)[0].is_number() ||
                !(*scale_range)[1].is_number())
                throw ConfigError(context + ": scale_range must be [min, max]");
            config.scale_min = (*scale_range)[0].get<float>();
            config.scale_max = (*scale_range)[1].get<float>();
        }

        auto methods = value.find("methods");
        if (methods != value.end())
        {
            config.methods.clear();
            for (const auto &name : field<vector<string>>(value, "methods", {}, context))
                config.methods.push_back(detectionMethodFromString(name));
            if (config.methods.empty())
                throw ConfigError(context + ": methods must not be empty");
        }

        config.cooldown_brightness_ratio = field<float>(value, "cooldown_brightness_ratio", config.cooldown_brightness_ratio, context);
        config.ready_brightness_ratio = field<float>(value, "ready_brightness_ratio", config.ready_brightness_ratio, context);
        config.dark_pixel_level = field<int>(value, "dark_pixel_level", config.dark_pixel_level, context);
        config.dark_concentration = field<float>(value, "dark_concentration", config.dark_concentration, context);
        config.saturation_limit = field<int>(value, "saturation_limit", config.saturation_limit, context);
        config.brightness_limit = field<int>(value, "brightness_limit", config.brightness_limit, context);
        config.monitor_min_confidence = field<float>(value, "monitor_min_confidence", config.monitor_min_confidence, context);
        return config;
    }

    static ExecutionSettings parseExecution(const json &value, const string &context)
    {
        ExecutionSettings settings;
        settings.global_cooldown = field<double>(value, "global_cooldown", settings.global_cooldown, context);
        settings.min_global_cooldown = field<double>(value, "min_global_cooldown", settings.min_global_cooldown, context);
        settings.max_global_cooldown = field<double>(value, "max_global_cooldown", settings.max_global_cooldown, context);
        settings.auto_retry = field<bool>(value, "auto_retry", settings.auto_retry, context);
        settings.max_retries = field<int>(value, "max_retries", settings.max_retries, context);
        settings.request_timeout = field<double>(value, "request_timeout", settings.request_timeout, context);
        settings.retry_delay = field<double>(value, "retry_delay", settings.retry_delay, context);
        settings.verification_delay = field<double>(value, "verification_delay", settings.verification_delay, context);
        settings.visual_verification = field<bool>(value, "visual_verification", settings.visual_verification, context);
        settings.adaptive_timing = field<bool>(value, "adaptive_timing", settings.adaptive_timing, context);
        settings.slow_execution = field<double>(value, "slow_execution", settings.slow_execution, context);
        settings.fast_execution = field<double>(value, "fast_execution", settings.fast_execution, context);
        settings.combo_step_delay = field<double>(value, "combo_step_delay", settings.combo_step_delay, context);
        return settings;
    }

    ClassProfile parse(const json &document, const string &base_dir)
    {
        if (!document.is_object())
            throw ConfigError("Profile document must be a JSON object");

        ClassProfile profile;
        profile.class_name = field<string>(document, "class_name", "", "Profile");
        if (profile.class_name.empty())
            throw ConfigError("Profile has no class_name");

        string context = "Profile '" + profile.class_name + "'";
        profile.display_name = field<string>(document, "display_name", profile.class_name, context);
        profile.resource_path = field<string>(document, "resource_path", "", context);
        profile.active_rotation = field<string>(document, "active_rotation", "", context);
        profile.detection = parseDetection(objectField(document, "detection_settings", context), context);
        profile.execution = parseExecution(objectField(document, "execution_settings", context), context);

        const json &bar = objectField(document, "skill_bar", context);
        if (bar.contains("region"))
            profile.bar_region = parseRect(bar["region"], context);
        profile.slot_count = field<int>(bar, "slots", profile.slot_count, context);

        for (const auto &entry : objectField(document, "skills", context).items())
            profile.abilities.push_back(parseAbility(entry.key(), entry.value(), profile.resource_path, base_dir, profile.class_name));

        for (const auto &entry : objectField(document, "rotations", context).items())
            profile.rotations.push_back(parseRotation(entry.key(), entry.value(), profile.class_name));

        validateProfile(profile);
        return profile;
    }

    ClassProfile loadString(const string &text, const string &base_dir)
    {
        json document;
        try
        {
            document = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError("Invalid profile JSON: " + string(e.what()));
        }
        return parse(document, base_dir);
    }

    ClassProfile loadFile(const string &path)
    {
        ifstream file(path);
        if (!file)
            throw ConfigError("Cannot open profile " + path);

        json document;
        try
        {
            document = json::parse(file);
        }
        catch (const json::parse_error &e)
        {
            throw ConfigError(path + ": invalid JSON: " + string(e.what()));
        }

        string base_dir = fs::path(path).parent_path().string();
        if (base_dir.empty())
            base_dir = ".";

        try
        {
            ClassProfile profile = parse(document, base_dir);
            log_info("Loaded profile " + log_string_src(profile.class_name) + " from " + path);
            return profile;
        }
        catch (const ConfigError &e)
        {
            throw ConfigError(path + ": " + string(e.what()));
        }
    }

    vector<ClassProfile> loadDirectory(const string &directory)
    {
        vector<ClassProfile> profiles;

        error_code error;
        fs::directory_iterator it(directory, error);
        if (error)
        {
            log_error("Cannot read profile directory " + directory + ": " + error.message());
            return profiles;
        }

        vector<string> files;
        for (const auto &entry : it)
        {
            if (entry.is_regular_file(error) && entry.path().extension() == ".json")
                files.push_back(entry.path().string());
        }
        sort(files.begin(), files.end());

        for (const auto &file : files)
        {
            try
            {
                profiles.push_back(loadFile(file));
            }
            catch (const ConfigError &e)
            {
                log_error("Skipping profile: " + string(e.what()));
            }
        }

        log_info("Loaded " + log_string(profiles.size()) + "/" + to_string(files.size()) + " profiles from " + directory);
        return profiles;
    }

    vector<ClassProfile> loadPath(const string &path)
    {
        error_code error;
        if (fs::is_directory(path, error))
            return loadDirectory(path);
        return {loadFile(path)};
    }

    json toJson(const ClassProfile &profile)
    {
        json skills = json::object();
        for (const auto &ability : profile.abilities)
        {
            json conditions = json::array();
            for (const auto &condition : ability.conditions)
            {
                conditions.push_back({{"resource", condition.resource},
                                      {"comparison", condition.comparison == Precondition::Comparison::BELOW ? "below" : "above"},
                                      {"threshold", condition.threshold}});
            }

            skills[ability.name] = {{"name", ability.name},
                                    {"key", ability.key},
                                    {"type", toString(ability.type)},
                                    {"icon_path", ability.icon_path.empty() ? string() : fs::absolute(ability.icon_path).string()},
                                    {"cooldown", ability.cooldown},
                                    {"cast_time", ability.cast_time},
                                    {"priority", ability.priority},
                                    {"resource_cost", ability.resource_cost},
                                    {"enabled", ability.enabled},
                                    {"description", ability.description},
                                    {"conditions", conditions},
                                    {"combo", ability.combo_sequence},
                                    {"buff_duration", ability.buff_duration},
                                    {"recast_prevention", ability.recast_prevention}};
        }

        json rotations = json::object();
        for (const auto &rotation : profile.rotations)
        {
            rotations[rotation.name] = {{"name", rotation.name},
                                        {"skills", rotation.abilities},
                                        {"repeat", rotation.repeat},
                                        {"adaptive", rotation.adaptive},
                                        {"enabled", rotation.enabled}};
        }

        json methods = json::array();
        for (auto method : profile.detection.methods)
            methods.push_back(toString(method));

        const DetectionConfig &detection = profile.detection;
        const ExecutionSettings &execution = profile.execution;

        json document = {
            {"version", "3.0"},
            {"class_name", profile.class_name},
            {"display_name", profile.display_name},
            {"resource_path", ""}, // Icon paths are exported resolved
            {"active_rotation", profile.active_rotation},
            {"detection_settings",
             {{"template_threshold", detection.template_threshold},
              {"cooldown_threshold", detection.cooldown_threshold},
              {"scan_interval", detection.scan_interval},
              {"rescan_interval", detection.rescan_interval},
              {"auto_rescan", detection.auto_rescan},
              {"use_multi_scale", detection.use_multi_scale},
              {"scale_range", {detection.scale_min, detection.scale_max}},
              {"methods", methods},
              {"cooldown_brightness_ratio", detection.cooldown_brightness_ratio},
              {"ready_brightness_ratio", detection.ready_brightness_ratio},
              {"dark_pixel_level", detection.dark_pixel_level},
              {"dark_concentration", detection.dark_concentration},
              {"saturation_limit", detection.saturation_limit},
              {"brightness_limit", detection.brightness_limit},
              {"monitor_min_confidence", detection.monitor_min_confidence}}},
            {"execution_settings",
             {{"global_cooldown", execution.global_cooldown},
              {"min_global_cooldown", execution.min_global_cooldown},
              {"max_global_cooldown", execution.max_global_cooldown},
              {"auto_retry", execution.auto_retry},
              {"max_retries", execution.max_retries},
              {"request_timeout", execution.request_timeout},
              {"retry_delay", execution.retry_delay},
              {"verification_delay", execution.verification_delay},
              {"visual_verification", execution.visual_verification},
              {"adaptive_timing", execution.adaptive_timing},
              {"slow_execution", execution.slow_execution},
              {"fast_execution", execution.fast_execution},
              {"combo_step_delay", execution.combo_step_delay}}},
            {"skills", skills},
            {"rotations", rotations}};

        if (profile.bar_region.area() > 0)
        {
            const cv::Rect &bar = profile.bar_region;
            document["skill_bar"] = {{"region", {bar.x, bar.y, bar.width, bar.height}}, {"slots", profile.slot_count}};
        }

        return document;
    }

    bool saveFile(const ClassProfile &profile, const string &path)
    {
        ofstream file(path);
        if (!file)
        {
            log_error("Cannot write profile " + path);
            return false;
        }

        file << toJson(profile).dump(2) << endl;
        if (!file.good())
        {
            log_error("Failed writing profile " + path);
            return false;
        }

        log_info("Saved profile " + log_string_src(profile.class_name) + " to " + path);
        return true;
    }
}
