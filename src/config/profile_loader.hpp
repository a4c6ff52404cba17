#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "detector/skill_types.hpp"

using namespace std;

// Class profiles as JSON files:
//
// {
//   "class_name": "warrior",
//   "resource_path": "icons/warrior",
//   "active_rotation": "Basic",
//   "skill_bar": { "region": [600, 980, 720, 72], "slots": 10 },
//   "detection_settings": { "template_threshold": 0.85, ... },
//   "execution_settings": { "global_cooldown": 0.15, ... },
//   "skills": { "Slash": { "key": "1", "icon_path": "slash.png", "cooldown": 2.0 } },
//   "rotations": { "Basic": { "skills": ["Slash"], "repeat": true } }
// }
namespace profile_loader
{
    // Build and validate a profile. Relative icon paths resolve against `base_dir`
    // (or resource_path, itself relative to `base_dir`). Throws ConfigError.
    ClassProfile parse(const nlohmann::json &document, const string &base_dir = ".");

    ClassProfile loadString(const string &text, const string &base_dir = ".");

    // Throws ConfigError naming the file on any problem
    ClassProfile loadFile(const string &path);

    // Every *.json in `directory`; bad files are logged and skipped
    vector<ClassProfile> loadDirectory(const string &directory);

    // A file or a directory of files
    vector<ClassProfile> loadPath(const string &path);

    // Inverse of parse, for exporting a tuned profile
    nlohmann::json toJson(const ClassProfile &profile);

    bool saveFile(const ClassProfile &profile, const string &path);
}
