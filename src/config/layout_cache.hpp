#pragma once

#include <opencv2/opencv.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <string>
#include "detector/skill_types.hpp"
#include "utils/logging.hpp"

using namespace std;

namespace cache
{
    namespace layout
    {
        static const int VERSION = 1;

        // Standard filename for a class's slot layout
        inline string generateFilename(const string &class_name, const string &directory = "cache")
        {
            return directory + "/" + class_name + "_layout.json";
        }

        // Slot -> ability bindings from the last scan. Only returned when the cached
        // bar geometry matches the current one.
        inline bool load(const string &class_name, const cv::Rect &bar_region, int slots, map<int, string> &layout,
                         const string &directory = "cache")
        {
            string filename = generateFilename(class_name, directory);
            try
            {
                ifstream file(filename);
                if (!file)
                {
                    log_debug("No cached layout for " + class_name + ", a scan will create one");
                    return false;
                }

                nlohmann::json document = nlohmann::json::parse(file);
                if (document.value("version", 0) != VERSION)
                {
                    log_warning("Incompatible layout cache version in " + filename);
                    return false;
                }

                auto region = document.at("bar_region").get<vector<int>>();
                if (region.size() != 4 || cv::Rect(region[0], region[1], region[2], region[3]) != bar_region ||
                    document.at("slots").get<int>() != slots)
                {
                    log_info("Cached layout for " + class_name + " was taken with another bar geometry, ignoring it");
                    return false;
                }

                layout.clear();
                for (const auto &entry : document.at("layout").items())
                    layout[stoi(entry.key())] = entry.value().get<string>();

                log_info("Loaded cached layout with " + to_string(layout.size()) + " slots for " + class_name);
                return !layout.empty();
            }
            catch (const exception &e)
            {
                log_error("Error loading layout cache " + filename + ": " + string(e.what()));
                return false;
            }
        }

        inline bool save(const string &class_name, const SkillBarMapping &mapping, const string &directory = "cache")
        {
            string command = "mkdir -p " + directory;
            if (system(command.c_str()) != 0)
            {
                log_error("Failed to create cache directory " + directory);
                return false;
            }

            string filename = generateFilename(class_name, directory);
            try
            {
                nlohmann::json layout = nlohmann::json::object();
                for (const auto &entry : mapping.detected)
                    layout[to_string(entry.first)] = entry.second;

                const cv::Rect &bar = mapping.bar_region;
                nlohmann::json document = {{"version", VERSION},
                                           {"class_name", class_name},
                                           {"bar_region", {bar.x, bar.y, bar.width, bar.height}},
                                           {"slots", mapping.slot_regions.size()},
                                           {"layout", layout}};

                ofstream file(filename);
                if (!file)
                {
                    log_error("Failed to open file for writing: " + filename);
                    return false;
                }

                file << document.dump(2) << endl;
                if (!file.good())
                {
                    log_error("Failed to write layout cache " + filename);
                    return false;
                }

                log_info("Saved layout with " + to_string(mapping.detected.size()) + " slots to " + filename);
                return true;
            }
            catch (const exception &e)
            {
                log_error("Error saving layout cache: " + string(e.what()));
                return false;
            }
        }
    }
}
