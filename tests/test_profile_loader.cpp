#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "test_helpers.hpp"
#include "config/profile_loader.hpp"
#include "config/layout_cache.hpp"

namespace fs = std::filesystem;

namespace
{
    const char *WARRIOR = R"({
        "class_name": "warrior",
        "display_name": "Warrior",
        "resource_path": "icons",
        "active_rotation": "Basic",
        "skill_bar": { "region": [600, 980, 720, 72], "slots": 12 },
        "detection_settings": { "template_threshold": 0.8, "scale_range": [0.9, 1.1] },
        "execution_settings": { "global_cooldown": 0.2, "max_retries": 1 },
        "skills": {
            "Slash": { "key": "1", "icon_path": "slash.png", "cooldown": 1.5, "priority": 5 },
            "Charge": { "key": "2", "icon_path": "/abs/charge.png" },
            "Battle Shout": { "key": "3", "type": "timed", "buff_duration": 120, "recast_prevention": true },
            "Last Stand": { "key": "4", "has_visual_cooldown": false,
                            "conditions": [ { "resource": "health", "comparison": "below", "threshold": 30 } ] },
            "Opener": { "key": "5", "type": "combo", "combo": ["Charge", "Slash"] }
        },
        "rotations": {
            "Basic": { "skills": ["Charge", "Slash"], "repeat": true },
            "Burst": { "skills": ["Opener", "Slash"], "repeat": false, "adaptive": false }
        }
    })";

    const Ability &findAbility(const ClassProfile &profile, const std::string &name)
    {
        for (const auto &ability : profile.abilities)
        {
            if (ability.name == name)
                return ability;
        }
        FAIL("no ability " << name);
        return profile.abilities.front();
    }

    // Scratch directory removed when the test ends
    struct TempDir
    {
        fs::path path;

        explicit TempDir(const std::string &name) : path(fs::temp_directory_path() / name)
        {
            fs::remove_all(path);
            fs::create_directories(path);
        }
        ~TempDir() { fs::remove_all(path); }

        std::string write(const std::string &file, const std::string &text) const
        {
            std::ofstream out(path / file);
            out << text;
            return (path / file).string();
        }
    };
}

TEST_CASE("ProfileLoader - A full profile", "[ProfileLoader]")
{
    ClassProfile profile = profile_loader::loadString(WARRIOR, "/data/profiles");

    REQUIRE(profile.class_name == "warrior");
    REQUIRE(profile.display_name == "Warrior");
    REQUIRE(profile.active_rotation == "Basic");
    REQUIRE(profile.bar_region == cv::Rect(600, 980, 720, 72));
    REQUIRE(profile.slot_count == 12);
    REQUIRE(profile.abilities.size() == 5);
    REQUIRE(profile.rotations.size() == 2);

    SECTION("Settings override only what they name")
    {
        DetectionConfig defaults;
        REQUIRE(profile.detection.template_threshold == Approx(0.8f));
        REQUIRE(profile.detection.scale_min == Approx(0.9f));
        REQUIRE(profile.detection.scale_max == Approx(1.1f));
        REQUIRE(profile.detection.cooldown_threshold == defaults.cooldown_threshold);

        REQUIRE(profile.execution.global_cooldown == Approx(0.2));
        REQUIRE(profile.execution.max_retries == 1);
        REQUIRE(profile.execution.request_timeout == ExecutionSettings().request_timeout);
    }

    SECTION("Skill fields and defaults")
    {
        const Ability &slash = findAbility(profile, "Slash");
        REQUIRE(slash.key == "1");
        REQUIRE(slash.cooldown == Approx(1.5));
        REQUIRE(slash.priority == 5);
        REQUIRE(slash.type == AbilityType::INSTANT);
        REQUIRE(slash.enabled);

        const Ability &charge = findAbility(profile, "Charge");
        REQUIRE(charge.cooldown == Approx(2.0));
        REQUIRE(charge.priority == 3);

        const Ability &shout = findAbility(profile, "Battle Shout");
        REQUIRE(shout.type == AbilityType::TIMED);
        REQUIRE(shout.buff_duration == Approx(120.0));
        REQUIRE(shout.recast_prevention);

        const Ability &stand = findAbility(profile, "Last Stand");
        REQUIRE(stand.type == AbilityType::MANUAL);
        REQUIRE(stand.conditions.size() == 1);
        REQUIRE(stand.conditions[0].resource == "health");
        REQUIRE(stand.conditions[0].threshold == Approx(30.0));

        const Ability &opener = findAbility(profile, "Opener");
        REQUIRE(opener.type == AbilityType::COMBO);
        REQUIRE(opener.combo_sequence == std::vector<std::string>{"Charge", "Slash"});
    }

    SECTION("Icon paths resolve against the resource path")
    {
        REQUIRE(findAbility(profile, "Slash").icon_path == "/data/profiles/icons/slash.png");
        REQUIRE(findAbility(profile, "Charge").icon_path == "/abs/charge.png");
        REQUIRE(findAbility(profile, "Battle Shout").icon_path.empty());
    }

    SECTION("Type names ignore case")
    {
        auto document = nlohmann::json::parse(WARRIOR);
        document["skills"]["Slash"]["type"] = "TIMED";
        REQUIRE(findAbility(profile_loader::parse(document), "Slash").type == AbilityType::TIMED);
    }

    SECTION("Rotations")
    {
        const Rotation *burst = nullptr;
        for (const auto &rotation : profile.rotations)
        {
            if (rotation.name == "Burst")
                burst = &rotation;
        }
        REQUIRE(burst != nullptr);
        REQUIRE_FALSE(burst->repeat);
        REQUIRE_FALSE(burst->adaptive);
        REQUIRE(burst->abilities == std::vector<std::string>{"Opener", "Slash"});
    }

    SECTION("Exported profiles load back the same")
    {
        ClassProfile reloaded = profile_loader::parse(profile_loader::toJson(profile));
        REQUIRE(reloaded.abilities.size() == profile.abilities.size());
        REQUIRE(findAbility(reloaded, "Slash").icon_path == "/data/profiles/icons/slash.png");
        REQUIRE(findAbility(reloaded, "Last Stand").type == AbilityType::MANUAL);
        REQUIRE(reloaded.bar_region == profile.bar_region);
        REQUIRE(reloaded.execution.global_cooldown == Approx(0.2));
    }
}

TEST_CASE("ProfileLoader - Invalid profiles are rejected", "[ProfileLoader]")
{
    auto document = nlohmann::json::parse(WARRIOR);

    SECTION("Rotation naming an unknown ability")
    {
        document["rotations"]["Basic"]["skills"] = {"Charge", "Whirlwind"};
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Wrong field type")
    {
        document["skills"]["Slash"]["cooldown"] = "fast";
        REQUIRE_THROWS_WITH(profile_loader::parse(document), Catch::Contains("cooldown"));
    }

    SECTION("Priority outside 1-10")
    {
        document["skills"]["Slash"]["priority"] = 11;
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Skill without a key")
    {
        document["skills"]["Slash"].erase("key");
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Combo with an unknown step")
    {
        document["skills"]["Opener"]["combo"] = {"Charge", "Bladestorm"};
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Unknown active rotation")
    {
        document["active_rotation"] = "Cleave";
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Threshold outside [0, 1]")
    {
        document["detection_settings"]["template_threshold"] = 1.5;
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Unknown ability type")
    {
        document["skills"]["Slash"]["type"] = "channelled";
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("No class name")
    {
        document.erase("class_name");
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Class name that is a path")
    {
        document["class_name"] = "../escape";
        REQUIRE_THROWS_WITH(profile_loader::parse(document), Catch::Contains("path separators"));

        document["class_name"] = "..";
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Type names outside ASCII")
    {
        document["skills"]["Slash"]["type"] = "Sofortzauber\u00e4";
        REQUIRE_THROWS_AS(profile_loader::parse(document), ConfigError);
    }

    SECTION("Not JSON at all")
    {
        REQUIRE_THROWS_AS(profile_loader::loadString("{ skills: "), ConfigError);
    }
}

TEST_CASE("ProfileLoader - Files and directories", "[ProfileLoader]")
{
    TempDir dir("abilitysight_profiles_test");

    SECTION("Missing files throw")
    {
        REQUIRE_THROWS_AS(profile_loader::loadFile((dir.path / "missing.json").string()), ConfigError);
    }

    SECTION("Icon paths resolve against the file's directory")
    {
        std::string path = dir.write("warrior.json", WARRIOR);
        ClassProfile profile = profile_loader::loadFile(path);
        REQUIRE(findAbility(profile, "Slash").icon_path == (dir.path / "icons" / "slash.png").string());
    }

    SECTION("Bad files in a directory are skipped")
    {
        dir.write("a_warrior.json", WARRIOR);
        dir.write("b_broken.json", "{ \"class_name\": ");
        dir.write("c_mage.json", R"({ "class_name": "mage", "skills": { "Frostbolt": { "key": "1" } } })");
        dir.write("notes.txt", "not a profile");

        auto profiles = profile_loader::loadDirectory(dir.path.string());
        REQUIRE(profiles.size() == 2);
        REQUIRE(profiles[0].class_name == "warrior");
        REQUIRE(profiles[1].class_name == "mage");

        REQUIRE(profile_loader::loadPath(dir.path.string()).size() == 2);
    }

    SECTION("Saved profiles load again")
    {
        ClassProfile profile = profile_loader::loadString(WARRIOR, dir.path.string());
        std::string path = (dir.path / "saved.json").string();
        REQUIRE(profile_loader::saveFile(profile, path));

        ClassProfile reloaded = profile_loader::loadFile(path);
        REQUIRE(reloaded.class_name == "warrior");
        REQUIRE(reloaded.rotations.size() == 2);
    }
}

TEST_CASE("LayoutCache - Saved layouts need the same bar geometry", "[ProfileLoader]")
{
    TempDir dir("abilitysight_layout_test");
    std::string directory = dir.path.string();

    SkillBarMapping mapping = createBarMapping(cv::Rect(600, 980, 720, 72), 12);
    mapping.detected = {{0, "Slash"}, {4, "Charge"}};
    REQUIRE(cache::layout::save("warrior", mapping, directory));

    std::map<int, std::string> layout;

    SECTION("Same geometry")
    {
        REQUIRE(cache::layout::load("warrior", mapping.bar_region, 12, layout, directory));
        REQUIRE(layout == mapping.detected);
    }

    SECTION("Moved bar")
    {
        REQUIRE_FALSE(cache::layout::load("warrior", cv::Rect(0, 980, 720, 72), 12, layout, directory));
        REQUIRE(layout.empty());
    }

    SECTION("Different slot count")
    {
        REQUIRE_FALSE(cache::layout::load("warrior", mapping.bar_region, 10, layout, directory));
    }

    SECTION("Unknown class")
    {
        REQUIRE_FALSE(cache::layout::load("mage", mapping.bar_region, 12, layout, directory));
    }
}
