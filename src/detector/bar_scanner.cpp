#include "bar_scanner.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>

using namespace cv;
using namespace std;

BarScanner::BarScanner(shared_ptr<SkillClassifier> classifier, bool debug)
    : classifier_(move(classifier)), debug_(debug)
{
}

map<int, DetectionResult> BarScanner::scan(SkillBarMapping &mapping, ReadinessModel &model, const DetectionConfig &config)
{
    map<int, DetectionResult> results;
    auto scan_start = chrono::steady_clock::now();

    // Identity always comes from the template score
    vector<DetectionMethod> methods = config.methods;
    if (find(methods.begin(), methods.end(), DetectionMethod::TEMPLATE_MATCH) == methods.end())
        methods.insert(methods.begin(), DetectionMethod::TEMPLATE_MATCH);

    vector<Ability> candidates;
    for (const auto &ability : model.snapshot())
    {
        if (!ability.enabled)
            continue;

        Mat icon;
        if (!classifier_->ensureTemplate(ability, icon))
        {
            log_debug("Skipping " + log_string_src(ability.name) + ": no icon loaded");
            continue;
        }
        candidates.push_back(ability);
    }

    log_debug("Scanning " + log_string(mapping.slot_regions.size()) + " slots against " +
              log_string(candidates.size()) + " icons");

    for (size_t i = 0; i < mapping.slot_regions.size(); i++)
    {
        int slot = static_cast<int>(i);
        const Rect &slot_region = mapping.slot_regions[i];

        try
        {
            Mat image;
            TimePoint observed_at;
            if (!classifier_->captureRegion(slot_region, image, observed_at))
            {
                log_debug("Slot " + to_string(slot) + " could not be captured");
                continue;
            }

            DetectionResult best;
            bool have_best = false;

            for (const auto &ability : candidates)
            {
                DetectionResult result = classifier_->classifyImage(ability, image, config, methods);
                if (!have_best || result.match_confidence > best.match_confidence)
                {
                    best = result;
                    have_best = true;
                }
            }

            if (debug_)
                saveDebugSlot(slot, image, have_best ? &best : nullptr);

            if (!have_best || best.match_confidence < config.template_threshold)
                continue;

            best.slot_index = slot;
            best.region = slot_region;
            best.observed_at = observed_at;
            results[slot] = best;

            model.updateState(best.ability, best.state, best.confidence, observed_at);
        }
        catch (const cv::Exception &e)
        {
            slot_errors_++;
            log_warning("Slot " + to_string(slot) + " skipped after OpenCV error: " + string(e.what()));
        }
        catch (const exception &e)
        {
            slot_errors_++;
            log_warning("Slot " + to_string(slot) + " skipped: " + string(e.what()));
        }
    }

    // An ability that matched several slots is bound to the one it matched best
    map<string, const DetectionResult *> best_slot;
    for (const auto &entry : results)
    {
        const DetectionResult &result = entry.second;
        auto it = best_slot.find(result.ability);
        if (it == best_slot.end() || result.match_confidence > it->second->match_confidence)
            best_slot[result.ability] = &result;
    }

    TimePoint now = Clock::now();
    for (const auto &entry : best_slot)
        bind(mapping, model, *entry.second);

    mapping.updateScanTime(now);

    double elapsed_ms = chrono::duration<double, milli>(chrono::steady_clock::now() - scan_start).count();
    log_info("Bar scan found " + log_string(results.size()) + " abilities in " + to_string((int)elapsed_ms) + " ms");

    return results;
}

void BarScanner::bind(SkillBarMapping &mapping, ReadinessModel &model, const DetectionResult &result)
{
    int slot = result.slot_index;

    // Layout changed: the previous occupant of this slot loses its position
    auto occupant = mapping.detected.find(slot);
    if (occupant != mapping.detected.end() && occupant->second != result.ability)
    {
        Ability previous;
        if (model.get(occupant->second, previous) && previous.position.slot_index == slot)
        {
            model.clearPosition(occupant->second);
            log_info(log_string_src(occupant->second) + " no longer in slot " + to_string(slot));
        }
    }

    // The ability moved away from its old slot
    for (auto it = mapping.detected.begin(); it != mapping.detected.end();)
    {
        if (it->first != slot && it->second == result.ability)
            it = mapping.detected.erase(it);
        else
            ++it;
    }

    mapping.detected[slot] = result.ability;

    SlotPosition position;
    position.slot_index = slot;
    position.region = result.region;
    model.setPosition(result.ability, position);

    log_debug("Bound " + log_string_src(result.ability) + " to slot " + to_string(slot) + " (match " +
              to_string(result.match_confidence) + ")");
}

void BarScanner::saveDebugSlot(int slot, const Mat &image, const DetectionResult *best)
{
    if (system("mkdir -p debug_frames/scanner") != 0)
    {
        log_warning("Could not create debug_frames/scanner");
        return;
    }

    string label = best ? best->ability + "_" + to_string((int)(best->match_confidence * 100)) : "empty";
    string path = "debug_frames/scanner/slot_" + to_string(slot) + "_" + label + ".png";
    if (!imwrite(path, image))
        log_warning("Could not write " + path);
}
