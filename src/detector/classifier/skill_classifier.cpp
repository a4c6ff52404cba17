#include "skill_classifier.hpp"
#include "template_processing.hpp"
#include "overlay_processing.hpp"
#include "color_processing.hpp"
#include "utils/colors.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

using namespace cv;
using namespace std;

SkillClassifier::SkillClassifier(shared_ptr<CaptureSource> capture, bool debug)
    : capture_(move(capture)), debug_(debug)
{
}

bool SkillClassifier::captureRegion(const Rect &region, Mat &out)
{
    TimePoint taken_at;
    return captureRegion(region, out, taken_at);
}

bool SkillClassifier::captureRegion(const Rect &region, Mat &out, TimePoint &taken_at)
{
    bool ok = false;
    try
    {
        ok = capture_ && region.area() > 0 && capture_->captureWithTime(region, out, taken_at) && !out.empty();
    }
    catch (const cv::Exception &e)
    {
        log_warning("Capture raised an OpenCV error: " + string(e.what()));
        ok = false;
    }
    catch (const exception &e)
    {
        log_warning("Capture raised: " + string(e.what()));
        ok = false;
    }

    if (!ok)
    {
        lock_guard<mutex> lock(mutex_);
        stats_.capture_failures++;
    }
    return ok;
}

bool SkillClassifier::ensureTemplate(const Ability &ability, Mat &icon)
{
    if (!ability.icon_template.empty())
    {
        icon = ability.icon_template;
        return true;
    }

    if (ability.icon_path.empty())
        return false;

    string key = cacheKey(ability);
    {
        lock_guard<mutex> lock(mutex_);
        auto it = templates_.find(key);
        if (it != templates_.end())
        {
            stats_.cache_hits++;
            icon = it->second;
            return true;
        }

        // A failed load is reported once and not retried until the cache is cleared
        if (failed_templates_.count(key))
            return false;

        stats_.cache_misses++;
    }

    Mat loaded = imread(ability.icon_path, IMREAD_COLOR);

    lock_guard<mutex> lock(mutex_);
    if (loaded.empty())
    {
        if (failed_templates_.insert(key).second)
        {
            stats_.failed_loads++;
            log_error("Failed to load icon for " + log_string_src(ability.name) + " from " + ability.icon_path);
        }
        return false;
    }

    templates_[key] = loaded;
    icon = loaded;
    log_debug("Loaded icon for " + log_string_src(ability.name) + " (" + to_string(loaded.cols) + "x" +
              to_string(loaded.rows) + ")");
    return true;
}

void SkillClassifier::clearCache()
{
    lock_guard<mutex> lock(mutex_);
    templates_.clear();
    failed_templates_.clear();
    log_info("Template cache cleared");
}

MethodResult SkillClassifier::runMethod(DetectionMethod method, const Mat &region, const Mat &icon,
                                        const DetectionConfig &config) const
{
    switch (method)
    {
    case DetectionMethod::TEMPLATE_MATCH:
        return template_processing::classify(region, icon, config);
    case DetectionMethod::COOLDOWN_OVERLAY:
        return overlay_processing::classify(region, config);
    case DetectionMethod::COLOR_ANALYSIS:
        return color_processing::classify(region, config);
    }
    return MethodResult{};
}

DetectionResult SkillClassifier::classify(const Ability &ability, const Rect &region, const DetectionConfig &config)
{
    DetectionResult result;
    result.ability = ability.name;
    result.slot_index = ability.position.slot_index;
    result.region = region;

    Mat image;
    TimePoint taken_at;
    if (!captureRegion(region, image, taken_at))
    {
        log_debug("No capture for " + log_string_src(ability.name) + ", state unknown");
        return result;
    }

    result = classifyImage(ability, image, config, config.methods);
    result.region = region;
    result.observed_at = taken_at;
    return result;
}

DetectionResult SkillClassifier::classifyImage(const Ability &ability, const Mat &image, const DetectionConfig &config,
                                               const vector<DetectionMethod> &methods)
{
    auto start = chrono::steady_clock::now();

    DetectionResult result;
    result.ability = ability.name;
    result.slot_index = ability.position.slot_index;
    result.region = ability.position.region;

    Mat icon;
    if (!ensureTemplate(ability, icon))
        return result;

    Mat region = colors::toBgr(image);
    bool have_winner = false;
    MethodResult best;

    for (DetectionMethod method : methods)
    {
        MethodResult candidate;
        try
        {
            candidate = runMethod(method, region, icon, config);
        }
        catch (const cv::Exception &e)
        {
            log_warning(toString(method) + " failed for " + log_string_src(ability.name) + ": " + string(e.what()));
            lock_guard<mutex> lock(mutex_);
            stats_.errors++;
            continue;
        }
        catch (const exception &e)
        {
            log_warning(toString(method) + " failed for " + log_string_src(ability.name) + ": " + string(e.what()));
            lock_guard<mutex> lock(mutex_);
            stats_.errors++;
            continue;
        }

        if (method == DetectionMethod::TEMPLATE_MATCH)
            result.match_confidence = candidate.confidence;

        // Strictly better wins; an equal score goes to template matching
        bool better = !have_winner || candidate.confidence > best.confidence ||
                      (candidate.confidence == best.confidence && method == DetectionMethod::TEMPLATE_MATCH &&
                       best.method != DetectionMethod::TEMPLATE_MATCH);
        if (better)
        {
            best = candidate;
            have_winner = true;
        }
    }

    if (have_winner)
    {
        result.state = best.state;
        result.confidence = best.confidence;
        result.method = best.method;
    }

    result.detection_time_ms = chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
    recordDetection(result.detection_time_ms);

    log_debug(log_string_src(ability.name) + " -> " + toString(result.state) + " (" + toString(result.method) +
              ", confidence " + to_string(result.confidence) + ")");

    if (debug_)
        saveDebugCrop(ability, region, result);

    return result;
}

void SkillClassifier::recordDetection(double elapsed_ms)
{
    lock_guard<mutex> lock(mutex_);
    stats_.detections++;
    detection_times_.push_back(elapsed_ms);
    if (detection_times_.size() > 100)
        detection_times_.pop_front();

    stats_.avg_detection_ms = accumulate(detection_times_.begin(), detection_times_.end(), 0.0) / detection_times_.size();
}

void SkillClassifier::saveDebugCrop(const Ability &ability, const Mat &region, const DetectionResult &result)
{
    uint64_t index;
    {
        lock_guard<mutex> lock(mutex_);
        index = debug_counter_++;
    }

    if (index == 0 && system("mkdir -p debug_frames/classifier") != 0)
        log_warning("Could not create debug_frames/classifier");

    string path = "debug_frames/classifier/" + ability.name + "_" + toString(result.state) + "_" + to_string(index) + ".png";
    if (!imwrite(path, region))
        log_warning("Could not write " + path);
}

ClassifierStats SkillClassifier::stats() const
{
    lock_guard<mutex> lock(mutex_);
    ClassifierStats copy = stats_;
    copy.cached_templates = templates_.size();
    return copy;
}

float SkillClassifier::optimizeThreshold(const vector<DetectionResult> &history, float current) const
{
    vector<float> confidences;
    for (const auto &result : history)
    {
        if (!result.ability.empty() && result.match_confidence > 0.0f)
            confidences.push_back(result.match_confidence);
    }

    if (confidences.empty())
        return current;

    sort(confidences.begin(), confidences.end());

    // 5th percentile, linearly interpolated
    double position = 0.05 * (confidences.size() - 1);
    size_t lower = static_cast<size_t>(position);
    size_t upper = std::min(lower + 1, confidences.size() - 1);
    double fraction = position - lower;
    float percentile = static_cast<float>(confidences[lower] + (confidences[upper] - confidences[lower]) * fraction);

    float suggested = std::min(current, std::max(0.6f, percentile));
    log_info("Suggested template threshold " + to_string(suggested) + " from " + log_string(confidences.size()) + " matches");
    return suggested;
}
