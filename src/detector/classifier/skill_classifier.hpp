#pragma once

#include <opencv2/opencv.hpp>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "capture/capture_source.hpp"
#include "method_result.hpp"

using namespace std;

struct ClassifierStats
{
    uint64_t detections = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t failed_loads = 0;
    uint64_t capture_failures = 0;
    uint64_t errors = 0;
    double avg_detection_ms = 0.0; // Over the last 100 detections
    size_t cached_templates = 0;
};

// Decides the readiness state of one ability from the pixels of one region
class SkillClassifier
{
public:
    explicit SkillClassifier(shared_ptr<CaptureSource> capture, bool debug = false);
    virtual ~SkillClassifier() = default;

    // Capture `region` and classify it. Capture or template failures yield UNKNOWN with confidence 0.
    virtual DetectionResult classify(const Ability &ability, const cv::Rect &region, const DetectionConfig &config);

    // Classify an already captured image of a slot
    virtual DetectionResult classifyImage(const Ability &ability, const cv::Mat &image, const DetectionConfig &config,
                                          const vector<DetectionMethod> &methods);

    bool captureRegion(const cv::Rect &region, cv::Mat &out);
    bool captureRegion(const cv::Rect &region, cv::Mat &out, TimePoint &taken_at);

    // Reference icon for `ability`, loading it once from disk on a cache miss
    virtual bool ensureTemplate(const Ability &ability, cv::Mat &icon);

    void clearCache();

    ClassifierStats stats() const;

    // Suggested template threshold from recent positive matches, never applied implicitly
    float optimizeThreshold(const vector<DetectionResult> &history, float current) const;

    void setDebug(bool debug) { debug_ = debug; }

private:
    MethodResult runMethod(DetectionMethod method, const cv::Mat &region, const cv::Mat &icon,
                           const DetectionConfig &config) const;
    void recordDetection(double elapsed_ms);
    void saveDebugCrop(const Ability &ability, const cv::Mat &region, const DetectionResult &result);

    static string cacheKey(const Ability &ability) { return ability.name + "|" + ability.icon_path; }

    shared_ptr<CaptureSource> capture_;
    bool debug_;

    mutable mutex mutex_;
    map<string, cv::Mat> templates_;
    set<string> failed_templates_;
    deque<double> detection_times_;
    ClassifierStats stats_;
    uint64_t debug_counter_ = 0;
};
