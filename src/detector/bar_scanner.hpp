#pragma once

#include <atomic>
#include <map>
#include <memory>
#include "classifier/skill_classifier.hpp"
#include "readiness_model.hpp"

using namespace std;

// Finds which ability sits in which slot of the bar
class BarScanner
{
public:
    explicit BarScanner(shared_ptr<SkillClassifier> classifier, bool debug = false);

    // One pass over every slot of `mapping`. Slots whose best identity score stays under
    // the template threshold are absent from the result. Winners are bound into `mapping`
    // and their positions written to `model`; a slot taken over by another ability
    // unbinds its previous occupant.
    map<int, DetectionResult> scan(SkillBarMapping &mapping, ReadinessModel &model, const DetectionConfig &config);

    uint64_t slotErrors() const { return slot_errors_; }

private:
    void bind(SkillBarMapping &mapping, ReadinessModel &model, const DetectionResult &result);
    void saveDebugSlot(int slot, const cv::Mat &image, const DetectionResult *best);

    shared_ptr<SkillClassifier> classifier_;
    bool debug_;
    atomic<uint64_t> slot_errors_{0};
};
