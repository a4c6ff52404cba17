#pragma once

#include "../skill_types.hpp"

// Outcome of one classification method on one captured region
struct MethodResult
{
    AbilityState state = AbilityState::UNKNOWN;
    float confidence = 0.0f;
    DetectionMethod method = DetectionMethod::TEMPLATE_MATCH;
};
