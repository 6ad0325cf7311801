#pragma once

#include <string_view>
#include "policy/detector_battery.hpp"
#include "policy/verdict.hpp"

namespace prompt_guard::policy {

// First match wins: detectors run in battery order and evaluation stops at
// the first one that fires. Empty text is allowed without running any.
class DecisionEngine {
public:
    explicit DecisionEngine(const DetectorBattery& battery);

    Verdict evaluate(std::string_view text) const;

private:
    const DetectorBattery& battery_;
};

}  // namespace prompt_guard::policy
