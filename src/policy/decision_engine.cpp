#include "policy/decision_engine.hpp"

#include "core/logging/logger.hpp"

namespace prompt_guard::policy {

DecisionEngine::DecisionEngine(const DetectorBattery& battery)
    : battery_(battery) {}

Verdict DecisionEngine::evaluate(std::string_view text) const {
    if (text.empty()) {
        LOG_DEBUG("Empty prompt, skipping detectors.");
        return Allowed{};
    }

    for (const auto& detector : battery_) {
        if (!detector.matches(text)) {
            continue;
        }
        LOG_INFO("Detector fired: " + detector.id());
        return Blocked(detector.id(), detector.warning());
    }

    LOG_DEBUG("No detector fired (" + std::to_string(battery_.size()) +
              " evaluated).");
    return Allowed{};
}

}  // namespace prompt_guard::policy
