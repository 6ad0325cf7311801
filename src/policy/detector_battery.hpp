#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "core/errors/guard_errors.hpp"
#include "policy/detector.hpp"

namespace prompt_guard::policy {

namespace detector_ids {
inline constexpr const char* kApiKey = "api_key";
inline constexpr const char* kPassword = "password";
inline constexpr const char* kSecretToken = "secret_token";
inline constexpr const char* kCredentialPair = "credential_pair";
inline constexpr const char* kEmailPassword = "email_password";
}  // namespace detector_ids

// Declarative rule table for the built-in detectors, in evaluation order.
std::vector<DetectorSpec> default_detector_specs();

// Immutable ordered collection of detectors. Order decides which warning
// is reported when several detectors would match.
class DetectorBattery {
public:
    using const_iterator = std::vector<Detector>::const_iterator;

    static core::errors::Result<DetectorBattery> build(
        const std::vector<DetectorSpec>& specs);
    static core::errors::Result<DetectorBattery> build_default();

    std::size_t size() const { return detectors_.size(); }
    bool empty() const { return detectors_.empty(); }
    const Detector& at(std::size_t index) const { return detectors_.at(index); }
    const Detector* find(const std::string& id) const;

    const_iterator begin() const { return detectors_.begin(); }
    const_iterator end() const { return detectors_.end(); }

private:
    explicit DetectorBattery(std::vector<Detector> detectors);

    std::vector<Detector> detectors_;
};

}  // namespace prompt_guard::policy
