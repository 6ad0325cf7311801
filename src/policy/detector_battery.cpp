#include "policy/detector_battery.hpp"

#include <utility>

namespace prompt_guard::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

// Unicode whitespace: control separators plus every Z category code point.
const std::string kSpaceSet = R"(\t\n\x{0B}\f\r\x{1C}-\x{1F}\x{85}\p{Z})";
const std::string kSpace = "[" + kSpaceSet + "]";
const std::string kKeyChars = "[-A-Za-z0-9_]";
const std::string kPasswordChars = "[^" + kSpaceSet + R"("'])";
const std::string kPasswordLabel = u8"密碼";
const std::string kLoginLabel = u8"登入";

std::string operator_after(const std::string& label) {
    return label + kSpace + "*[:=]";
}

// label, optional whitespace, ':' or '=', optional whitespace and quote, then
// at least min_length value characters.
std::string assignment(const std::string& label, const std::string& value_chars,
                       const int min_length) {
    return operator_after(label) + kSpace + R"(*["']?)" + value_chars + "{" +
           std::to_string(min_length) + ",}";
}

PatternSpec insensitive(std::string expression) {
    return PatternSpec{std::move(expression), CaseMode::Insensitive};
}

PatternSpec sensitive(std::string expression) {
    return PatternSpec{std::move(expression), CaseMode::Sensitive};
}

PatternRule single(PatternSpec pattern) {
    return PatternRule{RuleKind::Single, std::move(pattern), std::nullopt};
}

PatternRule ordered(PatternSpec lead, PatternSpec follow) {
    return PatternRule{RuleKind::Ordered, std::move(lead), std::move(follow)};
}

PatternRule co_occurring(PatternSpec first, PatternSpec second) {
    return PatternRule{RuleKind::CoOccurring, std::move(first), std::move(second)};
}

DetectorSpec api_key_spec() {
    return DetectorSpec{
        detector_ids::kApiKey,
        {
            single(insensitive(assignment("api[-_]?key", kKeyChars, 20))),
            single(insensitive("api[-_]?key" + kSpace + "+" + kKeyChars + "{20,}")),
            single(sensitive("sk-[A-Za-z0-9]{32,}")),
            // Google keys are exactly 35 characters after the prefix.
            single(sensitive("AIza[-0-9A-Za-z_]{35}")),
            single(sensitive("AKIA[0-9A-Z]{16}")),
            // Base64-looking run; broad on purpose and prone to false positives.
            single(sensitive("[0-9a-zA-Z/+]{40}")),
        },
        u8"檢測到 API Key，請勿在提示中包含 API Key 等敏感資訊"};
}

PatternSpec password_assignment() {
    return insensitive(assignment("(password|pwd|pass)", kPasswordChars, 6));
}

DetectorSpec password_spec() {
    return DetectorSpec{
        detector_ids::kPassword,
        {
            single(password_assignment()),
            single(sensitive(assignment(kPasswordLabel, kPasswordChars, 6))),
        },
        u8"檢測到密碼資訊，請勿在提示中包含密碼等敏感資訊"};
}

DetectorSpec secret_token_spec() {
    return DetectorSpec{
        detector_ids::kSecretToken,
        {
            single(insensitive(assignment("secret", kKeyChars, 16))),
            single(insensitive(assignment("secret[-_ ]?key", kKeyChars, 16))),
            single(insensitive(assignment("token", kKeyChars, 20))),
        },
        u8"檢測到 Secret Key 或 Token，請勿在提示中包含此類敏感資訊"};
}

DetectorSpec credential_pair_spec() {
    return DetectorSpec{
        detector_ids::kCredentialPair,
        {
            ordered(insensitive(operator_after("username")),
                    insensitive(operator_after("password"))),
            ordered(insensitive(operator_after("account")),
                    insensitive(operator_after("password"))),
            ordered(sensitive(operator_after(kLoginLabel)),
                    sensitive(operator_after(kPasswordLabel))),
        },
        u8"檢測到帳號密碼組合，請勿在提示中包含帳號密碼等敏感資訊"};
}

DetectorSpec email_password_spec() {
    const std::string email = R"([-a-zA-Z0-9._%+]+@[-a-zA-Z0-9.]+\.[a-zA-Z]{2,})";
    return DetectorSpec{
        detector_ids::kEmailPassword,
        {
            co_occurring(sensitive(email),
                         insensitive(assignment("password", kPasswordChars, 6))),
        },
        u8"檢測到電子郵件和密碼組合，請勿在提示中包含此類敏感資訊"};
}

}  // namespace

std::vector<DetectorSpec> default_detector_specs() {
    return {api_key_spec(), password_spec(), secret_token_spec(),
            credential_pair_spec(), email_password_spec()};
}

DetectorBattery::DetectorBattery(std::vector<Detector> detectors)
    : detectors_(std::move(detectors)) {}

core::errors::Result<DetectorBattery> DetectorBattery::build(
    const std::vector<DetectorSpec>& specs) {
    std::vector<Detector> detectors;
    detectors.reserve(specs.size());
    for (const auto& spec : specs) {
        for (const auto& existing : detectors) {
            if (existing.id() == spec.id) {
                return GuardError{ErrorCategory::Internal,
                                  "Duplicate detector id: " + spec.id,
                                  "duplicate_detector"};
            }
        }

        auto compiled = Detector::compile(spec);
        if (core::errors::is_error(compiled)) {
            return core::errors::get_error(compiled);
        }
        detectors.push_back(std::move(core::errors::get_value(compiled)));
    }
    return DetectorBattery(std::move(detectors));
}

core::errors::Result<DetectorBattery> DetectorBattery::build_default() {
    return build(default_detector_specs());
}

const Detector* DetectorBattery::find(const std::string& id) const {
    for (const auto& detector : detectors_) {
        if (detector.id() == id) {
            return &detector;
        }
    }
    return nullptr;
}

}  // namespace prompt_guard::policy
