#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace prompt_guard::policy {

class DecisionEngine;

struct Allowed {};

struct AllowedWithNotice {
    std::string notice;
};

// Only DecisionEngine can block a submission.
class Blocked {
public:
    const std::string& detector_id() const { return detector_id_; }
    const std::string& warning() const { return warning_; }

private:
    friend class DecisionEngine;

    Blocked(std::string detector_id, std::string warning)
        : detector_id_(std::move(detector_id)), warning_(std::move(warning)) {}

    std::string detector_id_;
    std::string warning_;
};

using Verdict = std::variant<Allowed, AllowedWithNotice, Blocked>;

inline bool allows_submission(const Verdict& verdict) {
    return !std::holds_alternative<Blocked>(verdict);
}

inline std::optional<std::string> message_of(const Verdict& verdict) {
    if (const auto* notice = std::get_if<AllowedWithNotice>(&verdict)) {
        return notice->notice;
    }
    if (const auto* blocked = std::get_if<Blocked>(&verdict)) {
        return blocked->warning();
    }
    return std::nullopt;
}

inline std::string to_string(const Verdict& verdict) {
    if (std::holds_alternative<Allowed>(verdict)) {
        return "allowed";
    }
    if (std::holds_alternative<AllowedWithNotice>(verdict)) {
        return "allowed_with_notice";
    }
    return "blocked";
}

}  // namespace prompt_guard::policy
