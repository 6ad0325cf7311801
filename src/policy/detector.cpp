#include "policy/detector.hpp"

#include <utility>

namespace prompt_guard::policy {

using core::errors::ErrorCategory;
using core::errors::GuardError;

namespace {

core::errors::Result<std::shared_ptr<const re2::RE2>> compile_pattern(
    const PatternSpec& spec) {
    re2::RE2::Options options;
    options.set_log_errors(false);
    options.set_case_sensitive(spec.case_mode == CaseMode::Sensitive);

    auto pattern = std::make_shared<const re2::RE2>(spec.expression, options);
    if (!pattern->ok()) {
        return GuardError{ErrorCategory::Internal,
                          "Invalid pattern '" + spec.expression + "': " +
                              pattern->error(),
                          "pattern_compile_failed"};
    }
    return pattern;
}

re2::StringPiece piece(std::string_view text) {
    return re2::StringPiece(text.data(), text.size());
}

bool search(std::string_view text, const re2::RE2& pattern) {
    return re2::RE2::PartialMatch(piece(text), pattern);
}

}  // namespace

CompiledRule::CompiledRule(RuleKind kind, std::shared_ptr<const re2::RE2> primary,
                           std::shared_ptr<const re2::RE2> secondary)
    : kind_(kind),
      primary_(std::move(primary)),
      secondary_(std::move(secondary)) {}

core::errors::Result<CompiledRule> CompiledRule::compile(const PatternRule& rule) {
    if (rule.kind != RuleKind::Single && !rule.secondary.has_value()) {
        return GuardError{ErrorCategory::Internal,
                          "Rule '" + rule.primary.expression +
                              "' needs a second pattern.",
                          "incomplete_rule"};
    }

    auto primary = compile_pattern(rule.primary);
    if (core::errors::is_error(primary)) {
        return core::errors::get_error(primary);
    }

    std::shared_ptr<const re2::RE2> secondary;
    if (rule.kind != RuleKind::Single) {
        auto compiled = compile_pattern(rule.secondary.value());
        if (core::errors::is_error(compiled)) {
            return core::errors::get_error(compiled);
        }
        secondary = core::errors::get_value(compiled);
    }

    return CompiledRule(rule.kind, core::errors::get_value(primary),
                        std::move(secondary));
}

bool CompiledRule::matches(std::string_view text) const {
    switch (kind_) {
        case RuleKind::Single:
            return search(text, *primary_);
        case RuleKind::Ordered: {
            re2::StringPiece lead;
            if (!primary_->Match(piece(text), 0, text.size(), re2::RE2::UNANCHORED,
                                 &lead, 1)) {
                return false;
            }
            const auto consumed =
                static_cast<std::size_t>(lead.data() - text.data()) + lead.size();
            return search(text.substr(consumed), *secondary_);
        }
        case RuleKind::CoOccurring:
            return search(text, *primary_) && search(text, *secondary_);
    }
    return false;
}

Detector::Detector(std::string id, std::vector<CompiledRule> rules,
                   std::string warning)
    : id_(std::move(id)), rules_(std::move(rules)), warning_(std::move(warning)) {}

core::errors::Result<Detector> Detector::compile(const DetectorSpec& spec) {
    if (spec.id.empty()) {
        return GuardError{ErrorCategory::Internal, "Detector id cannot be empty.",
                          "invalid_detector"};
    }
    if (spec.rules.empty()) {
        return GuardError{ErrorCategory::Internal,
                          "Detector '" + spec.id + "' has no rules.",
                          "invalid_detector"};
    }

    std::vector<CompiledRule> rules;
    rules.reserve(spec.rules.size());
    for (const auto& rule : spec.rules) {
        auto compiled = CompiledRule::compile(rule);
        if (core::errors::is_error(compiled)) {
            auto error = core::errors::get_error(compiled);
            error.message = "Detector '" + spec.id + "': " + error.message;
            return error;
        }
        rules.push_back(std::move(core::errors::get_value(compiled)));
    }

    return Detector(spec.id, std::move(rules), spec.warning);
}

bool Detector::matches(std::string_view text) const {
    for (const auto& rule : rules_) {
        if (rule.matches(text)) {
            return true;
        }
    }
    return false;
}

}  // namespace prompt_guard::policy
