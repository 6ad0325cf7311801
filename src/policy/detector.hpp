#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <re2/re2.h>
#include "core/errors/guard_errors.hpp"

namespace prompt_guard::policy {

enum class CaseMode {
    Sensitive,
    Insensitive
};

enum class RuleKind {
    Single,       // primary found anywhere
    Ordered,      // secondary found at or after the end of the first primary match
    CoOccurring   // primary and secondary both found anywhere
};

struct PatternSpec {
    std::string expression;
    CaseMode case_mode = CaseMode::Sensitive;
};

struct PatternRule {
    RuleKind kind = RuleKind::Single;
    PatternSpec primary;
    std::optional<PatternSpec> secondary;
};

// Alternative shapes of one detector; any of them matching is a match.
using PatternGroup = std::vector<PatternRule>;

struct DetectorSpec {
    std::string id;
    PatternGroup rules;
    std::string warning;
};

// PatternRule compiled to RE2 programs. Patterns are UTF-8: classes and
// counts apply to code points, and matching time is linear in the text.
class CompiledRule {
public:
    static core::errors::Result<CompiledRule> compile(const PatternRule& rule);

    bool matches(std::string_view text) const;

private:
    CompiledRule(RuleKind kind, std::shared_ptr<const re2::RE2> primary,
                 std::shared_ptr<const re2::RE2> secondary);

    RuleKind kind_;
    std::shared_ptr<const re2::RE2> primary_;
    std::shared_ptr<const re2::RE2> secondary_;
};

// A detector fires when any rule of its pattern group matches.
class Detector {
public:
    static core::errors::Result<Detector> compile(const DetectorSpec& spec);

    const std::string& id() const { return id_; }
    const std::string& warning() const { return warning_; }
    std::size_t rule_count() const { return rules_.size(); }

    bool matches(std::string_view text) const;

private:
    Detector(std::string id, std::vector<CompiledRule> rules,
             std::string warning);

    std::string id_;
    std::vector<CompiledRule> rules_;
    std::string warning_;
};

}  // namespace prompt_guard::policy
