#pragma once

#include <exception>
#include <istream>
#include <ostream>
#include <string>
#include "core/errors/guard_errors.hpp"
#include "policy/decision_engine.hpp"
#include "policy/detector_battery.hpp"
#include "policy/verdict.hpp"

namespace prompt_guard::runtime {

core::errors::Result<std::string> read_payload(std::istream& in);

// Maps a failure to an allow-with-notice verdict. Failures never block.
policy::Verdict make_failure_verdict(const core::errors::GuardError& error);

// Same mapping for an exception that escaped the hook, whatever its type.
policy::Verdict make_exception_verdict(std::exception_ptr failure);

class HookRunner {
public:
    explicit HookRunner(const policy::DetectorBattery& battery);

    policy::Verdict run_payload(const std::string& raw) const;
    policy::Verdict run(std::istream& in) const;

    // Writes exactly one encoded response for the payload read from `in`.
    bool respond(std::istream& in, std::ostream& out) const;

private:
    policy::DecisionEngine engine_;
};

bool write_response(const policy::Verdict& verdict, std::ostream& out);

}  // namespace prompt_guard::runtime
