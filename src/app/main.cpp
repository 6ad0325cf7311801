#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/invocation_id.hpp"
#include "core/errors/guard_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/detector_battery.hpp"
#include "policy/verdict.hpp"
#include "runtime/hook_runner.hpp"

namespace {

using prompt_guard::core::errors::ErrorCategory;
using prompt_guard::core::errors::GuardError;

// Every path ends here: the host always gets a response and a zero exit.
int answer(const prompt_guard::policy::Verdict& verdict) {
    prompt_guard::runtime::write_response(verdict, std::cout);
    return 0;
}

int run_hook(int argc, char* argv[]) {
    auto& logger = prompt_guard::core::logging::Logger::get();
    logger.set_invocation_id(prompt_guard::core::config::generate_invocation_id());

    // 1. Options. A bad flag is logged and ignored; the hook still answers.
    prompt_guard::app::cli::HookOptions options;
    auto parsed = prompt_guard::app::cli::parse_and_validate(argc, argv);
    if (prompt_guard::core::errors::is_error(parsed)) {
        const auto& err = prompt_guard::core::errors::get_error(parsed);
        LOG_WARN("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_WARN("Hint: " + err.hint);
        }
    } else {
        options = prompt_guard::core::errors::get_value(parsed);
    }

    if (options.verbose) {
        logger.set_min_level(prompt_guard::core::logging::LogLevel::DEBUG);
    }
    if (options.show_help) {
        std::cerr << prompt_guard::app::cli::usage();
        return answer(prompt_guard::policy::Allowed{});
    }

    // 2. Detector battery
    auto battery = prompt_guard::policy::DetectorBattery::build_default();
    if (prompt_guard::core::errors::is_error(battery)) {
        const auto& err = prompt_guard::core::errors::get_error(battery);
        LOG_ERROR("Failed to build detectors [" + err.code + "]: " + err.message);
        return answer(prompt_guard::runtime::make_failure_verdict(err));
    }
    LOG_DEBUG("Detectors ready: " +
              std::to_string(prompt_guard::core::errors::get_value(battery).size()));

    // 3. Evaluate the payload
    const prompt_guard::runtime::HookRunner runner(
        prompt_guard::core::errors::get_value(battery));
    if (options.input_file.has_value()) {
        std::ifstream in(options.input_file.value(), std::ios::binary);
        if (!in.is_open()) {
            const GuardError err{ErrorCategory::Input,
                                 "Unable to open input file: " +
                                     options.input_file->string(),
                                 "input_open_failed"};
            LOG_ERROR("Input error [" + err.code + "]: " + err.message);
            return answer(prompt_guard::runtime::make_failure_verdict(err));
        }
        runner.respond(in, std::cout);
        return 0;
    }

    runner.respond(std::cin, std::cout);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        return run_hook(argc, argv);
    } catch (...) {
        return answer(prompt_guard::runtime::make_exception_verdict(std::current_exception()));
    }
}
