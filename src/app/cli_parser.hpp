#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/guard_errors.hpp"

namespace prompt_guard::app::cli {

    // Invocation options. None of them change what the detectors look for.
    struct HookOptions {
        std::optional<std::filesystem::path> input_file;
        bool verbose = false;
        bool show_help = false;
    };

    prompt_guard::core::errors::Result<HookOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
