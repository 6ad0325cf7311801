#include "cli_parser.hpp"
#include <system_error>
#include <utility>
#include <vector>

namespace prompt_guard::app::cli {

    using namespace prompt_guard::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> input;
        bool verbose = false;
        bool help = false;
    };

    std::string usage() {
        return "Usage: prompt_guard [--input <payload.json>] [--verbose] [--help]\n"
               "Reads a hook payload {\"prompt\": \"...\"} from stdin (or --input)\n"
               "and writes {\"continue\": bool, \"user_message\": \"...\"} to stdout.\n";
    }

    Result<HookOptions> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--input") {
                if (i + 1 < args.size()) raw.input = args[++i];
                else return GuardError{ErrorCategory::Input, "Missing value for --input", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return GuardError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", "Run with --help for usage."};
            }
        }

        // 3. Validator Phase
        HookOptions options;
        options.verbose = raw.verbose;
        options.show_help = raw.help;

        if (raw.input) {
            std::filesystem::path p(raw.input.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return GuardError{ErrorCategory::Input, "Input file does not exist: " + p.string(), "invalid_path"};
            }

            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return GuardError{ErrorCategory::Input, "Input path is not a regular file: " + p.string(), "invalid_path"};
            }
            options.input_file = std::move(p);
        }

        return options;
    }

} // namespace prompt_guard::app::cli
