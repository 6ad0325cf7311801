#pragma once
#include <optional>
#include <string>

namespace prompt_guard::protocol {

    // The part of the hook payload the filter reads; other fields are ignored.
    struct HookRequest {
        std::optional<std::string> prompt;
    };

    // Serialized as {"continue": ..., "user_message": ...}; user_message is
    // omitted when there is nothing to show.
    struct HookResponse {
        bool continue_submission = true;
        std::optional<std::string> user_message;
    };

    namespace fields {
        inline constexpr const char* kPrompt = "prompt";
        inline constexpr const char* kContinue = "continue";
        inline constexpr const char* kUserMessage = "user_message";
    }

} // namespace prompt_guard::protocol
