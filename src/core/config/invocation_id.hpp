#pragma once
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <unistd.h>

namespace prompt_guard::core::config {

    // "hook-<pid>-<8 hex digits>". The pid lets stderr lines be matched to
    // the host's child process; the random part separates pid reuse.
    inline std::string generate_invocation_id() {
        std::random_device entropy;
        const auto suffix = static_cast<std::uint32_t>(entropy());

        char buffer[48];
        std::snprintf(buffer, sizeof(buffer), "hook-%ld-%08x",
                      static_cast<long>(::getpid()), static_cast<unsigned>(suffix));
        return buffer;
    }

} // namespace prompt_guard::core::config
