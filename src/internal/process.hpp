#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace quarry::internal::process {

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
        bool cancelled{false};
    };

    /*
     * Runs `args` (argv[0] resolved through PATH) with stdin on /dev/null, capturing both output streams.
     *
     * The child leads its own process group. On timeout or a stop request the whole group is SIGKILLed and
     * the child is reaped before returning, so nothing it spawned outlives the call. The deadline covers the
     * child's whole lifetime, including time spent after it closed its output. Throws std::runtime_error when the child cannot be
     * started at all; a missing executable surfaces as exit code 127.
     */
    subprocess_result run_subprocess(
            const std::vector<std::string>& args,
            std::optional<std::chrono::milliseconds> timeout = std::nullopt,
            std::stop_token stop = {});

}  // namespace quarry::internal::process
