#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace quarry::cli {

    // nullopt means continue to run(); otherwise the process exit code (2 on invalid input)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Applies a JSON config file onto `cfg`; throws std::runtime_error on unreadable or invalid files
    void apply_config_file(const std::filesystem::path& path, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

    /*
     * Loads the engine for cfg.input_path, performs the requested command, and writes exactly one framed
     * document to `out`. Load faults become an error report (or a failed mutation result) rather than a missing
     * document. Returns 0 once a document is written, 1 when a requested save fails, 2 without an input.
     */
    int run(const startup_config& cfg, std::ostream& out, std::ostream& err);

}  // namespace quarry::cli
