#pragma once

#include "memory_program.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace quarry {

    /*
     * Program database
     *
     * A JSON snapshot of a memory_program plus any decompilations recorded for it. The loader validates the
     * schema_version and replays every record through the memory_program population calls, so a database
     * that violates the model's invariants (overlapping units, entry outside its body, ...) fails to load
     * with the offending record named.
     */

    struct loaded_program {
        std::unique_ptr<memory_program> program{};
        // empty when no function in the database carries a decompilation
        std::unique_ptr<memory_decompiler> decompiler{};
    };

    loaded_program parse_program_database(std::string_view json, std::string_view origin = "<memory>");
    loaded_program load_program_database(const std::filesystem::path& path);

    std::string serialize_program_database(const memory_program& program, const memory_decompiler* decompiler);
    void save_program_database(
            const std::filesystem::path& path, const memory_program& program, const memory_decompiler* decompiler);

}  // namespace quarry
