#pragma once

#include "analysis.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace quarry {

    using namespace std::string_view_literals;

    /*
     * Quarry Startup Config Options
     *
     * Input
     * - input_path: Program database (.json) or binary image to analyze.
     * - input: How input_path is read; automatic sniffs the file magic.
     * - config_path: Optional JSON config file applied before command-line flags.
     *
     * Toolchain engine
     * - nm_path / objdump_path: Symbol and disassembly tools used to import binaries.
     * - asm_syntax: Disassembly syntax flavor (intel or att) for x86 imports.
     * - tool_timeout_ms: Wall-clock budget per nm / objdump run.
     * - decompiler_command: External decompiler command template; empty disables decompilation of binaries.
     *
     * Report
     * - max_instructions: Disassembly walk bound from the entry point.
     * - decompile_timeout: Time box for decompiling the entry function.
     *
     * Mutations (mutually exclusive; either replaces the report)
     * - rename: Address and new name for the first symbol at that address.
     * - set_type: Address and type name for the data unit at that address.
     * - save_path: Write the program database back after the command ran.
     *
     * Introspection and output
     * - print_config: Print resolved startup config and exit.
     * - quiet/verbose: stderr verbosity; stdout only ever carries the document.
     */

    enum class input_kind { automatic, database, binary };
    enum class asm_syntax { intel, att };

    inline constexpr std::string_view to_string(input_kind kind) {
        switch (kind) {
            case input_kind::automatic:
                return "auto"sv;
            case input_kind::database:
                return "database"sv;
            case input_kind::binary:
                return "binary"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_input_kind(std::string_view text, input_kind& out) {
        if (utils::str_case_eq(text, "auto"sv) || utils::str_case_eq(text, "automatic"sv)) {
            out = input_kind::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "database"sv) || utils::str_case_eq(text, "db"sv)) {
            out = input_kind::database;
            return true;
        }
        if (utils::str_case_eq(text, "binary"sv) || utils::str_case_eq(text, "bin"sv)) {
            out = input_kind::binary;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(asm_syntax syntax) {
        switch (syntax) {
            case asm_syntax::intel:
                return "intel"sv;
            case asm_syntax::att:
                return "att"sv;
        }
        return "intel"sv;
    }

    inline constexpr bool try_parse_asm_syntax(std::string_view text, asm_syntax& out) {
        if (utils::str_case_eq(text, "intel"sv)) {
            out = asm_syntax::intel;
            return true;
        }
        if (utils::str_case_eq(text, "att"sv) || utils::str_case_eq(text, "at&t"sv)) {
            out = asm_syntax::att;
            return true;
        }
        return false;
    }

    struct rename_request {
        std::string address{};
        std::string new_name{};
    };

    struct set_type_request {
        std::string address{};
        std::string type_name{};
    };

    struct startup_config {
        std::optional<std::filesystem::path> input_path{};
        input_kind input{input_kind::automatic};
        std::optional<std::filesystem::path> config_path{};

        std::filesystem::path nm_path{"llvm-nm"};
        std::filesystem::path objdump_path{"llvm-objdump"};
        asm_syntax syntax{asm_syntax::intel};
        int tool_timeout_ms{60'000};
        std::string decompiler_command{};

        uint32_t max_instructions{default_max_instructions};
        std::chrono::seconds decompile_timeout{default_decompile_timeout};

        std::optional<rename_request> rename{};
        std::optional<set_type_request> set_type{};
        std::optional<std::filesystem::path> save_path{};

        bool print_config{false};
        bool quiet{false};
        bool verbose{false};
    };

}  // namespace quarry
