#pragma once

#include "config.hpp"
#include "memory_program.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

    /*
     * Toolchain engine
     *
     * Imports an object file or executable into a memory_program by running nm and objdump and parsing their
     * text output. Both GNU binutils and LLVM output shapes are accepted. The importer never decodes machine
     * code itself.
     */

    enum class binary_format { unknown, elf, pe, macho };

    inline constexpr std::string_view to_string(binary_format format) {
        switch (format) {
            case binary_format::unknown:
                return "unknown"sv;
            case binary_format::elf:
                return "ELF"sv;
            case binary_format::pe:
                return "PE"sv;
            case binary_format::macho:
                return "Mach-O"sv;
        }
        return "unknown"sv;
    }

    // PE needs "MZ" plus the "PE\0\0" signature at e_lfanew; a bare "MZ" prefix is `unknown`
    binary_format detect_binary_format(std::string_view leading_bytes);
    // unreadable or short files are `unknown`
    binary_format detect_binary_format(const std::filesystem::path& path);

    struct toolchain_options {
        std::filesystem::path nm_path{"llvm-nm"};
        std::filesystem::path objdump_path{"llvm-objdump"};
        asm_syntax syntax{asm_syntax::intel};
        int tool_timeout_ms{60'000};
        bool verbose{false};
    };

    // One line of `nm -P` output
    struct nm_entry {
        std::string name{};
        std::string demangled{};
        char kind{};
        std::optional<address> value{};
        uint64_t size{};

        bool is_undefined() const noexcept { return kind == 'U' || kind == 'w' || kind == 'v'; }
        bool is_text() const noexcept { return kind == 'T' || kind == 't' || kind == 'W'; }
        bool is_data() const noexcept;
    };

    std::vector<nm_entry> parse_nm_output(std::string_view text);

    // `objdump -f`
    struct objdump_file_header {
        std::string file_format{};
        std::string architecture{};
        std::optional<address> start_address{};
    };

    objdump_file_header parse_objdump_file_header(std::string_view text);

    // Ghidra-style language id for an objdump architecture and file format; "unknown:<arch>" otherwise
    std::string language_id_for(const objdump_file_header& header);
    uint32_t pointer_size_for(const objdump_file_header& header);

    struct objdump_instruction {
        address addr{};
        std::vector<uint8_t> bytes{};
        std::string mnemonic{};
        std::string operands{};
        std::string comment{};
    };

    // `objdump -d` listing; GNU continuation lines are folded into the instruction they continue
    std::vector<objdump_instruction> parse_objdump_disassembly(std::string_view text);

    std::vector<std::string> make_nm_command(const toolchain_options& options, const std::filesystem::path& binary);
    std::vector<std::string> make_objdump_header_command(
            const toolchain_options& options, const std::filesystem::path& binary);
    std::vector<std::string> make_objdump_disassembly_command(
            const toolchain_options& options, const std::filesystem::path& binary, bool x86_target);

    // Builds a program from parsed tool output; exposed so imports can be checked without running the tools
    std::unique_ptr<memory_program> build_imported_program(
            std::string program_name,
            const objdump_file_header& header,
            const std::vector<nm_entry>& symbols,
            const std::vector<objdump_instruction>& listing,
            bool verbose = false);

    // Runs the tools against `binary`; throws std::runtime_error when a tool cannot run or fails
    std::unique_ptr<memory_program> import_binary(const std::filesystem::path& binary, const toolchain_options& options);

    /*
     * External decompiler
     *
     * Runs `command` once per function. The command is split on whitespace; the placeholders {binary},
     * {address} and {name} are substituted in every argument. When neither {binary} nor {address} appears,
     * the binary path and the entry address are appended. Standard output is the decompiled text.
     */
    class external_decompiler final : public decompiler_service {
      public:
        external_decompiler(std::string command, std::filesystem::path binary, bool verbose = false);

        std::vector<std::string> command_for(const function_info& function) const;

        void open(const program_model& model) override;
        decompile_result decompile(
                const function_info& function, std::chrono::seconds timeout, std::stop_token stop) override;

      private:
        std::string command_template;
        std::filesystem::path binary_path;
        bool verbose;
        bool opened{false};
    };

}  // namespace quarry
