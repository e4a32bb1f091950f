#pragma once

#include "program.hpp"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <optional>
#include <ranges>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quarry {

    inline constexpr uint32_t default_max_instructions = 100U;
    inline constexpr std::chrono::seconds default_decompile_timeout{30};
    inline constexpr auto unknown_program_name = "unknown"sv;

    struct function_record {
        std::string name{};
        std::string entry_point{};
        std::string signature{};
        std::string body_range{};

        bool operator==(const function_record&) const = default;
    };

    struct symbol_record {
        std::string name{};
        std::string address{};
        std::string type{};
        std::string source{};

        bool operator==(const symbol_record&) const = default;
    };

    struct instruction_record {
        std::string address{};
        std::string mnemonic{};
        std::string operands{};
        std::string bytes{};
        std::string comment{};

        bool operator==(const instruction_record&) const = default;
    };

    struct decompiled_function {
        std::string name{};
        std::string entry_point{};
        std::string code{};
        std::string signature{};
        std::string body{};

        bool operator==(const decompiled_function&) const = default;
    };

    struct analysis_report {
        std::string program_name{};
        std::string entry_point{};
        std::optional<decompiled_function> entry_function{};
        std::vector<function_record> functions{};
        std::vector<symbol_record> symbols{};
        std::vector<instruction_record> disassembly{};
        std::string image_base{};
        std::string language{};

        bool operator==(const analysis_report&) const = default;
    };

    struct error_report {
        bool error{true};
        std::string message{};
        std::string traceback{};
        std::string program_name{unknown_program_name};

        bool operator==(const error_report&) const = default;
    };

    struct mutation_result {
        bool success{false};
        std::string message{};

        bool operator==(const mutation_result&) const = default;
    };

    // Either shape is a complete top-level document; consumers tell them apart by the error flag.
    using report_document = std::variant<analysis_report, error_report>;

    // Entry point resolution: first external entry, else the image's minimum address.
    address resolve_entry_point(const program_model& model);

    // Function catalog
    function_record make_function_record(const function_info& function);
    std::vector<function_record> enumerate_functions(const program_model& model);
    std::optional<function_info> find_function_containing(const program_model& model, address addr);

    // Symbol catalog; external symbols are dropped, engine order is kept
    symbol_record make_symbol_record(const symbol_info& symbol);
    std::vector<symbol_record> enumerate_symbols(const program_model& model);

    /*
     * Disassembly walker
     *
     * Decodes one instruction at a time starting at `start`, advancing by each decoded length. Stops after
     * `max_instructions` records, at the first address without an instruction, or when the cursor cannot
     * advance. Never throws for a gap; engine faults propagate.
     */
    std::vector<instruction_record> walk_disassembly(
            const program_model& model, address start, uint32_t max_instructions = default_max_instructions);

    // "55 48 89 e5"; each element is masked to 8 bits so signed byte representations render as 00-ff
    template <std::ranges::input_range R>
        requires std::integral<std::ranges::range_value_t<R>>
    std::string format_instruction_bytes(R&& bytes) {
        static constexpr auto hex_digits = "0123456789abcdef"sv;
        std::string out{};
        for (auto value : bytes) {
            auto byte = static_cast<uint8_t>(static_cast<unsigned>(value) & 0xffU);
            if (!out.empty()) {
                out.push_back(' ');
            }
            out.push_back(hex_digits[byte >> 4U]);
            out.push_back(hex_digits[byte & 0x0fU]);
        }
        return out;
    }

    /*
     * Decompilation adapter
     *
     * Returns nullopt without touching the decompiler when `function` is absent. Timeouts, cancellation,
     * decompiler failure, empty output and decompiler exceptions all degrade to nullopt. `stop` is forwarded
     * to the decompiler, which reports cancellation through its own status.
     */
    std::optional<decompiled_function> decompile_function(
            decompiler_service& decompiler,
            const std::optional<function_info>& function,
            std::chrono::seconds timeout = default_decompile_timeout,
            bool verbose = false,
            std::stop_token stop = {});

    struct report_options {
        uint32_t max_instructions{default_max_instructions};
        std::chrono::seconds decompile_timeout{default_decompile_timeout};
        bool verbose{false};
        std::stop_token stop{};
    };

    /*
     * Top-level orchestrator
     *
     * assemble() runs the fixed pipeline (entry, containing function, decompile, functions, symbols,
     * disassembly) and never throws: any fault aborts the remaining stages and yields an error_report.
     * The decompiler is optional; without one the entry function is always absent.
     */
    class report_assembler {
      public:
        report_assembler(const program_model& model, decompiler_service* decompiler, report_options options = {});

        report_document assemble() const;

      private:
        analysis_report build() const;

        const program_model& model;
        decompiler_service* decompiler;
        report_options options;
    };

    // Best-effort program name; `unknown_program_name` when the model is missing or fails
    std::string safe_program_name(const program_model* model);

    // Message chain of `error` and every nested exception, one per line, prefixed with `stage`
    std::string describe_exception(const std::exception& error, std::string_view stage);

    error_report make_error_report(const program_model* model, const std::exception& error, std::string_view stage);

    // Consumer-side lookups on a report
    std::optional<function_record> find_function_by_name(const analysis_report& report, std::string_view name);
    std::optional<function_record> find_function_at(const analysis_report& report, address addr);
    std::vector<symbol_record> find_symbols_at(const analysis_report& report, address addr);

}  // namespace quarry
