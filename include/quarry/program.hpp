#pragma once

#include "address.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

    using namespace std::string_view_literals;

    /*
     * Capability interface of the analysis engine
     *
     * The report pipeline and the mutation operations only ever see a program_model and, optionally, a
     * decompiler_service. Engines are expected to be fully analyzed before they are handed over; nothing here
     * triggers analysis.
     *
     * Faults while reading or writing engine state are reported as exceptions (engine_error or any other
     * std::exception). "Nothing there" is never an exception: lookups return std::nullopt or an empty vector.
     */

    class engine_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    enum class symbol_kind : uint8_t {
        function,
        label,
        data,
        namespace_scope,
        class_type,
        parameter,
        local_var,
        global_var,
        library,
    };

    inline constexpr std::string_view to_string(symbol_kind kind) {
        switch (kind) {
            case symbol_kind::function:
                return "Function"sv;
            case symbol_kind::label:
                return "Label"sv;
            case symbol_kind::data:
                return "Data"sv;
            case symbol_kind::namespace_scope:
                return "Namespace"sv;
            case symbol_kind::class_type:
                return "Class"sv;
            case symbol_kind::parameter:
                return "Parameter"sv;
            case symbol_kind::local_var:
                return "Local Var"sv;
            case symbol_kind::global_var:
                return "Global Var"sv;
            case symbol_kind::library:
                return "Library"sv;
        }
        return "Label"sv;
    }

    inline constexpr bool try_parse_symbol_kind(std::string_view text, symbol_kind& out) {
        constexpr symbol_kind all_kinds[] = {
                symbol_kind::function,
                symbol_kind::label,
                symbol_kind::data,
                symbol_kind::namespace_scope,
                symbol_kind::class_type,
                symbol_kind::parameter,
                symbol_kind::local_var,
                symbol_kind::global_var,
                symbol_kind::library};
        for (auto kind : all_kinds) {
            if (utils::str_case_eq(text, to_string(kind))) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    // How a symbol's name was established
    enum class source_type : uint8_t {
        default_source,
        analysis,
        imported,
        user_defined,
    };

    inline constexpr std::string_view to_string(source_type source) {
        switch (source) {
            case source_type::default_source:
                return "DEFAULT"sv;
            case source_type::analysis:
                return "ANALYSIS"sv;
            case source_type::imported:
                return "IMPORTED"sv;
            case source_type::user_defined:
                return "USER_DEFINED"sv;
        }
        return "DEFAULT"sv;
    }

    inline constexpr bool try_parse_source_type(std::string_view text, source_type& out) {
        if (utils::str_case_eq(text, "DEFAULT"sv)) {
            out = source_type::default_source;
            return true;
        }
        if (utils::str_case_eq(text, "ANALYSIS"sv)) {
            out = source_type::analysis;
            return true;
        }
        if (utils::str_case_eq(text, "IMPORTED"sv)) {
            out = source_type::imported;
            return true;
        }
        if (utils::str_case_eq(text, "USER_DEFINED"sv)) {
            out = source_type::user_defined;
            return true;
        }
        return false;
    }

    enum class comment_kind : uint8_t {
        eol,
        pre,
        post,
        plate,
        repeatable,
    };

    inline constexpr std::string_view to_string(comment_kind kind) {
        switch (kind) {
            case comment_kind::eol:
                return "eol"sv;
            case comment_kind::pre:
                return "pre"sv;
            case comment_kind::post:
                return "post"sv;
            case comment_kind::plate:
                return "plate"sv;
            case comment_kind::repeatable:
                return "repeatable"sv;
        }
        return "eol"sv;
    }

    inline constexpr bool try_parse_comment_kind(std::string_view text, comment_kind& out) {
        constexpr comment_kind all_kinds[] = {
                comment_kind::eol, comment_kind::pre, comment_kind::post, comment_kind::plate, comment_kind::repeatable};
        for (auto kind : all_kinds) {
            if (utils::str_case_eq(text, to_string(kind))) {
                out = kind;
                return true;
            }
        }
        return false;
    }

    struct function_info {
        std::string name{};
        address entry{};
        std::string signature{};
        std::vector<address_range> body{};
    };

    struct symbol_info {
        uint64_t id{};
        std::string name{};
        address addr{};
        symbol_kind kind{symbol_kind::label};
        source_type source{source_type::default_source};
        bool is_external{false};
    };

    struct instruction_info {
        address addr{};
        std::string mnemonic{};
        std::string operands{};
        std::vector<uint8_t> bytes{};
        // decoded length; the walker advances by this, not by bytes.size()
        uint32_t length{};
    };

    // Opaque engine type descriptor; only its name reaches reports
    struct data_type {
        std::string name{};
        uint64_t size{};

        bool operator==(const data_type&) const = default;
    };

    struct data_info {
        address addr{};
        data_type type{};
    };

    enum class decompile_status : uint8_t {
        completed,
        timed_out,
        cancelled,
        failed,
    };

    inline constexpr std::string_view to_string(decompile_status status) {
        switch (status) {
            case decompile_status::completed:
                return "completed"sv;
            case decompile_status::timed_out:
                return "timed_out"sv;
            case decompile_status::cancelled:
                return "cancelled"sv;
            case decompile_status::failed:
                return "failed"sv;
        }
        return "failed"sv;
    }

    inline constexpr bool try_parse_decompile_status(std::string_view text, decompile_status& out) {
        constexpr decompile_status all_statuses[] = {
                decompile_status::completed,
                decompile_status::timed_out,
                decompile_status::cancelled,
                decompile_status::failed};
        for (auto status : all_statuses) {
            if (utils::str_case_eq(text, to_string(status))) {
                out = status;
                return true;
            }
        }
        return false;
    }

    struct decompile_result {
        decompile_status status{decompile_status::failed};
        std::string code{};
        std::string signature{};
        std::string error_message{};
    };

    class program_model {
      public:
        virtual ~program_model() = default;

        // metadata
        virtual std::string name() const = 0;
        virtual address image_base() const = 0;
        virtual address min_address() const = 0;
        virtual std::string language_id() const = 0;

        virtual std::vector<address> external_entry_points() const = 0;

        // function manager; functions() iterates in the engine's layout order
        virtual std::vector<function_info> functions() const = 0;
        virtual std::optional<function_info> function_containing(address addr) const = 0;

        // symbol table; symbols() includes external symbols, flagged by is_external
        virtual std::vector<symbol_info> symbols() const = 0;
        virtual std::vector<symbol_info> symbols_at(address addr) const = 0;
        virtual void rename_symbol(const symbol_info& symbol, std::string_view new_name, source_type source) = 0;

        // listing
        virtual std::optional<instruction_info> instruction_at(address addr) const = 0;
        virtual std::optional<std::string> comment_at(address addr, comment_kind kind) const = 0;
        virtual std::optional<data_info> data_at(address addr) const = 0;
        virtual void create_data(address addr, const data_type& type) = 0;

        // address factory and type parser; malformed input yields nullopt
        virtual std::optional<address> parse_address(std::string_view text) const = 0;
        virtual std::optional<data_type> parse_data_type(std::string_view text) const = 0;
    };

    class decompiler_service {
      public:
        virtual ~decompiler_service() = default;

        virtual void open(const program_model& model) = 0;

        // Must honor both the timeout and the stop token and report which one ended the run via status.
        virtual decompile_result decompile(
                const function_info& function, std::chrono::seconds timeout, std::stop_token stop) = 0;
    };

}  // namespace quarry
