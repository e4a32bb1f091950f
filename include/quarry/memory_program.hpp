#pragma once

#include "program.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quarry {

    struct program_metadata {
        std::string name{};
        address image_base{};
        // derived from the lowest populated address when unset
        std::optional<address> min_address{};
        std::string language_id{};
        uint32_t pointer_size{8U};
    };

    struct comment_entry {
        address addr{};
        comment_kind kind{comment_kind::eol};
        std::string text{};
    };

    /*
     * In-memory program model
     *
     * Backs both the program database loader and the toolchain importer, and is the engine the tests run
     * against. Functions, instructions and data are keyed by address and iterate in ascending address order;
     * symbols iterate in insertion order, which is the order their source listed them.
     */
    class memory_program final : public program_model {
      public:
        explicit memory_program(program_metadata metadata);

        // population; each throws engine_error on a conflicting entry
        void add_entry_point(address addr);
        void add_function(function_info function);
        uint64_t add_symbol(symbol_info symbol);
        void add_instruction(instruction_info instruction);
        void set_comment(address addr, comment_kind kind, std::string text);
        void add_data(data_info data);
        void register_type(std::string name, uint64_t size);

        const program_metadata& metadata() const noexcept { return info; }
        std::vector<instruction_info> instructions() const;
        std::vector<comment_entry> comments() const;
        std::vector<data_info> defined_data() const;
        std::vector<data_type> registered_types() const;

        std::string name() const override;
        address image_base() const override;
        address min_address() const override;
        std::string language_id() const override;

        std::vector<address> external_entry_points() const override;

        std::vector<function_info> functions() const override;
        std::optional<function_info> function_containing(address addr) const override;

        std::vector<symbol_info> symbols() const override;
        std::vector<symbol_info> symbols_at(address addr) const override;
        void rename_symbol(const symbol_info& symbol, std::string_view new_name, source_type source) override;

        std::optional<instruction_info> instruction_at(address addr) const override;
        std::optional<std::string> comment_at(address addr, comment_kind kind) const override;
        std::optional<data_info> data_at(address addr) const override;
        void create_data(address addr, const data_type& type) override;

        std::optional<address> parse_address(std::string_view text) const override;
        std::optional<data_type> parse_data_type(std::string_view text) const override;

      private:
        std::optional<address> lowest_populated_address() const;
        void check_unit_free(address addr, uint64_t size, std::optional<address> ignore_data) const;

        program_metadata info;
        std::vector<address> entry_points{};
        std::map<address, function_info> functions_by_entry{};
        std::vector<symbol_info> symbol_table{};
        uint64_t next_symbol_id{1U};
        std::map<address, instruction_info> listing{};
        std::map<std::pair<address, comment_kind>, std::string> comment_table{};
        std::map<address, data_info> data_units{};
        std::map<std::string, uint64_t, std::less<>> user_types{};
    };

    struct canned_decompilation {
        decompile_status status{decompile_status::completed};
        std::string code{};
        std::string signature{};
    };

    // Serves decompilations recorded ahead of time, keyed by function entry
    class memory_decompiler final : public decompiler_service {
      public:
        void add(address entry, canned_decompilation decompilation);

        const std::map<address, canned_decompilation>& entries() const noexcept { return table; }

        bool is_open() const noexcept { return opened; }

        void open(const program_model& model) override;
        decompile_result decompile(
                const function_info& function, std::chrono::seconds timeout, std::stop_token stop) override;

      private:
        std::map<address, canned_decompilation> table{};
        bool opened{false};
    };

}  // namespace quarry
