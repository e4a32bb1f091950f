#pragma once

#include "quarry.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

#include <array>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace quarry::test::detail {
    namespace fs = std::filesystem;
    using namespace std::string_view_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_file(const fs::path& path, std::string_view text, bool executable = false) {
        {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            out << text;
        }
        if (executable) {
            ::chmod(path.c_str(), 0755);
        }
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    inline address at(uint64_t offset) {
        return address{offset};
    }

    /*
     * sample.bin
     *
     *   0x1000 main (10 bytes): push rbp / mov rbp, rsp / mov eax, 0 ; "return 0" / ret
     *   0x1010 helper (4 bytes): nop / nop / nop / ret
     *   0x2000 counter: int, 0x2008 buffer: undefined1[8]
     *   puts: external
     */
    inline std::unique_ptr<memory_program> make_sample_program() {
        auto program = std::make_unique<memory_program>(program_metadata{
                .name = "sample.bin", .image_base = at(0x1000), .language_id = "x86:LE:64:default"});

        program->add_entry_point(at(0x1000));
        program->add_function(function_info{
                .name = "main",
                .entry = at(0x1000),
                .signature = "int main(void)",
                .body = {*make_range(at(0x1000), 10U)}});
        program->add_function(function_info{
                .name = "helper",
                .entry = at(0x1010),
                .signature = "void helper(void)",
                .body = {*make_range(at(0x1010), 4U)}});

        program->add_instruction(instruction_info{.addr = at(0x1000), .mnemonic = "PUSH", .operands = "RBP", .bytes = {0x55}});
        program->add_instruction(instruction_info{
                .addr = at(0x1001), .mnemonic = "MOV", .operands = "RBP,RSP", .bytes = {0x48, 0x89, 0xe5}});
        program->add_instruction(instruction_info{
                .addr = at(0x1004), .mnemonic = "MOV", .operands = "EAX,0x0", .bytes = {0xb8, 0x00, 0x00, 0x00, 0x00}});
        program->add_instruction(instruction_info{.addr = at(0x1009), .mnemonic = "RET", .bytes = {0xc3}});
        for (uint64_t offset = 0x1010; offset < 0x1013; ++offset) {
            program->add_instruction(instruction_info{.addr = at(offset), .mnemonic = "NOP", .bytes = {0x90}});
        }
        program->add_instruction(instruction_info{.addr = at(0x1013), .mnemonic = "RET", .bytes = {0xc3}});
        program->set_comment(at(0x1004), comment_kind::eol, "return 0");
        program->set_comment(at(0x1000), comment_kind::plate, "entry");

        program->add_symbol(symbol_info{
                .name = "main", .addr = at(0x1000), .kind = symbol_kind::function, .source = source_type::imported});
        program->add_symbol(symbol_info{
                .name = "helper", .addr = at(0x1010), .kind = symbol_kind::function, .source = source_type::analysis});
        program->add_symbol(symbol_info{
                .name = "puts",
                .addr = at(0x0),
                .kind = symbol_kind::function,
                .source = source_type::imported,
                .is_external = true});
        program->add_symbol(symbol_info{
                .name = "counter", .addr = at(0x2000), .kind = symbol_kind::data, .source = source_type::imported});

        program->add_data(data_info{.addr = at(0x2000), .type = {.name = "int", .size = 4U}});
        program->add_data(data_info{.addr = at(0x2008), .type = {.name = "undefined1[8]", .size = 8U}});
        return program;
    }

    inline std::unique_ptr<memory_decompiler> make_sample_decompiler() {
        auto decompiler = std::make_unique<memory_decompiler>();
        decompiler->add(
                at(0x1000),
                canned_decompilation{.code = "int main(void)\n{\n  return 0;\n}\n", .signature = "int main(void)"});
        return decompiler;
    }

    enum class fault_point { none, name, entry_points, functions, symbols, instruction_at, rename, create_data };

    /*
     * Delegates to an inner model and raises engine_error from one chosen capability. Also counts how often the
     * type parser is reached.
     */
    class faulting_program : public program_model {
      public:
        faulting_program(program_model& inner, fault_point fault) : inner{inner}, fault{fault} {}

        mutable int parse_data_type_calls{0};
        // raise a non-std value instead of engine_error
        bool raise_foreign{false};

        std::string name() const override {
            raise_if(fault_point::name);
            return inner.name();
        }
        address image_base() const override { return inner.image_base(); }
        address min_address() const override { return inner.min_address(); }
        std::string language_id() const override { return inner.language_id(); }

        std::vector<address> external_entry_points() const override {
            raise_if(fault_point::entry_points);
            return inner.external_entry_points();
        }

        std::vector<function_info> functions() const override {
            raise_if(fault_point::functions);
            return inner.functions();
        }
        std::optional<function_info> function_containing(address addr) const override {
            return inner.function_containing(addr);
        }

        std::vector<symbol_info> symbols() const override {
            raise_if(fault_point::symbols);
            return inner.symbols();
        }
        std::vector<symbol_info> symbols_at(address addr) const override { return inner.symbols_at(addr); }
        void rename_symbol(const symbol_info& symbol, std::string_view new_name, source_type source) override {
            raise_if(fault_point::rename);
            inner.rename_symbol(symbol, new_name, source);
        }

        std::optional<instruction_info> instruction_at(address addr) const override {
            raise_if(fault_point::instruction_at);
            return inner.instruction_at(addr);
        }
        std::optional<std::string> comment_at(address addr, comment_kind kind) const override {
            return inner.comment_at(addr, kind);
        }
        std::optional<data_info> data_at(address addr) const override { return inner.data_at(addr); }
        void create_data(address addr, const data_type& type) override {
            raise_if(fault_point::create_data);
            inner.create_data(addr, type);
        }

        std::optional<address> parse_address(std::string_view text) const override {
            return inner.parse_address(text);
        }
        std::optional<data_type> parse_data_type(std::string_view text) const override {
            ++parse_data_type_calls;
            return inner.parse_data_type(text);
        }

      private:
        void raise_if(fault_point point) const {
            if (fault == point) {
                if (raise_foreign) {
                    throw 42;
                }
                throw engine_error("injected fault");
            }
        }

        program_model& inner;
        fault_point fault;
    };

    // Records every request and answers with a fixed result
    class scripted_decompiler final : public decompiler_service {
      public:
        explicit scripted_decompiler(decompile_result result) : result{std::move(result)} {}

        int open_calls{0};
        int decompile_calls{0};
        bool throw_on_decompile{false};
        bool throw_foreign_on_decompile{false};
        bool throw_on_open{false};
        std::chrono::seconds last_timeout{};

        void open(const program_model&) override {
            ++open_calls;
            if (throw_on_open) {
                throw engine_error("decompiler unavailable");
            }
        }

        decompile_result decompile(
                const function_info&, std::chrono::seconds timeout, std::stop_token) override {
            ++decompile_calls;
            last_timeout = timeout;
            if (throw_foreign_on_decompile) {
                throw 42;
            }
            if (throw_on_decompile) {
                throw engine_error("decompiler crashed");
            }
            return result;
        }

      private:
        decompile_result result;
    };

}  // namespace quarry::test::detail
