#include "quarry/toolchain.hpp"

#include "quarry/format.hpp"

#include "internal/process.hpp"
#include "internal/symbols.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>

using namespace quarry::literals;

namespace quarry {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr std::string_view trim_left(std::string_view text) noexcept {
            while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
                text.remove_prefix(1U);
            }
            return text;
        }

        static constexpr bool is_hex_token(std::string_view token) noexcept {
            return !token.empty() && token.size() % 2U == 0U && std::ranges::all_of(token, utils::is_hex_digit);
        }

        static std::string to_lower_ascii(std::string_view text) {
            std::string lower{text};
            std::ranges::transform(lower, lower.begin(), utils::char_tolower);
            return lower;
        }

        // "1e622820" is an instruction word; memory order is little-endian
        static void append_byte_token(std::vector<uint8_t>& bytes, std::string_view token) {
            for (size_t i = token.size(); i >= 2U; i -= 2U) {
                auto value = utils::parse_arithmetic<uint8_t>(token.substr(i - 2U, 2U), 16);
                bytes.push_back(value.value_or(0U));
            }
        }

        // offset of an objdump annotation ("# 2004 <x>", "// =0x10", "; 0x8")
        static size_t find_comment_start(std::string_view text) {
            for (size_t i = 0U; i + 1U < text.size(); ++i) {
                if (text[i] != ' ' && text[i] != '\t') {
                    continue;
                }
                auto tail = text.substr(i + 1U);
                if (tail.starts_with("# "sv) || tail.starts_with("// "sv) || tail.starts_with("; "sv)) {
                    return i;
                }
            }
            return std::string_view::npos;
        }

        static void split_instruction_text(std::string_view text, objdump_instruction& out) {
            text = utils::trim_view(text);
            if (auto comment = find_comment_start(text); comment != std::string_view::npos) {
                auto tail = utils::trim_view(text.substr(comment));
                auto marker = tail.find(' ');
                out.comment = std::string{utils::trim_view(tail.substr(marker + 1U))};
                text = utils::trim_view(text.substr(0U, comment));
            }

            auto split = text.find_first_of(" \t"sv);
            if (split == std::string_view::npos) {
                out.mnemonic = std::string{text};
                return;
            }
            out.mnemonic = std::string{text.substr(0U, split)};
            out.operands = std::string{utils::trim_view(text.substr(split + 1U))};
        }

        // "ns::foo(int) const" -> "ns::foo"; "Foo::operator()(int)" -> "Foo::operator()"
        static std::string strip_parameter_list(std::string_view demangled) {
            auto close = demangled.rfind(')');
            if (close == std::string_view::npos) {
                return std::string{demangled};
            }
            int depth = 0;
            for (size_t i = close + 1U; i-- > 0U;) {
                if (demangled[i] == ')') {
                    ++depth;
                }
                else if (demangled[i] == '(') {
                    if (--depth == 0) {
                        return i == 0U ? std::string{demangled} : std::string{demangled.substr(0U, i)};
                    }
                }
            }
            return std::string{demangled};
        }

        static std::string sanitize_symbol_name(std::string name) {
            std::ranges::replace_if(
                    name, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }, '_');
            return name;
        }

        static std::string undefined_type_for(uint64_t size) {
            if (size == 1U || size == 2U || size == 4U || size == 8U) {
                return "undefined{}"_format(size);
            }
            return "undefined1[{}]"_format(size);
        }

        static void note(bool verbose, std::string_view message) {
            if (verbose) {
                std::cerr << "note: " << message << '\n';
            }
        }

        static void replace_all(std::string& text, std::string_view from, std::string_view to) {
            size_t pos = 0U;
            while ((pos = text.find(from, pos)) != std::string::npos) {
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
        }

        static std::string first_line(std::string_view text) {
            text = utils::trim_view(text);
            return std::string{text.substr(0U, text.find('\n'))};
        }

        // first line declaring a function, with any opening brace dropped
        static std::string extract_signature(std::string_view code) {
            for (auto line : utils::split_lines(code)) {
                line = utils::trim_view(line);
                if (line.empty() || line.starts_with("//"sv) || line.starts_with("/*"sv) || line.starts_with("*"sv)) {
                    continue;
                }
                if (line.find('(') == std::string_view::npos) {
                    return {};
                }
                if (line.ends_with('{')) {
                    line.remove_suffix(1U);
                }
                return std::string{utils::trim_view(line)};
            }
            return {};
        }

        // DOS header: "MZ" ... e_lfanew (little-endian u32 at 0x3c) -> "PE\0\0"
        inline constexpr size_t dos_header_size = 0x40U;
        inline constexpr size_t e_lfanew_offset = 0x3cU;
        inline constexpr auto pe_signature = "PE\0\0"sv;

        static std::optional<size_t> pe_header_offset(std::string_view dos_header) {
            if (dos_header.size() < dos_header_size) {
                return std::nullopt;
            }
            uint32_t offset = 0U;
            for (size_t i = 4U; i-- > 0U;) {
                offset = (offset << 8U) | static_cast<uint8_t>(dos_header[e_lfanew_offset + i]);
            }
            if (offset < dos_header_size) {
                return std::nullopt;
            }
            return size_t{offset};
        }

        static bool uses_llvm_objdump(const fs::path& objdump_path) {
            return objdump_path.filename().string().find("llvm") != std::string::npos;
        }

        static internal::process::subprocess_result run_tool(
                const std::vector<std::string>& command, const toolchain_options& options) {
            debug_log("running ", command.front());
            auto result = internal::process::run_subprocess(command, std::chrono::milliseconds{options.tool_timeout_ms});
            if (result.timed_out) {
                throw std::runtime_error(
                        "{} timed out after {}ms"_format(command.front(), options.tool_timeout_ms));
            }
            if (result.exit_code == 127 && result.stdout_output.empty()) {
                throw std::runtime_error("unable to run {}"_format(command.front()));
            }
            return result;
        }

    }  // namespace detail

    bool nm_entry::is_data() const noexcept {
        constexpr std::string_view data_kinds = "DdBbRrGgSsV";
        return data_kinds.find(kind) != std::string_view::npos;
    }

    binary_format detect_binary_format(std::string_view leading_bytes) {
        constexpr auto elf_magic = "\x7f"
                                   "ELF"sv;
        if (leading_bytes.starts_with(elf_magic)) {
            return binary_format::elf;
        }
        if (leading_bytes.starts_with("MZ"sv)) {
            auto offset = detail::pe_header_offset(leading_bytes);
            if (offset && *offset + 4U <= leading_bytes.size() &&
                leading_bytes.substr(*offset, 4U) == detail::pe_signature) {
                return binary_format::pe;
            }
            return binary_format::unknown;
        }
        if (leading_bytes.size() >= 4U) {
            uint32_t magic = 0U;
            for (size_t i = 0U; i < 4U; ++i) {
                magic = (magic << 8U) | static_cast<uint8_t>(leading_bytes[i]);
            }
            constexpr std::array<uint32_t, 4> macho_magics{0xfeedfaceU, 0xfeedfacfU, 0xcefaedfeU, 0xcffaedfeU};
            if (std::ranges::find(macho_magics, magic) != macho_magics.end()) {
                return binary_format::macho;
            }
        }
        return binary_format::unknown;
    }

    binary_format detect_binary_format(const std::filesystem::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return binary_format::unknown;
        }
        std::array<char, detail::dos_header_size> header{};
        in.read(header.data(), static_cast<std::streamsize>(header.size()));
        std::string_view leading{header.data(), static_cast<size_t>(in.gcount())};
        if (!leading.starts_with("MZ"sv)) {
            return detect_binary_format(leading);
        }

        // the PE signature usually sits past the DOS stub, so it is read where e_lfanew points
        auto offset = detail::pe_header_offset(leading);
        if (!offset) {
            return binary_format::unknown;
        }
        in.clear();
        in.seekg(static_cast<std::streamoff>(*offset));
        std::array<char, 4> signature{};
        in.read(signature.data(), static_cast<std::streamsize>(signature.size()));
        if (in.gcount() != static_cast<std::streamsize>(signature.size()) ||
            std::string_view{signature.data(), signature.size()} != detail::pe_signature) {
            return binary_format::unknown;
        }
        return binary_format::pe;
    }

    std::vector<nm_entry> parse_nm_output(std::string_view text) {
        std::vector<nm_entry> entries{};
        for (auto line : utils::split_lines(text)) {
            auto tokens = internal::symbols::split_whitespace_tokens(utils::trim_view(line));
            // archive member headers ("lib.a[x.o]:") and blank lines carry no kind column
            if (tokens.size() < 2U || tokens[1].size() != 1U) {
                continue;
            }

            nm_entry entry{
                    .name = std::string{tokens[0]},
                    .demangled = internal::symbols::demangle_symbol_name(
                            internal::symbols::strip_symbol_addendum(tokens[0])),
                    .kind = tokens[1].front()};
            if (tokens.size() >= 3U && !entry.is_undefined()) {
                if (auto value = utils::parse_hex_u64(tokens[2])) {
                    entry.value = address{*value};
                }
            }
            if (tokens.size() >= 4U) {
                entry.size = utils::parse_hex_u64(tokens[3]).value_or(0U);
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    objdump_file_header parse_objdump_file_header(std::string_view text) {
        objdump_file_header header{};
        for (auto line : utils::split_lines(text)) {
            line = utils::trim_view(line);
            if (auto pos = line.find("file format"sv); pos != std::string_view::npos) {
                header.file_format = std::string{utils::trim_view(line.substr(pos + "file format"sv.size()))};
            }
            else if (line.starts_with("architecture:"sv)) {
                auto value = line.substr("architecture:"sv.size());
                header.architecture = std::string{utils::trim_view(value.substr(0U, value.find(',')))};
            }
            else if (line.starts_with("start address"sv)) {
                auto value = utils::trim_view(line.substr("start address"sv.size()));
                if (value.starts_with(':')) {
                    value = utils::trim_view(value.substr(1U));
                }
                if (auto start = utils::parse_hex_u64(value)) {
                    header.start_address = address{*start};
                }
            }
        }
        return header;
    }

    std::string language_id_for(const objdump_file_header& header) {
        auto arch = detail::to_lower_ascii(header.architecture);
        auto format = detail::to_lower_ascii(header.file_format);
        auto mentions = [&](std::string_view token) {
            return arch.find(token) != std::string::npos || format.find(token) != std::string::npos;
        };

        if (mentions("x86-64"sv) || mentions("x86_64"sv) || mentions("amd64"sv)) {
            return "x86:LE:64:default";
        }
        if (mentions("i386"sv) || mentions("i686"sv) || arch == "x86"sv) {
            return "x86:LE:32:default";
        }
        if (mentions("aarch64"sv) || mentions("arm64"sv)) {
            return "AARCH64:LE:64:v8A";
        }
        if (arch.starts_with("arm"sv) || mentions("littlearm"sv)) {
            return "ARM:LE:32:v8";
        }
        if (mentions("riscv64"sv)) {
            return "RISCV:LE:64:RV64GC";
        }
        return "unknown:{}"_format(arch.empty() ? format : arch);
    }

    uint32_t pointer_size_for(const objdump_file_header& header) {
        auto language = language_id_for(header);
        if (language.find(":64:"sv) != std::string::npos) {
            return 8U;
        }
        if (language.find(":32:"sv) != std::string::npos) {
            return 4U;
        }
        return header.file_format.find("64"sv) != std::string::npos ? 8U : 4U;
    }

    std::vector<objdump_instruction> parse_objdump_disassembly(std::string_view text) {
        std::vector<objdump_instruction> listing{};
        for (auto line : utils::split_lines(text)) {
            // instruction lines are indented; symbol headers ("0000000000001139 <main>:") are not
            if (line.empty() || (line.front() != ' ' && line.front() != '\t')) {
                continue;
            }
            auto body = detail::trim_left(line);
            auto colon = body.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            auto addr_text = body.substr(0U, colon);
            if (addr_text.empty() || !std::ranges::all_of(addr_text, utils::is_hex_digit)) {
                continue;
            }
            auto addr = utils::parse_hex_u64(addr_text);
            if (!addr) {
                continue;
            }

            objdump_instruction instruction{.addr = address{*addr}};
            auto rest = detail::trim_left(body.substr(colon + 1U));

            std::string_view byte_text{};
            std::string_view instruction_text{};
            if (auto tab = rest.find('\t'); tab != std::string_view::npos) {
                byte_text = rest.substr(0U, tab);
                instruction_text = rest.substr(tab + 1U);
            }
            else {
                // no tab: leading hex tokens are bytes, whatever follows is the instruction
                auto tokens = internal::symbols::split_whitespace_tokens(rest);
                size_t consumed = 0U;
                while (consumed < tokens.size() && detail::is_hex_token(tokens[consumed])) {
                    ++consumed;
                }
                if (consumed == tokens.size()) {
                    byte_text = rest;
                }
                else if (consumed > 0U) {
                    auto first = tokens[consumed].data() - rest.data();
                    byte_text = rest.substr(0U, static_cast<size_t>(first));
                    instruction_text = rest.substr(static_cast<size_t>(first));
                }
                else {
                    continue;
                }
            }

            bool bytes_ok = true;
            for (auto token : internal::symbols::split_whitespace_tokens(byte_text)) {
                if (!detail::is_hex_token(token)) {
                    bytes_ok = false;
                    break;
                }
                detail::append_byte_token(instruction.bytes, token);
            }
            if (!bytes_ok || instruction.bytes.empty()) {
                continue;
            }

            if (utils::trim_view(instruction_text).empty()) {
                // GNU wraps long encodings onto continuation lines that only carry bytes
                if (!listing.empty()) {
                    auto& previous = listing.back();
                    auto expected = previous.addr.advanced(previous.bytes.size());
                    if (expected && *expected == instruction.addr) {
                        previous.bytes.insert(previous.bytes.end(), instruction.bytes.begin(), instruction.bytes.end());
                    }
                }
                continue;
            }

            detail::split_instruction_text(instruction_text, instruction);
            listing.push_back(std::move(instruction));
        }
        return listing;
    }

    std::vector<std::string> make_nm_command(const toolchain_options& options, const std::filesystem::path& binary) {
        return {options.nm_path.string(), "-P", "-n", binary.string()};
    }

    std::vector<std::string> make_objdump_header_command(
            const toolchain_options& options, const std::filesystem::path& binary) {
        return {options.objdump_path.string(), "-f", binary.string()};
    }

    std::vector<std::string> make_objdump_disassembly_command(
            const toolchain_options& options, const std::filesystem::path& binary, bool x86_target) {
        std::vector<std::string> args{options.objdump_path.string(), "-d", "--demangle"};
        if (x86_target) {
            if (detail::uses_llvm_objdump(options.objdump_path)) {
                args.push_back("--x86-asm-syntax={}"_format(options.syntax));
            }
            else {
                args.emplace_back("-M");
                args.emplace_back(to_string(options.syntax));
            }
        }
        args.push_back(binary.string());
        return args;
    }

    std::unique_ptr<memory_program> build_imported_program(
            std::string program_name,
            const objdump_file_header& header,
            const std::vector<nm_entry>& symbols,
            const std::vector<objdump_instruction>& listing,
            bool verbose) {
        std::optional<address> lowest{};
        auto consider = [&lowest](address addr) {
            if (!lowest || addr < *lowest) {
                lowest = addr;
            }
        };
        for (const auto& instruction : listing) {
            consider(instruction.addr);
        }
        for (const auto& entry : symbols) {
            if (entry.value && (entry.is_text() || entry.is_data())) {
                consider(*entry.value);
            }
        }

        program_metadata metadata{
                .name = std::move(program_name),
                .image_base = address{lowest.value_or(address{}).offset & ~uint64_t{0xfff}},
                .language_id = language_id_for(header),
                .pointer_size = pointer_size_for(header)};
        auto program = std::make_unique<memory_program>(std::move(metadata));

        for (const auto& instruction : listing) {
            try {
                program->add_instruction(instruction_info{
                        .addr = instruction.addr,
                        .mnemonic = instruction.mnemonic,
                        .operands = instruction.operands,
                        .bytes = instruction.bytes,
                        .length = static_cast<uint32_t>(instruction.bytes.size())});
            } catch (const engine_error& e) {
                detail::note(verbose, "skipping instruction: {}"_format(e.what()));
                continue;
            }
            if (!instruction.comment.empty()) {
                program->set_comment(instruction.addr, comment_kind::eol, instruction.comment);
            }
        }

        std::set<address> function_entries{};
        for (const auto& entry : symbols) {
            if (!entry.is_text() || !entry.value || entry.size == 0U) {
                continue;
            }
            auto body = make_range(*entry.value, entry.size);
            if (!body || !function_entries.insert(*entry.value).second) {
                continue;
            }
            auto name = detail::sanitize_symbol_name(detail::strip_parameter_list(entry.demangled));
            auto signature =
                    entry.demangled.find('(') != std::string::npos ? entry.demangled : "{}()"_format(entry.demangled);
            try {
                program->add_function(function_info{
                        .name = std::move(name), .entry = *entry.value, .signature = signature, .body = {*body}});
            } catch (const engine_error& e) {
                detail::note(verbose, "skipping function: {}"_format(e.what()));
            }
        }

        for (const auto& entry : symbols) {
            bool external = entry.is_undefined() || !entry.value;
            symbol_info symbol{
                    .name = detail::sanitize_symbol_name(
                            entry.is_text() ? detail::strip_parameter_list(entry.demangled) : entry.demangled),
                    .addr = entry.value.value_or(address{}),
                    .kind = entry.is_text() ? symbol_kind::function
                          : entry.is_data() ? symbol_kind::data
                                            : symbol_kind::label,
                    .source = source_type::imported,
                    .is_external = external};
            if (symbol.name.empty()) {
                continue;
            }
            program->add_symbol(std::move(symbol));

            if (!external && entry.is_data() && entry.size > 0U) {
                auto type = program->parse_data_type(detail::undefined_type_for(entry.size));
                if (!type) {
                    continue;
                }
                try {
                    program->add_data(data_info{.addr = *entry.value, .type = std::move(*type)});
                } catch (const engine_error& e) {
                    detail::note(verbose, "skipping data: {}"_format(e.what()));
                }
            }
        }

        if (header.start_address &&
            (header.start_address->offset != 0U || program->instruction_at(*header.start_address))) {
            program->add_entry_point(*header.start_address);
        }

        return program;
    }

    std::unique_ptr<memory_program> import_binary(const std::filesystem::path& binary, const toolchain_options& options) {
        std::error_code ec{};
        if (!std::filesystem::is_regular_file(binary, ec) || ec) {
            throw std::runtime_error("input binary not found: {}"_format(binary.string()));
        }

        auto header_run = detail::run_tool(make_objdump_header_command(options, binary), options);
        if (header_run.exit_code != 0) {
            throw std::runtime_error(
                    "{} -f failed (exit {}): {}"_format(
                            options.objdump_path.string(),
                            header_run.exit_code,
                            detail::first_line(header_run.stderr_output)));
        }
        auto header = parse_objdump_file_header(header_run.stdout_output);
        detail::note(options.verbose, "{}: {} ({})"_format(binary.string(), header.file_format, header.architecture));

        std::vector<nm_entry> symbols{};
        auto nm_run = detail::run_tool(make_nm_command(options, binary), options);
        if (nm_run.exit_code == 0) {
            symbols = parse_nm_output(nm_run.stdout_output);
        }
        if (symbols.empty()) {
            // stripped images still carry a dynamic table
            auto dynamic_command = make_nm_command(options, binary);
            dynamic_command.insert(dynamic_command.end() - 1, "-D");
            auto dynamic_run = detail::run_tool(dynamic_command, options);
            if (dynamic_run.exit_code == 0) {
                symbols = parse_nm_output(dynamic_run.stdout_output);
            }
            else {
                detail::note(
                        options.verbose,
                        "no symbols read from {}: {}"_format(binary.string(), detail::first_line(dynamic_run.stderr_output)));
            }
        }

        bool x86_target = language_id_for(header).starts_with("x86"sv);
        auto disassembly_run = detail::run_tool(make_objdump_disassembly_command(options, binary, x86_target), options);
        if (disassembly_run.exit_code != 0) {
            throw std::runtime_error(
                    "{} -d failed (exit {}): {}"_format(
                            options.objdump_path.string(),
                            disassembly_run.exit_code,
                            detail::first_line(disassembly_run.stderr_output)));
        }
        auto listing = parse_objdump_disassembly(disassembly_run.stdout_output);

        return build_imported_program(binary.filename().string(), header, symbols, listing, options.verbose);
    }

    external_decompiler::external_decompiler(std::string command, std::filesystem::path binary, bool verbose)
            : command_template{std::move(command)}, binary_path{std::move(binary)}, verbose{verbose} {}

    std::vector<std::string> external_decompiler::command_for(const function_info& function) const {
        std::vector<std::string> args{};
        bool has_target_placeholder = false;
        for (auto token : internal::symbols::split_whitespace_tokens(command_template)) {
            std::string arg{token};
            if (arg.find("{binary}"sv) != std::string::npos || arg.find("{address}"sv) != std::string::npos) {
                has_target_placeholder = true;
            }
            detail::replace_all(arg, "{binary}"sv, binary_path.string());
            detail::replace_all(arg, "{address}"sv, function.entry.to_string());
            detail::replace_all(arg, "{name}"sv, function.name);
            args.push_back(std::move(arg));
        }
        if (!has_target_placeholder) {
            args.push_back(binary_path.string());
            args.push_back(function.entry.to_string());
        }
        return args;
    }

    void external_decompiler::open([[maybe_unused]] const program_model& model) {
        if (utils::trim_view(command_template).empty()) {
            throw engine_error("no decompiler command configured");
        }
        std::error_code ec{};
        if (!std::filesystem::exists(binary_path, ec) || ec) {
            throw engine_error("decompiler target not found: {}"_format(binary_path.string()));
        }
        opened = true;
    }

    decompile_result external_decompiler::decompile(
            const function_info& function, std::chrono::seconds timeout, std::stop_token stop) {
        if (!opened) {
            throw engine_error("decompiler is not open");
        }

        auto command = command_for(function);
        detail::note(verbose, "decompiling {} with {}"_format(function.name, command.front()));
        auto run = internal::process::run_subprocess(
                command, std::chrono::duration_cast<std::chrono::milliseconds>(timeout), std::move(stop));

        if (run.timed_out) {
            return decompile_result{
                    .status = decompile_status::timed_out,
                    .error_message = "timed out after {}s"_format(timeout.count())};
        }
        if (run.cancelled) {
            return decompile_result{.status = decompile_status::cancelled};
        }
        if (run.exit_code != 0) {
            return decompile_result{
                    .status = decompile_status::failed,
                    .error_message = "exit {}: {}"_format(run.exit_code, detail::first_line(run.stderr_output))};
        }

        auto signature = detail::extract_signature(run.stdout_output);
        return decompile_result{
                .status = decompile_status::completed,
                .code = std::move(run.stdout_output),
                .signature = std::move(signature)};
    }

}  // namespace quarry
