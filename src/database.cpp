#include "quarry/database.hpp"

#include "quarry/analysis.hpp"
#include "quarry/format.hpp"
#include "quarry/utils.hpp"

#include "internal/files.hpp"
#include "internal/types.hpp"

#include <stdexcept>

using namespace quarry::literals;

namespace quarry {

    namespace detail {

        using internal::persisted_program;

        static address require_address(std::string_view text, std::string_view field, std::string_view origin) {
            auto addr = parse_address(text);
            if (!addr) {
                throw std::runtime_error("invalid address '{}' for {} in {}"_format(text, field, origin));
            }
            return *addr;
        }

        static std::vector<uint8_t> parse_byte_string(std::string_view text, std::string_view origin) {
            std::vector<uint8_t> bytes{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto next = text.find(' ', cursor);
                if (next == std::string_view::npos) {
                    next = text.size();
                }
                auto token = text.substr(cursor, next - cursor);
                cursor = next + 1U;
                if (token.empty()) {
                    continue;
                }
                auto value = token.size() == 2U ? utils::parse_hex_u64(token) : std::nullopt;
                if (!value) {
                    throw std::runtime_error("invalid instruction byte '{}' in {}"_format(token, origin));
                }
                bytes.push_back(static_cast<uint8_t>(*value));
            }
            return bytes;
        }

        static void load_function(
                const internal::persisted_function& entry,
                memory_program& program,
                memory_decompiler& decompiler,
                std::string_view origin) {
            function_info function{
                    .name = entry.name,
                    .entry = require_address(entry.entry_point, "function entry_point", origin),
                    .signature = entry.signature};
            for (const auto& range : entry.body) {
                auto start = require_address(range.start, "body start", origin);
                auto end = require_address(range.end, "body end", origin);
                if (end < start) {
                    throw std::runtime_error(
                            "body range of {} ends before it starts in {}"_format(entry.name, origin));
                }
                function.body.push_back(address_range{.start = start, .end = end});
            }
            if (function.signature.empty()) {
                function.signature = function.name + "()";
            }

            if (entry.decompiled) {
                decompile_status status{};
                if (!try_parse_decompile_status(entry.decompiled->status, status)) {
                    throw std::runtime_error(
                            "invalid decompile status '{}' for {} in {}"_format(
                                    entry.decompiled->status, entry.name, origin));
                }
                decompiler.add(
                        function.entry,
                        canned_decompilation{
                                .status = status,
                                .code = entry.decompiled->code,
                                .signature = entry.decompiled->signature.value_or(std::string{})});
            }

            program.add_function(std::move(function));
        }

        static void load_symbol(
                const internal::persisted_symbol& entry, memory_program& program, std::string_view origin) {
            symbol_info symbol{
                    .name = entry.name,
                    .addr = require_address(entry.address, "symbol address", origin),
                    .is_external = entry.external};
            if (!try_parse_symbol_kind(entry.type, symbol.kind)) {
                throw std::runtime_error("invalid symbol type '{}' for {} in {}"_format(entry.type, entry.name, origin));
            }
            if (!try_parse_source_type(entry.source, symbol.source)) {
                throw std::runtime_error(
                        "invalid symbol source '{}' for {} in {}"_format(entry.source, entry.name, origin));
            }
            program.add_symbol(std::move(symbol));
        }

        static void load_instruction(
                const internal::persisted_instruction& entry, memory_program& program, std::string_view origin) {
            instruction_info instruction{
                    .addr = require_address(entry.address, "instruction address", origin),
                    .mnemonic = entry.mnemonic,
                    .operands = entry.operands,
                    .bytes = parse_byte_string(entry.bytes, origin),
                    .length = entry.length.value_or(0U)};
            program.add_instruction(std::move(instruction));
        }

        static void load_data(const internal::persisted_data& entry, memory_program& program, std::string_view origin) {
            auto addr = require_address(entry.address, "data address", origin);
            auto type = program.parse_data_type(entry.type);
            if (!type) {
                throw std::runtime_error("invalid data type '{}' at {} in {}"_format(entry.type, addr, origin));
            }
            program.add_data(data_info{.addr = addr, .type = std::move(*type)});
        }

        static loaded_program build_program(const persisted_program& data, std::string_view origin) {
            program_metadata metadata{
                    .name = data.name,
                    .image_base = require_address(data.image_base, "image_base", origin),
                    .language_id = data.language,
                    .pointer_size = data.pointer_size};
            if (data.min_address) {
                metadata.min_address = require_address(*data.min_address, "min_address", origin);
            }

            loaded_program loaded{};
            loaded.program = std::make_unique<memory_program>(std::move(metadata));
            auto decompiler = std::make_unique<memory_decompiler>();
            auto& program = *loaded.program;

            // types first; data entries may name them
            for (const auto& type : data.types) {
                program.register_type(type.name, type.size);
            }
            for (const auto& entry : data.entry_points) {
                program.add_entry_point(require_address(entry, "entry point", origin));
            }
            for (const auto& function : data.functions) {
                load_function(function, program, *decompiler, origin);
            }
            for (const auto& symbol : data.symbols) {
                load_symbol(symbol, program, origin);
            }
            for (const auto& instruction : data.instructions) {
                load_instruction(instruction, program, origin);
            }
            for (const auto& comment : data.comments) {
                comment_kind kind{};
                if (!try_parse_comment_kind(comment.kind, kind)) {
                    throw std::runtime_error("invalid comment kind '{}' in {}"_format(comment.kind, origin));
                }
                program.set_comment(require_address(comment.address, "comment address", origin), kind, comment.text);
            }
            for (const auto& entry : data.data) {
                load_data(entry, program, origin);
            }

            if (!decompiler->entries().empty()) {
                loaded.decompiler = std::move(decompiler);
            }
            return loaded;
        }

    }  // namespace detail

    loaded_program parse_program_database(std::string_view json, std::string_view origin) {
        auto data = internal::files::parse_json_text<internal::persisted_program>(std::string{json}, origin);
        internal::files::validate_supported_schema_version(data.schema_version, origin);
        try {
            return detail::build_program(data, origin);
        } catch (const engine_error& e) {
            throw std::runtime_error("invalid program database {}: {}"_format(origin, e.what()));
        }
    }

    loaded_program load_program_database(const std::filesystem::path& path) {
        debug_log("loading program database ", path.string());
        return parse_program_database(internal::files::read_text_file(path), path.string());
    }

    std::string serialize_program_database(const memory_program& program, const memory_decompiler* decompiler) {
        const auto& metadata = program.metadata();

        internal::persisted_program data{
                .name = metadata.name,
                .image_base = metadata.image_base.to_string(),
                .language = metadata.language_id,
                .pointer_size = metadata.pointer_size};
        if (metadata.min_address) {
            data.min_address = metadata.min_address->to_string();
        }

        for (auto entry : program.external_entry_points()) {
            data.entry_points.push_back(entry.to_string());
        }
        for (const auto& type : program.registered_types()) {
            data.types.push_back(internal::persisted_type{.name = type.name, .size = type.size});
        }

        for (const auto& function : program.functions()) {
            internal::persisted_function entry{
                    .name = function.name, .entry_point = function.entry.to_string(), .signature = function.signature};
            for (const auto& range : function.body) {
                entry.body.push_back(
                        internal::persisted_range{.start = range.start.to_string(), .end = range.end.to_string()});
            }
            if (decompiler) {
                const auto& recorded = decompiler->entries();
                if (auto it = recorded.find(function.entry); it != recorded.end()) {
                    internal::persisted_decompilation decompiled{
                            .status = std::string{to_string(it->second.status)}, .code = it->second.code};
                    if (!it->second.signature.empty()) {
                        decompiled.signature = it->second.signature;
                    }
                    entry.decompiled = std::move(decompiled);
                }
            }
            data.functions.push_back(std::move(entry));
        }

        for (const auto& symbol : program.symbols()) {
            data.symbols.push_back(internal::persisted_symbol{
                    .name = symbol.name,
                    .address = symbol.addr.to_string(),
                    .type = std::string{to_string(symbol.kind)},
                    .source = std::string{to_string(symbol.source)},
                    .external = symbol.is_external});
        }

        for (const auto& instruction : program.instructions()) {
            internal::persisted_instruction entry{
                    .address = instruction.addr.to_string(),
                    .mnemonic = instruction.mnemonic,
                    .operands = instruction.operands,
                    .bytes = format_instruction_bytes(instruction.bytes)};
            if (instruction.length != instruction.bytes.size()) {
                entry.length = instruction.length;
            }
            data.instructions.push_back(std::move(entry));
        }

        for (const auto& comment : program.comments()) {
            data.comments.push_back(internal::persisted_comment{
                    .address = comment.addr.to_string(),
                    .kind = std::string{to_string(comment.kind)},
                    .text = comment.text});
        }

        for (const auto& unit : program.defined_data()) {
            data.data.push_back(internal::persisted_data{.address = unit.addr.to_string(), .type = unit.type.name});
        }

        return internal::files::write_json_text(data);
    }

    void save_program_database(
            const std::filesystem::path& path, const memory_program& program, const memory_decompiler* decompiler) {
        internal::files::write_text_file(path, serialize_program_database(program, decompiler) + "\n");
    }

}  // namespace quarry
