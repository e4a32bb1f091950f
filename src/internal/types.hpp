#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quarry::internal {

    /*
     * Program database schema (schema_version 1)
     *
     * Addresses are stored in canonical text form, instruction bytes as space separated hex pairs, tags with
     * the same vocabulary reports use.
     */

    struct persisted_range {
        std::string start{};
        std::string end{};
    };

    struct persisted_decompilation {
        std::string status{"completed"};
        std::string code{};
        std::optional<std::string> signature{};
    };

    struct persisted_function {
        std::string name{};
        std::string entry_point{};
        std::string signature{};
        std::vector<persisted_range> body{};
        std::optional<persisted_decompilation> decompiled{};
    };

    struct persisted_symbol {
        std::string name{};
        std::string address{};
        std::string type{"Label"};
        std::string source{"DEFAULT"};
        bool external{false};
    };

    struct persisted_instruction {
        std::string address{};
        std::string mnemonic{};
        std::string operands{};
        std::string bytes{};
        std::optional<uint32_t> length{};
    };

    struct persisted_comment {
        std::string address{};
        std::string kind{"eol"};
        std::string text{};
    };

    struct persisted_data {
        std::string address{};
        std::string type{};
    };

    struct persisted_type {
        std::string name{};
        uint64_t size{};
    };

    struct persisted_program {
        int schema_version{1};
        std::string name{};
        std::string image_base{"0x0"};
        std::optional<std::string> min_address{};
        std::string language{};
        uint32_t pointer_size{8U};
        std::vector<std::string> entry_points{};
        std::vector<persisted_type> types{};
        std::vector<persisted_function> functions{};
        std::vector<persisted_symbol> symbols{};
        std::vector<persisted_instruction> instructions{};
        std::vector<persisted_comment> comments{};
        std::vector<persisted_data> data{};
    };

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> nm{};
        std::optional<std::string> objdump{};
        std::optional<std::string> decompiler{};
        std::optional<std::string> asm_syntax{};
        std::optional<uint32_t> max_instructions{};
        std::optional<int> decompile_timeout_s{};
        std::optional<int> tool_timeout_ms{};
    };

}  // namespace quarry::internal

namespace glz {

    template <>
    struct meta<quarry::internal::persisted_range> {
        using T = quarry::internal::persisted_range;
        static constexpr auto value = object("start", &T::start, "end", &T::end);
    };

    template <>
    struct meta<quarry::internal::persisted_decompilation> {
        using T = quarry::internal::persisted_decompilation;
        static constexpr auto value = object("status", &T::status, "code", &T::code, "signature", &T::signature);
    };

    template <>
    struct meta<quarry::internal::persisted_function> {
        using T = quarry::internal::persisted_function;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "entry_point",
                       &T::entry_point,
                       "signature",
                       &T::signature,
                       "body",
                       &T::body,
                       "decompiled",
                       &T::decompiled);
    };

    template <>
    struct meta<quarry::internal::persisted_symbol> {
        using T = quarry::internal::persisted_symbol;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "address",
                       &T::address,
                       "type",
                       &T::type,
                       "source",
                       &T::source,
                       "external",
                       &T::external);
    };

    template <>
    struct meta<quarry::internal::persisted_instruction> {
        using T = quarry::internal::persisted_instruction;
        static constexpr auto value =
                object("address",
                       &T::address,
                       "mnemonic",
                       &T::mnemonic,
                       "operands",
                       &T::operands,
                       "bytes",
                       &T::bytes,
                       "length",
                       &T::length);
    };

    template <>
    struct meta<quarry::internal::persisted_comment> {
        using T = quarry::internal::persisted_comment;
        static constexpr auto value = object("address", &T::address, "kind", &T::kind, "text", &T::text);
    };

    template <>
    struct meta<quarry::internal::persisted_data> {
        using T = quarry::internal::persisted_data;
        static constexpr auto value = object("address", &T::address, "type", &T::type);
    };

    template <>
    struct meta<quarry::internal::persisted_type> {
        using T = quarry::internal::persisted_type;
        static constexpr auto value = object("name", &T::name, "size", &T::size);
    };

    template <>
    struct meta<quarry::internal::persisted_program> {
        using T = quarry::internal::persisted_program;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "name",
                       &T::name,
                       "image_base",
                       &T::image_base,
                       "min_address",
                       &T::min_address,
                       "language",
                       &T::language,
                       "pointer_size",
                       &T::pointer_size,
                       "entry_points",
                       &T::entry_points,
                       "types",
                       &T::types,
                       "functions",
                       &T::functions,
                       "symbols",
                       &T::symbols,
                       "instructions",
                       &T::instructions,
                       "comments",
                       &T::comments,
                       "data",
                       &T::data);
    };

    template <>
    struct meta<quarry::internal::persisted_config> {
        using T = quarry::internal::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "nm",
                       &T::nm,
                       "objdump",
                       &T::objdump,
                       "decompiler",
                       &T::decompiler,
                       "asm_syntax",
                       &T::asm_syntax,
                       "max_instructions",
                       &T::max_instructions,
                       "decompile_timeout_s",
                       &T::decompile_timeout_s,
                       "tool_timeout_ms",
                       &T::tool_timeout_ms);
    };

}  // namespace glz
