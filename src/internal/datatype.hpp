#pragma once

#include "quarry/program.hpp"

#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace quarry::internal::datatype {

    using namespace std::string_view_literals;

    struct builtin_type {
        std::string_view name{};
        // 0 means pointer-sized
        uint64_t size{};
    };

    inline constexpr builtin_type builtin_types[] = {
            {"undefined"sv, 1U}, {"undefined1"sv, 1U}, {"undefined2"sv, 2U}, {"undefined4"sv, 4U},
            {"undefined8"sv, 8U}, {"byte"sv, 1U},       {"sbyte"sv, 1U},      {"char"sv, 1U},
            {"uchar"sv, 1U},      {"bool"sv, 1U},       {"word"sv, 2U},       {"short"sv, 2U},
            {"ushort"sv, 2U},     {"wchar_t"sv, 2U},    {"dword"sv, 4U},      {"int"sv, 4U},
            {"uint"sv, 4U},       {"float"sv, 4U},      {"qword"sv, 8U},      {"long"sv, 8U},
            {"ulong"sv, 8U},      {"longlong"sv, 8U},   {"ulonglong"sv, 8U},  {"double"sv, 8U},
            {"pointer"sv, 0U},    {"void"sv, 0U},
    };

    using user_type_lookup = std::function<std::optional<uint64_t>(std::string_view)>;

    inline bool is_identifier_char(char c, bool first) noexcept {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc) != 0 || c == '_') {
            return true;
        }
        return !first && (std::isdigit(uc) != 0 || c == ':');
    }

    /*
     * Type-name grammar
     *
     *   type   := name suffix*
     *   suffix := '*' | '[' count ']'
     *
     * `name` is a builtin or a type registered with the program. "void" is only valid behind a pointer.
     * Pointers render as "<base> *" ("int **" when nested), arrays as "<base>[N]".
     */
    inline std::optional<data_type> parse_type_name(
            std::string_view text, const user_type_lookup& lookup_user, uint32_t pointer_size) {
        text = utils::trim_view(text);
        if (text.empty() || !is_identifier_char(text.front(), true)) {
            return std::nullopt;
        }

        size_t pos = 0U;
        while (pos < text.size() && is_identifier_char(text[pos], pos == 0U)) {
            ++pos;
        }
        auto base = text.substr(0U, pos);

        std::optional<uint64_t> size{};
        for (const auto& builtin : builtin_types) {
            if (builtin.name == base) {
                size = builtin.size == 0U && builtin.name == "pointer"sv ? uint64_t{pointer_size} : builtin.size;
                break;
            }
        }
        if (!size && lookup_user) {
            size = lookup_user(base);
        }
        if (!size) {
            return std::nullopt;
        }

        data_type type{.name = std::string{base}, .size = *size};
        bool is_void = base == "void"sv;

        while (pos < text.size()) {
            auto c = text[pos];
            if (c == ' ' || c == '\t') {
                ++pos;
                continue;
            }
            if (c == '*') {
                type.name += type.name.ends_with('*') ? "*" : " *";
                type.size = pointer_size;
                is_void = false;
                ++pos;
                continue;
            }
            if (c == '[') {
                auto close = text.find(']', pos);
                if (close == std::string_view::npos || is_void) {
                    return std::nullopt;
                }
                auto count_text = utils::trim_view(text.substr(pos + 1U, close - pos - 1U));
                auto count = utils::parse_arithmetic<uint64_t>(count_text);
                if (!count || *count == 0U || type.size > UINT64_MAX / *count) {
                    return std::nullopt;
                }
                type.name += "[" + std::to_string(*count) + "]";
                type.size *= *count;
                pos = close + 1U;
                continue;
            }
            return std::nullopt;
        }

        if (is_void || type.size == 0U) {
            return std::nullopt;
        }
        return type;
    }

}  // namespace quarry::internal::datatype
