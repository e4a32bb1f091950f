#pragma once

#include "quarry/utils.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::internal::symbols {

    using namespace std::string_view_literals;

    inline constexpr std::string_view strip_one_leading_underscore(std::string_view symbol) noexcept {
        if (!symbol.empty() && symbol.front() == '_') {
            symbol.remove_prefix(1U);
        }
        return symbol;
    }

    // "puts@GLIBC_2.2.5" -> "puts"; "puts@@GLIBC_2.2.5" likewise
    inline constexpr std::string_view strip_symbol_addendum(std::string_view symbol) noexcept {
        auto at = symbol.find('@');
        if (at != std::string_view::npos && at > 0U) {
            symbol = symbol.substr(0U, at);
        }
        return symbol;
    }

    inline std::vector<std::string_view> split_whitespace_tokens(std::string_view text) {
        std::vector<std::string_view> tokens{};
        size_t cursor = 0U;
        while (cursor < text.size()) {
            while (cursor < text.size() && (text[cursor] == ' ' || text[cursor] == '\t')) {
                ++cursor;
            }
            if (cursor >= text.size()) {
                break;
            }
            auto end = cursor;
            while (end < text.size() && text[end] != ' ' && text[end] != '\t') {
                ++end;
            }
            tokens.push_back(text.substr(cursor, end - cursor));
            cursor = end;
        }
        return tokens;
    }

    // Itanium ABI demangling; also accepts bare type encodings such as typeid names
    inline std::optional<std::string> try_demangle(std::string_view input) {
        int status = 0;
        auto* demangled_ptr = abi::__cxa_demangle(std::string{input}.c_str(), nullptr, nullptr, &status);
        if (demangled_ptr == nullptr || status != 0) {
            std::free(demangled_ptr);
            return std::nullopt;
        }

        std::string demangled{demangled_ptr};
        std::free(demangled_ptr);
        return demangled;
    }

    // Mach-O prefixes every symbol with an extra underscore, so a second attempt runs without it
    inline std::string demangle_symbol_name(std::string_view mangled) {
        if (!mangled.starts_with("_Z"sv) && !mangled.starts_with("__Z"sv)) {
            return std::string{mangled};
        }
        if (auto demangled = try_demangle(mangled)) {
            return *demangled;
        }
        if (auto stripped = strip_one_leading_underscore(mangled); stripped != mangled) {
            if (auto demangled = try_demangle(stripped)) {
                return *demangled;
            }
        }
        return std::string{mangled};
    }

}  // namespace quarry::internal::symbols
