#pragma once

#include "format.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

    /*
     * Engine-neutral address value.
     *
     * The only text form that leaves quarry is the canonical one produced by to_string(): "0x" followed by
     * lowercase hex digits without padding. parse_address() accepts that form and bare hex digits.
     */
    struct address {
        static constexpr bool to_string_formattable = true;

        uint64_t offset{};

        std::string to_string() const;

        // nullopt on wrap-around past the top of the address space
        constexpr std::optional<address> advanced(uint64_t delta) const noexcept {
            if (delta > UINT64_MAX - offset) {
                return std::nullopt;
            }
            return address{offset + delta};
        }

        constexpr auto operator<=>(const address&) const = default;
    };

    // Closed interval [start, end]
    struct address_range {
        static constexpr bool to_string_formattable = true;

        address start{};
        address end{};

        constexpr bool contains(address addr) const noexcept { return start <= addr && addr <= end; }

        constexpr uint64_t length() const noexcept { return end.offset - start.offset + 1U; }

        std::string to_string() const;

        constexpr bool operator==(const address_range&) const = default;
    };

    std::optional<address> parse_address(std::string_view text);

    // nullopt when the range would be empty or wrap
    std::optional<address_range> make_range(address start, uint64_t length);

    bool body_contains(std::span<const address_range> body, address addr);

    // "[0x1000, 0x1009] [0x2000, 0x2003]"
    std::string body_to_string(std::span<const address_range> body);

    // Inverse of body_to_string; nullopt on malformed text
    std::optional<std::vector<address_range>> parse_body(std::string_view text);

}  // namespace quarry
