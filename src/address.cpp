#include "quarry/address.hpp"

#include <algorithm>
#include <vector>

using namespace quarry::literals;

namespace quarry {

    std::string address::to_string() const {
        return "0x{:x}"_format(offset);
    }

    std::string address_range::to_string() const {
        return "[{}, {}]"_format(start, end);
    }

    std::optional<address> parse_address(std::string_view text) {
        if (auto value = utils::parse_hex_u64(text)) {
            return address{*value};
        }
        return std::nullopt;
    }

    std::optional<address_range> make_range(address start, uint64_t length) {
        if (length == 0U) {
            return std::nullopt;
        }
        auto last = start.advanced(length - 1U);
        if (!last) {
            return std::nullopt;
        }
        return address_range{.start = start, .end = *last};
    }

    bool body_contains(std::span<const address_range> body, address addr) {
        return std::ranges::any_of(body, [addr](const address_range& range) { return range.contains(addr); });
    }

    std::string body_to_string(std::span<const address_range> body) {
        std::vector<std::string> parts{};
        parts.reserve(body.size());
        for (const auto& range : body) {
            parts.push_back(range.to_string());
        }
        return utils::join_with_separator(parts, " ");
    }

    std::optional<std::vector<address_range>> parse_body(std::string_view text) {
        std::vector<address_range> body{};
        text = utils::trim_view(text);
        while (!text.empty()) {
            if (text.front() != '[') {
                return std::nullopt;
            }
            auto close = text.find(']');
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            auto inner = text.substr(1U, close - 1U);
            auto comma = inner.find(',');
            if (comma == std::string_view::npos) {
                return std::nullopt;
            }
            auto start = parse_address(inner.substr(0U, comma));
            auto end = parse_address(inner.substr(comma + 1U));
            if (!start || !end || *end < *start) {
                return std::nullopt;
            }
            body.push_back(address_range{.start = *start, .end = *end});
            text = utils::trim_view(text.substr(close + 1U));
        }
        return body;
    }

}  // namespace quarry
