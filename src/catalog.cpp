#include "quarry/analysis.hpp"

#include <algorithm>

namespace quarry {

    address resolve_entry_point(const program_model& model) {
        auto entries = model.external_entry_points();
        if (!entries.empty()) {
            return entries.front();
        }
        debug_log("no external entry points, falling back to minimum address");
        return model.min_address();
    }

    function_record make_function_record(const function_info& function) {
        return function_record{
                .name = function.name,
                .entry_point = function.entry.to_string(),
                .signature = function.signature,
                .body_range = body_to_string(function.body)};
    }

    std::vector<function_record> enumerate_functions(const program_model& model) {
        auto functions = model.functions();
        std::vector<function_record> records{};
        records.reserve(functions.size());
        for (const auto& function : functions) {
            records.push_back(make_function_record(function));
        }
        return records;
    }

    std::optional<function_info> find_function_containing(const program_model& model, address addr) {
        return model.function_containing(addr);
    }

    symbol_record make_symbol_record(const symbol_info& symbol) {
        return symbol_record{
                .name = symbol.name,
                .address = symbol.addr.to_string(),
                .type = std::string{to_string(symbol.kind)},
                .source = std::string{to_string(symbol.source)}};
    }

    std::vector<symbol_record> enumerate_symbols(const program_model& model) {
        auto symbols = model.symbols();
        std::vector<symbol_record> records{};
        records.reserve(symbols.size());
        for (const auto& symbol : symbols) {
            if (symbol.is_external) {
                continue;
            }
            records.push_back(make_symbol_record(symbol));
        }
        return records;
    }

    std::optional<function_record> find_function_by_name(const analysis_report& report, std::string_view name) {
        auto it = std::ranges::find(report.functions, name, &function_record::name);
        if (it == report.functions.end()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<function_record> find_function_at(const analysis_report& report, address addr) {
        for (const auto& function : report.functions) {
            auto body = parse_body(function.body_range);
            if (body && body_contains(*body, addr)) {
                return function;
            }
            if (auto entry = parse_address(function.entry_point); entry && *entry == addr) {
                return function;
            }
        }
        return std::nullopt;
    }

    std::vector<symbol_record> find_symbols_at(const analysis_report& report, address addr) {
        std::vector<symbol_record> matches{};
        for (const auto& symbol : report.symbols) {
            if (auto symbol_addr = parse_address(symbol.address); symbol_addr && *symbol_addr == addr) {
                matches.push_back(symbol);
            }
        }
        return matches;
    }

}  // namespace quarry
