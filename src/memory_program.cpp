#include "quarry/memory_program.hpp"

#include "quarry/format.hpp"

#include "internal/datatype.hpp"

#include <algorithm>
#include <cctype>

using namespace quarry::literals;

namespace quarry {

    namespace detail {

        static bool is_valid_symbol_name(std::string_view name) {
            if (name.empty()) {
                return false;
            }
            return std::ranges::none_of(name, [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
        }

    }  // namespace detail

    memory_program::memory_program(program_metadata metadata) : info{std::move(metadata)} {
        if (info.pointer_size == 0U) {
            throw engine_error("pointer size must be non-zero");
        }
    }

    void memory_program::add_entry_point(address addr) {
        if (std::ranges::find(entry_points, addr) == entry_points.end()) {
            entry_points.push_back(addr);
        }
    }

    void memory_program::add_function(function_info function) {
        if (function.body.empty()) {
            auto range = make_range(function.entry, 1U);
            function.body.push_back(*range);
        }
        if (!body_contains(function.body, function.entry)) {
            throw engine_error("function {} entry {} lies outside its body"_format(function.name, function.entry));
        }
        auto [it, inserted] = functions_by_entry.emplace(function.entry, function);
        if (!inserted) {
            throw engine_error("duplicate function at {}"_format(function.entry));
        }
    }

    uint64_t memory_program::add_symbol(symbol_info symbol) {
        if (!detail::is_valid_symbol_name(symbol.name)) {
            throw engine_error("invalid symbol name: '{}'"_format(symbol.name));
        }
        symbol.id = next_symbol_id++;
        symbol_table.push_back(std::move(symbol));
        return symbol_table.back().id;
    }

    void memory_program::add_instruction(instruction_info instruction) {
        if (instruction.length == 0U) {
            instruction.length = static_cast<uint32_t>(instruction.bytes.size());
        }
        if (instruction.length == 0U) {
            throw engine_error("instruction at {} has no length"_format(instruction.addr));
        }
        check_unit_free(instruction.addr, instruction.length, std::nullopt);
        listing.emplace(instruction.addr, std::move(instruction));
    }

    void memory_program::set_comment(address addr, comment_kind kind, std::string text) {
        if (text.empty()) {
            comment_table.erase({addr, kind});
            return;
        }
        comment_table[{addr, kind}] = std::move(text);
    }

    void memory_program::add_data(data_info data) {
        if (data.type.size == 0U) {
            throw engine_error("data at {} has zero size"_format(data.addr));
        }
        check_unit_free(data.addr, data.type.size, std::nullopt);
        data_units.emplace(data.addr, std::move(data));
    }

    void memory_program::register_type(std::string name, uint64_t size) {
        if (size == 0U) {
            throw engine_error("type {} has zero size"_format(name));
        }
        user_types.insert_or_assign(std::move(name), size);
    }

    std::vector<instruction_info> memory_program::instructions() const {
        std::vector<instruction_info> out{};
        out.reserve(listing.size());
        for (const auto& [addr, instruction] : listing) {
            out.push_back(instruction);
        }
        return out;
    }

    std::vector<comment_entry> memory_program::comments() const {
        std::vector<comment_entry> out{};
        out.reserve(comment_table.size());
        for (const auto& [key, text] : comment_table) {
            out.push_back(comment_entry{.addr = key.first, .kind = key.second, .text = text});
        }
        return out;
    }

    std::vector<data_info> memory_program::defined_data() const {
        std::vector<data_info> out{};
        out.reserve(data_units.size());
        for (const auto& [addr, data] : data_units) {
            out.push_back(data);
        }
        return out;
    }

    std::vector<data_type> memory_program::registered_types() const {
        std::vector<data_type> out{};
        out.reserve(user_types.size());
        for (const auto& [name, size] : user_types) {
            out.push_back(data_type{.name = name, .size = size});
        }
        return out;
    }

    std::string memory_program::name() const {
        return info.name;
    }

    address memory_program::image_base() const {
        return info.image_base;
    }

    address memory_program::min_address() const {
        if (info.min_address) {
            return *info.min_address;
        }
        return lowest_populated_address().value_or(info.image_base);
    }

    std::string memory_program::language_id() const {
        return info.language_id;
    }

    std::vector<address> memory_program::external_entry_points() const {
        return entry_points;
    }

    std::vector<function_info> memory_program::functions() const {
        std::vector<function_info> out{};
        out.reserve(functions_by_entry.size());
        for (const auto& [entry, function] : functions_by_entry) {
            out.push_back(function);
        }
        return out;
    }

    std::optional<function_info> memory_program::function_containing(address addr) const {
        for (const auto& [entry, function] : functions_by_entry) {
            if (body_contains(function.body, addr)) {
                return function;
            }
        }
        return std::nullopt;
    }

    std::vector<symbol_info> memory_program::symbols() const {
        return symbol_table;
    }

    std::vector<symbol_info> memory_program::symbols_at(address addr) const {
        std::vector<symbol_info> out{};
        for (const auto& symbol : symbol_table) {
            if (!symbol.is_external && symbol.addr == addr) {
                out.push_back(symbol);
            }
        }
        return out;
    }

    void memory_program::rename_symbol(const symbol_info& symbol, std::string_view new_name, source_type source) {
        if (!detail::is_valid_symbol_name(new_name)) {
            throw engine_error("invalid symbol name: '{}'"_format(new_name));
        }
        auto it = std::ranges::find(symbol_table, symbol.id, &symbol_info::id);
        if (it == symbol_table.end()) {
            throw engine_error("symbol {} no longer exists"_format(symbol.name));
        }
        it->name = std::string{new_name};
        it->source = source;

        // function names follow their primary symbol
        if (it->kind == symbol_kind::function) {
            if (auto fn = functions_by_entry.find(it->addr); fn != functions_by_entry.end()) {
                fn->second.name = it->name;
            }
        }
    }

    std::optional<instruction_info> memory_program::instruction_at(address addr) const {
        if (auto it = listing.find(addr); it != listing.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::string> memory_program::comment_at(address addr, comment_kind kind) const {
        if (auto it = comment_table.find({addr, kind}); it != comment_table.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<data_info> memory_program::data_at(address addr) const {
        if (auto it = data_units.find(addr); it != data_units.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void memory_program::create_data(address addr, const data_type& type) {
        if (type.size == 0U) {
            throw engine_error("cannot create data of zero size at {}"_format(addr));
        }
        check_unit_free(addr, type.size, addr);
        data_units.insert_or_assign(addr, data_info{.addr = addr, .type = type});
    }

    std::optional<address> memory_program::parse_address(std::string_view text) const {
        return quarry::parse_address(text);
    }

    std::optional<data_type> memory_program::parse_data_type(std::string_view text) const {
        auto lookup = [this](std::string_view name) -> std::optional<uint64_t> {
            if (auto it = user_types.find(name); it != user_types.end()) {
                return it->second;
            }
            return std::nullopt;
        };
        return internal::datatype::parse_type_name(text, lookup, info.pointer_size);
    }

    std::optional<address> memory_program::lowest_populated_address() const {
        std::optional<address> lowest{};
        auto consider = [&lowest](address addr) {
            if (!lowest || addr < *lowest) {
                lowest = addr;
            }
        };
        if (!listing.empty()) {
            consider(listing.begin()->first);
        }
        if (!data_units.empty()) {
            consider(data_units.begin()->first);
        }
        for (const auto& [entry, function] : functions_by_entry) {
            for (const auto& range : function.body) {
                consider(range.start);
            }
        }
        return lowest;
    }

    // A new unit of `size` bytes at `addr` may not overlap instructions or other data
    void memory_program::check_unit_free(address addr, uint64_t size, std::optional<address> ignore_data) const {
        auto range = make_range(addr, size);
        if (!range) {
            throw engine_error("unit at {} of {} bytes wraps the address space"_format(addr, size));
        }

        auto overlaps = [&range](address start, uint64_t length) {
            auto other = make_range(start, length);
            return other && other->start <= range->end && range->start <= other->end;
        };

        // units are non-overlapping, so only the unit just below and those inside the range can collide
        auto instr = listing.upper_bound(range->end);
        while (instr != listing.begin()) {
            --instr;
            if (overlaps(instr->first, instr->second.length)) {
                throw engine_error(
                        "{} conflicts with instruction at {}"_format(range->to_string(), instr->first));
            }
            if (instr->first < range->start) {
                break;
            }
        }

        auto data = data_units.upper_bound(range->end);
        while (data != data_units.begin()) {
            --data;
            if (ignore_data && data->first == *ignore_data) {
                if (data->first < range->start) {
                    break;
                }
                continue;
            }
            if (overlaps(data->first, data->second.type.size)) {
                throw engine_error("{} conflicts with data at {}"_format(range->to_string(), data->first));
            }
            if (data->first < range->start) {
                break;
            }
        }
    }

    void memory_decompiler::add(address entry, canned_decompilation decompilation) {
        table.insert_or_assign(entry, std::move(decompilation));
    }

    void memory_decompiler::open([[maybe_unused]] const program_model& model) {
        opened = true;
    }

    decompile_result memory_decompiler::decompile(
            const function_info& function, [[maybe_unused]] std::chrono::seconds timeout, std::stop_token stop) {
        if (!opened) {
            throw engine_error("decompiler is not open");
        }
        if (stop.stop_requested()) {
            return decompile_result{.status = decompile_status::cancelled};
        }
        auto it = table.find(function.entry);
        if (it == table.end()) {
            return decompile_result{
                    .status = decompile_status::failed,
                    .error_message = "no decompilation recorded for {}"_format(function.entry)};
        }
        return decompile_result{
                .status = it->second.status, .code = it->second.code, .signature = it->second.signature};
    }

}  // namespace quarry
