#include "quarry/mutation.hpp"

#include "quarry/format.hpp"

using namespace quarry::literals;

namespace quarry {

    namespace detail {

        static mutation_result failure(std::string message) {
            return mutation_result{.success = false, .message = std::move(message)};
        }

        static mutation_result success(std::string message) {
            return mutation_result{.success = true, .message = std::move(message)};
        }

    }  // namespace detail

    mutation_ops::mutation_ops(program_model& model) : model{model} {}

    mutation_result mutation_ops::rename_symbol(std::string_view address_text, std::string_view new_name) {
        std::lock_guard lock{write_mutex};
        try {
            auto addr = model.parse_address(address_text);
            if (!addr) {
                return detail::failure("invalid address: {}"_format(address_text));
            }

            auto symbols = model.symbols_at(*addr);
            if (symbols.empty()) {
                return detail::failure("No symbol found at address");
            }

            model.rename_symbol(symbols.front(), new_name, source_type::user_defined);
            return detail::success("Renamed to {}"_format(new_name));
        } catch (const std::exception& e) {
            return detail::failure(e.what());
        } catch (...) {
            return detail::failure("unknown error");
        }
    }

    mutation_result mutation_ops::set_data_type(std::string_view address_text, std::string_view type_text) {
        std::lock_guard lock{write_mutex};
        try {
            auto addr = model.parse_address(address_text);
            if (!addr) {
                return detail::failure("invalid address: {}"_format(address_text));
            }

            if (!model.data_at(*addr)) {
                return detail::failure("No data at address");
            }

            auto type = model.parse_data_type(type_text);
            if (!type) {
                return detail::failure("invalid data type: {}"_format(type_text));
            }

            model.create_data(*addr, *type);
            return detail::success("Set type to {}"_format(type_text));
        } catch (const std::exception& e) {
            return detail::failure(e.what());
        } catch (...) {
            return detail::failure("unknown error");
        }
    }

}  // namespace quarry
