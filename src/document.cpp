#include "quarry/document.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>

namespace glz {

    template <>
    struct meta<quarry::function_record> {
        using T = quarry::function_record;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "entry_point",
                       &T::entry_point,
                       "signature",
                       &T::signature,
                       "body_range",
                       &T::body_range);
    };

    template <>
    struct meta<quarry::symbol_record> {
        using T = quarry::symbol_record;
        static constexpr auto value =
                object("name", &T::name, "address", &T::address, "type", &T::type, "source", &T::source);
    };

    template <>
    struct meta<quarry::instruction_record> {
        using T = quarry::instruction_record;
        static constexpr auto value =
                object("address",
                       &T::address,
                       "mnemonic",
                       &T::mnemonic,
                       "operands",
                       &T::operands,
                       "bytes",
                       &T::bytes,
                       "comment",
                       &T::comment);
    };

    template <>
    struct meta<quarry::decompiled_function> {
        using T = quarry::decompiled_function;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "entry_point",
                       &T::entry_point,
                       "code",
                       &T::code,
                       "signature",
                       &T::signature,
                       "body",
                       &T::body);
    };

    template <>
    struct meta<quarry::analysis_report> {
        using T = quarry::analysis_report;
        static constexpr auto value =
                object("program_name",
                       &T::program_name,
                       "entry_point",
                       &T::entry_point,
                       "entry_function",
                       &T::entry_function,
                       "functions",
                       &T::functions,
                       "symbols",
                       &T::symbols,
                       "disassembly",
                       &T::disassembly,
                       "image_base",
                       &T::image_base,
                       "language",
                       &T::language);
    };

    template <>
    struct meta<quarry::error_report> {
        using T = quarry::error_report;
        static constexpr auto value =
                object("error",
                       &T::error,
                       "message",
                       &T::message,
                       "traceback",
                       &T::traceback,
                       "program_name",
                       &T::program_name);
    };

    template <>
    struct meta<quarry::mutation_result> {
        using T = quarry::mutation_result;
        static constexpr auto value = object("success", &T::success, "message", &T::message);
    };

}  // namespace glz

namespace quarry {

    namespace detail {

        // entry_function is written as null rather than dropped so the schema is the same for every report
        inline constexpr glz::opts write_opts{.skip_null_members = false, .prettify = true};
        inline constexpr glz::opts discriminator_opts{.error_on_unknown_keys = false};

        struct document_discriminator {
            std::optional<bool> error{};
        };

        template <typename T>
        static std::string serialize_json_payload(const T& payload) {
            std::string json{};
            auto ec = glz::write<write_opts>(payload, json);
            if (ec) {
                throw std::runtime_error("failed to serialize json payload");
            }
            return json;
        }

        template <typename T>
        static std::optional<T> read_json_payload(std::string_view json) {
            T value{};
            std::string buffer{json};
            auto ec = glz::read_json(value, buffer);
            if (ec) {
                return std::nullopt;
            }
            return value;
        }

    }  // namespace detail

}  // namespace quarry

namespace glz {

    template <>
    struct meta<quarry::detail::document_discriminator> {
        using T = quarry::detail::document_discriminator;
        static constexpr auto value = object("error", &T::error);
    };

}  // namespace glz

namespace quarry {

    std::string to_json(const analysis_report& report) {
        return detail::serialize_json_payload(report);
    }

    std::string to_json(const error_report& report) {
        return detail::serialize_json_payload(report);
    }

    std::string to_json(const report_document& document) {
        return std::visit([](const auto& report) { return to_json(report); }, document);
    }

    std::string to_json(const mutation_result& result) {
        return detail::serialize_json_payload(result);
    }

    void emit_document(std::ostream& os, std::string_view json) {
        os << document_start_marker << '\n';
        os << json;
        if (!json.ends_with('\n')) {
            os << '\n';
        }
        os << document_end_marker << '\n';
        os.flush();
    }

    std::optional<std::string_view> extract_document(std::string_view stream_text) {
        auto start = stream_text.find(document_start_marker);
        if (start == std::string_view::npos) {
            return std::nullopt;
        }
        auto body_begin = start + document_start_marker.size();
        auto end = stream_text.find(document_end_marker, body_begin);
        if (end == std::string_view::npos) {
            return std::nullopt;
        }
        return utils::trim_view(stream_text.substr(body_begin, end - body_begin));
    }

    std::optional<report_document> parse_document(std::string_view json) {
        detail::document_discriminator discriminator{};
        std::string buffer{json};
        if (auto ec = glz::read<detail::discriminator_opts>(discriminator, buffer); ec) {
            return std::nullopt;
        }

        if (discriminator.error.value_or(false)) {
            if (auto report = detail::read_json_payload<error_report>(json)) {
                return report_document{std::move(*report)};
            }
            return std::nullopt;
        }

        if (auto report = detail::read_json_payload<analysis_report>(json)) {
            return report_document{std::move(*report)};
        }
        return std::nullopt;
    }

    std::optional<mutation_result> parse_mutation_result(std::string_view json) {
        return detail::read_json_payload<mutation_result>(json);
    }

}  // namespace quarry
