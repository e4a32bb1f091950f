#pragma once

#include "analysis.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace quarry {

    /*
     * Text channel
     *
     * Every invocation prints exactly one document: the start marker line, pretty-printed JSON, the end marker
     * line. Anything else on the stream (tool chatter, warnings) is outside the markers, so consumers scan for
     * the marker pair instead of parsing the whole stream.
     */
    inline constexpr auto document_start_marker = "__QUARRY_JSON_START__"sv;
    inline constexpr auto document_end_marker = "__QUARRY_JSON_END__"sv;

    std::string to_json(const analysis_report& report);
    std::string to_json(const error_report& report);
    std::string to_json(const report_document& document);
    std::string to_json(const mutation_result& result);

    void emit_document(std::ostream& os, std::string_view json);

    // JSON text between the first start marker and the following end marker
    std::optional<std::string_view> extract_document(std::string_view stream_text);

    // nullopt on malformed JSON; the `error` flag selects the shape
    std::optional<report_document> parse_document(std::string_view json);
    std::optional<mutation_result> parse_mutation_result(std::string_view json);

    inline bool is_error(const report_document& document) {
        return std::holds_alternative<error_report>(document);
    }

}  // namespace quarry
