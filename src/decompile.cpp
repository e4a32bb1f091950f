#include "quarry/analysis.hpp"

#include <iostream>
#include <stop_token>

namespace quarry {

    std::optional<decompiled_function> decompile_function(
            decompiler_service& decompiler,
            const std::optional<function_info>& function,
            std::chrono::seconds timeout,
            bool verbose,
            std::stop_token stop) {
        if (!function) {
            return std::nullopt;
        }

        // one request, one source; a stop on the caller's token is forwarded into it
        std::stop_source request{};
        std::stop_callback forward{stop, [&request] { request.request_stop(); }};

        decompile_result result{};
        try {
            result = decompiler.decompile(*function, timeout, request.get_token());
        } catch (const std::exception& e) {
            if (verbose) {
                std::cerr << "note: decompiler failed for " << function->name << ": " << e.what() << '\n';
            }
            return std::nullopt;
        } catch (...) {
            if (verbose) {
                std::cerr << "note: decompiler failed for " << function->name << ": unknown error\n";
            }
            return std::nullopt;
        }

        if (result.status != decompile_status::completed) {
            if (verbose) {
                std::cerr << "note: decompilation of " << function->name << " ended with status "
                          << to_string(result.status);
                if (!result.error_message.empty()) {
                    std::cerr << ": " << result.error_message;
                }
                std::cerr << '\n';
            }
            return std::nullopt;
        }

        if (result.code.empty()) {
            return std::nullopt;
        }

        return decompiled_function{
                .name = function->name,
                .entry_point = function->entry.to_string(),
                .code = std::move(result.code),
                .signature = result.signature.empty() ? function->signature : std::move(result.signature),
                .body = body_to_string(function->body)};
    }

}  // namespace quarry
