#include "quarry/analysis.hpp"
#include "quarry/format.hpp"

#include "internal/symbols.hpp"

#include <iostream>
#include <typeinfo>
#include <utility>

using namespace quarry::literals;

namespace quarry {

    namespace detail {

        class stage_error : public std::runtime_error {
          public:
            explicit stage_error(std::string_view stage)
                    : std::runtime_error{"{} failed"_format(stage)}, stage_name{stage} {}

            std::string_view stage() const noexcept { return stage_name; }

          private:
            std::string stage_name;
        };

        template <typename F>
        static auto run_stage(std::string_view stage, F&& fn) -> decltype(fn()) {
            debug_log("stage: ", stage);
            try {
                return std::forward<F>(fn)();
            } catch (const std::exception&) {
                std::throw_with_nested(stage_error{stage});
            }
        }

        static std::string demangle_type_name(const char* mangled) {
            return internal::symbols::try_demangle(mangled).value_or(std::string{mangled});
        }

        struct chain_link {
            std::string type{};
            std::string message{};
        };

        static void append_chain(const std::exception& error, std::vector<chain_link>& chain) {
            chain.push_back(chain_link{.type = demangle_type_name(typeid(error).name()), .message = error.what()});
            try {
                std::rethrow_if_nested(error);
            } catch (const std::exception& nested) {
                append_chain(nested, chain);
            } catch (...) {
                chain.push_back(chain_link{.type = "<non-standard exception>", .message = "unknown error"});
            }
        }

        // The fault that started the chain; wrappers added by run_stage only name the stage.
        static std::string root_message(const std::vector<chain_link>& chain) {
            if (chain.empty()) {
                return "unknown error";
            }
            auto message = chain.back().message;
            return message.empty() ? std::string{"unknown error"} : message;
        }

    }  // namespace detail

    report_assembler::report_assembler(
            const program_model& model, decompiler_service* decompiler, report_options options)
            : model{model}, decompiler{decompiler}, options{std::move(options)} {}

    analysis_report report_assembler::build() const {
        analysis_report report{};

        auto entry = detail::run_stage("resolve entry point", [&] { return resolve_entry_point(model); });

        auto entry_function =
                detail::run_stage("find entry function", [&] { return find_function_containing(model, entry); });

        if (entry_function && decompiler != nullptr) {
            bool opened = false;
            try {
                decompiler->open(model);
                opened = true;
            } catch (const std::exception& e) {
                if (options.verbose) {
                    std::cerr << "note: decompiler unavailable: " << e.what() << '\n';
                }
            }
            if (opened) {
                report.entry_function = detail::run_stage("decompile entry function", [&] {
                    return decompile_function(
                            *decompiler, entry_function, options.decompile_timeout, options.verbose, options.stop);
                });
            }
        }

        report.functions = detail::run_stage("enumerate functions", [&] { return enumerate_functions(model); });
        report.symbols = detail::run_stage("enumerate symbols", [&] { return enumerate_symbols(model); });
        report.disassembly = detail::run_stage(
                "disassemble entry", [&] { return walk_disassembly(model, entry, options.max_instructions); });

        detail::run_stage("read program metadata", [&] {
            report.program_name = model.name();
            report.image_base = model.image_base().to_string();
            report.language = model.language_id();
        });
        report.entry_point = entry.to_string();

        return report;
    }

    report_document report_assembler::assemble() const {
        try {
            return build();
        } catch (const detail::stage_error& e) {
            return make_error_report(&model, e, e.stage());
        } catch (const std::exception& e) {
            return make_error_report(&model, e, "assemble report");
        } catch (...) {
            error_report report{};
            report.message = "unknown error";
            report.traceback = "stage: assemble report\n  <non-standard exception>: unknown error\n";
            report.program_name = safe_program_name(&model);
            return report;
        }
    }

    std::string safe_program_name(const program_model* model) {
        if (model == nullptr) {
            return std::string{unknown_program_name};
        }
        try {
            auto name = model->name();
            if (!name.empty()) {
                return name;
            }
        } catch (const std::exception& e) {
            debug_log("program name unavailable: ", e.what());
        }
        return std::string{unknown_program_name};
    }

    std::string describe_exception(const std::exception& error, std::string_view stage) {
        std::vector<detail::chain_link> chain{};
        detail::append_chain(error, chain);

        std::string trace{"stage: {}\n"_format(stage)};
        for (size_t i = 0U; i < chain.size(); ++i) {
            trace += "  [{}] {}: {}\n"_format(i, chain[i].type, chain[i].message);
        }
        return trace;
    }

    error_report make_error_report(const program_model* model, const std::exception& error, std::string_view stage) {
        std::vector<detail::chain_link> chain{};
        detail::append_chain(error, chain);

        error_report report{};
        report.message = detail::root_message(chain);
        report.traceback = describe_exception(error, stage);
        report.program_name = safe_program_name(model);
        return report;
    }

}  // namespace quarry
