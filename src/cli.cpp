#include "quarry/cli.hpp"

#include "quarry/database.hpp"
#include "quarry/document.hpp"
#include "quarry/format.hpp"
#include "quarry/mutation.hpp"
#include "quarry/toolchain.hpp"

#include "internal/files.hpp"
#include "internal/platform.hpp"
#include "internal/types.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace quarry::literals;

namespace quarry::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;
    namespace platform = internal::platform;

    // bare tool names resolve to the executables found at configure time
    static fs::path resolve_tool_path(const fs::path& configured, std::string_view bare_name, std::string_view found) {
        if (configured == fs::path{bare_name} && !found.empty()) {
            return fs::path{found};
        }
        return configured;
    }

    static std::string_view optional_path_or_default(const std::optional<fs::path>& value) {
        static constexpr auto default_value = "<none>"sv;
        if (value) {
            return value->native();
        }
        return default_value;
    }

    static input_kind resolve_input_kind(const startup_config& cfg) {
        if (cfg.input != input_kind::automatic) {
            return cfg.input;
        }
        return detect_binary_format(*cfg.input_path) == binary_format::unknown ? input_kind::database
                                                                               : input_kind::binary;
    }

    struct loaded_engine {
        std::unique_ptr<memory_program> program{};
        std::unique_ptr<memory_decompiler> recorded{};
        std::unique_ptr<external_decompiler> external{};

        decompiler_service* decompiler() const {
            if (external) {
                return external.get();
            }
            return recorded.get();
        }
    };

    static loaded_engine load_engine(const startup_config& cfg, std::ostream& err) {
        loaded_engine engine{};
        auto kind = resolve_input_kind(cfg);
        if (cfg.verbose) {
            err << "note: reading {} as {}\n"_format(cfg.input_path->string(), kind);
        }

        if (kind == input_kind::binary) {
            toolchain_options options{
                    .nm_path = resolve_tool_path(cfg.nm_path, platform::tool::llvm_nm, platform::tool::llvm_nm_path),
                    .objdump_path = resolve_tool_path(
                            cfg.objdump_path, platform::tool::llvm_objdump, platform::tool::llvm_objdump_path),
                    .syntax = cfg.syntax,
                    .tool_timeout_ms = cfg.tool_timeout_ms,
                    .verbose = cfg.verbose};
            engine.program = import_binary(*cfg.input_path, options);
            if (!cfg.decompiler_command.empty()) {
                engine.external =
                        std::make_unique<external_decompiler>(cfg.decompiler_command, *cfg.input_path, cfg.verbose);
            }
            return engine;
        }

        auto loaded = load_program_database(*cfg.input_path);
        engine.program = std::move(loaded.program);
        engine.recorded = std::move(loaded.decompiler);
        if (!cfg.decompiler_command.empty() && !cfg.quiet) {
            err << "warning: --decompiler has no effect on a program database\n";
        }
        return engine;
    }

    static bool save_if_requested(const startup_config& cfg, const loaded_engine& engine, std::ostream& err) {
        if (!cfg.save_path) {
            return true;
        }
        try {
            save_program_database(*cfg.save_path, *engine.program, engine.recorded.get());
        } catch (const std::exception& e) {
            err << "error: " << e.what() << '\n';
            return false;
        }
        if (cfg.verbose) {
            err << "note: saved program database to " << cfg.save_path->string() << '\n';
        }
        return true;
    }

    static mutation_result run_mutation(const startup_config& cfg, memory_program& program) {
        mutation_ops ops{program};
        if (cfg.rename) {
            return ops.rename_symbol(cfg.rename->address, cfg.rename->new_name);
        }
        return ops.set_data_type(cfg.set_type->address, cfg.set_type->type_name);
    }

}}  // namespace quarry::cli::detail

namespace quarry::cli {

    void apply_config_file(const std::filesystem::path& path, startup_config& cfg) {
        auto data = internal::files::read_json_file<internal::persisted_config>(path);
        internal::files::validate_supported_schema_version(data.schema_version, path.string());

        if (data.nm) {
            cfg.nm_path = *data.nm;
        }
        if (data.objdump) {
            cfg.objdump_path = *data.objdump;
        }
        if (data.decompiler) {
            cfg.decompiler_command = *data.decompiler;
        }
        if (data.asm_syntax && !try_parse_asm_syntax(*data.asm_syntax, cfg.syntax)) {
            throw std::runtime_error("invalid asm_syntax in {}: {}"_format(path.string(), *data.asm_syntax));
        }
        if (data.max_instructions) {
            cfg.max_instructions = *data.max_instructions;
        }
        if (data.decompile_timeout_s) {
            if (*data.decompile_timeout_s <= 0) {
                throw std::runtime_error("decompile_timeout_s must be positive in {}"_format(path.string()));
            }
            cfg.decompile_timeout = std::chrono::seconds{*data.decompile_timeout_s};
        }
        if (data.tool_timeout_ms) {
            if (*data.tool_timeout_ms <= 0) {
                throw std::runtime_error("tool_timeout_ms must be positive in {}"_format(path.string()));
            }
            cfg.tool_timeout_ms = *data.tool_timeout_ms;
        }
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << ("  input={}\n"
               "  input_kind={}\n"
               "  config={}\n"
               "  nm={}\n"
               "  objdump={}\n"
               "  asm_syntax={}\n"
               "  tool_timeout_ms={}\n"
               "  decompiler={}\n"
               "  max_instructions={}\n"
               "  decompile_timeout={}\n"
               "  save={}\n"_format(
                       detail::optional_path_or_default(cfg.input_path),
                       cfg.input,
                       detail::optional_path_or_default(cfg.config_path),
                       cfg.nm_path.string(),
                       cfg.objdump_path.string(),
                       cfg.syntax,
                       cfg.tool_timeout_ms,
                       cfg.decompiler_command.empty() ? "<none>"sv : std::string_view{cfg.decompiler_command},
                       cfg.max_instructions,
                       cfg.decompile_timeout.count(),
                       detail::optional_path_or_default(cfg.save_path)));
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"quarry: binary analysis report aggregator"};

        bool show_version = false;
        std::string input_arg{};
        std::string program_arg{};
        std::string input_kind_arg{std::string{to_string(cfg.input)}};
        std::string config_arg{};
        std::string nm_arg{cfg.nm_path.string()};
        std::string objdump_arg{cfg.objdump_path.string()};
        std::string syntax_arg{std::string{to_string(cfg.syntax)}};
        std::string decompiler_arg{cfg.decompiler_command};
        uint32_t max_instructions_arg{cfg.max_instructions};
        int decompile_timeout_arg{static_cast<int>(cfg.decompile_timeout.count())};
        int tool_timeout_arg{cfg.tool_timeout_ms};
        std::vector<std::string> rename_args{};
        std::vector<std::string> set_type_args{};
        std::string save_arg{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("input", input_arg, "Program database (.json) or binary image");
        app.add_option("--program", program_arg, "Program database (.json)");
        app.add_option("--input-kind", input_kind_arg, "Input kind: auto|database|binary (auto sniffs ELF, PE and Mach-O headers)");
        app.add_option("--config", config_arg, "JSON config file applied before command-line flags");
        app.add_option("--nm", nm_arg, "nm executable used to import binaries");
        app.add_option("--objdump", objdump_arg, "objdump executable used to import binaries");
        app.add_option("--asm-syntax", syntax_arg, "x86 disassembly syntax: intel|att");
        app.add_option("--tool-timeout", tool_timeout_arg, "Per-tool timeout in milliseconds");
        app.add_option("--decompiler", decompiler_arg, "External decompiler command ({binary} {address} {name})");
        app.add_option("--max-instructions", max_instructions_arg, "Disassembly bound from the entry point");
        app.add_option("--decompile-timeout", decompile_timeout_arg, "Decompile timeout in seconds");
        app.add_option("--rename", rename_args, "Rename the first symbol at ADDR")
                ->expected(2)
                ->type_name("ADDR NAME");
        app.add_option("--set-type", set_type_args, "Set the type of the data at ADDR")
                ->expected(2)
                ->type_name("ADDR TYPE");
        app.add_option("--save", save_arg, "Write the program database after the command ran");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress warnings on stderr");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose notes on stderr");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "quarry " << QUARRY_VERSION << '\n';
            return std::optional<int>{0};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!rename_args.empty() && !set_type_args.empty()) {
            std::cerr << "--rename and --set-type are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!input_arg.empty() && !program_arg.empty()) {
            std::cerr << "give either a positional input or --program, not both\n";
            return std::optional<int>{2};
        }

        // file values first; explicit flags win
        if (!config_arg.empty()) {
            cfg.config_path = config_arg;
            try {
                apply_config_file(*cfg.config_path, cfg);
            } catch (const std::exception& e) {
                std::cerr << "error: " << e.what() << '\n';
                return std::optional<int>{2};
            }
        }

        auto given = [&app](std::string_view name) { return app.get_option(std::string{name})->count() > 0U; };

        if (given("--input-kind"sv) && !try_parse_input_kind(input_kind_arg, cfg.input)) {
            std::cerr << "invalid --input-kind value: " << input_kind_arg << " (expected auto|database|binary)\n";
            return std::optional<int>{2};
        }
        if (given("--asm-syntax"sv) && !try_parse_asm_syntax(syntax_arg, cfg.syntax)) {
            std::cerr << "invalid --asm-syntax value: " << syntax_arg << " (expected intel|att)\n";
            return std::optional<int>{2};
        }
        if (given("--decompile-timeout"sv)) {
            if (decompile_timeout_arg <= 0) {
                std::cerr << "invalid --decompile-timeout value: " << decompile_timeout_arg << " (expected > 0)\n";
                return std::optional<int>{2};
            }
            cfg.decompile_timeout = std::chrono::seconds{decompile_timeout_arg};
        }
        if (given("--tool-timeout"sv)) {
            if (tool_timeout_arg <= 0) {
                std::cerr << "invalid --tool-timeout value: " << tool_timeout_arg << " (expected > 0)\n";
                return std::optional<int>{2};
            }
            cfg.tool_timeout_ms = tool_timeout_arg;
        }
        if (given("--max-instructions"sv)) {
            cfg.max_instructions = max_instructions_arg;
        }
        if (given("--nm"sv)) {
            cfg.nm_path = nm_arg;
        }
        if (given("--objdump"sv)) {
            cfg.objdump_path = objdump_arg;
        }
        if (given("--decompiler"sv)) {
            cfg.decompiler_command = decompiler_arg;
        }

        if (!program_arg.empty()) {
            cfg.input_path = program_arg;
            cfg.input = input_kind::database;
        }
        else if (!input_arg.empty()) {
            cfg.input_path = input_arg;
        }
        if (rename_args.size() == 2U) {
            cfg.rename = rename_request{.address = rename_args[0], .new_name = rename_args[1]};
        }
        if (set_type_args.size() == 2U) {
            cfg.set_type = set_type_request{.address = set_type_args[0], .type_name = set_type_args[1]};
        }
        if (!save_arg.empty()) {
            cfg.save_path = save_arg;
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (!cfg.input_path) {
            std::cerr << "no input given (expected <input> or --program)\n";
            return std::optional<int>{2};
        }

        return std::nullopt;
    }

    int run(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        if (!cfg.input_path) {
            err << "error: no input given\n";
            return 2;
        }

        bool mutating = cfg.rename || cfg.set_type;

        detail::loaded_engine engine{};
        try {
            engine = detail::load_engine(cfg, err);
        } catch (const std::exception& e) {
            if (!cfg.quiet) {
                err << "error: " << e.what() << '\n';
            }
            if (mutating) {
                emit_document(out, to_json(mutation_result{.success = false, .message = e.what()}));
            }
            else {
                emit_document(out, to_json(make_error_report(nullptr, e, "load")));
            }
            return 0;
        }

        if (mutating) {
            auto result = detail::run_mutation(cfg, *engine.program);
            emit_document(out, to_json(result));
            if (result.success && !detail::save_if_requested(cfg, engine, err)) {
                return 1;
            }
            return 0;
        }

        report_assembler assembler{
                *engine.program,
                engine.decompiler(),
                report_options{
                        .max_instructions = cfg.max_instructions,
                        .decompile_timeout = cfg.decompile_timeout,
                        .verbose = cfg.verbose}};
        auto document = assembler.assemble();
        emit_document(out, to_json(document));

        if (!is_error(document) && !detail::save_if_requested(cfg, engine, err)) {
            return 1;
        }
        return 0;
    }

}  // namespace quarry::cli
