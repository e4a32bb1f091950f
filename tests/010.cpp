#include "utils.hpp"

#include "internal/platform.hpp"
#include "internal/process.hpp"

#include <csignal>
#include <thread>

namespace quarry::test {
    using namespace std::string_view_literals;
    using detail::at;

    namespace detail {
        static constexpr auto gnu_header = R"(
a.out:     file format elf64-x86-64
architecture: i386:x86-64, flags 0x00000150:
HAS_SYMS, DYNAMIC, D_PAGED
start address 0x0000000000001040

)";

        static constexpr auto llvm_header = "\na.out:\tfile format elf64-x86-64\n"
                                            "architecture: x86_64\n"
                                            "start address: 0x0000000000001040\n\n";

        static constexpr auto gnu_nm = "_start T 0000000000001040 0000000000000008\n"
                                       "main T 0000000000001139 0000000000000016\n"
                                       "_Z6helperi T 0000000000001150 000000000000000b\n"
                                       "counter D 0000000000004010 0000000000000004\n"
                                       "buffer B 0000000000004020 0000000000000010\n"
                                       "puts@GLIBC_2.2.5 U\n"
                                       "__gmon_start__ w\n";

        static constexpr auto gnu_listing = "\n"
                                            "a.out:     file format elf64-x86-64\n"
                                            "\n"
                                            "\n"
                                            "Disassembly of section .text:\n"
                                            "\n"
                                            "0000000000001040 <_start>:\n"
                                            "    1040:\tf3 0f 1e fa          \tendbr64\n"
                                            "    1044:\t31 ed                \txor    ebp,ebp\n"
                                            "\n"
                                            "0000000000001139 <main>:\n"
                                            "    1139:\t55                   \tpush   rbp\n"
                                            "    113a:\t48 89 e5             \tmov    rbp,rsp\n"
                                            "    113d:\t48 8d 05 c0 0e 00 00 \tlea    rax,[rip+0xec0]        "
                                            "# 2004 <_IO_stdin_used+0x4>\n"
                                            "    1144:\t48 b8 88 77 66 55 44 \tmovabs rax,0x1122334455667788\n"
                                            "    114b:\t33 22 11 \n"
                                            "    114e:\tc3                   \tret\n";

        // DOS header with e_lfanew pointing at a "PE\0\0" signature
        static std::string make_pe_image(uint32_t pe_offset) {
            std::string image(pe_offset + 8U, '\0');
            image[0] = 'M';
            image[1] = 'Z';
            for (size_t i = 0U; i < 4U; ++i) {
                image[0x3cU + i] = static_cast<char>((pe_offset >> (8U * i)) & 0xffU);
            }
            image.replace(pe_offset, 4U, "PE\0\0"sv);
            return image;
        }

        static std::string shell_quote(const fs::path& path) {
            return "'" + path.string() + "'";
        }

        // nm and objdump stand-ins that replay canned output
        struct fake_toolchain {
            temp_dir dir{"quarry_010_tools"};
            fs::path nm{dir.path / "fake-nm"};
            fs::path objdump{dir.path / "fake-objdump"};
            fs::path binary{dir.path / "a.out"};

            explicit fake_toolchain(bool objdump_fails = false) {
                write_file(dir.path / "header.txt", gnu_header);
                write_file(dir.path / "listing.txt", gnu_listing);
                write_file(dir.path / "nm.txt", gnu_nm);
                write_file(dir.path / "args.txt", "");
                write_file(binary, "\x7f"
                                   "ELF\x02\x01\x01"sv);

                write_file(nm, "#!/bin/sh\ncat " + shell_quote(dir.path / "nm.txt") + "\n", true);
                if (objdump_fails) {
                    write_file(objdump, "#!/bin/sh\necho 'unknown file format' >&2\nexit 1\n", true);
                }
                else {
                    write_file(
                            objdump,
                            "#!/bin/sh\n"
                            "echo \"$@\" >> " + shell_quote(dir.path / "args.txt") + "\n"
                            "case \"$1\" in\n"
                            "  -f) cat " + shell_quote(dir.path / "header.txt") + " ;;\n"
                            "  *) cat " + shell_quote(dir.path / "listing.txt") + " ;;\n"
                            "esac\n",
                            true);
                }
            }

            toolchain_options options() const {
                return toolchain_options{.nm_path = nm, .objdump_path = objdump};
            }
        };

        static report_document run_for_document(const startup_config& cfg, int expected_code = 0) {
            std::ostringstream out{};
            std::ostringstream err{};
            CHECK(cli::run(cfg, out, err) == expected_code);
            auto json = extract_document(out.str());
            REQUIRE(json);
            auto document = parse_document(*json);
            REQUIRE(document);
            return *document;
        }
    }  // namespace detail

    TEST_CASE("010: nm portable output", "[010][toolchain]") {
        auto entries = parse_nm_output(detail::gnu_nm);
        REQUIRE(entries.size() == 7U);

        CHECK(entries[0].name == "_start");
        CHECK(entries[0].is_text());
        CHECK(entries[0].value == at(0x1040));
        CHECK(entries[0].size == 8U);

        CHECK(entries[2].demangled == "helper(int)");
        CHECK(entries[3].is_data());
        CHECK(entries[4].kind == 'B');
        CHECK(entries[4].size == 16U);

        CHECK(entries[5].name == "puts@GLIBC_2.2.5");
        CHECK(entries[5].demangled == "puts");
        CHECK(entries[5].is_undefined());
        CHECK_FALSE(entries[5].value);
        CHECK(entries[6].is_undefined());

        // archive member headers and blank lines are skipped
        CHECK(parse_nm_output("libx.a[x.o]:\n\nfoo T 10 4\n"sv).size() == 1U);
    }

    TEST_CASE("010: objdump file headers", "[010][toolchain]") {
        auto gnu = parse_objdump_file_header(detail::gnu_header);
        CHECK(gnu.file_format == "elf64-x86-64");
        CHECK(gnu.architecture == "i386:x86-64");
        CHECK(gnu.start_address == at(0x1040));

        auto llvm = parse_objdump_file_header(detail::llvm_header);
        CHECK(llvm.file_format == "elf64-x86-64");
        CHECK(llvm.architecture == "x86_64");
        CHECK(llvm.start_address == at(0x1040));

        CHECK(language_id_for(gnu) == "x86:LE:64:default");
        CHECK(language_id_for(llvm) == "x86:LE:64:default");
        CHECK(pointer_size_for(gnu) == 8U);

        auto language_of = [](std::string format, std::string arch) {
            return language_id_for(objdump_file_header{.file_format = std::move(format), .architecture = std::move(arch)});
        };
        CHECK(language_of("elf32-i386", "i386") == "x86:LE:32:default");
        CHECK(language_of("elf64-littleaarch64", "aarch64") == "AARCH64:LE:64:v8A");
        CHECK(language_of("mach-o arm64", "arm64") == "AARCH64:LE:64:v8A");
        CHECK(language_of("elf32-littlearm", "arm") == "ARM:LE:32:v8");
        CHECK(language_of("elf64-littleriscv", "riscv64") == "RISCV:LE:64:RV64GC");
        CHECK(language_of("elf32-tradbigmips", "mips") == "unknown:mips");

        CHECK(pointer_size_for(objdump_file_header{.file_format = "elf32-littlearm", .architecture = "arm"}) == 4U);
        CHECK(pointer_size_for(objdump_file_header{.file_format = "elf32-tradbigmips", .architecture = "mips"}) == 4U);
        CHECK(pointer_size_for(objdump_file_header{.file_format = "elf64-s390", .architecture = "s390:64-bit"}) == 8U);
    }

    TEST_CASE("010: GNU disassembly listing", "[010][toolchain]") {
        auto listing = parse_objdump_disassembly(detail::gnu_listing);
        REQUIRE(listing.size() == 7U);

        CHECK(listing[0].addr == at(0x1040));
        CHECK(listing[0].mnemonic == "endbr64");
        CHECK(listing[0].operands.empty());
        CHECK(listing[1].operands == "ebp,ebp");

        CHECK(listing[4].mnemonic == "lea");
        CHECK(listing[4].operands == "rax,[rip+0xec0]");
        CHECK(listing[4].comment == "2004 <_IO_stdin_used+0x4>");

        // continuation bytes belong to movabs
        CHECK(listing[5].bytes ==
              std::vector<uint8_t>{0x48, 0xb8, 0x88, 0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11});
        CHECK(listing[6].addr == at(0x114e));
        CHECK(listing[6].mnemonic == "ret");
    }

    TEST_CASE("010: LLVM and AArch64 listings", "[010][toolchain]") {
        auto llvm = parse_objdump_disassembly("0000000000001139 <main>:\n"
                                              "    1139: 55                           \tpushq\t%rbp\n"
                                              "    113a: 48 89 e5                     \tmovq\t%rsp, %rbp\n"sv);
        REQUIRE(llvm.size() == 2U);
        CHECK(llvm[1].mnemonic == "movq");
        CHECK(llvm[1].operands == "%rsp, %rbp");
        CHECK(llvm[1].bytes == std::vector<uint8_t>{0x48, 0x89, 0xe5});

        auto arm = parse_objdump_disassembly("0000000000000714 <main>:\n"
                                             " 714:\ta9bf7bfd \tstp\tx29, x30, [sp, #-16]!\n"
                                             " 718:\t910003fd \tmov\tx29, sp\n"
                                             " 71c:\t52800000 \tmov\tw0, #0x0                   \t// #0\n"sv);
        REQUIRE(arm.size() == 3U);
        CHECK(arm[0].bytes == std::vector<uint8_t>{0xfd, 0x7b, 0xbf, 0xa9});
        CHECK(arm[0].operands == "x29, x30, [sp, #-16]!");
        CHECK(arm[0].comment.empty());
        CHECK(arm[2].operands == "w0, #0x0");
        CHECK(arm[2].comment == "#0");
    }

    TEST_CASE("010: binary format detection", "[010][toolchain]") {
        CHECK(detect_binary_format("\x7f"
                                   "ELF\x02"sv) == binary_format::elf);
        CHECK(detect_binary_format("\xcf\xfa\xed\xfe"sv) == binary_format::macho);
        CHECK(detect_binary_format("\xfe\xed\xfa\xce"sv) == binary_format::macho);
        CHECK(detect_binary_format("{\"schema_version\": 1}"sv) == binary_format::unknown);
        CHECK(detect_binary_format(""sv) == binary_format::unknown);

        CHECK(detect_binary_format(detail::make_pe_image(0x40U)) == binary_format::pe);
        auto far_image = detail::make_pe_image(0x80U);
        // the signature lies beyond the bytes handed in
        CHECK(detect_binary_format(std::string_view{far_image}.substr(0U, 0x40U)) == binary_format::unknown);
        CHECK(detect_binary_format("MZ\x90\x00"sv) == binary_format::unknown);

        detail::temp_dir dir{"quarry_010_format"};
        CHECK(detect_binary_format(dir.path / "missing") == binary_format::unknown);
        detail::write_file(dir.path / "tiny", "MZ");
        CHECK(detect_binary_format(dir.path / "tiny") == binary_format::unknown);

        detail::write_file(dir.path / "notes.txt", "MZ is a prefix, not a format: " + std::string(64U, '.'));
        CHECK(detect_binary_format(dir.path / "notes.txt") == binary_format::unknown);

        detail::write_file(dir.path / "stub.exe", detail::make_pe_image(0x80U));
        CHECK(detect_binary_format(dir.path / "stub.exe") == binary_format::pe);

        auto truncated = detail::make_pe_image(0x80U);
        truncated.resize(0x82U);
        detail::write_file(dir.path / "truncated.exe", truncated);
        CHECK(detect_binary_format(dir.path / "truncated.exe") == binary_format::unknown);
    }

    TEST_CASE("010: configured tool paths", "[010][toolchain]") {
        namespace tool = internal::platform::tool;

        // configure either found an executable or kept the bare name
        CHECK_FALSE(tool::llvm_nm_path.empty());
        CHECK(tool::llvm_nm_path.ends_with("nm"sv));
        CHECK_FALSE(tool::llvm_objdump_path.empty());
        CHECK(tool::llvm_objdump_path.ends_with("objdump"sv));
    }

    TEST_CASE("010: tool command lines", "[010][toolchain]") {
        toolchain_options llvm{.nm_path = "/opt/llvm/bin/llvm-nm", .objdump_path = "/opt/llvm/bin/llvm-objdump"};
        CHECK(make_nm_command(llvm, "a.out") == std::vector<std::string>{"/opt/llvm/bin/llvm-nm", "-P", "-n", "a.out"});
        CHECK(make_objdump_header_command(llvm, "a.out") ==
              std::vector<std::string>{"/opt/llvm/bin/llvm-objdump", "-f", "a.out"});
        CHECK(make_objdump_disassembly_command(llvm, "a.out", true) ==
              std::vector<std::string>{
                      "/opt/llvm/bin/llvm-objdump", "-d", "--demangle", "--x86-asm-syntax=intel", "a.out"});
        CHECK(make_objdump_disassembly_command(llvm, "a.out", false) ==
              std::vector<std::string>{"/opt/llvm/bin/llvm-objdump", "-d", "--demangle", "a.out"});

        toolchain_options gnu{.nm_path = "nm", .objdump_path = "objdump", .syntax = asm_syntax::att};
        CHECK(make_objdump_disassembly_command(gnu, "a.out", true) ==
              std::vector<std::string>{"objdump", "-d", "--demangle", "-M", "att", "a.out"});
    }

    TEST_CASE("010: tool output becomes a program", "[010][toolchain]") {
        auto program = build_imported_program(
                "a.out",
                parse_objdump_file_header(detail::gnu_header),
                parse_nm_output(detail::gnu_nm),
                parse_objdump_disassembly(detail::gnu_listing));

        CHECK(program->name() == "a.out");
        CHECK(program->image_base() == at(0x1000));
        CHECK(program->language_id() == "x86:LE:64:default");
        CHECK(program->external_entry_points() == std::vector<address>{at(0x1040)});

        auto functions = program->functions();
        REQUIRE(functions.size() == 3U);
        CHECK(functions[0].name == "_start");
        CHECK(functions[0].signature == "_start()");
        CHECK(functions[1].name == "main");
        CHECK(body_to_string(functions[1].body) == "[0x1139, 0x114e]");
        CHECK(functions[2].name == "helper");
        CHECK(functions[2].signature == "helper(int)");

        auto movabs = program->instruction_at(at(0x1144));
        REQUIRE(movabs);
        CHECK(movabs->length == 10U);
        CHECK(program->instruction_at(at(0x114e)));
        CHECK(program->comment_at(at(0x113d), comment_kind::eol) == "2004 <_IO_stdin_used+0x4>");

        auto counter = program->data_at(at(0x4010));
        REQUIRE(counter);
        CHECK(counter->type.name == "undefined4");
        auto buffer = program->data_at(at(0x4020));
        REQUIRE(buffer);
        CHECK(buffer->type.name == "undefined1[16]");

        auto symbols = enumerate_symbols(*program);
        REQUIRE(symbols.size() == 5U);
        CHECK(symbols[2] == symbol_record{.name = "helper", .address = "0x1150", .type = "Function", .source = "IMPORTED"});
        CHECK(symbols[3].type == "Data");

        report_assembler assembler{*program, nullptr, report_options{.max_instructions = 4U}};
        auto document = assembler.assemble();
        REQUIRE_FALSE(is_error(document));
        const auto& report = std::get<analysis_report>(document);
        CHECK(report.entry_point == "0x1040");
        REQUIRE(report.disassembly.size() == 2U);
        CHECK(report.disassembly[0].bytes == "f3 0f 1e fa");
    }

    TEST_CASE("010: import through stand-in tools", "[010][toolchain]") {
        detail::fake_toolchain tools{};
        auto program = import_binary(tools.binary, tools.options());
        CHECK(program->name() == "a.out");
        CHECK(program->functions().size() == 3U);

        auto args = detail::read_file(tools.dir.path / "args.txt");
        CHECK(args.find("-f " + tools.binary.string()) != std::string::npos);
        CHECK(args.find("-d --demangle -M intel " + tools.binary.string()) != std::string::npos);

        CHECK_THROWS_AS(import_binary(tools.dir.path / "missing", tools.options()), std::runtime_error);

        detail::fake_toolchain broken{true};
        try {
            (void)import_binary(broken.binary, broken.options());
            FAIL("import succeeded");
        } catch (const std::runtime_error& e) {
            CHECK(std::string{e.what()}.find("-f failed (exit 1): unknown file format") != std::string::npos);
        }
    }

    TEST_CASE("010: subprocess capture", "[010][process]") {
        using internal::process::run_subprocess;

        auto ok = run_subprocess({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
        CHECK(ok.exit_code == 3);
        CHECK(ok.stdout_output == "out\n");
        CHECK(ok.stderr_output == "err\n");
        CHECK_FALSE(ok.timed_out);

        auto missing = run_subprocess({"/nonexistent/quarry-tool"});
        CHECK(missing.exit_code == 127);

        auto started = std::chrono::steady_clock::now();
        auto slow = run_subprocess({"/bin/sh", "-c", "sleep 5"}, std::chrono::milliseconds{200});
        CHECK(slow.timed_out);
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds{4});

        std::stop_source source{};
        std::jthread canceller{[&source] {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
            source.request_stop();
        }};
        auto cancelled = run_subprocess({"/bin/sh", "-c", "sleep 5"}, std::nullopt, source.get_token());
        CHECK(cancelled.cancelled);
        CHECK_FALSE(cancelled.timed_out);

        // output closed early, child still running
        auto silent_started = std::chrono::steady_clock::now();
        auto silent = run_subprocess(
                {"/bin/sh", "-c", "exec >&- 2>&-; sleep 5"}, std::chrono::milliseconds{200});
        CHECK(silent.timed_out);
        CHECK(silent.exit_code == 128 + SIGKILL);
        CHECK(std::chrono::steady_clock::now() - silent_started < std::chrono::seconds{4});

        std::stop_source silent_source{};
        std::jthread silent_canceller{[&silent_source] {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
            silent_source.request_stop();
        }};
        auto silent_cancelled =
                run_subprocess({"/bin/sh", "-c", "exec >&- 2>&-; sleep 5"}, std::nullopt, silent_source.get_token());
        CHECK(silent_cancelled.cancelled);

        CHECK_THROWS_AS(run_subprocess({}), std::runtime_error);
    }

    TEST_CASE("010: external decompiler", "[010][decompiler]") {
        detail::temp_dir dir{"quarry_010_decompiler"};
        auto binary = dir.path / "target.bin";
        detail::write_file(binary, "\x7f"
                                   "ELF"sv);
        auto good = dir.path / "good.sh";
        detail::write_file(
                good,
                "#!/bin/sh\n"
                "echo \"// decompiled $1\"\n"
                "echo \"int $2(void) {\"\n"
                "echo \"  return 0;\"\n"
                "echo \"}\"\n",
                true);
        auto bad = dir.path / "bad.sh";
        detail::write_file(bad, "#!/bin/sh\necho 'no such function' >&2\nexit 3\n", true);
        auto slow = dir.path / "slow.sh";
        detail::write_file(slow, "#!/bin/sh\nsleep 5\n", true);

        memory_program program{program_metadata{.name = "target"}};
        function_info entry_fn{.name = "main", .entry = at(0x1139)};

        SECTION("completed") {
            external_decompiler decompiler{good.string() + " {address} {name}", binary};
            decompiler.open(program);
            auto result = decompiler.decompile(entry_fn, std::chrono::seconds{10}, {});
            CHECK(result.status == decompile_status::completed);
            CHECK(result.code.starts_with("// decompiled 0x1139\n"));
            CHECK(result.signature == "int main(void)");
        }

        SECTION("failed") {
            external_decompiler decompiler{bad.string(), binary};
            decompiler.open(program);
            auto result = decompiler.decompile(entry_fn, std::chrono::seconds{10}, {});
            CHECK(result.status == decompile_status::failed);
            CHECK(result.error_message == "exit 3: no such function");
        }

        SECTION("timed out") {
            external_decompiler decompiler{slow.string(), binary};
            decompiler.open(program);
            auto result = decompiler.decompile(entry_fn, std::chrono::seconds{1}, {});
            CHECK(result.status == decompile_status::timed_out);
        }

        SECTION("adapter drops unusable results") {
            external_decompiler decompiler{bad.string(), binary};
            decompiler.open(program);
            CHECK_FALSE(decompile_function(decompiler, entry_fn, std::chrono::seconds{10}));
        }

        SECTION("placeholders") {
            external_decompiler explicit_args{"dec --in={binary} --at {address} {name}", binary};
            CHECK(explicit_args.command_for(entry_fn) ==
                  std::vector<std::string>{"dec", "--in=" + binary.string(), "--at", "0x1139", "main"});

            external_decompiler appended{"dec --quiet {name}", binary};
            CHECK(appended.command_for(entry_fn) ==
                  std::vector<std::string>{"dec", "--quiet", "main", binary.string(), "0x1139"});
        }

        SECTION("open failures") {
            external_decompiler empty{"  ", binary};
            CHECK_THROWS_AS(empty.open(program), engine_error);

            external_decompiler no_target{good.string(), dir.path / "missing.bin"};
            CHECK_THROWS_AS(no_target.open(program), engine_error);

            external_decompiler unopened{good.string(), binary};
            CHECK_THROWS_AS(unopened.decompile(entry_fn, std::chrono::seconds{1}, {}), engine_error);
        }
    }

    TEST_CASE("010: command runs against a program database", "[010][cli]") {
        detail::temp_dir dir{"quarry_010_cli"};
        auto database = dir.path / "sample.json";
        auto program = detail::make_sample_program();
        auto decompiler = detail::make_sample_decompiler();
        save_program_database(database, *program, decompiler.get());

        SECTION("report") {
            startup_config cfg{.input_path = database, .max_instructions = 2U};
            auto document = detail::run_for_document(cfg);
            REQUIRE_FALSE(is_error(document));
            const auto& report = std::get<analysis_report>(document);
            CHECK(report.program_name == "sample.bin");
            CHECK(report.disassembly.size() == 2U);
            REQUIRE(report.entry_function);
            CHECK(report.entry_function->code == "int main(void)\n{\n  return 0;\n}\n");
        }

        SECTION("rename and save") {
            auto saved = dir.path / "renamed.json";
            startup_config cfg{
                    .input_path = database,
                    .rename = rename_request{.address = "0x1010", .new_name = "worker"},
                    .save_path = saved};
            std::ostringstream out{};
            std::ostringstream err{};
            CHECK(cli::run(cfg, out, err) == 0);

            auto json = extract_document(out.str());
            REQUIRE(json);
            auto result = parse_mutation_result(*json);
            REQUIRE(result);
            CHECK(*result == mutation_result{.success = true, .message = "Renamed to worker"});

            auto reloaded = load_program_database(saved);
            auto functions = reloaded.program->functions();
            REQUIRE(functions.size() == 2U);
            CHECK(functions[1].name == "worker");
            REQUIRE(reloaded.decompiler);
        }

        SECTION("failed mutation leaves the database alone") {
            auto saved = dir.path / "untouched.json";
            startup_config cfg{
                    .input_path = database,
                    .set_type = set_type_request{.address = "0x1000", .type_name = "int"},
                    .save_path = saved};
            std::ostringstream out{};
            std::ostringstream err{};
            CHECK(cli::run(cfg, out, err) == 0);
            auto result = parse_mutation_result(*extract_document(out.str()));
            REQUIRE(result);
            CHECK_FALSE(result->success);
            CHECK(result->message == "No data at address");
            CHECK_FALSE(std::filesystem::exists(saved));
        }

        SECTION("save failure") {
            startup_config cfg{.input_path = database, .save_path = dir.path / "no" / "such" / "dir.json"};
            auto document = detail::run_for_document(cfg, 1);
            CHECK_FALSE(is_error(document));
        }

        SECTION("load failures") {
            auto broken = dir.path / "broken.json";
            detail::write_file(broken, R"({"schema_version": 7})");

            startup_config report_cfg{.input_path = broken, .quiet = true};
            auto document = detail::run_for_document(report_cfg);
            REQUIRE(is_error(document));
            const auto& error = std::get<error_report>(document);
            CHECK(error.traceback.starts_with("stage: load\n"));
            CHECK(error.message.find("unsupported schema_version") != std::string::npos);
            CHECK(error.program_name == "unknown");

            startup_config mutation_cfg{
                    .input_path = broken,
                    .rename = rename_request{.address = "0x1000", .new_name = "x"},
                    .quiet = true};
            std::ostringstream out{};
            std::ostringstream err{};
            CHECK(cli::run(mutation_cfg, out, err) == 0);
            auto result = parse_mutation_result(*extract_document(out.str()));
            REQUIRE(result);
            CHECK_FALSE(result->success);
            CHECK(err.str().empty());
        }

        SECTION("no input") {
            std::ostringstream out{};
            std::ostringstream err{};
            CHECK(cli::run(startup_config{}, out, err) == 2);
            CHECK(out.str().empty());
        }
    }

    TEST_CASE("010: command runs against a binary", "[010][cli]") {
        detail::fake_toolchain tools{};
        auto script = tools.dir.path / "decompile.sh";
        detail::write_file(script, "#!/bin/sh\necho \"int $2(void)\"\necho \"{ }\"\n", true);

        startup_config cfg{
                .input_path = tools.binary,
                .nm_path = tools.nm,
                .objdump_path = tools.objdump,
                .decompiler_command = script.string() + " {address} {name}"};
        auto document = detail::run_for_document(cfg);
        REQUIRE_FALSE(is_error(document));
        const auto& report = std::get<analysis_report>(document);
        CHECK(report.program_name == "a.out");
        CHECK(report.entry_point == "0x1040");
        REQUIRE(report.entry_function);
        CHECK(report.entry_function->name == "_start");
        CHECK(report.entry_function->signature == "int _start(void)");

        detail::fake_toolchain broken{true};
        startup_config broken_cfg{
                .input_path = broken.binary, .nm_path = broken.nm, .objdump_path = broken.objdump, .quiet = true};
        auto failure = detail::run_for_document(broken_cfg);
        REQUIRE(is_error(failure));
        CHECK(std::get<error_report>(failure).message.find("unknown file format") != std::string::npos);
    }
}  // namespace quarry::test
