#include "anchordrop/cli.hpp"

#include "anchordrop/ledger.hpp"

#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace anchordrop::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr auto version_string = "anchordrop 0.1.0"sv;

        static void print_config(const run_config& cfg, std::ostream& os) {
            os << "ledger_dir=" << cfg.ledger_dir.string() << '\n';
            os << "ledger_file=" << cfg.ledger_file.string() << '\n';
            os << "ledger_path=" << ledger_path(cfg).string() << '\n';
            os << "invalid_input=" << to_string(cfg.invalid_input) << '\n';
            os << "on_corrupt=" << to_string(cfg.on_corrupt) << '\n';
            os << "write_mode=" << to_string(cfg.write_mode) << '\n';
            os << "quiet=" << (cfg.quiet ? "true" : "false") << '\n';
            os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg, drop_request& request) {
        CLI::App app{"Drop a CLAUDE/AGENTS memory anchor for KB synch", "anchordrop"};

        bool show_version = false;
        bool strict = false;
        std::string file_arg{};
        std::string line_arg{};
        std::string desc_arg{};
        std::string kind_arg{default_anchor_kind};
        std::string ledger_dir_arg{cfg.ledger_dir.string()};
        std::string ledger_file_arg{cfg.ledger_file.string()};
        std::string invalid_input_arg{std::string{to_string(cfg.invalid_input)}};
        std::string on_corrupt_arg{std::string{to_string(cfg.on_corrupt)}};
        std::string write_mode_arg{std::string{to_string(cfg.write_mode)}};

        app.add_option("file", file_arg, "File to annotate");
        app.add_option("line", line_arg, "1-based line the anchor is inserted at");
        app.add_option("description", desc_arg, "Text written into the comment and the ledger entry");
        app.add_option("kind", kind_arg, "Anchor category")->capture_default_str();

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--ledger-dir", ledger_dir_arg, "Directory holding the anchors ledger")->capture_default_str();
        app.add_option("--ledger-file", ledger_file_arg, "Ledger file name")->capture_default_str();
        app.add_option("--invalid-input", invalid_input_arg, "Exit status for missing file or bad line: ok|fail");
        app.add_flag("--strict", strict, "Same as --invalid-input fail");
        app.add_option("--on-corrupt", on_corrupt_arg, "Unparseable ledger handling: reinitialize|fail");
        app.add_option("--write-mode", write_mode_arg, "File write strategy: overwrite|atomic");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress the confirmation line");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_invalid_input_policy(invalid_input_arg, cfg.invalid_input)) {
            std::cerr << "invalid --invalid-input value: " << invalid_input_arg << " (expected ok|fail)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_corrupt_ledger_policy(on_corrupt_arg, cfg.on_corrupt)) {
            std::cerr << "invalid --on-corrupt value: " << on_corrupt_arg << " (expected reinitialize|fail)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_write_strategy(write_mode_arg, cfg.write_mode)) {
            std::cerr << "invalid --write-mode value: " << write_mode_arg << " (expected overwrite|atomic)\n";
            return std::optional<int>{2};
        }
        if (strict) {
            cfg.invalid_input = invalid_input_policy::exit_nonzero;
        }
        if (ledger_file_arg.empty()) {
            std::cerr << "--ledger-file must be non-empty\n";
            return std::optional<int>{2};
        }
        cfg.ledger_dir = ledger_dir_arg;
        cfg.ledger_file = ledger_file_arg;

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (app.count("file") == 0U || app.count("line") == 0U || app.count("description") == 0U) {
            std::cerr << "usage: anchordrop [options] <file> <line> <description> [kind]\n";
            return std::optional<int>{2};
        }

        auto line = utils::parse_arithmetic<std::size_t>(utils::trim_view(line_arg));
        if (!line) {
            std::cerr << "invalid line value: " << line_arg << " (expected a non-negative integer)\n";
            return std::optional<int>{2};
        }

        request.file = file_arg;
        request.line = *line;
        request.description = desc_arg;
        request.kind = kind_arg;
        return std::nullopt;
    }

    int run(const run_config& cfg, const drop_request& request) {
        auto result = drop_anchor(request, cfg, std::cout, std::cerr);
        return exit_code_for(result, cfg);
    }

    int main_entry(int argc, char** argv) {
        try {
            run_config cfg{};
            drop_request request{};
            if (auto cli_result = parse_cli(argc, argv, cfg, request)) {
                return *cli_result;
            }

            return run(cfg, request);
        } catch (std::exception& e) {
            std::cerr << "Error: " << e.what() << '\n';
            return 1;
        } catch (...) {
            std::cerr << "Error: unknown exception\n";
            return 1;
        }
    }

}  // namespace anchordrop::cli
