#pragma once

#include "utils.hpp"

#include <filesystem>
#include <string_view>

namespace anchordrop {

    using namespace std::string_view_literals;

    /*
     * anchordrop Run Config Options
     *
     * Ledger storage
     * - ledger_dir: Directory holding the ledger file, relative to the working directory unless absolute.
     * - ledger_file: Ledger file name inside ledger_dir.
     *
     * Failure handling
     * - invalid_input: Exit status used when the target file is missing or the line is out of range.
     *     report_and_succeed prints the message and exits 0; exit_nonzero prints it and exits 2.
     * - on_corrupt: What loading does with a ledger that exists but does not parse.
     *     reinitialize_on_corrupt warns and starts a fresh record (prior entries are lost);
     *     fail_on_corrupt aborts the run without touching the ledger.
     *
     * Writes
     * - write_mode: overwrite rewrites files in place; atomic writes a sibling temp file and renames it.
     *
     * Output
     * - quiet/verbose: Suppress the confirmation line, or trace key/comment/ledger details on stderr.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved config and exit.
     */

    enum class invalid_input_policy { report_and_succeed, exit_nonzero };
    enum class corrupt_ledger_policy { reinitialize_on_corrupt, fail_on_corrupt };
    enum class write_strategy { overwrite, atomic };

    inline constexpr std::string_view to_string(invalid_input_policy policy) {
        switch (policy) {
            case invalid_input_policy::report_and_succeed:
                return "ok"sv;
            case invalid_input_policy::exit_nonzero:
                return "fail"sv;
        }
        return "ok"sv;
    }

    inline constexpr bool try_parse_invalid_input_policy(std::string_view text, invalid_input_policy& out) {
        if (utils::str_case_eq(text, "ok"sv) || utils::str_case_eq(text, "succeed"sv)) {
            out = invalid_input_policy::report_and_succeed;
            return true;
        }
        if (utils::str_case_eq(text, "fail"sv) || utils::str_case_eq(text, "nonzero"sv)) {
            out = invalid_input_policy::exit_nonzero;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(corrupt_ledger_policy policy) {
        switch (policy) {
            case corrupt_ledger_policy::reinitialize_on_corrupt:
                return "reinitialize"sv;
            case corrupt_ledger_policy::fail_on_corrupt:
                return "fail"sv;
        }
        return "reinitialize"sv;
    }

    inline constexpr bool try_parse_corrupt_ledger_policy(std::string_view text, corrupt_ledger_policy& out) {
        if (utils::str_case_eq(text, "reinitialize"sv) || utils::str_case_eq(text, "reinit"sv)) {
            out = corrupt_ledger_policy::reinitialize_on_corrupt;
            return true;
        }
        if (utils::str_case_eq(text, "fail"sv)) {
            out = corrupt_ledger_policy::fail_on_corrupt;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(write_strategy strategy) {
        switch (strategy) {
            case write_strategy::overwrite:
                return "overwrite"sv;
            case write_strategy::atomic:
                return "atomic"sv;
        }
        return "atomic"sv;
    }

    inline constexpr bool try_parse_write_strategy(std::string_view text, write_strategy& out) {
        if (utils::str_case_eq(text, "overwrite"sv)) {
            out = write_strategy::overwrite;
            return true;
        }
        if (utils::str_case_eq(text, "atomic"sv)) {
            out = write_strategy::atomic;
            return true;
        }
        return false;
    }

    inline constexpr auto default_ledger_dir = ".claude/memory_anchors"sv;
    inline constexpr auto default_ledger_file = "anchors.json"sv;
    inline constexpr auto default_anchor_kind = "line"sv;

    struct run_config {
        std::filesystem::path ledger_dir{default_ledger_dir};
        std::filesystem::path ledger_file{default_ledger_file};

        invalid_input_policy invalid_input{invalid_input_policy::report_and_succeed};
        corrupt_ledger_policy on_corrupt{corrupt_ledger_policy::reinitialize_on_corrupt};
        write_strategy write_mode{write_strategy::atomic};

        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

}  // namespace anchordrop
