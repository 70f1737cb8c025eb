#pragma once

#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace anchordrop {

    inline constexpr int ledger_schema_version = 1;
    inline constexpr auto anchor_status_active = "active"sv;

    struct anchor_entry {
        std::string key{};
        std::string path{};
        std::size_t line{};
        std::string kind{default_anchor_kind};
        std::string description{};
        std::string status{anchor_status_active};
        std::string created{};
    };

    struct anchors_record {
        int version{ledger_schema_version};
        std::string generated{};
        std::vector<anchor_entry> anchors{};
    };

    // UTC, "%Y-%m-%dT%H:%M:%SZ"
    std::string current_timestamp();

    anchors_record make_empty_record();

    std::filesystem::path ledger_path(const run_config& cfg);

    /*
     * Loads the ledger at `path`.
     *
     * A missing file yields make_empty_record(). A file that exists but is not a valid anchors record
     * (bad JSON, missing or mistyped fields) is handled by `policy`: reinitialize_on_corrupt writes a
     * warning to `warn` and returns an empty record, dropping whatever the file held; fail_on_corrupt
     * throws. A record that parses is returned as is, whatever its version. Unknown keys are ignored.
     */
    anchors_record load_ledger(const std::filesystem::path& path, corrupt_ledger_policy policy, std::ostream& warn);

    // Appends in order and refreshes `generated`.
    void append_entry(anchors_record& record, anchor_entry entry);

    // Creates parent directories, then replaces the file with prettified JSON.
    void save_ledger(const std::filesystem::path& path, const anchors_record& record, write_strategy strategy);

}  // namespace anchordrop
