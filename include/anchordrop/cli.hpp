#pragma once

#include "anchor.hpp"
#include "config.hpp"

#include <optional>

namespace anchordrop::cli {

    // Returns an exit code when the process should stop (usage error, --version, --print-config).
    std::optional<int> parse_cli(int argc, char** argv, run_config& cfg, drop_request& request);

    int run(const run_config& cfg, const drop_request& request);

    // Body of main: parse, run, and report escaped exceptions as "Error: <message>" on stderr with exit 1.
    int main_entry(int argc, char** argv);

}  // namespace anchordrop::cli
