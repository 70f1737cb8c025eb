#pragma once

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

namespace anchordrop {

    struct drop_request {
        std::filesystem::path file{};
        std::size_t line{};
        std::string description{};
        std::string kind{default_anchor_kind};
    };

    enum class drop_status : uint8_t {
        dropped,
        file_not_found,
        invalid_line,
    };

    inline constexpr std::string_view to_string(drop_status status) {
        switch (status) {
            case drop_status::dropped:
                return "dropped"sv;
            case drop_status::file_not_found:
                return "file_not_found"sv;
            case drop_status::invalid_line:
                return "invalid_line"sv;
        }
        return "invalid_line"sv;
    }

    struct drop_result {
        drop_status status{drop_status::invalid_line};
        std::string key{};
        std::string comment{};
        std::filesystem::path ledger_path{};
        std::size_t line_count{};
    };

    /*
     * Inserts an anchor comment into `request.file` and records it in the ledger named by `cfg`.
     *
     * A missing file or an out-of-range line is reported on `out` and returned as the matching
     * drop_status with nothing written. I/O and serialization failures throw std::runtime_error;
     * once the source file has been rewritten a later ledger failure leaves the comment in place.
     */
    drop_result drop_anchor(const drop_request& request, const run_config& cfg, std::ostream& out, std::ostream& err);

    int exit_code_for(const drop_result& result, const run_config& cfg);

}  // namespace anchordrop
