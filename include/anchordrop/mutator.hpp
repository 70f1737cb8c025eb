#pragma once

#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace anchordrop {

    // 1 <= line_number <= line_count + 1
    constexpr bool is_valid_insert_position(std::size_t line_number, std::size_t line_count) {
        return line_number >= 1U && line_number <= line_count + 1U;
    }

    // Inserts `text` so it becomes line `line_number` (1-based); line_count + 1 appends.
    // Throws std::out_of_range for any other position.
    void insert_line(std::vector<std::string>& lines, std::size_t line_number, std::string text);

    // Reads `path`, inserts `comment` (already newline-terminated) at `line_number` and rewrites the file.
    // Returns the line count before insertion.
    std::size_t insert_comment_into_file(
            const std::filesystem::path& path, std::size_t line_number, std::string_view comment, write_strategy strategy);

}  // namespace anchordrop
