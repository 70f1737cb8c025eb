#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace anchordrop {

    // Each element keeps its trailing '\n'; only the last one may lack it.
    // join_lines(split_lines(s)) == s for every s.
    std::vector<std::string> split_lines(std::string_view content);

    std::string join_lines(const std::vector<std::string>& lines);

    std::vector<std::string> read_lines(const std::filesystem::path& path);

}  // namespace anchordrop
