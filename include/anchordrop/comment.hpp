#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace anchordrop {

    inline constexpr auto anchor_tag = std::string_view{"CLAUDE_ANCHOR"};

    struct comment_style {
        std::string_view prefix{};
        std::string_view suffix{};

        constexpr bool operator==(const comment_style&) const = default;
    };

    // Extension match is case-insensitive and the leading dot is optional.
    // Unknown or empty extensions fall back to "//".
    comment_style resolve_comment_style(std::string_view extension);

    // "<prefix> CLAUDE_ANCHOR[key=<key>] <description><suffix>\n"
    std::string build_comment(const std::filesystem::path& path, std::string_view key, std::string_view description);

}  // namespace anchordrop
