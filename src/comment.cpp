#include "anchordrop/comment.hpp"

#include "anchordrop/format.hpp"

#include <algorithm>
#include <array>

using namespace anchordrop::literals;

namespace anchordrop {

    namespace detail {

        using namespace std::string_view_literals;

        struct extension_style {
            std::string_view extension;
            comment_style style;
        };

        static constexpr comment_style hash_style{"#"sv, ""sv};
        static constexpr comment_style slash_style{"//"sv, ""sv};
        static constexpr comment_style dash_style{"--"sv, ""sv};
        static constexpr comment_style markup_style{"<!--"sv, " -->"sv};

        static constexpr std::array extension_styles{
                extension_style{"py"sv, hash_style},
                extension_style{"js"sv, slash_style},
                extension_style{"ts"sv, slash_style},
                extension_style{"go"sv, slash_style},
                extension_style{"c"sv, slash_style},
                extension_style{"cpp"sv, slash_style},
                extension_style{"java"sv, slash_style},
                extension_style{"rs"sv, slash_style},
                extension_style{"zig"sv, slash_style},
                extension_style{"sql"sv, dash_style},
                extension_style{"html"sv, markup_style},
                extension_style{"htm"sv, markup_style}};

    }  // namespace detail

    comment_style resolve_comment_style(std::string_view extension) {
        if (extension.starts_with('.')) {
            extension.remove_prefix(1U);
        }

        auto it = std::ranges::find_if(detail::extension_styles, [extension](const detail::extension_style& entry) {
            return utils::str_case_eq(entry.extension, extension);
        });
        if (it == detail::extension_styles.end()) {
            return detail::slash_style;
        }
        return it->style;
    }

    std::string build_comment(const std::filesystem::path& path, std::string_view key, std::string_view description) {
        auto style = resolve_comment_style(path.extension().string());
        return "{} {}[key={}] {}{}\n"_format(style.prefix, anchor_tag, key, description, style.suffix);
    }

}  // namespace anchordrop
