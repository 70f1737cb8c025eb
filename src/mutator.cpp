#include "anchordrop/mutator.hpp"

#include "internal/io.hpp"

#include "anchordrop/format.hpp"
#include "anchordrop/lines.hpp"

#include <iterator>
#include <stdexcept>

using namespace anchordrop::literals;

namespace anchordrop {

    void insert_line(std::vector<std::string>& lines, std::size_t line_number, std::string text) {
        if (!is_valid_insert_position(line_number, lines.size())) {
            throw std::out_of_range(
                    "line {} is outside 1..{} for {} lines"_format(line_number, lines.size() + 1U, lines.size()));
        }
        auto pos = std::next(lines.begin(), static_cast<std::ptrdiff_t>(line_number - 1U));
        lines.insert(pos, std::move(text));
    }

    std::size_t insert_comment_into_file(
            const std::filesystem::path& path, std::size_t line_number, std::string_view comment, write_strategy strategy) {
        auto lines = read_lines(path);
        auto original_count = lines.size();

        insert_line(lines, line_number, std::string{comment});

        try {
            internal::io::write_text_file(path, join_lines(lines), strategy);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("failed to write updated content to {}: {}"_format(path.string(), e.what()));
        }

        debug_log("inserted anchor at ", path.string(), ':', line_number, " (", original_count, " -> ", lines.size(), ")");
        return original_count;
    }

}  // namespace anchordrop
