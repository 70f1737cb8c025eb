#include "anchordrop/lines.hpp"

#include "internal/io.hpp"

#include "anchordrop/format.hpp"

#include <stdexcept>

using namespace anchordrop::literals;

namespace anchordrop {

    std::vector<std::string> split_lines(std::string_view content) {
        std::vector<std::string> lines{};
        std::size_t start = 0U;
        while (start < content.size()) {
            auto newline = content.find('\n', start);
            if (newline == std::string_view::npos) {
                lines.emplace_back(content.substr(start));
                break;
            }
            lines.emplace_back(content.substr(start, newline - start + 1U));
            start = newline + 1U;
        }
        return lines;
    }

    std::string join_lines(const std::vector<std::string>& lines) {
        std::size_t total = 0U;
        for (const auto& line : lines) {
            total += line.size();
        }

        std::string joined{};
        joined.reserve(total);
        for (const auto& line : lines) {
            joined += line;
        }
        return joined;
    }

    std::vector<std::string> read_lines(const std::filesystem::path& path) {
        std::string content{};
        try {
            content = internal::io::read_text_file(path);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("failed to read file {}: {}"_format(path.string(), e.what()));
        }
        return split_lines(content);
    }

}  // namespace anchordrop
