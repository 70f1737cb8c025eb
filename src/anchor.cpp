#include "anchordrop/anchor.hpp"

#include "anchordrop/comment.hpp"
#include "anchordrop/format.hpp"
#include "anchordrop/key.hpp"
#include "anchordrop/ledger.hpp"
#include "anchordrop/lines.hpp"
#include "anchordrop/mutator.hpp"

#include <ostream>
#include <stdexcept>
#include <system_error>

using namespace anchordrop::literals;

namespace anchordrop {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr int invalid_input_exit_code = 2;

        static bool target_exists(const fs::path& path) {
            std::error_code ec{};
            auto found = fs::exists(path, ec);
            if (ec) {
                throw std::runtime_error("failed to stat {}: {}"_format(path.string(), ec.message()));
            }
            return found;
        }

        static void ensure_ledger_dir(const fs::path& dir) {
            if (dir.empty()) {
                return;
            }
            std::error_code ec{};
            fs::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("failed to create {}: {}"_format(dir.string(), ec.message()));
            }
        }

    }  // namespace detail

    drop_result drop_anchor(const drop_request& request, const run_config& cfg, std::ostream& out, std::ostream& err) {
        drop_result result{};
        auto file_text = request.file.string();

        if (!detail::target_exists(request.file)) {
            out << "File " << file_text << " not found.\n";
            result.status = drop_status::file_not_found;
            return result;
        }

        auto line_count = read_lines(request.file).size();
        result.line_count = line_count;
        if (!is_valid_insert_position(request.line, line_count)) {
            out << "Invalid line " << request.line << " for file with " << line_count << " lines.\n";
            result.status = drop_status::invalid_line;
            return result;
        }

        result.key = generate_key();
        result.comment = build_comment(request.file, result.key, request.description);
        if (cfg.verbose) {
            err << "key: " << result.key << '\n';
            err << "comment: " << utils::trim_view(result.comment) << '\n';
        }

        insert_comment_into_file(request.file, request.line, result.comment, cfg.write_mode);

        detail::ensure_ledger_dir(cfg.ledger_dir);
        result.ledger_path = ledger_path(cfg);
        if (cfg.verbose) {
            err << "ledger: " << result.ledger_path.string() << '\n';
        }

        auto record = load_ledger(result.ledger_path, cfg.on_corrupt, out);
        append_entry(
                record,
                anchor_entry{
                        .key = result.key,
                        .path = file_text,
                        .line = request.line,
                        .kind = request.kind,
                        .description = request.description,
                        .status = std::string{anchor_status_active},
                        .created = current_timestamp()});
        save_ledger(result.ledger_path, record, cfg.write_mode);

        result.status = drop_status::dropped;
        if (!cfg.quiet) {
            out << "Anchor " << result.key << " dropped at " << file_text << ':' << request.line << '\n';
        }
        return result;
    }

    int exit_code_for(const drop_result& result, const run_config& cfg) {
        if (result.status == drop_status::dropped) {
            return 0;
        }
        switch (cfg.invalid_input) {
            case invalid_input_policy::report_and_succeed:
                return 0;
            case invalid_input_policy::exit_nonzero:
                return detail::invalid_input_exit_code;
        }
        return 0;
    }

}  // namespace anchordrop
