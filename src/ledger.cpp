#include "anchordrop/ledger.hpp"

#include "internal/io.hpp"
#include "internal/types.hpp"

#include "anchordrop/format.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace anchordrop::literals;

namespace anchordrop {

    namespace detail {

        namespace fs = std::filesystem;

        static bool parse_record(const std::string& json, anchors_record& out, std::string& reason) {
            anchors_record parsed{};
            auto ec = glz::read<internal::ledger_read_opts>(parsed, json);
            if (ec) {
                reason = glz::format_error(ec, json);
                return false;
            }
            out = std::move(parsed);
            return true;
        }

        static void ensure_parent_directory(const fs::path& path) {
            auto parent = path.parent_path();
            if (parent.empty()) {
                return;
            }
            std::error_code ec{};
            fs::create_directories(parent, ec);
            if (ec) {
                throw std::runtime_error("failed to create {}: {}"_format(parent.string(), ec.message()));
            }
        }

    }  // namespace detail

    std::string current_timestamp() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

        std::tm utc_tm{};
        gmtime_r(&now, &utc_tm);

        std::ostringstream os{};
        os << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%SZ");
        return os.str();
    }

    anchors_record make_empty_record() {
        anchors_record record{};
        record.version = ledger_schema_version;
        record.generated = current_timestamp();
        return record;
    }

    std::filesystem::path ledger_path(const run_config& cfg) {
        return cfg.ledger_dir / cfg.ledger_file;
    }

    anchors_record load_ledger(const std::filesystem::path& path, corrupt_ledger_policy policy, std::ostream& warn) {
        std::error_code exists_ec{};
        if (!std::filesystem::exists(path, exists_ec)) {
            if (exists_ec) {
                throw std::runtime_error(
                        "failed to stat anchors file {}: {}"_format(path.string(), exists_ec.message()));
            }
            debug_log("no ledger at ", path.string(), ", starting empty");
            return make_empty_record();
        }

        std::string json{};
        try {
            json = internal::io::read_text_file(path);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("failed to open anchors file {}: {}"_format(path.string(), e.what()));
        }

        anchors_record record{};
        std::string reason{};
        if (detail::parse_record(json, record, reason)) {
            debug_log("loaded ", record.anchors.size(), " anchors from ", path.string());
            return record;
        }

        switch (policy) {
            case corrupt_ledger_policy::reinitialize_on_corrupt:
                debug_log("discarding unparseable ledger: ", reason);
                warn << "Invalid " << path.filename().string() << "; reinitializing.\n";
                return make_empty_record();
            case corrupt_ledger_policy::fail_on_corrupt:
                break;
        }
        throw std::runtime_error("invalid anchors file {}: {}"_format(path.string(), reason));
    }

    void append_entry(anchors_record& record, anchor_entry entry) {
        record.anchors.push_back(std::move(entry));
        record.generated = current_timestamp();
    }

    void save_ledger(const std::filesystem::path& path, const anchors_record& record, write_strategy strategy) {
        detail::ensure_parent_directory(path);

        std::string json{};
        auto ec = glz::write<internal::ledger_write_opts>(record, json);
        if (ec) {
            throw std::runtime_error("failed to serialize anchors record");
        }
        json.push_back('\n');

        try {
            internal::io::write_text_file(path, json, strategy);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("failed to write anchors file {}: {}"_format(path.string(), e.what()));
        }
    }

}  // namespace anchordrop
