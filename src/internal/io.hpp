#pragma once

#include "anchordrop/config.hpp"
#include "anchordrop/format.hpp"

extern "C" {
#include <unistd.h>
}

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace anchordrop::internal::io {

    namespace fs = std::filesystem;
    using namespace anchordrop::literals;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    inline void write_stream(const fs::path& path, std::string_view content) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

    // Symlinks are followed so the file they point at is the one replaced.
    inline fs::path resolve_write_target(const fs::path& path) {
        std::error_code ec{};
        if (!fs::is_symlink(fs::symlink_status(path, ec))) {
            return path;
        }
        auto resolved = fs::weakly_canonical(path, ec);
        if (ec) {
            throw std::runtime_error("failed to resolve symlink {}: {}"_format(path.string(), ec.message()));
        }
        return resolved;
    }

    inline bool directory_writable(const fs::path& file) {
        auto dir = file.parent_path();
        if (dir.empty()) {
            dir = ".";
        }
        return ::access(dir.c_str(), W_OK) == 0;
    }

    // Sibling temp file that is removed unless commit() renamed it over the target.
    class scoped_temp_file {
      public:
        explicit scoped_temp_file(const fs::path& target) : target_{resolve_write_target(target)} {
            static std::atomic<unsigned> counter{0U};
            auto name = "{}.tmp.{}.{}"_format(
                    target_.filename().string(), static_cast<long>(::getpid()), counter.fetch_add(1U));
            path_ = target_.parent_path() / name;
        }

        scoped_temp_file(const scoped_temp_file&) = delete;
        scoped_temp_file& operator=(const scoped_temp_file&) = delete;

        ~scoped_temp_file() {
            if (!committed_) {
                std::error_code ec{};
                fs::remove(path_, ec);
            }
        }

        const fs::path& path() const { return path_; }

        void write(std::string_view content) { write_stream(path_, content); }

        void commit() {
            std::error_code ec{};
            auto status = fs::status(target_, ec);
            if (!ec && fs::exists(status)) {
                fs::permissions(path_, status.permissions(), fs::perm_options::replace, ec);
                if (ec) {
                    throw std::runtime_error(
                            "failed to copy permissions onto {}: {}"_format(path_.string(), ec.message()));
                }
            }

            fs::rename(path_, target_, ec);
            if (ec) {
                throw std::runtime_error(
                        "failed to rename {} to {}: {}"_format(path_.string(), target_.string(), ec.message()));
            }
            committed_ = true;
        }

      private:
        fs::path target_{};
        fs::path path_{};
        bool committed_{false};
    };

    inline void write_text_file(const fs::path& path, std::string_view content, write_strategy strategy) {
        if (strategy == write_strategy::overwrite) {
            write_stream(path, content);
            return;
        }

        auto target = resolve_write_target(path);
        if (!directory_writable(target)) {
            // no room for a sibling temp file; rewrite in place
            write_stream(target, content);
            return;
        }

        scoped_temp_file temp{target};
        temp.write(content);
        temp.commit();
    }

}  // namespace anchordrop::internal::io
