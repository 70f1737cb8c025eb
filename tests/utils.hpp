#pragma once

#include "anchordrop.hpp"
#include "anchordrop/cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/io.hpp"
#include "../src/internal/types.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace anchordrop::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Switches the working directory for the lifetime of the object.
    struct scoped_cwd {
        fs::path previous{};

        explicit scoped_cwd(const fs::path& dir) : previous{fs::current_path()} { fs::current_path(dir); }

        ~scoped_cwd() {
            std::error_code ec{};
            fs::current_path(previous, ec);
        }
    };

    inline void write_file(const fs::path& path, std::string_view content) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out);
        out << content;
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in);
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline run_config config_for(const fs::path& root) {
        run_config cfg{};
        cfg.ledger_dir = root / "memory_anchors";
        return cfg;
    }

    inline std::size_t count_with_prefix(const fs::path& dir, std::string_view prefix) {
        std::size_t count = 0U;
        for (const auto& entry : fs::directory_iterator{dir}) {
            if (entry.path().filename().string().starts_with(prefix)) {
                ++count;
            }
        }
        return count;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& args) {
        std::vector<char*> argv{};
        argv.reserve(args.size());
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return argv;
    }

    struct main_output {
        int code{};
        std::string out{};
        std::string err{};
    };

    inline main_output run_main(std::vector<std::string> args) {
        auto argv = to_argv(args);

        std::ostringstream captured_out{};
        std::ostringstream captured_err{};
        auto* saved_out_buf = std::cout.rdbuf(captured_out.rdbuf());
        auto* saved_err_buf = std::cerr.rdbuf(captured_err.rdbuf());

        int code = 0;
        try {
            code = cli::main_entry(static_cast<int>(argv.size()), argv.data());
        } catch (...) {
            std::cout.rdbuf(saved_out_buf);
            std::cerr.rdbuf(saved_err_buf);
            throw;
        }

        std::cout.flush();
        std::cerr.flush();
        std::cout.rdbuf(saved_out_buf);
        std::cerr.rdbuf(saved_err_buf);

        return main_output{.code = code, .out = captured_out.str(), .err = captured_err.str()};
    }
}  // namespace anchordrop::test::detail
