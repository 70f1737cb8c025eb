#include "utils.hpp"

#include <stdexcept>

namespace anchordrop::test {

    TEST_CASE("006: insert position bounds", "[006][mutator]") {
        CHECK_FALSE(is_valid_insert_position(0U, 3U));
        CHECK(is_valid_insert_position(1U, 3U));
        CHECK(is_valid_insert_position(4U, 3U));
        CHECK_FALSE(is_valid_insert_position(5U, 3U));

        CHECK(is_valid_insert_position(1U, 0U));
        CHECK_FALSE(is_valid_insert_position(2U, 0U));
    }

    TEST_CASE("006: insert_line places text before the numbered line", "[006][mutator]") {
        std::vector<std::string> lines{"a\n", "b\n", "c\n"};

        SECTION("first line") {
            insert_line(lines, 1U, "X\n");
            CHECK(lines == std::vector<std::string>{"X\n", "a\n", "b\n", "c\n"});
        }
        SECTION("middle line") {
            insert_line(lines, 2U, "X\n");
            CHECK(lines == std::vector<std::string>{"a\n", "X\n", "b\n", "c\n"});
        }
        SECTION("one past the end appends") {
            insert_line(lines, 4U, "X\n");
            CHECK(lines == std::vector<std::string>{"a\n", "b\n", "c\n", "X\n"});
        }
        SECTION("out of range is rejected untouched") {
            CHECK_THROWS_AS(insert_line(lines, 0U, "X\n"), std::out_of_range);
            CHECK_THROWS_AS(insert_line(lines, 5U, "X\n"), std::out_of_range);
            CHECK(lines.size() == 3U);
        }
    }

    TEST_CASE("006: insert_comment_into_file rewrites the file", "[006][mutator]") {
        detail::temp_dir temp{"anchordrop_mutator"};
        auto path = temp.path / "code.go";

        SECTION("overwrite strategy") {
            detail::write_file(path, "package main\nfunc main() {}\n");
            auto before = insert_comment_into_file(path, 2U, "// marker\n", write_strategy::overwrite);
            CHECK(before == 2U);
            CHECK(detail::read_file(path) == "package main\n// marker\nfunc main() {}\n");
        }
        SECTION("atomic strategy") {
            detail::write_file(path, "package main\nfunc main() {}\n");
            auto before = insert_comment_into_file(path, 3U, "// marker\n", write_strategy::atomic);
            CHECK(before == 2U);
            CHECK(detail::read_file(path) == "package main\nfunc main() {}\n// marker\n");
            CHECK(detail::count_with_prefix(temp.path, "code.go.tmp") == 0U);
        }
        SECTION("empty file") {
            detail::write_file(path, "");
            auto before = insert_comment_into_file(path, 1U, "// marker\n", write_strategy::atomic);
            CHECK(before == 0U);
            CHECK(detail::read_file(path) == "// marker\n");
        }
        SECTION("last line without newline") {
            detail::write_file(path, "one\ntwo");
            insert_comment_into_file(path, 2U, "// marker\n", write_strategy::atomic);
            CHECK(detail::read_file(path) == "one\n// marker\ntwo");
        }
    }

    TEST_CASE("006: atomic rewrite keeps permission bits", "[006][mutator][io]") {
        namespace fs = std::filesystem;
        detail::temp_dir temp{"anchordrop_mutator_perms"};
        auto path = temp.path / "run.sh";
        detail::write_file(path, "#!/bin/sh\necho hi\n");
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read, fs::perm_options::replace);

        insert_comment_into_file(path, 2U, "// marker\n", write_strategy::atomic);

        auto perms = fs::status(path).permissions();
        CHECK((perms & fs::perms::owner_exec) != fs::perms::none);
        CHECK((perms & fs::perms::others_read) == fs::perms::none);
    }

    TEST_CASE("006: atomic rewrite through a symlink edits the linked file", "[006][mutator][io]") {
        namespace fs = std::filesystem;
        detail::temp_dir temp{"anchordrop_mutator_symlink"};
        fs::create_directories(temp.path / "real");
        auto real = temp.path / "real" / "a.py";
        auto link = temp.path / "link.py";
        detail::write_file(real, "x = 1\ny = 2\n");

        SECTION("absolute link target") {
            fs::create_symlink(real, link);
        }
        SECTION("relative link target") {
            fs::create_symlink(fs::path{"real"} / "a.py", link);
        }

        auto before = insert_comment_into_file(link, 2U, "# marker\n", write_strategy::atomic);
        CHECK(before == 2U);
        CHECK(fs::is_symlink(fs::symlink_status(link)));
        CHECK(detail::read_file(real) == "x = 1\n# marker\ny = 2\n");
        CHECK(detail::count_with_prefix(temp.path, "link.py.tmp") == 0U);
        CHECK(detail::count_with_prefix(temp.path / "real", "a.py.tmp") == 0U);
    }

    TEST_CASE("006: scoped temp file sits beside the resolved target", "[006][io]") {
        namespace fs = std::filesystem;
        detail::temp_dir temp{"anchordrop_scoped_temp_link"};
        fs::create_directories(temp.path / "real");
        auto real = temp.path / "real" / "out.txt";
        detail::write_file(real, "old");
        fs::create_symlink(real, temp.path / "out.txt");

        internal::io::scoped_temp_file file{temp.path / "out.txt"};
        CHECK(file.path().parent_path() == fs::weakly_canonical(temp.path / "real"));
    }

    TEST_CASE("006: scoped temp file is removed unless committed", "[006][io]") {
        detail::temp_dir temp{"anchordrop_scoped_temp"};
        auto target = temp.path / "out.txt";
        std::filesystem::path temp_path{};
        {
            internal::io::scoped_temp_file file{target};
            temp_path = file.path();
            file.write("abandoned");
            CHECK(std::filesystem::exists(temp_path));
        }
        CHECK_FALSE(std::filesystem::exists(temp_path));
        CHECK_FALSE(std::filesystem::exists(target));

        {
            internal::io::scoped_temp_file file{target};
            file.write("kept");
            file.commit();
        }
        CHECK(detail::read_file(target) == "kept");
        CHECK(detail::count_with_prefix(temp.path, "out.txt.tmp") == 0U);
    }
}  // namespace anchordrop::test
