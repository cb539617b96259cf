/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of squish.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/format.h>

#include <nlohmann/json.hpp>

#include <squish/reader/archive_summary.h>

#include <squish/tool/console_progress.h>
#include <squish/tool/summary_table.h>

#include "test_file_util.h"
#include "test_helpers.h"

using namespace squish;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

namespace fs = std::filesystem;

namespace {

class tool_test : public ::testing::Test {
 protected:
  void SetUp() override {
    test::write_tree(input(), tree);
  }

  fs::path input() const { return td.path() / "project"; }
  fs::path archive() const { return td.path() / "project.squish"; }

  test::file_tree const tree{
      {"README", "read me"},
      {"src/main.cpp", "int main() {}"},
      {"src/copy.cpp", "int main() {}"},
      {"docs/a.txt", "a"},
      {"empty", ""},
  };
  test::temporary_directory td{"squish"};
};

} // namespace

TEST(squish_main, no_arguments) {
  auto const r = test::run_squish({});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("Usage: squish <command>"));
  EXPECT_TRUE(r.out.empty());
}

TEST(squish_main, help) {
  auto const r = test::run_squish({"--help"});

  EXPECT_EQ(0, r.exit_code);
  EXPECT_THAT(r.out, HasSubstr("Commands:"));
  EXPECT_THAT(r.out, HasSubstr("unpack"));
}

TEST(squish_main, unknown_command) {
  auto const r = test::run_squish({"frobnicate"});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("unknown command 'frobnicate'"));
}

TEST(squish_main, command_help) {
  for (auto const* cmd : {"pack", "list", "unpack"}) {
    auto const r = test::run_squish({cmd, "--help"});

    EXPECT_EQ(0, r.exit_code) << cmd;
    EXPECT_THAT(r.out, HasSubstr(fmt::format("Usage: squish {}", cmd)));
  }
}

TEST(squish_main, missing_positional_argument) {
  for (auto const* cmd : {"pack", "list", "unpack"}) {
    auto const r = test::run_squish({cmd});
    EXPECT_EQ(1, r.exit_code) << cmd;
  }
}

TEST(squish_main, invalid_option) {
  auto const r = test::run_squish({"pack", "--no-such-option"});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, StartsWith("error: "));
}

TEST_F(tool_test, pack_list_unpack) {
  auto const out = td.path() / "restored";

  {
    auto const r = test::run_squish({"pack", input().string()});
    EXPECT_EQ(0, r.exit_code) << r.err;
    EXPECT_THAT(r.out, HasSubstr("Packing complete!"));
    EXPECT_THAT(r.out, HasSubstr("Saved as " + archive().string()));
    EXPECT_THAT(r.out, HasSubstr("Compression ratio was "));
    EXPECT_TRUE(fs::exists(archive()));
  }

  {
    auto const r = test::run_squish({"list", archive().string()});
    EXPECT_EQ(0, r.exit_code) << r.err;
    EXPECT_THAT(r.out, HasSubstr("Squish breakdown:"));
    EXPECT_THAT(r.out, HasSubstr("| Number of files      | 5"));
    EXPECT_THAT(r.out, HasSubstr("| Number of chunks     | 3"));
    EXPECT_THAT(r.out, HasSubstr("Top-level directory breakdown:"));
    EXPECT_THAT(r.out, HasSubstr("| src "));
  }

  {
    auto const r =
        test::run_squish({"unpack", archive().string(), "-o", out.string()});
    EXPECT_EQ(0, r.exit_code) << r.err;
    EXPECT_THAT(r.out, HasSubstr("Unpacking complete!"));
    EXPECT_THAT(r.out, HasSubstr("was unsquished into " + out.string()));
  }

  EXPECT_EQ(tree, test::read_tree(out));
}

TEST_F(tool_test, unpack_default_output) {
  ASSERT_EQ(0, test::run_squish({"pack", input().string() + "/", "-j", "2"})
                   .exit_code);

  fs::remove_all(input());

  auto const r = test::run_squish({"unpack", archive().string()});

  EXPECT_EQ(0, r.exit_code) << r.err;
  EXPECT_EQ(tree, test::read_tree(input()));
}

TEST_F(tool_test, unpack_needs_derivable_output) {
  auto const other = td.path() / "archive.bin";

  ASSERT_EQ(0, test::run_squish({"pack", input().string(), "-o",
                                 other.string()})
                   .exit_code);

  auto const r = test::run_squish({"unpack", other.string()});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("use --output"));
}

TEST_F(tool_test, list_simple) {
  ASSERT_EQ(0, test::run_squish({"pack", input().string()}).exit_code);

  auto const r = test::run_squish({"list", "--simple", archive().string()});

  EXPECT_EQ(0, r.exit_code) << r.err;
  EXPECT_THAT(r.out, StartsWith("squish_size(bytes): "));
  EXPECT_THAT(r.out, HasSubstr("original_size(bytes): 34, "));
  EXPECT_THAT(r.out, HasSubstr("number_of_files: 5, chunks_count: 3\n"));
  EXPECT_THAT(r.out, HasSubstr("        13  src/main.cpp\n"));
  EXPECT_THAT(r.out, HasSubstr("         0  empty\n"));
}

TEST_F(tool_test, list_json) {
  ASSERT_EQ(0, test::run_squish({"pack", input().string()}).exit_code);

  auto const r = test::run_squish({"list", "--json", archive().string()});

  ASSERT_EQ(0, r.exit_code) << r.err;

  auto const j = nlohmann::json::parse(r.out);

  EXPECT_EQ("01.00.00", j["version"].get<std::string>());
  EXPECT_EQ(3, j["unique_chunks"].get<int>());
  EXPECT_EQ(34, j["total_original_size"].get<int>());
  EXPECT_EQ(5, j["files"].size());
}

TEST_F(tool_test, list_simple_and_json_conflict) {
  auto const r = test::run_squish(
      {"list", "--simple", "--json", archive().string()});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("mutually exclusive"));
}

TEST_F(tool_test, list_invalid_archive) {
  auto const bogus = td.path() / "bogus.squish";
  test::write_file(bogus, "definitely not an archive");

  auto const r = test::run_squish({"list", bogus.string()});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("Failed to list files"));
  EXPECT_THAT(r.err, HasSubstr("invalid format"));
}

TEST_F(tool_test, pack_missing_input) {
  auto const r = test::run_squish({"pack", (td.path() / "nope").string()});

  EXPECT_EQ(1, r.exit_code);
  EXPECT_THAT(r.err, HasSubstr("Failed to pack"));
}

TEST_F(tool_test, fancy_output) {
  auto const r = test::run_squish({"pack", input().string()}, true);

  EXPECT_EQ(0, r.exit_code) << r.err;
  EXPECT_THAT(r.out, HasSubstr("<green>Packing complete!<normal>"));
  EXPECT_THAT(r.err, HasSubstr("Packing ["));
  EXPECT_THAT(r.err, HasSubstr("<clear>"));
}

TEST_F(tool_test, plain_output_has_no_progress) {
  auto const r = test::run_squish({"pack", input().string()});

  EXPECT_EQ(0, r.exit_code);
  EXPECT_THAT(r.out, Not(HasSubstr("<green>")));
  EXPECT_THAT(r.err, Not(HasSubstr("Packing [")));
}

TEST(summary_table, thousands_separator) {
  EXPECT_EQ("0", tool::with_thousands_separator(0));
  EXPECT_EQ("999", tool::with_thousands_separator(999));
  EXPECT_EQ("1,000", tool::with_thousands_separator(1000));
  EXPECT_EQ("1,234,567", tool::with_thousands_separator(1234567));
}

TEST(summary_table, render_table_two_titles) {
  std::vector<std::string> const titles{"Directory", "File Count"};
  std::vector<tool::table_row> const rows{{"src", "2"}, {"docs", "1"}};

  EXPECT_EQ("+-----------+------------+\n"
            "| Directory | File Count |\n"
            "+-----------+------------+\n"
            "| src       | 2          |\n"
            "| docs      | 1          |\n"
            "+-----------+------------+\n",
            tool::render_table(titles, rows));
}

TEST(summary_table, render_table_spanning_title) {
  std::vector<std::string> const titles{"Summary"};
  std::vector<tool::table_row> const rows{{"a", "b"}};

  EXPECT_EQ("+---+-----+\n"
            "| Summary |\n"
            "+---+-----+\n"
            "| a | b   |\n"
            "+---+-----+\n",
            tool::render_table(titles, rows));
}

TEST(summary_table, top_level_breakdown) {
  std::vector<reader::file_info> const files{
      {"src/a", 1}, {"src/b/c", 1}, {"docs/x", 1}, {"README", 1},
      {"zzz/y", 1}, {"src/d", 1},   {"docs/z", 1},
  };

  auto const b = tool::top_level_breakdown(files);

  ASSERT_EQ(4, b.size());
  EXPECT_EQ((std::pair<std::string, size_t>{"src", 3}), b[0]);
  EXPECT_EQ((std::pair<std::string, size_t>{"docs", 2}), b[1]);
  EXPECT_EQ((std::pair<std::string, size_t>{"README", 1}), b[2]);
  EXPECT_EQ((std::pair<std::string, size_t>{"zzz", 1}), b[3]);
}

TEST(console_progress, progress_bar) {
  EXPECT_EQ("=====>    ", tool::render_progress_bar(10, 0.5));
  EXPECT_EQ("==========", tool::render_progress_bar(10, 1.0));
  EXPECT_EQ(">   ", tool::render_progress_bar(4, 0.0));
  EXPECT_EQ("====", tool::render_progress_bar(4, 7.0));
}
