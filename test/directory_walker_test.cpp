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

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/stat.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <squish/error.h>
#include <squish/utility/directory_walker.h>

#include "test_file_util.h"
#include "test_helpers.h"
#include "test_logger.h"

using namespace squish;
using ::testing::ElementsAre;

namespace fs = std::filesystem;

namespace {

std::vector<std::string>
relative(std::vector<fs::path> const& paths, fs::path const& root) {
  std::vector<std::string> rv;
  for (auto const& p : paths) {
    rv.push_back(p.lexically_relative(root).generic_string());
  }
  return rv;
}

} // namespace

TEST(directory_walker, finds_nested_files_sorted) {
  test::test_logger lgr;
  test::temporary_directory td{"squish"};

  test::write_tree(td.path(), {{"b.txt", "b"},
                               {"a/z.txt", "z"},
                               {"a/b/c/d/e/f.txt", "f"},
                               {"empty", ""}});
  fs::create_directories(td.path() / "no" / "files" / "here");

  auto const files = utility::walk_directory(lgr, td.path());

  EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
  EXPECT_THAT(relative(files, td.path()),
              ElementsAre("a/b/c/d/e/f.txt", "a/z.txt", "b.txt", "empty"));
}

TEST(directory_walker, deep_tree) {
  test::test_logger lgr;
  test::temporary_directory td{"squish"};

  fs::path p = td.path();
  for (int i = 0; i < 200; ++i) {
    p /= "d";
  }
  fs::create_directories(p);
  test::write_file(p / "leaf", "leaf");

  auto const files = utility::walk_directory(lgr, td.path());

  ASSERT_EQ(1, files.size());
  EXPECT_EQ(p / "leaf", files[0]);
}

TEST(directory_walker, symlinks) {
  test::test_logger lgr;
  test::temporary_directory td{"squish"};
  auto const root = td.path() / "root";

  test::write_tree(root, {{"real/file.txt", "data"}});
  fs::create_symlink(root / "real" / "file.txt", root / "link.txt");
  fs::create_directory_symlink(root / "real", root / "dirlink");
  fs::create_symlink(root / "nowhere", root / "dangling");

  auto const files = utility::walk_directory(lgr, root);

  EXPECT_THAT(relative(files, root), ElementsAre("link.txt", "real/file.txt"));
}

TEST(directory_walker, skips_special_files) {
  test::test_logger lgr{logger::DEBUG};
  test::temporary_directory td{"squish"};

  test::write_file(td.path() / "regular", "x");
  ASSERT_EQ(0, ::mkfifo((td.path() / "fifo").c_str(), 0600));

  auto const files = utility::walk_directory(lgr, td.path());

  EXPECT_THAT(relative(files, td.path()), ElementsAre("regular"));
  EXPECT_TRUE(lgr.contains(logger::DEBUG, "skipping"));
}

TEST(directory_walker, root_must_be_directory) {
  test::test_logger lgr;
  test::temporary_directory td{"squish"};

  test::write_file(td.path() / "file", "x");

  EXPECT_THROW(utility::walk_directory(lgr, td.path() / "file"),
               system_error);
  EXPECT_THROW(utility::walk_directory(lgr, td.path() / "missing"),
               system_error);
}
