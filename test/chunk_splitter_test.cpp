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

#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <squish/chunk_hasher.h>
#include <squish/error.h>
#include <squish/zstd_codec.h>

#include <squish/writer/chunk_store.h>
#include <squish/writer/internal/chunk_splitter.h>
#include <squish/writer/internal/chunk_writer.h>

#include "test_file_util.h"
#include "test_logger.h"

using namespace squish;
using namespace squish::writer;
using namespace squish::writer::internal;

namespace fs = std::filesystem;

namespace {

class chunk_splitter_test : public ::testing::Test {
 protected:
  void SetUp() override {
    store = std::make_unique<chunk_store>(codec);
    writer = std::make_unique<chunk_writer>(lgr, os);
  }

  fs::path add_file(std::string const& name, std::string const& content) {
    auto p = td.path() / name;
    fs::create_directories(p.parent_path());
    test::write_file(p, content);
    return p;
  }

  chunk_splitter make_splitter(size_t chunk_size) {
    return chunk_splitter(lgr, *store, *writer, chunk_size);
  }

  test::test_logger lgr;
  test::temporary_directory td{"squish"};
  zstd_codec codec{3};
  std::ostringstream os;
  std::unique_ptr<chunk_store> store;
  std::unique_ptr<chunk_writer> writer;
};

} // namespace

TEST_F(chunk_splitter_test, chunks_in_read_order) {
  auto const p = add_file("sub/data.bin", "aaaabbbbcc");
  auto splitter = make_splitter(4);

  auto const fe = splitter.process_file(p, td.path());
  writer->finish();

  EXPECT_EQ("sub/data.bin", fe.path);
  EXPECT_EQ(10, fe.size);
  ASSERT_EQ(3, fe.chunks.size());
  EXPECT_EQ(chunk_hasher::hash("aaaa", 4), fe.chunks[0]);
  EXPECT_EQ(chunk_hasher::hash("bbbb", 4), fe.chunks[1]);
  EXPECT_EQ(chunk_hasher::hash("cc", 2), fe.chunks[2]);
  EXPECT_EQ(3, writer->records_written());
}

TEST_F(chunk_splitter_test, empty_file_has_no_chunks) {
  auto const p = add_file("empty", "");
  auto splitter = make_splitter(4);

  auto const fe = splitter.process_file(p, td.path());
  writer->finish();

  EXPECT_EQ("empty", fe.path);
  EXPECT_EQ(0, fe.size);
  EXPECT_TRUE(fe.chunks.empty());
  EXPECT_EQ(0, writer->records_written());
  EXPECT_TRUE(os.str().empty());
}

TEST_F(chunk_splitter_test, exact_multiple_of_chunk_size) {
  auto const p = add_file("even", "12345678");
  auto splitter = make_splitter(4);

  auto const fe = splitter.process_file(p, td.path());

  EXPECT_EQ(8, fe.size);
  EXPECT_EQ(2, fe.chunks.size());
}

TEST_F(chunk_splitter_test, duplicate_chunks_are_written_once) {
  auto const p1 = add_file("a", "abcdabcdabcd");
  auto const p2 = add_file("b", "abcd");
  auto splitter = make_splitter(4);

  auto const fe1 = splitter.process_file(p1, td.path());
  auto const fe2 = splitter.process_file(p2, td.path());
  writer->finish();

  ASSERT_EQ(3, fe1.chunks.size());
  EXPECT_EQ(fe1.chunks[0], fe1.chunks[1]);
  EXPECT_EQ(fe1.chunks[0], fe1.chunks[2]);
  ASSERT_EQ(1, fe2.chunks.size());
  EXPECT_EQ(fe1.chunks[0], fe2.chunks[0]);
  EXPECT_EQ(1, store->size());
  EXPECT_EQ(1, writer->records_written());
}

TEST_F(chunk_splitter_test, missing_file_throws) {
  auto splitter = make_splitter(4);

  EXPECT_THROW(splitter.process_file(td.path() / "nope", td.path()),
               system_error);
}

TEST_F(chunk_splitter_test, zero_chunk_size_is_rejected) {
  EXPECT_THROW(make_splitter(0), runtime_error);
}

TEST(relative_archive_path, below_root) {
  EXPECT_EQ("a/b/c.txt", relative_archive_path("/x/y/a/b/c.txt", "/x/y"));
  EXPECT_EQ("c.txt", relative_archive_path("dir/c.txt", "dir/"));
  EXPECT_EQ("c.txt", relative_archive_path("dir/./c.txt", "dir"));
}

TEST(relative_archive_path, outside_root) {
  for (auto const& [path, root] :
       {std::pair{"/x/other/file", "/x/y"}, std::pair{"/x/y", "/x/y"},
        std::pair{"/x/y/../z", "/x/y"}}) {
    try {
      relative_archive_path(path, root);
      FAIL() << path << " should not be below " << root;
    } catch (archive_error const& e) {
      EXPECT_EQ(archive_errc::path_escapes_root, e.code()) << path;
    }
  }
}
