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

#include <cerrno>
#include <iostream>
#include <system_error>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <folly/FileUtil.h>

#include <squish/util.h>

#include "test_file_util.h"

namespace squish::test {

namespace fs = std::filesystem;

std::string read_file(fs::path const& path) {
  std::string content;
  if (!folly::readFile(path.string().c_str(), content)) {
    throw std::system_error(errno, std::generic_category(), path.string());
  }
  return content;
}

void write_file(fs::path const& path, std::string_view content) {
  if (!folly::writeFile(content, path.string().c_str())) {
    throw std::system_error(errno, std::generic_category(), path.string());
  }
}

temporary_directory::temporary_directory(std::string_view prefix) {
  static thread_local boost::uuids::random_generator uuid_gen;
  path_ = fs::temp_directory_path() /
          (std::string(prefix) + '.' + boost::uuids::to_string(uuid_gen()));
  fs::create_directory(path_);
}

temporary_directory::~temporary_directory() {
  if (getenv_is_enabled("SQUISH_KEEP_TEMPORARY_DIRECTORIES")) {
    std::cerr << "keeping " << path_ << "\n";
    return;
  }

  std::error_code ec;
  fs::remove_all(path_, ec);

  if (ec) {
    std::cerr << "cannot remove " << path_ << ": " << ec.message() << "\n";
  }
}

} // namespace squish::test
