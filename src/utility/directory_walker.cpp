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
#include <system_error>

#include <fmt/format.h>

#include <squish/error.h>
#include <squish/logger.h>

#include <squish/utility/directory_walker.h>

namespace squish::utility {

namespace fs = std::filesystem;

std::vector<fs::path> walk_directory(logger& lgr, fs::path const& root) {
  LOG_PROXY(debug_logger_policy, lgr);

  std::error_code ec;

  if (!fs::is_directory(root, ec)) {
    if (ec) {
      SQUISH_THROW(system_error, fmt::format("cannot access {}", root.string()),
                   ec);
    }
    SQUISH_THROW(system_error,
                 fmt::format("{} is not a directory", root.string()),
                 std::make_error_code(std::errc::not_a_directory));
  }

  std::vector<fs::path> files;
  std::vector<fs::path> stack{root};

  while (!stack.empty()) {
    auto dir = std::move(stack.back());
    stack.pop_back();

    LOG_TRACE << "reading directory " << dir.string();

    fs::directory_iterator it(dir, ec);

    if (ec) {
      SQUISH_THROW(system_error,
                   fmt::format("cannot read directory {}", dir.string()), ec);
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
      auto const& entry = *it;
      auto const st = entry.symlink_status(ec);

      if (ec) {
        SQUISH_THROW(system_error,
                     fmt::format("cannot stat {}", entry.path().string()), ec);
      }

      if (fs::is_directory(st)) {
        stack.push_back(entry.path());
      } else if (entry.is_regular_file(ec)) {
        files.push_back(entry.path());
      } else {
        // dangling symlinks report an error here, which is just another
        // reason to skip the entry
        ec.clear();
        LOG_DEBUG << "skipping " << entry.path().string();
      }
    }

    if (ec) {
      SQUISH_THROW(system_error,
                   fmt::format("cannot read directory {}", dir.string()), ec);
    }
  }

  std::sort(files.begin(), files.end());

  return files;
}

} // namespace squish::utility
