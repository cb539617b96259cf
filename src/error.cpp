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
#include <cstdlib>
#include <iostream>

#include <fmt/format.h>

#include <squish/error.h>
#include <squish/util.h>

namespace squish {

namespace {

std::string located(std::string_view s, source_location const& loc) {
  return fmt::format("[{}:{}] {}", basename(loc.file_name()), loc.line(), s);
}

} // namespace

error::error(source_location loc) noexcept
    : loc_{loc} {}

runtime_error::runtime_error(std::string_view s, source_location loc)
    : error{loc}
    , what_{located(s, loc)} {}

system_error::system_error(std::string_view s, source_location loc)
    : system_error(s, errno, loc) {}

system_error::system_error(std::string_view s, int err, source_location loc)
    : system_error(s, std::error_code(err, std::generic_category()), loc) {}

system_error::system_error(std::string_view s, std::error_code ec,
                           source_location loc)
    : error{loc}
    , syserr_{ec, located(s, loc)} {}

std::string_view archive_errc_name(archive_errc code) {
  switch (code) {
  case archive_errc::invalid_format:
    return "invalid format";
  case archive_errc::incompatible_version:
    return "incompatible version";
  case archive_errc::illegal_utf8:
    return "illegal UTF-8";
  case archive_errc::missing_chunk:
    return "missing chunk";
  case archive_errc::corrupt_data:
    return "corrupt data";
  case archive_errc::path_escapes_root:
    return "path escapes root";
  case archive_errc::io_error:
    return "I/O error";
  case archive_errc::pipeline_error:
    return "pipeline error";
  }
  return "unknown error";
}

archive_error::archive_error(archive_errc code, std::string_view s,
                             source_location loc)
    : runtime_error{fmt::format("{}: {}", archive_errc_name(code), s), loc}
    , code_{code} {}

void assertion_failed(std::string_view expr, std::string_view msg,
                      source_location loc) {
  std::cerr << "Assertion `" << expr << "` failed in " << loc.file_name() << "("
            << loc.line() << "): " << msg << "\n";
  std::abort();
}

void handle_panic(std::string_view msg, source_location loc) {
  std::cerr << "Panic: " << msg << " in " << loc.file_name() << "("
            << loc.line() << ")\n";
  std::abort();
}

} // namespace squish
