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

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

#include <squish/source_location.h>

namespace squish {

class error : public std::exception {
 public:
  auto location() const { return loc_; }
  auto file() const { return loc_.file_name(); }
  auto line() const { return loc_.line(); }

 protected:
  error(source_location loc) noexcept;

 private:
  source_location loc_;
};

class runtime_error : public error {
 public:
  runtime_error(std::string_view s, source_location loc);

  char const* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

class system_error : public error {
 public:
  system_error(std::string_view s, source_location loc);
  system_error(std::string_view s, int err, source_location loc);
  system_error(std::string_view s, std::error_code ec, source_location loc);

  char const* what() const noexcept override { return syserr_.what(); }
  std::error_code const& code() const noexcept { return syserr_.code(); }
  int get_errno() const { return code().value(); }

 private:
  std::system_error syserr_;
};

enum class archive_errc {
  invalid_format,
  incompatible_version,
  illegal_utf8,
  missing_chunk,
  corrupt_data,
  path_escapes_root,
  io_error,
  pipeline_error,
};

std::string_view archive_errc_name(archive_errc code);

/**
 * Error raised while producing or consuming an archive
 *
 * The code tells callers (and tests) which class of failure occurred,
 * the message names the offending path where there is one.
 */
class archive_error : public runtime_error {
 public:
  archive_error(archive_errc code, std::string_view s, source_location loc);

  archive_errc code() const noexcept { return code_; }

 private:
  archive_errc code_;
};

#define SQUISH_THROW(cls, ...)                                                 \
  throw cls(__VA_ARGS__, SQUISH_CURRENT_SOURCE_LOCATION)

#define SQUISH_CHECK(expr, message)                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      ::squish::assertion_failed(#expr, message,                               \
                                 SQUISH_CURRENT_SOURCE_LOCATION);              \
    }                                                                          \
  } while (false)

#define SQUISH_PANIC(message)                                                  \
  do {                                                                         \
    ::squish::handle_panic(message, SQUISH_CURRENT_SOURCE_LOCATION);           \
  } while (false)

[[noreturn]] void assertion_failed(std::string_view expr, std::string_view msg,
                                   source_location loc);

[[noreturn]] void handle_panic(std::string_view msg, source_location loc);

} // namespace squish
