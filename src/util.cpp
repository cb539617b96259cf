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
#include <optional>
#include <string>

#include <utf8cpp/utf8.h>

#include <fmt/format.h>

#include <folly/Conv.h>
#include <folly/ExceptionString.h>
#include <folly/String.h>
#include <folly/system/HardwareConcurrency.h>

#include <squish/error.h>
#include <squish/util.h>

namespace squish {

namespace {

inline std::string trimmed(std::string in) {
  while (!in.empty() && in.back() == ' ') {
    in.pop_back();
  }
  return in;
}

} // namespace

std::string size_with_unit(file_size_t size) {
  return trimmed(folly::prettyPrint(size, folly::PRETTY_BYTES_IEC, true));
}

std::string time_with_unit(double sec) {
  return trimmed(folly::prettyPrint(sec, folly::PRETTY_TIME_HMS, false));
}

std::string time_with_unit(std::chrono::nanoseconds ns) {
  return time_with_unit(1e-9 * ns.count());
}

bool is_valid_utf8(std::string_view str) {
  return utf8::is_valid(str.begin(), str.end());
}

std::string path_to_utf8_string(std::filesystem::path const& p) {
  return u8string_to_string(p.generic_u8string());
}

bool getenv_is_enabled(char const* var) {
  if (auto val = std::getenv(var)) {
    if (auto maybe_bool = folly::tryTo<bool>(val);
        maybe_bool.hasValue() && *maybe_bool) {
      return true;
    }
  }
  return false;
}

std::string_view basename(std::string_view path) {
  auto pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

std::string exception_str(std::exception const& e) {
  return folly::exceptionStr(e).toStdString();
}

std::string exception_str(std::exception_ptr const& e) {
  return folly::exceptionStr(e).toStdString();
}

unsigned int hardware_concurrency() noexcept {
  static auto const env = [] {
    std::optional<unsigned> concurrency;
    if (auto env = std::getenv("SQUISH_OVERRIDE_HARDWARE_CONCURRENCY")) {
      if (auto v = folly::tryTo<unsigned>(env); v.hasValue()) {
        concurrency = *v;
      }
    }
    return concurrency;
  }();
  return env.value_or(folly::hardware_concurrency());
}

std::tm safe_localtime(std::time_t t) {
  std::tm buf{};
  if (!::localtime_r(&t, &buf)) {
    SQUISH_THROW(runtime_error,
                 fmt::format("localtime_r: error code {}", errno));
  }
  return buf;
}

} // namespace squish
