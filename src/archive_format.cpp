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

#include <chrono>
#include <istream>
#include <ostream>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <squish/archive_format.h>
#include <squish/endian.h>
#include <squish/error.h>
#include <squish/util.h>

namespace squish {

namespace {

void check_write(std::ostream& os, std::string_view what) {
  if (!os) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 fmt::format("failed to write {}", what));
  }
}

void check_read(std::istream& is, std::string_view what) {
  if (is.bad()) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 fmt::format("failed to read {}", what));
  }
  if (!is) {
    SQUISH_THROW(archive_error, archive_errc::corrupt_data,
                 fmt::format("unexpected end of archive while reading {}",
                             what));
  }
}

template <typename T>
void write_le(std::ostream& os, T value) {
  little_endian<T> le{value};
  os.write(reinterpret_cast<char const*>(&le), sizeof(le));
  check_write(os, "integer");
}

template <typename T>
T read_le(std::istream& is) {
  little_endian<T> le;
  is.read(reinterpret_cast<char*>(&le), sizeof(le));
  check_read(is, "integer");
  return le.load();
}

} // namespace

format_version format_version::parse(std::string_view version) {
  format_version v;

  auto const p1 = version.find('.');
  if (p1 == std::string_view::npos) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 fmt::format("invalid version format: '{}'", version));
  }

  v.major = version.substr(0, p1);
  auto rest = version.substr(p1 + 1);

  if (auto p2 = rest.find('.'); p2 != std::string_view::npos) {
    v.minor = rest.substr(0, p2);
    v.patch = rest.substr(p2 + 1);
  } else {
    v.minor = rest;
  }

  if (v.major.empty() || v.minor.empty()) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 fmt::format("invalid version format: '{}'", version));
  }

  return v;
}

std::string magic_header() {
  return fmt::format("{}{}", kMagicPrefix, kFormatVersion);
}

void write_header(std::ostream& os) {
  auto const header = magic_header();
  os.write(header.data(), header.size());
  check_write(os, "header");
}

std::string verify_header(std::istream& is) {
  std::string header(magic_header().size(), '\0');
  is.read(header.data(), header.size());

  if (is.bad()) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 "failed to read archive header");
  }

  if (!is) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 "file too short for an archive header");
  }

  if (!header.starts_with(kMagicPrefix)) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 "invalid archive header: prefix mismatch");
  }

  auto version = header.substr(kMagicPrefix.size());

  if (!is_valid_utf8(version)) {
    SQUISH_THROW(archive_error, archive_errc::invalid_format,
                 "invalid UTF-8 in version string");
  }

  auto const found = format_version::parse(version);
  auto const current = format_version::parse(kFormatVersion);

  if (!found.is_compatible_with(current)) {
    SQUISH_THROW(archive_error, archive_errc::incompatible_version,
                 fmt::format("archive version {}.{} vs. current version {}.{}",
                             found.major, found.minor, current.major,
                             current.minor));
  }

  return version;
}

uint64_t current_timestamp() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch())
      .count();
}

void write_timestamp(std::ostream& os, uint64_t seconds) {
  write_le(os, seconds);
}

std::string format_creation_date(uint64_t seconds) {
  auto const local = safe_localtime(static_cast<std::time_t>(seconds));
  return fmt::format("{:%H:%M %d/%m/%Y}", local);
}

file_off_t write_placeholder_u64(std::ostream& os) {
  auto const pos = static_cast<file_off_t>(os.tellp());
  if (pos < 0) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 "output stream is not seekable");
  }
  write_le<uint64_t>(os, 0);
  return pos;
}

void patch_u64(std::ostream& os, file_off_t offset, uint64_t value) {
  os.seekp(offset, std::ios::beg);
  check_write(os, "placeholder (seek)");
  write_le(os, value);
  os.seekp(0, std::ios::end);
  check_write(os, "placeholder (seek to end)");
}

void write_u32(std::ostream& os, uint32_t value) { write_le(os, value); }

void write_u64(std::ostream& os, uint64_t value) { write_le(os, value); }

void write_bytes(std::ostream& os, std::span<uint8_t const> data) {
  os.write(reinterpret_cast<char const*>(data.data()), data.size());
  check_write(os, "data");
}

void write_bytes(std::ostream& os, std::string_view data) {
  os.write(data.data(), data.size());
  check_write(os, "data");
}

uint32_t read_u32(std::istream& is) { return read_le<uint32_t>(is); }

uint64_t read_u64(std::istream& is) { return read_le<uint64_t>(is); }

void read_bytes(std::istream& is, std::span<uint8_t> data) {
  is.read(reinterpret_cast<char*>(data.data()), data.size());
  check_read(is, "data");
}

std::string read_string(std::istream& is, size_t size) {
  std::string str(size, '\0');
  is.read(str.data(), size);
  check_read(is, "string");
  return str;
}

void skip_bytes(std::istream& is, file_size_t size) {
  is.seekg(static_cast<std::streamoff>(size), std::ios::cur);
  check_read(is, "data (seek)");
}

file_off_t stream_offset(std::istream& is) {
  auto const pos = static_cast<file_off_t>(is.tellg());
  if (pos < 0) {
    SQUISH_THROW(archive_error, archive_errc::io_error,
                 "input stream is not seekable");
  }
  return pos;
}

} // namespace squish
