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

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

#include <squish/types.h>

/*
 * On-disk layout, all integers are little-endian:
 *
 *   header        "squish" ++ "MM.mm.pp"
 *   timestamp     u64 seconds since the epoch
 *   chunk count   u64, written as 0 and patched once packing is done
 *   chunk table   N x { digest[16], original_len u64, compressed_len u64,
 *                       compressed bytes }
 *   file count    u32
 *   file table    M x { path_len u32, path (UTF-8), original_size u64,
 *                       chunk_count u32, digest[16] x chunk_count }
 */

namespace squish {

constexpr std::string_view kMagicPrefix{"squish"};
constexpr std::string_view kFormatVersion{"01.00.00"};

constexpr size_t kChunkSize{2 * 1024 * 1024};

// upper bound for a single decompressed chunk when reading
constexpr size_t kMaxDecompressedChunkSize{5 * kChunkSize};

struct format_version {
  std::string_view major;
  std::string_view minor;
  std::string_view patch;

  /**
   * Split a "MM.mm[.pp]" version string, throws invalid_format on failure
   */
  static format_version parse(std::string_view version);

  bool is_compatible_with(format_version const& other) const {
    return major == other.major && minor == other.minor;
  }
};

std::string magic_header();

void write_header(std::ostream& os);

/**
 * Read and validate the archive header
 *
 * Reads exactly `magic_header().size()` bytes. Throws `invalid_format` on a
 * prefix mismatch or malformed version and `incompatible_version` if the
 * major or minor version differ from `kFormatVersion`.
 *
 * \returns The version string found in the header.
 */
std::string verify_header(std::istream& is);

uint64_t current_timestamp();
void write_timestamp(std::ostream& os, uint64_t seconds);

/**
 * Local time representation of an archive timestamp ("HH:MM DD/MM/YYYY")
 */
std::string format_creation_date(uint64_t seconds);

/**
 * Reserve space for a u64 that will be patched later
 *
 * \returns The offset of the placeholder.
 */
file_off_t write_placeholder_u64(std::ostream& os);

/**
 * Overwrite the u64 at `offset` and reposition the stream at its end
 */
void patch_u64(std::ostream& os, file_off_t offset, uint64_t value);

void write_u32(std::ostream& os, uint32_t value);
void write_u64(std::ostream& os, uint64_t value);
void write_bytes(std::ostream& os, std::span<uint8_t const> data);
void write_bytes(std::ostream& os, std::string_view data);

uint32_t read_u32(std::istream& is);
uint64_t read_u64(std::istream& is);
void read_bytes(std::istream& is, std::span<uint8_t> data);
std::string read_string(std::istream& is, size_t size);
void skip_bytes(std::istream& is, file_size_t size);

file_off_t stream_offset(std::istream& is);

} // namespace squish
