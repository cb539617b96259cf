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

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <squish/reader/archive_summary.h>

namespace squish::tool {

using table_row = std::array<std::string, 2>;

/**
 * Render a two-column ASCII table
 *
 * A single title spans both columns, two titles head one column each.
 */
std::string render_table(std::span<std::string const> titles,
                         std::span<table_row const> rows);

std::string with_thousands_separator(uint64_t value);

/**
 * Number of files per first path component, most populated first
 *
 * Ties are ordered by name to keep the output stable.
 */
std::vector<std::pair<std::string, size_t>>
top_level_breakdown(std::span<reader::file_info const> files);

std::string render_summary(reader::archive_summary const& summary);
std::string render_simple_listing(reader::archive_summary const& summary);
nlohmann::json summary_to_json(reader::archive_summary const& summary);

} // namespace squish::tool
