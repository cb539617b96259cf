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
#include <iterator>

#include <fmt/format.h>

#include <parallel_hashmap/phmap.h>

#include <squish/util.h>

#include <squish/tool/summary_table.h>

namespace squish::tool {

namespace {

std::string separator_line(size_t w0, size_t w1) {
  return fmt::format("+{}+{}+\n", std::string(w0 + 2, '-'),
                     std::string(w1 + 2, '-'));
}

} // namespace

std::string render_table(std::span<std::string const> titles,
                         std::span<table_row const> rows) {
  size_t w0{0};
  size_t w1{0};

  for (auto const& r : rows) {
    w0 = std::max(w0, r[0].size());
    w1 = std::max(w1, r[1].size());
  }

  if (titles.size() == 2) {
    w0 = std::max(w0, titles[0].size());
    w1 = std::max(w1, titles[1].size());
  } else if (titles.size() == 1 && titles[0].size() > w0 + w1 + 3) {
    w1 = titles[0].size() - w0 - 3;
  }

  auto const sep = separator_line(w0, w1);
  std::string out;
  auto it = std::back_inserter(out);

  out += sep;

  if (titles.size() == 1) {
    fmt::format_to(it, "| {:<{}} |\n", titles[0], w0 + w1 + 3);
    out += sep;
  } else if (titles.size() == 2) {
    fmt::format_to(it, "| {:^{}} | {:^{}} |\n", titles[0], w0, titles[1], w1);
    out += sep;
  }

  for (auto const& r : rows) {
    fmt::format_to(it, "| {:<{}} | {:<{}} |\n", r[0], w0, r[1], w1);
  }

  out += sep;

  return out;
}

std::string with_thousands_separator(uint64_t value) {
  auto digits = fmt::format("{}", value);
  std::string out;

  out.reserve(digits.size() + digits.size() / 3);

  for (size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) {
      out += ',';
    }
    out += digits[i];
  }

  return out;
}

std::vector<std::pair<std::string, size_t>>
top_level_breakdown(std::span<reader::file_info const> files) {
  phmap::flat_hash_map<std::string, size_t> counts;

  for (auto const& f : files) {
    auto const pos = f.path.find('/');
    ++counts[f.path.substr(0, pos)];
  }

  std::vector<std::pair<std::string, size_t>> rv(counts.begin(), counts.end());

  std::sort(rv.begin(), rv.end(), [](auto const& a, auto const& b) {
    return a.second != b.second ? a.second > b.second : a.first < b.first;
  });

  return rv;
}

std::string render_summary(reader::archive_summary const& summary) {
  std::vector<std::string> const summary_title{"Squish Summary"};
  std::vector<table_row> const summary_rows{
      {"Creation Date", summary.creation_date},
      {"Squish Version", summary.version},
      {"Compressed size", size_with_unit(summary.archive_size)},
      {"Original size", size_with_unit(summary.total_original_size)},
      {"Reduction Percentage",
       fmt::format("{:.1f}%", summary.reduction_percentage)},
      {"Number of files", with_thousands_separator(summary.files.size())},
      {"Number of chunks", with_thousands_separator(summary.unique_chunks)},
  };

  std::vector<std::string> const breakdown_titles{"Directory", "File Count"};
  std::vector<table_row> breakdown_rows;

  for (auto& [dir, count] : top_level_breakdown(summary.files)) {
    breakdown_rows.push_back({std::move(dir), with_thousands_separator(count)});
  }

  return fmt::format("\nSquish breakdown:\n{}\nTop-level directory "
                     "breakdown:\n{}",
                     render_table(summary_title, summary_rows),
                     render_table(breakdown_titles, breakdown_rows));
}

std::string render_simple_listing(reader::archive_summary const& summary) {
  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it,
                 "squish_size(bytes): {}, original_size(bytes): {}, "
                 "reduction: {:.2f}%, number_of_files: {}, chunks_count: {}\n",
                 summary.archive_size, summary.total_original_size,
                 summary.reduction_percentage, summary.files.size(),
                 summary.unique_chunks);

  fmt::format_to(it, "{:>10}  File Path\n", "Size (Bytes)");
  out += "----------  --------------------\n";

  for (auto const& f : summary.files) {
    fmt::format_to(it, "{:>10}  {}\n", f.size, f.path);
  }

  return out;
}

nlohmann::json summary_to_json(reader::archive_summary const& summary) {
  nlohmann::json files = nlohmann::json::array();

  for (auto const& f : summary.files) {
    files.push_back({{"path", f.path}, {"size", f.size}});
  }

  return {
      {"version", summary.version},
      {"creation_time", summary.creation_time},
      {"creation_date", summary.creation_date},
      {"unique_chunks", summary.unique_chunks},
      {"total_original_size", summary.total_original_size},
      {"archive_size", summary.archive_size},
      {"reduction_percentage", summary.reduction_percentage},
      {"files", std::move(files)},
  };
}

} // namespace squish::tool
