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

#include <array>
#include <random>

#include <squish/error.h>

#include <squish/tool/iolayer.h>
#include <squish/tool/main_adapter.h>
#include <squish_tool_main.h>

#include "test_file_util.h"
#include "test_helpers.h"

namespace squish::test {

namespace fs = std::filesystem;

std::string_view test_terminal::color(termcolor color) const {
  static constexpr std::array<std::string_view,
                              static_cast<size_t>(termcolor::NUM_COLORS)>
      // clang-format off
      colors = {{
          "<normal>",
          "<red>",
          "<green>",
          "<yellow>",
          "<cyan>",
          "<gray>",
          "<bold-red>",
          "<bold-green>",
          "<bold-yellow>",
          "<bold-cyan>",
          "<dim-cyan>",
          "<dim-yellow>",
          "<dim-magenta>",
      }};
  // clang-format on

  return colors.at(static_cast<size_t>(color));
}

std::string
test_terminal::colored(std::string text, termcolor color, bool enable) const {
  if (!enable) {
    return text;
  }

  std::string result{this->color(color)};
  result.append(text);
  result.append(this->color(termcolor::NORMAL));

  return result;
}

test_iolayer::test_iolayer()
    : term_{std::make_shared<test_terminal>()}
    , iol_{std::make_unique<tool::iolayer>(tool::iolayer{
          .term = term_,
          .in = in_,
          .out = out_,
          .err = err_,
      })} {}

test_iolayer::~test_iolayer() = default;

void write_tree(fs::path const& root, file_tree const& tree) {
  for (auto const& [rel, content] : tree) {
    auto const p = root / rel;
    fs::create_directories(p.parent_path());
    test::write_file(p, content);
  }
}

file_tree read_tree(fs::path const& root) {
  file_tree tree;

  for (auto const& e : fs::recursive_directory_iterator(root)) {
    if (e.is_regular_file()) {
      tree.emplace(e.path().lexically_relative(root).generic_string(),
                   test::read_file(e.path()));
    }
  }

  return tree;
}

std::string random_data(size_t size, uint64_t seed) {
  std::mt19937_64 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string data;

  data.reserve(size);

  for (size_t i = 0; i < size; ++i) {
    data.push_back(static_cast<char>(dist(rng)));
  }

  return data;
}

std::vector<fs::path> tree_paths(fs::path const& root, file_tree const& tree) {
  std::vector<fs::path> paths;

  for (auto const& [rel, content] : tree) {
    paths.push_back(root / rel);
  }

  return paths;
}

tool_result run_squish(std::vector<std::string> args, bool fancy) {
  test_iolayer iol;

  iol.set_terminal_is_tty(fancy);
  iol.set_terminal_fancy(fancy);

  args.insert(args.begin(), "squish");

  auto const rv = tool::main_adapter(tool::squish_main)(args, iol.get());

  return {rv, iol.out(), iol.err()};
}

} // namespace squish::test
