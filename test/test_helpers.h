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
#include <filesystem>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <squish/terminal.h>

namespace squish {

namespace tool {
struct iolayer;
} // namespace tool

namespace test {

class test_terminal : public terminal {
 public:
  void set_fancy(bool fancy) { fancy_ = fancy; }
  void set_is_tty(bool is_tty) { is_tty_ = is_tty; }
  void set_width(size_t width) { width_ = width; }

  size_t width() const override { return width_; }
  bool is_tty(std::ostream&) const override { return is_tty_; }
  bool is_fancy() const override { return fancy_; }
  std::string_view color(termcolor color) const override;
  std::string
  colored(std::string text, termcolor color, bool enable) const override;
  std::string_view carriage_return() const override { return "<cr>"; }
  std::string_view clear_line() const override { return "<clear>"; }

 private:
  bool fancy_{false};
  bool is_tty_{false};
  size_t width_{80};
};

class test_iolayer {
 public:
  test_iolayer();
  ~test_iolayer();

  tool::iolayer const& get() const { return *iol_; }

  std::string out() const { return out_.str(); }
  std::string err() const { return err_.str(); }

  void set_terminal_is_tty(bool is_tty) { term_->set_is_tty(is_tty); }
  void set_terminal_fancy(bool fancy) { term_->set_fancy(fancy); }

 private:
  std::shared_ptr<test_terminal> term_;
  std::istringstream in_;
  std::ostringstream out_;
  std::ostringstream err_;
  std::unique_ptr<tool::iolayer> iol_;
};

// relative path -> contents
using file_tree = std::map<std::string, std::string>;

void write_tree(std::filesystem::path const& root, file_tree const& tree);
file_tree read_tree(std::filesystem::path const& root);

std::string random_data(size_t size, uint64_t seed = 42);

std::vector<std::filesystem::path>
tree_paths(std::filesystem::path const& root, file_tree const& tree);

/**
 * Run the squish tool in-process
 */
struct tool_result {
  int exit_code;
  std::string out;
  std::string err;
};

tool_result run_squish(std::vector<std::string> args, bool fancy = false);

} // namespace test
} // namespace squish
