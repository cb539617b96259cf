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
#include <array>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <squish/logger.h>
#include <squish/reader/archive_reader.h>
#include <squish/terminal.h>
#include <squish/util.h>
#include <squish/utility/directory_walker.h>
#include <squish/writer/archive_writer.h>

#include <squish/tool/console_progress.h>
#include <squish/tool/iolayer.h>
#include <squish/tool/summary_table.h>
#include <squish/tool/tool.h>
#include <squish_tool_main.h>

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace squish::tool {

namespace {

using namespace std::string_view_literals;

constexpr std::string_view kArchiveExtension{".squish"};

struct command {
  std::string_view name;
  std::string_view description;
  int (*fn)(int, char**, iolayer const&);
};

bool parse_options(int argc, char** argv, po::options_description const& opts,
                   po::positional_options_description const& pos,
                   po::variables_map& vm, iolayer const& iol) {
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(opts)
                  .positional(pos)
                  .run(),
              vm);
    po::notify(vm);
  } catch (po::error const& e) {
    iol.err << "error: " << e.what() << "\n";
    return false;
  }

  return true;
}

std::string colored(iolayer const& iol, std::string text, termcolor color) {
  return iol.term->colored(std::move(text), color,
                           iol.term->is_tty(iol.out) && iol.term->is_fancy());
}

std::string error_prefix(iolayer const& iol, std::string text) {
  return iol.term->colored(std::move(text), termcolor::RED,
                           iol.term->is_tty(iol.err) && iol.term->is_fancy());
}

std::string default_archive_name(std::string const& input) {
  auto p = fs::path(input).lexically_normal();

  if (!p.has_filename() && p.has_parent_path()) {
    p = p.parent_path();
  }

  return p.string() + std::string(kArchiveExtension);
}

std::string default_unpack_dir(std::string const& archive) {
  if (archive.ends_with(kArchiveExtension) &&
      archive.size() > kArchiveExtension.size()) {
    return archive.substr(0, archive.size() - kArchiveExtension.size());
  }

  return archive;
}

std::string_view display_path(std::string_view path) {
  if (path.starts_with("./"sv)) {
    path.remove_prefix(2);
  }
  return path;
}

int pack_main(int argc, char** argv, iolayer const& iol) {
  std::string input, output;
  size_t num_workers;
  logger_options logopts;

  // clang-format off
  po::options_description opts("Pack options");
  opts.add_options()
    ("input",
        po::value<std::string>(&input),
        "input directory")
    ("output,o",
        po::value<std::string>(&output),
        "output archive (default: <input>.squish)")
    ("max-threads,j",
        po::value<size_t>(&num_workers)->default_value(
            writer::archive_writer_options::kDefaultNumWorkers),
        "number of worker threads")
    ;
  // clang-format on

  add_common_options(opts, logopts);

  po::positional_options_description pos;
  pos.add("input", 1);

  po::variables_map vm;

  if (!parse_options(argc, argv, opts, pos, vm, iol)) {
    return 1;
  }

  if (vm.contains("help") or !vm.contains("input")) {
    iol.out << tool_header("squish pack")
            << "Usage: squish pack <input> [OPTIONS...]\n\n"
            << opts << "\n";
    return vm.contains("help") ? 0 : 1;
  }

  if (output.empty()) {
    output = default_archive_name(input);
  }

  try {
    stream_logger lgr(iol.term, iol.err, logopts);

    auto const files = utility::walk_directory(lgr, input);

    writer::archive_writer_options wopts;
    wopts.num_workers = num_workers;

    {
      console_progress prog(iol, "Packing");
      writer::pack(lgr, input, output, files, wopts, &prog);
    }

    auto const summary = reader::list(lgr, output);

    iol.out << colored(iol, "Packing complete!", termcolor::GREEN)
            << " Saved as " << display_path(output) << "\n"
            << fmt::format("Compression ratio was {:.1f}%\n",
                           summary.reduction_percentage);
  } catch (std::exception const& e) {
    iol.err << error_prefix(iol, "Failed to pack") << ": " << exception_str(e)
            << "\n";
    return 1;
  }

  return 0;
}

int list_main(int argc, char** argv, iolayer const& iol) {
  std::string archive;
  bool simple{false}, json{false};
  logger_options logopts;

  // clang-format off
  po::options_description opts("List options");
  opts.add_options()
    ("archive",
        po::value<std::string>(&archive),
        "input archive")
    ("simple",
        po::value<bool>(&simple)->zero_tokens(),
        "machine readable output")
    ("json",
        po::value<bool>(&json)->zero_tokens(),
        "print summary as JSON")
    ;
  // clang-format on

  add_common_options(opts, logopts);

  po::positional_options_description pos;
  pos.add("archive", 1);

  po::variables_map vm;

  if (!parse_options(argc, argv, opts, pos, vm, iol)) {
    return 1;
  }

  if (vm.contains("help") or !vm.contains("archive")) {
    iol.out << tool_header("squish list")
            << "Usage: squish list <archive> [OPTIONS...]\n\n"
            << opts << "\n";
    return vm.contains("help") ? 0 : 1;
  }

  if (simple && json) {
    iol.err << "error: --simple and --json are mutually exclusive\n";
    return 1;
  }

  try {
    stream_logger lgr(iol.term, iol.err, logopts);

    auto const summary = reader::list(lgr, archive);

    if (json) {
      iol.out << summary_to_json(summary).dump(2) << "\n";
    } else if (simple) {
      iol.out << render_simple_listing(summary);
    } else {
      iol.out << render_summary(summary);
    }
  } catch (std::exception const& e) {
    iol.err << error_prefix(iol, "Failed to list files") << ": "
            << exception_str(e) << "\n";
    return 1;
  }

  return 0;
}

int unpack_main(int argc, char** argv, iolayer const& iol) {
  std::string archive, output;
  size_t num_workers;
  logger_options logopts;

  // clang-format off
  po::options_description opts("Unpack options");
  opts.add_options()
    ("archive",
        po::value<std::string>(&archive),
        "input archive")
    ("output,o",
        po::value<std::string>(&output),
        "output directory (default: archive name without .squish)")
    ("max-threads,j",
        po::value<size_t>(&num_workers)->default_value(
            reader::archive_reader_options::kDefaultNumWorkers),
        "number of worker threads")
    ;
  // clang-format on

  add_common_options(opts, logopts);

  po::positional_options_description pos;
  pos.add("archive", 1);

  po::variables_map vm;

  if (!parse_options(argc, argv, opts, pos, vm, iol)) {
    return 1;
  }

  if (vm.contains("help") or !vm.contains("archive")) {
    iol.out << tool_header("squish unpack")
            << "Usage: squish unpack <archive> [OPTIONS...]\n\n"
            << opts << "\n";
    return vm.contains("help") ? 0 : 1;
  }

  if (output.empty()) {
    output = default_unpack_dir(archive);

    if (output == archive) {
      iol.err << "error: cannot derive output directory from " << archive
              << ", use --output\n";
      return 1;
    }
  }

  try {
    stream_logger lgr(iol.term, iol.err, logopts);

    reader::archive_reader_options ropts;
    ropts.num_workers = num_workers;

    {
      console_progress prog(iol, "Unpacking");
      reader::unpack(lgr, archive, output, ropts, &prog);
    }

    iol.out << colored(iol, "Unpacking complete!", termcolor::GREEN) << "\n"
            << display_path(archive) << " was unsquished into "
            << display_path(output) << "\n";
  } catch (std::exception const& e) {
    iol.err << error_prefix(iol, "Failed to unpack") << ": "
            << exception_str(e) << "\n";
    return 1;
  }

  return 0;
}

constexpr std::array commands{
    command{"pack"sv, "pack a directory into an archive"sv, &pack_main},
    command{"list"sv, "list the contents of an archive"sv, &list_main},
    command{"unpack"sv, "extract all files from an archive"sv, &unpack_main},
};

void usage(std::ostream& os) {
  os << tool_header("squish") << "Usage: squish <command> [OPTIONS...]\n\n"
     << "Commands:\n";

  for (auto const& cmd : commands) {
    os << fmt::format("  {:<10}{}\n", cmd.name, cmd.description);
  }

  os << "\nRun 'squish <command> --help' for command specific options.\n";
}

} // namespace

int squish_main(int argc, char** argv, iolayer const& iol) {
  if (argc < 2) {
    usage(iol.err);
    return 1;
  }

  std::string_view const name{argv[1]};

  if (name == "-h"sv || name == "--help"sv) {
    usage(iol.out);
    return 0;
  }

  auto it = std::find_if(commands.begin(), commands.end(),
                         [&](command const& c) { return c.name == name; });

  if (it == commands.end()) {
    iol.err << "error: unknown command '" << name << "'\n";
    usage(iol.err);
    return 1;
  }

  // the command name takes the place of the program name
  return it->fn(argc - 1, argv + 1, iol);
}

} // namespace squish::tool
