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
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>

#include <folly/lang/Assume.h>
#include <folly/small_vector.h>

#include <boost/chrono/thread_clock.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <squish/error.h>
#include <squish/logger.h>
#include <squish/terminal_ansi.h>
#include <squish/util.h>

namespace squish {

namespace {

constexpr std::array<std::pair<std::string_view, logger::level_type>, 6>
    log_level_map = {{
        {"error", logger::ERROR},
        {"warn", logger::WARN},
        {"info", logger::INFO},
        {"verbose", logger::VERBOSE},
        {"debug", logger::DEBUG},
        {"trace", logger::TRACE},
    }};

std::string_view level_color(terminal const& term, logger::level_type level) {
  switch (level) {
  case logger::FATAL:
  case logger::ERROR:
    return term.color(termcolor::BOLD_RED);
  case logger::WARN:
    return term.color(termcolor::BOLD_YELLOW);
  case logger::VERBOSE:
    return term.color(termcolor::DIM_CYAN);
  case logger::DEBUG:
    return term.color(termcolor::DIM_YELLOW);
  case logger::TRACE:
    return term.color(termcolor::GRAY);
  default:
    return {};
  }
}

} // namespace

char logger::level_char(level_type level) {
  switch (level) {
  case FATAL:
    return 'F';
  case ERROR:
    return 'E';
  case WARN:
    return 'W';
  case INFO:
    return 'I';
  case VERBOSE:
    return 'V';
  case DEBUG:
    return 'D';
  case TRACE:
    return 'T';
  }
  folly::assume_unreachable();
}

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval) {
  return os << logger::level_name(optval);
}

std::istream& operator>>(std::istream& is, logger::level_type& optval) {
  std::string s;
  is >> s;
  optval = logger::parse_level(s);
  return is;
}

logger::level_type logger::parse_level(std::string_view level) {
  // FATAL cannot be selected as a threshold
  for (auto const& [name, lvl] : log_level_map) {
    if (level == name) {
      return lvl;
    }
  }
  SQUISH_THROW(runtime_error, fmt::format("invalid logger level: {}", level));
}

std::string_view logger::level_name(level_type level) {
  for (auto const& [name, lvl] : log_level_map) {
    if (level == lvl) {
      return name;
    }
  }
  SQUISH_THROW(runtime_error, fmt::format("invalid logger level: {}",
                                          static_cast<int>(level)));
}

std::string logger::all_level_names() {
  std::string result;
  for (auto const& m : log_level_map) {
    if (!result.empty()) {
      result += ", ";
    }
    result += m.first;
  }
  return result;
}

null_logger::null_logger() { set_policy<prod_logger_policy>(); }

stream_logger::stream_logger(logger_options const& options)
    : stream_logger(std::cerr, options) {}

stream_logger::stream_logger(std::ostream& os, logger_options const& options)
    : stream_logger(std::make_shared<terminal_ansi>(), os, options) {}

stream_logger::stream_logger(std::shared_ptr<terminal const> term,
                             std::ostream& os, logger_options const& options)
    : os_(os)
    , color_(term->is_tty(os) && term->is_fancy())
    , with_context_(options.with_context ? options.with_context.value()
                                         : options.threshold >= logger::VERBOSE)
    , term_{std::move(term)} {
  set_threshold(options.threshold);
}

void stream_logger::write_nolock(std::string_view output) {
  os_ << output;
  os_.flush();
}

logger::level_type stream_logger::threshold() const {
  return threshold_.load();
}

void stream_logger::write(level_type level, std::string_view output,
                          source_location loc) {
  if (level <= threshold_ || level == FATAL) {
    auto t = get_current_time_string();
    std::string_view prefix;
    std::string_view suffix;

    if (color_) {
      prefix = level_color(*term_, level);
      if (!prefix.empty()) {
        suffix = term_->color(termcolor::NORMAL);
      }
    }

    char lchar = logger::level_char(level);
    std::string context;
    size_t context_len = 0;

    if (with_context_) {
      context = get_logger_context(loc);
      context_len = context.size();
      if (color_) {
        context = fmt::format("{}{}{}{}{}", suffix,
                              term_->color(termcolor::DIM_MAGENTA), context,
                              term_->color(termcolor::NORMAL), prefix);
      }
    }

    folly::small_vector<std::string_view, 2> lines;
    std::string_view rest = output;

    while (!rest.empty()) {
      auto pos = rest.find('\n');
      lines.push_back(rest.substr(0, pos));
      if (pos == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(pos + 1);
    }

    if (lines.empty()) {
      lines.push_back("<<< no log message >>>");
    }

    std::string buf;
    auto it = std::back_inserter(buf);
    bool first = true;

    for (auto l : lines) {
      fmt::format_to(it, "{}{} {} {}{}{}\n", prefix, lchar, t, context, l,
                     suffix);

      if (first) {
        std::ranges::fill(t, '.');
        context.assign(context_len, ' ');
        first = false;
      }
    }

    std::lock_guard lock(mx_);
    write_nolock(buf);
  }

  if (level == FATAL) {
    std::abort();
  }
}

void stream_logger::set_threshold(level_type threshold) {
  threshold_ = threshold;

  if (threshold >= level_type::DEBUG) {
    set_policy<debug_logger_policy>();
  } else {
    set_policy<prod_logger_policy>();
  }
}

class timed_level_log_entry::state {
 public:
  using thread_clock = boost::chrono::thread_clock;

  state(logger& lgr, logger::level_type level, source_location loc,
        bool with_cpu)
      : lgr_{lgr}
      , level_{level}
      , start_time_{std::chrono::steady_clock::now()}
      , cpu_start_time_{with_cpu ? std::make_optional(thread_clock::now())
                                 : std::nullopt}
      , loc_{loc} {}

  void log(std::ostringstream& oss) const {
    std::chrono::duration<double> sec =
        std::chrono::steady_clock::now() - start_time_;
    oss << " [" << time_with_unit(sec.count());
    if (cpu_start_time_) {
      boost::chrono::duration<double> cpu_time_sec =
          thread_clock::now() - cpu_start_time_.value();
      oss << ", " << time_with_unit(cpu_time_sec.count()) << " CPU";
    }
    oss << "]";
    lgr_.write(level_, oss.str(), loc_);
  }

 private:
  logger& lgr_;
  logger::level_type const level_;
  std::chrono::steady_clock::time_point const start_time_;
  std::optional<thread_clock::time_point> const cpu_start_time_;
  source_location const loc_;
};

timed_level_log_entry::timed_level_log_entry(logger& lgr,
                                             logger::level_type level,
                                             source_location loc,
                                             bool with_cpu) {
  if (level <= lgr.threshold()) {
    state_ = std::make_unique<state>(lgr, level, loc, with_cpu);
  }
}

timed_level_log_entry::~timed_level_log_entry() {
  if (state_ && output_) {
    state_->log(oss_);
  }
}

namespace detail {

bool logging_class_factory::is_policy_name(logger const& lgr,
                                           std::string_view name) {
  return lgr.policy_name() == name;
}

void logging_class_factory::on_policy_not_found(logger const& lgr) {
  SQUISH_THROW(runtime_error,
               fmt::format("no such logger policy: {}", lgr.policy_name()));
}

} // namespace detail

std::string get_logger_context(source_location loc) {
  return fmt::format("[{0}:{1}] ", basename(loc.file_name()), loc.line());
}

std::string get_current_time_string() {
  using namespace std::chrono;
  auto const now = floor<microseconds>(system_clock::now());
  auto const local = safe_localtime(system_clock::to_time_t(now));
  return fmt::format("{:%H:%M}:{:%S}", local, now);
}

} // namespace squish
