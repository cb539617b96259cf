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

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <squish/detail/logging_class_factory.h>
#include <squish/source_location.h>

namespace squish {

class terminal;

class logger {
 public:
  enum level_type : unsigned {
    FATAL,
    ERROR,
    WARN,
    INFO,
    VERBOSE,
    DEBUG,
    TRACE
  };

  static char level_char(level_type level);

  virtual ~logger() = default;

  virtual void
  write(level_type level, std::string_view output, source_location loc) = 0;
  virtual level_type threshold() const = 0;

  std::string_view policy_name() const { return policy_name_; }

  static level_type parse_level(std::string_view level);
  static std::string_view level_name(level_type level);

  static std::string all_level_names();

 protected:
  template <class Policy>
  void set_policy() {
    policy_name_ = Policy::name();
  }

 private:
  std::string_view policy_name_;
};

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval);
std::istream& operator>>(std::istream& is, logger::level_type& optval);

struct logger_options {
  logger::level_type threshold{logger::WARN};
  std::optional<bool> with_context{};
};

class stream_logger : public logger {
 public:
  explicit stream_logger(logger_options const& options = {});
  explicit stream_logger(std::ostream& os, logger_options const& options = {});
  stream_logger(std::shared_ptr<terminal const> term, std::ostream& os,
                logger_options const& options = {});

  void write(level_type level, std::string_view output,
             source_location loc) override;
  level_type threshold() const override;

  void set_threshold(level_type threshold);
  void set_with_context(bool with_context) { with_context_ = with_context; }

 private:
  void write_nolock(std::string_view output);

  std::ostream& os_;
  std::mutex mutable mx_;
  std::atomic<level_type> threshold_;
  bool const color_;
  bool with_context_;
  std::shared_ptr<terminal const> term_;
};

class null_logger : public logger {
 public:
  null_logger();

  void write(level_type, std::string_view, source_location) override {}
  level_type threshold() const override { return FATAL; }
};

class level_log_entry {
 public:
  level_log_entry(logger& lgr, logger::level_type level, source_location loc)
      : lgr_(lgr)
      , level_(level)
      , loc_(loc) {}

  level_log_entry(level_log_entry const&) = delete;

  ~level_log_entry() { lgr_.write(level_, oss_.str(), loc_); }

  template <typename T>
  level_log_entry& operator<<(T const& val) {
    oss_ << val;
    return *this;
  }

 private:
  logger& lgr_;
  std::ostringstream oss_;
  logger::level_type const level_;
  source_location const loc_;
};

class timed_level_log_entry {
 public:
  timed_level_log_entry(logger& lgr, logger::level_type level,
                        source_location loc, bool with_cpu = false);
  timed_level_log_entry(timed_level_log_entry const&) = delete;
  ~timed_level_log_entry();

  template <typename T>
  timed_level_log_entry& operator<<(T const& val) {
    if (state_) {
      output_ = true;
      oss_ << val;
    }
    return *this;
  }

 private:
  class state;

  std::ostringstream oss_;
  bool output_{false};
  std::unique_ptr<state const> state_;
};

class no_log_entry {
 public:
  no_log_entry(logger&, logger::level_type) {}
  no_log_entry(logger&, logger::level_type, source_location) {}
  no_log_entry(logger&, logger::level_type, source_location, bool) {}

  template <typename T>
  no_log_entry& operator<<(T const&) {
    return *this;
  }
};

namespace detail {

template <bool LoggingEnabled>
using logger_type =
    std::conditional_t<LoggingEnabled, level_log_entry, no_log_entry>;

template <bool LoggingEnabled>
using timed_logger_type =
    std::conditional_t<LoggingEnabled, timed_level_log_entry, no_log_entry>;

} // namespace detail

template <unsigned MinLogLevel>
class MinimumLogLevelPolicy {
 public:
  template <unsigned Level>
  using logger_type = detail::logger_type<Level <= MinLogLevel>;

  template <unsigned Level>
  using timed_logger_type = detail::timed_logger_type<Level <= MinLogLevel>;

  static constexpr bool is_enabled_for(logger::level_type level) {
    return level <= MinLogLevel;
  }
};

template <typename LogPolicy>
class log_proxy {
 public:
  log_proxy(logger& lgr)
      : lgr_(lgr)
      , threshold_(lgr.threshold()) {}

  static constexpr bool policy_is_enabled_for(logger::level_type level) {
    return LogPolicy::is_enabled_for(level);
  }

  bool logger_is_enabled_for(logger::level_type level) const {
    return level <= threshold_;
  }

  auto fatal(source_location loc) const {
    return level_log_entry(lgr_, logger::FATAL, loc);
  }

  template <logger::level_type Level>
  auto entry(source_location loc) const {
    return typename LogPolicy::template logger_type<Level>(lgr_, Level, loc);
  }

  template <logger::level_type Level>
  auto timed_entry(source_location loc, bool with_cpu = false) const {
    return typename LogPolicy::template timed_logger_type<Level>(
        lgr_, Level, loc, with_cpu);
  }

  logger& get_logger() const { return lgr_; }

 private:
  logger& lgr_;
  logger::level_type threshold_;
};

#define LOG_DETAIL_LEVEL(level, lgr)                                           \
  if constexpr (std::decay_t<decltype(lgr)>::policy_is_enabled_for(            \
                    ::squish::logger::level))                                  \
    if ((lgr).logger_is_enabled_for(::squish::logger::level))                  \
  (lgr).template entry<::squish::logger::level>(                               \
      SQUISH_CURRENT_SOURCE_LOCATION)

#define LOG_DETAIL_TIMED(level, lgr, cpu)                                      \
  (lgr).template timed_entry<::squish::logger::level>(                         \
      SQUISH_CURRENT_SOURCE_LOCATION, cpu)

#define LOG_PROXY(policy, lgr) ::squish::log_proxy<policy> log_(lgr)
#define LOG_PROXY_DECL(policy) ::squish::log_proxy<policy> log_
#define LOG_PROXY_INIT(lgr) log_(lgr)
#define LOG_FATAL log_.fatal(SQUISH_CURRENT_SOURCE_LOCATION)
#define LOG_ERROR LOG_DETAIL_LEVEL(ERROR, log_)
#define LOG_WARN LOG_DETAIL_LEVEL(WARN, log_)
#define LOG_INFO LOG_DETAIL_LEVEL(INFO, log_)
#define LOG_VERBOSE LOG_DETAIL_LEVEL(VERBOSE, log_)
#define LOG_DEBUG LOG_DETAIL_LEVEL(DEBUG, log_)
#define LOG_TRACE LOG_DETAIL_LEVEL(TRACE, log_)
#define LOG_TIMED_INFO LOG_DETAIL_TIMED(INFO, log_, false)
#define LOG_TIMED_VERBOSE LOG_DETAIL_TIMED(VERBOSE, log_, false)
#define LOG_TIMED_DEBUG LOG_DETAIL_TIMED(DEBUG, log_, false)
#define LOG_CPU_TIMED_INFO LOG_DETAIL_TIMED(INFO, log_, true)
#define LOG_CPU_TIMED_VERBOSE LOG_DETAIL_TIMED(VERBOSE, log_, true)

class prod_logger_policy : public MinimumLogLevelPolicy<logger::VERBOSE> {
 public:
  static std::string_view name() { return "prod"; }
};

class debug_logger_policy : public MinimumLogLevelPolicy<logger::TRACE> {
 public:
  static std::string_view name() { return "debug"; }
};

using logger_policies = std::tuple<debug_logger_policy, prod_logger_policy>;

template <class Base, template <class> class T, class LoggerPolicyList,
          class... Args>
std::unique_ptr<Base> make_unique_logging_object(logger& lgr, Args&&... args) {
  return detail::logging_class_factory::create<T, Base, LoggerPolicyList>(
      lgr, std::forward<Args>(args)...);
}

std::string get_logger_context(source_location loc);
std::string get_current_time_string();

} // namespace squish
