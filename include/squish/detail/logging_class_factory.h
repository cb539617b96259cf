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

#include <memory>
#include <string_view>
#include <tuple>
#include <utility>

namespace squish {

class logger;

namespace detail {

/**
 * Picks the logger policy matching the logger's policy name at runtime
 * and instantiates `T<Policy>` for it.
 */
class logging_class_factory {
 public:
  template <template <class> class T, class Base, class PolicyList,
            class... Args>
  static std::unique_ptr<Base> create(logger& lgr, Args&&... args) {
    return create_from_list<T, Base>(
        lgr, static_cast<PolicyList*>(nullptr), std::forward<Args>(args)...);
  }

 private:
  template <template <class> class T, class Base, class... Policies,
            class... Args>
  static std::unique_ptr<Base>
  create_from_list(logger& lgr, std::tuple<Policies...>*, Args&&... args) {
    std::unique_ptr<Base> obj;

    // at most one of the policies can match, so args are only consumed once
    static_cast<void>(
        ((is_policy_name(lgr, Policies::name()) &&
          (obj = std::make_unique<T<Policies>>(lgr,
                                               std::forward<Args>(args)...),
           true)) ||
         ...));

    if (!obj) {
      on_policy_not_found(lgr);
    }

    return obj;
  }

  static bool is_policy_name(logger const& lgr, std::string_view name);
  [[noreturn]] static void on_policy_not_found(logger const& lgr);
};

} // namespace detail
} // namespace squish
