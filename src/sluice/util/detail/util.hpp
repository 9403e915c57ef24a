/* Sluice
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "sluice/util/detail/util_fwd.hpp"

namespace sluice::util
{

// Free functions: in *_fwd.hpp.

// Template/constexpr implementations.

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path); // This only copies the pointer and length (not the string).
#  ifdef SLUICE_OS_WIN
  constexpr char SEP = '\\';
#  else
  constexpr char SEP = '/';
#  endif
  /* Here I just want to do path.rfind(SEP)... but in C++17 not every standard library marks it `constexpr` in a way
   * that every compiler accepts in this context.  Hence I am doing it manually; a loop is fine in a C++14+ constexpr
   * function.
   * @todo Change it back to rfind() once we require C++20, where it is reliably constexpr. */
  const auto path_sz = path.size();
  if (path_sz != 0)
  {
    const auto path_ptr = path.data();
    for (auto path_search_ptr = path_ptr + path_sz - 1;
         path_search_ptr >= path_ptr; --path_search_ptr)
    {
      if ((*path_search_ptr) == SEP)
      {
        path.remove_prefix((path_search_ptr - path_ptr) + 1);
        break;
      }
    }
  }
  // else { Nothing to do. }

  return path;
} // get_last_path_segment()

} // namespace sluice::util

// Macros.

/**
 * Helper macro, same as SLUICE_UTIL_WHERE_AM_I(), but takes the source location details as arguments instead of
 * grabbing them from `__FILE__`, `__FUNCTION__`, `__LINE__`.  Arguably not useful outside of the `sluice::util`
 * module itself.
 *
 * @param ARG_file
 *        Full file name, as from `__FILE__`, as a `String_view`; or a fragment inside it (e.g., just the
 *        part past the last dir separator if any); depending on which part you'd prefer ultimately printed.
 * @param ARG_function
 *        Full function name, as from `__FUNCTION__`, as a `String_view` (recommended for perf) or `const char*`.
 * @param ARG_line
 *        Line number, as from `__LINE__`.
 * @return `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`).
 */
#define SLUICE_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/**
 * Helper macro, same as #SLUICE_UTIL_WHERE_AM_I_FROM_ARGS(), but results in a list of comma-separated, instead of
 * `<<` separated, arguments, although they are still to be passed to an `ostream` with exactly the same semantics
 * as the aforementioned macro.
 *
 * @param ARG_file
 *        See SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param ARG_function
 *        See SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param ARG_line
 *        See SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @return Exactly the same as SLUICE_UTIL_WHERE_AM_I_FROM_ARGS() but with commas instead of `<<`.
 */
#define SLUICE_UTIL_WHERE_AM_I_FROM_ARGS_TO_ARGS(ARG_file, ARG_function, ARG_line) \
  ::sluice::util::get_last_path_segment(ARG_file), ':', ARG_function, '(', ARG_line, ')'
