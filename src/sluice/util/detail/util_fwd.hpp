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

#include "sluice/common.hpp"
#include <string>
#include <string_view>

namespace sluice::util
{

// Types.

/**
 * Short-hand for the string-view type used throughout Sluice: a very lightweight `std::string`-like
 * representation of a character sequence already in memory.  Record messages, source file/function names,
 * module names and field keys are all carried as `String_view`s, so a log call copies none of them.
 */
using String_view = std::string_view;

// Free functions.

/**
 * Helper for SLUICE_UTIL_WHERE_AM_I() and the log macros that, given a pointer/length of a string in memory
 * containing a path, returns a pointer/length into that same buffer that comprises the postfix
 * just past the last directory separator or (if none exists) to all of it.
 *
 * Since it returns a view into existing memory (typically `__FILE__`, which is in static memory), it is appropriate
 * for log call sites, where creating temporary `std::string`s is best avoided.
 *
 * ### Instructions on how to best construct `String_view path` from `__FILE__` ###
 * Use `sizeof(__FILE__)` to obtain a compile-time length: `String_view(__FILE__, sizeof(__FILE__) - 1)`.
 * The pointer+length constructor is reliably `constexpr`; so the entire call can then be evaluated by the compiler.
 *
 * @param path
 *        String containing a path from a `__FILE__` macro.  See instructions above.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view path);

/**
 * Helper for SLUICE_UTIL_WHERE_AM_I_STR() that, given values for source code file name, function, and line number,
 * returns an `std::string` equal to what SLUICE_UTIL_WHERE_AM_I() would place into an `ostream`.
 *
 * @param file
 *        See `ARG_file` for SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param function
 *        See `ARG_function` for SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @param line
 *        See `ARG_line` for SLUICE_UTIL_WHERE_AM_I_FROM_ARGS().
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace sluice::util
