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
#include <boost/thread.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <iostream>
#include <string>

/**
 * Sluice module containing miscellaneous general-use facilities that don't fit into any other Sluice module.
 *
 * Each symbol therein is typically used by at least 1 other Sluice module; but all public symbols (except ones
 * under a detail/ subdirectory) are intended for use by Sluice user as well.
 */
namespace sluice::util
{
// Types.

// Find doc headers near the bodies of these compound types.

class Null_interface;

class String_ostream;

/**
 * Short-hand for standard thread class.
 * We use/encourage use of boost.thread threads (and other boost.thread facilities) over std.thread counterparts --
 * simply because it tends to be more full-featured.  Notably log::Async_drain relies on boost.thread interruption
 * points being absent from its worker loop (it never interrupts), and on `boost::condition_variable`.
 */
using Thread = boost::thread;

/**
 * @namespace sluice::util::this_thread
 * @brief Short-hand for standard this-thread namespace. Paired with util::Thread.
 */
namespace this_thread = boost::this_thread;

/// Short-hand for an OS-provided ID of a util::Thread.
using Thread_id = Thread::id;

/// Short-hand for non-reentrant, exclusive mutex.  ("Reentrant" = one can lock an already-locked-in-that-thread mutex.)
using Mutex_non_recursive = boost::mutex;

/**
 * Short-hand for advanced-capability RAII lock guard for any mutex, ensuring exclusive ownership of that mutex.
 * Note the advanced API available for the underlying type: it is possible to relinquish ownership without unlocking,
 * gain ownership of a locked mutex; and so on.  log::Async_drain needs the unlocking ability to wait on a
 * condition variable.
 *
 * @tparam Mutex
 *         A non-recursive or recursive mutex type.  Recommend one of: #Mutex_non_recursive, `boost::recursive_mutex`.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

/// Short-hand for the condition variable paired with #Lock_guard of #Mutex_non_recursive.
using Condition_variable = boost::condition_variable;

// Free functions.

/**
 * Writes to the specified string, as if the given arguments were each passed, via `<<` in sequence,
 * to an `ostringstream`, and then the result were appended to the aforementioned string variable.
 *
 * Tip: It works nicely, 99% as nicely as simply `<<`ing an `ostream`; but certain language subtleties mean
 * you may not be able to pass a manipulator like `std::hex` without an explicit cast.
 *
 * @tparam ...T
 *         Each type `T` is such that `os << t`, with types `T const & t` and `ostream& os`, builds and writes
 *         `t` to `os`, returning lvalue `os`.
 * @param target_str
 *        Pointer to the string to which to append.
 * @param ostream_args
 *        One or more arguments, such that each argument `arg` is suitable for `os << arg`, where
 *        `os` is an `ostream`.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Equivalent to ostream_op_to_string() but returns a new `string` by value instead of writing to the caller's
 * `string`.  This is useful at least in constructor initializers, where it is not possible to first
 * declare a stack variable.
 *
 * @tparam ...T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return Resulting `std::string`.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * "Induction step" version of variadic function template that simply outputs arguments 2+ via
 * `<<` to the given `ostream`, in the order given.
 *
 * @tparam ...T_rest
 *         See `...T` in ostream_op_to_string().
 * @param remaining_ostream_args
 *        See `ostream_args` in ostream_op_to_string().
 * @tparam T1
 *         Same as each of `...T_rest`.
 * @param ostream_arg1
 *        Same as each of `remaining_ostream_args`.
 * @param os
 *        Pointer to stream to which to sequentially send arguments for output.
 */
template<typename T1, typename ...T_rest>
void feed_args_to_ostream(std::ostream* os, T1 const & ostream_arg1, T_rest const &... remaining_ostream_args);

/**
 * "Induction base" for a variadic function template, this simply outputs given item to given `ostream` via `<<`.
 *
 * @tparam T
 *         See each of `...T` in ostream_op_to_string().
 * @param os
 *        Pointer to stream to which to sequentially send arguments for output.
 * @param only_ostream_arg
 *        See each of `ostream_args` in ostream_op_to_string().
 */
template<typename T>
void feed_args_to_ostream(std::ostream* os, T const & only_ostream_arg);

/**
 * Deserializes an `enum class` value from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to an `Enum`.  If none is
 * recognized, `enum_default` is the result.  The recognized values are:
 *   - "0", "1", ...: Corresponds to the underlying-integer conversion to that `Enum`.  (Can be disabled optionally.)
 *   - Case-[in]sensitive string encoding of the `Enum`, as determined by `operator<<(ostream&)` -- which must exist
 *     (or this will not compile).  Informally we recommend the encoding to be the non-S_-prefix part of the actual
 *     `Enum` member; e.g., `"WARNING"` for log::Level::S_WARNING.
 * If the scanned token does not map to any of these, or if end-of-input is encountered immediately (empty token),
 * then `enum_default` is returned.
 *
 * Error semantics: There are no invalid values or exceptions thrown; `enum_default` returned is the worst case.
 * Do note `*is_ptr` may not be `good() == true` after return.
 *
 * Tip: It is convenient to implement `operator>>(istream&)` in terms of istream_to_enum().  With both
 * `>>` and `<<` available, serialization/deserialization of the `enum class` will work; this enables
 * conversion from `string` via `lexical_cast`, which log::Verbosity_config relies on.
 *
 * @tparam Enum
 *         An `enum class` whose elements, from `enum_lowest` (non-negative) up to and including `enum_sentinel`,
 *         are strictly monotonically increasing with increment 1.  `ostream << Enum` exists and works without
 *         throwing for all values in range [`enum_lowest`, `enum_sentinel`), each encoding distinct, starting with
 *         a non-digit and consisting only of alphanumerics and underscores.
 * @param is_ptr
 *        Stream from which to deserialize.
 * @param enum_default
 *        Value to return if the token does not match either the numeric encoding (if enabled) or the `<<` encoding.
 * @param enum_sentinel
 *        `Enum` value such that all valid deserializable values have numeric conversions strictly lower than it.
 * @param accept_num_encoding
 *        If `true`, a numeric value is accepted as an encoding; otherwise it is not.
 * @param case_sensitive
 *        If `true`, then the token must exactly equal an `ostream<<` encoding of a non-sentinel `Enum`;
 *        otherwise it may equal it modulo different case.
 * @param enum_lowest
 *        The lowest `Enum` value.  Its integer value is very often 0, sometimes 1.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

// Macros.

/**
 * Expands to an `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`) containing
 * the file name, function name, and line number at the macro invocation's context.
 *
 * It's a functional macro despite taking no arguments to convey that it mimics a free function sans args.
 *
 * @internal
 *
 * ### Performance ###
 * The items `<<`ed onto the target `ostream` are each evaluated at compile-time.
 * This includes the expression involving sluice::util::get_last_path_segment() which is `constexpr`.
 */
#define SLUICE_UTIL_WHERE_AM_I() \
  SLUICE_UTIL_WHERE_AM_I_FROM_ARGS(::sluice::util::get_last_path_segment \
                                     (::sluice::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::sluice::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * Same as SLUICE_UTIL_WHERE_AM_I() but evaluates to an `std::string`.  It's probably a bit slower as
 * well, as the string must be built at runtime.
 */
#define SLUICE_UTIL_WHERE_AM_I_STR() \
  ::sluice::util::get_where_am_i_str(::sluice::util::get_last_path_segment \
                                       (::sluice::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                     ::sluice::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                     __LINE__)

/**
 * Expands to a string literal, like `"/path/to/file.cpp" ":" "func_name" "(" "332" ")"`, usable where a fully
 * compile-time context string is needed: see SLUICE_ERROR_EXEC_AND_THROW_ON_ERROR().  Being a literal, it cannot
 * strip the directory part of `__FILE__` the way SLUICE_UTIL_WHERE_AM_I() does.
 *
 * @param ARG_function
 *        Function name as an identifier (not a string); it is stringized.
 */
#define SLUICE_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" BOOST_PP_STRINGIZE(__LINE__) ")"

/**
 * Use this to create a semicolon-safe version of a "void" functional macro definition consisting of at least two
 * statements; or of one statement that would become two statements by appending a semicolon.
 *
 * Loosely speaking, IF your sub-statements are always blocks, and you have a "void" functional macro to be used in
 * the typical way (every use is a statement that looks like a function call), and the macro's definition is anything
 * *other* than an expression with an intentionally missing trailing semicolon, THEN you should probably wrap
 * that would-be macro definition in a SLUICE_UTIL_SEMICOLON_SAFE().
 *
 * The classic example is a checking log macro, `if (enabled) { log(); }`: followed by the invoker's `;` and an
 * `else` it would attach the `else` to the wrong `if` or not compile at all.  With the wrapper it behaves as a single
 * statement in every context.
 *
 * @param ARG_func_macro_definition
 *        The intended value of a functional macro, such that the "function" it approximates would have
 *        return type `void`.  Behavior is undefined if the value of this parameter ends in a semicolon.
 * @return Code to be used as the entire definition of such a macro.
 */
#define SLUICE_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace sluice::util
