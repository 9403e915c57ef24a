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

#include "sluice/error/error_fwd.hpp"
#include "sluice/log/log.hpp"
#include "sluice/util/detail/util.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace sluice::error
{
// Types.

/**
 * An `std::runtime_error` (which is an `std::exception`) that stores an #Error_code.  We derive from boost.system's
 * `system_error` which already does that nicely.  This polymorphic subclass merely improves the `what()`
 * message a little bit -- specially handling the case when there is no #Error_code, or it is falsy -- but is
 * otherwise identical.
 *
 * It is thrown by APIs following the optional-`Error_code*` convention when the caller passes null; for example
 * log::Async_drain::flush() when invoked from the worker thread itself.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The #Error_code describing the error if available; or the success value (`Error_code()`)
   *        if an error code is unavailable or inapplicable to this error.
   *        In the latter case what() will omit anything to do with error codes and feature only `context`.
   * @param context
   *        String describing the context, i.e., where/in what circumstances the error occurred/what happened.
   *        SLUICE_UTIL_WHERE_AM_I_STR() may be helpful.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error, when one only has a context string and no applicable/known error code.
   * Formally it's equivalent to `Runtime_error(Error_code(), context)`: it is syntactic sugar only.
   *
   * @param context
   *        See the other ctor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * Returns a message describing the exception.  Namely:
   *   - If no/success #Error_code passed to ctor: Message includes `context` only.
   *   - If non-success #Error_code passed to ctor: Message includes the superclass details (code, category,
   *     message) and `context`.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /**
   * This is a copy of `context` from ctor if `!err_code_or_success`; or unused otherwise.
   *
   * The superclass memorizes an `Error_code` no matter which of its constructors we use; and its `what()` would
   * then decorate `context` with a meaningless "success" message.  So, when there's no code, we keep `context` here
   * and return it from our what() directly; otherwise we pass `context` up and defer to the superclass `what()`.
   * Either way `context` is copied exactly once.
   */
  const std::string m_context_if_no_code;
}; // class Runtime_error

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    // The caller can assume non-null err_code; can perform func() equivalent and set *err_code on error.
    return false;
  }

  // err_code is null, so make our own Error_code and throw if the wrapped operation sets it.
  Error_code our_err_code;
  *ret = func(&our_err_code);

  if (our_err_code)
  {
    // Pass through the context from caller: the present location is not helpful to the log reader.
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_and_throw_on_error()

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  // See exec_and_throw_on_error().  This is just a simplified version where func() returns void.

  if (err_code)
  {
    return false;
  }

  Error_code our_err_code;
  func(&our_err_code);

  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }

  return true;
} // exec_void_and_throw_on_error()

} // namespace sluice::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val` and logs a warning about the error using SLUICE_LOG_WARNING().
 * An `err_code` variable of type that is pointer to sluice::Error_code must be declared at the point where the macro
 * is invoked; and `get_logger()` and `get_log_module()` must be available as for any `SLUICE_LOG_*()` macro.
 *
 * @param ARG_val
 *        Value convertible to sluice::Error_code.  Reminder: `Error_code` is implicitly convertible from
 *        any boost.system-enabled code set, including sluice::log::error::Code.
 */
#define SLUICE_ERROR_EMIT_ERROR(ARG_val) \
  SLUICE_UTIL_SEMICOLON_SAFE \
  ( \
    ::sluice::Error_code SLUICE_ERROR_EMIT_ERR_val(ARG_val); \
    SLUICE_LOG_WARNING("Error code emitted: [" << SLUICE_ERROR_EMIT_ERR_val << "] " \
                       "[" << SLUICE_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = SLUICE_ERROR_EMIT_ERR_val; \
  )

/**
 * Logs a warning about the given error code using SLUICE_LOG_WARNING().  Same as SLUICE_ERROR_EMIT_ERROR() but
 * does not touch any `err_code`.
 *
 * @param ARG_val
 *        See SLUICE_ERROR_EMIT_ERROR().
 */
#define SLUICE_ERROR_LOG_ERROR(ARG_val) \
  SLUICE_UTIL_SEMICOLON_SAFE \
  ( \
    ::sluice::Error_code SLUICE_ERROR_LOG_ERR_val(ARG_val); \
    SLUICE_LOG_WARNING("Error occurred: [" << SLUICE_ERROR_LOG_ERR_val << "] " \
                       "[" << SLUICE_ERROR_LOG_ERR_val.message() << "]."); \
  )

/**
 * Logs a warning about the (often `errno`-based or from a library) error code in `sys_err_code`, which must be an
 * object of type sluice::Error_code in the context of the macro's invocation.
 */
#define SLUICE_ERROR_SYS_ERROR_LOG_WARNING() \
  SLUICE_LOG_WARNING("System error occurred: [" << sys_err_code << "] [" << sys_err_code.message() << "].")

/**
 * Narrow-use macro that implements the error code/exception semantics expected of public-facing Sluice APIs taking
 * a trailing `Error_code* err_code = 0` argument: if user passes in null `err_code`, error causes
 * `Runtime_error(e_c)` to be thrown; if non-null, then `*err_code = e_c` is set sans exception.  Usage:
 *
 *   ~~~
 *   T f(AT1 arg1, Error_code* err_code = 0)
 *   {
 *     SLUICE_ERROR_EXEC_AND_THROW_ON_ERROR(T, f, arg1, _1);
 *     // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.
 *     // ...Bulk of f() goes here!  You can now set *err_code to anything without fear....
 *   }
 *   ~~~
 *
 * @see exec_void_and_throw_on_error() which you can use directly when `ARG_ret_type` would be void.
 *
 * @param ARG_ret_type
 *        The return type of the invoking function/method.  It cannot be a reference type or `void`.
 * @param ARG_function_name
 *        The name `F` such that `return F(A1, A2, ..., err_code, ...);` would recursively call the invoker.
 * @param ...
 *        `A1, A2, ..., _1, ...`: the invoker's arg list with the `err_code` arg replaced by the identifier `_1`.
 */
#define SLUICE_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  SLUICE_UTIL_SEMICOLON_SAFE \
  ( \
    /* We need both the result of the operation (if applicable) and whether it actually ran. */ \
    ARG_ret_type result; \
    if (::sluice::error::exec_and_throw_on_error \
          ([&](::sluice::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, SLUICE_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      /* f() WAS executed; did NOT throw (no error); and return value was placed into `result`. */ \
      return result; \
    } \
    /* else: f() did not run, because err_code is non-null.  Macro invoker should do its thing. */ \
  )
