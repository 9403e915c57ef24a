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

#include "sluice/util/util_fwd.hpp"
#include "sluice/common.hpp"

/**
 * Sluice module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * boost.system's error facility.  The latter facility is quite complete; so sluice::error is intended to contain
 * only minor syntactic-sugary items.
 *
 * @note Sluice uses the convention wherein error-related facilities of a particular module X (in
 *       `namespace sluice::X`) -- especially X's dedicated error code set, if any -- are to reside
 *       in `namespace sluice::X::error`, mirroring the naming of up-one-level-from-that `sluice::error`.
 *       So the log module's codes are in sluice::log::error.
 */
namespace sluice::error
{
// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * Helper for SLUICE_ERROR_EXEC_AND_THROW_ON_ERROR() macro that does everything in the latter not needing a
 * preprocessor.  Probably not to be called except by that macro.
 *
 * The preprocessor is needed to (1) supply context (file/line #/etc.) info to the exception object; and (2) to
 * make the invoker of the macro return to *its* caller.  So this function instead (1) takes the context string as an
 * argument; and (2) returns `true` if and only if the invoker of the macro should immediately return the value
 * `*ret`.
 *
 * @tparam Func
 *         Any type such that given an instance `Func f`, the expression `r = f(&e_c)` is valid,
 *         assuming `e_c` is an #Error_code, and `r` is a `Ret`.
 * @tparam Ret
 *         The return type of the operation `func()`.
 * @param func
 *        The operation that performs whatever possibly error-generating actions are being wrapped and returns
 *        whatever value is intended for the ultimate API caller.  The `Error_code*` passed into `func()` will NOT be
 *        null; thus `func()` must NOT throw Runtime_error on error.
 * @param ret
 *        Non-null pointer to a value into which the present function will place the return value of `func()`, if
 *        indeed it executes the latter (and thus `true` is returned).
 * @param err_code
 *        Null; or non-null pointer to an error code in memory; probably originating from the API caller.
 * @param context
 *        Value suitable for the `context` argument of Runtime_error constructor.
 * @return `true` if and only if `err_code` is null; and therefore `func()` was called.
 *         `false` otherwise (the caller should perform the equivalent of `func()` while safely assuming `*err_code`
 *         may be assigned to upon error).
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Equivalent of exec_and_throw_on_error() for operations with `void` return type.  Unlike the latter function,
 * however, the present function is to be used directly as opposed to via macro.
 *
 * @tparam Func
 *         Any type such that given an instance `Func f`, the expression `f(&e_c)` is valid,
 *         assuming `e_c` is an #Error_code.
 * @param func
 *        See exec_and_throw_on_error().  Returns `void`.
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace sluice::error
