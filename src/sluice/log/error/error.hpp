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

/**
 * Namespace containing the log module's extension of boost.system error conventions, so that drains can report
 * failures with codes/messages from within their own set of error codes/messages.
 *
 * ### Synopsis ###
 *   ~~~
 *   // Assign a code from log's custom error code set -- to a *general* Error_code.
 *   sluice::Error_code code = sluice::log::error::Code::S_IO_FAILURE;
 *   std::cout << "General error value = [" << code.value() << "]; msg = [" << code.message() << "].\n";
 *   // And a drain can return it directly as its result:
 *   return sluice::log::Drain_error(sluice::log::error::Code::S_IO_FAILURE);
 *   ~~~
 *
 * Drains implemented outside Sluice are free to report any other boost.system-enabled code (an `errno` in
 * `system_category()`, say) instead; the codes here are merely the ones Sluice's own drains emit.
 */
namespace sluice::log::error
{

// Types.

/**
 * All possible errors returned (via sluice::Error_code, usually inside a log::Drain_error) by sluice::log drains and
 * APIs.  These values are convertible to sluice::Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that sluice::Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message().  This
 * description must be identical to the description in the /// comment below, or at least as close as possible.
 * Add new values to the end; do not delete deprecated ones.
 */
enum class Code
{
  /// Writing a record to an output stream failed; the stream is in a bad state.
  S_IO_FAILURE = 1,
  /// A field value could not be encoded by the serializer.
  S_ENCODING_FAILURE,
  /// A downstream drain rejected the record.
  S_DOWNSTREAM_REJECTED,
  /// More than one drain failed while handling a single record; see the individual codes.
  S_MULTIPLE_DRAINS_FAILED,
  /// Records were dropped from a full asynchronous queue.
  S_RECORDS_DROPPED,
  /// An asynchronous drain was asked to flush from its own worker thread, which would never complete.
  S_FLUSH_FROM_WORKER_THREAD,
  /// A drain threw an exception while handling a record; the exception was contained.
  S_DRAIN_EXCEPTION
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching sluice::Error_code.  This is used by boost.system to convert
 * `Code` to `Error_code` implicitly.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding sluice::Error_code.
 */
Error_code make_error_code(Code err_code);

} // namespace sluice::log::error

/// We may add some ADL-based overloads into this namespace outside `sluice`.
namespace boost::system
{

// Types.

/**
 * Specializing this `struct` authorizes boost.system to make `enum` `Code` implicitly convertible to `Error_code`.
 * The non-specialized version yields `value == false`.
 */
template<>
struct is_error_code_enum<::sluice::log::error::Code>
{
  /// Means `Code` `enum` values can be used for sluice::Error_code.
  static const bool value = true;
};

} // namespace boost::system
