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

#include "sluice/log/field_seq.hpp"
#include <boost/noncopyable.hpp>
#include <string>
#include <vector>

namespace sluice::log
{

// Types.

/**
 * Result of Drain::log(): success, or one or more error codes.  Success is represented by the falsy (empty) value;
 * so the idiom is:
 *
 *   ~~~
 *   if (const auto err = drain->log(record, fields)) { ...handle err... }
 *   ~~~
 *
 * A drain that fans out to several others (Duplicate_drain) reports every failure it saw, via aggregate(); one
 * that forwards to one other reports that one's result unchanged.
 */
class Drain_error
{
public:
  // Constructors/destructor.

  /// Constructs success.
  Drain_error();

  /**
   * Constructs failure with the given code; or success if the code is falsy.  Not `explicit`, so a drain can
   * `return Error_code(...)` (or `return err_code` from some other API) directly.
   *
   * @param err_code
   *        The code.
   */
  Drain_error(const Error_code& err_code);

  // Methods.

  /**
   * Returns result that includes every code from `err1` and then from `err2`; thus success if and only if both are
   * success.
   *
   * @param err1
   *        A result.
   * @param err2
   *        Another result.
   * @return See above.
   */
  static Drain_error aggregate(const Drain_error& err1, const Drain_error& err2);

  /**
   * Returns `true` if and only if this is a failure.
   * @return See above.
   */
  explicit operator bool() const;

  /**
   * Returns the one code summarizing `*this`: falsy if success; the code itself if exactly one; else
   * log::error::Code::S_MULTIPLE_DRAINS_FAILED.
   *
   * @return See above.
   */
  Error_code code() const;

  /**
   * Returns all the codes, in the order they were encountered; empty if success.
   * @return See above.
   */
  const std::vector<Error_code>& codes() const;

private:
  // Data.

  /// See codes().  All are truthy.
  std::vector<Error_code> m_codes;
}; // class Drain_error

/**
 * The sink capability: the single interface implemented by every destination of log records -- the built-in
 * combinators, the built-in reference sinks (Ostream_drain, Buffer_drain) and any user-supplied output (JSON, syslog,
 * files...).  A Logger holds a `Drain::Ptr`; combinators hold `Drain::Ptr`s of their inner drains; so the
 * configuration of where records go is a tree of drains built by the application at startup (and possibly
 * re-pointed at runtime via Atomic_switch_drain).
 *
 * ### Implementing a Drain ###
 * log() receives the Record and the Field_seq.  It may inspect the Record freely (level, message, source location...).
 * It should touch the fields only if it is going to output the record: a drain that decides to discard a record must
 * not iterate or realize the fields, so that any lazy values go unevaluated.  The Record and Field_seq, and all they
 * refer to, are valid only until log() returns; a drain that defers work (Async_drain) copies what it needs.
 * Failures should be returned, not thrown; an exception that escapes anyway is turned into a failure by
 * log_contained() before it reaches the logging code.
 *
 * is_enabled() is a cheap pre-check used by the log macros to skip building the message and fields entirely.
 * Returning `true` is always correct; returning `false` promises that log() would discard any record of that level.
 *
 * ### Thread safety ###
 * A Drain may be invoked concurrently from any number of threads, as Logger objects are freely shared.  log() and
 * is_enabled() must be safe for that; a drain that cannot synchronize itself can be wrapped in a Mutex_drain.
 * is_enabled() must always be safe for concurrent use.
 */
class Drain :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to a Drain; the handle through which Logger and combinators refer to drains.
  using Ptr = boost::shared_ptr<Drain>;

  // Methods.

  /**
   * Handles one log record.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields.
   * @return Falsy on success (which includes deliberately discarding the record); else the failure(s).
   */
  virtual Drain_error log(const Record& record, const Field_seq& fields) = 0;

  /**
   * Returns `false` only if log() would discard every record of the given level.  Default implementation returns
   * `true`.
   *
   * @param level
   *        A level other than Level::S_NONE.
   * @return See above.
   */
  virtual bool is_enabled(Level level) const;
}; // class Drain

// Free functions.

/**
 * Calls `drain->log(record, fields)`, except that an exception thrown by it (by the drain itself, or by a lazy Value
 * it realizes) does not propagate: it is returned as log::error::Code::S_DRAIN_EXCEPTION.  Logger and the combinators
 * that must keep going past a failed child (Duplicate_drain, Async_drain) invoke drains through this.
 *
 * @param drain
 *        The drain; not null.
 * @param record
 *        See Drain::log().
 * @param fields
 *        See Drain::log().
 * @param what
 *        If not null, and an exception was caught, `*what` is set to its `what()`; otherwise untouched.
 * @return What `drain->log()` returned, or the above code.
 */
Drain_error log_contained(Drain* drain, const Record& record, const Field_seq& fields, std::string* what = 0);

/**
 * Prints a Drain_error: `success`, or each code as `[<code>] [<message>]`, comma-separated.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Drain_error& val);

} // namespace sluice::log
