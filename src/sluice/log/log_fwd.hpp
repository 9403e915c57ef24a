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
#include <boost/shared_ptr.hpp>
#include <variant>
#include <vector>

/**
 * Sluice module providing structured logging: a log call site produces a Record plus a lazily evaluated sequence of
 * key-value fields, and hands both to a tree of composable sinks (Drain objects).
 *
 * The main pieces, leaves first:
 *   - Level: the ordered severity of a record.
 *   - Value: a field payload; either an eager Scalar or a lazy computation evaluated only if some drain actually
 *     serializes it.
 *   - Context_node: an immutable, shared, singly-linked list node of key-value pairs.  Child loggers point at their
 *     parent's node instead of copying it (a "cactus stack").
 *   - Logger: a cheap, copyable, thread-safe handle of (Drain, Context_node).  Never fails; swallows drain errors
 *     into an optional error handler.
 *   - Record, Field_seq: what a Drain receives per log call.
 *   - Drain: the single polymorphic sink capability.  Built-in combinators (Discard_drain, Filter_level_drain,
 *     Filter_drain, Duplicate_drain, Atomic_switch_drain, Async_drain, ...) are themselves drains that wrap others.
 *
 * There is no global logger.  Code that wants to log receives a Logger (often via a Log_context base) explicitly;
 * the `SLUICE_LOG_*()` macros then do the rest.
 */
namespace sluice::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Async_drain;
class Atomic_switch_drain;
class Buffer_drain;
class Context_node;
class Discard_drain;
class Drain;
class Drain_error;
class Duplicate_drain;
class Field_seq;
class Filter_drain;
class Filter_level_drain;
class Ignore_result_drain;
class Kv;
class Log_context;
class Logger;
class Map_error_drain;
class Mutex_drain;
class Ostream_drain;
class Ostream_record_writer;
class Ostream_serializer;
struct Record;
class Serializer;
class Value;
class Verbosity_config;

/**
 * Enumeration of the possible levels (a/k/a severities) of log records, ordered from most to least severe.
 * A drain filtering by level passes a record if and only if the record's level is at least as severe as a threshold;
 * numerically: `record_level <= threshold`.  See level_passes().
 *
 * ### Informal semantics ###
 *   - S_CRITICAL: the program cannot continue in some important capacity.
 *   - S_ERROR: an abnormal condition subjectively more severe than WARNING.
 *   - S_WARNING: an abnormal condition, not frequent enough to degrade performance if logged.
 *   - S_INFO: a normal condition, not frequent enough to degrade performance if logged.
 *   - S_DEBUG: like INFO, but of less interest to a human skimming the log.
 *   - S_TRACE: anything that may occur with great frequency; enabling it *can* affect performance.
 *
 * Inside Sluice itself only WARNING and INFO (and TRACE, rarely) are used.
 */
enum class Level : size_t
{
  /**
   * Sentinel level that must not be specified for any actual record; but can be used as a filter threshold,
   * wherein no records (not even S_CRITICAL ones) pass.
   */
  S_NONE = 0,
  /// The program cannot continue in some important capacity.
  S_CRITICAL,
  /// A "bad" condition with "worse" impact than that of Level::S_WARNING.
  S_ERROR,
  /// A "bad" condition that is not frequent enough to be of level Level::S_TRACE.
  S_WARNING,
  /// A not-"bad" condition that is not frequent enough to be of level Level::S_TRACE.
  S_INFO,
  /// Like Level::S_INFO but of subjectively less interest to a human reader.
  S_DEBUG,
  /**
   * Any condition that may occur with great frequency (thus verbose if logged).  One MUST be able to set the
   * threshold to INFO and confidently count that logging will not affect performance.
   */
  S_TRACE,
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
}; // enum class Level

/**
 * Tag type for the "no value" Scalar alternative: the default-constructed Value holds one.  All `None`s are equal.
 */
struct None
{
};

/**
 * The type of a realized field value: the alternative held by an eager Value, or returned by a lazy one.
 * The alternatives are, in index order: None, `bool`, signed 64-bit integer, unsigned 64-bit integer, `double`,
 * `std::string`.  A Serializer receives these and picks its own encoding for each.
 */
using Scalar = std::variant<None, bool, int64_t, uint64_t, double, std::string>;

/// Short-hand for an ordered list of key-value pairs, as owned by a Context_node.
using Kv_list = std::vector<Kv>;

/**
 * Function called by a Logger (or an Async_drain) with any failure a drain reports for a given record.
 * Logging never interrupts the caller's control flow; this is the out-of-band channel for such failures.
 * It may be invoked concurrently from multiple threads.
 */
using Error_handler = Function<void (const Drain_error& err, const Record& record)>;

// Free functions.

/**
 * Returns `true` if and only if a record of the given level passes a threshold of `threshold`: i.e., the former is
 * at least as severe as the latter.  Level::S_NONE as a threshold passes nothing.
 *
 * @param level
 *        A record's level; not Level::S_NONE or Level::S_END_SENTINEL.
 * @param threshold
 *        The threshold.
 * @return See above.
 */
bool level_passes(Level level, Level threshold);

/**
 * Deserializes a log::Level from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a log::Level.  If none is
 * recognized, Level::S_NONE is the result.  The recognized values are:
 *   - "0", "1", ...: Corresponds to the `int` conversion of that log::Level (e.g., 0 being NONE).
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual log::Level member; e.g.,
 *     "warning" (or "Warning" or "WARNING" or...) for `S_WARNING`.
 * This enables parsing from config file/command line and conversion from `string` via `boost::lexical_cast`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Level& val);

/**
 * Serializes a log::Level to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Level val);

/**
 * Prints None as `none`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const None& val);

/**
 * Prints a Scalar in a plain human-readable form: `none`, `true`/`false`, a number, or the string as-is.
 * Ostream_serializer uses this.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Scalar& val);

/**
 * Returns `true`: all None values are equal.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return `true`.
 */
bool operator==(const None& val1, const None& val2);

/**
 * Returns `false`: all None values are equal.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return `false`.
 */
bool operator!=(const None& val1, const None& val2);

} // namespace sluice::log
