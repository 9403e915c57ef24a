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

#include "sluice/log/filter_drain.hpp"
#include <boost/unordered_map.hpp>
#include <utility>
#include <string>
#include <vector>

namespace sluice::log
{

// Types.

/**
 * Per-module verbosity configuration, parseable from a concise string (config file, command line), from which
 * make_verbosity_filter() builds a drain that passes only records at least as severe as their module's configured
 * level.
 *
 * Put simply, one can read a string like `"ALL:INFO;net:TRACE;db.pool:WARNING"` from an `istream` via `>>`; then
 * `make_verbosity_filter(cfg, inner)`; resulting in a drain that forwards to `inner` the records of modules `net` and
 * `net.*` up to TRACE; of `db.pool` and `db.pool.*` up to WARNING; and of all other modules up to INFO.
 *
 * ### Module resolution ###
 * Module names are dotted paths and are case-insensitive (stored upper-cased).  A record's module resolves to the
 * configured name that is the longest dotted prefix of it: for `"db.pool.conn"`, `DB.POOL` beats `DB` beats the
 * default; but `DB.PO` is not a prefix in this sense.  If a name is configured more than once, the later pair wins;
 * same for the default.
 */
class Verbosity_config
{
public:
  // Types.

  /// Short-hand for the configuration capable of being encapsulated by Verbosity_config.
  using Module_level_pair_seq = std::vector<std::pair<std::string, Level>>;

  // Constants.

  /// String that Verbosity_config::parse() treats as the default/catch-all verbosity's "module" specifier.
  static const std::string S_ALL_MODULE_NAME_ALIAS;

  /// Separates module/level pairs in a Verbosity_config specifier string.
  static const char S_TOKEN_SEPARATOR;

  /// Separates module and level within each pair in a Verbosity_config specifier string.
  static const char S_PAIR_SEPARATOR;

  /// Separates the segments of a module name.
  static const char S_MODULE_SEGMENT_SEPARATOR;

  /// Default/catch-all level when none is specified.
  static const Level S_MOST_VERBOSE_LEVEL_DEFAULT;

  // Constructors/destructor.

  /// Constructs a Verbosity_config with only the default/catch-all level, #S_MOST_VERBOSE_LEVEL_DEFAULT.
  Verbosity_config();

  // Methods.

  /**
   * Deserializes `*this` from a standard input stream.  Reads a single space-delimited token from the given stream.
   * Separates that into a sequence of #S_TOKEN_SEPARATOR-delimited pairs, each representing an element of what will
   * be returnable via module_level_pairs(), in order.  Each pair is to be in one of the following forms:
   *   - No #S_PAIR_SEPARATOR; just a Level readable via its `istream>>` operator (as of this writing,
   *     a number "1", "2", ... or a string "WARNING", "info", etc.).  Then this is taken to be the level, and
   *     the module name for module_level_pairs() is taken to be as-if "" (the default).
   *   - ":level" (where the colon stands for #S_PAIR_SEPARATOR): As-if simply "level" (previous bullet point).
   *   - "ALL:level" (ditto re. colon): `ALL` is #S_ALL_MODULE_NAME_ALIAS: Same meaning as previous bullet point.
   *   - "name:level" (ditto re. colon): `name` is the module name; `level` is as above.
   *
   * Returns `true` if the token was legal; else `false`.  last_result_message() can then be invoked to get
   * further details suitable for display to the user in the case of `false`.  An unrecognized level name is illegal
   * (as opposed to silently meaning NONE).
   *
   * If `true` returned, the existing payload is completely overwritten.  Otherwise it is untouched.
   *
   * @param is
   *        Input stream.
   * @return `true` if and only if successfully deserialized.  See also last_result_message().
   */
  bool parse(std::istream& is);

  /**
   * To be used after parse() or `operator>>`, returns "" on success or a message describing the problem on failure.
   *
   * @return See above.
   */
  const std::string& last_result_message() const;

  /**
   * Read-only access to encapsulated config, given as module-name-to-level pairs in order, with an empty module
   * name specifying the default.  The first pair always has the empty name.
   *
   * @return See above.
   */
  const Module_level_pair_seq& module_level_pairs() const;

  /**
   * Returns the level threshold for records of the given module; see class doc header for the resolution rules.
   *
   * @param module
   *        Module name, as in Record::m_module.  Any case.
   * @return See above.
   */
  Level module_level(util::String_view module) const;

private:
  // Methods.

  /// Recomputes #m_level_by_module from #m_module_level_pairs.
  void index_pairs();

  // Data.

  /// See module_level_pairs().
  Module_level_pair_seq m_module_level_pairs;

  /// Resolution of #m_module_level_pairs: name (upper-case; "" for default) to level, later pairs overriding.
  boost::unordered_map<std::string, Level> m_level_by_module;

  /// See last_result_message().
  std::string m_last_result_message;
}; // class Verbosity_config

// Free functions.

/**
 * Returns a Filter_drain that forwards to `inner` exactly the records whose level passes the level `cfg` resolves
 * for their module: `level_passes(record.m_level, cfg.module_level(record.m_module))`.  A copy of `cfg` is kept;
 * later changes to `cfg` do not affect the result.  (To change verbosity at runtime, build a new filter and install
 * it via Atomic_switch_drain.)
 *
 * @param cfg
 *        Verbosity configuration.
 * @param inner
 *        Drain to which to forward passing records; not null.
 * @return See above.
 */
boost::shared_ptr<Filter_drain> make_verbosity_filter(const Verbosity_config& cfg, Drain::Ptr inner);

/**
 * Deserializes a Verbosity_config from a standard input stream by invoking `val.parse(is)`.
 * `val.last_result_message()` can be used to glean the success or failure of this operation.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Verbosity_config& val);

/**
 * Serializes a Verbosity_config to a standard output stream, in a form `>>` can parse.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Verbosity_config& val);

/**
 * Returns `true` if and only if `val1.module_level_pairs() == val2.module_level_pairs()`.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Verbosity_config& val1, const Verbosity_config& val2);

/**
 * Returns `!(val1 == val2)`.
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator!=(const Verbosity_config& val1, const Verbosity_config& val2);

} // namespace sluice::log
