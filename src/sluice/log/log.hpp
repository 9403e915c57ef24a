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

#include "sluice/log/log_fwd.hpp"
#include "sluice/log/drain.hpp"
#include "sluice/log/field_seq.hpp"
#include "sluice/log/value.hpp"
#include "sluice/util/util.hpp"
#include <boost/chrono/system_clocks.hpp>
#include <initializer_list>

// Macros.  These (conceptually) belong to the sluice::log namespace (hence the prefix for each macro).

/**
 * Logs a WARNING record into sluice::log::Logger `get_logger()` with module `get_log_module()`, if such logging is
 * enabled by that Logger's Drain (Logger::is_enabled()).  Analogous macros exist for the other levels.
 *
 * The message is built from `ARG_stream_fragment` via `ostream<<`; it is not evaluated at all unless the level is
 * enabled.  It is followed by zero or more key-value pairs, the call-site fields of the record:
 *
 *   ~~~
 *   SLUICE_LOG_WARNING("Peer [" << peer << "] reset the connection.", {"bytes_lost", n_lost}, {"retry", true});
 *   ~~~
 *
 * The same is true of the pairs: a pair's Value is not even constructed unless the level is enabled.  An expensive
 * value that should be computed only if the record actually reaches a serializing drain should be made via
 * sluice::log::lazy() instead.
 *
 * `get_logger()` must return something convertible to `const Logger&`; `get_log_module()` something convertible to
 * util::String_view.  Usually both come from deriving from sluice::log::Log_context; or from SLUICE_LOG_SET_CONTEXT()
 * in the current block.
 *
 * ### Level selection ###
 * Before selecting a level for your log call site, please consider the discussion in the sluice::log::Level doc
 * header.
 *
 * @param ARG_stream_fragment
 *        Same as in SLUICE_LOG_WITH_CHECKING().
 * @param ...
 *        Zero or more key-value pairs, each of the form `{"key", value}`, `value` being convertible to
 *        sluice::log::Value.  The key must be a string literal (or otherwise have static storage duration).
 */
#define SLUICE_LOG_WARNING(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_WARNING, ARG_stream_fragment, __VA_ARGS__)

/**
 * Logs a CRITICAL record.  See SLUICE_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WARNING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_CRITICAL(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_CRITICAL, ARG_stream_fragment, __VA_ARGS__)

/**
 * Logs an ERROR record.  See SLUICE_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WARNING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_ERROR(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_ERROR, ARG_stream_fragment, __VA_ARGS__)

/**
 * Logs an INFO record.  See SLUICE_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WARNING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_INFO(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_INFO, ARG_stream_fragment, __VA_ARGS__)

/**
 * Logs a DEBUG record.  See SLUICE_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WARNING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_DEBUG(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_DEBUG, ARG_stream_fragment, __VA_ARGS__)

/**
 * Logs a TRACE record.  See SLUICE_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WARNING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_TRACE(ARG_stream_fragment, ...) \
  SLUICE_LOG_WITH_CHECKING(::sluice::log::Level::S_TRACE, ARG_stream_fragment, __VA_ARGS__)

/**
 * For the rest of the block within which this macro is instantiated, causes all `SLUICE_LOG_...()` invocations to
 * log to `ARG_logger` with module `ARG_module`, instead of the normal `get_logger()` and `get_log_module()`, if
 * there even are such things available in the block.  This is useful, for example, in `static` methods or free
 * functions, where there is no Log_context base, but a Logger is available (for example) via a parameter.
 *
 * Example:
 *   ~~~
 *   void serve(const sluice::log::Logger& logger, unsigned int port)
 *   {
 *     SLUICE_LOG_SET_CONTEXT(logger.child({{"port", port}}), "net");
 *     SLUICE_LOG_INFO("Serving.");
 *   }
 *   ~~~
 *
 * @note It will not compile if used 2+ times in the same block at the same nesting level.  (The same applies to
 *       mixing with SLUICE_LOG_SET_LOGGER() or SLUICE_LOG_SET_MODULE().)  Create sub-blocks to work around this.
 *
 * @param ARG_logger
 *        Expression convertible to `const Logger&`; a copy of it is used in subsequent `SLUICE_LOG_...()`
 *        invocations in this block.
 * @param ARG_module
 *        Expression convertible to util::String_view; it must refer to a string that outlives the block (in practice
 *        a string literal).
 */
#define SLUICE_LOG_SET_CONTEXT(ARG_logger, ARG_module) \
  SLUICE_LOG_SET_LOGGER(ARG_logger); \
  SLUICE_LOG_SET_MODULE(ARG_module)

/**
 * Equivalent to SLUICE_LOG_SET_CONTEXT() but sets the `get_logger` only.
 *
 * @param ARG_logger
 *        See SLUICE_LOG_SET_CONTEXT().
 */
#define SLUICE_LOG_SET_LOGGER(ARG_logger) \
  [[maybe_unused]] \
    const auto get_logger \
      = [SLUICE_LOG_SET_LOGGER_logger = ::sluice::log::Logger(ARG_logger)]() -> const ::sluice::log::Logger& \
          { return SLUICE_LOG_SET_LOGGER_logger; }

/**
 * Equivalent to SLUICE_LOG_SET_CONTEXT() but sets the `get_log_module` only.
 *
 * @param ARG_module
 *        See SLUICE_LOG_SET_CONTEXT().
 */
#define SLUICE_LOG_SET_MODULE(ARG_module) \
  [[maybe_unused]] \
    const auto get_log_module \
      = [SLUICE_LOG_SET_MODULE_module = ::sluice::util::String_view(ARG_module)]() -> ::sluice::util::String_view \
          { return SLUICE_LOG_SET_MODULE_module; }

/**
 * Logs a record of the specified level into sluice::log::Logger `get_logger()` with module `get_log_module()` if
 * such logging is enabled by said Logger.  The behavior is identical to that by SLUICE_LOG_WARNING() and similar, but
 * one specifies the level as an argument instead of it being hard-coded into the macro name itself.
 *
 * @note It is important that neither `ARG_stream_fragment` nor the pairs are evaluated unless Logger::is_enabled() is
 *       `true`.  Otherwise resources are wasted on constructing a message and fields that never get logged.
 *
 * @param ARG_level
 *        Level (type log::Level); not Level::S_NONE.
 * @param ARG_stream_fragment
 *        Fragment of code as if writing to a standard `ostream`.  A terminating newline is NOT to be included.
 * @param ...
 *        Same as in SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_WITH_CHECKING(ARG_level, ARG_stream_fragment, ...) \
  SLUICE_UTIL_SEMICOLON_SAFE \
  ( \
    if (get_logger().is_enabled(ARG_level)) \
    { \
      SLUICE_LOG_WITHOUT_CHECKING(ARG_level, ARG_stream_fragment, __VA_ARGS__); \
    } \
  )

/**
 * Logs a record of the specified level into sluice::log::Logger `get_logger()` with module `get_log_module()`
 * regardless of whether such logging is enabled by the Logger.  Analogous to SLUICE_LOG_WITH_CHECKING() but without
 * checking for whether it is enabled; the drains will still filter as configured, but the cost of building the
 * message and fields is always paid.
 *
 * @param ARG_level
 *        See SLUICE_LOG_WITH_CHECKING().
 * @param ARG_stream_fragment
 *        See SLUICE_LOG_WITH_CHECKING().
 * @param ...
 *        See SLUICE_LOG_WARNING().
 */
#define SLUICE_LOG_WITHOUT_CHECKING(ARG_level, ARG_stream_fragment, ...) \
  SLUICE_UTIL_SEMICOLON_SAFE \
  ( \
    using ::sluice::util::String_view; \
    using ::sluice::util::get_last_path_segment; \
    using ::boost::chrono::system_clock; \
    const ::sluice::log::Logger& SLUICE_LOG_WO_CHK_logger = get_logger(); \
    /* Important: This is from the time-of-day/calendar clock, which is not steady, monotonic, etc.; *but* it is */ \
    /* convertible to a UTC time with cosmic meaning to humans; that is invaluable. */ \
    const auto SLUICE_LOG_WO_CHK_time_stamp = system_clock::now(); \
    /* See Record::m_src_file doc.  All of these have constant values at compile time. */ \
    constexpr char const * SLUICE_LOG_WO_CHK_file_ptr = __FILE__; \
    constexpr size_t SLUICE_LOG_WO_CHK_file_sz = sizeof(__FILE__) - 1; \
    constexpr char const * SLUICE_LOG_WO_CHK_func_ptr = __FUNCTION__; \
    constexpr size_t SLUICE_LOG_WO_CHK_func_sz = sizeof(__FUNCTION__) - 1; \
    constexpr String_view SLUICE_LOG_WO_CHK_full_file_str(SLUICE_LOG_WO_CHK_file_ptr, SLUICE_LOG_WO_CHK_file_sz); \
    /* Yes -- get_last_path_segment() is constexpr and will thus "execute" at compile time! */ \
    constexpr String_view SLUICE_LOG_WO_CHK_file_str = get_last_path_segment(SLUICE_LOG_WO_CHK_full_file_str); \
    constexpr String_view SLUICE_LOG_WO_CHK_func_str(SLUICE_LOG_WO_CHK_func_ptr, SLUICE_LOG_WO_CHK_func_sz); \
    ::sluice::util::String_ostream SLUICE_LOG_WO_CHK_msg_os; \
    SLUICE_LOG_WO_CHK_msg_os.os() << ARG_stream_fragment; \
    /* Constructor call, not brace-init: the commas must be inside parentheses, for the enclosing macro's sake. */ \
    const ::sluice::log::Record SLUICE_LOG_WO_CHK_record(ARG_level, SLUICE_LOG_WO_CHK_msg_os.str_view(), \
                                                         SLUICE_LOG_WO_CHK_file_str, __LINE__, 0, \
                                                         SLUICE_LOG_WO_CHK_func_str, \
                                                         String_view(get_log_module()), \
                                                         SLUICE_LOG_WO_CHK_time_stamp, \
                                                         ::sluice::util::this_thread::get_id()); \
    SLUICE_LOG_WO_CHK_logger.log(SLUICE_LOG_WO_CHK_record, { __VA_ARGS__ }); \
  ) /* SLUICE_UTIL_SEMICOLON_SAFE() */

namespace sluice::log
{

// Types.

/**
 * Ephemeral descriptor of one log event; passed, with the Field_seq, to Drain::log().  The macros (e.g.,
 * SLUICE_LOG_WARNING()) fill it in at the call site.
 *
 * The string members are views.  They refer to: for the source location, static storage (as obtained from
 * `__FILE__` and `__FUNCTION__`); for #m_msg and #m_module, storage that lives at least until Drain::log() returns,
 * but no longer.  Hence a Record must not be kept beyond the log call; Async_drain, which needs to, keeps copies of
 * those strings alongside its copy of the Record.
 */
struct Record
{
  // Constructors/destructor.

  /**
   * Constructs the record by copying each argument into the same-named member.
   *
   * @param level
   *        See #m_level.
   * @param msg
   *        See #m_msg.
   * @param src_file
   *        See #m_src_file.
   * @param src_line
   *        See #m_src_line.
   * @param src_column
   *        See #m_src_column.
   * @param src_function
   *        See #m_src_function.
   * @param module
   *        See #m_module.
   * @param called_when
   *        See #m_called_when.
   * @param call_thread_id
   *        See #m_call_thread_id.
   */
  explicit Record(Level level, util::String_view msg,
                  util::String_view src_file, unsigned int src_line, unsigned int src_column,
                  util::String_view src_function, util::String_view module,
                  const boost::chrono::system_clock::time_point& called_when,
                  const util::Thread_id& call_thread_id);

  // Data.

  /// Level of the record.  Not Level::S_NONE or Level::S_END_SENTINEL.
  Level m_level;

  /// The message, as built from the call site's `ostream<<` fragment.
  util::String_view m_msg;

  /**
   * Pointer/length into static-storage string that would have come from built-in `__FILE__` macro which is
   * auto-invoked by `SLUICE_LOG_*()` logging call sites.  Formally this should be the abs. or rel. path to the
   * current source file; but in practice the macros reduce it to the last path segment (the file's name) at
   * compile time.
   */
  util::String_view m_src_file;

  /// Copy of integer that would have come from built-in `__LINE__` macro.
  unsigned int m_src_line;

  /// Column within #m_src_line; 0 means unknown (the macros always give 0).
  unsigned int m_src_column;

  /// Analogous to #m_src_file but coming from `__FUNCTION__`, not `__FILE__`.
  util::String_view m_src_function;

  /**
   * The module (a/k/a area, or component) of the program that logged: a dotted name such as `"net.tcp"`, as
   * returned by `get_log_module()` at the call site.  Verbosity_config uses it to pick a per-module level.
   */
  util::String_view m_module;

  /**
   * Time stamp from as close as possible to entering the log call site (usually `SLUICE_LOG_WARNING()` or
   * similar).  It is from the calendar clock, so convertible to a human-meaningful UTC time.
   */
  boost::chrono::system_clock::time_point m_called_when;

  /// ID of the thread from which the record was logged.
  util::Thread_id m_call_thread_id;
}; // struct Record

/**
 * The handle through which code logs: pairs a Drain (where the records go) with a Context_node (which key-value
 * pairs they carry in addition to the call site's own), plus an optional Error_handler.
 *
 * A Logger is immutable, cheap to copy (three reference-counted pointers), and may be used concurrently from any
 * number of threads; all synchronization needed to actually output records lives in the drains.  There is no global
 * Logger: code that logs receives one explicitly, usually by deriving from Log_context.
 *
 * ### Hierarchy ###
 * A child Logger (child(), or the 2-arg constructor) shares its parent's drain and error handler and adds its own
 * list of pairs in a new Context_node pointing at the parent's.  Creating a child costs time proportional only to
 * the number of pairs it adds.  The drain, for every record, sees: the call site's pairs, then the emitting Logger's
 * own, then each ancestor's, nearest first; see Field_seq.
 *
 * ### Errors ###
 * log() never fails, as far as the caller can tell: a failure reported by the drain is given to the error handler,
 * if any, and is otherwise ignored.
 *
 * ### The null Logger ###
 * A default-constructed Logger has no drain; is_enabled() is always `false` for it; and logging to it is a no-op.
 * It is the natural "do not log" value, e.g., for the diagnostic Logger passed to Async_drain.
 */
class Logger
{
public:
  // Constructors/destructor.

  /// Constructs the null Logger; see class doc header.
  Logger();

  /**
   * Constructs a root Logger: one whose Context_node has no parent.
   *
   * @param drain
   *        Where records go.  May be null, making an equivalent of the null Logger (but with a context).
   * @param own
   *        Pairs attached to every record logged via `*this` and its descendants.
   * @param error_handler
   *        Function to receive drain failures; an `empty()` one means failures are ignored.  Descendants inherit it.
   */
  explicit Logger(Drain::Ptr drain, Kv_list own = Kv_list(), Error_handler error_handler = Error_handler());

  /**
   * Constructs a child Logger of `parent`.  Never fails.  Equivalent to `parent.child(extra)`.
   *
   * @param parent
   *        The parent; its drain and error handler are shared.
   * @param extra
   *        The child's own pairs.
   */
  explicit Logger(const Logger& parent, Kv_list extra);

  // Methods.

  /**
   * Returns a child Logger with the given own pairs; see class doc header.
   *
   * @param extra
   *        The child's own pairs.
   * @return See above.
   */
  Logger child(Kv_list extra) const;

  /**
   * Returns `false` if a record of the given level would certainly be discarded by the drain (or there is no
   * drain).  The log macros call this before building the message and fields.
   *
   * @param level
   *        A level other than Level::S_NONE.
   * @return See above.
   */
  bool is_enabled(Level level) const;

  /**
   * Passes the given record, with the given call-site pairs followed by `*this` context, to the drain; passes any
   * failure to the error handler.  Usually invoked by a `SLUICE_LOG_*()` macro.
   *
   * @param record
   *        The record.
   * @param call_site_pairs
   *        The call site's own pairs.
   */
  void log(const Record& record, std::initializer_list<Kv> call_site_pairs) const;

  /**
   * Identical to the other log() but takes the call-site pairs as a range.
   *
   * @param record
   *        The record.
   * @param call_site_begin
   *        Start of call-site pairs.
   * @param call_site_end
   *        End of call-site pairs.
   */
  void log(const Record& record, const Kv* call_site_begin, const Kv* call_site_end) const;

  /**
   * Returns the drain; null if none.
   * @return See above.
   */
  const Drain::Ptr& drain() const;

  /**
   * Returns the node holding `*this` own pairs, linked to the ancestors'; null for the null Logger.
   * @return See above.
   */
  const Context_node::Ptr& context() const;

private:
  // Data.

  /// See drain().
  Drain::Ptr m_drain;

  /// See context().
  Context_node::Ptr m_context;

  /// Receives drain failures; null if none.  Shared with descendants.
  boost::shared_ptr<const Error_handler> m_error_handler;
}; // class Logger

/**
 * Convenience class that simply stores a Logger and a module name, providing the `get_logger()` and
 * `get_log_module()` that the `SLUICE_LOG_*()` macros expect.  Derive from it (even privately) to make those macros
 * available in a class's methods:
 *
 *   ~~~
 *   class Cool_class : private sluice::log::Log_context
 *   {
 *   public:
 *     explicit Cool_class(const sluice::log::Logger& logger) :
 *       Log_context(logger.child({{"obj", "cool"}}), "cool") {}
 *     void run() { SLUICE_LOG_INFO("Running.", {"attempt", 1}); }
 *   };
 *   ~~~
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs Log_context by storing the given Logger and module.
   *
   * @param logger
   *        Logger to use; a copy is stored.
   * @param module
   *        Module name, e.g. `"net.tcp"`; a copy is stored.
   */
  explicit Log_context(const Logger& logger = Logger(), util::String_view module = "");

  // Methods.

  /**
   * Returns the stored Logger.
   * @return See above.
   */
  const Logger& get_logger() const;

  /**
   * Returns the stored module name.
   * @return See above.  Valid as long as `*this` exists and its module is not changed.
   */
  util::String_view get_log_module() const;

  /**
   * Swaps Logger and module with another object.
   *
   * @param other
   *        Other object.
   */
  void swap(Log_context& other);

private:
  // Data.

  /// The Logger.
  Logger m_logger;

  /// The module name.
  std::string m_module;
}; // class Log_context

// Free functions: in *_fwd.hpp.

} // namespace sluice::log
