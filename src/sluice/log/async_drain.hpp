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

#include "sluice/log/log.hpp"
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <deque>

namespace sluice::log
{

// Types.

/**
 * Drain that decouples the logging threads from an inner drain's (possibly slow, blocking) I/O: log() copies the
 * record and its fields into a bounded FIFO queue and returns immediately; one worker thread, started in the
 * constructor, pops them in arrival order and passes each to the inner drain.
 *
 * ### What is copied ###
 * The Record's message and module strings are copied (the other views refer to static storage); the fields are
 * taken as a Field_seq::detached() copy, which copies the call site's pairs and shares the (immutable) Context_node
 * chain.  Lazy values are not computed in the logging thread: the inner drain realizes them in the worker thread,
 * if at all.  The lazy computation results remain shared with the original log call, so if another branch of the
 * drain tree (e.g., a synchronous sibling in a Duplicate_drain) already computed one, it is not recomputed.
 *
 * ### Ordering ###
 * Records logged from one thread reach the inner drain in the order logged.  Records from different threads reach
 * it in the order they entered the queue.
 *
 * ### Overflow ###
 * When the queue holds Config::m_capacity records:
 *   - Config::Overflow::S_BLOCK (default): log() blocks until the worker makes room.  Nothing is lost.
 *   - Config::Overflow::S_DROP_OLDEST: the oldest queued record is dropped to make room; log() never blocks.
 *     Each drop is reported to the Error_handler (with log::error::Code::S_RECORDS_DROPPED and the dropped Record) and
 *     logged to the diagnostic Logger; dropped_count() tracks the total.
 *
 * A log() call made from the worker thread itself (i.e., the inner drain, directly or not, logs back into `*this`)
 * never blocks: if the queue is full, it drops the oldest record as in S_DROP_OLDEST.
 *
 * ### Errors ###
 * log() itself always returns success: the inner drain runs later, in another thread.  Its failures are passed to
 * the Error_handler given to the constructor, if any, and logged (WARNING) to the diagnostic Logger.
 *
 * ### Diagnostic logging ###
 * `*this` logs about its own operation (worker start/stop, drops, inner drain failures) to the Logger given to the
 * constructor, with module `"sluice"`.  That Logger must not lead back into `*this`; typically it is a simple
 * synchronous console logger, or the null Logger (the default).
 *
 * ### Shutdown ###
 * The destructor lets the worker handle every record accepted so far, then joins the thread.  No record accepted by
 * log() is lost at shutdown (except as dropped by the overflow policy).  The destructor must not be called
 * concurrently with log() or from the worker thread.
 */
class Async_drain :
  public Drain,
  public Log_context
{
public:
  // Types.

  /// Controls the behavior of an Async_drain; passed to its constructor.
  struct Config
  {
    // Types.

    /// What log() does when the queue is full.
    enum class Overflow
    {
      /// Block until there is room.
      S_BLOCK,
      /// Drop the oldest queued record.
      S_DROP_OLDEST
    }; // enum class Overflow

    // Constants.

    /// Default value of #m_capacity.
    static constexpr size_t S_CAPACITY_DEFAULT = 128;

    // Constructors/destructor.

    /// Constructs the default config: #S_CAPACITY_DEFAULT, Overflow::S_BLOCK, `"sluice_async"`.
    Config();

    // Data.

    /// Maximum number of records queued but not yet taken by the worker.  Must be positive.
    size_t m_capacity;

    /// See Overflow.
    Overflow m_overflow;

    /// OS name of the worker thread (truncated to the OS limit); empty means do not set one.
    std::string m_thread_name;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs the drain and starts the worker thread.
   *
   * @param diag_logger
   *        Logger to use for logging about `*this` operation (not the records it forwards!).  See class doc header.
   * @param inner
   *        Drain to which the worker forwards records; not null.
   * @param config
   *        Configuration; copied.
   * @param error_handler
   *        Receives failures of the inner drain and drop events; `empty()` means ignore them (they are still logged
   *        to `diag_logger`).  Called from the worker thread (failures) or a logging thread (drops).
   */
  explicit Async_drain(const Logger& diag_logger, Drain::Ptr inner, const Config& config = Config(),
                       Error_handler error_handler = Error_handler());

  /// Handles all accepted records; stops and joins the worker thread.  See class doc header.
  ~Async_drain() override;

  // Methods.

  /**
   * Implements interface method by enqueueing a copy of the record and (detached) fields.  May block; see class doc
   * header.
   *
   * @param record
   *        The record.
   * @param fields
   *        The fields; not realized.
   * @return Success.
   */
  Drain_error log(const Record& record, const Field_seq& fields) override;

  /**
   * Implements interface method by asking the inner drain.
   *
   * @param level
   *        The level.
   * @return See above.
   */
  bool is_enabled(Level level) const override;

  /**
   * Blocks until every record accepted by log() before this call has been handled by the inner drain.  Records
   * logged concurrently with flush() may or may not be waited for.
   *
   * @param err_code
   *        See sluice::Error_code docs for error reporting semantics.  #Error_code generated:
   *        log::error::Code::S_FLUSH_FROM_WORKER_THREAD (called from the worker thread, e.g., by the inner drain;
   *        this would never return).
   */
  void flush(Error_code* err_code = 0);

  /**
   * Returns the number of records dropped so far due to overflow.
   * @return See above.
   */
  uint64_t dropped_count() const;

private:
  // Types.

  /**
   * One queued record: the copies needed to pass it to the inner drain after the log() call has returned.
   * #m_record's message and module views point into #m_msg_copy and #m_module_copy; therefore a Log_request is never
   * copied or moved, only its owning pointer is.
   */
  struct Log_request :
    private boost::noncopyable
  {
    // Constructors/destructor.

    /**
     * Makes the copies.
     *
     * @param record
     *        Record as passed to log().
     * @param fields
     *        Fields as passed to log().
     */
    explicit Log_request(const Record& record, const Field_seq& fields);

    // Data.

    /// Copy of the message.
    const std::string m_msg_copy;

    /// Copy of the module name.
    const std::string m_module_copy;

    /// Copy of the record, but with views into the above copies.
    Record m_record;

    /// Detached copy of the fields.
    const Field_seq m_fields;
  }; // struct Log_request

  /// Short-hand for the owning pointer to a Log_request.
  using Log_request_ptr = boost::movelib::unique_ptr<Log_request>;

  // Methods.

  /// Body of the worker thread.
  void worker_main();

  /**
   * In the worker thread: passes the request to the inner drain; reports any failure.
   *
   * @param log_request
   *        The request.
   */
  void really_log(const Log_request& log_request);

  /**
   * Reports a record dropped due to overflow: error handler and diagnostic log.  Not called with #m_mutex locked.
   *
   * @param log_request
   *        The dropped request.
   */
  void report_drop(const Log_request& log_request);

  /// In the worker thread: sets its OS name per Config::m_thread_name.
  void set_worker_os_name();

  // Data.

  /// See ctor.
  const Drain::Ptr m_inner;

  /// See ctor.
  const Config m_config;

  /// See ctor.
  const Error_handler m_error_handler;

  /// Protects the mutable data below, except #m_dropped_count.
  mutable util::Mutex_non_recursive m_mutex;

  /// Signaled when #m_queue becomes non-empty or #m_stopping becomes `true`.
  util::Condition_variable m_queue_not_empty;

  /// Signaled when #m_queue gets below capacity.
  util::Condition_variable m_queue_not_full;

  /// Signaled when the worker has finished a request and found #m_queue empty.
  util::Condition_variable m_idle;

  /// The queue: back is newest.
  std::deque<Log_request_ptr> m_queue;

  /// `true` while the worker is handling a request taken from #m_queue.
  bool m_worker_busy;

  /// Set by the destructor; the worker exits once this is `true` and #m_queue is empty.
  bool m_stopping;

  /// ID of the worker thread; set by the worker itself as it starts.
  util::Thread_id m_worker_id;

  /// See dropped_count().
  std::atomic<uint64_t> m_dropped_count;

  /// The worker thread.  Declared last: it starts in the ctor body, when all the above is ready.
  boost::movelib::unique_ptr<util::Thread> m_worker;
}; // class Async_drain

} // namespace sluice::log
