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
#include "sluice/log/async_drain.hpp"
#include "sluice/log/error/error.hpp"
#include "sluice/error/error.hpp"
#include <boost/move/make_unique.hpp>
#include <cassert>
#include <cerrno>
#ifdef SLUICE_OS_LINUX
#  include <pthread.h>
#endif

namespace sluice::log
{

// Async_drain::Config implementations.

Async_drain::Config::Config() :
  m_capacity(S_CAPACITY_DEFAULT),
  m_overflow(Overflow::S_BLOCK),
  m_thread_name("sluice_async")
{
  // That's it.
}

// Async_drain::Log_request implementations.

Async_drain::Log_request::Log_request(const Record& record, const Field_seq& fields) :
  m_msg_copy(record.m_msg),
  m_module_copy(record.m_module),
  m_record(record),
  m_fields(fields.detached())
{
  // The copy still points at the caller's strings, which die once log() returns.  Re-point at ours.
  m_record.m_msg = m_msg_copy;
  m_record.m_module = m_module_copy;
}

// Async_drain implementations.

Async_drain::Async_drain(const Logger& diag_logger, Drain::Ptr inner, const Config& config,
                         Error_handler error_handler) :
  Log_context(diag_logger, "sluice"),
  m_inner(std::move(inner)),
  m_config(config),
  m_error_handler(std::move(error_handler)),
  m_worker_busy(false),
  m_stopping(false),
  m_dropped_count(0)
{
  assert(m_inner);
  assert((m_config.m_capacity > 0) && "Per contract, queue capacity must be positive.");

  m_worker = boost::movelib::make_unique<util::Thread>([this]() { worker_main(); });

  SLUICE_LOG_INFO("Async_drain [" << this << "]: Worker thread [" << m_worker->get_id() << "] started; "
                  "queue capacity [" << m_config.m_capacity << "]; "
                  "drop oldest on overflow? = [" << (m_config.m_overflow == Config::Overflow::S_DROP_OLDEST) << "].");
}

Async_drain::~Async_drain() // Virtual.
{
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);

    SLUICE_LOG_INFO("Async_drain [" << this << "]: Deleting.  Worker thread will first handle the "
                    "[" << m_queue.size() << "] queued records; then we will join it.");
    m_stopping = true;
  }
  m_queue_not_empty.notify_one();

  m_worker->join();

  SLUICE_LOG_INFO("Async_drain [" << this << "]: Worker thread joined; "
                  "records dropped over our lifetime: [" << m_dropped_count.load() << "].");
}

Drain_error Async_drain::log(const Record& record, const Field_seq& fields) // Virtual.
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  // Make all the copies before locking.
  auto log_request = boost::movelib::make_unique<Log_request>(record, fields);
  Log_request_ptr dropped;

  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);

    if (m_queue.size() >= m_config.m_capacity)
    {
      // Blocking in the worker thread would wait for ourselves forever.
      if ((m_config.m_overflow == Config::Overflow::S_BLOCK) && (util::this_thread::get_id() != m_worker_id))
      {
        m_queue_not_full.wait(lock, [&]() -> bool { return m_queue.size() < m_config.m_capacity; });
      }
      else
      {
        dropped = std::move(m_queue.front());
        m_queue.pop_front();
      }
    }

    m_queue.push_back(std::move(log_request));
  } // Lock_guard lock(m_mutex);

  m_queue_not_empty.notify_one();

  if (dropped)
  {
    report_drop(*dropped);
  }

  return Drain_error();
} // Async_drain::log()

bool Async_drain::is_enabled(Level level) const // Virtual.
{
  return m_inner->is_enabled(level);
}

void Async_drain::flush(Error_code* err_code)
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  if (sluice::error::exec_void_and_throw_on_error([this](Error_code* actual_err_code) { flush(actual_err_code); },
                                                  err_code, "sluice::log::Async_drain::flush()"))
  {
    return;
  }
  // else

  Lock_guard<Mutex_non_recursive> lock(m_mutex);

  if (util::this_thread::get_id() == m_worker_id)
  {
    SLUICE_ERROR_EMIT_ERROR(error::Code::S_FLUSH_FROM_WORKER_THREAD);
    return;
  }
  // else

  err_code->clear();

  SLUICE_LOG_TRACE("Async_drain [" << this << "]: Flushing [" << m_queue.size() << "] queued records.");
  m_idle.wait(lock, [&]() -> bool { return m_queue.empty() && (!m_worker_busy); });
}

uint64_t Async_drain::dropped_count() const
{
  return m_dropped_count;
}

void Async_drain::worker_main()
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    m_worker_id = util::this_thread::get_id();
  }

  set_worker_os_name();

  SLUICE_LOG_TRACE("Async_drain [" << this << "]: Worker thread starting.");

  while (true)
  {
    Log_request_ptr log_request;
    {
      Lock_guard<Mutex_non_recursive> lock(m_mutex);

      m_queue_not_empty.wait(lock, [&]() -> bool { return m_stopping || (!m_queue.empty()); });
      if (m_queue.empty())
      {
        assert(m_stopping);
        break;
      }
      // else

      log_request = std::move(m_queue.front());
      m_queue.pop_front();
      m_worker_busy = true;
    }
    m_queue_not_full.notify_one();

    really_log(*log_request);
    log_request.reset();

    bool now_idle;
    {
      Lock_guard<Mutex_non_recursive> lock(m_mutex);
      m_worker_busy = false;
      now_idle = m_queue.empty();
    }
    if (now_idle)
    {
      m_idle.notify_all();
    }
  } // while (true)

  SLUICE_LOG_TRACE("Async_drain [" << this << "]: Worker thread exiting: queue empty, and shutdown requested.");
} // Async_drain::worker_main()

void Async_drain::really_log(const Log_request& log_request)
{
  std::string exc_what;
  const auto err = log_contained(m_inner.get(), log_request.m_record, log_request.m_fields, &exc_what);
  if (!err)
  {
    return;
  }
  // else

  if (err.code() == error::Code::S_DRAIN_EXCEPTION)
  {
    SLUICE_LOG_WARNING("Async_drain [" << this << "]: Inner drain threw; exception message: [" << exc_what << "].");
  }

  SLUICE_LOG_WARNING("Async_drain [" << this << "]: Inner drain failed to handle record "
                     "[" << log_request.m_record.m_level << "] from module [" << log_request.m_module_copy << "] "
                     "logged at [" << log_request.m_record.m_src_file << ':' << log_request.m_record.m_src_line << "]: "
                     "[" << err << "].");
  SLUICE_ERROR_LOG_ERROR(err.code());

  if (!m_error_handler.empty())
  {
    m_error_handler(err, log_request.m_record);
  }
}

void Async_drain::report_drop(const Log_request& log_request)
{
  const auto n_dropped = ++m_dropped_count;

  SLUICE_LOG_WARNING("Async_drain [" << this << "]: Queue full at [" << m_config.m_capacity << "] records; "
                     "dropped the oldest one, of level [" << log_request.m_record.m_level << "] "
                     "from module [" << log_request.m_module_copy << "].  Total dropped: [" << n_dropped << "].");

  if (!m_error_handler.empty())
  {
    m_error_handler(Drain_error(error::Code::S_RECORDS_DROPPED), log_request.m_record);
  }
}

void Async_drain::set_worker_os_name()
{
  using boost::system::system_category;

  if (m_config.m_thread_name.empty())
  {
    return;
  }
  // else

#ifdef SLUICE_OS_LINUX
  std::string os_name = m_config.m_thread_name;

  // See `man pthread_setname_np`.  There is a hard limit on the length of the name, and it is:
  constexpr size_t MAX_PTHREAD_NAME_SZ = 15;
  if (os_name.size() > MAX_PTHREAD_NAME_SZ)
  {
    // Truncate.  `man` indicates not doing so shall lead to ERANGE error.
    os_name.erase(MAX_PTHREAD_NAME_SZ);
  }

  const auto result_code = ::pthread_setname_np(::pthread_self(), os_name.c_str());
  if (result_code != 0)
  {
    const Error_code sys_err_code(result_code, system_category());
    SLUICE_LOG_WARNING("Async_drain [" << this << "]: Unable to set OS thread name to [" << os_name << "] via "
                       "pthread_setname_np().  Continuing without it.  Details follow.");
    SLUICE_ERROR_SYS_ERROR_LOG_WARNING();
  }
  else
  {
    SLUICE_LOG_INFO("Async_drain [" << this << "]: OS thread name has been set to [" << os_name << "], possibly "
                    "truncated to [" << MAX_PTHREAD_NAME_SZ << "] characters.");
  }
#else
  SLUICE_LOG_INFO("Async_drain [" << this << "]: Not setting OS thread name [" << m_config.m_thread_name << "]: "
                  "supported on Linux only.");
#endif
} // Async_drain::set_worker_os_name()

} // namespace sluice::log
