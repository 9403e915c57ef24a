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
#include "sluice/log/log.hpp"
#include <cassert>
#include <ostream>

namespace sluice::log
{

// Record implementations.

Record::Record(Level level, util::String_view msg,
               util::String_view src_file, unsigned int src_line, unsigned int src_column,
               util::String_view src_function, util::String_view module,
               const boost::chrono::system_clock::time_point& called_when,
               const util::Thread_id& call_thread_id) :
  m_level(level),
  m_msg(msg),
  m_src_file(src_file),
  m_src_line(src_line),
  m_src_column(src_column),
  m_src_function(src_function),
  m_module(module),
  m_called_when(called_when),
  m_call_thread_id(call_thread_id)
{
  assert((level != Level::S_NONE) && (level < Level::S_END_SENTINEL));
}

// Logger implementations.

Logger::Logger() = default; // All null.

Logger::Logger(Drain::Ptr drain, Kv_list own, Error_handler error_handler) :
  m_drain(std::move(drain)),
  m_context(boost::make_shared<Context_node>(std::move(own))),
  m_error_handler(error_handler.empty()
                    ? boost::shared_ptr<const Error_handler>()
                    : boost::make_shared<Error_handler>(std::move(error_handler)))
{
  // That's it.
}

Logger::Logger(const Logger& parent, Kv_list extra) :
  m_drain(parent.m_drain),
  // Cactus stack: point at the parent's node; never copy it.
  m_context(boost::make_shared<Context_node>(std::move(extra), parent.m_context)),
  m_error_handler(parent.m_error_handler)
{
  // That's it.
}

Logger Logger::child(Kv_list extra) const
{
  return Logger(*this, std::move(extra));
}

bool Logger::is_enabled(Level level) const
{
  return m_drain && m_drain->is_enabled(level);
}

void Logger::log(const Record& record, std::initializer_list<Kv> call_site_pairs) const
{
  log(record, call_site_pairs.begin(), call_site_pairs.end());
}

void Logger::log(const Record& record, const Kv* call_site_begin, const Kv* call_site_end) const
{
  if (!m_drain)
  {
    return;
  }
  // else

  const Field_seq fields(call_site_begin, call_site_end, m_context);
  const auto err = log_contained(m_drain.get(), record, fields);
  if (err && m_error_handler)
  {
    (*m_error_handler)(err, record);
  }
  // Otherwise the error is dropped: log() must not disturb the caller's control flow.
}

const Drain::Ptr& Logger::drain() const
{
  return m_drain;
}

const Context_node::Ptr& Logger::context() const
{
  return m_context;
}

// Log_context implementations.

Log_context::Log_context(const Logger& logger, util::String_view module) :
  m_logger(logger),
  m_module(module)
{
  // Nothing.
}

const Logger& Log_context::get_logger() const
{
  return m_logger;
}

util::String_view Log_context::get_log_module() const
{
  return m_module;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
  swap(m_module, other.m_module);
}

// Level implementations.

bool level_passes(Level level, Level threshold)
{
  // S_NONE as a threshold is below everything; so it can never pass.
  return (threshold != Level::S_NONE) && (level <= threshold);
}

std::ostream& operator<<(std::ostream& os, Level val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  switch (val)
  {
    case Level::S_NONE: return os << "NONE";
    case Level::S_CRITICAL: return os << "CRITICAL";
    case Level::S_ERROR: return os << "ERROR";
    case Level::S_WARNING: return os << "WARNING";
    case Level::S_INFO: return os << "INFO";
    case Level::S_DEBUG: return os << "DEBUG";
    case Level::S_TRACE: return os << "TRACE";
    case Level::S_END_SENTINEL: assert(false && "Should not be printing sentinel.");
  }

  assert(false && "Looks like a corrupt/sentinel log::Level value.  gcc would've caught an incomplete switch().");
  return os;
}

std::istream& operator>>(std::istream& is, Level& val)
{
  // Range [NONE, END_SENTINEL); no match => NONE; allow for number instead of ostream<< string; case-insensitive.
  val = util::istream_to_enum(&is, Level::S_NONE, Level::S_END_SENTINEL);
  return is;
}

} // namespace sluice::log
