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

/* These are just so commonly used, that they are shoved here for everyone: boost.system for Error_code;
 * boost.chrono for the time stamps attached to every log record. */
#include <boost/system/error_code.hpp>
#include <boost/chrono/chrono.hpp>
#include <functional>
#include <cstdint>

/* We build in C++17 mode ourselves, and the headers use `std::variant`, `std::string_view`, `if constexpr` and
 * friends; so demand it of the including translation unit as well, with a clear message. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any sluice/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `sluice` namespace (hence the prefix for each macro).

#ifdef __linux__
/// Macro that is defined if and only if the compiling environment is Linux.
#  define SLUICE_OS_LINUX
#elif defined(__APPLE__)
/// Macro that is defined if and only if the compiling environment is Mac OS X or higher macOS.
#  define SLUICE_OS_MAC
#elif defined(_WIN32) || defined(_WIN64)
/// Macro that is defined if and only if the compiling environment is Windows.
#  define SLUICE_OS_WIN
#endif

/**
 * Catch-all namespace for the Sluice project: a structured-logging core built around a tree of composable
 * sinks ("drains") fed by a hierarchy of immutable, context-carrying loggers.
 *
 * The modules are:
 *   - sluice::log: everything a user touches to log -- log::Level, log::Value, log::Logger, log::Record,
 *     the log::Drain capability, and the built-in combinator and reference drains.
 *   - sluice::error: error-reporting facilities shared by all modules (log::error has the log-specific codes).
 *   - sluice::util: miscellaneous general-use facilities used by the above.
 *
 * There is no global state anywhere in Sluice: there is no "current logger."  A log::Logger (or a
 * log::Log_context holding one) is always passed explicitly to whatever code wants to log.
 */
namespace sluice
{

// Types.  They're outside of `namespace ::sluice::util` for brevity due to their frequent use.

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and
 * a pointer through which to obtain a statically stored message string); this is how Sluice modules report
 * errors to the user.  sluice::log::error::Code values convert to it implicitly.
 */
using Error_code = boost::system::error_code;

// See just below.
template<typename Signature>
class Function;

/**
 * Intended as the polymorphic function wrapper of choice for Sluice, internally and externally; to be used
 * instead of `std::function`.  It is a thin subclass adding `empty()` and `clear()` for readability at call
 * sites; otherwise identical to `std::function`.
 *
 * @tparam Result
 *         See `std::function`.
 * @tparam Args
 *         See `std::function`.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data of our own in this subclass, just a handful of APIs.
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.  Add none of our own.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `!bool(*this)`; i.e., `true` if and only if `*this` stores no callable.
   * @return See above.
   */
  bool empty() const noexcept;

  /// Makes `*this` store no callable, as if default-constructed.
  void clear() noexcept;
}; // class Function<Result (Args...)>

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

template<typename Result, typename... Args>
void Function<Result (Args...)>::clear() noexcept
{
  *this = nullptr;
}

} // namespace sluice
