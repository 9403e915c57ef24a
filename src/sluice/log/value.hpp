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
#include <boost/make_shared.hpp>
#include <type_traits>
#include <utility>

namespace sluice::log
{

// Types.

/**
 * The payload of one log field: either an *eager* Scalar, held ready; or a *lazy* computation, which produces a
 * Scalar from the Record being logged -- but only if, and when, some Drain actually realizes it (see
 * Field_seq::realize()).  A combinator that drops a record before it reaches a serializing drain never triggers a
 * lazy computation; and within one log call the computation runs at most once no matter how many drains realize it.
 *
 * Value is a cheap-to-copy value type: an eager Value copies its Scalar; a lazy one shares its (immutable) function
 * object via `boost::shared_ptr`.
 *
 * ### Constructing ###
 * Implicit conversions exist from the natural C++ types, so that call sites read naturally:
 *
 *   ~~~
 *   SLUICE_LOG_INFO("Accepted.", {"port", port}, {"peer", peer_str}, {"secure", true},
 *                   {"digest", sluice::log::lazy([blob](const Record&) { return blob->digest_str(); })});
 *   ~~~
 *
 * Any integer type other than `bool` becomes the signed or unsigned 64-bit alternative according to its signedness;
 * `float` becomes `double`; `const char*`, util::String_view and `std::string` become `std::string` (copied).
 *
 * ### Thread safety ###
 * The lazy function may be invoked from a thread other than the one that logged (Async_drain's worker).  It is stored
 * as a `const` function object and always invoked through a `const` reference; it is up to the user to make sure
 * any state it captures is safe to access concurrently with the logging thread.  lazy() checks at compile time that
 * the callable is invocable as `const`.
 */
class Value
{
public:
  // Types.

  /// The type of the stored lazy computation.
  using Lazy_func = Function<Scalar (const Record& record)>;

  /// Short-hand for ref-counted pointer to an immutable #Lazy_func; the identity of a lazy computation.
  using Lazy_func_ptr = boost::shared_ptr<const Lazy_func>;

  // Constructors/destructor.

  /// Constructs an eager Value holding None.
  Value();

  /**
   * Constructs an eager Value holding the given Scalar.
   * @param val
   *        The value.
   */
  Value(Scalar val);

  /**
   * Constructs an eager Value holding `None`.
   * @param val
   *        Ignored.
   */
  Value(None val);

  /**
   * Constructs an eager Value holding a `bool`.
   * @param val
   *        The value.
   */
  Value(bool val);

  /**
   * Constructs an eager Value holding the integer, as `int64_t` if `Integer` is signed, else as `uint64_t`.
   *
   * @tparam Integer
   *         Any integral type except `bool`.
   * @param val
   *        The value.
   */
  template<typename Integer,
           typename = std::enable_if_t<std::is_integral_v<Integer> && (!std::is_same_v<Integer, bool>)>>
  Value(Integer val);

  /**
   * Constructs an eager Value holding a `double`.
   * @param val
   *        The value.
   */
  Value(double val);

  /**
   * Constructs an eager Value holding a copy of the given NUL-terminated string.
   * @param val
   *        The value; not null.
   */
  Value(const char* val);

  /**
   * Constructs an eager Value holding a copy of the given string.
   * @param val
   *        The value.
   */
  Value(util::String_view val);

  /**
   * Constructs an eager Value holding the given string (moved-in).
   * @param val
   *        The value.
   */
  Value(std::string val);

  /**
   * Constructs a lazy Value.  Use lazy() instead, which builds `func` from any suitable callable.
   *
   * @param func
   *        The computation; not null.
   */
  explicit Value(Lazy_func_ptr func);

  // Methods.

  /**
   * Returns `true` if and only if `*this` holds a lazy computation.
   * @return See above.
   */
  bool is_lazy() const;

  /**
   * Returns the held Scalar.  Behavior undefined (assertion may trip) if is_lazy().
   * @return See above.
   */
  const Scalar& eager() const;

  /**
   * Returns the held lazy computation.  Behavior undefined (assertion may trip) unless is_lazy().
   * @return See above.
   */
  const Lazy_func_ptr& lazy_func() const;

private:
  // Data.

  /// The eager value; or the lazy computation.
  std::variant<Scalar, Lazy_func_ptr> m_payload;
}; // class Value

/**
 * One key-value pair; a field of a log record.  The key must refer to a string with static storage duration (in
 * practice a string literal); it is never copied, not even by Async_drain.  Duplicate keys are permitted anywhere
 * and are never de-duplicated.
 */
class Kv
{
public:
  // Constructors/destructor.

  /**
   * Constructs the pair.  Not `explicit`, so that `{"key", value}` works at call sites.
   *
   * @param key
   *        The key.  See class doc header regarding its lifetime.
   * @param value
   *        The value.
   */
  Kv(util::String_view key, Value value);

  // Data.

  /// The key.
  util::String_view m_key;

  /// The value.
  Value m_value;
}; // class Kv

// Free functions.

/**
 * Makes a lazy Value from the given callable, which shall be invoked with the Record being logged if and only if some
 * drain realizes the field; at most once per log call.  Its result is converted to Scalar the same way Value's
 * eager constructors convert (so it may return, e.g., an `int` or `std::string`); returning a lazy Value from it
 * is not allowed.
 *
 * @tparam Func
 *         A callable such that `const Func f; f(record)` is valid for `const Record& record` and yields a type
 *         convertible to Value.  A lambda without `mutable` satisfies the `const` requirement.
 * @param func
 *        The callable (moved/copied into the returned Value).  See Value doc header regarding thread safety.
 * @return See above.
 */
template<typename Func>
Value lazy(Func&& func);

// Template implementations.

template<typename Integer, typename>
Value::Value(Integer val) :
  m_payload(std::is_signed_v<Integer> ? Scalar(std::in_place_type<int64_t>, int64_t(val))
                                      : Scalar(std::in_place_type<uint64_t>, uint64_t(val)))
{
  // Nothing else.
}

template<typename Func>
Value lazy(Func&& func)
{
  using Func_obj = std::decay_t<Func>;
  static_assert(std::is_invocable_v<const Func_obj&, const Record&>,
                "A lazy log value must be invocable, as `const`, with (const Record&).");
  static_assert(std::is_convertible_v<std::invoke_result_t<const Func_obj&, const Record&>, Value>,
                "A lazy log value must produce something convertible to an eager Value.");

  return Value(boost::make_shared<Value::Lazy_func>
                 ([func = Func_obj(std::forward<Func>(func))](const Record& record) -> Scalar
  {
    const Value result(func(record));
    return result.eager();
  }));
} // lazy()

} // namespace sluice::log
