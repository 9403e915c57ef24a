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

#include "sluice/log/context_node.hpp"
#include "sluice/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <iterator>

namespace sluice::log
{

// Types.

/**
 * Visitor through which Field_seq::serialize() hands each realized field to a drain's chosen encoding.  A drain that
 * writes records somewhere implements one (or uses Ostream_serializer); the core mandates no format.
 */
class Serializer :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Consumes one field.
   *
   * @param key
   *        The key.  Refers to static storage.
   * @param val
   *        The realized value.  Valid only until emit() returns.
   * @return Falsy on success; otherwise the reason the field could not be encoded (e.g.,
   *         log::error::Code::S_ENCODING_FAILURE); Field_seq::serialize() then stops and returns it.
   */
  virtual Error_code emit(util::String_view key, const Scalar& val) = 0;
}; // class Serializer

/**
 * The key-value fields of one log call, as a Drain sees them: a lazily walked sequence of the call site's own pairs,
 * then the emitting Logger's own pairs (its Context_node), then each ancestor's pairs, nearest first.  Within each
 * list the pairs are in the order given.  Nothing is copied or merged; duplicate keys all appear, most specific first.
 *
 * Iterating (begin(), end()) yields `const Kv&` without evaluating anything.  Values are realized via realize() (or
 * all at once via serialize()); a lazy Value's computation runs then, at most once for the log call, even if several
 * drains realize it, and even if one of those drains is an Async_drain realizing a detached() copy in another thread.
 * A drain that never realizes a lazy value never pays for it.
 *
 * ### Lifetime ###
 * A Field_seq as passed to Drain::log() borrows the call site's pairs, which live only for the duration of that call.
 * A drain that keeps the fields beyond that must keep a detached() copy instead.
 *
 * ### Thread safety ###
 * A given Field_seq object is used by one thread at a time (the logging thread, for the one passed to Drain::log()).
 * It and its detached() copies may, however, be realized concurrently from different threads.
 */
class Field_seq
{
public:
  // Types.

  /// Forward, read-only iterator over the fields; see class doc header for the order.
  class Const_iterator
  {
  public:
    // Types.

    /// For `std::iterator_traits`.
    using iterator_category = std::forward_iterator_tag;
    /// For `std::iterator_traits`.
    using value_type = Kv;
    /// For `std::iterator_traits`.
    using difference_type = std::ptrdiff_t;
    /// For `std::iterator_traits`.
    using pointer = const Kv*;
    /// For `std::iterator_traits`.
    using reference = const Kv&;

    // Constructors/destructor.

    /// Constructs the past-the-end iterator.
    Const_iterator();

    /**
     * Constructs iterator to the first field of the sequence made of the given call-site range followed by the
     * given chain of nodes.
     *
     * @param call_site_begin
     *        Start of the call-site pairs.
     * @param call_site_end
     *        End of the call-site pairs.
     * @param node
     *        The nearest node; or null.
     */
    explicit Const_iterator(const Kv* call_site_begin, const Kv* call_site_end, const Context_node* node);

    // Methods.

    /**
     * Returns the current field.
     * @return See above.
     */
    reference operator*() const;

    /**
     * Returns pointer to the current field.
     * @return See above.
     */
    pointer operator->() const;

    /**
     * Pre-increment; visits ancestors only when reaching the end of the current list.
     * @return `*this`.
     */
    Const_iterator& operator++();

    /**
     * Post-increment.
     * @return Copy of `*this` before the increment.
     */
    Const_iterator operator++(int);

    /**
     * Returns `true` if and only if both point to the same field or both are past-the-end.
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator==(const Const_iterator& other) const;

    /**
     * Negation of `==`.
     * @param other
     *        Other iterator.
     * @return See above.
     */
    bool operator!=(const Const_iterator& other) const;

  private:
    // Methods.

    /// Moves up the chain while the current list is exhausted; becomes past-the-end if the chain is exhausted.
    void skip_exhausted_lists();

    // Data.

    /// Current field; null if past-the-end.
    const Kv* m_pos;
    /// End of the list containing #m_pos.
    const Kv* m_list_end;
    /// The node to visit after the current list; null if none.
    const Context_node* m_next_node;
  }; // class Const_iterator

  // Constructors/destructor.

  /**
   * Constructs the sequence of the given call-site pairs followed by those of the given chain.
   *
   * @param call_site_begin
   *        Start of call-site pairs; they must remain valid as long as `*this` is used.
   * @param call_site_end
   *        End of call-site pairs.
   * @param context
   *        The emitting Logger's node; or null.
   */
  explicit Field_seq(const Kv* call_site_begin = nullptr, const Kv* call_site_end = nullptr,
                     Context_node::Ptr context = Context_node::Ptr());

  // Methods.

  /**
   * Returns iterator to first field.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns the number of fields; walks the whole chain, but realizes nothing.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns `true` if and only if there are no fields.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the realized Scalar for the given Value, which should be one of `*this` fields' values: the eager Scalar
   * as-is; or the result of the lazy computation, computing it now if this log call has not yet done so.
   *
   * @param val
   *        The value.
   * @param record
   *        The record being logged; passed to the lazy computation.
   * @return See above.  Valid as long as `*this` or some copy of it exists.
   */
  const Scalar& realize(const Value& val, const Record& record) const;

  /**
   * Realizes each field in order and passes it to the given serializer; stops at the first failure.
   *
   * @param record
   *        The record being logged.
   * @param serializer
   *        The visitor.
   * @return Falsy on success; else what `serializer` returned.
   */
  Error_code serialize(const Record& record, Serializer* serializer) const;

  /**
   * Returns an equivalent sequence that does not borrow the call-site pairs, so it may outlive the log call
   * (Async_drain uses this).  The call-site pairs are copied into a new node in front of the chain; the chain is
   * shared, not copied.  The copy shares `*this` lazy-value results, so a lazy computation still runs at most once.
   *
   * @return See above.
   */
  Field_seq detached() const;

private:
  // Types.

  /**
   * Results of lazy computations of one log call, shared by a Field_seq and its detached() copies.  The lazy
   * computation runs while #m_mutex is held: that is what guarantees at-most-once evaluation across threads.
   */
  struct Lazy_memo
  {
    /// Protects #m_results.
    util::Mutex_non_recursive m_mutex;
    /// Map from a lazy computation's identity to its result.  References to elements remain valid forever.
    boost::unordered_map<const Value::Lazy_func*, Scalar> m_results;
  };

  // Data.

  /// Start of call-site pairs.
  const Kv* m_call_site_begin;

  /// End of call-site pairs.
  const Kv* m_call_site_end;

  /// The emitting Logger's node; or null.
  Context_node::Ptr m_context;

  /// Lazy results; created on first lazy realize() or on detached().
  mutable boost::shared_ptr<Lazy_memo> m_memo;
}; // class Field_seq

} // namespace sluice::log
