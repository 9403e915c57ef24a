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

#include "sluice/log/value.hpp"
#include <boost/noncopyable.hpp>

namespace sluice::log
{

// Types.

/**
 * An immutable node of a logger hierarchy's context: the key-value pairs a Logger added on top of those of its parent
 * Logger, plus a shared pointer to the parent's node (if any).  Nodes are shared, never copied: creating a child
 * Logger allocates one node holding only the child's own pairs, O(own pairs) regardless of depth.  A node never
 * refers to its children, so the whole thing is a "cactus stack": many leaves share each path to the root, and
 * a node lives exactly as long as some Logger (or some in-flight record inside an Async_drain) references it or
 * a descendant.
 *
 * Enumerating a node's pairs is done via Field_seq, which walks own pairs first, then the parent's, and so on up;
 * it does so lazily, so a consumer that stops early never touches ancestor data.
 *
 * ### Thread safety ###
 * Immutable after construction; hence safe for concurrent reads.
 */
class Context_node :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable node; null means "no context."
  using Ptr = boost::shared_ptr<const Context_node>;

  // Constructors/destructor.

  /**
   * Constructs node.
   *
   * @param own
   *        The pairs this node adds; in the order in which they will be enumerated.  May be empty.
   * @param parent
   *        The parent node; or null if this is a root.
   */
  explicit Context_node(Kv_list own, Ptr parent = Ptr());

  // Methods.

  /**
   * The pairs this node adds.
   * @return See above.
   */
  const Kv_list& own() const;

  /**
   * The parent node; or null if this is a root.
   * @return See above.
   */
  const Ptr& parent() const;

private:
  // Data.

  /// See own().
  const Kv_list m_own;

  /// See parent().
  const Ptr m_parent;
}; // class Context_node

} // namespace sluice::log
