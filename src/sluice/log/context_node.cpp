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
#include "sluice/log/context_node.hpp"

namespace sluice::log
{

Context_node::Context_node(Kv_list own, Ptr parent) :
  m_own(std::move(own)),
  m_parent(std::move(parent))
{
  // Nothing else.
}

const Kv_list& Context_node::own() const
{
  return m_own;
}

const Context_node::Ptr& Context_node::parent() const
{
  return m_parent;
}

} // namespace sluice::log
