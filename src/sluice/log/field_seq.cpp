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
#include "sluice/log/field_seq.hpp"
#include <boost/make_shared.hpp>
#include <cassert>

namespace sluice::log
{

// Field_seq::Const_iterator implementations.

Field_seq::Const_iterator::Const_iterator() :
  m_pos(nullptr),
  m_list_end(nullptr),
  m_next_node(nullptr)
{
  // Nothing else.
}

Field_seq::Const_iterator::Const_iterator(const Kv* call_site_begin, const Kv* call_site_end,
                                          const Context_node* node) :
  m_pos(call_site_begin),
  m_list_end(call_site_end),
  m_next_node(node)
{
  skip_exhausted_lists();
}

void Field_seq::Const_iterator::skip_exhausted_lists()
{
  /* Only look at a node once the list before it is exhausted; so a consumer that stops early never dereferences the
   * ancestors.  Empty lists (a Logger that added no pairs, say) are skipped. */
  while ((m_pos == m_list_end) && m_next_node)
  {
    const auto& own = m_next_node->own();
    m_pos = own.data();
    m_list_end = m_pos + own.size();
    m_next_node = m_next_node->parent().get();
  }

  if (m_pos == m_list_end)
  {
    // Normalize to the one past-the-end value, so that == works.
    m_pos = m_list_end = nullptr;
    assert(!m_next_node);
  }
}

Field_seq::Const_iterator::reference Field_seq::Const_iterator::operator*() const
{
  assert(m_pos);
  return *m_pos;
}

Field_seq::Const_iterator::pointer Field_seq::Const_iterator::operator->() const
{
  assert(m_pos);
  return m_pos;
}

Field_seq::Const_iterator& Field_seq::Const_iterator::operator++()
{
  assert(m_pos);
  ++m_pos;
  skip_exhausted_lists();
  return *this;
}

Field_seq::Const_iterator Field_seq::Const_iterator::operator++(int)
{
  const auto prev = *this;
  ++(*this);
  return prev;
}

bool Field_seq::Const_iterator::operator==(const Const_iterator& other) const
{
  // Each field lives at a unique address; past-the-end is normalized to null.
  return m_pos == other.m_pos;
}

bool Field_seq::Const_iterator::operator!=(const Const_iterator& other) const
{
  return !(*this == other);
}

// Field_seq implementations.

Field_seq::Field_seq(const Kv* call_site_begin, const Kv* call_site_end, Context_node::Ptr context) :
  m_call_site_begin(call_site_begin),
  m_call_site_end(call_site_end),
  m_context(std::move(context))
{
  assert((m_call_site_begin == m_call_site_end) || (m_call_site_begin && m_call_site_end));
}

Field_seq::Const_iterator Field_seq::begin() const
{
  return Const_iterator(m_call_site_begin, m_call_site_end, m_context.get());
}

Field_seq::Const_iterator Field_seq::end() const
{
  return Const_iterator();
}

size_t Field_seq::size() const
{
  return std::distance(begin(), end());
}

bool Field_seq::empty() const
{
  return begin() == end();
}

const Scalar& Field_seq::realize(const Value& val, const Record& record) const
{
  using util::Lock_guard;
  using util::Mutex_non_recursive;

  if (!val.is_lazy())
  {
    return val.eager();
  }
  // else

  if (!m_memo)
  {
    m_memo = boost::make_shared<Lazy_memo>();
  }

  const auto& func = *val.lazy_func();

  Lock_guard<Mutex_non_recursive> lock(m_memo->m_mutex);
  const auto it = m_memo->m_results.find(&func);
  if (it != m_memo->m_results.end())
  {
    return it->second;
  }
  // else: First realization in this log call.  Compute while locked, so no other thread computes it concurrently.

  return m_memo->m_results.emplace(&func, func(record)).first->second;
} // Field_seq::realize()

Error_code Field_seq::serialize(const Record& record, Serializer* serializer) const
{
  assert(serializer);

  for (const auto& kv : *this)
  {
    const auto err_code = serializer->emit(kv.m_key, realize(kv.m_value, record));
    if (err_code)
    {
      return err_code;
    }
  }
  return Error_code();
}

Field_seq Field_seq::detached() const
{
  // Share lazy results with the copy: so ensure they exist now, in the thread that owns *this.
  if (!m_memo)
  {
    m_memo = boost::make_shared<Lazy_memo>();
  }

  Field_seq copy(nullptr, nullptr,
                 (m_call_site_begin == m_call_site_end)
                   ? m_context
                   : Context_node::Ptr(boost::make_shared<Context_node>(Kv_list(m_call_site_begin, m_call_site_end),
                                                                        m_context)));
  copy.m_memo = m_memo;
  return copy;
}

} // namespace sluice::log
