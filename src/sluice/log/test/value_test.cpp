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

#include "sluice/log/log.hpp"
#include "sluice/log/async_drain.hpp"
#include "sluice/log/duplicate_drain.hpp"
#include "sluice/log/filter_drain.hpp"
#include "sluice/log/ostream_serializer.hpp"
#include "sluice/log/error/error.hpp"
#include "sluice/test/test_drain.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <sstream>

namespace sluice::log::test
{

namespace
{
using sluice::test::Test_drain;
using sluice::test::test_record;
using util::ostream_op_string;
using std::string;
using std::vector;

/// Serializer that fails on the given key.
class Picky_serializer :
  public Serializer
{
public:
  explicit Picky_serializer(util::String_view bad_key) :
    m_bad_key(bad_key)
  {
    // Nothing else.
  }

  Error_code emit(util::String_view key, const Scalar& val) override
  {
    if (key == m_bad_key)
    {
      return error::Code::S_ENCODING_FAILURE;
    }
    m_seen.push_back(ostream_op_string(key, '=', val));
    return Error_code();
  }

  const util::String_view m_bad_key;
  vector<string> m_seen;
}; // class Picky_serializer

} // Anonymous namespace

#define CTX SLUICE_UTIL_WHERE_AM_I_STR()

TEST(Value, Eager)
{
  EXPECT_FALSE(Value().is_lazy());
  EXPECT_TRUE(std::holds_alternative<None>(Value().eager()));
  EXPECT_TRUE(std::holds_alternative<bool>(Value(true).eager()));
  EXPECT_EQ(std::get<int64_t>(Value(-3).eager()), -3);
  EXPECT_EQ(std::get<int64_t>(Value(short(7)).eager()), 7);
  EXPECT_EQ(std::get<uint64_t>(Value(7u).eager()), 7u);
  EXPECT_EQ(std::get<uint64_t>(Value(size_t(1) << 40).eager()), size_t(1) << 40);
  EXPECT_EQ(std::get<double>(Value(2.5).eager()), 2.5);
  EXPECT_EQ(std::get<string>(Value("abc").eager()), "abc");
  EXPECT_EQ(std::get<string>(Value(util::String_view("xyz", 2)).eager()), "xy");
  EXPECT_EQ(std::get<string>(Value(string("str")).eager()), "str");

  EXPECT_EQ(ostream_op_string(Value().eager()), "none");
  EXPECT_EQ(ostream_op_string(Value(false).eager()), "false");
  EXPECT_EQ(ostream_op_string(Value(-12).eager()), "-12");
  EXPECT_EQ(ostream_op_string(Value("as is").eager()), "as is");
  EXPECT_TRUE(None() == None());

#ifndef NDEBUG // The null check is an assert(); without it the call is simply undefined.
  const char* const null_str = nullptr;
  EXPECT_DEATH(static_cast<void>(Value(null_str)), "non-null string");
#endif
} // TEST(Value, Eager)

TEST(Value, Lazy)
{
  int n_calls = 0;
  const auto val = lazy([&](const Record& record) -> string
  {
    ++n_calls;
    return ostream_op_string("computed:", record.m_msg);
  });
  EXPECT_TRUE(val.is_lazy());
  EXPECT_EQ(n_calls, 0);

  const auto record = test_record(Level::S_INFO, "m1");
  const Kv pairs[] = { { "lazy", val }, { "again", val }, { "eager", 5 } };
  const Field_seq fields(std::begin(pairs), std::end(pairs));

  // Iterating does not realize.
  EXPECT_EQ(fields.size(), 3u);
  EXPECT_EQ(n_calls, 0);

  EXPECT_EQ(std::get<string>(fields.realize(pairs[0].m_value, record)), "computed:m1");
  EXPECT_EQ(n_calls, 1);
  // Same computation (the Value was copied, the function shared): not recomputed within this log call.
  EXPECT_EQ(std::get<string>(fields.realize(pairs[1].m_value, record)), "computed:m1");
  EXPECT_EQ(n_calls, 1);

  // A detached copy shares the result.
  const auto copy = fields.detached();
  EXPECT_EQ(std::get<string>(copy.realize(copy.begin()->m_value, record)), "computed:m1");
  EXPECT_EQ(n_calls, 1);

  // Another log call computes anew.
  const Field_seq fields2(std::begin(pairs), std::end(pairs));
  fields2.realize(pairs[0].m_value, test_record(Level::S_INFO, "m2"));
  EXPECT_EQ(n_calls, 2);
} // TEST(Value, Lazy)

TEST(Value, Lazy_at_most_once_per_log_call)
{
  std::atomic<int> n_calls(0);
  const auto sync1 = boost::make_shared<Test_drain>();
  const auto sync2 = boost::make_shared<Test_drain>();
  const auto async_inner = boost::make_shared<Test_drain>();
  {
    const auto async = boost::make_shared<Async_drain>(Logger(), async_inner);
    const Logger logger(boost::make_shared<Duplicate_drain>
                          (sync1, boost::make_shared<Duplicate_drain>(async, sync2)));

    for (int i = 0; i != 3; ++i)
    {
      logger.log(test_record(Level::S_INFO),
                 { { "i", i }, { "expensive", lazy([&](const Record&) { return ++n_calls; }) } });
    }
    async->flush();
  }

  // Three drains realized each record; each computation ran once per log call regardless.
  EXPECT_EQ(n_calls.load(), 3);
  for (const auto& drain : { sync1, sync2, async_inner })
  {
    const auto entries = drain->entries();
    ASSERT_EQ(entries.size(), 3u) << CTX;
    for (size_t i = 0; i != 3; ++i)
    {
      EXPECT_EQ(std::get<int64_t>(entries[i].m_fields[1].second), int64_t(i + 1)) << CTX;
    }
  }
} // TEST(Value, Lazy_at_most_once_per_log_call)

TEST(Value, Lazy_never_if_discarded)
{
  int n_calls = 0;
  const auto counted = lazy([&](const Record&) { return ++n_calls; });
  const auto inner = boost::make_shared<Test_drain>();
  const Logger logger(boost::make_shared<Filter_level_drain>(Level::S_WARNING, inner));

  // Past the pre-check (as if logged without checking): the filter drops it before anything looks at the fields.
  logger.log(test_record(Level::S_DEBUG), { { "x", counted } });
  logger.log(test_record(Level::S_TRACE), { { "x", counted } });
  EXPECT_EQ(n_calls, 0);
  EXPECT_EQ(inner->count(), 0u);

  // A drain that passes the record but never reads fields does not pay either.
  const auto lazy_drain = boost::make_shared<Test_drain>(false);
  Logger(lazy_drain).log(test_record(Level::S_INFO), { { "x", counted } });
  EXPECT_EQ(n_calls, 0);
  EXPECT_EQ(lazy_drain->count(), 1u);

  logger.log(test_record(Level::S_ERROR), { { "x", counted } });
  EXPECT_EQ(n_calls, 1);
} // TEST(Value, Lazy_never_if_discarded)

TEST(Field_seq, Interface)
{
  const auto root = boost::make_shared<Context_node>(Kv_list{ { "r1", 1 }, { "r2", 2 } });
  const auto empty_mid = boost::make_shared<Context_node>(Kv_list(), root);
  const auto leaf = boost::make_shared<Context_node>(Kv_list{ { "l1", "x" } }, empty_mid);
  const auto record = test_record(Level::S_INFO);

  EXPECT_TRUE(Field_seq().empty());
  EXPECT_EQ(Field_seq().size(), 0u);
  EXPECT_TRUE(Field_seq(nullptr, nullptr, boost::make_shared<Context_node>(Kv_list())).empty());

  {
    const Kv call_site[] = { { "c1", true } };
    const Field_seq fields(std::begin(call_site), std::end(call_site), leaf);
    vector<string> keys;
    for (auto it = fields.begin(); it != fields.end(); it++)
    {
      keys.emplace_back(it->m_key);
    }
    EXPECT_EQ(keys, (vector<string>{ "c1", "l1", "r1", "r2" }));

    std::ostringstream os;
    Ostream_serializer serializer(os);
    EXPECT_FALSE(fields.serialize(record, &serializer));
    EXPECT_EQ(os.str(), "c1=true, l1=x, r1=1, r2=2");
    EXPECT_EQ(serializer.n_emitted(), 4u);

    Picky_serializer picky("r1");
    EXPECT_EQ(fields.serialize(record, &picky), error::Code::S_ENCODING_FAILURE);
    EXPECT_EQ(picky.m_seen, (vector<string>{ "c1=true", "l1=x" }));
  }

  // No call-site pairs: just the chain.
  const Field_seq chain_only(nullptr, nullptr, leaf);
  EXPECT_EQ(chain_only.size(), 3u);
  EXPECT_EQ(chain_only.begin()->m_key, "l1");

  // detached() outlives the call-site storage.
  Field_seq detached;
  {
    const vector<Kv> call_site{ { "tmp", string("temporary") } };
    detached = Field_seq(call_site.data(), call_site.data() + call_site.size(), root).detached();
  }
  std::ostringstream os;
  Ostream_serializer serializer(os);
  EXPECT_FALSE(detached.serialize(record, &serializer));
  EXPECT_EQ(os.str(), "tmp=temporary, r1=1, r2=2");
} // TEST(Field_seq, Interface)

} // namespace sluice::log::test
