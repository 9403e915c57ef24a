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

#include "sluice/log/discard_drain.hpp"
#include "sluice/log/duplicate_drain.hpp"
#include "sluice/log/error_mapping_drain.hpp"
#include "sluice/log/filter_drain.hpp"
#include "sluice/log/mutex_drain.hpp"
#include "sluice/log/error/error.hpp"
#include "sluice/test/test_drain.hpp"
#include <gtest/gtest.h>
#include <boost/move/make_unique.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <stdexcept>
#include <vector>

namespace sluice::log::test
{

namespace
{
using sluice::test::Test_drain;
using sluice::test::test_record;
using util::ostream_op_string;
using std::string;
using std::vector;

/// Drain that is not safe for concurrent use, and notices if it is so used anyway.
class Unsynchronized_drain :
  public Drain
{
public:
  Unsynchronized_drain() :
    m_count(0),
    m_inside(false),
    m_overlaps(0)
  {
    // Nothing else.
  }

  Drain_error log(const Record&, const Field_seq&) override
  {
    if (m_inside.exchange(true))
    {
      ++m_overlaps;
    }
    const auto count = m_count;
    util::this_thread::yield();
    m_count = count + 1;
    m_inside = false;
    return Drain_error();
  }

  unsigned int m_count;
  std::atomic<bool> m_inside;
  std::atomic<unsigned int> m_overlaps;
}; // class Unsynchronized_drain

/// Drain whose log() throws.
class Throwing_drain :
  public Drain
{
public:
  Drain_error log(const Record&, const Field_seq&) override
  {
    throw std::runtime_error("drain boom");
  }
}; // class Throwing_drain

} // Anonymous namespace

#define CTX SLUICE_UTIL_WHERE_AM_I_STR()

TEST(Drain_error, Interface)
{
  const Drain_error ok;
  EXPECT_FALSE(ok);
  EXPECT_FALSE(ok.code());
  EXPECT_TRUE(ok.codes().empty());
  EXPECT_EQ(ostream_op_string(ok), "success");
  EXPECT_FALSE(Drain_error(Error_code()));

  const Drain_error one(error::Code::S_IO_FAILURE);
  EXPECT_TRUE(one);
  EXPECT_EQ(one.code(), error::Code::S_IO_FAILURE);

  const auto both = Drain_error::aggregate(one, Drain_error(error::Code::S_DOWNSTREAM_REJECTED));
  EXPECT_TRUE(both);
  EXPECT_EQ(both.code(), error::Code::S_MULTIPLE_DRAINS_FAILED);
  ASSERT_EQ(both.codes().size(), 2u);
  EXPECT_EQ(both.codes()[0], error::Code::S_IO_FAILURE);
  EXPECT_EQ(both.codes()[1], error::Code::S_DOWNSTREAM_REJECTED);
  const auto printed = ostream_op_string(both);
  EXPECT_NE(printed.find(", "), string::npos) << printed;
  EXPECT_NE(printed.find(Error_code(error::Code::S_DOWNSTREAM_REJECTED).message()), string::npos) << printed;

  EXPECT_EQ(Drain_error::aggregate(ok, one).code(), error::Code::S_IO_FAILURE);
  EXPECT_FALSE(Drain_error::aggregate(ok, ok));

  EXPECT_STREQ(Error_code(error::Code::S_IO_FAILURE).category().name(), "sluice_log");
} // TEST(Drain_error, Interface)

TEST(Drain, Log_contained)
{
  Throwing_drain thrower;
  string what = "untouched";
  Drain_error err;
  EXPECT_NO_THROW(err = log_contained(&thrower, test_record(Level::S_INFO), Field_seq(), &what));
  EXPECT_EQ(err.code(), error::Code::S_DRAIN_EXCEPTION);
  EXPECT_EQ(what, "drain boom");
  EXPECT_NO_THROW(err = log_contained(&thrower, test_record(Level::S_INFO), Field_seq()));
  EXPECT_EQ(err.code(), error::Code::S_DRAIN_EXCEPTION);

  // Otherwise the result passes through; `what` is left alone.
  Test_drain failing;
  failing.fail_with(error::Code::S_IO_FAILURE);
  EXPECT_EQ(log_contained(&failing, test_record(Level::S_INFO), Field_seq(), &what).code(),
            error::Code::S_IO_FAILURE);
  EXPECT_EQ(what, "drain boom");
  Test_drain fine;
  EXPECT_FALSE(log_contained(&fine, test_record(Level::S_INFO), Field_seq(), &what));
  EXPECT_EQ(fine.count(), 1u);
} // TEST(Drain, Log_contained)

TEST(Discard_drain, Interface)
{
  Discard_drain drain;
  for (auto level : { Level::S_CRITICAL, Level::S_INFO, Level::S_TRACE })
  {
    EXPECT_FALSE(drain.is_enabled(level)) << CTX;
    EXPECT_FALSE(drain.log(test_record(level), Field_seq())) << CTX;
  }
}

TEST(Filter_level_drain, Interface)
{
  const auto inner = boost::make_shared<Test_drain>();
  Filter_level_drain drain(Level::S_WARNING, inner);

  for (auto level : { Level::S_TRACE, Level::S_DEBUG, Level::S_INFO, Level::S_WARNING,
                      Level::S_ERROR, Level::S_CRITICAL })
  {
    EXPECT_FALSE(drain.log(test_record(level, ostream_op_string(level)), Field_seq())) << CTX;
  }
  const auto entries = inner->entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].m_level, Level::S_WARNING);
  EXPECT_EQ(entries[1].m_level, Level::S_ERROR);
  EXPECT_EQ(entries[2].m_level, Level::S_CRITICAL);

  EXPECT_TRUE(drain.is_enabled(Level::S_CRITICAL));
  EXPECT_TRUE(drain.is_enabled(Level::S_WARNING));
  EXPECT_FALSE(drain.is_enabled(Level::S_INFO));

  // INFO threshold: Info/Warning/Error/Critical pass, Debug/Trace do not.
  const auto inner2 = boost::make_shared<Test_drain>();
  Filter_level_drain info_drain(Level::S_INFO, inner2);
  for (auto level : { Level::S_INFO, Level::S_WARNING, Level::S_ERROR, Level::S_CRITICAL,
                      Level::S_DEBUG, Level::S_TRACE })
  {
    info_drain.log(test_record(level), Field_seq());
  }
  EXPECT_EQ(inner2->count(), 4u);

  // A NONE threshold passes nothing.
  const auto inner3 = boost::make_shared<Test_drain>();
  Filter_level_drain none_drain(Level::S_NONE, inner3);
  none_drain.log(test_record(Level::S_CRITICAL), Field_seq());
  EXPECT_EQ(inner3->count(), 0u);
  EXPECT_FALSE(none_drain.is_enabled(Level::S_CRITICAL));

  // The inner drain's failure comes through.
  inner->fail_with(error::Code::S_IO_FAILURE);
  EXPECT_EQ(drain.log(test_record(Level::S_ERROR), Field_seq()).code(), error::Code::S_IO_FAILURE);
  EXPECT_FALSE(drain.log(test_record(Level::S_INFO), Field_seq()));
} // TEST(Filter_level_drain, Interface)

TEST(Filter_drain, Interface)
{
  const auto inner = boost::make_shared<Test_drain>();
  Filter_drain drain([](const Record& record) { return record.m_module == "net"; }, inner);

  EXPECT_FALSE(drain.log(test_record(Level::S_INFO, "a", "net"), Field_seq()));
  EXPECT_FALSE(drain.log(test_record(Level::S_INFO, "b", "disk"), Field_seq()));
  EXPECT_FALSE(drain.log(test_record(Level::S_TRACE, "c", "net"), Field_seq()));

  const auto entries = inner->entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].m_msg, "a");
  EXPECT_EQ(entries[1].m_msg, "c");
  EXPECT_TRUE(drain.is_enabled(Level::S_TRACE));

  inner->fail_with(error::Code::S_IO_FAILURE);
  EXPECT_FALSE(drain.log(test_record(Level::S_INFO, "d", "disk"), Field_seq()));
  EXPECT_TRUE(drain.log(test_record(Level::S_INFO, "e", "net"), Field_seq()));
} // TEST(Filter_drain, Interface)

TEST(Duplicate_drain, Interface)
{
  const auto first = boost::make_shared<Test_drain>();
  const auto second = boost::make_shared<Test_drain>();
  Duplicate_drain drain(first, second);
  const Kv pairs[] = { { "k", "v" } };
  const Field_seq fields(std::begin(pairs), std::end(pairs));

  EXPECT_FALSE(drain.log(test_record(Level::S_INFO), fields));
  EXPECT_EQ(first->count(), 1u);
  EXPECT_EQ(second->count(), 1u);
  EXPECT_EQ(Test_drain::keys(second->entries()[0]), vector<string>{ "k" });

  // One fails: the other still gets the record; the failure is reported as-is.
  first->fail_with(error::Code::S_IO_FAILURE);
  auto err = drain.log(test_record(Level::S_INFO), fields);
  EXPECT_EQ(err.code(), error::Code::S_IO_FAILURE);
  EXPECT_EQ(second->count(), 2u);

  // Both fail: both codes, in order.
  second->fail_with(error::Code::S_DOWNSTREAM_REJECTED);
  err = drain.log(test_record(Level::S_INFO), fields);
  EXPECT_EQ(err.code(), error::Code::S_MULTIPLE_DRAINS_FAILED);
  ASSERT_EQ(err.codes().size(), 2u);
  EXPECT_EQ(err.codes()[0], error::Code::S_IO_FAILURE);
  EXPECT_EQ(err.codes()[1], error::Code::S_DOWNSTREAM_REJECTED);
  EXPECT_EQ(first->count(), 3u);
  EXPECT_EQ(second->count(), 3u);

  // The first throws (here: a lazy value it realizes does): the second still gets the record.
  const auto realizing = boost::make_shared<Test_drain>();
  const auto not_realizing = boost::make_shared<Test_drain>(false);
  Duplicate_drain fragile(realizing, not_realizing);
  const Kv bad_pairs[] = { { "x", lazy([](const Record&) -> int { throw std::runtime_error("lazy boom"); }) } };
  const Field_seq bad_fields(std::begin(bad_pairs), std::end(bad_pairs));
  EXPECT_NO_THROW(err = fragile.log(test_record(Level::S_INFO), bad_fields));
  EXPECT_EQ(err.code(), error::Code::S_DRAIN_EXCEPTION);
  EXPECT_EQ(realizing->count(), 0u);
  EXPECT_EQ(not_realizing->count(), 1u);

  // Enabled if either is.
  Duplicate_drain picky(boost::make_shared<Test_drain>(true, Level::S_ERROR),
                        boost::make_shared<Test_drain>(true, Level::S_INFO));
  EXPECT_TRUE(picky.is_enabled(Level::S_INFO));
  EXPECT_FALSE(picky.is_enabled(Level::S_DEBUG));
  Duplicate_drain nobody(boost::make_shared<Discard_drain>(), boost::make_shared<Discard_drain>());
  EXPECT_FALSE(nobody.is_enabled(Level::S_CRITICAL));
} // TEST(Duplicate_drain, Interface)

TEST(Map_error_drain, Interface)
{
  const auto inner = boost::make_shared<Test_drain>();
  unsigned int n_mapped = 0;
  Map_error_drain drain([&](const Drain_error& err) -> Drain_error
  {
    ++n_mapped;
    return (err.code() == error::Code::S_IO_FAILURE) ? Drain_error() : err;
  }, inner);

  // The mapper only sees failures.
  EXPECT_FALSE(drain.log(test_record(Level::S_INFO), Field_seq()));
  EXPECT_EQ(n_mapped, 0u);

  inner->fail_with(error::Code::S_IO_FAILURE);
  EXPECT_FALSE(drain.log(test_record(Level::S_INFO), Field_seq()));
  EXPECT_EQ(n_mapped, 1u);

  inner->fail_with(error::Code::S_DOWNSTREAM_REJECTED);
  EXPECT_EQ(drain.log(test_record(Level::S_INFO), Field_seq()).code(), error::Code::S_DOWNSTREAM_REJECTED);
  EXPECT_EQ(n_mapped, 2u);
  EXPECT_EQ(inner->count(), 3u);

  // Translating one failure into another.
  Map_error_drain translating([](const Drain_error&) -> Drain_error
  {
    return Error_code(error::Code::S_ENCODING_FAILURE);
  }, inner);
  EXPECT_EQ(translating.log(test_record(Level::S_INFO), Field_seq()).code(), error::Code::S_ENCODING_FAILURE);
} // TEST(Map_error_drain, Interface)

TEST(Ignore_result_drain, Interface)
{
  const auto inner = boost::make_shared<Test_drain>(true, Level::S_WARNING);
  Ignore_result_drain drain(inner);
  inner->fail_with(error::Code::S_IO_FAILURE);
  EXPECT_FALSE(drain.log(test_record(Level::S_ERROR), Field_seq()));
  EXPECT_EQ(inner->count(), 1u);
  EXPECT_TRUE(drain.is_enabled(Level::S_WARNING));
  EXPECT_FALSE(drain.is_enabled(Level::S_INFO));

  // The usual way to use it: under a Logger whose error handler should not hear about this branch.
  unsigned int n_reported = 0;
  const Logger logger(boost::make_shared<Duplicate_drain>(boost::make_shared<Ignore_result_drain>(inner),
                                                          boost::make_shared<Discard_drain>()),
                      {}, [&](const Drain_error&, const Record&) { ++n_reported; });
  logger.log(test_record(Level::S_ERROR), {});
  EXPECT_EQ(n_reported, 0u);
  EXPECT_EQ(inner->count(), 2u);
} // TEST(Ignore_result_drain, Interface)

TEST(Mutex_drain, Interface)
{
  constexpr unsigned int N_THREADS = 4;
  constexpr unsigned int N_RECORDS = 500;

  const auto inner = boost::make_shared<Unsynchronized_drain>();
  const auto drain = boost::make_shared<Mutex_drain>(inner);
  const Logger logger(drain);

  vector<boost::movelib::unique_ptr<util::Thread>> threads;
  for (unsigned int idx = 0; idx != N_THREADS; ++idx)
  {
    threads.emplace_back(boost::movelib::make_unique<util::Thread>([&]()
    {
      for (unsigned int rec_idx = 0; rec_idx != N_RECORDS; ++rec_idx)
      {
        logger.log(test_record(Level::S_INFO), { { "rec_idx", rec_idx } });
      }
    }));
  }
  for (const auto& thread : threads)
  {
    thread->join();
  }

  EXPECT_EQ(inner->m_overlaps.load(), 0u);
  EXPECT_EQ(inner->m_count, N_THREADS * N_RECORDS);
  EXPECT_TRUE(drain->is_enabled(Level::S_TRACE));
} // TEST(Mutex_drain, Interface)

} // namespace sluice::log::test
