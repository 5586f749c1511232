/* Ping: Core
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

#include "ping/echo/async_pinger.hpp"
#include "ping/echo/ping_future.hpp"
#include "ping/echo/ip_pair.hpp"
#include "ping/echo/error.hpp"
#include "ping/echo/detail/async_worker.hpp"
#include "ping/echo/detail/completion_state.hpp"
#include "ping/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>
#include <boost/make_shared.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace ping::echo::test
{

namespace
{
using ping::test::counting_payload;
using ping::test::to_bytes;
using ping::test::bogon_v4;
using ping::test::network_tests_enabled;

/// The worker keeps the first logger it is given; so every test passes the same one.
Async_pinger make_async_pinger()
{
  return Async_pinger(ping::test::process_logger());
}

/// Logger that accepts every message, counts it, and discards it.
class Counting_logger :
  public flow::log::Logger
{
public:
  bool should_log(flow::log::Sev, const flow::log::Component&) const override
  {
    return true;
  }

  bool logs_asynchronously() const override
  {
    return false;
  }

  void do_log(flow::log::Msg_metadata*, flow::util::String_view) override
  {
    ++m_n_messages;
  }

  /// Messages received so far.
  std::atomic<size_t> m_n_messages{0};
}; // class Counting_logger

} // Anonymous namespace

TEST(Async_pinger, Concurrent_loopback)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  const auto dst1 = util::Ip_address(util::Ipv4_address::loopback());
  const auto dst2 = boost::asio::ip::make_address("127.0.0.2");

  auto future1 = pinger.send(dst1, Buffer(counting_payload(48, 1)));
  auto future2 = pinger.send(dst2, Buffer(counting_payload(48, 2)));

  const auto result2 = future2.wait();
  const auto result1 = future1.wait();

  EXPECT_FALSE(result1.m_err_code) << result1.m_err_code.message();
  EXPECT_EQ(to_bytes(result1.m_buffer.reply_data()), counting_payload(48, 1));
  EXPECT_EQ(*result1.m_buffer.responding_ip(), dst1);

  EXPECT_FALSE(result2.m_err_code) << result2.m_err_code.message();
  EXPECT_EQ(to_bytes(result2.m_buffer.reply_data()), counting_payload(48, 2));
  EXPECT_EQ(*result2.m_buffer.responding_ip(), dst2);
} // TEST(Async_pinger, Concurrent_loopback)

TEST(Async_pinger, Loopback_v6)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v6_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv6 handle available to the worker.";
  }

  const auto loopback = util::Ipv6_address::loopback();
  const auto result = pinger.send(util::Ip_address(loopback), Buffer(counting_payload(64, 3))).wait();
  if (result.m_err_code == error::Code::S_NET_UNREACHABLE)
  {
    GTEST_SKIP() << "IPv6 loopback not configured.";
  }
  EXPECT_FALSE(result.m_err_code) << result.m_err_code.message();
  EXPECT_EQ(result.m_buffer.reply_state(), Buffer::Reply_state::S_FILLED_V6);
  EXPECT_EQ(to_bytes(result.m_buffer.reply_data()), counting_payload(64, 3));
  EXPECT_EQ(*result.m_buffer.responding_ip(), util::Ip_address(loopback));

  // Same, bound to the loopback source.
  const auto pinned = pinger.send_from(Ip_pair(loopback, loopback), Buffer(counting_payload(40, 9))).wait();
  EXPECT_FALSE(pinned.m_err_code) << pinned.m_err_code.message();
  EXPECT_EQ(to_bytes(pinned.m_buffer.reply_data()), counting_payload(40, 9));
  EXPECT_EQ(*pinned.m_buffer.responding_ip(), util::Ip_address(loopback));
} // TEST(Async_pinger, Loopback_v6)

TEST(Async_pinger, Pinned_loopback_v4)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  const auto loopback = util::Ipv4_address::loopback();
  const auto result = pinger.send_from(Ip_pair(loopback, loopback), Buffer(counting_payload(24, 5))).wait();
  EXPECT_FALSE(result.m_err_code) << result.m_err_code.message();
  EXPECT_EQ(result.m_buffer.reply_state(), Buffer::Reply_state::S_FILLED_V4);
  EXPECT_EQ(to_bytes(result.m_buffer.reply_data()), counting_payload(24, 5));
  EXPECT_EQ(*result.m_buffer.responding_ip(), util::Ip_address(loopback));
}

TEST(Async_pinger, Large_payload)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  // Every byte value once.
  const auto loopback = util::Ip_address(util::Ipv4_address::loopback());
  const auto result = pinger.send(loopback, Buffer(counting_payload(256))).wait();
  EXPECT_FALSE(result.m_err_code) << result.m_err_code.message();
  EXPECT_EQ(result.m_buffer.request_data(), counting_payload(256));
  EXPECT_EQ(to_bytes(result.m_buffer.reply_data()), counting_payload(256));
  EXPECT_EQ(*result.m_buffer.responding_ip(), loopback);
}

TEST(Async_pinger, Unavailable_family)
{
  // Nothing reaches the network here: a family without a handle is refused at submission.
  auto pinger = make_async_pinger();
  const std::pair<bool, util::Ip_address> families[]
    = { { pinger.v4_available(), util::Ip_address(util::Ipv4_address::loopback()) },
        { pinger.v6_available(), util::Ip_address(util::Ipv6_address::loopback()) } };

  size_t n_refused = 0;
  for (const auto& [available, dst] : families)
  {
    if (available)
    {
      continue;
    }
    // else
    ++n_refused;

    const auto result = pinger.send(dst, Buffer(counting_payload(40, 7))).wait();
    EXPECT_EQ(result.m_err_code, error::Code::S_ICMP_HANDLE_UNAVAILABLE) << "Destination [" << dst << "].";
    EXPECT_EQ(result.m_round_trip_time_ms, 0u);
    EXPECT_EQ(result.m_buffer.reply_state(), Buffer::Reply_state::S_EMPTY);
    EXPECT_EQ(result.m_buffer.request_data(), counting_payload(40, 7));
  }

  if (n_refused == 0)
  {
    GTEST_SKIP() << "Both ICMP families are available to the worker; nothing is refused.";
  }
} // TEST(Async_pinger, Unavailable_family)

TEST(Async_pinger, Future_logs_to_worker_logger)
{
  make_async_pinger(); // Worker (and the Logger it keeps) exists from here on.

  Counting_logger issuer_logger;
  std::optional<Ping_future> future;
  {
    Async_pinger pinger(&issuer_logger);
    /* Either way it completes at submission without touching the network: a pinned loopback source cannot reach
     * an off-host address; and a family without a handle is refused outright. */
    if (pinger.v4_available())
    {
      future.emplace(pinger.send_from(Ip_pair(util::Ipv4_address::loopback(), bogon_v4()),
                                      Buffer(counting_payload(16))));
    }
    else
    {
      future.emplace(pinger.send(util::Ip_address(util::Ipv4_address::loopback()), Buffer(counting_payload(16))));
    }
  } // The issuer is gone; its Logger could be too.

  const size_t n_issuer_messages = issuer_logger.m_n_messages;
  EXPECT_GT(n_issuer_messages, 0u);

  const auto result = future->wait();
  EXPECT_TRUE(result.m_err_code);
  EXPECT_EQ(result.m_buffer.request_data(), counting_payload(16));

  // Neither the worker's submission handling nor the polling went through the issuer's Logger.
  EXPECT_EQ(issuer_logger.m_n_messages, n_issuer_messages);
} // TEST(Async_pinger, Future_logs_to_worker_logger)

TEST(Async_pinger, Many_in_flight)
{
  constexpr size_t S_N_REQUESTS = 10;

  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  const auto loopback = util::Ip_address(util::Ipv4_address::loopback());
  std::vector<Ping_future> futures;
  for (size_t idx = 0; idx != S_N_REQUESTS; ++idx)
  {
    futures.emplace_back(pinger.send(loopback, Buffer(counting_payload(20 + idx, uint8_t(idx)))));
  }

  for (size_t idx = 0; idx != S_N_REQUESTS; ++idx)
  {
    const auto result = futures[idx].wait();
    EXPECT_FALSE(result.m_err_code) << "Request [" << idx << "]: " << result.m_err_code.message();
    EXPECT_EQ(to_bytes(result.m_buffer.reply_data()), counting_payload(20 + idx, uint8_t(idx)));
  }
}

TEST(Async_pinger, Timeout_completes_last)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  auto slow_pinger = pinger;
  slow_pinger.set_timeout_ms(500);
  EXPECT_EQ(slow_pinger.timeout_ms(), 500u);
  EXPECT_EQ(pinger.timeout_ms(), S_DEFAULT_TIMEOUT_MS);

  auto slow = slow_pinger.send(bogon_v4(), Buffer(counting_payload(8)));
  auto fast = pinger.send(util::Ip_address(util::Ipv4_address::loopback()), Buffer(counting_payload(8)));

  const auto fast_result = fast.wait();
  EXPECT_FALSE(fast_result.m_err_code) << fast_result.m_err_code.message();

  const auto slow_result = slow.wait();
  if ((slow_result.m_err_code == error::Code::S_NET_UNREACHABLE)
      || (slow_result.m_err_code == error::Code::S_HOST_UNREACHABLE))
  {
    GTEST_SKIP() << "No route toward the test address; cannot observe a timeout.";
  }
  EXPECT_EQ(slow_result.m_err_code, error::Code::S_TIMEOUT);
  EXPECT_EQ(slow_result.m_round_trip_time_ms, 0u);
  EXPECT_EQ(slow_result.m_buffer.reply_state(), Buffer::Reply_state::S_EMPTY);
  EXPECT_EQ(slow_result.m_buffer.request_data(), counting_payload(8));
} // TEST(Async_pinger, Timeout_completes_last)

TEST(Async_pinger, Poll_with_waker)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  auto future = pinger.send(util::Ip_address(util::Ipv4_address::loopback()), Buffer(counting_payload(32)));

  Async_result result;
  boost::promise<void> woken_promise;
  auto woken = woken_promise.get_future();
  if (!future.poll([&]() { woken_promise.set_value(); }, &result))
  {
    woken.wait();
    // Once woken, the next poll is ready; its waker is never used.
    ASSERT_TRUE(future.poll(util::Task(), &result));
  }

  EXPECT_FALSE(result.m_err_code) << result.m_err_code.message();
  EXPECT_EQ(to_bytes(result.m_buffer.reply_data()), counting_payload(32));
}

TEST(Async_pinger, Dropped_future)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  const auto loopback = util::Ip_address(util::Ipv4_address::loopback());
  {
    // Never polled: the in-flight request keeps its own reference and finishes unobserved.
    auto dropped = pinger.send(loopback, Buffer(counting_payload(1000)));
  }

  // The worker is unharmed.
  const auto result = pinger.send(loopback, Buffer(counting_payload(10))).wait();
  EXPECT_FALSE(result.m_err_code) << result.m_err_code.message();
}

TEST(Async_pinger, Pinned_source)
{
  auto pinger = make_async_pinger();
  if ((!network_tests_enabled()) || (!pinger.v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  const auto result = pinger.send_from(Ip_pair(util::Ipv4_address::loopback(), bogon_v4()),
                                       Buffer(counting_payload(16))).wait();
  EXPECT_EQ(result.m_err_code, error::Code::S_NET_UNREACHABLE);
  EXPECT_EQ(result.m_buffer.reply_state(), Buffer::Reply_state::S_EMPTY);
  EXPECT_EQ(result.m_buffer.request_data(), counting_payload(16));
}

TEST(Async_pinger, Queue_capacity)
{
  make_async_pinger(); // Worker exists from here on.
  const auto capacity = Async_pinger::queue_capacity();
  EXPECT_GE(capacity, 1u);
  EXPECT_FALSE(Async_pinger::set_queue_capacity(capacity + 1));
  EXPECT_FALSE(Async_pinger::set_queue_capacity(0));
  EXPECT_EQ(Async_pinger::queue_capacity(), capacity);
}

TEST(Async_worker, Reference_counts_return_to_baseline)
{
  using detail::Async_worker;
  using detail::Completion_state;

  const auto worker = Async_worker::get_or_create(ping::test::process_logger());
  if ((!network_tests_enabled()) || (!worker->family_available(Ip_family::S_V4)))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available to the worker.";
  }

  // Accepted (completes via the routine); then refused at submission (context reclaimed at once).
  const std::optional<util::Ip_address> srcs[] = { std::nullopt, util::Ip_address(util::Ipv4_address::loopback()) };
  const util::Ip_address dsts[] = { util::Ipv4_address::loopback(), bogon_v4() };

  for (size_t idx = 0; idx != 2; ++idx)
  {
    Buffer buf(counting_payload(24));
    buf.init_for_send();

    Async_worker::Job job;
    job.m_src = srcs[idx];
    job.m_dst = dsts[idx];
    job.m_opts = detail::Request_options{ S_DEFAULT_TTL, S_DEFAULT_DF, S_DEFAULT_TIMEOUT_MS };
    job.m_request = buf.request_blob();
    job.m_reply = buf.reply_region();
    job.m_state = boost::make_shared<Completion_state>(ping::test::process_logger(), Ip_family::S_V4, std::move(buf));
    const auto state = job.m_state;
    worker->submit(std::move(job));

    boost::promise<void> woken_promise;
    auto woken = woken_promise.get_future();
    Async_result result;
    if (!state->poll([&]() { woken_promise.set_value(); }, &result))
    {
      woken.wait();
      ASSERT_TRUE(state->poll(util::Task(), &result));
    }
    EXPECT_EQ(bool(result.m_err_code), idx == 1) << result.m_err_code.message();

    // The worker lets go of its reference just after waking us.
    for (int n_tries = 0; (state.use_count() != 1) && (n_tries != 200); ++n_tries)
    {
      boost::this_thread::sleep_for(boost::chrono::milliseconds(10));
    }
    EXPECT_EQ(state.use_count(), 1) << "Request [" << idx << "].";
  }
} // TEST(Async_worker, Reference_counts_return_to_baseline)

} // namespace ping::echo::test
