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

#include "ping/echo/pinger.hpp"
#include "ping/echo/ip_pair.hpp"
#include "ping/echo/error.hpp"
#include "ping/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/move/unique_ptr.hpp>
#include <boost/move/make_unique.hpp>

namespace ping::echo::test
{

namespace
{
using ping::test::counting_payload;
using ping::test::to_bytes;
using ping::test::bogon_v4;

/**
 * Creates a Pinger, or yields null if network tests are disabled or this host lets us open no ICMP handle at all.
 *
 * @return See above.
 */
boost::movelib::unique_ptr<Pinger> make_pinger()
{
  if (!ping::test::network_tests_enabled())
  {
    return boost::movelib::unique_ptr<Pinger>();
  }
  // else

  Error_code err_code;
  auto pinger = boost::movelib::make_unique<Pinger>(ping::test::process_logger(), &err_code);
  if (err_code == error::Code::S_ICMP_HANDLES_UNAVAILABLE)
  {
    pinger.reset();
  }
  return pinger;
}

} // Anonymous namespace

TEST(Pinger, Loopback_v4)
{
  auto pinger = make_pinger();
  if ((!pinger) || (!pinger->v4_available()))
  {
    GTEST_SKIP() << "Network tests disabled, or no ICMPv4 handle available (unprivileged ICMP sockets disabled?).";
  }

  EXPECT_EQ(pinger->ttl(), S_DEFAULT_TTL);
  EXPECT_EQ(pinger->df(), S_DEFAULT_DF);
  EXPECT_EQ(pinger->timeout_ms(), S_DEFAULT_TIMEOUT_MS);

  const auto loopback = util::Ip_address(util::Ipv4_address::loopback());
  Buffer buf(counting_payload(256));
  Error_code err_code;
  const auto rtt = pinger->send(loopback, &buf, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_LT(rtt, S_DEFAULT_TIMEOUT_MS);
  EXPECT_EQ(buf.reply_state(), Buffer::Reply_state::S_FILLED_V4);
  EXPECT_EQ(to_bytes(buf.reply_data()), buf.request_data());
  ASSERT_TRUE(buf.responding_ip());
  EXPECT_EQ(*buf.responding_ip(), loopback);

  // Reuse the Buffer with other settings; loopback does not decrement TTL.
  pinger->set_ttl(1);
  pinger->set_df(true);
  buf.request_data() = counting_payload(16, 100);
  pinger->send(loopback, &buf, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(to_bytes(buf.reply_data()), counting_payload(16, 100));

  // Empty payload.
  Buffer empty_buf;
  pinger->send(loopback, &empty_buf, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(empty_buf.reply_data().size(), 0u);
  EXPECT_EQ(*empty_buf.responding_ip(), loopback);
} // TEST(Pinger, Loopback_v4)

TEST(Pinger, Loopback_v6)
{
  auto pinger = make_pinger();
  if ((!pinger) || (!pinger->v6_available()))
  {
    GTEST_SKIP() << "No ICMPv6 handle available to this process.";
  }

  const auto loopback = util::Ip_address(util::Ipv6_address::loopback());
  Buffer buf(counting_payload(64));
  Error_code err_code;
  pinger->send(loopback, &buf, &err_code);
  if (err_code == error::Code::S_NET_UNREACHABLE)
  {
    GTEST_SKIP() << "IPv6 loopback not configured.";
  }
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(buf.reply_state(), Buffer::Reply_state::S_FILLED_V6);
  EXPECT_EQ(to_bytes(buf.reply_data()), buf.request_data());
  EXPECT_EQ(*buf.responding_ip(), loopback);
}

TEST(Pinger, Timeout)
{
  auto pinger = make_pinger();
  if ((!pinger) || (!pinger->v4_available()))
  {
    GTEST_SKIP() << "No ICMPv4 handle available to this process.";
  }

  pinger->set_timeout_ms(300);
  Buffer buf(counting_payload(32));
  Error_code err_code;
  const auto rtt = pinger->send(bogon_v4(), &buf, &err_code);
  if ((err_code == error::Code::S_NET_UNREACHABLE) || (err_code == error::Code::S_HOST_UNREACHABLE))
  {
    GTEST_SKIP() << "No route toward the test address; cannot observe a timeout.";
  }
  EXPECT_EQ(err_code, error::Code::S_TIMEOUT);
  EXPECT_EQ(rtt, 0u);
  EXPECT_EQ(buf.reply_state(), Buffer::Reply_state::S_EMPTY);
  EXPECT_EQ(buf.reply_data().size(), 0u);
  EXPECT_FALSE(buf.responding_ip());
}

TEST(Pinger, Pinned_source)
{
  auto pinger = make_pinger();
  if ((!pinger) || (!pinger->v4_available()))
  {
    GTEST_SKIP() << "No ICMPv4 handle available to this process.";
  }

  Buffer buf(counting_payload(32));
  Error_code err_code;

  // Loopback to loopback works.
  pinger->send_from(Ip_pair(util::Ipv4_address::loopback(), util::Ipv4_address::loopback()), &buf, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();

  // A loopback source cannot reach anything off-host.
  const auto rtt = pinger->send_from(Ip_pair(util::Ipv4_address::loopback(), bogon_v4()), &buf, &err_code);
  EXPECT_EQ(err_code, error::Code::S_NET_UNREACHABLE);
  EXPECT_EQ(rtt, 0u);
  EXPECT_EQ(buf.reply_state(), Buffer::Reply_state::S_EMPTY);
}

TEST(Pinger, Bad_input)
{
  auto pinger = make_pinger();
  if (!pinger)
  {
    GTEST_SKIP() << "No ICMP handle available to this process.";
  }

  Error_code err_code;
  EXPECT_EQ(pinger->send(util::Ip_address(util::Ipv4_address::loopback()), nullptr, &err_code), 0u);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  // A family without a handle reports it per request.
  Buffer buf(counting_payload(8));
  if (!pinger->v6_available())
  {
    pinger->send(util::Ip_address(util::Ipv6_address::loopback()), &buf, &err_code);
    EXPECT_EQ(err_code, error::Code::S_ICMP_HANDLE_UNAVAILABLE);
  }
  if (!pinger->v4_available())
  {
    pinger->send(util::Ip_address(util::Ipv4_address::loopback()), &buf, &err_code);
    EXPECT_EQ(err_code, error::Code::S_ICMP_HANDLE_UNAVAILABLE);
  }
}

} // namespace ping::echo::test
