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

#include "ping/echo/error.hpp"
#include "ping/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <sstream>
#include <cerrno>

namespace ping::echo::error::test
{

namespace
{
using flow::util::ostream_op_string;
using ping::test::to_underlying;
using boost::system::system_category;
} // Anonymous namespace

TEST(Echo_error, Code_interface)
{
  const Error_code err_code = Code::S_TIMEOUT;
  EXPECT_TRUE(err_code);
  EXPECT_EQ(to_underlying(Code::S_TIMEOUT), S_CODE_LOWEST_INT_VALUE);
  EXPECT_STREQ(err_code.category().name(), "ping/echo");

  EXPECT_EQ(Error_code(Code::S_TIMEOUT).message(), "Request timed out");
  EXPECT_EQ(Error_code(Code::S_HOST_UNREACHABLE).message(), "Destination host unreachable");
  EXPECT_EQ(Error_code(Code::S_NET_UNREACHABLE).message(), "Destination network unreachable");
  EXPECT_EQ(Error_code(Code::S_PROTOCOL_UNREACHABLE).message(), "Destination protocol unreachable");
  EXPECT_EQ(Error_code(Code::S_TTL_EXPIRED).message(), "TTL expired in transit");
  EXPECT_EQ(Error_code(Code::S_REASSEMBLY_EXPIRED).message(), "Reassembly timed out waiting for fragments");
  EXPECT_EQ(Error_code(Code::S_NEEDS_FRAGMENTED).message(), "Packet needs fragmented");

  EXPECT_EQ(ostream_op_string(Code::S_NET_UNREACHABLE), "NET_UNREACHABLE");
  EXPECT_EQ(ostream_op_string(Code::S_ICMP_V6_HANDLE_UNAVAILABLE), "ICMP_V6_HANDLE_UNAVAILABLE");

  Code code;
  std::istringstream is("ttl_expired");
  is >> code;
  EXPECT_EQ(code, Code::S_TTL_EXPIRED);
  std::istringstream bad_is("NOT_A_CODE");
  bad_is >> code;
  EXPECT_EQ(code, Code::S_END_SENTINEL);
} // TEST(Echo_error, Code_interface)

TEST(Echo_error, From_ip_status)
{
  EXPECT_FALSE(from_ip_status(uint32_t(Ip_status::S_SUCCESS)));
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_REQ_TIMED_OUT)), Code::S_TIMEOUT);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_DEST_HOST_UNREACHABLE)), Code::S_HOST_UNREACHABLE);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_DEST_NET_UNREACHABLE)), Code::S_NET_UNREACHABLE);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_DEST_PROT_UNREACHABLE)), Code::S_PROTOCOL_UNREACHABLE);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_TTL_EXPIRED_TRANSIT)), Code::S_TTL_EXPIRED);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_TTL_EXPIRED_REASSEM)), Code::S_REASSEMBLY_EXPIRED);
  EXPECT_EQ(from_ip_status(uint32_t(Ip_status::S_PACKET_TOO_BIG)), Code::S_NEEDS_FRAGMENTED);

  // Outside the closed set: "other", carrying the raw value and a readable message.
  const auto port = from_ip_status(uint32_t(Ip_status::S_DEST_PORT_UNREACHABLE));
  EXPECT_EQ(port.category(), ip_status_category());
  EXPECT_EQ(port.value(), int(Ip_status::S_DEST_PORT_UNREACHABLE));
  EXPECT_EQ(port.message(), ostream_op_string("Other IP error (", int(Ip_status::S_DEST_PORT_UNREACHABLE),
                                              "): Destination port unreachable"));

  const auto unknown = from_ip_status(11050);
  EXPECT_EQ(unknown.category(), ip_status_category());
  EXPECT_EQ(unknown.value(), 11050);
  EXPECT_EQ(unknown.message(), "Other IP error (11050): Unknown status");
} // TEST(Echo_error, From_ip_status)

TEST(Echo_error, From_sys_error)
{
  EXPECT_EQ(from_sys_error(Error_code(EHOSTUNREACH, system_category())), Code::S_HOST_UNREACHABLE);
  EXPECT_EQ(from_sys_error(Error_code(ENETUNREACH, system_category())), Code::S_NET_UNREACHABLE);
  EXPECT_EQ(from_sys_error(Error_code(ENOPROTOOPT, system_category())), Code::S_PROTOCOL_UNREACHABLE);
  EXPECT_EQ(from_sys_error(Error_code(ETIMEDOUT, system_category())), Code::S_TIMEOUT);
  EXPECT_EQ(from_sys_error(Error_code(EMSGSIZE, system_category())), Code::S_NEEDS_FRAGMENTED);

  // Unmapped errno: passes through as "other".
  const Error_code eperm(EPERM, system_category());
  EXPECT_EQ(from_sys_error(eperm), eperm);

  // Raw statuses go through from_ip_status().
  EXPECT_EQ(from_sys_error(Error_code(int(Ip_status::S_REQ_TIMED_OUT), ip_status_category())), Code::S_TIMEOUT);

  // Already ours: unchanged.
  EXPECT_EQ(from_sys_error(Code::S_ICMP_HANDLE_UNAVAILABLE), Code::S_ICMP_HANDLE_UNAVAILABLE);
} // TEST(Echo_error, From_sys_error)

} // namespace ping::echo::error::test
