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

/// @file
#include "ping/util/util_fwd.hpp"
#include <boost/chrono/ceil.hpp>
#include <netinet/in.h>
#include <cstring>
#include <limits>

namespace ping::util
{

// Implementations.

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

Sock_address to_sock_address(const Ip_address& addr)
{
  return Sock_address(addr, 0);
}

Ip_address from_sock_address(const ::sockaddr& sock_addr)
{
  using std::memcpy;

  if (sock_addr.sa_family == AF_INET6)
  {
    const auto& sock_addr6 = reinterpret_cast<const ::sockaddr_in6&>(sock_addr);
    Ipv6_address::bytes_type bytes;
    static_assert(sizeof(bytes) == sizeof(sock_addr6.sin6_addr), "in6_addr must be 16 bytes.");
    memcpy(bytes.data(), &sock_addr6.sin6_addr, bytes.size());
    return Ipv6_address(bytes, sock_addr6.sin6_scope_id);
  }
  // else

  if (sock_addr.sa_family == AF_INET)
  {
    const auto& sock_addr4 = reinterpret_cast<const ::sockaddr_in&>(sock_addr);
    return Ipv4_address(ntohl(sock_addr4.sin_addr.s_addr));
  }
  // else

  return Ipv4_address();
} // from_sock_address()

uint16_t internet_checksum(const Blob_const& blob)
{
  const auto data = blob_data(blob);
  const size_t size = blob.size();

  /* Sum 16-bit words as they sit in memory (no byte swapping).  One's-complement addition is byte-order independent,
   * so the folded complement can be stored as-is. */
  uint32_t sum = 0;
  size_t idx = 0;
  for (; (idx + 1) < size; idx += 2)
  {
    uint16_t word;
    std::memcpy(&word, data + idx, sizeof(word));
    sum += word;
  }
  if (idx < size)
  {
    uint16_t word = 0;
    std::memcpy(&word, data + idx, 1);
    sum += word;
  }

  while ((sum >> 16) != 0)
  {
    sum = (sum & 0xFFFF) + (sum >> 16);
  }
  return static_cast<uint16_t>(~sum);
} // internet_checksum()

int to_poll_timeout_ms(const flow::Fine_duration& remaining)
{
  using boost::chrono::ceil;
  using boost::chrono::milliseconds;

  if (remaining <= flow::Fine_duration::zero())
  {
    return 0;
  }

  const auto remaining_ms = ceil<milliseconds>(remaining).count();
  constexpr auto INT_MAX_MS = std::numeric_limits<int>::max();
  return (remaining_ms >= INT_MAX_MS) ? INT_MAX_MS : int(remaining_ms);
}

} // namespace ping::util
