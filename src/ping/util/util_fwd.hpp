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
#pragma once

#include "ping/common.hpp"
#include <flow/log/log.hpp>
#include <flow/async/util.hpp>
#include <boost/asio.hpp>
#include <sys/socket.h>

/**
 * Flow-style module containing miscellaneous general-use facilities that don't fit into any other ping module.
 *
 * Some of these, notably the address aliases, are used throughout ping::echo, including in its API.
 */
namespace ping::util
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Native_handle;
class Asio_waitable_native_handle;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/// Short-hand for Flow's `Fine_time_pt`.
using Fine_time_pt = flow::Fine_time_pt;

/// Short-hand for `flow::async::Task`: a polymorphic `void ()` functor, e.g., the waker of an echo::Ping_future.
using Task = flow::async::Task;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * In ping it typically points to the request payload of an echo::Buffer.
 */
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

/// Short-hand for an IP address of either version.
using Ip_address = boost::asio::ip::address;

/// Short-hand for an IPv4 address.
using Ipv4_address = boost::asio::ip::address_v4;

/// Short-hand for an IPv6 address.
using Ipv6_address = boost::asio::ip::address_v6;

/**
 * Socket address of a given IP address; its `data()` and `size()` are suitable for `::bind()`, `::connect()`,
 * `::sendto()`.  The port is irrelevant for ICMP and is always zero.
 */
using Sock_address = boost::asio::ip::udp::endpoint;

// Free functions.

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

/**
 * Returns the socket address (port 0) for the given IP address, ready for the BSD socket APIs.
 *
 * @param addr
 *        Address of either version.
 * @return See above.
 */
Sock_address to_sock_address(const Ip_address& addr);

/**
 * Loads an IP address from a raw socket address as filled out by, e.g., `::recvmsg()`.  `AF_INET` and `AF_INET6`
 * are understood; anything else yields an unspecified (all-zeroes) v4 address.
 *
 * @param sock_addr
 *        The socket address.
 * @return See above.
 */
Ip_address from_sock_address(const ::sockaddr& sock_addr);

/**
 * Computes the Internet (RFC 1071) 16-bit one's-complement checksum over the given bytes.  The result is in
 * network order already, in the sense that it can be `memcpy()`ed as-is into the checksum field of a header that was
 * itself summed with that field zeroed.
 *
 * @param blob
 *        The bytes; an odd length is padded with a zero byte.
 * @return See above.
 */
uint16_t internet_checksum(const Blob_const& blob);

/**
 * Converts the time remaining until a deadline into the `int` millisecond timeout of `::poll()`, rounding up so
 * that the wait never ends before the deadline.  A non-positive remainder yields 0; a remainder exceeding what `int`
 * can hold yields `std::numeric_limits<int>::max()`.
 *
 * @param remaining
 *        Time left until the deadline.
 * @return See above.
 */
int to_poll_timeout_ms(const flow::Fine_duration& remaining);

} // namespace ping::util
