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

#include "ping/util/util_fwd.hpp"
#include <ostream>

/**
 * ping::echo is the point of the library: it sends ICMP echo requests (pings) and reports their outcomes, both
 * blocking (Pinger) and non-blocking (Async_pinger, Ping_future).  See the ping namespace doc header for an overview.
 *
 * The two issuers share the same result semantics: a request yields an #Error_code (falsy on success, else see
 * error::Code) plus, on success, a round-trip time in milliseconds; and the caller's Buffer carries the request
 * payload out and (on a reply) the echoed payload and the responding address back.
 */
namespace ping::echo
{

// Types.

// Find doc headers near the bodies of these compound types.

class Buffer;
class Ip_pair;
class Pinger;
class Async_pinger;
class Ping_future;
struct Async_result;

/// IP version of an address, request, or ICMP handle.
enum class Ip_family
{
  /// IPv4 (ICMP).
  S_V4,
  /// IPv6 (ICMPv6).
  S_V6
};

// Constants.

/// Default IP TTL (hop limit) of an issuer.
constexpr uint8_t S_DEFAULT_TTL = 255;

/// Default don't-fragment setting of an issuer.
constexpr bool S_DEFAULT_DF = false;

/// Default per-request timeout of an issuer, in milliseconds.
constexpr unsigned int S_DEFAULT_TIMEOUT_MS = 2000;

// Free functions.

/**
 * Returns the IP version of the given address.
 *
 * @param addr
 *        Address.
 * @return See above.
 */
Ip_family family_of(const util::Ip_address& addr);

/**
 * Prints string representation of the given Ip_family to the given `ostream`: "v4" or "v6".
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Ip_family val);

/**
 * Prints string representation of the given Ip_pair to the given `ostream`.
 *
 * @relatesalso Ip_pair
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ip_pair& val);

/**
 * Returns `true` if and only if the two pairs have equal sources and equal destinations.
 *
 * @relatesalso Ip_pair
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Ip_pair& val1, const Ip_pair& val2);

/**
 * Negation of similar `==`.
 *
 * @relatesalso Ip_pair
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Ip_pair& val1, const Ip_pair& val2);

} // namespace ping::echo

/**
 * Internal implementation details of ping::echo; not to be used directly by the user.
 */
namespace ping::echo::detail
{

// Types.

struct Echo_reply;
struct Request_options;
class Icmp_handle;
class Completion_state;
class Async_worker;
template<typename Job>
class Job_queue;

} // namespace ping::echo::detail
