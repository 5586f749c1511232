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

#include "ping/echo/echo_fwd.hpp"

namespace ping::echo
{

// Types.

/**
 * A source address and a destination address of the same IP version, for sending a request from a specific
 * local address; e.g., Pinger::send_from().  A mixed pair cannot be constructed: there is no constructor for it.
 *
 * The source must be a local address; the destination must be reachable from it according to the local
 * routing table, or the request fails with error::Code::S_NET_UNREACHABLE.
 */
class Ip_pair
{
public:
  // Constructors/destructor.

  /**
   * Constructs an IPv4 pair.
   *
   * @param src
   *        Source address.
   * @param dst
   *        Destination address.
   */
  explicit Ip_pair(const util::Ipv4_address& src, const util::Ipv4_address& dst);

  /**
   * Constructs an IPv6 pair.
   *
   * @param src
   *        Source address.
   * @param dst
   *        Destination address.
   */
  explicit Ip_pair(const util::Ipv6_address& src, const util::Ipv6_address& dst);

  // Methods.

  /**
   * Source address.
   * @return See above.
   */
  const util::Ip_address& src() const;

  /**
   * Destination address.
   * @return See above.
   */
  const util::Ip_address& dst() const;

  /**
   * IP version of both addresses.
   * @return See above.
   */
  Ip_family family() const;

private:
  // Data.

  /// See src().
  util::Ip_address m_src;

  /// See dst().
  util::Ip_address m_dst;
}; // class Ip_pair

} // namespace ping::echo
