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
#include "ping/echo/ip_pair.hpp"

namespace ping::echo
{

// Implementations.

Ip_pair::Ip_pair(const util::Ipv4_address& src, const util::Ipv4_address& dst) :
  m_src(src),
  m_dst(dst)
{
  // That's it.
}

Ip_pair::Ip_pair(const util::Ipv6_address& src, const util::Ipv6_address& dst) :
  m_src(src),
  m_dst(dst)
{
  // That's it.
}

const util::Ip_address& Ip_pair::src() const
{
  return m_src;
}

const util::Ip_address& Ip_pair::dst() const
{
  return m_dst;
}

Ip_family Ip_pair::family() const
{
  return family_of(m_dst);
}

Ip_family family_of(const util::Ip_address& addr)
{
  return addr.is_v6() ? Ip_family::S_V6 : Ip_family::S_V4;
}

std::ostream& operator<<(std::ostream& os, Ip_family val)
{
  return os << ((val == Ip_family::S_V4) ? "v4" : "v6");
}

std::ostream& operator<<(std::ostream& os, const Ip_pair& val)
{
  return os << '[' << val.src() << " => " << val.dst() << ']';
}

bool operator==(const Ip_pair& val1, const Ip_pair& val2)
{
  return (val1.src() == val2.src()) && (val1.dst() == val2.dst());
}

bool operator!=(const Ip_pair& val1, const Ip_pair& val2)
{
  return !operator==(val1, val2);
}

} // namespace ping::echo
