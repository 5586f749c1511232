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

namespace ping::echo::detail
{

// Types.

/**
 * The reply record: what the echo primitive (Icmp_handle) writes at the start of a Buffer reply region, to be
 * reinterpreted in place (no copying) once the request completes.  The echoed payload, if any, follows at offset
 * #S_ECHO_REPLY_RESERVED_SIZE.
 *
 * If #m_n_replies is 0, the request produced no reply; the reason is #m_sys_errno if non-zero (a `system_category()`
 * value), else #m_status (e.g., error::Ip_status::S_REQ_TIMED_OUT).  If it is 1, the remaining fields describe the
 * reply: an echo reply (#m_status is error::Ip_status::S_SUCCESS) or an ICMP error reported by some node along the
 * way (#m_status says what; #m_address is that node).
 */
struct Echo_reply
{
  // Data.

  /// 0 or 1.
  uint32_t m_n_replies;

  /// error::Ip_status, cast to its underlying type.
  uint32_t m_status;

  /// If no reply: the errno that prevented it, or 0.
  uint32_t m_sys_errno;

  /// Round-trip time from send to reply, in milliseconds.
  uint32_t m_round_trip_time_ms;

  /// Number of echoed payload bytes stored after the record.
  uint32_t m_data_size;

  /// 4 or 6: which of #m_address is meaningful; 0 if none.
  uint8_t m_ip_version;

  /// Received TTL (hop limit) of the reply; 0 if unknown.
  uint8_t m_hop_limit;

  /// Padding; 0.
  uint16_t m_reserved;

  /// Responding node's address: first 4 bytes if v4, all 16 if v6; network order.
  uint8_t m_address[16];
}; // struct Echo_reply

// Constants.

/// Offset of the echoed payload in the reply region: the Echo_reply record rounded up to 8-byte alignment.
constexpr size_t S_ECHO_REPLY_RESERVED_SIZE = ((sizeof(Echo_reply) + 7) / 8) * 8;

/// Reply region room beyond the reserved record size and the request length.
constexpr size_t S_REPLY_REGION_SLACK_SIZE = 24;

} // namespace ping::echo::detail
