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
#include <optional>
#include <vector>

namespace ping::echo
{

// Types.

/**
 * Request and reply storage for one request at a time.  The user fills request_data() with the payload to send (any
 * bytes; empty is fine), hands the Buffer to an issuer, and upon completion reads reply_data() (the echoed payload)
 * and responding_ip().
 *
 * Ownership: a Buffer is owned by exactly one party at a time.  Pinger::send() borrows it for the duration of the
 * call.  Async_pinger::send() takes it (by value, hence typically moved-in) and gives it back in the Async_result,
 * once the Ping_future completes; until then the in-flight request owns it.  Either way do not expect reply_data()
 * to be meaningful until the request completes.
 *
 * ### Reply region ###
 * Internally there is a second, reply, region: sized and 8-byte-aligned by init_for_send() to be large enough for
 * the reply record plus the echoed payload (with some room to spare); the echo primitive writes into it directly;
 * and once the request completes the record is reinterpreted in place.  The user never touches it directly.
 *
 * A Buffer is reusable: sending it again resets the reply state.  It is copyable and movable.
 */
class Buffer
{
public:
  // Types.

  /// The type of request_data().
  using Request_data = std::vector<uint8_t>;

  /// What the reply region currently holds.
  enum class Reply_state
  {
    /// Nothing usable: never sent, not completed, or completed without a reply (e.g., timeout).
    S_EMPTY,
    /// An ICMPv4 reply record.
    S_FILLED_V4,
    /// An ICMPv6 reply record.
    S_FILLED_V6
  };

  // Constructors/destructor.

  /// Constructs with empty request payload.
  Buffer();

  /**
   * Constructs with the given request payload.
   *
   * @param request_data
   *        Payload to send.
   */
  explicit Buffer(Request_data&& request_data);

  // Methods.

  /**
   * The request payload, which may be modified at will while the Buffer is not in-flight.
   * @return See above.
   */
  Request_data& request_data();

  /**
   * The request payload.
   * @return See above.
   */
  const Request_data& request_data() const;

  /**
   * The echoed payload from the last completed request: a view into the reply region.  Empty if reply_state() is
   * Reply_state::S_EMPTY, or if the reply carried no payload (as is the case for ICMP errors).
   * For a successful echo of a fully-echoed payload this equals request_data().
   *
   * @return See above.  Valid until `*this` is modified.
   */
  util::Blob_const reply_data() const;

  /**
   * The address of the node that replied to the last completed request: the destination for an echo reply; the
   * reporting router/host for an ICMP error.  `nullopt` if reply_state() is Reply_state::S_EMPTY.
   *
   * @return See above.
   */
  std::optional<util::Ip_address> responding_ip() const;

  /**
   * See Reply_state.
   * @return See above.
   */
  Reply_state reply_state() const;

  /**
   * Internal-use: (re)sizes the reply region for the current request_data() and resets reply_state() to
   * Reply_state::S_EMPTY.  Issuers call this before every send.
   */
  void init_for_send();

  /**
   * Internal-use: the request payload as a blob.
   * @return See above.
   */
  util::Blob_const request_blob() const;

  /**
   * Internal-use: the reply region as a blob; empty until init_for_send().
   * @return See above.
   */
  util::Blob_mutable reply_region();

  /**
   * Internal-use: marks the reply region as holding a reply record of the given family; returns the record.
   * Returns null, and leaves reply_state() alone, if the reply region is too small to hold a record.
   *
   * @param family
   *        IP version of the completed request.
   * @return See above.
   */
  const detail::Echo_reply* set_filled(Ip_family family);

private:
  // Types.

  /// A lump of bytes, aligned to 8, out of which the reply region is built.
  struct alignas(8) Chunk
  {
    /// The bytes.
    uint8_t m_bytes[8];
  };

  // Methods.

  /**
   * The reply record, if the reply region can hold one; else null.
   * @return See above.
   */
  const detail::Echo_reply* reply_record() const;

  // Data.

  /// See request_data().
  Request_data m_request_data;

  /// The reply region.  Heap storage: its address survives moves of `*this`, which in-flight requests rely on.
  std::vector<Chunk> m_reply_region;

  /// See reply_state().
  Reply_state m_reply_state;
}; // class Buffer

} // namespace ping::echo
