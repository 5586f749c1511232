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
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/core/noncopyable.hpp>

namespace ping::echo
{

// Types.

/**
 * The blocking issuer: send() transmits one ICMP(v4 or v6) echo request and returns once it completes, with the
 * round-trip time or the reason there was no successful reply.  Per-request TTL, don't-fragment and timeout come from
 * `*this` (defaults: #S_DEFAULT_TTL, #S_DEFAULT_DF, #S_DEFAULT_TIMEOUT_MS).
 *
 * ### Outcomes ###
 * An outcome is never thrown: it is emitted via the mandatory `err_code` argument.  Falsy means an echo reply came
 * back; the return value is then the round-trip time in milliseconds.  Otherwise (return value 0) it is one of the
 * closed set (error::Code::S_TIMEOUT, error::Code::S_HOST_UNREACHABLE, ...), or an "other" code: a raw reply status
 * in error::ip_status_category(), or an errno in `boost::system::system_category()`.  The Buffer's reply_data() and
 * responding_ip() are filled if any reply (echo reply or ICMP error) arrived.
 *
 * ### Thread safety ###
 * send() and send_from() may be called concurrently, each with its own Buffer.  The setters may not be called
 * concurrently with anything else.
 */
class Pinger :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Opens the ICMPv4 and ICMPv6 handles.  If only one fails, `*this` is usable for the other family, and the
   * failure is reported via `err_code` (but never thrown).
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ICMP_V4_HANDLE_UNAVAILABLE, error::Code::S_ICMP_V6_HANDLE_UNAVAILABLE (usable `*this`),
   *        error::Code::S_ICMP_HANDLES_UNAVAILABLE (every send() will fail).
   */
  explicit Pinger(flow::log::Logger* logger_ptr, Error_code* err_code = 0);

  /// Closes the handles.
  ~Pinger();

  // Methods.

  /**
   * Sends an echo request to `dst` from a source chosen by the routing table; blocks until it completes.
   *
   * @param dst
   *        Destination (v4 or v6).
   * @param buf
   *        Its request_data() is sent; upon return it holds the reply, if any.  Must not be null.
   * @param err_code
   *        The outcome: see class doc header.  Additionally error::Code::S_ICMP_HANDLE_UNAVAILABLE if `dst`'s family
   *        is unavailable; error::Code::S_INVALID_ARGUMENT if `buf` is null.  Must not be null.
   * @return Round-trip time in milliseconds if `!*err_code`; else 0.
   */
  unsigned int send(const util::Ip_address& dst, Buffer* buf, Error_code* err_code);

  /**
   * Like send() but from the given source address.
   *
   * @param addrs
   *        Source (must be local) and destination.
   * @param buf
   *        See send().
   * @param err_code
   *        See send().  A destination not reachable from the source yields error::Code::S_NET_UNREACHABLE.
   * @return See send().
   */
  unsigned int send_from(const Ip_pair& addrs, Buffer* buf, Error_code* err_code);

  /**
   * Whether v4 requests can be sent.
   * @return See above.
   */
  bool v4_available() const;

  /**
   * Whether v6 requests can be sent.
   * @return See above.
   */
  bool v6_available() const;

  /**
   * TTL (hop limit) of subsequent requests.
   * @return See above.
   */
  uint8_t ttl() const;

  /**
   * Sets ttl().
   * @param ttl
   *        Value.
   */
  void set_ttl(uint8_t ttl);

  /**
   * Whether subsequent requests forbid fragmentation.
   * @return See above.
   */
  bool df() const;

  /**
   * Sets df().
   * @param df
   *        Value.
   */
  void set_df(bool df);

  /**
   * Timeout of subsequent requests, in milliseconds.
   * @return See above.
   */
  unsigned int timeout_ms() const;

  /**
   * Sets timeout_ms().
   * @param timeout_ms
   *        Value.
   */
  void set_timeout_ms(unsigned int timeout_ms);

private:
  // Methods.

  /**
   * Implements send() and send_from().
   *
   * @param src
   *        Source or null.
   * @param dst
   *        Destination.
   * @param buf
   *        See send().
   * @param err_code
   *        See send().
   * @return See send().
   */
  unsigned int send_impl(const util::Ip_address* src, const util::Ip_address& dst, Buffer* buf,
                         Error_code* err_code);

  // Data.

  /// ICMPv4 primitive; null if unavailable.
  boost::movelib::unique_ptr<detail::Icmp_handle> m_icmp_v4;

  /// ICMPv6 primitive; null if unavailable.
  boost::movelib::unique_ptr<detail::Icmp_handle> m_icmp_v6;

  /// See ttl().
  uint8_t m_ttl;

  /// See df().
  bool m_df;

  /// See timeout_ms().
  unsigned int m_timeout_ms;
}; // class Pinger

} // namespace ping::echo
