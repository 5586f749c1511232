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

#include "ping/echo/ping_future.hpp"
#include <flow/log/log.hpp>

namespace ping::echo
{

// Types.

/**
 * The non-blocking issuer: send() queues one echo request for the process-wide background worker thread and
 * immediately returns a Ping_future, which completes once the request does.  Outcome semantics are those of
 * Pinger::send(), delivered via Async_result.
 *
 * All Async_pinger objects in the process (and their copies) share the one worker thread, created by the first
 * Async_pinger constructed and never destroyed.  That first Async_pinger's Logger is the one the worker logs to;
 * it is also the one every Ping_future (whichever Async_pinger issued it) logs to, since a future and its in-flight
 * request can outlive their issuer.  So that Logger must outlive every Ping_future and every in-flight request in
 * the process; simplest is to let it live until the process exits.  Other Async_pinger objects' Loggers are used
 * only within send() and send_from() and need outlive only their Async_pinger.
 *
 * The worker issues queued requests in FIFO order; their completion order is however theirs: a fast request queued
 * after a slow one can complete first.
 *
 * ### Backpressure ###
 * The worker's queue is bounded (see set_queue_capacity()).  If it is full, send() blocks until the worker makes
 * room.  This is not an error; and the stall lasts only until the worker next runs.
 *
 * ### Configuration ###
 * TTL, don't-fragment and timeout are per-Async_pinger (copies included) with the same defaults as Pinger.
 *
 * ### Thread safety ###
 * send() and send_from() may be called concurrently.  The setters may not be called concurrently with anything
 * else on the same object.
 */
class Async_pinger :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs issuer, creating the background worker if not yet done.  The worker opens the ICMPv4 and ICMPv6
   * handles once; a family whose handle did not open (see v4_available(), v6_available()) fails each of its requests
   * with error::Code::S_ICMP_HANDLE_UNAVAILABLE.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Async_pinger(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Queues an echo request to `dst`, from a source chosen by the routing table.  Blocks only if the queue is full.
   *
   * @param dst
   *        Destination (v4 or v6).
   * @param buf
   *        Its request_data() is sent; the Buffer comes back via Async_result::m_buffer.
   * @return The future.
   */
  Ping_future send(const util::Ip_address& dst, Buffer buf);

  /**
   * Like send() but from the given source address.
   *
   * @param addrs
   *        Source (must be local) and destination.
   * @param buf
   *        See send().
   * @return See send().
   */
  Ping_future send_from(const Ip_pair& addrs, Buffer buf);

  /**
   * Whether v4 requests can succeed at all.
   * @return See above.
   */
  bool v4_available() const;

  /**
   * Whether v6 requests can succeed at all.
   * @return See above.
   */
  bool v6_available() const;

  /**
   * See Pinger::ttl().
   * @return See above.
   */
  uint8_t ttl() const;

  /**
   * See Pinger::set_ttl().
   * @param ttl
   *        Value.
   */
  void set_ttl(uint8_t ttl);

  /**
   * See Pinger::df().
   * @return See above.
   */
  bool df() const;

  /**
   * See Pinger::set_df().
   * @param df
   *        Value.
   */
  void set_df(bool df);

  /**
   * See Pinger::timeout_ms().
   * @return See above.
   */
  unsigned int timeout_ms() const;

  /**
   * See Pinger::set_timeout_ms().
   * @param timeout_ms
   *        Value.
   */
  void set_timeout_ms(unsigned int timeout_ms);

  /**
   * Sets the capacity of the process-wide submission queue.  Only effective before the first Async_pinger is
   * constructed: afterwards returns `false` and changes nothing.  Also returns `false` if `capacity` is 0.
   * The default is the compile-time `PING_ASYNC_QUEUE_CAPACITY` (CMake cache variable), else 1024.
   *
   * @param capacity
   *        Capacity.
   * @return `true` if and only if the capacity was set.
   */
  static bool set_queue_capacity(size_t capacity);

  /**
   * The capacity of the process-wide submission queue, in effect or to be.
   * @return See above.
   */
  static size_t queue_capacity();

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
   * @return See send().
   */
  Ping_future send_impl(const util::Ip_address* src, const util::Ip_address& dst, Buffer&& buf);

  // Data.

  /// The shared worker.
  detail::Async_worker* m_worker;

  /// See ttl().
  uint8_t m_ttl;

  /// See df().
  bool m_df;

  /// See timeout_ms().
  unsigned int m_timeout_ms;
}; // class Async_pinger

} // namespace ping::echo
