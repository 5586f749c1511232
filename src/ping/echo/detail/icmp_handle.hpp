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
#include "ping/util/native_handle.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <ostream>

namespace ping::echo::detail
{

// Types.

/// Per-request IP options and timeout, as configured on an issuer.
struct Request_options
{
  // Data.

  /// IP TTL (v4) or unicast hop limit (v6).
  uint8_t m_ttl;

  /// Whether to forbid fragmentation.
  bool m_df;

  /// Timeout from send to reply, in milliseconds.
  unsigned int m_timeout_ms;
}; // struct Request_options

/**
 * The echo primitive for one address family: sends one ICMP(v6) echo request and collects its outcome into the
 * reply region of a Buffer in the form of a detail::Echo_reply record followed by the echoed payload.
 * There's a blocking variant, send_echo(), and an asynchronous one, async_send_echo(), plus parse_replies() for
 * interpreting the reply region after the latter completes.
 *
 * ### Sockets ###
 * Construction merely detects which kind of ICMP socket this process may open: an unprivileged ICMP datagram
 * socket (`SOCK_DGRAM`; allowed by `net.ipv4.ping_group_range`), else a raw socket (`SOCK_RAW`; needs
 * `CAP_NET_RAW`).  If neither, construction fails; the family is then unavailable.  Each request then opens its own
 * socket of that kind: the TTL and don't-fragment options are per-socket; the socket is connect()ed to the
 * destination (optionally after bind()ing the source); and the request's replies and ICMP errors are
 * demultiplexed on that socket alone.  ICMP errors (unreachable, time exceeded, ...) are collected via the socket
 * error queue (`IP_RECVERR`/`IPV6_RECVERR`).
 *
 * ### Thread safety ###
 * The object is immutable after construction; concurrent sends are safe.  async_send_echo() must be called from the
 * thread running the given `Task_engine`.
 */
class Icmp_handle :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Completion routine of async_send_echo(): invoked with the opaque context given to it.
  using Completion_routine = void (*)(void* context);

  /// Kind of ICMP socket in use.
  enum class Socket_kind
  {
    /// `SOCK_DGRAM`: kernel assigns the echo identifier and filters replies.
    S_DATAGRAM,
    /// `SOCK_RAW`: we assign the identifier; v4 receives include the IP header.
    S_RAW
  };

  // Constructors/destructor.

  /**
   * Detects the usable socket kind for `family`.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param family
   *        Address family.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from `::socket()` (the one of the `SOCK_RAW` attempt), typically `EPERM` or `EACCES`.
   *        If emitted, `*this` is unusable and shall be discarded.
   */
  explicit Icmp_handle(flow::log::Logger* logger_ptr, Ip_family family, Error_code* err_code = 0);

  // Methods.

  /**
   * Address family.
   * @return See above.
   */
  Ip_family family() const;

  /**
   * Kind of socket each request uses.
   * @return See above.
   */
  Socket_kind socket_kind() const;

  /**
   * Sends an echo request and blocks until it completes: with a reply (echo reply or ICMP error), a timeout, or a
   * failure.
   *
   * @param src
   *        Source address, or null to let the routing table choose.  Same family as `dst`.
   * @param dst
   *        Destination address of family family().
   * @param request
   *        Request payload.
   * @param opts
   *        TTL, don't-fragment, timeout.
   * @param reply
   *        Reply region of the Buffer: 8-byte aligned; at least `sizeof(Echo_reply)` plus the request size.
   * @param last_err
   *        Set if and only if 0 is returned: why there was no reply.  Either a `system_category()` errno (e.g.,
   *        `ENETUNREACH` or `EINVAL` from trying to route; `EMSGSIZE` with `opts.m_df`), or an
   *        ip_status_category() value (error::Ip_status::S_REQ_TIMED_OUT).
   * @return Number of reply records written: 0 or 1.
   */
  size_t send_echo(const util::Ip_address* src, const util::Ip_address& dst, const util::Blob_const& request,
                   const Request_options& opts, const util::Blob_mutable& reply, Error_code* last_err) const;

  /**
   * Submits an echo request to complete asynchronously on the given `Task_engine`, which must be running in the
   * calling thread.  There are two possible immediate outcomes:
   *   - Accepted: returns 0; `*last_err` is error::Code::S_REQUEST_PENDING.  Later, `completion_routine(context)`
   *     is invoked exactly once, from within the `Task_engine`'s thread, once the reply region holds the outcome;
   *     parse it with parse_replies().  `request` and `reply` must stay valid until then.
   *   - Failed: returns 0; `*last_err` is the failure (same possibilities as for send_echo()).
   *     `completion_routine` is never invoked.
   *
   * Any other return value (there is none in this implementation) means the primitive's contract is broken.
   *
   * `*this` must outlive every accepted request.
   *
   * @param task_engine
   *        Event loop on which to wait for the reply and the timeout.
   * @param src
   *        See send_echo().
   * @param dst
   *        See send_echo().
   * @param request
   *        See send_echo().
   * @param opts
   *        See send_echo().
   * @param reply
   *        See send_echo().
   * @param completion_routine
   *        See above.
   * @param context
   *        Passed to `completion_routine` as-is.
   * @param last_err
   *        See above.
   * @return See above.
   */
  size_t async_send_echo(flow::util::Task_engine* task_engine,
                         const util::Ip_address* src, const util::Ip_address& dst, const util::Blob_const& request,
                         const Request_options& opts, const util::Blob_mutable& reply,
                         Completion_routine completion_routine, void* context, Error_code* last_err) const;

  /**
   * Interprets a reply region after async_send_echo() completion (or send_echo() return): returns the number of
   * reply records present.  If 0, `*last_err` is set to the reason: see send_echo() (plus
   * error::Code::S_REPLY_BUFFER_TOO_SMALL, if the region cannot even hold a record).
   *
   * @param reply
   *        Reply region.
   * @param last_err
   *        See above.
   * @return 0 or 1.
   */
  static size_t parse_replies(const util::Blob_mutable& reply, Error_code* last_err);

private:
  // Types.

  struct Async_echo_op;

  /// Outcome of one non-blocking read pass over a request socket.
  enum class Read_outcome
  {
    /// Nothing relevant arrived (yet).
    S_NONE,
    /// Reply record written.
    S_REPLIED,
    /// Request failed; no reply record.
    S_FAILED
  };

  // Methods.

  /**
   * Opens, configures, (binds and) connects the socket for one request.
   *
   * @param src
   *        See send_echo().
   * @param dst
   *        See send_echo().
   * @param opts
   *        See send_echo().
   * @param err_code
   *        Set to failure or success.
   * @return The socket; `.null()` on failure.
   */
  util::Native_handle open_request_socket(const util::Ip_address* src, const util::Ip_address& dst,
                                          const Request_options& opts, Error_code* err_code) const;

  /**
   * Sends the echo request on a socket from open_request_socket().
   *
   * @param sock
   *        Socket.
   * @param request
   *        Payload.
   * @param seq
   *        Sequence number to use.
   * @param err_code
   *        Set to failure or success.
   */
  void send_request(const util::Native_handle& sock, const util::Blob_const& request, uint16_t seq,
                    Error_code* err_code) const;

  /**
   * Drains (without blocking) the error queue and then the receive queue of the request socket, until the request
   * is decided or nothing more is available.  On Read_outcome::S_REPLIED the reply record is written; on
   * Read_outcome::S_FAILED `*err_code` is set.
   *
   * @param sock
   *        Socket.
   * @param seq
   *        Sequence number of our request.
   * @param request_size
   *        Size of request payload; helps size the receive buffer.
   * @param sent_at
   *        When the request was sent.
   * @param reply
   *        Reply region.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Read_outcome read_reply(const util::Native_handle& sock, uint16_t seq, size_t request_size,
                          const util::Fine_time_pt& sent_at, const util::Blob_mutable& reply,
                          Error_code* err_code) const;

  /**
   * Records a reply-less outcome in the reply region, for parse_replies() to report.
   *
   * @param reply
   *        Reply region.
   * @param last_err
   *        The reason.
   */
  static void record_no_reply(const util::Blob_mutable& reply, const Error_code& last_err);

  /**
   * Fills the reply record (and payload area) for a received reply.
   *
   * @param reply
   *        Reply region.
   * @param status
   *        Raw error::Ip_status.
   * @param sent_at
   *        When the request was sent.
   * @param responder
   *        Address of the replying node.
   * @param hop_limit
   *        Received TTL/hop limit or 0.
   * @param payload
   *        Echoed payload (empty for ICMP errors).
   */
  static void record_reply(const util::Blob_mutable& reply, uint32_t status, const util::Fine_time_pt& sent_at,
                           const util::Ip_address& responder, int hop_limit, const util::Blob_const& payload);

  /**
   * Maps an ICMP(v6) error type/code, as reported in the socket error queue, to a raw error::Ip_status.
   *
   * @param family
   *        ICMP or ICMPv6.
   * @param type
   *        ICMP type.
   * @param code
   *        ICMP code.
   * @return See above.
   */
  static uint32_t icmp_error_to_ip_status(Ip_family family, uint8_t type, uint8_t code);

  /**
   * Completes an accepted async request (see async_send_echo()) exactly once; subsequent calls are no-ops.
   *
   * @param op
   *        The request.
   */
  static void finish_async_echo(Async_echo_op* op);

  /**
   * Begins (or continues) async-waiting for the request socket to become readable (or errored).
   *
   * @param op
   *        The request.
   */
  void async_wait_readable(const boost::shared_ptr<Async_echo_op>& op) const;

  // Data.

  /// See family().
  const Ip_family m_family;

  /// See socket_kind().
  Socket_kind m_socket_kind;

  /// Echo identifier for Socket_kind::S_RAW (the kernel overwrites it for Socket_kind::S_DATAGRAM).
  const uint16_t m_echo_id;
}; // class Icmp_handle

// Free functions.

/**
 * Prints string representation of the given Icmp_handle to the given `ostream`.
 *
 * @relatesalso Icmp_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Icmp_handle& val);

} // namespace ping::echo::detail
