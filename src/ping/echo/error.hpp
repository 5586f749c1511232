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

/**
 * Namespace containing the ping::echo module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages; plus the mapping of raw
 * OS-level and ICMP-level outcomes onto those codes.  Note that many errors ping::echo might report are
 * system errors and would not draw from this set of codes/messages but rather from boost.asio's (or
 * boost.system's) `system_category()`.  See flow::error documentation for a detailed discussion.
 *
 * ### Outcome taxonomy ###
 * The result of a request (see echo::Pinger::send() and echo::Ping_future::poll()) is an #Error_code:
 *   - Falsy: success.
 *   - One of the *closed set* of request outcomes in this category: Code::S_TIMEOUT, Code::S_HOST_UNREACHABLE,
 *     Code::S_NET_UNREACHABLE, Code::S_PROTOCOL_UNREACHABLE, Code::S_TTL_EXPIRED, Code::S_REASSEMBLY_EXPIRED,
 *     Code::S_NEEDS_FRAGMENTED.  These are expected outcomes of a request.
 *   - Anything else is "other": a raw reply status in ip_status_category() (see #Ip_status); an errno
 *     in `system_category()`; or one of the remaining (non-outcome) codes in this category.  The caller may still act
 *     on the raw value and the `.message()`.
 */
namespace ping::echo::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via ping::Error_code arguments) by ping::echo functions/methods *outside of*
/// possibly system-triggered errors.
enum class Code
{
  /// Request timed out: no reply and no ICMP error arrived before the per-request timeout elapsed.
  S_TIMEOUT = S_CODE_LOWEST_INT_VALUE,

  /// Destination host unreachable.
  S_HOST_UNREACHABLE,

  /// Destination network unreachable.
  S_NET_UNREACHABLE,

  /// Destination protocol unreachable.
  S_PROTOCOL_UNREACHABLE,

  /// TTL expired in transit.
  S_TTL_EXPIRED,

  /// Reassembly timed out waiting for fragments.
  S_REASSEMBLY_EXPIRED,

  /// Packet needs fragmented, but the don't-fragment bit is set.
  S_NEEDS_FRAGMENTED,

  /**
   * Asynchronous submission accepted; completion will be signaled later.  Never emitted as a request outcome: it
   * is the "last error" value by which an async submission reports acceptance.
   */
  S_REQUEST_PENDING,

  /// Echo request could not be sent: the ICMP handle for the destination's address family is unavailable.
  S_ICMP_HANDLE_UNAVAILABLE,

  /// Issuer created, but its ICMPv4 handle could not be opened; IPv6 remains usable.
  S_ICMP_V4_HANDLE_UNAVAILABLE,

  /// Issuer created, but its ICMPv6 handle could not be opened; IPv4 remains usable.
  S_ICMP_V6_HANDLE_UNAVAILABLE,

  /// Issuer could open neither the ICMPv4 nor the ICMPv6 handle.
  S_ICMP_HANDLES_UNAVAILABLE,

  /// Reply region of the buffer is too small to hold even the reply record.
  S_REPLY_BUFFER_TOO_SMALL,

  /// User called an API with 1 or more arguments violating its documented requirements.
  S_INVALID_ARGUMENT,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

/**
 * Raw status of one echo reply record, as written into an echo::Buffer reply region by the echo primitive:
 * S_SUCCESS, or an ICMP-level failure reported by the network (or the timeout pseudo-status).
 * Values other than the enumerated ones may appear in `Error_code`s of ip_status_category(); hence
 * one should treat the enumeration as non-exhaustive.
 */
enum class Ip_status : uint32_t
{
  /// Echo reply received.
  S_SUCCESS = 0,
  /// No reply before the timeout.
  S_REQ_TIMED_OUT,
  /// ICMP destination unreachable: network.
  S_DEST_NET_UNREACHABLE,
  /// ICMP destination unreachable: host.
  S_DEST_HOST_UNREACHABLE,
  /// ICMP destination unreachable: protocol.
  S_DEST_PROT_UNREACHABLE,
  /// ICMP destination unreachable: port.
  S_DEST_PORT_UNREACHABLE,
  /// ICMP destination unreachable: administratively prohibited.
  S_DEST_PROHIBITED,
  /// ICMP fragmentation needed (v4) or packet too big (v6).
  S_PACKET_TOO_BIG,
  /// ICMP time exceeded: TTL/hop limit expired in transit.
  S_TTL_EXPIRED_TRANSIT,
  /// ICMP time exceeded: fragment reassembly time exceeded.
  S_TTL_EXPIRED_REASSEM,
  /// ICMP parameter problem.
  S_PARAM_PROBLEM,
  /// ICMP source quench (v4, deprecated but possible).
  S_SOURCE_QUENCH,
  /// Some other ICMP error type/code.
  S_GENERAL_FAILURE
}; // enum class Ip_status

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching #Error_code.  Does not need to be called explicitly: simply
 * assigning a Code to an #Error_code works thanks to `is_error_code_enum` specialization below.
 *
 * @param err_code
 *        The `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Returns the boost.system category (name `"ping/ip-status"`) for raw #Ip_status values that are not among the
 * closed set of outcomes; e.g., `Ip_status::S_DEST_PORT_UNREACHABLE`.
 *
 * @return See above.
 */
const boost::system::error_category& ip_status_category();

/**
 * Maps a raw reply status to a request outcome: falsy for `Ip_status::S_SUCCESS`; the matching closed-set Code if
 * any; else an #Error_code holding the raw value in ip_status_category().
 *
 * @param raw_status
 *        An #Ip_status value, cast to its underlying type (possibly not among the enumerated values).
 * @return See above.
 */
Error_code from_ip_status(uint32_t raw_status);

/**
 * Maps a "last error" (as left by an echo-primitive call that produced no reply) to a request outcome.
 *   - `system_category()` errno values `EHOSTUNREACH`, `ENETUNREACH`, `ENOPROTOOPT`, `ETIMEDOUT`, `EMSGSIZE` map to
 *     the matching closed-set Code; other errno values are returned unchanged (as "other").
 *   - ip_status_category() values are mapped via from_ip_status().
 *   - Anything else (including our own Code values) is returned unchanged.
 *
 * @param sys_err_code
 *        The last error.
 * @return See above.
 */
Error_code from_sys_error(const Error_code& sys_err_code);

/**
 * Deserializes a Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "<digits>", where `<digits>` is the numeric value of the Code; or
 *   - the Code name without the `S_` prefix, case-insensitively, e.g. "TIMEOUT".
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream, as its name without the `S_` prefix; e.g., "NET_UNREACHABLE".
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace ping::echo::error

namespace boost::system
{

// Types.

template<>
struct is_error_code_enum<::ping::echo::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
