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
#include "ping/echo/error.hpp"
#include "ping/util/util_fwd.hpp"
#include <flow/util/util.hpp>
#include <cerrno>

namespace ping::echo::error
{

// Types.

/**
 * The boost.system category for errors returned by the ping::echo module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit (.cpp
 * file), and its logic is accessed indirectly through standard boost.system machinery
 * (`Error_code::name()` and `Error_code::message()`).
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging
   * #Error_code).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error (similarly in spirit to `std::strerror()`).
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_NET_UNREACHABLE => `"NET_UNREACHABLE"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

/**
 * The boost.system category for raw #Ip_status values that did not map to a closed-set outcome Code.
 * Its message() is what the user sees for an "other" reply-status outcome.
 */
class Ip_status_category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Ip_status_category.
  static const Ip_status_category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API.
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: e.g., "Other IP error (5): Destination port unreachable".
   *
   * @param val
   *        Raw #Ip_status value.
   * @return String describing the error.
   */
  std::string message(int val) const override;

private:
  // Constructors.

  /// Boring constructor.
  explicit Ip_status_category();
}; // class Ip_status_category

// Static initializations.

const Category Category::S_CATEGORY;
const Ip_status_category Ip_status_category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

const boost::system::error_category& ip_status_category()
{
  return Ip_status_category::S_CATEGORY;
}

Error_code from_ip_status(uint32_t raw_status)
{
  switch (Ip_status(raw_status))
  {
  case Ip_status::S_SUCCESS:
    return Error_code();
  case Ip_status::S_REQ_TIMED_OUT:
    return Code::S_TIMEOUT;
  case Ip_status::S_DEST_HOST_UNREACHABLE:
    return Code::S_HOST_UNREACHABLE;
  case Ip_status::S_DEST_NET_UNREACHABLE:
    return Code::S_NET_UNREACHABLE;
  case Ip_status::S_TTL_EXPIRED_TRANSIT:
    return Code::S_TTL_EXPIRED;
  case Ip_status::S_TTL_EXPIRED_REASSEM:
    return Code::S_REASSEMBLY_EXPIRED;
  case Ip_status::S_DEST_PROT_UNREACHABLE:
    return Code::S_PROTOCOL_UNREACHABLE;
  case Ip_status::S_PACKET_TOO_BIG:
    return Code::S_NEEDS_FRAGMENTED;

  case Ip_status::S_DEST_PORT_UNREACHABLE:
  case Ip_status::S_DEST_PROHIBITED:
  case Ip_status::S_PARAM_PROBLEM:
  case Ip_status::S_SOURCE_QUENCH:
  case Ip_status::S_GENERAL_FAILURE:
    break;
  }
  // Fell through: not in the closed set (possibly not even enumerated).
  return Error_code(int(raw_status), Ip_status_category::S_CATEGORY);
} // from_ip_status()

Error_code from_sys_error(const Error_code& sys_err_code)
{
  if (sys_err_code.category() == Ip_status_category::S_CATEGORY)
  {
    return from_ip_status(uint32_t(sys_err_code.value()));
  }
  // else
  if (sys_err_code.category() != boost::system::system_category())
  {
    return sys_err_code;
  }
  // else

  switch (sys_err_code.value())
  {
  case EHOSTUNREACH:
    return Code::S_HOST_UNREACHABLE;
  case ENETUNREACH:
    return Code::S_NET_UNREACHABLE;
  case ENOPROTOOPT:
    return Code::S_PROTOCOL_UNREACHABLE;
  case ETIMEDOUT:
    return Code::S_TIMEOUT;
  case EMSGSIZE:
    return Code::S_NEEDS_FRAGMENTED;
  default:
    return sys_err_code;
  }
} // from_sys_error()

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ping/echo";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_TIMEOUT:
    return "Request timed out";
  case Code::S_HOST_UNREACHABLE:
    return "Destination host unreachable";
  case Code::S_NET_UNREACHABLE:
    return "Destination network unreachable";
  case Code::S_PROTOCOL_UNREACHABLE:
    return "Destination protocol unreachable";
  case Code::S_TTL_EXPIRED:
    return "TTL expired in transit";
  case Code::S_REASSEMBLY_EXPIRED:
    return "Reassembly timed out waiting for fragments";
  case Code::S_NEEDS_FRAGMENTED:
    return "Packet needs fragmented";
  case Code::S_REQUEST_PENDING:
    return "Asynchronous submission accepted; completion will be signaled later.";
  case Code::S_ICMP_HANDLE_UNAVAILABLE:
    return "Echo request could not be sent: the ICMP handle for the destination's address family is unavailable.";
  case Code::S_ICMP_V4_HANDLE_UNAVAILABLE:
    return "Issuer created, but its ICMPv4 handle could not be opened; IPv6 remains usable.";
  case Code::S_ICMP_V6_HANDLE_UNAVAILABLE:
    return "Issuer created, but its ICMPv6 handle could not be opened; IPv4 remains usable.";
  case Code::S_ICMP_HANDLES_UNAVAILABLE:
    return "Issuer could open neither the ICMPv4 nor the ICMPv6 handle.";
  case Code::S_REPLY_BUFFER_TOO_SMALL:
    return "Reply region of the buffer is too small to hold even the reply record.";
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments violating its documented requirements.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_TIMEOUT:
    return "TIMEOUT";
  case Code::S_HOST_UNREACHABLE:
    return "HOST_UNREACHABLE";
  case Code::S_NET_UNREACHABLE:
    return "NET_UNREACHABLE";
  case Code::S_PROTOCOL_UNREACHABLE:
    return "PROTOCOL_UNREACHABLE";
  case Code::S_TTL_EXPIRED:
    return "TTL_EXPIRED";
  case Code::S_REASSEMBLY_EXPIRED:
    return "REASSEMBLY_EXPIRED";
  case Code::S_NEEDS_FRAGMENTED:
    return "NEEDS_FRAGMENTED";
  case Code::S_REQUEST_PENDING:
    return "REQUEST_PENDING";
  case Code::S_ICMP_HANDLE_UNAVAILABLE:
    return "ICMP_HANDLE_UNAVAILABLE";
  case Code::S_ICMP_V4_HANDLE_UNAVAILABLE:
    return "ICMP_V4_HANDLE_UNAVAILABLE";
  case Code::S_ICMP_V6_HANDLE_UNAVAILABLE:
    return "ICMP_V6_HANDLE_UNAVAILABLE";
  case Code::S_ICMP_HANDLES_UNAVAILABLE:
    return "ICMP_HANDLES_UNAVAILABLE";
  case Code::S_REPLY_BUFFER_TOO_SMALL:
    return "REPLY_BUFFER_TOO_SMALL";
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

Ip_status_category::Ip_status_category() = default;

const char* Ip_status_category::name() const noexcept // Virtual.
{
  return "ping/ip-status";
}

std::string Ip_status_category::message(int val) const // Virtual.
{
  using flow::util::ostream_op_string;

  util::String_view description;
  switch (Ip_status(val))
  {
  case Ip_status::S_SUCCESS:
    description = "Success";
    break;
  case Ip_status::S_REQ_TIMED_OUT:
    description = "Request timed out";
    break;
  case Ip_status::S_DEST_NET_UNREACHABLE:
    description = "Destination network unreachable";
    break;
  case Ip_status::S_DEST_HOST_UNREACHABLE:
    description = "Destination host unreachable";
    break;
  case Ip_status::S_DEST_PROT_UNREACHABLE:
    description = "Destination protocol unreachable";
    break;
  case Ip_status::S_DEST_PORT_UNREACHABLE:
    description = "Destination port unreachable";
    break;
  case Ip_status::S_DEST_PROHIBITED:
    description = "Communication administratively prohibited";
    break;
  case Ip_status::S_PACKET_TOO_BIG:
    description = "Packet too big";
    break;
  case Ip_status::S_TTL_EXPIRED_TRANSIT:
    description = "TTL expired in transit";
    break;
  case Ip_status::S_TTL_EXPIRED_REASSEM:
    description = "TTL expired during reassembly";
    break;
  case Ip_status::S_PARAM_PROBLEM:
    description = "Parameter problem";
    break;
  case Ip_status::S_SOURCE_QUENCH:
    description = "Source quench received";
    break;
  case Ip_status::S_GENERAL_FAILURE:
    description = "General failure";
    break;
  default:
    description = "Unknown status";
  }

  return ostream_op_string("Other IP error (", val, "): ", description);
} // Ip_status_category::message()

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace ping::echo::error
