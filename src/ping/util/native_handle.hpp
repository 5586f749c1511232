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

#include <ostream>
#include <flow/common.hpp>
#include <boost/core/noncopyable.hpp>

namespace ping::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "ping uses Linux ICMP sockets (datagram or raw) plus the socket error queue.  "
                       "Build in Linux only.");
#endif
// From this point on (in #including .cpp files as well) POSIX is assumed; and in many spots specifically Linux.

// Types.

/**
 * A thin owning wrapper around a native handle, a/k/a descriptor a/k/a FD: typically a socket opened for one
 * ICMP echo request.  It is either null() or stores a native handle; in the latter case the destructor
 * `::close()`s it.  Move construction and assignment transfer ownership (nullifying the source); copying is
 * not allowed, as that would lead to a double-close.
 *
 * To hand the handle to another owner, use release().  To merely watch it for readability, construct an
 * Asio_waitable_native_handle from it: that guy never closes what it watches.
 */
struct Native_handle :
  private boost::noncopyable
{
  // Types.

  /// The native handle type.
  using handle_t = int;

  // Constants.

  /**
   * The value for #m_native_handle such that `null() == true`; else it is `false`.
   * No valid handle ever equals this.
   */
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE), the exact payload of this Native_handle.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Takes ownership of the given payload; also subsumes no-args construction to mean constructing an object with
   * `null() == true`.
   *
   * @param native_handle
   *        Payload.
   */
  explicit Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object owning what `src` owned, while making `src.null() == true`.
   *
   * @param src
   *        Source object.
   */
  Native_handle(Native_handle&& src);

  /// Closes the handle, unless null().
  ~Native_handle();

  // Methods.

  /**
   * Move assignment; closes the currently owned handle (if any) and then acts similarly to move ctor.
   * No-op if `&src == this`.
   *
   * @param src
   *        Source object which will be made `null() == true`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;

  /**
   * Makes `null() == true` without closing anything and returns the formerly owned handle.
   * @return See above.
   */
  handle_t release();

  /// Closes the handle (unless null()) and makes `null() == true`.
  void reset();
}; // struct Native_handle

// Free functions.

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace ping::util
