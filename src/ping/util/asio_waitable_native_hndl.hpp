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

#include "ping/util/native_handle.hpp"
#include "ping/common.hpp"
#include <flow/util/util_fwd.hpp>
#include <boost/asio.hpp>

namespace ping::util
{

// Types.

/**
 * Lets a boost.asio loop async-wait for readability of a socket that is not an asio I/O object: a request socket
 * opened via plain `::socket()`, owned by a Native_handle.
 *
 * Construct, then watch() the FD; registration with the reactor can fail (e.g., `epoll_ctl()` running out of
 * watches or memory), and watch() reports that through its `Error_code*` rather than by throwing.  Thereafter
 * `async_wait(Base::wait_read, F)` works as with any asio descriptor: `F(Error_code)` runs in the thread running the
 * `Task_engine` once the FD is readable *or* has a pending error.  The latter matters: ICMP errors land in the
 * socket error queue, which asio's reactor reports as readiness of a read-wait.
 *
 * The destructor does *not* close the FD; the Native_handle keeps ownership.  Destroying `*this` completes any
 * outstanding wait with `operation_aborted`.  So destroy `*this` before closing the watched Native_handle.
 */
class Asio_waitable_native_handle :
  protected boost::asio::posix::descriptor
{
public:
  // Types.

  /// Short-hand for our base type, for `Base::wait_read`.
  using Base = boost::asio::posix::descriptor;

  // Constructors/destructor.

  /**
   * Constructs, watching nothing yet.
   *
   * @param task_engine
   *        Loop on which async_wait() handlers shall run.
   */
  explicit Asio_waitable_native_handle(flow::util::Task_engine& task_engine);

  /// Deregisters, without closing the watched FD.
  ~Asio_waitable_native_handle();

  // Methods.

  /**
   * Registers `hndl` with the reactor of the `Task_engine` given to the ctor.  On failure `*this` stays as if
   * just constructed; async_wait() must not be called.
   *
   * @param hndl
   *        Handle to watch; must outlive `*this`.  A `.null()` one fails with `EBADF`.
   * @param err_code
   *        Set to failure or success.  Failure: `already_open` if watching already; else the `errno` of the
   *        registration.
   */
  void watch(const Native_handle& hndl, Error_code* err_code);

  /// Publicly expose `posix::basic_descriptor::async_wait()`.  See its boost.asio docs.
  using Base::async_wait;
}; // class Asio_waitable_native_handle

} // namespace ping::util
