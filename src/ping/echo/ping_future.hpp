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

#include "ping/echo/buffer.hpp"
#include <boost/shared_ptr.hpp>

namespace ping::echo
{

// Types.

/**
 * The outcome of one Async_pinger request, as produced by a completed Ping_future.
 *
 * Same semantics as the return value and `err_code` of Pinger::send(); plus the Buffer, handed back to the caller.
 */
struct Async_result
{
  // Constructors/destructor.

  /// Constructs a success-looking, zero-RTT, empty result: a placeholder to be filled by Ping_future::poll().
  Async_result();

  // Data.

  /// Falsy on success; else error::Code (closed set) or "other" (see error::from_sys_error()).
  Error_code m_err_code;

  /// Round-trip time in milliseconds if `!m_err_code`; else 0.
  unsigned int m_round_trip_time_ms;

  /// The request's Buffer: its reply_data() and responding_ip() describe the reply, if any.
  Buffer m_buffer;
}; // struct Async_result

/**
 * The pollable handle to one outstanding Async_pinger request.  It can be polled from any thread, though not
 * concurrently from two; or one can block on it via wait().
 *
 * ### Poll contract ###
 * poll() returns `true` exactly once: when the request has completed, with its Async_result.  Until then each poll()
 * returns `false` and registers the given waker, displacing the waker of any earlier poll(): the latest waker is
 * invoked exactly once, from the background worker thread, upon completion, after which the next poll() returns
 * `true`.  Wakers must be quick and non-blocking; typically they notify an event loop or a condition variable.
 * In particular a waker must not itself submit another request: were the submission queue full, the worker thread would
 * block on its own queue.
 *
 * Do not poll() again after it returned `true`: that is a fatal error (as is, for that matter, polling a request whose
 * submission broke the echo primitive's contract).
 *
 * ### Dropping ###
 * Destroying a Ping_future does not cancel the request: the worker still completes it (up to its timeout), and the
 * Buffer is then discarded.
 *
 * Move-only.
 */
class Ping_future
{
public:
  // Constructors/destructor.

  /**
   * Internal-use: wraps the shared state of a submitted request.
   *
   * @param state
   *        The state; not null.
   */
  explicit Ping_future(boost::shared_ptr<detail::Completion_state>&& state);

  /**
   * Move constructor.
   * @param src
   *        Moved-from; must not be used further (other than being destroyed or assigned-to).
   */
  Ping_future(Ping_future&& src);

  /// Forbid copying.
  Ping_future(const Ping_future&) = delete;

  /// Releases this side's share of the request state.
  ~Ping_future();

  // Methods.

  /**
   * Move assignment.
   * @param src
   *        See move ctor.
   * @return `*this`.
   */
  Ping_future& operator=(Ping_future&& src);

  /// Forbid copying.
  Ping_future& operator=(const Ping_future&) = delete;

  /**
   * See class doc header.
   *
   * @param waker
   *        To invoke (from an unspecified thread) once `true` would be returned.  Ignored if `true` is returned now.
   * @param result
   *        Filled if and only if `true` is returned.
   * @return See class doc header.
   */
  bool poll(util::Task&& waker, Async_result* result);

  /**
   * Blocks until the request completes and returns its outcome; then `*this` is spent (see poll()).
   * @return See above.
   */
  Async_result wait();

private:
  // Data.

  /// The state shared with the worker.
  boost::shared_ptr<detail::Completion_state> m_state;
}; // class Ping_future

} // namespace ping::echo
